#include <QTest>
#include "semantic/validate.h"
#include "semantic/request.h"
#include "semantic/response.h"
#include "semantic/frame.h"

namespace {

SemanticRequest userRequest(const QString& model, const QString& text) {
    SemanticRequest req;
    req.model = model;
    InteractionItem item;
    item.role = QStringLiteral("user");
    item.content.append(Segment::fromText(text));
    req.messages.append(item);
    return req;
}

ParameterBounds anthropicLikeBounds() {
    ParameterBounds b;
    b.temperature = ParameterBounds::Range{0.0, 1.0};
    b.topP = ParameterBounds::Range{0.0, 1.0};
    b.topK = ParameterBounds::Range{0.0, 500.0};
    b.maxTokens = ParameterBounds::Range{1.0, 128000.0};
    b.stopSequences = true;
    return b;
}

}

class TestValidate : public QObject {
    Q_OBJECT

private slots:
    void testValidRequest() {
        auto result = Validate::request(userRequest(QStringLiteral("gpt-4"), QStringLiteral("Hello")));
        QVERIFY(result.has_value());
    }

    void testEmptyMessagesInvalid() {
        SemanticRequest req;
        req.model = QStringLiteral("gpt-4");

        auto result = Validate::request(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::DecodeFailed);
        QCOMPARE(result.error().code, QStringLiteral("empty_messages"));
    }

    void testEmptyModelInvalid() {
        auto result = Validate::request(userRequest(QString(), QStringLiteral("Hello")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("empty_model"));
    }

    void testUnknownRoleRejected() {
        SemanticRequest req = userRequest(QStringLiteral("m"), QStringLiteral("Hi"));
        req.messages.first().role = QStringLiteral("narrator");

        auto result = Validate::request(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("invalid_role"));
    }

    void testOrphanToolResultRejected() {
        SemanticRequest req = userRequest(QStringLiteral("m"), QStringLiteral("Hi"));
        InteractionItem tool;
        tool.role = QStringLiteral("tool");
        tool.toolCallId = QStringLiteral("call_missing");
        tool.content.append(Segment::fromText(QStringLiteral("42")));
        req.messages.append(tool);

        auto result = Validate::request(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("orphan_tool_result"));
    }

    void testToolResultAfterCallAccepted() {
        SemanticRequest req = userRequest(QStringLiteral("m"), QStringLiteral("Weather?"));
        InteractionItem assistant;
        assistant.role = QStringLiteral("assistant");
        assistant.toolCalls.append(ActionCall{QStringLiteral("call_1"), QStringLiteral("weather"),
                                              QStringLiteral("{\"city\":\"Oslo\"}")});
        req.messages.append(assistant);
        InteractionItem tool;
        tool.role = QStringLiteral("tool");
        tool.toolCallId = QStringLiteral("call_1");
        tool.content.append(Segment::fromText(QStringLiteral("sunny")));
        req.messages.append(tool);

        QVERIFY(Validate::request(req).has_value());
    }

    void testContinuedConversationAllowsUnseenCall() {
        SemanticRequest req = userRequest(QStringLiteral("m"), QStringLiteral("Hi"));
        QJsonObject passthrough;
        passthrough[QStringLiteral("previous_response_id")] = QStringLiteral("resp_1");
        req.extensions.setPassthrough(QStringLiteral("openai.responses"), passthrough);
        InteractionItem tool;
        tool.role = QStringLiteral("tool");
        tool.toolCallId = QStringLiteral("call_prev");
        req.messages.append(tool);

        QVERIFY(Validate::request(req).has_value());
    }

    void testParameterWithinBounds() {
        ConstraintSet set;
        set.temperature = 0.7;
        set.maxTokens = 1024;
        QVERIFY(Validate::constraints(set, anthropicLikeBounds()).has_value());
    }

    void testParameterOutOfRangeNotClamped() {
        ConstraintSet set;
        set.temperature = 1.5;

        auto result = Validate::constraints(set, anthropicLikeBounds());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::InvalidParameter);
        QCOMPARE(result.error().httpStatus(), 400);
        QVERIFY(result.error().message.contains(QStringLiteral("temperature")));
    }

    void testUnsupportedParameterIsEncodeError() {
        ConstraintSet set;
        set.frequencyPenalty = 0.5;

        auto result = Validate::constraints(set, anthropicLikeBounds());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::EncodeFailed);
        QCOMPARE(result.error().code, QStringLiteral("unsupported_parameter"));
    }

    void testSeedUnsupported() {
        ConstraintSet set;
        set.seed = 7;
        auto result = Validate::constraints(set, anthropicLikeBounds());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::EncodeFailed);
    }

    void testNegativeThinkingBudget() {
        ConstraintSet set;
        set.thinkingBudget = -1;
        auto result = Validate::constraints(set, anthropicLikeBounds());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::InvalidParameter);
    }

    void testResponseNeedsCandidate() {
        SemanticResponse resp;
        QVERIFY(!Validate::response(resp).has_value());
        resp.candidates.append(Candidate{});
        QVERIFY(Validate::response(resp).has_value());
    }

    void testFailedFrameNeedsMessage() {
        StreamFrame frame;
        frame.type = FrameType::Failed;
        QVERIFY(!Validate::frame(frame).has_value());
        frame.failure = DomainFailure::connectFailed(QStringLiteral("refused"));
        QVERIFY(Validate::frame(frame).has_value());
    }
};

QTEST_MAIN(TestValidate)
#include "tst_validate.moc"
