#include <QTest>
#include "semantic/features/stream_aggregator.h"
#include "semantic/frame.h"
#include "semantic/response.h"

namespace {

StreamFrame frameOf(FrameType type, int candidate = 0) {
    StreamFrame frame;
    frame.type = type;
    frame.candidateIndex = candidate;
    return frame;
}

StreamFrame textDelta(const QString& text, int candidate = 0) {
    StreamFrame frame = frameOf(FrameType::Delta, candidate);
    frame.deltaSegments.append(Segment::fromText(text));
    return frame;
}

}

class TestAggregator : public QObject {
    Q_OBJECT

private slots:
    void testTextDeltasMerge() {
        StreamAggregator agg;

        StreamFrame started = frameOf(FrameType::Started);
        started.envelope.requestId = QStringLiteral("req-001");
        started.responseId = QStringLiteral("msg_1");
        started.model = QStringLiteral("claude-sonnet-4");
        agg.addFrame(started);
        agg.addFrame(textDelta(QStringLiteral("Hello ")));
        agg.addFrame(textDelta(QStringLiteral("World")));

        StreamFrame usage = frameOf(FrameType::UsageDelta);
        usage.usageDelta.promptTokens = 10;
        usage.usageDelta.completionTokens = 5;
        agg.addFrame(usage);

        StreamFrame fin = frameOf(FrameType::Finished);
        fin.stopCause = StopCause::Length;
        fin.isFinal = true;
        agg.addFrame(fin);

        auto result = agg.finalize();
        QVERIFY(result.has_value());
        QCOMPARE(result->envelope.requestId, QStringLiteral("req-001"));
        QCOMPARE(result->responseId, QStringLiteral("msg_1"));
        QCOMPARE(result->modelUsed, QStringLiteral("claude-sonnet-4"));
        QCOMPARE(result->candidates.size(), 1);
        QCOMPARE(result->candidates[0].output.size(), 1);
        QCOMPARE(result->candidates[0].output[0].text, QStringLiteral("Hello World"));
        QCOMPARE(result->candidates[0].stopCause, StopCause::Length);
        QCOMPARE(result->usage.totalTokens, 15);
    }

    void testReasoningKeptApartFromText() {
        StreamAggregator agg;
        agg.addFrame(frameOf(FrameType::Started));

        StreamFrame think = frameOf(FrameType::Delta);
        think.deltaSegments.append(Segment::fromReasoning(QStringLiteral("plan ")));
        agg.addFrame(think);
        StreamFrame think2 = frameOf(FrameType::Delta);
        Segment sig = Segment::fromReasoning(QStringLiteral("more"));
        sig.structured[QStringLiteral("signature")] = QStringLiteral("sig-1");
        think2.deltaSegments.append(sig);
        agg.addFrame(think2);
        agg.addFrame(textDelta(QStringLiteral("answer")));
        agg.addFrame(frameOf(FrameType::Finished));

        auto result = agg.finalize();
        QVERIFY(result.has_value());
        const QList<Segment>& out = result->candidates[0].output;
        QCOMPARE(out.size(), 2);
        QCOMPARE(out[0].kind, SegmentKind::Reasoning);
        QCOMPARE(out[0].text, QStringLiteral("plan more"));
        QCOMPARE(out[0].structured.value(QStringLiteral("signature")).toString(),
                 QStringLiteral("sig-1"));
        QCOMPARE(out[1].text, QStringLiteral("answer"));
    }

    void testToolCallsCollected() {
        StreamAggregator agg;
        agg.addFrame(frameOf(FrameType::Started));

        StreamFrame call = frameOf(FrameType::ActionDelta);
        call.actionDelta.callId = QStringLiteral("call_1");
        call.actionDelta.name = QStringLiteral("weather");
        call.actionDelta.argsPatch = QStringLiteral("{\"city\":\"Oslo\"}");
        call.actionDelta.closed = true;
        agg.addFrame(call);

        StreamFrame anonymous = frameOf(FrameType::ActionDelta);
        anonymous.actionDelta.argsPatch = QStringLiteral("{}");
        agg.addFrame(anonymous);

        StreamFrame fin = frameOf(FrameType::Finished);
        fin.stopCause = StopCause::ToolCall;
        agg.addFrame(fin);

        auto result = agg.finalize();
        QVERIFY(result.has_value());
        QCOMPARE(result->candidates[0].toolCalls.size(), 1);
        QCOMPARE(result->candidates[0].toolCalls[0].args, QStringLiteral("{\"city\":\"Oslo\"}"));
        QCOMPARE(result->candidates[0].stopCause, StopCause::ToolCall);
    }

    void testCandidatesOrderedByIndex() {
        QList<StreamFrame> frames;
        frames.append(frameOf(FrameType::Started, 1));
        frames.append(textDelta(QStringLiteral("second"), 1));
        frames.append(frameOf(FrameType::Started, 0));
        frames.append(textDelta(QStringLiteral("first"), 0));
        frames.append(frameOf(FrameType::Finished, 1));
        frames.append(frameOf(FrameType::Finished, 0));

        StreamAggregator agg;
        auto result = agg.aggregate(frames);
        QVERIFY(result.has_value());
        QCOMPARE(result->candidates.size(), 2);
        QCOMPARE(result->candidates[0].index, 0);
        QCOMPARE(result->candidates[0].output[0].text, QStringLiteral("first"));
        QCOMPARE(result->candidates[1].output[0].text, QStringLiteral("second"));
    }

    void testUsageKeepsLargestCumulativeValue() {
        StreamAggregator agg;
        StreamFrame started = frameOf(FrameType::Started);
        started.usageDelta.promptTokens = 12;
        agg.addFrame(started);

        StreamFrame u1 = frameOf(FrameType::UsageDelta);
        u1.usageDelta.completionTokens = 3;
        agg.addFrame(u1);
        StreamFrame u2 = frameOf(FrameType::UsageDelta);
        u2.usageDelta.promptTokens = 12;
        u2.usageDelta.completionTokens = 8;
        agg.addFrame(u2);
        agg.addFrame(frameOf(FrameType::Finished));

        auto result = agg.finalize();
        QVERIFY(result.has_value());
        QCOMPARE(result->usage.promptTokens, 12);
        QCOMPARE(result->usage.completionTokens, 8);
        QCOMPARE(result->usage.totalTokens, 20);
    }

    void testFailedFrameYieldsFailure() {
        StreamAggregator agg;
        agg.addFrame(frameOf(FrameType::Started));
        agg.addFrame(textDelta(QStringLiteral("partial")));

        StreamFrame failed = frameOf(FrameType::Failed);
        failed.failure = DomainFailure::upstreamHttp(529, QStringLiteral("overloaded_error"),
                                                     QStringLiteral("Overloaded"));
        agg.addFrame(failed);

        auto result = agg.finalize();
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::UpstreamHttp);
        QCOMPARE(result.error().upstreamStatus, 529);
    }

    void testFinalizeResets() {
        StreamAggregator agg;
        agg.addFrame(frameOf(FrameType::Started));
        agg.addFrame(textDelta(QStringLiteral("once")));
        QVERIFY(agg.finalize().has_value());

        auto second = agg.finalize();
        QVERIFY(second.has_value());
        QVERIFY(second->candidates.isEmpty());
    }
};

QTEST_MAIN(TestAggregator)
#include "tst_aggregator.moc"
