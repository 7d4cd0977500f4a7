#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/openai.h"
#include "adapters/wire/openai_wire.h"

namespace {

// data: payloads of an SSE body, in order.
QList<QByteArray> dataLines(const QByteArray& sse) {
    QList<QByteArray> out;
    for (const QByteArray& line : sse.split('\n')) {
        if (line.startsWith("data: "))
            out.append(line.mid(6));
    }
    return out;
}

QByteArray chatBody() {
    return R"({
        "model": "gpt-4o",
        "temperature": 0.2,
        "max_completion_tokens": 300,
        "seed": 7,
        "stop": "END",
        "parallel_tool_calls": false,
        "user": "u-1",
        "tools": [{"type": "function", "function": {"name": "weather",
                   "parameters": {"type": "object"}}}],
        "tool_choice": {"type": "function", "function": {"name": "weather"}},
        "messages": [
            {"role": "developer", "content": "Be brief."},
            {"role": "user", "content": [{"type": "text", "text": "Oslo?"}], "name": "ana"},
            {"role": "assistant", "content": null,
             "tool_calls": [{"id": "call_1", "type": "function",
                             "function": {"name": "weather", "arguments": "{\"city\":\"Oslo\"}"}}]},
            {"role": "tool", "tool_call_id": "call_1", "content": "12C"}
        ]
    })";
}

}

class TestOpenAIRoundtrip : public QObject {
    Q_OBJECT

private slots:
    void testDecodeRequest() {
        OpenAIChatAdapter inbound;
        auto req = inbound.decodeRequest(chatBody(), {});
        QVERIFY(req.has_value());

        QCOMPARE(req->model, QStringLiteral("gpt-4o"));
        QCOMPARE(req->messages.size(), 4);
        QCOMPARE(req->messages[0].role, QStringLiteral("system"));
        QCOMPARE(req->messages[1].name, QStringLiteral("ana"));
        QCOMPARE(req->messages[2].content.size(), 0);
        QCOMPARE(req->messages[2].toolCalls[0].args, QStringLiteral("{\"city\":\"Oslo\"}"));
        QCOMPARE(req->messages[3].toolCallId, QStringLiteral("call_1"));

        QCOMPARE(req->constraints.maxTokens.value(), 300);
        QCOMPARE(req->constraints.seed.value(), 7);
        QCOMPARE(req->constraints.stopSequences, QStringList{QStringLiteral("END")});
        QCOMPARE(req->constraints.parallelToolCalls.value(), false);
        QCOMPARE(req->toolChoice.mode, ToolChoice::Mode::Named);
        QCOMPARE(req->toolChoice.name, QStringLiteral("weather"));
        QCOMPARE(req->extensions.passthrough().value(QStringLiteral("user")).toString(),
                 QStringLiteral("u-1"));
    }

    void testRequestRoundTrip() {
        auto first = OpenAIWire::decodeRequest(QJsonDocument::fromJson(chatBody()).object());
        QVERIFY(first.has_value());
        auto encoded = OpenAIWire::encodeRequest(*first);
        QVERIFY(encoded.has_value());
        QCOMPARE(encoded->value(QStringLiteral("user")).toString(), QStringLiteral("u-1"));
        QVERIFY(encoded->value(QStringLiteral("messages")).toArray()[2].toObject()
                    .value(QStringLiteral("content")).isNull());

        auto second = OpenAIWire::decodeRequest(*encoded);
        QVERIFY(second.has_value());
        QCOMPARE(second->messages, first->messages);
        QCOMPARE(second->constraints, first->constraints);
        QCOMPARE(second->tools, first->tools);
        QCOMPARE(second->toolChoice, first->toolChoice);
    }

    void testMissingMessagesRejected() {
        OpenAIChatAdapter inbound;
        auto req = inbound.decodeRequest(R"({"model":"gpt-4o"})", {});
        QVERIFY(!req.has_value());
        QCOMPARE(req.error().code, QStringLiteral("invalid_messages"));
    }

    void testEncodeResponse() {
        SemanticResponse resp;
        resp.responseId = QStringLiteral("chatcmpl-1");
        resp.modelUsed = QStringLiteral("gpt-4o");
        Candidate cand;
        cand.output.append(Segment::fromReasoning(QStringLiteral("hm")));
        cand.output.append(Segment::fromText(QStringLiteral("Hi")));
        ActionCall call;
        call.callId = QStringLiteral("call_2");
        call.name = QStringLiteral("f");
        call.args = QStringLiteral("{\"a\":1}");
        cand.toolCalls.append(call);
        cand.stopCause = StopCause::ToolCall;
        resp.candidates.append(cand);
        resp.usage.promptTokens = 4;
        resp.usage.completionTokens = 6;

        OpenAIChatAdapter inbound;
        auto body = inbound.encodeResponse(resp);
        QVERIFY(body.has_value());
        const QJsonObject root = QJsonDocument::fromJson(*body).object();
        QCOMPARE(root.value(QStringLiteral("object")).toString(), QStringLiteral("chat.completion"));
        const QJsonObject choice = root.value(QStringLiteral("choices")).toArray()[0].toObject();
        QCOMPARE(choice.value(QStringLiteral("finish_reason")).toString(), QStringLiteral("tool_calls"));
        const QJsonObject message = choice.value(QStringLiteral("message")).toObject();
        QCOMPARE(message.value(QStringLiteral("content")).toString(), QStringLiteral("Hi"));
        QCOMPARE(message.value(QStringLiteral("reasoning_content")).toString(), QStringLiteral("hm"));
        QCOMPARE(message.value(QStringLiteral("tool_calls")).toArray()[0].toObject()
                     .value(QStringLiteral("function")).toObject()
                     .value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{\"a\":1}"));
        QCOMPARE(root.value(QStringLiteral("usage")).toObject()
                     .value(QStringLiteral("total_tokens")).toInt(), 10);

        auto decoded = OpenAIWire::decodeResponse(root);
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->candidates, resp.candidates);
    }

    void testStructuredOutputCannotBeEncoded() {
        SemanticResponse resp;
        Candidate cand;
        cand.output.append(Segment::fromStructured(
            QJsonObject{{QStringLiteral("type"), QStringLiteral("redacted_thinking")}},
            QStringLiteral("anthropic")));
        resp.candidates.append(cand);

        auto root = OpenAIWire::encodeResponse(resp);
        QVERIFY(!root.has_value());
        QCOMPARE(root.error().kind, ErrorKind::EncodeFailed);
    }

    void testStreamChunks() {
        OpenAIChatAdapter inbound;
        StreamEncodeState state;
        QByteArray out;

        StreamFrame started;
        started.type = FrameType::Started;
        started.responseId = QStringLiteral("chatcmpl-s");
        started.model = QStringLiteral("gpt-4o");
        out += *inbound.encodeStreamFrame(started, state);

        StreamFrame text;
        text.type = FrameType::Delta;
        text.deltaSegments.append(Segment::fromText(QStringLiteral("Hi")));
        out += *inbound.encodeStreamFrame(text, state);

        StreamFrame call;
        call.type = FrameType::ActionDelta;
        call.actionDelta.callId = QStringLiteral("call_1");
        call.actionDelta.name = QStringLiteral("weather");
        call.actionDelta.argsPatch = QStringLiteral("{\"city\":\"Oslo\"}");
        call.actionDelta.closed = true;
        out += *inbound.encodeStreamFrame(call, state);

        StreamFrame usage;
        usage.type = FrameType::UsageDelta;
        usage.usageDelta.promptTokens = 3;
        usage.usageDelta.completionTokens = 2;
        out += *inbound.encodeStreamFrame(usage, state);

        StreamFrame fin;
        fin.type = FrameType::Finished;
        fin.isFinal = true;
        out += *inbound.encodeStreamFrame(fin, state);

        const QList<QByteArray> lines = dataLines(out);
        QCOMPARE(lines.size(), 6);
        QCOMPARE(lines.last(), QByteArray("[DONE]"));

        const QJsonObject first = QJsonDocument::fromJson(lines[0]).object();
        QCOMPARE(first.value(QStringLiteral("id")).toString(), QStringLiteral("chatcmpl-s"));
        QCOMPARE(first.value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("role")).toString(),
                 QStringLiteral("assistant"));

        const QJsonObject tool = QJsonDocument::fromJson(lines[2]).object()
            .value(QStringLiteral("choices")).toArray()[0].toObject()
            .value(QStringLiteral("delta")).toObject()
            .value(QStringLiteral("tool_calls")).toArray()[0].toObject();
        QCOMPARE(tool.value(QStringLiteral("index")).toInt(), 0);
        QCOMPARE(tool.value(QStringLiteral("id")).toString(), QStringLiteral("call_1"));

        const QJsonObject finish = QJsonDocument::fromJson(lines[3]).object();
        QCOMPARE(finish.value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("finish_reason")).toString(),
                 QStringLiteral("tool_calls"));
        const QJsonObject usageChunk = QJsonDocument::fromJson(lines[4]).object();
        QCOMPARE(usageChunk.value(QStringLiteral("usage")).toObject()
                     .value(QStringLiteral("total_tokens")).toInt(), 5);

        for (int i = 0; i < 5; ++i) {
            QCOMPARE(QJsonDocument::fromJson(lines[i]).object()
                         .value(QStringLiteral("model")).toString(),
                     QStringLiteral("gpt-4o"));
        }
    }

    void testToolCallIndexCountsPerChoice() {
        OpenAIChatAdapter inbound;
        StreamEncodeState state;

        StreamFrame started;
        started.type = FrameType::Started;
        started.responseId = QStringLiteral("chatcmpl-n");
        started.model = QStringLiteral("gpt-4o");
        (void)inbound.encodeStreamFrame(started, state);

        QList<QPair<int, int>> seen;   // choice index, tool call index
        const QList<int> choices = {0, 1, 0, 1, 1};
        for (int i = 0; i < choices.size(); ++i) {
            StreamFrame call;
            call.type = FrameType::ActionDelta;
            call.candidateIndex = choices[i];
            call.actionDelta.callId = QStringLiteral("call_%1").arg(i);
            call.actionDelta.name = QStringLiteral("weather");
            call.actionDelta.argsPatch = QStringLiteral("{}");
            call.actionDelta.closed = true;
            auto encoded = inbound.encodeStreamFrame(call, state);
            QVERIFY(encoded.has_value());
            const QList<QByteArray> lines = dataLines(*encoded);
            QCOMPARE(lines.size(), 1);
            const QJsonObject choice = QJsonDocument::fromJson(lines.first()).object()
                .value(QStringLiteral("choices")).toArray()[0].toObject();
            const QJsonObject tool = choice.value(QStringLiteral("delta")).toObject()
                .value(QStringLiteral("tool_calls")).toArray()[0].toObject();
            seen.append({choice.value(QStringLiteral("index")).toInt(),
                         tool.value(QStringLiteral("index")).toInt()});
        }

        const QList<QPair<int, int>> expected = {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {1, 2}};
        QCOMPARE(seen, expected);
    }

    void testStreamFailureIsErrorChunk() {
        OpenAIChatAdapter inbound;
        StreamEncodeState state;

        StreamFrame failed;
        failed.type = FrameType::Failed;
        failed.failure = DomainFailure::streamTimeout(QStringLiteral("idle"));
        const QList<QByteArray> lines = dataLines(*inbound.encodeStreamFrame(failed, state));
        QCOMPARE(lines.size(), 1);
        QCOMPARE(QJsonDocument::fromJson(lines[0]).object()
                     .value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(),
                 QStringLiteral("stream_timeout"));
        QVERIFY(state.finished);
    }

    void testEncodeFailureShape() {
        OpenAIChatAdapter inbound;
        auto body = inbound.encodeFailure(
            DomainFailure::upstreamHttp(503, QStringLiteral("unavailable"), QStringLiteral("down")));
        const QJsonObject err = QJsonDocument::fromJson(*body).object()
            .value(QStringLiteral("error")).toObject();
        QCOMPARE(err.value(QStringLiteral("type")).toString(), QStringLiteral("transport_error"));
        QCOMPARE(err.value(QStringLiteral("subkind")).toString(), QStringLiteral("upstream_http_error"));
        QCOMPARE(err.value(QStringLiteral("upstream_status")).toInt(), 503);
    }

    void testOutboundBuildRequest() {
        auto req = OpenAIWire::decodeRequest(QJsonDocument::fromJson(chatBody()).object());
        QVERIFY(req.has_value());
        req->stream = true;
        req->metadata[QStringLiteral("provider_base_url")] = QStringLiteral("https://api.example.test/v1");
        req->metadata[QStringLiteral("header.authorization")] = QStringLiteral("Bearer caller-key");
        req->metadata[QStringLiteral("custom_header.X-Org")] = QStringLiteral("acme");

        OpenAIOutbound outbound;
        auto pr = outbound.buildRequest(*req);
        QVERIFY(pr.has_value());
        QCOMPARE(pr->url, QStringLiteral("https://api.example.test/v1/chat/completions"));
        QCOMPARE(pr->headers.value(QStringLiteral("Authorization")), QStringLiteral("Bearer caller-key"));
        QCOMPARE(pr->headers.value(QStringLiteral("X-Org")), QStringLiteral("acme"));
        QCOMPARE(pr->headers.value(QStringLiteral("Accept")), QStringLiteral("text/event-stream"));

        const QJsonObject body = QJsonDocument::fromJson(pr->body).object();
        QVERIFY(body.value(QStringLiteral("stream_options")).toObject()
                    .value(QStringLiteral("include_usage")).toBool());
    }

    void testOutboundApiKeyWins() {
        SemanticRequest req;
        req.model = QStringLiteral("gpt-4o");
        req.metadata[QStringLiteral("api_key")] = QStringLiteral("sk-config");
        req.metadata[QStringLiteral("header.authorization")] = QStringLiteral("Bearer caller");

        OpenAIOutbound outbound;
        auto pr = outbound.buildRequest(req);
        QVERIFY(pr.has_value());
        QCOMPARE(pr->url, QStringLiteral("https://api.openai.com/v1/chat/completions"));
        QCOMPARE(pr->headers.value(QStringLiteral("Authorization")), QStringLiteral("Bearer sk-config"));
    }

    void testOutboundParallelToolSlots() {
        OpenAIOutbound outbound;
        StreamDecodeState state;
        auto frames = outbound.parseChunk({QString(),
            R"({"id":"c","model":"m","choices":[{"index":1,"delta":{"tool_calls":[{"index":2,"id":"x","function":{"name":"f","arguments":"{}"}}]}}]})",
            QStringLiteral("openai")}, state);
        QVERIFY(frames.has_value());
        QCOMPARE(frames->size(), 2);
        QCOMPARE(frames->at(0).type, FrameType::Started);
        QCOMPARE(frames->at(1).actionDelta.slot, OpenAIOutbound::kSlotsPerChoice + 2);
        QCOMPARE(frames->at(1).candidateIndex, 1);
        QVERIFY(state.sawToolCall);
    }
};

QTEST_MAIN(TestOpenAIRoundtrip)
#include "tst_openai_roundtrip.moc"
