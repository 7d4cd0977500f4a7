#include "adapters/inbound/openai_chat.h"
#include "adapters/wire/openai_wire.h"
#include <QDateTime>

QString OpenAIChatAdapter::protocol() const
{
    return OpenAIWire::kFormat;
}

Result<SemanticRequest> OpenAIChatAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root) return std::unexpected(root.error());

    Result<SemanticRequest> req = OpenAIWire::decodeRequest(*root);
    if (!req) return req;
    req->metadata = metadata;
    return req;
}

Result<QByteArray> OpenAIChatAdapter::encodeResponse(const SemanticResponse& response)
{
    Result<QJsonObject> root = OpenAIWire::encodeResponse(response);
    if (!root) return std::unexpected(root.error());
    return WireUtil::compact(*root);
}

Result<QByteArray> OpenAIChatAdapter::encodeFailure(const DomainFailure& failure)
{
    return WireUtil::compact(OpenAIWire::errorBody(failure));
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

QByteArray OpenAIChatAdapter::chunk(const StreamEncodeState& state, int index,
                                    const QJsonObject& delta, const QJsonValue& finishReason)
{
    QJsonObject choice;
    choice[QStringLiteral("index")] = index;
    choice[QStringLiteral("delta")] = delta;
    choice[QStringLiteral("finish_reason")] = finishReason;

    QJsonObject root;
    root[QStringLiteral("id")] = state.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
    root[QStringLiteral("created")] = state.createdAt;
    root[QStringLiteral("model")] = state.model;
    root[QStringLiteral("choices")] = QJsonArray{choice};
    return WireUtil::sseFrame(QString(), root);
}

void OpenAIChatAdapter::ensureStarted(const StreamFrame& frame, StreamEncodeState& state)
{
    if (!frame.responseId.isEmpty() && !state.started)
        state.responseId = frame.responseId;
    if (!frame.model.isEmpty() && state.model.isEmpty())
        state.model = frame.model;
    if (state.responseId.isEmpty())
        state.responseId = WireUtil::newId(QStringLiteral("chatcmpl-"));
    if (state.createdAt == 0)
        state.createdAt = QDateTime::currentSecsSinceEpoch();
}

Result<QByteArray> OpenAIChatAdapter::encodeStreamFrame(const StreamFrame& frame,
                                                        StreamEncodeState& state)
{
    if (state.finished)
        return QByteArray();

    if (frame.type == FrameType::Failed) {
        state.finished = true;
        return WireUtil::sseFrame(QString(), OpenAIWire::errorBody(frame.failure));
    }

    ensureStarted(frame, state);
    QByteArray out;
    if (!state.started) {
        state.started = true;
        out += chunk(state, frame.candidateIndex,
                     {{QStringLiteral("role"), QStringLiteral("assistant")},
                      {QStringLiteral("content"), QString()}},
                     QJsonValue::Null);
    }

    switch (frame.type) {
    case FrameType::Started:
        state.usage = WireUtil::maxUsage(state.usage, frame.usageDelta);
        break;
    case FrameType::Delta:
        for (const Segment& seg : frame.deltaSegments) {
            if (seg.kind == SegmentKind::Text) {
                if (!seg.text.isEmpty())
                    out += chunk(state, frame.candidateIndex,
                                 {{QStringLiteral("content"), seg.text}}, QJsonValue::Null);
            } else if (seg.kind == SegmentKind::Reasoning) {
                if (!seg.text.isEmpty())
                    out += chunk(state, frame.candidateIndex,
                                 {{QStringLiteral("reasoning_content"), seg.text}}, QJsonValue::Null);
            } else {
                return std::unexpected(DomainFailure::encodeFailed(
                    QStringLiteral("unrepresentable_content"),
                    QStringLiteral("Chat Completions streams carry only text, reasoning and tool calls")));
            }
        }
        break;
    case FrameType::ActionDelta: {
        state.sawToolCall = true;
        ActionCall call;
        call.callId = frame.actionDelta.callId;
        call.name = frame.actionDelta.name;
        call.args = frame.actionDelta.argsPatch;
        QJsonObject tc = OpenAIWire::toolCallObject(call);
        tc[QStringLiteral("index")] = state.toolCallCounts[frame.candidateIndex]++;
        out += chunk(state, frame.candidateIndex,
                     {{QStringLiteral("tool_calls"), QJsonArray{tc}}}, QJsonValue::Null);
        break;
    }
    case FrameType::UsageDelta:
        state.usage = WireUtil::maxUsage(state.usage, frame.usageDelta);
        break;
    case FrameType::Finished: {
        state.finished = true;
        const StopCause cause = frame.stopCause.value_or(
            state.sawToolCall ? StopCause::ToolCall : StopCause::Completed);
        out += chunk(state, frame.candidateIndex, QJsonObject(),
                     OpenAIWire::finishReason(cause));
        if (!state.usage.isEmpty()) {
            QJsonObject root;
            root[QStringLiteral("id")] = state.responseId;
            root[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
            root[QStringLiteral("created")] = state.createdAt;
            root[QStringLiteral("model")] = state.model;
            root[QStringLiteral("choices")] = QJsonArray();
            root[QStringLiteral("usage")] = OpenAIWire::usageObject(state.usage);
            out += WireUtil::sseFrame(QString(), root);
        }
        out += WireUtil::sseData(QByteArrayLiteral("[DONE]"));
        break;
    }
    case FrameType::Failed:
        break;
    }
    return out;
}
