#include "adapters/inbound/anthropic.h"
#include "adapters/wire/anthropic_wire.h"
#include <QDateTime>

QString AnthropicAdapter::protocol() const
{
    return AnthropicWire::kFormat;
}

Result<SemanticRequest> AnthropicAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root) return std::unexpected(root.error());

    Result<SemanticRequest> req = AnthropicWire::decodeRequest(*root);
    if (!req) return req;
    req->metadata = metadata;
    return req;
}

Result<QByteArray> AnthropicAdapter::encodeResponse(const SemanticResponse& response)
{
    Result<QJsonObject> root = AnthropicWire::encodeResponse(response);
    if (!root) return std::unexpected(root.error());
    return WireUtil::compact(*root);
}

Result<QByteArray> AnthropicAdapter::encodeFailure(const DomainFailure& failure)
{
    return WireUtil::compact(AnthropicWire::errorBody(failure));
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

QByteArray AnthropicAdapter::messageStart(const StreamFrame& frame, StreamEncodeState& state)
{
    if (state.started)
        return {};
    state.started = true;
    if (!frame.responseId.isEmpty())
        state.responseId = frame.responseId;
    if (state.responseId.isEmpty())
        state.responseId = WireUtil::newId(QStringLiteral("msg_"));
    if (!frame.model.isEmpty())
        state.model = frame.model;
    state.createdAt = QDateTime::currentSecsSinceEpoch();

    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = state.usage.promptTokens;
    usage[QStringLiteral("output_tokens")] = 0;

    QJsonObject message;
    message[QStringLiteral("id")] = state.responseId;
    message[QStringLiteral("type")] = QStringLiteral("message");
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("model")] = state.model;
    message[QStringLiteral("content")] = QJsonArray();
    message[QStringLiteral("stop_reason")] = QJsonValue::Null;
    message[QStringLiteral("stop_sequence")] = QJsonValue::Null;
    message[QStringLiteral("usage")] = usage;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("message_start");
    event[QStringLiteral("message")] = message;
    return WireUtil::sseFrame(QStringLiteral("message_start"), event);
}

QByteArray AnthropicAdapter::openBlock(StreamEncodeState& state, const QString& kind,
                                       const QJsonObject& contentBlock)
{
    QByteArray out = closeBlock(state);
    state.openIndex = state.nextIndex++;
    state.openKind = kind;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_start");
    event[QStringLiteral("index")] = state.openIndex;
    event[QStringLiteral("content_block")] = contentBlock;
    out += WireUtil::sseFrame(QStringLiteral("content_block_start"), event);
    return out;
}

QByteArray AnthropicAdapter::closeBlock(StreamEncodeState& state)
{
    if (state.openIndex < 0)
        return {};
    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_stop");
    event[QStringLiteral("index")] = state.openIndex;
    state.openIndex = -1;
    state.openKind.clear();
    return WireUtil::sseFrame(QStringLiteral("content_block_stop"), event);
}

QByteArray AnthropicAdapter::blockDelta(const StreamEncodeState& state, const QJsonObject& delta)
{
    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_delta");
    event[QStringLiteral("index")] = state.openIndex;
    event[QStringLiteral("delta")] = delta;
    return WireUtil::sseFrame(QStringLiteral("content_block_delta"), event);
}

Result<QByteArray> AnthropicAdapter::encodeSegments(const QList<Segment>& segments,
                                                    StreamEncodeState& state)
{
    QByteArray out;
    for (const Segment& seg : segments) {
        switch (seg.kind) {
        case SegmentKind::Text: {
            if (state.openKind != QLatin1String("text")) {
                out += openBlock(state, QStringLiteral("text"),
                                 {{QStringLiteral("type"), QStringLiteral("text")},
                                  {QStringLiteral("text"), QString()}});
            }
            if (!seg.text.isEmpty()) {
                out += blockDelta(state, {{QStringLiteral("type"), QStringLiteral("text_delta")},
                                          {QStringLiteral("text"), seg.text}});
            }
            break;
        }
        case SegmentKind::Reasoning: {
            if (state.openKind != QLatin1String("thinking")) {
                out += openBlock(state, QStringLiteral("thinking"),
                                 {{QStringLiteral("type"), QStringLiteral("thinking")},
                                  {QStringLiteral("thinking"), QString()}});
            }
            if (!seg.text.isEmpty()) {
                out += blockDelta(state, {{QStringLiteral("type"), QStringLiteral("thinking_delta")},
                                          {QStringLiteral("thinking"), seg.text}});
            }
            const QString signature = seg.structured.value(QStringLiteral("signature")).toString();
            if (!signature.isEmpty()) {
                out += blockDelta(state, {{QStringLiteral("type"), QStringLiteral("signature_delta")},
                                          {QStringLiteral("signature"), signature}});
            }
            break;
        }
        case SegmentKind::Structured: {
            VoidResult ok = WireUtil::checkStructuredOrigin(seg, AnthropicWire::compatibleFormats());
            if (!ok) return std::unexpected(ok.error());
            out += openBlock(state, QStringLiteral("structured"), seg.structured);
            out += closeBlock(state);
            break;
        }
        case SegmentKind::Media:
            return std::unexpected(DomainFailure::encodeFailed(
                QStringLiteral("unrepresentable_content"),
                QStringLiteral("Streamed assistant output cannot carry media blocks")));
        }
    }
    return out;
}

QByteArray AnthropicAdapter::encodeToolCall(const ActionDelta& call, StreamEncodeState& state)
{
    state.sawToolCall = true;
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("tool_use");
    block[QStringLiteral("id")] = call.callId;
    block[QStringLiteral("name")] = call.name;
    block[QStringLiteral("input")] = QJsonObject();

    QByteArray out = openBlock(state, QStringLiteral("tool_use"), block);
    if (!call.argsPatch.isEmpty()) {
        out += blockDelta(state, {{QStringLiteral("type"), QStringLiteral("input_json_delta")},
                                  {QStringLiteral("partial_json"), call.argsPatch}});
    }
    out += closeBlock(state);
    return out;
}

QByteArray AnthropicAdapter::messageStop(const StreamFrame& frame, StreamEncodeState& state)
{
    QByteArray out = closeBlock(state);
    state.finished = true;

    const StopCause cause = frame.stopCause.value_or(
        state.sawToolCall ? StopCause::ToolCall : StopCause::Completed);

    QJsonObject delta;
    delta[QStringLiteral("stop_reason")] = AnthropicWire::stopReason(cause);
    delta[QStringLiteral("stop_sequence")] = QJsonValue::Null;

    QJsonObject usage;
    usage[QStringLiteral("output_tokens")] = state.usage.completionTokens;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("message_delta");
    event[QStringLiteral("delta")] = delta;
    event[QStringLiteral("usage")] = usage;
    out += WireUtil::sseFrame(QStringLiteral("message_delta"), event);

    out += WireUtil::sseFrame(QStringLiteral("message_stop"),
                              {{QStringLiteral("type"), QStringLiteral("message_stop")}});
    return out;
}

Result<QByteArray> AnthropicAdapter::encodeStreamFrame(const StreamFrame& frame,
                                                       StreamEncodeState& state)
{
    if (state.finished)
        return QByteArray();

    if (frame.type == FrameType::Failed) {
        state.finished = true;
        return WireUtil::sseFrame(QStringLiteral("error"), AnthropicWire::errorBody(frame.failure));
    }

    if (frame.type == FrameType::Started)
        state.usage = WireUtil::maxUsage(state.usage, frame.usageDelta);
    QByteArray out = messageStart(frame, state);

    switch (frame.type) {
    case FrameType::Started:
        break;
    case FrameType::Delta: {
        Result<QByteArray> encoded = encodeSegments(frame.deltaSegments, state);
        if (!encoded) return encoded;
        out += *encoded;
        break;
    }
    case FrameType::ActionDelta:
        out += encodeToolCall(frame.actionDelta, state);
        break;
    case FrameType::UsageDelta:
        state.usage = WireUtil::maxUsage(state.usage, frame.usageDelta);
        break;
    case FrameType::Finished:
        out += messageStop(frame, state);
        break;
    case FrameType::Failed:
        break;
    }
    return out;
}
