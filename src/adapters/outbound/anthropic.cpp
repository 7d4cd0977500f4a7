#include "anthropic.h"
#include "adapters/wire/anthropic_wire.h"

namespace {

StreamFrame deltaFrame(const Segment& segment)
{
    StreamFrame frame;
    frame.type = FrameType::Delta;
    frame.deltaSegments.append(segment);
    return frame;
}

}

QString AnthropicOutbound::adapterId() const
{
    return AnthropicWire::kFormat;
}

Result<ProviderRequest> AnthropicOutbound::buildRequest(const SemanticRequest& request)
{
    Result<QJsonObject> body = AnthropicWire::encodeRequest(request);
    if (!body) return std::unexpected(body.error());

    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = OutboundRequest::endpoint(request, QStringLiteral("https://api.anthropic.com/v1"),
                                       QStringLiteral("/messages"));
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("anthropic-version")] = QStringLiteral("2023-06-01");
    OutboundRequest::applyCredentials(pr, request, true);
    OutboundRequest::applyHeaders(pr, request,
        {QStringLiteral("anthropic-version"), QStringLiteral("anthropic-beta")});
    if (request.stream)
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");

    pr.body = WireUtil::compact(*body);
    pr.stream = request.stream;
    pr.adapterHint = adapterId();
    return pr;
}

Result<SemanticResponse> AnthropicOutbound::parseResponse(const ProviderResponse& response)
{
    Result<QJsonObject> root = WireUtil::parseObject(response.body);
    if (!root) return std::unexpected(root.error());
    return AnthropicWire::decodeResponse(*root);
}

DomainFailure AnthropicOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root || !root->value(QStringLiteral("error")).isObject())
        return OutboundRequest::plainFailure(httpStatus, body);
    return AnthropicWire::failureFromError(httpStatus, root->value(QStringLiteral("error")).toObject());
}

ParameterBounds AnthropicOutbound::parameterBounds() const
{
    return AnthropicWire::bounds();
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

StreamFrame AnthropicOutbound::blockStart(const QJsonObject& event, StreamDecodeState& state)
{
    const int index = event.value(QStringLiteral("index")).toInt();
    const QJsonObject block = event.value(QStringLiteral("content_block")).toObject();
    const QString type = block.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("text")) {
        state.slotKinds[index] = type;
        return deltaFrame(Segment::fromText(block.value(QStringLiteral("text")).toString()));
    }
    if (type == QLatin1String("thinking")) {
        state.slotKinds[index] = type;
        return deltaFrame(Segment::fromReasoning(block.value(QStringLiteral("thinking")).toString()));
    }
    if (type == QLatin1String("tool_use")) {
        state.slotKinds[index] = type;
        state.sawToolCall = true;
        StreamFrame frame;
        frame.type = FrameType::ActionDelta;
        frame.actionDelta.slot = index;
        frame.actionDelta.callId = block.value(QStringLiteral("id")).toString();
        frame.actionDelta.name = block.value(QStringLiteral("name")).toString();
        const QJsonObject input = block.value(QStringLiteral("input")).toObject();
        if (!input.isEmpty())
            frame.actionDelta.argsPatch = WireUtil::argsText(input);
        return frame;
    }

    // redacted_thinking, server tool blocks, ...
    state.slotKinds[index] = QStringLiteral("structured");
    return deltaFrame(AnthropicWire::decodeBlock(block));
}

std::optional<StreamFrame> AnthropicOutbound::blockDelta(const QJsonObject& event,
                                                         const StreamDecodeState& state)
{
    const int index = event.value(QStringLiteral("index")).toInt();
    const QJsonObject delta = event.value(QStringLiteral("delta")).toObject();
    const QString type = delta.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("text_delta"))
        return deltaFrame(Segment::fromText(delta.value(QStringLiteral("text")).toString()));
    if (type == QLatin1String("thinking_delta"))
        return deltaFrame(Segment::fromReasoning(delta.value(QStringLiteral("thinking")).toString()));
    if (type == QLatin1String("signature_delta")) {
        Segment seg = Segment::fromReasoning(QString());
        seg.structured[QStringLiteral("signature")] = delta.value(QStringLiteral("signature"));
        return deltaFrame(seg);
    }
    if (type == QLatin1String("input_json_delta")
        && state.slotKinds.value(index) == QLatin1String("tool_use")) {
        StreamFrame frame;
        frame.type = FrameType::ActionDelta;
        frame.actionDelta.slot = index;
        frame.actionDelta.argsPatch = delta.value(QStringLiteral("partial_json")).toString();
        return frame;
    }
    return std::nullopt;
}

Result<QList<StreamFrame>> AnthropicOutbound::parseChunk(const ProviderChunk& chunk,
                                                         StreamDecodeState& state)
{
    Result<QJsonObject> parsed = WireUtil::parseObject(chunk.data);
    if (!parsed) return std::unexpected(parsed.error());
    const QJsonObject& event = *parsed;

    QString type = event.value(QStringLiteral("type")).toString();
    if (type.isEmpty())
        type = chunk.type;

    QList<StreamFrame> frames;
    if (type == QLatin1String("message_start")) {
        const QJsonObject message = event.value(QStringLiteral("message")).toObject();
        state.responseId = message.value(QStringLiteral("id")).toString();
        state.model = message.value(QStringLiteral("model")).toString();
        state.started = true;
        const QJsonObject usage = message.value(QStringLiteral("usage")).toObject();
        state.usage.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();

        StreamFrame frame;
        frame.type = FrameType::Started;
        frame.responseId = state.responseId;
        frame.model = state.model;
        frame.usageDelta.promptTokens = state.usage.promptTokens;
        frames.append(frame);
    } else if (type == QLatin1String("content_block_start")) {
        frames.append(blockStart(event, state));
    } else if (type == QLatin1String("content_block_delta")) {
        if (std::optional<StreamFrame> frame = blockDelta(event, state))
            frames.append(*frame);
    } else if (type == QLatin1String("content_block_stop")) {
        const int index = event.value(QStringLiteral("index")).toInt();
        if (state.slotKinds.value(index) == QLatin1String("tool_use")) {
            StreamFrame frame;
            frame.type = FrameType::ActionDelta;
            frame.actionDelta.slot = index;
            frame.actionDelta.closed = true;
            frames.append(frame);
        }
    } else if (type == QLatin1String("message_delta")) {
        const QJsonObject delta = event.value(QStringLiteral("delta")).toObject();
        const QJsonObject usage = event.value(QStringLiteral("usage")).toObject();
        if (usage.contains(QStringLiteral("input_tokens")))
            state.usage.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
        state.usage.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
        state.usage.totalTokens = state.usage.promptTokens + state.usage.completionTokens;

        StreamFrame frame;
        frame.type = FrameType::Finished;
        const QString reason = delta.value(QStringLiteral("stop_reason")).toString();
        if (!reason.isEmpty())
            frame.stopCause = AnthropicWire::stopCause(reason);
        frame.usageDelta = state.usage;
        frames.append(frame);
    } else if (type == QLatin1String("message_stop")) {
        StreamFrame frame;
        frame.type = FrameType::Finished;
        frame.isFinal = true;
        frames.append(frame);
    } else if (type == QLatin1String("error")) {
        StreamFrame frame;
        frame.type = FrameType::Failed;
        frame.failure = AnthropicWire::failureFromError(
            0, event.value(QStringLiteral("error")).toObject());
        frames.append(frame);
    }
    // ping and unknown events carry nothing.
    return frames;
}
