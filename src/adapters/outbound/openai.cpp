#include "openai.h"
#include "adapters/wire/openai_wire.h"

QString OpenAIOutbound::adapterId() const
{
    return OpenAIWire::kFormat;
}

Result<ProviderRequest> OpenAIOutbound::buildRequest(const SemanticRequest& request)
{
    Result<QJsonObject> body = OpenAIWire::encodeRequest(request);
    if (!body) return std::unexpected(body.error());

    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = OutboundRequest::endpoint(request, QStringLiteral("https://api.openai.com/v1"),
                                       QStringLiteral("/chat/completions"));
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    OutboundRequest::applyCredentials(pr, request, false);
    OutboundRequest::applyHeaders(pr, request,
        {QStringLiteral("openai-organization"), QStringLiteral("openai-beta")});
    if (request.stream)
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");

    pr.body = WireUtil::compact(*body);
    pr.stream = request.stream;
    pr.adapterHint = adapterId();
    return pr;
}

Result<SemanticResponse> OpenAIOutbound::parseResponse(const ProviderResponse& response)
{
    Result<QJsonObject> root = WireUtil::parseObject(response.body);
    if (!root) return std::unexpected(root.error());
    return OpenAIWire::decodeResponse(*root);
}

DomainFailure OpenAIOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root || !root->value(QStringLiteral("error")).isObject())
        return OutboundRequest::plainFailure(httpStatus, body);
    return OpenAIWire::failureFromError(httpStatus, root->value(QStringLiteral("error")).toObject());
}

ParameterBounds OpenAIOutbound::parameterBounds() const
{
    return OpenAIWire::bounds();
}

void OpenAIOutbound::parseChoice(const QJsonObject& choice, StreamDecodeState& state,
                                 QList<StreamFrame>& frames)
{
    const int index = choice.value(QStringLiteral("index")).toInt();
    const QJsonObject delta = choice.value(QStringLiteral("delta")).toObject();

    QString reasoning = delta.value(QStringLiteral("reasoning_content")).toString();
    if (reasoning.isEmpty())
        reasoning = delta.value(QStringLiteral("reasoning")).toString();
    if (!reasoning.isEmpty()) {
        StreamFrame frame;
        frame.type = FrameType::Delta;
        frame.candidateIndex = index;
        frame.deltaSegments.append(Segment::fromReasoning(reasoning));
        frames.append(frame);
    }

    const QString content = delta.value(QStringLiteral("content")).toString();
    if (!content.isEmpty()) {
        StreamFrame frame;
        frame.type = FrameType::Delta;
        frame.candidateIndex = index;
        frame.deltaSegments.append(Segment::fromText(content));
        frames.append(frame);
    }

    for (const QJsonValue& tv : delta.value(QStringLiteral("tool_calls")).toArray()) {
        const QJsonObject tc = tv.toObject();
        const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
        state.sawToolCall = true;

        StreamFrame frame;
        frame.type = FrameType::ActionDelta;
        frame.candidateIndex = index;
        frame.actionDelta.slot = index * kSlotsPerChoice + tc.value(QStringLiteral("index")).toInt();
        frame.actionDelta.callId = tc.value(QStringLiteral("id")).toString();
        frame.actionDelta.name = fn.value(QStringLiteral("name")).toString();
        frame.actionDelta.argsPatch = fn.value(QStringLiteral("arguments")).toString();
        frames.append(frame);
    }

    const QJsonValue finish = choice.value(QStringLiteral("finish_reason"));
    if (finish.isString()) {
        StreamFrame frame;
        frame.type = FrameType::Finished;
        frame.candidateIndex = index;
        frame.stopCause = OpenAIWire::stopCause(finish.toString());
        frames.append(frame);
    }
}

Result<QList<StreamFrame>> OpenAIOutbound::parseChunk(const ProviderChunk& chunk,
                                                      StreamDecodeState& state)
{
    Result<QJsonObject> parsed = WireUtil::parseObject(chunk.data);
    if (!parsed) return std::unexpected(parsed.error());
    const QJsonObject& root = *parsed;

    QList<StreamFrame> frames;
    if (root.value(QStringLiteral("error")).isObject()) {
        StreamFrame frame;
        frame.type = FrameType::Failed;
        frame.failure = OpenAIWire::failureFromError(
            502, root.value(QStringLiteral("error")).toObject());
        frames.append(frame);
        return frames;
    }

    if (!state.started) {
        state.started = true;
        state.responseId = root.value(QStringLiteral("id")).toString();
        state.model = root.value(QStringLiteral("model")).toString();

        StreamFrame frame;
        frame.type = FrameType::Started;
        frame.responseId = state.responseId;
        frame.model = state.model;
        frames.append(frame);
    }

    for (const QJsonValue& cv : root.value(QStringLiteral("choices")).toArray())
        parseChoice(cv.toObject(), state, frames);

    const QJsonValue usage = root.value(QStringLiteral("usage"));
    if (usage.isObject()) {
        state.usage = OpenAIWire::usageFrom(usage.toObject());
        StreamFrame frame;
        frame.type = FrameType::UsageDelta;
        frame.usageDelta = state.usage;
        frames.append(frame);
    }
    return frames;
}
