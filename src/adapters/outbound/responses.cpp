#include "responses.h"
#include "adapters/wire/responses_wire.h"
#include "semantic/sse_parser.h"
#include "semantic/features/stream_aggregator.h"
#include "semantic/features/tool_call_assembler.h"

namespace {

StreamFrame deltaFrame(const Segment& segment)
{
    StreamFrame frame;
    frame.type = FrameType::Delta;
    frame.deltaSegments.append(segment);
    return frame;
}

StreamFrame toolFragment(int slot, const QString& patch, bool closed)
{
    StreamFrame frame;
    frame.type = FrameType::ActionDelta;
    frame.actionDelta.slot = slot;
    frame.actionDelta.argsPatch = patch;
    frame.actionDelta.closed = closed;
    return frame;
}

const QString kOpenCall = QStringLiteral("function_call");
const QString kClosedCall = QStringLiteral("function_call.closed");

}

QString ResponsesOutbound::adapterId() const
{
    return ResponsesWire::kFormat;
}

QString ResponsesOutbound::defaultBaseUrl() const
{
    return QStringLiteral("https://api.openai.com/v1");
}

QStringList ResponsesOutbound::forwardedHeaders() const
{
    return {QStringLiteral("openai-organization"), QStringLiteral("openai-beta")};
}

void ResponsesOutbound::finishBody(QJsonObject& body, const SemanticRequest& request) const
{
    Q_UNUSED(body);
    Q_UNUSED(request);
}

Result<ProviderRequest> ResponsesOutbound::buildRequest(const SemanticRequest& request)
{
    Result<QJsonObject> body = ResponsesWire::encodeRequest(request);
    if (!body) return std::unexpected(body.error());
    finishBody(*body, request);

    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = OutboundRequest::endpoint(request, defaultBaseUrl(), QStringLiteral("/responses"));
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    OutboundRequest::applyCredentials(pr, request, false);
    OutboundRequest::applyHeaders(pr, request, forwardedHeaders());

    pr.stream = body->value(QStringLiteral("stream")).toBool();
    if (pr.stream)
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");
    pr.body = WireUtil::compact(*body);
    pr.adapterHint = adapterId();
    return pr;
}

Result<SemanticResponse> ResponsesOutbound::parseResponse(const ProviderResponse& response)
{
    const QByteArray head = response.body.trimmed().left(6);
    if (head.startsWith("event:") || head.startsWith("data:"))
        return foldEventStream(response.body);

    Result<QJsonObject> root = WireUtil::parseObject(response.body);
    if (!root) return std::unexpected(root.error());
    return ResponsesWire::decodeResponse(*root, adapterId());
}

Result<SemanticResponse> ResponsesOutbound::foldEventStream(const QByteArray& body)
{
    SseParser parser;
    parser.feed(body);
    parser.finish();

    StreamDecodeState state;
    ToolCallAssembler tools;
    StreamAggregator aggregator;

    while (std::optional<SseEvent> event = parser.next()) {
        ProviderChunk chunk;
        chunk.type = event->type;
        chunk.data = event->data;
        chunk.adapterHint = adapterId();

        Result<QList<StreamFrame>> frames = parseChunk(chunk, state);
        if (!frames) return std::unexpected(frames.error());
        for (const StreamFrame& frame : *frames) {
            if (frame.type == FrameType::Failed)
                return std::unexpected(frame.failure);
            if (frame.type == FrameType::ActionDelta) {
                Result<QList<StreamFrame>> promoted = tools.accept(frame);
                if (!promoted) return std::unexpected(promoted.error());
                for (const StreamFrame& call : *promoted)
                    aggregator.addFrame(call);
                continue;
            }
            if (frame.type == FrameType::Finished) {
                for (const StreamFrame& call : tools.flush())
                    aggregator.addFrame(call);
            }
            aggregator.addFrame(frame);
        }
    }
    return aggregator.finalize();
}

DomainFailure ResponsesOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root || !root->value(QStringLiteral("error")).isObject())
        return OutboundRequest::plainFailure(httpStatus, body);
    return ResponsesWire::failureFromError(httpStatus, root->value(QStringLiteral("error")).toObject());
}

ParameterBounds ResponsesOutbound::parameterBounds() const
{
    return ResponsesWire::bounds();
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

void ResponsesOutbound::parseItemDone(const QJsonObject& event, StreamDecodeState& state,
                                      QList<StreamFrame>& frames) const
{
    const int index = event.value(QStringLiteral("output_index")).toInt();
    const QJsonObject item = event.value(QStringLiteral("item")).toObject();
    const QString type = item.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("function_call")) {
        if (state.slotKinds.value(index) == kClosedCall)
            return;
        if (!state.slotKinds.contains(index)) {
            StreamFrame open = toolFragment(index, QString(), false);
            open.actionDelta.callId = item.value(QStringLiteral("call_id")).toString();
            open.actionDelta.name = item.value(QStringLiteral("name")).toString();
            frames.append(open);
            state.sawToolCall = true;
        }
        state.slotKinds[index] = kClosedCall;
        frames.append(toolFragment(index, item.value(QStringLiteral("arguments")).toString(), true));
        return;
    }
    if (type == QLatin1String("reasoning")) {
        if (item.contains(QStringLiteral("encrypted_content"))) {
            Segment seg = Segment::fromReasoning(QString());
            seg.structured[QStringLiteral("encrypted_content")] =
                item.value(QStringLiteral("encrypted_content"));
            frames.append(deltaFrame(seg));
        }
        return;
    }
    if (type == QLatin1String("message"))
        return;

    // Server-side tool calls and other items are relayed whole.
    frames.append(deltaFrame(Segment::fromStructured(item, adapterId())));
}

Result<QList<StreamFrame>> ResponsesOutbound::parseChunk(const ProviderChunk& chunk,
                                                         StreamDecodeState& state)
{
    if (chunk.data.trimmed() == "[DONE]")
        return QList<StreamFrame>();

    Result<QJsonObject> parsed = WireUtil::parseObject(chunk.data);
    if (!parsed) return std::unexpected(parsed.error());
    const QJsonObject& event = *parsed;

    QString type = event.value(QStringLiteral("type")).toString();
    if (type.isEmpty())
        type = chunk.type;
    const QJsonObject response = event.value(QStringLiteral("response")).toObject();

    // Upstream events name their model either at the top level or inside
    // the response object.
    QString model = event.value(QStringLiteral("model")).toString();
    if (model.isEmpty())
        model = response.value(QStringLiteral("model")).toString();
    if (!model.isEmpty())
        state.model = model;

    QList<StreamFrame> frames;
    if (!state.started && (type == QLatin1String("response.created")
                           || type == QLatin1String("response.in_progress"))) {
        state.started = true;
        state.responseId = response.value(QStringLiteral("id")).toString();
        StreamFrame frame;
        frame.type = FrameType::Started;
        frame.responseId = state.responseId;
        frame.model = state.model;
        frames.append(frame);
    } else if (type == QLatin1String("response.output_item.added")) {
        const int index = event.value(QStringLiteral("output_index")).toInt();
        const QJsonObject item = event.value(QStringLiteral("item")).toObject();
        if (item.value(QStringLiteral("type")).toString() == QLatin1String("function_call")) {
            state.slotKinds[index] = kOpenCall;
            state.sawToolCall = true;
            StreamFrame frame = toolFragment(index, item.value(QStringLiteral("arguments")).toString(), false);
            frame.actionDelta.callId = item.value(QStringLiteral("call_id")).toString();
            frame.actionDelta.name = item.value(QStringLiteral("name")).toString();
            frames.append(frame);
        }
    } else if (type == QLatin1String("response.output_text.delta")
               || type == QLatin1String("response.refusal.delta")) {
        frames.append(deltaFrame(Segment::fromText(event.value(QStringLiteral("delta")).toString())));
    } else if (type == QLatin1String("response.reasoning_summary_text.delta")
               || type == QLatin1String("response.reasoning_text.delta")) {
        frames.append(deltaFrame(Segment::fromReasoning(event.value(QStringLiteral("delta")).toString())));
    } else if (type == QLatin1String("response.function_call_arguments.delta")) {
        const int index = event.value(QStringLiteral("output_index")).toInt();
        if (state.slotKinds.value(index) == kOpenCall)
            frames.append(toolFragment(index, event.value(QStringLiteral("delta")).toString(), false));
    } else if (type == QLatin1String("response.function_call_arguments.done")) {
        const int index = event.value(QStringLiteral("output_index")).toInt();
        if (state.slotKinds.value(index) == kOpenCall) {
            state.slotKinds[index] = kClosedCall;
            frames.append(toolFragment(index, event.value(QStringLiteral("arguments")).toString(), true));
        }
    } else if (type == QLatin1String("response.output_item.done")) {
        parseItemDone(event, state, frames);
    } else if (type == QLatin1String("response.completed")
               || type == QLatin1String("response.incomplete")) {
        state.usage = ResponsesWire::usageFrom(response.value(QStringLiteral("usage")).toObject());
        StreamFrame frame;
        frame.type = FrameType::Finished;
        frame.isFinal = true;
        frame.stopCause = ResponsesWire::stopCause(
            response.value(QStringLiteral("status")).toString(),
            response.value(QStringLiteral("incomplete_details")).toObject()
                .value(QStringLiteral("reason")).toString(),
            state.sawToolCall);
        frame.usageDelta = state.usage;
        frames.append(frame);
    } else if (type == QLatin1String("response.failed")) {
        StreamFrame frame;
        frame.type = FrameType::Failed;
        frame.failure = ResponsesWire::failureFromError(
            502, response.value(QStringLiteral("error")).toObject());
        frames.append(frame);
    } else if (type == QLatin1String("error")) {
        QJsonObject error = event.value(QStringLiteral("error")).toObject();
        if (error.isEmpty())
            error = event;
        StreamFrame frame;
        frame.type = FrameType::Failed;
        frame.failure = ResponsesWire::failureFromError(502, error);
        frames.append(frame);
    }
    return frames;
}
