#include "adapters/inbound/openai_responses.h"
#include "adapters/wire/responses_wire.h"
#include <QDateTime>

QString OpenAIResponsesAdapter::protocol() const
{
    return ResponsesWire::kFormat;
}

Result<SemanticRequest> OpenAIResponsesAdapter::decodeResponsesBody(
    const QJsonObject& root,
    const QMap<QString, QString>& metadata) const
{
    Result<SemanticRequest> req = ResponsesWire::decodeRequest(root, protocol());
    if (!req) return req;
    req->metadata = metadata;
    return req;
}

Result<SemanticRequest> OpenAIResponsesAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root) return std::unexpected(root.error());
    return decodeResponsesBody(*root, metadata);
}

Result<QByteArray> OpenAIResponsesAdapter::encodeResponse(const SemanticResponse& response)
{
    Result<QJsonObject> root = ResponsesWire::encodeResponse(response);
    if (!root) return std::unexpected(root.error());
    return WireUtil::compact(*root);
}

Result<QByteArray> OpenAIResponsesAdapter::encodeFailure(const DomainFailure& failure)
{
    return WireUtil::compact(failure.toJson());
}

// ---------------------------------------------------------------------------
// Streaming
// ---------------------------------------------------------------------------

QByteArray OpenAIResponsesAdapter::event(StreamEncodeState& state, const QString& type,
                                         QJsonObject payload)
{
    payload[QStringLiteral("type")] = type;
    payload[QStringLiteral("sequence_number")] = state.sequence++;
    payload[QStringLiteral("model")] = state.model;
    return WireUtil::sseFrame(type, payload);
}

QJsonObject OpenAIResponsesAdapter::responseObject(const StreamEncodeState& state,
                                                   const QString& status)
{
    QJsonObject response;
    response[QStringLiteral("id")] = state.responseId;
    response[QStringLiteral("object")] = QStringLiteral("response");
    response[QStringLiteral("created_at")] = state.createdAt;
    response[QStringLiteral("model")] = state.model;
    response[QStringLiteral("status")] = status;
    response[QStringLiteral("output")] = state.outputItems;
    return response;
}

QByteArray OpenAIResponsesAdapter::responseCreated(const StreamFrame& frame,
                                                   StreamEncodeState& state)
{
    if (state.started)
        return {};
    state.started = true;
    if (!frame.responseId.isEmpty())
        state.responseId = frame.responseId;
    if (state.responseId.isEmpty())
        state.responseId = WireUtil::newId(QStringLiteral("resp_"));
    if (!frame.model.isEmpty())
        state.model = frame.model;
    state.createdAt = QDateTime::currentSecsSinceEpoch();

    const QJsonObject response = responseObject(state, QStringLiteral("in_progress"));
    QByteArray out = event(state, QStringLiteral("response.created"),
                           {{QStringLiteral("response"), response}});
    out += event(state, QStringLiteral("response.in_progress"),
                 {{QStringLiteral("response"), response}});
    return out;
}

QByteArray OpenAIResponsesAdapter::openItem(StreamEncodeState& state, const QString& kind,
                                            const QString& itemId, const QJsonObject& item)
{
    QByteArray out = closeItem(state);
    state.openIndex = state.nextIndex++;
    state.openKind = kind;
    state.openItemId = itemId;
    state.openText.clear();
    state.openStructured = QJsonObject();

    out += event(state, QStringLiteral("response.output_item.added"),
                 {{QStringLiteral("output_index"), state.openIndex},
                  {QStringLiteral("item"), item}});
    if (kind == QLatin1String("message")) {
        QJsonObject part;
        part[QStringLiteral("type")] = QStringLiteral("output_text");
        part[QStringLiteral("text")] = QString();
        part[QStringLiteral("annotations")] = QJsonArray();
        out += event(state, QStringLiteral("response.content_part.added"),
                     {{QStringLiteral("item_id"), itemId},
                      {QStringLiteral("output_index"), state.openIndex},
                      {QStringLiteral("content_index"), 0},
                      {QStringLiteral("part"), part}});
    }
    return out;
}

QByteArray OpenAIResponsesAdapter::closeItem(StreamEncodeState& state)
{
    if (state.openIndex < 0)
        return {};

    QByteArray out;
    QJsonObject item;
    if (state.openKind == QLatin1String("message")) {
        QJsonObject part;
        part[QStringLiteral("type")] = QStringLiteral("output_text");
        part[QStringLiteral("text")] = state.openText;
        part[QStringLiteral("annotations")] = QJsonArray();
        out += event(state, QStringLiteral("response.output_text.done"),
                     {{QStringLiteral("item_id"), state.openItemId},
                      {QStringLiteral("output_index"), state.openIndex},
                      {QStringLiteral("content_index"), 0},
                      {QStringLiteral("text"), state.openText}});
        out += event(state, QStringLiteral("response.content_part.done"),
                     {{QStringLiteral("item_id"), state.openItemId},
                      {QStringLiteral("output_index"), state.openIndex},
                      {QStringLiteral("content_index"), 0},
                      {QStringLiteral("part"), part}});
        item = ResponsesWire::messageItem(state.openItemId, state.openText, true);
    } else {
        if (!state.openText.isEmpty()) {
            QJsonObject part;
            part[QStringLiteral("type")] = QStringLiteral("summary_text");
            part[QStringLiteral("text")] = state.openText;
            out += event(state, QStringLiteral("response.reasoning_summary_text.done"),
                         {{QStringLiteral("item_id"), state.openItemId},
                          {QStringLiteral("output_index"), state.openIndex},
                          {QStringLiteral("summary_index"), 0},
                          {QStringLiteral("text"), state.openText}});
            out += event(state, QStringLiteral("response.reasoning_summary_part.done"),
                         {{QStringLiteral("item_id"), state.openItemId},
                          {QStringLiteral("output_index"), state.openIndex},
                          {QStringLiteral("summary_index"), 0},
                          {QStringLiteral("part"), part}});
        }
        item = ResponsesWire::reasoningItem(state.openItemId, state.openText);
        if (state.openStructured.contains(QStringLiteral("encrypted_content")))
            item[QStringLiteral("encrypted_content")] =
                state.openStructured.value(QStringLiteral("encrypted_content"));
    }

    out += event(state, QStringLiteral("response.output_item.done"),
                 {{QStringLiteral("output_index"), state.openIndex},
                  {QStringLiteral("item"), item}});
    state.outputItems.append(item);

    state.openIndex = -1;
    state.openKind.clear();
    state.openItemId.clear();
    state.openText.clear();
    state.openStructured = QJsonObject();
    return out;
}

Result<QByteArray> OpenAIResponsesAdapter::encodeSegments(const QList<Segment>& segments,
                                                          StreamEncodeState& state)
{
    QByteArray out;
    for (const Segment& seg : segments) {
        switch (seg.kind) {
        case SegmentKind::Text: {
            if (state.openKind != QLatin1String("message")) {
                const QString itemId = WireUtil::newId(QStringLiteral("msg_"));
                out += openItem(state, QStringLiteral("message"), itemId,
                                ResponsesWire::messageItem(itemId, QString(), false));
            }
            if (seg.text.isEmpty())
                break;
            state.openText += seg.text;
            out += event(state, QStringLiteral("response.output_text.delta"),
                         {{QStringLiteral("item_id"), state.openItemId},
                          {QStringLiteral("output_index"), state.openIndex},
                          {QStringLiteral("content_index"), 0},
                          {QStringLiteral("delta"), seg.text}});
            break;
        }
        case SegmentKind::Reasoning: {
            if (state.openKind != QLatin1String("reasoning")) {
                const QString itemId = WireUtil::newId(QStringLiteral("rs_"));
                out += openItem(state, QStringLiteral("reasoning"), itemId,
                                ResponsesWire::reasoningItem(itemId, QString()));
            }
            for (auto it = seg.structured.constBegin(); it != seg.structured.constEnd(); ++it)
                state.openStructured[it.key()] = it.value();
            if (seg.text.isEmpty())
                break;
            if (state.openText.isEmpty()) {
                out += event(state, QStringLiteral("response.reasoning_summary_part.added"),
                             {{QStringLiteral("item_id"), state.openItemId},
                              {QStringLiteral("output_index"), state.openIndex},
                              {QStringLiteral("summary_index"), 0},
                              {QStringLiteral("part"), QJsonObject{
                                  {QStringLiteral("type"), QStringLiteral("summary_text")},
                                  {QStringLiteral("text"), QString()}}}});
            }
            state.openText += seg.text;
            out += event(state, QStringLiteral("response.reasoning_summary_text.delta"),
                         {{QStringLiteral("item_id"), state.openItemId},
                          {QStringLiteral("output_index"), state.openIndex},
                          {QStringLiteral("summary_index"), 0},
                          {QStringLiteral("delta"), seg.text}});
            break;
        }
        case SegmentKind::Structured: {
            VoidResult ok = WireUtil::checkStructuredOrigin(seg, ResponsesWire::compatibleFormats());
            if (!ok) return std::unexpected(ok.error());
            out += closeItem(state);
            const int index = state.nextIndex++;
            out += event(state, QStringLiteral("response.output_item.added"),
                         {{QStringLiteral("output_index"), index},
                          {QStringLiteral("item"), seg.structured}});
            out += event(state, QStringLiteral("response.output_item.done"),
                         {{QStringLiteral("output_index"), index},
                          {QStringLiteral("item"), seg.structured}});
            state.outputItems.append(seg.structured);
            break;
        }
        case SegmentKind::Media:
            return std::unexpected(DomainFailure::encodeFailed(
                QStringLiteral("unrepresentable_content"),
                QStringLiteral("Streamed assistant output cannot carry media items")));
        }
    }
    return out;
}

QByteArray OpenAIResponsesAdapter::encodeToolCall(const ActionDelta& call,
                                                  StreamEncodeState& state)
{
    state.sawToolCall = true;
    QByteArray out = closeItem(state);

    ActionCall full;
    full.callId = call.callId;
    full.name = call.name;
    full.args = call.argsPatch;
    QJsonObject item = ResponsesWire::functionCallItem(full, true);
    const QString itemId = item.value(QStringLiteral("id")).toString();
    const int index = state.nextIndex++;

    QJsonObject pending = item;
    pending[QStringLiteral("arguments")] = QString();
    pending[QStringLiteral("status")] = QStringLiteral("in_progress");
    out += event(state, QStringLiteral("response.output_item.added"),
                 {{QStringLiteral("output_index"), index},
                  {QStringLiteral("item"), pending}});
    if (!call.argsPatch.isEmpty()) {
        out += event(state, QStringLiteral("response.function_call_arguments.delta"),
                     {{QStringLiteral("item_id"), itemId},
                      {QStringLiteral("output_index"), index},
                      {QStringLiteral("delta"), call.argsPatch}});
    }
    out += event(state, QStringLiteral("response.function_call_arguments.done"),
                 {{QStringLiteral("item_id"), itemId},
                  {QStringLiteral("output_index"), index},
                  {QStringLiteral("arguments"), call.argsPatch}});
    out += event(state, QStringLiteral("response.output_item.done"),
                 {{QStringLiteral("output_index"), index},
                  {QStringLiteral("item"), item}});
    state.outputItems.append(item);
    return out;
}

QByteArray OpenAIResponsesAdapter::responseDone(const StreamFrame& frame,
                                                StreamEncodeState& state)
{
    QByteArray out = closeItem(state);
    state.finished = true;

    const StopCause cause = frame.stopCause.value_or(
        state.sawToolCall ? StopCause::ToolCall : StopCause::Completed);
    const QString status = ResponsesWire::status(cause);

    QJsonObject response = responseObject(state, status);
    const QString reason = ResponsesWire::incompleteReason(cause);
    if (!reason.isEmpty())
        response[QStringLiteral("incomplete_details")] =
            QJsonObject{{QStringLiteral("reason"), reason}};
    response[QStringLiteral("usage")] = ResponsesWire::usageObject(state.usage);

    out += event(state, QStringLiteral("response.") + status,
                 {{QStringLiteral("response"), response}});
    return out;
}

Result<QByteArray> OpenAIResponsesAdapter::encodeStreamFrame(const StreamFrame& frame,
                                                             StreamEncodeState& state)
{
    if (state.finished)
        return QByteArray();

    if (frame.type == FrameType::Started || frame.type == FrameType::UsageDelta)
        state.usage = WireUtil::maxUsage(state.usage, frame.usageDelta);
    QByteArray out = responseCreated(frame, state);

    switch (frame.type) {
    case FrameType::Started:
    case FrameType::UsageDelta:
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
    case FrameType::Finished:
        out += responseDone(frame, state);
        break;
    case FrameType::Failed: {
        state.finished = true;
        QJsonObject response = responseObject(state, QStringLiteral("failed"));
        response[QStringLiteral("error")] = frame.failure.errorObject();
        out += event(state, QStringLiteral("response.failed"),
                     {{QStringLiteral("response"), response}});
        break;
    }
    }
    return out;
}
