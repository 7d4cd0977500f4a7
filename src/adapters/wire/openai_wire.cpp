#include "openai_wire.h"
#include <QDateTime>

namespace OpenAIWire {

namespace {

const QStringList kRequestKeys = {
    QStringLiteral("model"), QStringLiteral("messages"), QStringLiteral("temperature"),
    QStringLiteral("top_p"), QStringLiteral("max_tokens"), QStringLiteral("max_completion_tokens"),
    QStringLiteral("stop"), QStringLiteral("seed"), QStringLiteral("frequency_penalty"),
    QStringLiteral("presence_penalty"), QStringLiteral("tools"), QStringLiteral("tool_choice"),
    QStringLiteral("parallel_tool_calls"), QStringLiteral("stream"), QStringLiteral("stream_options"),
    QStringLiteral("reasoning_effort")
};

const QStringList kResponseKeys = {
    QStringLiteral("id"), QStringLiteral("object"), QStringLiteral("created"),
    QStringLiteral("model"), QStringLiteral("choices"), QStringLiteral("usage")
};

Segment decodePart(const QJsonObject& part)
{
    const QString type = part.value(QStringLiteral("type")).toString();
    if (type == QLatin1String("text")) {
        Segment seg = Segment::fromText(part.value(QStringLiteral("text")).toString());
        seg.extras = WireUtil::extrasOf(part, {QStringLiteral("type"), QStringLiteral("text")});
        return seg;
    }
    if (type == QLatin1String("image_url")) {
        const QJsonObject image = part.value(QStringLiteral("image_url")).toObject();
        Segment seg = Segment::fromMedia(
            WireUtil::mediaFromUrl(image.value(QStringLiteral("url")).toString()));
        seg.extras = WireUtil::extrasOf(image, {QStringLiteral("url")});
        return seg;
    }
    // input_audio, file, ...
    return Segment::fromStructured(part, kFormat);
}

QList<Segment> decodeContent(const QJsonValue& content)
{
    QList<Segment> segments;
    if (content.isString()) {
        segments.append(Segment::fromText(content.toString()));
    } else if (content.isArray()) {
        for (const QJsonValue& pv : content.toArray()) {
            segments.append(decodePart(pv.toObject()));
        }
    }
    return segments;
}

// Reasoning goes to reasoning_content, everything else to content parts.
Result<QJsonArray> encodeParts(const QList<Segment>& segments, QString* reasoning)
{
    QJsonArray parts;
    for (const Segment& seg : segments) {
        QJsonObject part;
        switch (seg.kind) {
        case SegmentKind::Text:
            part[QStringLiteral("type")] = QStringLiteral("text");
            part[QStringLiteral("text")] = seg.text;
            WireUtil::applyExtras(part, WireUtil::extrasOf(seg.extras, {QStringLiteral("detail")}));
            break;
        case SegmentKind::Media: {
            QJsonObject image;
            image[QStringLiteral("url")] = WireUtil::mediaUrl(seg.media);
            if (seg.extras.contains(QStringLiteral("detail")))
                image[QStringLiteral("detail")] = seg.extras.value(QStringLiteral("detail"));
            part[QStringLiteral("type")] = QStringLiteral("image_url");
            part[QStringLiteral("image_url")] = image;
            break;
        }
        case SegmentKind::Reasoning:
            if (reasoning)
                reasoning->append(seg.text);
            continue;
        case SegmentKind::Structured: {
            VoidResult ok = WireUtil::checkStructuredOrigin(seg, compatibleFormats());
            if (!ok)
                return std::unexpected(ok.error());
            part = seg.structured;
            break;
        }
        }
        parts.append(part);
    }
    return parts;
}

QJsonValue contentValue(const QJsonArray& parts)
{
    if (parts.size() == 1) {
        const QJsonObject part = parts.first().toObject();
        if (part.size() == 2 && part.value(QStringLiteral("type")).toString() == QLatin1String("text"))
            return part.value(QStringLiteral("text"));
    }
    return parts;
}

ActionCall decodeToolCall(const QJsonObject& tc)
{
    const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
    ActionCall call;
    call.callId = tc.value(QStringLiteral("id")).toString();
    call.name = fn.value(QStringLiteral("name")).toString();
    call.args = WireUtil::argsText(fn.value(QStringLiteral("arguments")));
    return call;
}

}

QStringList compatibleFormats()
{
    return {kFormat, QStringLiteral("openai.native")};
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Result<SemanticRequest> decodeRequest(const QJsonObject& root)
{
    SemanticRequest req;
    req.envelope = SemanticEnvelope::create();
    req.model = root.value(QStringLiteral("model")).toString();

    const QJsonValue msgsVal = root.value(QStringLiteral("messages"));
    if (!msgsVal.isArray()) {
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("invalid_messages"),
            QStringLiteral("'messages' must be an array")));
    }

    for (const QJsonValue& mv : msgsVal.toArray()) {
        const QJsonObject m = mv.toObject();
        InteractionItem item;
        item.role = m.value(QStringLiteral("role")).toString();
        if (item.role == QLatin1String("developer"))
            item.role = QStringLiteral("system");
        item.name = m.value(QStringLiteral("name")).toString();

        const QString reasoning = m.value(QStringLiteral("reasoning_content")).toString();
        if (!reasoning.isEmpty())
            item.content.append(Segment::fromReasoning(reasoning));
        item.content.append(decodeContent(m.value(QStringLiteral("content"))));

        for (const QJsonValue& tv : m.value(QStringLiteral("tool_calls")).toArray())
            item.toolCalls.append(decodeToolCall(tv.toObject()));
        item.toolCallId = m.value(QStringLiteral("tool_call_id")).toString();

        req.messages.append(item);
    }

    ConstraintSet& c = req.constraints;
    if (root.contains(QStringLiteral("temperature")))
        c.temperature = root.value(QStringLiteral("temperature")).toDouble();
    if (root.contains(QStringLiteral("top_p")))
        c.topP = root.value(QStringLiteral("top_p")).toDouble();
    if (root.contains(QStringLiteral("max_completion_tokens")))
        c.maxTokens = root.value(QStringLiteral("max_completion_tokens")).toInt();
    else if (root.contains(QStringLiteral("max_tokens")))
        c.maxTokens = root.value(QStringLiteral("max_tokens")).toInt();
    if (root.contains(QStringLiteral("seed")))
        c.seed = root.value(QStringLiteral("seed")).toInt();
    if (root.contains(QStringLiteral("frequency_penalty")))
        c.frequencyPenalty = root.value(QStringLiteral("frequency_penalty")).toDouble();
    if (root.contains(QStringLiteral("presence_penalty")))
        c.presencePenalty = root.value(QStringLiteral("presence_penalty")).toDouble();
    if (root.contains(QStringLiteral("reasoning_effort")))
        c.reasoningEffort = root.value(QStringLiteral("reasoning_effort")).toString();
    if (root.contains(QStringLiteral("parallel_tool_calls")))
        c.parallelToolCalls = root.value(QStringLiteral("parallel_tool_calls")).toBool();

    const QJsonValue stop = root.value(QStringLiteral("stop"));
    if (stop.isString()) {
        c.stopSequences.append(stop.toString());
    } else {
        for (const QJsonValue& sv : stop.toArray())
            c.stopSequences.append(sv.toString());
    }

    for (const QJsonValue& tv : root.value(QStringLiteral("tools")).toArray()) {
        const QJsonObject fn = tv.toObject().value(QStringLiteral("function")).toObject();
        ActionSpec spec;
        spec.name = fn.value(QStringLiteral("name")).toString();
        spec.description = fn.value(QStringLiteral("description")).toString();
        spec.parameters = fn.value(QStringLiteral("parameters")).toObject();
        req.tools.append(spec);
    }

    const QJsonValue choice = root.value(QStringLiteral("tool_choice"));
    if (choice.isString()) {
        const QString mode = choice.toString();
        if (mode == QLatin1String("auto"))          req.toolChoice.mode = ToolChoice::Mode::Auto;
        else if (mode == QLatin1String("none"))     req.toolChoice.mode = ToolChoice::Mode::None;
        else if (mode == QLatin1String("required")) req.toolChoice.mode = ToolChoice::Mode::Required;
    } else if (choice.isObject()) {
        req.toolChoice.mode = ToolChoice::Mode::Named;
        req.toolChoice.name = choice.toObject().value(QStringLiteral("function"))
                                  .toObject().value(QStringLiteral("name")).toString();
    }

    req.stream = root.value(QStringLiteral("stream")).toBool();
    req.extensions.setPassthrough(kFormat, WireUtil::collectUnmapped(root, kRequestKeys));
    return req;
}

Result<QJsonObject> encodeRequest(const SemanticRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QJsonArray messages;
    for (const InteractionItem& item : request.messages) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = item.role;

        QString reasoning;
        Result<QJsonArray> parts = encodeParts(item.content, &reasoning);
        if (!parts) return std::unexpected(parts.error());

        if (parts->isEmpty()) {
            msg[QStringLiteral("content")] = item.toolCalls.isEmpty()
                ? QJsonValue(QString()) : QJsonValue(QJsonValue::Null);
        } else {
            msg[QStringLiteral("content")] = contentValue(*parts);
        }
        if (!reasoning.isEmpty())
            msg[QStringLiteral("reasoning_content")] = reasoning;
        if (!item.name.isEmpty())
            msg[QStringLiteral("name")] = item.name;
        if (!item.toolCalls.isEmpty()) {
            QJsonArray calls;
            for (const ActionCall& call : item.toolCalls)
                calls.append(toolCallObject(call));
            msg[QStringLiteral("tool_calls")] = calls;
        }
        if (item.role == QLatin1String("tool"))
            msg[QStringLiteral("tool_call_id")] = item.toolCallId;

        messages.append(msg);
    }
    body[QStringLiteral("messages")] = messages;

    const ConstraintSet& c = request.constraints;
    if (c.temperature.has_value())
        body[QStringLiteral("temperature")] = *c.temperature;
    if (c.topP.has_value())
        body[QStringLiteral("top_p")] = *c.topP;
    if (c.maxTokens.has_value())
        body[QStringLiteral("max_tokens")] = *c.maxTokens;
    if (c.seed.has_value())
        body[QStringLiteral("seed")] = *c.seed;
    if (c.frequencyPenalty.has_value())
        body[QStringLiteral("frequency_penalty")] = *c.frequencyPenalty;
    if (c.presencePenalty.has_value())
        body[QStringLiteral("presence_penalty")] = *c.presencePenalty;
    if (!c.stopSequences.isEmpty())
        body[QStringLiteral("stop")] = QJsonArray::fromStringList(c.stopSequences);
    if (c.parallelToolCalls.has_value())
        body[QStringLiteral("parallel_tool_calls")] = *c.parallelToolCalls;
    if (c.reasoningEffort.has_value())
        body[QStringLiteral("reasoning_effort")] = *c.reasoningEffort;
    else if (c.thinkingBudget.has_value() && *c.thinkingBudget > 0)
        body[QStringLiteral("reasoning_effort")] = WireUtil::effortForBudget(*c.thinkingBudget);

    if (!request.tools.isEmpty()) {
        QJsonArray tools;
        for (const ActionSpec& spec : request.tools) {
            QJsonObject fn;
            fn[QStringLiteral("name")] = spec.name;
            if (!spec.description.isEmpty())
                fn[QStringLiteral("description")] = spec.description;
            fn[QStringLiteral("parameters")] = spec.parameters;
            QJsonObject t;
            t[QStringLiteral("type")] = QStringLiteral("function");
            t[QStringLiteral("function")] = fn;
            tools.append(t);
        }
        body[QStringLiteral("tools")] = tools;
    }

    switch (request.toolChoice.mode) {
    case ToolChoice::Mode::Unset:
        break;
    case ToolChoice::Mode::Auto:
        body[QStringLiteral("tool_choice")] = QStringLiteral("auto");
        break;
    case ToolChoice::Mode::None:
        body[QStringLiteral("tool_choice")] = QStringLiteral("none");
        break;
    case ToolChoice::Mode::Required:
        body[QStringLiteral("tool_choice")] = QStringLiteral("required");
        break;
    case ToolChoice::Mode::Named: {
        QJsonObject fn;
        fn[QStringLiteral("name")] = request.toolChoice.name;
        QJsonObject choice;
        choice[QStringLiteral("type")] = QStringLiteral("function");
        choice[QStringLiteral("function")] = fn;
        body[QStringLiteral("tool_choice")] = choice;
        break;
    }
    }

    if (request.stream) {
        body[QStringLiteral("stream")] = true;
        body[QStringLiteral("stream_options")] = QJsonObject{{QStringLiteral("include_usage"), true}};
    }

    WireUtil::mergePassthrough(body, request.extensions, compatibleFormats());
    return body;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

Result<SemanticResponse> decodeResponse(const QJsonObject& root)
{
    if (root.contains(QStringLiteral("error")) && !root.contains(QStringLiteral("choices"))) {
        return std::unexpected(failureFromError(502, root.value(QStringLiteral("error")).toObject()));
    }

    SemanticResponse resp;
    resp.envelope = SemanticEnvelope::create();
    resp.responseId = root.value(QStringLiteral("id")).toString();
    resp.modelUsed = root.value(QStringLiteral("model")).toString();

    for (const QJsonValue& cv : root.value(QStringLiteral("choices")).toArray()) {
        const QJsonObject choice = cv.toObject();
        const QJsonObject message = choice.value(QStringLiteral("message")).toObject();

        Candidate cand;
        cand.index = choice.value(QStringLiteral("index")).toInt();
        const QString reasoning = message.value(QStringLiteral("reasoning_content")).toString();
        if (!reasoning.isEmpty())
            cand.output.append(Segment::fromReasoning(reasoning));
        cand.output.append(decodeContent(message.value(QStringLiteral("content"))));
        for (const QJsonValue& tv : message.value(QStringLiteral("tool_calls")).toArray())
            cand.toolCalls.append(decodeToolCall(tv.toObject()));
        cand.stopCause = stopCause(choice.value(QStringLiteral("finish_reason")).toString());
        resp.candidates.append(cand);
    }

    resp.usage = usageFrom(root.value(QStringLiteral("usage")).toObject());
    resp.extensions.setPassthrough(kFormat, WireUtil::collectUnmapped(root, kResponseKeys));
    return resp;
}

Result<QJsonObject> encodeResponse(const SemanticResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? WireUtil::newId(QStringLiteral("chatcmpl-")) : response.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion");
    root[QStringLiteral("created")] = QDateTime::currentSecsSinceEpoch();
    root[QStringLiteral("model")] = response.modelUsed;

    QJsonArray choices;
    for (const Candidate& cand : response.candidates) {
        QString text;
        QString reasoning;
        for (const Segment& seg : cand.output) {
            if (seg.kind == SegmentKind::Text) {
                text += seg.text;
            } else if (seg.kind == SegmentKind::Reasoning) {
                reasoning += seg.text;
            } else {
                return std::unexpected(DomainFailure::encodeFailed(
                    QStringLiteral("unrepresentable_content"),
                    QStringLiteral("Chat Completions responses carry only text, reasoning and tool calls")));
            }
        }

        QJsonObject message;
        message[QStringLiteral("role")] = QStringLiteral("assistant");
        message[QStringLiteral("content")] = (text.isEmpty() && !cand.toolCalls.isEmpty())
            ? QJsonValue(QJsonValue::Null) : QJsonValue(text);
        if (!reasoning.isEmpty())
            message[QStringLiteral("reasoning_content")] = reasoning;
        if (!cand.toolCalls.isEmpty()) {
            QJsonArray calls;
            for (const ActionCall& call : cand.toolCalls)
                calls.append(toolCallObject(call));
            message[QStringLiteral("tool_calls")] = calls;
        }

        QJsonObject choice;
        choice[QStringLiteral("index")] = cand.index;
        choice[QStringLiteral("message")] = message;
        choice[QStringLiteral("finish_reason")] = finishReason(cand.stopCause);
        choices.append(choice);
    }
    root[QStringLiteral("choices")] = choices;
    root[QStringLiteral("usage")] = usageObject(response.usage);

    WireUtil::mergePassthrough(root, response.extensions, compatibleFormats());
    return root;
}

// ---------------------------------------------------------------------------
// Shared pieces
// ---------------------------------------------------------------------------

QJsonObject toolCallObject(const ActionCall& call)
{
    QJsonObject fn;
    fn[QStringLiteral("name")] = call.name;
    fn[QStringLiteral("arguments")] = call.args;
    QJsonObject tc;
    tc[QStringLiteral("id")] = call.callId;
    tc[QStringLiteral("type")] = QStringLiteral("function");
    tc[QStringLiteral("function")] = fn;
    return tc;
}

QJsonObject usageObject(const UsageEntry& usage)
{
    QJsonObject u;
    u[QStringLiteral("prompt_tokens")] = usage.promptTokens;
    u[QStringLiteral("completion_tokens")] = usage.completionTokens;
    u[QStringLiteral("total_tokens")] = usage.totalTokens > 0
        ? usage.totalTokens : usage.promptTokens + usage.completionTokens;
    return u;
}

UsageEntry usageFrom(const QJsonObject& usage)
{
    UsageEntry u;
    u.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    u.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    u.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();
    if (u.totalTokens == 0)
        u.totalTokens = u.promptTokens + u.completionTokens;
    return u;
}

QString finishReason(StopCause cause)
{
    switch (cause) {
    case StopCause::Completed:     return QStringLiteral("stop");
    case StopCause::Length:        return QStringLiteral("length");
    case StopCause::ContentFilter: return QStringLiteral("content_filter");
    case StopCause::ToolCall:      return QStringLiteral("tool_calls");
    }
    return QStringLiteral("stop");
}

StopCause stopCause(const QString& finishReason)
{
    if (finishReason == QLatin1String("length"))          return StopCause::Length;
    if (finishReason == QLatin1String("tool_calls")
        || finishReason == QLatin1String("function_call")) return StopCause::ToolCall;
    if (finishReason == QLatin1String("content_filter"))  return StopCause::ContentFilter;
    return StopCause::Completed;
}

QJsonObject errorBody(const DomainFailure& failure)
{
    return failure.toJson();
}

DomainFailure failureFromError(int httpStatus, const QJsonObject& error)
{
    QString code = error.value(QStringLiteral("code")).toString();
    if (code.isEmpty())
        code = error.value(QStringLiteral("type")).toString();
    if (code.isEmpty())
        code = QStringLiteral("upstream_error");
    QString message = error.value(QStringLiteral("message")).toString();
    if (message.isEmpty())
        message = QStringLiteral("Upstream returned HTTP %1").arg(httpStatus);
    return DomainFailure::upstreamHttp(httpStatus, code, message);
}

ParameterBounds bounds()
{
    ParameterBounds b;
    b.temperature = ParameterBounds::Range{0.0, 2.0};
    b.topP = ParameterBounds::Range{0.0, 1.0};
    b.maxTokens = ParameterBounds::Range{1.0, 1e9};
    b.frequencyPenalty = ParameterBounds::Range{-2.0, 2.0};
    b.presencePenalty = ParameterBounds::Range{-2.0, 2.0};
    b.seed = true;
    b.stopSequences = true;
    return b;
}

}
