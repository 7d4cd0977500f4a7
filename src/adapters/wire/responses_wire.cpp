#include "responses_wire.h"
#include <QDateTime>

namespace ResponsesWire {

namespace {

const QStringList kRequestKeys = {
    QStringLiteral("model"), QStringLiteral("input"), QStringLiteral("instructions"),
    QStringLiteral("max_output_tokens"), QStringLiteral("temperature"), QStringLiteral("top_p"),
    QStringLiteral("tools"), QStringLiteral("tool_choice"), QStringLiteral("parallel_tool_calls"),
    QStringLiteral("stream"), QStringLiteral("reasoning")
};

const QStringList kResponseKeys = {
    QStringLiteral("id"), QStringLiteral("object"), QStringLiteral("created_at"),
    QStringLiteral("model"), QStringLiteral("status"), QStringLiteral("output"),
    QStringLiteral("usage"), QStringLiteral("incomplete_details"), QStringLiteral("error")
};

// Content part types that live inside a message item rather than being an
// item of their own.
const QStringList kPartTypes = {
    QStringLiteral("refusal"), QStringLiteral("input_file"),
    QStringLiteral("input_audio"), QStringLiteral("output_audio")
};

const QString kBuiltinTools = QStringLiteral("responses.builtin_tools");
const QString kReasoningSummary = QStringLiteral("responses.reasoning_summary");

bool isPart(const Segment& seg)
{
    return seg.kind == SegmentKind::Structured
        && kPartTypes.contains(seg.structured.value(QStringLiteral("type")).toString());
}

Segment decodePart(const QJsonObject& part, const QString& formatTag)
{
    const QString type = part.value(QStringLiteral("type")).toString();
    if (type == QLatin1String("input_text") || type == QLatin1String("output_text")
        || type == QLatin1String("text")) {
        Segment seg = Segment::fromText(part.value(QStringLiteral("text")).toString());
        seg.extras = WireUtil::extrasOf(part, {QStringLiteral("type"), QStringLiteral("text"),
                                               QStringLiteral("annotations"), QStringLiteral("logprobs")});
        return seg;
    }
    if (type == QLatin1String("input_image")) {
        Segment seg = Segment::fromMedia(
            WireUtil::mediaFromUrl(part.value(QStringLiteral("image_url")).toString()));
        seg.extras = WireUtil::extrasOf(part, {QStringLiteral("type"), QStringLiteral("image_url")});
        return seg;
    }
    return Segment::fromStructured(part, formatTag);
}

QList<Segment> decodeParts(const QJsonValue& content, const QString& formatTag)
{
    QList<Segment> segments;
    if (content.isString()) {
        segments.append(Segment::fromText(content.toString()));
    } else {
        for (const QJsonValue& pv : content.toArray())
            segments.append(decodePart(pv.toObject(), formatTag));
    }
    return segments;
}

QList<Segment> decodeReasoning(const QJsonObject& item)
{
    QJsonObject opaque;
    if (item.contains(QStringLiteral("encrypted_content")))
        opaque[QStringLiteral("encrypted_content")] = item.value(QStringLiteral("encrypted_content"));

    QList<Segment> segments;
    for (const QJsonValue& sv : item.value(QStringLiteral("summary")).toArray())
        segments.append(Segment::fromReasoning(sv.toObject().value(QStringLiteral("text")).toString()));
    if (segments.isEmpty())
        segments.append(Segment::fromReasoning(QString()));
    segments.first().structured = opaque;
    return segments;
}

ActionCall decodeFunctionCall(const QJsonObject& item)
{
    ActionCall call;
    call.callId = item.value(QStringLiteral("call_id")).toString();
    call.name = item.value(QStringLiteral("name")).toString();
    call.args = WireUtil::argsText(item.value(QStringLiteral("arguments")));
    return call;
}

InteractionItem& assistantTail(QList<InteractionItem>& items)
{
    if (items.isEmpty() || items.last().role != QLatin1String("assistant")) {
        InteractionItem item;
        item.role = QStringLiteral("assistant");
        items.append(item);
    }
    return items.last();
}

Result<QJsonObject> encodeUserPart(const Segment& seg)
{
    QJsonObject part;
    switch (seg.kind) {
    case SegmentKind::Text:
        part[QStringLiteral("type")] = QStringLiteral("input_text");
        part[QStringLiteral("text")] = seg.text;
        WireUtil::applyExtras(part, WireUtil::extrasOf(seg.extras, {QStringLiteral("cache_control")}));
        return part;
    case SegmentKind::Media:
        part[QStringLiteral("type")] = QStringLiteral("input_image");
        part[QStringLiteral("image_url")] = WireUtil::mediaUrl(seg.media);
        if (seg.extras.contains(QStringLiteral("detail")))
            part[QStringLiteral("detail")] = seg.extras.value(QStringLiteral("detail"));
        return part;
    case SegmentKind::Reasoning:
        part[QStringLiteral("type")] = QStringLiteral("input_text");
        part[QStringLiteral("text")] = seg.text;
        return part;
    case SegmentKind::Structured: {
        VoidResult ok = WireUtil::checkStructuredOrigin(seg, compatibleFormats());
        if (!ok) return std::unexpected(ok.error());
        return seg.structured;
    }
    }
    return part;
}

}

QStringList compatibleFormats()
{
    return {kFormat, kCodexFormat};
}

// ---------------------------------------------------------------------------
// Items
// ---------------------------------------------------------------------------

QJsonObject functionCallItem(const ActionCall& call, bool withIds)
{
    QJsonObject item;
    if (withIds)
        item[QStringLiteral("id")] = WireUtil::newId(QStringLiteral("fc_"));
    item[QStringLiteral("type")] = QStringLiteral("function_call");
    item[QStringLiteral("call_id")] = call.callId;
    item[QStringLiteral("name")] = call.name;
    item[QStringLiteral("arguments")] = call.args;
    if (withIds)
        item[QStringLiteral("status")] = QStringLiteral("completed");
    return item;
}

QJsonObject messageItem(const QString& itemId, const QString& text, bool completed)
{
    QJsonObject part;
    part[QStringLiteral("type")] = QStringLiteral("output_text");
    part[QStringLiteral("text")] = text;
    part[QStringLiteral("annotations")] = QJsonArray();

    QJsonObject item;
    if (!itemId.isEmpty())
        item[QStringLiteral("id")] = itemId;
    item[QStringLiteral("type")] = QStringLiteral("message");
    item[QStringLiteral("role")] = QStringLiteral("assistant");
    if (!itemId.isEmpty())
        item[QStringLiteral("status")] = completed ? QStringLiteral("completed")
                                                   : QStringLiteral("in_progress");
    item[QStringLiteral("content")] = completed ? QJsonArray{part} : QJsonArray();
    return item;
}

QJsonObject reasoningItem(const QString& itemId, const QString& summary)
{
    QJsonArray parts;
    if (!summary.isEmpty()) {
        QJsonObject part;
        part[QStringLiteral("type")] = QStringLiteral("summary_text");
        part[QStringLiteral("text")] = summary;
        parts.append(part);
    }
    QJsonObject item;
    if (!itemId.isEmpty())
        item[QStringLiteral("id")] = itemId;
    item[QStringLiteral("type")] = QStringLiteral("reasoning");
    item[QStringLiteral("summary")] = parts;
    return item;
}

Result<QJsonArray> encodeAssistantItems(const QList<Segment>& segments,
                                        const QList<ActionCall>& calls,
                                        bool withIds)
{
    QJsonArray items;
    QJsonArray parts;

    auto flushMessage = [&]() {
        if (parts.isEmpty()) return;
        QJsonObject item;
        if (withIds) {
            item[QStringLiteral("id")] = WireUtil::newId(QStringLiteral("msg_"));
            item[QStringLiteral("status")] = QStringLiteral("completed");
        }
        item[QStringLiteral("type")] = QStringLiteral("message");
        item[QStringLiteral("role")] = QStringLiteral("assistant");
        item[QStringLiteral("content")] = parts;
        items.append(item);
        parts = QJsonArray();
    };

    for (const Segment& seg : segments) {
        switch (seg.kind) {
        case SegmentKind::Text: {
            QJsonObject part;
            part[QStringLiteral("type")] = QStringLiteral("output_text");
            part[QStringLiteral("text")] = seg.text;
            part[QStringLiteral("annotations")] = QJsonArray();
            parts.append(part);
            break;
        }
        case SegmentKind::Media:
            return std::unexpected(DomainFailure::encodeFailed(
                QStringLiteral("unrepresentable_content"),
                QStringLiteral("Assistant output cannot carry media in the Responses format")));
        case SegmentKind::Reasoning: {
            flushMessage();
            QJsonObject item = reasoningItem(
                withIds ? WireUtil::newId(QStringLiteral("rs_")) : QString(), seg.text);
            if (seg.structured.contains(QStringLiteral("encrypted_content")))
                item[QStringLiteral("encrypted_content")] = seg.structured.value(QStringLiteral("encrypted_content"));
            items.append(item);
            break;
        }
        case SegmentKind::Structured: {
            VoidResult ok = WireUtil::checkStructuredOrigin(seg, compatibleFormats());
            if (!ok) return std::unexpected(ok.error());
            if (isPart(seg)) {
                parts.append(seg.structured);
            } else {
                flushMessage();
                items.append(seg.structured);
            }
            break;
        }
        }
    }
    flushMessage();

    for (const ActionCall& call : calls)
        items.append(functionCallItem(call, withIds));
    return items;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Result<SemanticRequest> decodeRequest(const QJsonObject& root, const QString& formatTag)
{
    SemanticRequest req;
    req.envelope = SemanticEnvelope::create();
    req.model = root.value(QStringLiteral("model")).toString();

    const QString instructions = root.value(QStringLiteral("instructions")).toString();
    if (!instructions.isEmpty()) {
        InteractionItem sysItem;
        sysItem.role = QStringLiteral("system");
        sysItem.content.append(Segment::fromText(instructions));
        req.messages.append(sysItem);
    }

    const QJsonValue input = root.value(QStringLiteral("input"));
    if (input.isString()) {
        InteractionItem item;
        item.role = QStringLiteral("user");
        item.content.append(Segment::fromText(input.toString()));
        req.messages.append(item);
    } else if (input.isArray()) {
        for (const QJsonValue& iv : input.toArray()) {
            const QJsonObject obj = iv.toObject();
            QString type = obj.value(QStringLiteral("type")).toString();
            if (type.isEmpty() && obj.contains(QStringLiteral("role")))
                type = QStringLiteral("message");

            if (type == QLatin1String("message")) {
                QString role = obj.value(QStringLiteral("role")).toString();
                if (role == QLatin1String("developer"))
                    role = QStringLiteral("system");
                const QList<Segment> content =
                    decodeParts(obj.value(QStringLiteral("content")), formatTag);
                if (role == QLatin1String("assistant")) {
                    assistantTail(req.messages).content.append(content);
                } else {
                    InteractionItem item;
                    item.role = role;
                    item.content = content;
                    req.messages.append(item);
                }
            } else if (type == QLatin1String("function_call")) {
                assistantTail(req.messages).toolCalls.append(decodeFunctionCall(obj));
            } else if (type == QLatin1String("function_call_output")) {
                InteractionItem item;
                item.role = QStringLiteral("tool");
                item.toolCallId = obj.value(QStringLiteral("call_id")).toString();
                item.content = decodeParts(obj.value(QStringLiteral("output")), formatTag);
                req.messages.append(item);
            } else if (type == QLatin1String("reasoning")) {
                assistantTail(req.messages).content.append(decodeReasoning(obj));
            } else {
                // Server-side tool calls, item references, ...
                assistantTail(req.messages).content.append(Segment::fromStructured(obj, formatTag));
            }
        }
    } else {
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("invalid_input"),
            QStringLiteral("'input' must be a string or an array")));
    }

    ConstraintSet& c = req.constraints;
    if (root.contains(QStringLiteral("max_output_tokens")))
        c.maxTokens = root.value(QStringLiteral("max_output_tokens")).toInt();
    if (root.contains(QStringLiteral("temperature")))
        c.temperature = root.value(QStringLiteral("temperature")).toDouble();
    if (root.contains(QStringLiteral("top_p")))
        c.topP = root.value(QStringLiteral("top_p")).toDouble();
    if (root.contains(QStringLiteral("parallel_tool_calls")))
        c.parallelToolCalls = root.value(QStringLiteral("parallel_tool_calls")).toBool();

    const QJsonObject reasoning = root.value(QStringLiteral("reasoning")).toObject();
    if (reasoning.contains(QStringLiteral("effort")))
        c.reasoningEffort = reasoning.value(QStringLiteral("effort")).toString();
    if (reasoning.contains(QStringLiteral("summary")))
        req.extensions.set(kReasoningSummary, reasoning.value(QStringLiteral("summary")));

    QJsonArray builtinTools;
    for (const QJsonValue& tv : root.value(QStringLiteral("tools")).toArray()) {
        const QJsonObject t = tv.toObject();
        if (t.value(QStringLiteral("type")).toString() != QLatin1String("function")) {
            builtinTools.append(t);
            continue;
        }
        ActionSpec spec;
        spec.name = t.value(QStringLiteral("name")).toString();
        spec.description = t.value(QStringLiteral("description")).toString();
        spec.parameters = t.value(QStringLiteral("parameters")).toObject();
        req.tools.append(spec);
    }
    if (!builtinTools.isEmpty())
        req.extensions.set(kBuiltinTools, builtinTools);

    const QJsonValue choice = root.value(QStringLiteral("tool_choice"));
    if (choice.isString()) {
        const QString mode = choice.toString();
        if (mode == QLatin1String("auto"))          req.toolChoice.mode = ToolChoice::Mode::Auto;
        else if (mode == QLatin1String("none"))     req.toolChoice.mode = ToolChoice::Mode::None;
        else if (mode == QLatin1String("required")) req.toolChoice.mode = ToolChoice::Mode::Required;
    } else if (choice.isObject()) {
        req.toolChoice.mode = ToolChoice::Mode::Named;
        req.toolChoice.name = choice.toObject().value(QStringLiteral("name")).toString();
    }

    req.stream = root.value(QStringLiteral("stream")).toBool();
    req.extensions.setPassthrough(formatTag, WireUtil::collectUnmapped(root, kRequestKeys));
    return req;
}

Result<QJsonObject> encodeRequest(const SemanticRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QStringList instructions;
    QJsonArray input;
    for (const InteractionItem& item : request.messages) {
        if (item.role == QLatin1String("system")) {
            for (const Segment& seg : item.content) {
                if (seg.kind == SegmentKind::Text)
                    instructions.append(seg.text);
            }
            continue;
        }

        if (item.role == QLatin1String("assistant")) {
            Result<QJsonArray> items = encodeAssistantItems(item.content, item.toolCalls, false);
            if (!items) return std::unexpected(items.error());
            for (const QJsonValue& v : *items)
                input.append(v);
            continue;
        }

        QJsonArray parts;
        for (const Segment& seg : item.content) {
            Result<QJsonObject> part = encodeUserPart(seg);
            if (!part) return std::unexpected(part.error());
            parts.append(*part);
        }

        QJsonObject obj;
        if (item.role == QLatin1String("tool")) {
            obj[QStringLiteral("type")] = QStringLiteral("function_call_output");
            obj[QStringLiteral("call_id")] = item.toolCallId;
            const bool plain = parts.size() == 1
                && parts.first().toObject().size() == 2
                && parts.first().toObject().value(QStringLiteral("type")).toString() == QLatin1String("input_text");
            if (plain)
                obj[QStringLiteral("output")] = parts.first().toObject().value(QStringLiteral("text"));
            else if (parts.isEmpty())
                obj[QStringLiteral("output")] = QString();
            else
                obj[QStringLiteral("output")] = parts;
        } else {
            obj[QStringLiteral("type")] = QStringLiteral("message");
            obj[QStringLiteral("role")] = item.role;
            obj[QStringLiteral("content")] = parts;
        }
        input.append(obj);
    }

    if (!instructions.isEmpty())
        body[QStringLiteral("instructions")] = instructions.join(QStringLiteral("\n\n"));
    body[QStringLiteral("input")] = input;

    const ConstraintSet& c = request.constraints;
    if (c.maxTokens.has_value())
        body[QStringLiteral("max_output_tokens")] = *c.maxTokens;
    if (c.temperature.has_value())
        body[QStringLiteral("temperature")] = *c.temperature;
    if (c.topP.has_value())
        body[QStringLiteral("top_p")] = *c.topP;
    if (c.parallelToolCalls.has_value())
        body[QStringLiteral("parallel_tool_calls")] = *c.parallelToolCalls;

    QJsonObject reasoning;
    if (c.reasoningEffort.has_value())
        reasoning[QStringLiteral("effort")] = *c.reasoningEffort;
    else if (c.thinkingBudget.has_value() && *c.thinkingBudget > 0)
        reasoning[QStringLiteral("effort")] = WireUtil::effortForBudget(*c.thinkingBudget);
    if (request.extensions.has(kReasoningSummary))
        reasoning[QStringLiteral("summary")] = request.extensions.get(kReasoningSummary);
    if (!reasoning.isEmpty())
        body[QStringLiteral("reasoning")] = reasoning;

    QJsonArray tools;
    for (const ActionSpec& spec : request.tools) {
        QJsonObject t;
        t[QStringLiteral("type")] = QStringLiteral("function");
        t[QStringLiteral("name")] = spec.name;
        if (!spec.description.isEmpty())
            t[QStringLiteral("description")] = spec.description;
        t[QStringLiteral("parameters")] = spec.parameters;
        tools.append(t);
    }
    for (const QJsonValue& t : request.extensions.get(kBuiltinTools).toArray())
        tools.append(t);
    if (!tools.isEmpty())
        body[QStringLiteral("tools")] = tools;

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
        QJsonObject choice;
        choice[QStringLiteral("type")] = QStringLiteral("function");
        choice[QStringLiteral("name")] = request.toolChoice.name;
        body[QStringLiteral("tool_choice")] = choice;
        break;
    }
    }

    if (request.stream)
        body[QStringLiteral("stream")] = true;

    WireUtil::mergePassthrough(body, request.extensions, compatibleFormats());
    return body;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

Result<SemanticResponse> decodeResponse(const QJsonObject& root, const QString& formatTag)
{
    const QString st = root.value(QStringLiteral("status")).toString();
    if (st == QLatin1String("failed")) {
        return std::unexpected(failureFromError(502, root.value(QStringLiteral("error")).toObject()));
    }

    SemanticResponse resp;
    resp.envelope = SemanticEnvelope::create();
    resp.responseId = root.value(QStringLiteral("id")).toString();
    resp.modelUsed = root.value(QStringLiteral("model")).toString();

    Candidate cand;
    for (const QJsonValue& iv : root.value(QStringLiteral("output")).toArray()) {
        const QJsonObject item = iv.toObject();
        const QString type = item.value(QStringLiteral("type")).toString();
        if (type == QLatin1String("message")) {
            cand.output.append(decodeParts(item.value(QStringLiteral("content")), formatTag));
        } else if (type == QLatin1String("reasoning")) {
            cand.output.append(decodeReasoning(item));
        } else if (type == QLatin1String("function_call")) {
            cand.toolCalls.append(decodeFunctionCall(item));
        } else {
            cand.output.append(Segment::fromStructured(item, formatTag));
        }
    }
    cand.stopCause = stopCause(st,
        root.value(QStringLiteral("incomplete_details")).toObject()
            .value(QStringLiteral("reason")).toString(),
        !cand.toolCalls.isEmpty());
    resp.candidates.append(cand);

    resp.usage = usageFrom(root.value(QStringLiteral("usage")).toObject());
    resp.extensions.setPassthrough(formatTag, WireUtil::collectUnmapped(root, kResponseKeys));
    return resp;
}

Result<QJsonObject> encodeResponse(const SemanticResponse& response)
{
    if (response.candidates.size() > 1) {
        return std::unexpected(DomainFailure::encodeFailed(
            QStringLiteral("multiple_candidates"),
            QStringLiteral("The Responses format carries a single candidate, got %1")
                .arg(response.candidates.size())));
    }

    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? WireUtil::newId(QStringLiteral("resp_")) : response.responseId;
    root[QStringLiteral("object")] = QStringLiteral("response");
    root[QStringLiteral("created_at")] = QDateTime::currentSecsSinceEpoch();
    root[QStringLiteral("model")] = response.modelUsed;

    QJsonArray output;
    StopCause cause = StopCause::Completed;
    if (!response.candidates.isEmpty()) {
        const Candidate& cand = response.candidates.first();
        Result<QJsonArray> items = encodeAssistantItems(cand.output, cand.toolCalls, true);
        if (!items) return std::unexpected(items.error());
        output = *items;
        cause = cand.stopCause;
    }

    root[QStringLiteral("status")] = status(cause);
    const QString reason = incompleteReason(cause);
    root[QStringLiteral("incomplete_details")] = reason.isEmpty()
        ? QJsonValue(QJsonValue::Null)
        : QJsonValue(QJsonObject{{QStringLiteral("reason"), reason}});
    root[QStringLiteral("error")] = QJsonValue::Null;
    root[QStringLiteral("output")] = output;
    root[QStringLiteral("usage")] = usageObject(response.usage);

    WireUtil::mergePassthrough(root, response.extensions, compatibleFormats());
    return root;
}

// ---------------------------------------------------------------------------
// Tables
// ---------------------------------------------------------------------------

QString status(StopCause cause)
{
    switch (cause) {
    case StopCause::Length:
    case StopCause::ContentFilter:
        return QStringLiteral("incomplete");
    case StopCause::Completed:
    case StopCause::ToolCall:
        return QStringLiteral("completed");
    }
    return QStringLiteral("completed");
}

QString incompleteReason(StopCause cause)
{
    switch (cause) {
    case StopCause::Length:        return QStringLiteral("max_output_tokens");
    case StopCause::ContentFilter: return QStringLiteral("content_filter");
    default:                       return QString();
    }
}

StopCause stopCause(const QString& status, const QString& incompleteReason, bool sawToolCall)
{
    if (status == QLatin1String("incomplete")) {
        if (incompleteReason == QLatin1String("content_filter"))
            return StopCause::ContentFilter;
        return StopCause::Length;
    }
    return sawToolCall ? StopCause::ToolCall : StopCause::Completed;
}

QJsonObject usageObject(const UsageEntry& usage)
{
    QJsonObject u;
    u[QStringLiteral("input_tokens")] = usage.promptTokens;
    u[QStringLiteral("output_tokens")] = usage.completionTokens;
    u[QStringLiteral("total_tokens")] = usage.totalTokens > 0
        ? usage.totalTokens : usage.promptTokens + usage.completionTokens;
    return u;
}

UsageEntry usageFrom(const QJsonObject& usage)
{
    UsageEntry u;
    u.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
    u.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
    u.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();
    if (u.totalTokens == 0)
        u.totalTokens = u.promptTokens + u.completionTokens;
    return u;
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
    b.maxTokens = ParameterBounds::Range{16.0, 1e9};
    return b;
}

}
