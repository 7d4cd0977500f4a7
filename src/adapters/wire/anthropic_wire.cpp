#include "anthropic_wire.h"

namespace AnthropicWire {

namespace {

const QStringList kRequestKeys = {
    QStringLiteral("model"), QStringLiteral("messages"), QStringLiteral("system"),
    QStringLiteral("max_tokens"), QStringLiteral("temperature"), QStringLiteral("top_p"),
    QStringLiteral("top_k"), QStringLiteral("stop_sequences"), QStringLiteral("stream"),
    QStringLiteral("tools"), QStringLiteral("tool_choice"), QStringLiteral("thinking")
};

const QStringList kResponseKeys = {
    QStringLiteral("id"), QStringLiteral("type"), QStringLiteral("role"),
    QStringLiteral("model"), QStringLiteral("content"), QStringLiteral("stop_reason"),
    QStringLiteral("stop_sequence"), QStringLiteral("usage")
};

bool isPlainText(const QJsonObject& block)
{
    return block.size() == 2
        && block.value(QStringLiteral("type")).toString() == QLatin1String("text")
        && block.contains(QStringLiteral("text"));
}

// A lone plain text block is written as a bare string.
QJsonValue contentValue(const QJsonArray& blocks)
{
    if (blocks.size() == 1 && isPlainText(blocks.first().toObject())) {
        return blocks.first().toObject().value(QStringLiteral("text"));
    }
    return blocks;
}

QJsonArray asBlocks(const QJsonValue& content)
{
    if (content.isString()) {
        QJsonObject block;
        block[QStringLiteral("type")] = QStringLiteral("text");
        block[QStringLiteral("text")] = content.toString();
        return QJsonArray{block};
    }
    return content.toArray();
}

Result<QJsonObject> toolUseBlock(const ActionCall& call)
{
    QJsonObject input;
    if (!call.args.trimmed().isEmpty()) {
        const QJsonDocument doc = QJsonDocument::fromJson(call.args.toUtf8());
        if (!doc.isObject()) {
            return std::unexpected(DomainFailure::encodeFailed(
                QStringLiteral("invalid_tool_arguments"),
                QStringLiteral("Arguments of tool call %1 are not a JSON object").arg(call.callId)));
        }
        input = doc.object();
    }

    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("tool_use");
    block[QStringLiteral("id")] = call.callId;
    block[QStringLiteral("name")] = call.name;
    block[QStringLiteral("input")] = input;
    return block;
}

ActionCall decodeToolUse(const QJsonObject& block)
{
    ActionCall call;
    call.callId = block.value(QStringLiteral("id")).toString();
    call.name = block.value(QStringLiteral("name")).toString();
    call.args = WireUtil::argsText(block.value(QStringLiteral("input")));
    return call;
}

InteractionItem decodeToolResult(const QJsonObject& block)
{
    InteractionItem item;
    item.role = QStringLiteral("tool");
    item.toolCallId = block.value(QStringLiteral("tool_use_id")).toString();
    item.isError = block.value(QStringLiteral("is_error")).toBool();
    const QJsonValue content = block.value(QStringLiteral("content"));
    if (content.isString()) {
        item.content.append(Segment::fromText(content.toString()));
    } else if (content.isArray()) {
        item.content = decodeBlocks(content.toArray());
    }
    return item;
}

Result<QJsonObject> toolResultBlock(const InteractionItem& item)
{
    Result<QJsonArray> blocks = encodeBlocks(item.content);
    if (!blocks) {
        return std::unexpected(blocks.error());
    }
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("tool_result");
    block[QStringLiteral("tool_use_id")] = item.toolCallId;
    block[QStringLiteral("content")] = contentValue(*blocks);
    if (item.isError) {
        block[QStringLiteral("is_error")] = true;
    }
    return block;
}

void decodeMessage(const QJsonObject& message, const QString& role,
                   QList<InteractionItem>& out)
{
    const QJsonValue content = message.value(QStringLiteral("content"));
    if (content.isString()) {
        InteractionItem item;
        item.role = role;
        item.content.append(Segment::fromText(content.toString()));
        out.append(item);
        return;
    }

    // tool_result blocks become tool items in place; the blocks around
    // them stay with the message's own role.
    InteractionItem pending;
    pending.role = role;
    bool hasPending = false;

    const QJsonArray blocks = content.toArray();
    for (const QJsonValue& bv : blocks) {
        const QJsonObject block = bv.toObject();
        const QString type = block.value(QStringLiteral("type")).toString();
        if (type == QLatin1String("tool_result")) {
            if (hasPending) {
                out.append(pending);
                pending = InteractionItem();
                pending.role = role;
                hasPending = false;
            }
            out.append(decodeToolResult(block));
        } else if (type == QLatin1String("tool_use")) {
            pending.toolCalls.append(decodeToolUse(block));
            hasPending = true;
        } else {
            pending.content.append(decodeBlock(block));
            hasPending = true;
        }
    }
    if (hasPending || blocks.isEmpty()) {
        out.append(pending);
    }
}

}

QStringList compatibleFormats()
{
    return {kFormat, QStringLiteral("openai.native")};
}

// ---------------------------------------------------------------------------
// Content blocks
// ---------------------------------------------------------------------------

Segment decodeBlock(const QJsonObject& block)
{
    const QString type = block.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("text")) {
        Segment seg = Segment::fromText(block.value(QStringLiteral("text")).toString());
        seg.extras = WireUtil::extrasOf(block, {QStringLiteral("type"), QStringLiteral("text")});
        return seg;
    }

    if (type == QLatin1String("image")) {
        const QJsonObject source = block.value(QStringLiteral("source")).toObject();
        MediaRef ref;
        ref.mimeType = source.value(QStringLiteral("media_type")).toString();
        if (source.value(QStringLiteral("type")).toString() == QLatin1String("base64")) {
            ref.inlineData = QByteArray::fromBase64(
                source.value(QStringLiteral("data")).toString().toLatin1());
        } else {
            ref.uri = source.value(QStringLiteral("url")).toString();
        }
        Segment seg = Segment::fromMedia(ref);
        seg.extras = WireUtil::extrasOf(block, {QStringLiteral("type"), QStringLiteral("source")});
        return seg;
    }

    if (type == QLatin1String("thinking")) {
        Segment seg = Segment::fromReasoning(block.value(QStringLiteral("thinking")).toString());
        if (block.contains(QStringLiteral("signature"))) {
            seg.structured[QStringLiteral("signature")] = block.value(QStringLiteral("signature"));
        }
        return seg;
    }

    // redacted_thinking, document, search results, server tool blocks...
    return Segment::fromStructured(block, kFormat);
}

QList<Segment> decodeBlocks(const QJsonArray& blocks)
{
    QList<Segment> segments;
    for (const QJsonValue& bv : blocks) {
        segments.append(decodeBlock(bv.toObject()));
    }
    return segments;
}

Result<QJsonArray> encodeBlocks(const QList<Segment>& segments)
{
    QJsonArray blocks;
    for (const Segment& seg : segments) {
        QJsonObject block;
        switch (seg.kind) {
        case SegmentKind::Text:
            block[QStringLiteral("type")] = QStringLiteral("text");
            block[QStringLiteral("text")] = seg.text;
            WireUtil::applyExtras(block, seg.extras);
            break;

        case SegmentKind::Media: {
            QJsonObject source;
            if (!seg.media.inlineData.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("base64");
                source[QStringLiteral("media_type")] = seg.media.mimeType;
                source[QStringLiteral("data")] = QString::fromLatin1(seg.media.inlineData.toBase64());
            } else {
                source[QStringLiteral("type")] = QStringLiteral("url");
                source[QStringLiteral("url")] = seg.media.uri;
            }
            block[QStringLiteral("type")] = QStringLiteral("image");
            block[QStringLiteral("source")] = source;
            WireUtil::applyExtras(block, WireUtil::extrasOf(seg.extras, {QStringLiteral("detail")}));
            break;
        }

        case SegmentKind::Reasoning:
            block[QStringLiteral("type")] = QStringLiteral("thinking");
            block[QStringLiteral("thinking")] = seg.text;
            if (seg.structured.contains(QStringLiteral("signature"))) {
                block[QStringLiteral("signature")] = seg.structured.value(QStringLiteral("signature"));
            }
            break;

        case SegmentKind::Structured: {
            VoidResult ok = WireUtil::checkStructuredOrigin(seg, compatibleFormats());
            if (!ok) {
                return std::unexpected(ok.error());
            }
            block = seg.structured;
            break;
        }
        }
        blocks.append(block);
    }
    return blocks;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Result<SemanticRequest> decodeRequest(const QJsonObject& root)
{
    SemanticRequest req;
    req.envelope = SemanticEnvelope::create();
    req.model = root.value(QStringLiteral("model")).toString();

    const QJsonValue sysVal = root.value(QStringLiteral("system"));
    if (sysVal.isString() || sysVal.isArray()) {
        InteractionItem sysItem;
        sysItem.role = QStringLiteral("system");
        if (sysVal.isString()) {
            sysItem.content.append(Segment::fromText(sysVal.toString()));
        } else {
            sysItem.content = decodeBlocks(sysVal.toArray());
        }
        req.messages.append(sysItem);
    }

    const QJsonValue msgsVal = root.value(QStringLiteral("messages"));
    if (!msgsVal.isArray()) {
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("invalid_messages"),
            QStringLiteral("'messages' must be an array")));
    }

    const QJsonArray msgs = msgsVal.toArray();
    for (const QJsonValue& mv : msgs) {
        const QJsonObject m = mv.toObject();
        const QString role = m.value(QStringLiteral("role")).toString();
        if (role != QLatin1String("user") && role != QLatin1String("assistant")) {
            return std::unexpected(DomainFailure::decodeFailed(
                QStringLiteral("invalid_role"),
                QStringLiteral("Message role '%1' is not valid here").arg(role)));
        }
        if (role == QLatin1String("assistant")
            && (req.messages.isEmpty() || req.messages.last().role == QLatin1String("system"))) {
            return std::unexpected(DomainFailure::decodeFailed(
                QStringLiteral("invalid_role_order"),
                QStringLiteral("The first message must come from the user")));
        }
        decodeMessage(m, role, req.messages);
    }

    ConstraintSet& c = req.constraints;
    if (root.contains(QStringLiteral("max_tokens")))
        c.maxTokens = root.value(QStringLiteral("max_tokens")).toInt();
    if (root.contains(QStringLiteral("temperature")))
        c.temperature = root.value(QStringLiteral("temperature")).toDouble();
    if (root.contains(QStringLiteral("top_p")))
        c.topP = root.value(QStringLiteral("top_p")).toDouble();
    if (root.contains(QStringLiteral("top_k")))
        c.topK = root.value(QStringLiteral("top_k")).toInt();
    for (const QJsonValue& sv : root.value(QStringLiteral("stop_sequences")).toArray())
        c.stopSequences.append(sv.toString());

    const QJsonObject thinking = root.value(QStringLiteral("thinking")).toObject();
    if (thinking.value(QStringLiteral("type")).toString() == QLatin1String("enabled"))
        c.thinkingBudget = thinking.value(QStringLiteral("budget_tokens")).toInt();

    for (const QJsonValue& tv : root.value(QStringLiteral("tools")).toArray()) {
        const QJsonObject t = tv.toObject();
        ActionSpec spec;
        spec.name = t.value(QStringLiteral("name")).toString();
        spec.description = t.value(QStringLiteral("description")).toString();
        spec.parameters = t.value(QStringLiteral("input_schema")).toObject();
        req.tools.append(spec);
    }

    const QJsonObject choice = root.value(QStringLiteral("tool_choice")).toObject();
    const QString choiceType = choice.value(QStringLiteral("type")).toString();
    if (choiceType == QLatin1String("auto")) {
        req.toolChoice.mode = ToolChoice::Mode::Auto;
    } else if (choiceType == QLatin1String("any")) {
        req.toolChoice.mode = ToolChoice::Mode::Required;
    } else if (choiceType == QLatin1String("none")) {
        req.toolChoice.mode = ToolChoice::Mode::None;
    } else if (choiceType == QLatin1String("tool")) {
        req.toolChoice.mode = ToolChoice::Mode::Named;
        req.toolChoice.name = choice.value(QStringLiteral("name")).toString();
    }
    if (choice.contains(QStringLiteral("disable_parallel_tool_use")))
        c.parallelToolCalls = !choice.value(QStringLiteral("disable_parallel_tool_use")).toBool();

    req.stream = root.value(QStringLiteral("stream")).toBool();
    req.extensions.setPassthrough(kFormat, WireUtil::collectUnmapped(root, kRequestKeys));
    return req;
}

Result<QJsonObject> encodeRequest(const SemanticRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QList<Segment> systemSegments;
    QJsonArray messages;
    QString lastRole;

    for (const InteractionItem& item : request.messages) {
        if (item.role == QLatin1String("system")) {
            systemSegments.append(item.content);
            continue;
        }

        const QString wireRole = item.role == QLatin1String("assistant")
            ? QStringLiteral("assistant") : QStringLiteral("user");
        if (messages.isEmpty() && wireRole == QLatin1String("assistant")) {
            return std::unexpected(DomainFailure::decodeFailed(
                QStringLiteral("invalid_role_order"),
                QStringLiteral("Anthropic conversations must start with a user turn")));
        }

        QJsonArray blocks;
        if (item.role == QLatin1String("tool")) {
            Result<QJsonObject> block = toolResultBlock(item);
            if (!block) return std::unexpected(block.error());
            blocks.append(*block);
        } else {
            Result<QJsonArray> content = encodeBlocks(item.content);
            if (!content) return std::unexpected(content.error());
            blocks = *content;
            for (const ActionCall& call : item.toolCalls) {
                Result<QJsonObject> block = toolUseBlock(call);
                if (!block) return std::unexpected(block.error());
                blocks.append(*block);
            }
        }

        // Consecutive turns with the same wire role are merged.
        if (!messages.isEmpty() && lastRole == wireRole) {
            QJsonObject prev = messages.last().toObject();
            QJsonArray merged = asBlocks(prev.value(QStringLiteral("content")));
            for (const QJsonValue& b : blocks)
                merged.append(b);
            prev[QStringLiteral("content")] = merged;
            messages[messages.size() - 1] = prev;
            continue;
        }

        QJsonObject msg;
        msg[QStringLiteral("role")] = wireRole;
        msg[QStringLiteral("content")] = item.role == QLatin1String("tool")
            ? QJsonValue(blocks) : contentValue(blocks);
        messages.append(msg);
        lastRole = wireRole;
    }

    if (!systemSegments.isEmpty()) {
        Result<QJsonArray> sysBlocks = encodeBlocks(systemSegments);
        if (!sysBlocks) return std::unexpected(sysBlocks.error());
        body[QStringLiteral("system")] = contentValue(*sysBlocks);
    }
    body[QStringLiteral("messages")] = messages;

    const ConstraintSet& c = request.constraints;
    body[QStringLiteral("max_tokens")] = c.maxTokens.value_or(4096);
    if (c.temperature.has_value())
        body[QStringLiteral("temperature")] = *c.temperature;
    if (c.topP.has_value())
        body[QStringLiteral("top_p")] = *c.topP;
    if (c.topK.has_value())
        body[QStringLiteral("top_k")] = *c.topK;
    if (!c.stopSequences.isEmpty())
        body[QStringLiteral("stop_sequences")] = QJsonArray::fromStringList(c.stopSequences);

    int budget = c.thinkingBudget.value_or(0);
    if (!c.thinkingBudget.has_value() && c.reasoningEffort.has_value())
        budget = WireUtil::budgetForEffort(*c.reasoningEffort);
    if (budget > 0) {
        QJsonObject thinking;
        thinking[QStringLiteral("type")] = QStringLiteral("enabled");
        thinking[QStringLiteral("budget_tokens")] = budget;
        body[QStringLiteral("thinking")] = thinking;
    }

    if (!request.tools.isEmpty()) {
        QJsonArray tools;
        for (const ActionSpec& spec : request.tools) {
            QJsonObject t;
            t[QStringLiteral("name")] = spec.name;
            if (!spec.description.isEmpty())
                t[QStringLiteral("description")] = spec.description;
            t[QStringLiteral("input_schema")] = spec.parameters.isEmpty()
                ? QJsonObject{{QStringLiteral("type"), QStringLiteral("object")}}
                : spec.parameters;
            tools.append(t);
        }
        body[QStringLiteral("tools")] = tools;
    }

    QJsonObject choice;
    switch (request.toolChoice.mode) {
    case ToolChoice::Mode::Unset:    break;
    case ToolChoice::Mode::Auto:     choice[QStringLiteral("type")] = QStringLiteral("auto"); break;
    case ToolChoice::Mode::Required: choice[QStringLiteral("type")] = QStringLiteral("any"); break;
    case ToolChoice::Mode::None:     choice[QStringLiteral("type")] = QStringLiteral("none"); break;
    case ToolChoice::Mode::Named:
        choice[QStringLiteral("type")] = QStringLiteral("tool");
        choice[QStringLiteral("name")] = request.toolChoice.name;
        break;
    }
    if (c.parallelToolCalls.has_value() && !choice.isEmpty())
        choice[QStringLiteral("disable_parallel_tool_use")] = !*c.parallelToolCalls;
    if (!choice.isEmpty())
        body[QStringLiteral("tool_choice")] = choice;

    if (request.stream)
        body[QStringLiteral("stream")] = true;

    WireUtil::mergePassthrough(body, request.extensions, compatibleFormats());
    return body;
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

Result<SemanticResponse> decodeResponse(const QJsonObject& root)
{
    if (root.value(QStringLiteral("type")).toString() == QLatin1String("error")) {
        return std::unexpected(failureFromError(502, root.value(QStringLiteral("error")).toObject()));
    }

    SemanticResponse resp;
    resp.envelope = SemanticEnvelope::create();
    resp.responseId = root.value(QStringLiteral("id")).toString();
    resp.modelUsed = root.value(QStringLiteral("model")).toString();

    Candidate cand;
    for (const QJsonValue& bv : root.value(QStringLiteral("content")).toArray()) {
        const QJsonObject block = bv.toObject();
        if (block.value(QStringLiteral("type")).toString() == QLatin1String("tool_use")) {
            cand.toolCalls.append(decodeToolUse(block));
        } else {
            cand.output.append(decodeBlock(block));
        }
    }
    cand.stopCause = stopCause(root.value(QStringLiteral("stop_reason")).toString());
    resp.candidates.append(cand);

    const QJsonObject usage = root.value(QStringLiteral("usage")).toObject();
    resp.usage.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
    resp.usage.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
    resp.usage.totalTokens = resp.usage.promptTokens + resp.usage.completionTokens;

    resp.extensions.setPassthrough(kFormat, WireUtil::collectUnmapped(root, kResponseKeys));
    return resp;
}

Result<QJsonObject> encodeResponse(const SemanticResponse& response)
{
    if (response.candidates.size() > 1) {
        return std::unexpected(DomainFailure::encodeFailed(
            QStringLiteral("multiple_candidates"),
            QStringLiteral("The Anthropic format carries a single candidate, got %1")
                .arg(response.candidates.size())));
    }

    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? WireUtil::newId(QStringLiteral("msg_")) : response.responseId;
    root[QStringLiteral("type")] = QStringLiteral("message");
    root[QStringLiteral("role")] = QStringLiteral("assistant");
    root[QStringLiteral("model")] = response.modelUsed;

    QJsonArray content;
    StopCause cause = StopCause::Completed;
    if (!response.candidates.isEmpty()) {
        const Candidate& cand = response.candidates.first();
        Result<QJsonArray> blocks = encodeBlocks(cand.output);
        if (!blocks) return std::unexpected(blocks.error());
        content = *blocks;
        for (const ActionCall& call : cand.toolCalls) {
            Result<QJsonObject> block = toolUseBlock(call);
            if (!block) return std::unexpected(block.error());
            content.append(*block);
        }
        cause = cand.stopCause;
    }
    root[QStringLiteral("content")] = content;
    root[QStringLiteral("stop_reason")] = stopReason(cause);
    root[QStringLiteral("stop_sequence")] = QJsonValue::Null;

    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = response.usage.promptTokens;
    usage[QStringLiteral("output_tokens")] = response.usage.completionTokens;
    root[QStringLiteral("usage")] = usage;

    WireUtil::mergePassthrough(root, response.extensions, compatibleFormats());
    return root;
}

// ---------------------------------------------------------------------------
// Tables
// ---------------------------------------------------------------------------

QString stopReason(StopCause cause)
{
    switch (cause) {
    case StopCause::Completed:     return QStringLiteral("end_turn");
    case StopCause::Length:        return QStringLiteral("max_tokens");
    case StopCause::ContentFilter: return QStringLiteral("refusal");
    case StopCause::ToolCall:      return QStringLiteral("tool_use");
    }
    return QStringLiteral("end_turn");
}

StopCause stopCause(const QString& reason)
{
    if (reason == QLatin1String("max_tokens"))  return StopCause::Length;
    if (reason == QLatin1String("tool_use"))    return StopCause::ToolCall;
    if (reason == QLatin1String("refusal"))     return StopCause::ContentFilter;
    return StopCause::Completed;
}

QJsonObject errorBody(const DomainFailure& failure)
{
    QJsonObject root;
    root[QStringLiteral("type")] = QStringLiteral("error");
    root[QStringLiteral("error")] = failure.errorObject();
    return root;
}

DomainFailure failureFromError(int httpStatus, const QJsonObject& error)
{
    QString type = error.value(QStringLiteral("type")).toString();
    if (type.isEmpty())
        type = QStringLiteral("upstream_error");
    QString message = error.value(QStringLiteral("message")).toString();
    if (message.isEmpty())
        message = QStringLiteral("Upstream returned HTTP %1").arg(httpStatus);

    // Errors delivered inside a 200 stream carry their status in the type.
    int status = httpStatus;
    if (status < 400) {
        if (type == QLatin1String("overloaded_error"))       status = 529;
        else if (type == QLatin1String("rate_limit_error"))  status = 429;
        else if (type == QLatin1String("api_error"))         status = 500;
        else                                                 status = 502;
    }
    return DomainFailure::upstreamHttp(status, type, message);
}

ParameterBounds bounds()
{
    ParameterBounds b;
    b.temperature = ParameterBounds::Range{0.0, 1.0};
    b.topP = ParameterBounds::Range{0.0, 1.0};
    b.topK = ParameterBounds::Range{0.0, 1e9};
    b.maxTokens = ParameterBounds::Range{1.0, 1e9};
    b.stopSequences = true;
    return b;
}

}
