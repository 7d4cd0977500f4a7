#include "validate.h"
#include <QSet>

namespace {

template<typename T>
VoidResult checkRange(const char* name,
                      const std::optional<T>& value,
                      const std::optional<ParameterBounds::Range>& range)
{
    if (!value.has_value())
        return {};
    if (!range.has_value())
        return std::unexpected(DomainFailure::encodeFailed(
            QStringLiteral("unsupported_parameter"),
            QStringLiteral("Parameter %1 is not supported by the target upstream")
                .arg(QLatin1String(name))));

    const double v = static_cast<double>(*value);
    if (v < range->min || v > range->max)
        return std::unexpected(DomainFailure::invalidParameter(
            QStringLiteral("parameter_out_of_range"),
            QStringLiteral("Parameter %1=%2 is outside the allowed range [%3, %4]")
                .arg(QLatin1String(name))
                .arg(v)
                .arg(range->min)
                .arg(range->max)));
    return {};
}

}

namespace Validate {

bool isKnownRole(const QString& role) {
    return role == QLatin1String("system") || role == QLatin1String("user")
        || role == QLatin1String("assistant") || role == QLatin1String("tool");
}

VoidResult request(const SemanticRequest& req) {
    if (req.messages.isEmpty())
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("empty_messages"), QStringLiteral("Request carries no messages")));
    if (req.model.isEmpty())
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("empty_model"), QStringLiteral("Request does not name a model")));

    // Responses conversations continued server-side reference calls that
    // are not repeated in the request.
    const bool continued =
        req.extensions.passthrough().contains(QStringLiteral("previous_response_id"));

    QSet<QString> seenCallIds;
    for (const InteractionItem& item : req.messages) {
        if (!isKnownRole(item.role))
            return std::unexpected(DomainFailure::decodeFailed(
                QStringLiteral("invalid_role"), QStringLiteral("Unknown message role '%1'").arg(item.role)));
        for (const ActionCall& call : item.toolCalls)
            seenCallIds.insert(call.callId);
        if (item.role == QLatin1String("tool")) {
            if (item.toolCallId.isEmpty())
                return std::unexpected(DomainFailure::decodeFailed(
                    QStringLiteral("missing_tool_call_id"),
                    QStringLiteral("Tool result does not reference a tool call")));
            if (!continued && !seenCallIds.contains(item.toolCallId))
                return std::unexpected(DomainFailure::decodeFailed(
                    QStringLiteral("orphan_tool_result"),
                    QStringLiteral("Tool result %1 has no preceding tool call").arg(item.toolCallId)));
        }
    }
    return {};
}

VoidResult constraints(const ConstraintSet& set, const ParameterBounds& bounds) {
    if (auto r = checkRange("temperature", set.temperature, bounds.temperature); !r)
        return r;
    if (auto r = checkRange("top_p", set.topP, bounds.topP); !r)
        return r;
    if (auto r = checkRange("top_k", set.topK, bounds.topK); !r)
        return r;
    if (auto r = checkRange("max_tokens", set.maxTokens, bounds.maxTokens); !r)
        return r;
    if (auto r = checkRange("frequency_penalty", set.frequencyPenalty, bounds.frequencyPenalty); !r)
        return r;
    if (auto r = checkRange("presence_penalty", set.presencePenalty, bounds.presencePenalty); !r)
        return r;
    if (set.seed.has_value() && !bounds.seed)
        return std::unexpected(DomainFailure::encodeFailed(
            QStringLiteral("unsupported_parameter"),
            QStringLiteral("Parameter seed is not supported by the target upstream")));
    if (!set.stopSequences.isEmpty() && !bounds.stopSequences)
        return std::unexpected(DomainFailure::encodeFailed(
            QStringLiteral("unsupported_parameter"),
            QStringLiteral("Parameter stop is not supported by the target upstream")));
    if (set.thinkingBudget.has_value() && *set.thinkingBudget < 0)
        return std::unexpected(DomainFailure::invalidParameter(
            QStringLiteral("parameter_out_of_range"),
            QStringLiteral("Thinking budget must not be negative")));
    return {};
}

VoidResult response(const SemanticResponse& resp) {
    if (resp.candidates.isEmpty())
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Upstream response carries no candidates")));
    return {};
}

VoidResult frame(const StreamFrame& f) {
    if (f.type == FrameType::Failed && f.failure.message.isEmpty())
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Failed frame carries no error message")));
    if (f.type == FrameType::ActionDelta && f.actionDelta.closed && f.actionDelta.callId.isEmpty())
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Completed tool call carries no call id")));
    return {};
}

}
