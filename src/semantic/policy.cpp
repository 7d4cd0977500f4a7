#include "policy.h"

ExecutionPlan Policy::plan(const SemanticRequest& req) const
{
    ExecutionPlan p;
    p.targetModel = req.model;
    p.maxAttempts = m_defaultMaxAttempts;
    return p;
}

RetryDecision Policy::nextRetry(const ExecutionPlan& plan,
                                int attempt,
                                const DomainFailure& failure) const
{
    const int maxAttempts = qMax(1, plan.maxAttempts);
    if (attempt + 1 >= maxAttempts) {
        return {false, QStringLiteral("max retry attempts reached")};
    }

    if (!failure.retryable) {
        return {false, QStringLiteral("failure is not retryable")};
    }

    for (auto kind : plan.retryableKinds) {
        if (failure.kind == kind) {
            return {
                true,
                QStringLiteral("retry %1/%2: %3")
                    .arg(attempt + 2)
                    .arg(maxAttempts)
                    .arg(failure.message)
            };
        }
    }

    return {false, QStringLiteral("non-retryable failure kind")};
}
