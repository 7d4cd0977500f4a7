#pragma once
#include "ports.h"
#include <QList>

struct ExecutionPlan {
    QString targetModel;
    int maxAttempts = 1;
    QList<ErrorKind> retryableKinds = {
        ErrorKind::ConnectFailed,
        ErrorKind::UpstreamTimeout,
        ErrorKind::UpstreamHttp
    };
};

struct RetryDecision {
    bool retry = false;
    QString reason;
};

class Policy {
public:
    void setDefaultMaxAttempts(int attempts) { m_defaultMaxAttempts = qMax(1, attempts); }
    int defaultMaxAttempts() const { return m_defaultMaxAttempts; }

    ExecutionPlan plan(const SemanticRequest& req) const;
    RetryDecision nextRetry(const ExecutionPlan& plan,
                            int attempt,
                            const DomainFailure& failure) const;

private:
    int m_defaultMaxAttempts = 1;
};
