#include "upstream_call.h"

UpstreamCall::UpstreamCall(QObject* parent)
    : QObject(parent)
{
}

bool UpstreamCall::settle()
{
    if (m_done) return false;
    m_done = true;
    deleteLater();
    return true;
}

void UpstreamCall::abort()
{
    settle();
}

void UpstreamCall::complete(const ProviderResponse& response)
{
    if (settle()) emit responseReady(response);
}

void UpstreamCall::openStream(QNetworkReply* reply)
{
    if (!settle()) {
        reply->abort();
        reply->deleteLater();
        return;
    }
    emit streamOpened(reply);
}

void UpstreamCall::fail(const DomainFailure& failure)
{
    if (settle()) emit failed(failure);
}
