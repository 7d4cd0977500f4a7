#pragma once
#include "semantic/ports.h"
#include "proxy/connection_pool.h"
#include "config/transport_config.h"
#include <QNetworkRequest>
#include <QSslConfiguration>

// IExecutor over QNetworkAccessManager. Buffered calls complete when the
// whole body has arrived; streaming calls complete when the response
// headers arrive, or with the buffered error body on a non-2xx status.
class QtExecutor : public IExecutor {
public:
    QtExecutor(ConnectionPool& pool, const TransportConfig& transport);

    UpstreamCall* start(const ProviderRequest& request) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    void setConnectionTimeout(int ms) { m_connectionTimeout = ms; }

private:
    ConnectionPool& m_pool;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 120000;
    int m_connectionTimeout = 30000;

    QNetworkRequest buildQtRequest(const ProviderRequest& request, int transferTimeout) const;
    QNetworkReply* send(QNetworkAccessManager* nam, const QNetworkRequest& req,
                        const ProviderRequest& request) const;
};
