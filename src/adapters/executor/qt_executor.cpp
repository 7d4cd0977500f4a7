#include "qt_executor.h"
#include "semantic/upstream_call.h"
#include "semantic/transport_errors.h"
#include "core/log_manager.h"
#include <QPointer>
#include <QTimer>
#include <QNetworkReply>
#include <QUrl>

namespace {

bool isSuccess(int status)
{
    return status >= 200 && status < 300;
}

// Turns one QNetworkReply into an UpstreamCall outcome. A streaming
// request gets connectTimeoutMs for its headers and then requestTimeoutMs
// for an error body; a buffered request gets requestTimeoutMs overall.
class QtUpstreamCall : public UpstreamCall {
public:
    QtUpstreamCall(QNetworkReply* reply, const ProviderRequest& request,
                   int connectTimeoutMs, int requestTimeoutMs)
        : m_reply(reply)
        , m_url(request.url)
        , m_adapterHint(request.adapterHint)
        , m_stream(request.stream)
        , m_requestTimeoutMs(requestTimeoutMs)
    {
        m_timer.setSingleShot(true);
        connect(&m_timer, &QTimer::timeout, this, [this]() { onTimeout(); });
        connect(reply, &QNetworkReply::finished, this, [this]() { onFinished(); });
        if (m_stream)
            connect(reply, &QNetworkReply::metaDataChanged, this, [this]() { onHeaders(); });
        m_timer.start(m_stream ? connectTimeoutMs : requestTimeoutMs);
    }

    ~QtUpstreamCall() override
    {
        dropReply();
    }

    void abort() override
    {
        if (isDone()) return;
        UpstreamCall::abort();
        m_timer.stop();
        dropReply();
    }

private:
    QPointer<QNetworkReply> m_reply;
    QTimer m_timer;
    QString m_url;
    QString m_adapterHint;
    bool m_stream;
    bool m_awaitingErrorBody = false;
    int m_requestTimeoutMs;

    int status() const
    {
        return m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    }

    void dropReply()
    {
        if (!m_reply) return;
        m_reply->disconnect(this);
        if (m_reply->isRunning())
            m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }

    void handOver()
    {
        QNetworkReply* reply = m_reply;
        reply->disconnect(this);
        m_reply = nullptr;
        m_timer.stop();
        LOG_DEBUG(QStringLiteral("QtExecutor: stream connected %1 status=%2")
                      .arg(m_url)
                      .arg(reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt()));
        openStream(reply);
    }

    void onHeaders()
    {
        if (isDone() || !m_reply || m_awaitingErrorBody) return;
        const int code = status();
        if (code == 0) return;
        if (isSuccess(code)) {
            handOver();
            return;
        }
        // Error bodies are small; collect them so the adapter can map them.
        m_awaitingErrorBody = true;
        m_timer.start(m_requestTimeoutMs);
    }

    void onFinished()
    {
        if (isDone() || !m_reply) return;
        m_timer.stop();

        // HTTP error statuses come back as responses; the upstream adapter
        // reads its own error body.
        if (m_reply->error() != QNetworkReply::NoError
            && !TransportErrors::isHttpStatusError(m_reply->error())) {
            const DomainFailure failure = TransportErrors::fromReply(m_reply);
            dropReply();
            fail(failure);
            return;
        }

        // A stream short enough to end before its headers were handled.
        if (m_stream && isSuccess(status())) {
            handOver();
            return;
        }

        ProviderResponse resp;
        resp.statusCode = status();
        resp.body = m_reply->readAll();
        resp.adapterHint = m_adapterHint;
        for (const auto& header : m_reply->rawHeaderList())
            resp.headers[QString::fromUtf8(header).toLower()] = QString::fromUtf8(m_reply->rawHeader(header));
        dropReply();
        complete(resp);
    }

    void onTimeout()
    {
        if (isDone()) return;
        const QString what = m_stream && !m_awaitingErrorBody
            ? QStringLiteral("No response headers from %1").arg(m_url)
            : QStringLiteral("No complete response from %1").arg(m_url);
        LOG_WARNING(QStringLiteral("QtExecutor: %1, giving up").arg(what));
        dropReply();
        fail(DomainFailure::upstreamTimeout(what));
    }
};

}

QtExecutor::QtExecutor(ConnectionPool& pool, const TransportConfig& transport)
    : m_pool(pool)
    , m_sslConfig(transport.sslConfiguration())
{
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request, int transferTimeout) const {
    QNetworkRequest req{QUrl{request.url}};
    req.setSslConfiguration(m_sslConfig);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setTransferTimeout(transferTimeout);
    return req;
}

QNetworkReply* QtExecutor::send(QNetworkAccessManager* nam, const QNetworkRequest& req,
                                const ProviderRequest& request) const {
    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return nam->post(req, request.body);
    if (method == "GET")
        return nam->get(req);
    return nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

UpstreamCall* QtExecutor::start(const ProviderRequest& request) {
    QNetworkAccessManager* nam = m_pool.acquire(QUrl(request.url));
    // Stream inactivity is governed by the relay's idle timer.
    QNetworkReply* reply = send(nam, buildQtRequest(request, request.stream ? 0 : m_requestTimeout),
                                request);
    // The manager goes back to the pool with the reply, on every path.
    m_pool.releaseWith(reply, nam);

    LOG_DEBUG(QStringLiteral("QtExecutor: %1 %2 (%3 bytes%4)")
                  .arg(request.method, request.url)
                  .arg(request.body.size())
                  .arg(request.stream ? QStringLiteral(", stream") : QString()));

    return new QtUpstreamCall(reply, request, m_connectionTimeout, m_requestTimeout);
}
