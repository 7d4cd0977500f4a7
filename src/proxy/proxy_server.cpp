#include "proxy_server.h"
#include "sse_writer.h"
#include "stream_relay.h"
#include "pipeline/pipeline.h"
#include "adapters/inbound/multi_router.h"
#include "core/log_manager.h"

#include <QSslServer>
#include <QSslConfiguration>
#include <QSslKey>
#include <QSslCertificate>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QHostAddress>
#include <QTimer>

namespace {

QString statusText(int status)
{
    switch (status) {
    case 200: return QStringLiteral("OK");
    case 400: return QStringLiteral("Bad Request");
    case 401: return QStringLiteral("Unauthorized");
    case 403: return QStringLiteral("Forbidden");
    case 404: return QStringLiteral("Not Found");
    case 413: return QStringLiteral("Payload Too Large");
    case 429: return QStringLiteral("Too Many Requests");
    case 500: return QStringLiteral("Internal Server Error");
    case 501: return QStringLiteral("Not Implemented");
    case 502: return QStringLiteral("Bad Gateway");
    case 503: return QStringLiteral("Service Unavailable");
    case 504: return QStringLiteral("Gateway Timeout");
    default:  return QStringLiteral("Unknown");
    }
}

bool wantsClose(const QMap<QString, QString>& headers, const QString& httpVersion)
{
    const QString connection = headers.value(QStringLiteral("connection")).toLower();
    if (connection == QLatin1String("close"))
        return true;
    return httpVersion == QLatin1String("HTTP/1.0") && connection != QLatin1String("keep-alive");
}

}

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(Pipeline* pipeline,
                         InboundMultiRouter* inbound,
                         const RequestRouter& router,
                         const ProxyConfig& config,
                         QObject* parent)
    : QObject(parent)
    , m_pipeline(pipeline)
    , m_inbound(inbound)
    , m_router(router)
    , m_config(config)
{
}

ProxyServer::~ProxyServer()
{
    stop();
}

const QStringList& ProxyServer::forwardedHeaders()
{
    static const QStringList headers = {
        QStringLiteral("authorization"),
        QStringLiteral("x-api-key"),
        QStringLiteral("anthropic-version"),
        QStringLiteral("anthropic-beta"),
        QStringLiteral("openai-organization"),
        QStringLiteral("openai-beta"),
        QStringLiteral("chatgpt-account-id"),
        QStringLiteral("originator"),
        QStringLiteral("session_id"),
    };
    return headers;
}

// ========================================================================
// start / stop
// ========================================================================

bool ProxyServer::start()
{
    if (m_server) {
        stop();
    }
    m_lastError.clear();

    const ListenOptions& listen = m_config.listen;
    if (listen.useTls()) {
        QFile certFile(listen.tlsCert);
        if (!certFile.open(QIODevice::ReadOnly)) {
            m_lastError = QStringLiteral("Cannot open certificate file %1").arg(listen.tlsCert);
            LOG_ERROR(QStringLiteral("ProxyServer: %1").arg(m_lastError));
            return false;
        }
        QFile keyFile(listen.tlsKey);
        if (!keyFile.open(QIODevice::ReadOnly)) {
            m_lastError = QStringLiteral("Cannot open private key file %1").arg(listen.tlsKey);
            LOG_ERROR(QStringLiteral("ProxyServer: %1").arg(m_lastError));
            return false;
        }

        const QSslCertificate cert(&certFile, QSsl::Pem);
        const QByteArray keyPem = keyFile.readAll();
        QSslKey key(keyPem, QSsl::Rsa, QSsl::Pem);
        if (key.isNull())
            key = QSslKey(keyPem, QSsl::Ec, QSsl::Pem);
        if (cert.isNull() || key.isNull()) {
            m_lastError = QStringLiteral("TLS certificate or key is invalid");
            LOG_ERROR(QStringLiteral("ProxyServer: %1").arg(m_lastError));
            return false;
        }

        QSslConfiguration sslConfig = QSslConfiguration::defaultConfiguration();
        sslConfig.setLocalCertificate(cert);
        sslConfig.setPrivateKey(key);
        sslConfig.setPeerVerifyMode(QSslSocket::VerifyNone);

        auto* sslServer = new QSslServer(this);
        sslServer->setSslConfiguration(sslConfig);
        m_server = sslServer;
    } else {
        m_server = new QTcpServer(this);
    }

    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &ProxyServer::onNewConnection);

    const QHostAddress address(listen.host);
    if (!m_server->listen(address.isNull() ? QHostAddress(QHostAddress::LocalHost) : address,
                          static_cast<quint16>(listen.port))) {
        m_lastError = QStringLiteral("Cannot listen on %1:%2 - %3")
                          .arg(listen.host)
                          .arg(listen.port)
                          .arg(m_server->errorString());
        LOG_ERROR(QStringLiteral("ProxyServer: %1").arg(m_lastError));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: %1 listening on %2:%3 with %4 bindings")
                 .arg(listen.useTls() ? QStringLiteral("HTTPS") : QStringLiteral("HTTP"))
                 .arg(listen.host)
                 .arg(m_server->serverPort())
                 .arg(m_router.bindings().size()));
    return true;
}

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    const QList<QTcpSocket*> sockets = m_connections.keys();
    for (QTcpSocket* socket : sockets) {
        if (PipelineCall* call = m_connections.value(socket).call)
            call->abort();
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    m_connections.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: stopped"));
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Socket handling
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_connections.insert(socket, Connection());
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !m_connections.contains(socket)) {
        return;
    }
    m_connections[socket].buffer += socket->readAll();
    processBuffer(socket);
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }
    // A live relay sees the same signal and cancels its upstream; a
    // buffered call in flight is cancelled here.
    if (PipelineCall* call = m_connections.value(socket).call)
        call->abort();
    m_connections.remove(socket);
    socket->deleteLater();
    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

void ProxyServer::processBuffer(QTcpSocket* socket)
{
    if (!m_connections.contains(socket))
        return;
    Connection& conn = m_connections[socket];
    if (conn.busy || socket->state() != QAbstractSocket::ConnectedState)
        return;

    const qsizetype headerEnd = conn.buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (conn.buffer.size() > 64 * 1024) {
            sendFailure(socket, DomainFailure::decodeFailed(
                QStringLiteral("header_too_large"),
                QStringLiteral("Request header exceeds 64 KiB")));
            socket->disconnectFromHost();
        }
        return;
    }

    const QByteArray head = conn.buffer.left(headerEnd);
    const HttpRequest parsedHead = parseHttpRequest(head, QByteArray());

    if (parsedHead.headers.value(QStringLiteral("transfer-encoding"))
            .contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
        sendFailure(socket, DomainFailure::decodeFailed(
            QStringLiteral("chunked_request"),
            QStringLiteral("Chunked request bodies are not supported")));
        socket->disconnectFromHost();
        return;
    }

    bool lengthOk = true;
    const QString lengthHeader = parsedHead.headers.value(QStringLiteral("content-length"));
    const qint64 contentLength = lengthHeader.isEmpty() ? 0 : lengthHeader.toLongLong(&lengthOk);
    if (!lengthOk || contentLength < 0) {
        sendFailure(socket, DomainFailure::decodeFailed(
            QStringLiteral("invalid_content_length"),
            QStringLiteral("Content-Length is not a valid size")));
        socket->disconnectFromHost();
        return;
    }
    if (contentLength > kMaxBodySize) {
        sendFailure(socket, DomainFailure::decodeFailed(
            QStringLiteral("body_too_large"),
            QStringLiteral("Request body exceeds %1 bytes").arg(kMaxBodySize)));
        socket->disconnectFromHost();
        return;
    }

    const qsizetype bodyStart = headerEnd + 4;
    if (conn.buffer.size() < bodyStart + contentLength) {
        return;
    }

    const HttpRequest request = parseHttpRequest(head, conn.buffer.mid(bodyStart, contentLength));
    conn.buffer.remove(0, bodyStart + contentLength);
    conn.busy = true;
    conn.closeAfter = wantsClose(request.headers, request.httpVersion);

    // Answers either right away or once the upstream call completes; both
    // end in requestDone(), which picks up the next buffered request.
    handleRequest(socket, request);
}

void ProxyServer::requestDone(QTcpSocket* socket, bool keepAlive)
{
    auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return;

    it->busy = false;
    it->call = nullptr;
    it->relay = nullptr;
    if (!keepAlive || it->closeAfter) {
        socket->disconnectFromHost();
        return;
    }
    if (!it->buffer.isEmpty()) {
        // Requests pipelined behind this one.
        QTimer::singleShot(0, this, [this, socket]() { processBuffer(socket); });
    }
}

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& head, const QByteArray& body)
{
    HttpRequest req;
    const QStringList lines = QString::fromUtf8(head).split(QStringLiteral("\r\n"));

    // Request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        const QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2].trimmed();
        }
    }

    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            req.headers[lines[i].left(colon).trimmed().toLower()] = lines[i].mid(colon + 1).trimmed();
        }
    }

    req.body = body;
    return req;
}

// ========================================================================
// Dispatch
// ========================================================================

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    if (request.method.isEmpty() || request.path.isEmpty()) {
        sendFailure(socket, DomainFailure::decodeFailed(
            QStringLiteral("malformed_request_line"), QStringLiteral("Malformed HTTP request line")));
        requestDone(socket);
        return;
    }

    if (request.method == QLatin1String("GET") && request.path == QLatin1String("/health")) {
        QJsonObject health;
        health[QStringLiteral("status")] = QStringLiteral("ok");
        sendHttpResponse(socket, 200, QJsonDocument(health).toJson(QJsonDocument::Compact));
        requestDone(socket);
        return;
    }

    Result<EndpointBinding> binding = m_router.match(request.method, request.path);
    if (!binding) {
        sendFailure(socket, binding.error());
        requestDone(socket);
        return;
    }

    const QMap<QString, QString> metadata = buildMetadata(request, *binding);

    Result<SemanticRequest> decoded = m_pipeline->decode(request.body, metadata);
    if (!decoded) {
        sendFailure(socket, decoded.error(), binding->callerFormat);
        requestDone(socket);
        return;
    }

    const QString callerFormat = binding->callerFormat;
    PipelineCall* call = m_pipeline->process(std::move(*decoded));
    m_connections[socket].call = call;

    // onSocketDisconnected() aborts the call, so these only fire for a
    // connected caller.
    connect(call, &PipelineCall::responseReady, this, [this, socket](const QByteArray& body) {
        sendHttpResponse(socket, 200, body);
        requestDone(socket);
    });
    connect(call, &PipelineCall::streamReady, this, [this, socket](PipelineStreamSession* session) {
        startStream(socket, session);
    });
    connect(call, &PipelineCall::failed, this,
            [this, socket, callerFormat](const DomainFailure& failure) {
        sendFailure(socket, failure, callerFormat);
        requestDone(socket);
    });
}

void ProxyServer::startStream(QTcpSocket* socket, PipelineStreamSession* session)
{
    auto* relay = new StreamRelay(socket, session, m_config.runtime.streamIdleTimeout, socket);
    m_connections[socket].call = nullptr;
    m_connections[socket].relay = relay;

    connect(relay, &StreamRelay::finished, this, [this, socket, relay](bool keepAlive) {
        relay->deleteLater();
        requestDone(socket, keepAlive);
    });

    relay->start();
}

// ========================================================================
// Responses
// ========================================================================

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText(status))
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
}

void ProxyServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure,
                              const QString& callerFormat)
{
    LOG_WARNING(QStringLiteral("ProxyServer: %1 (%2): %3")
                    .arg(failure.typeName(), failure.code, failure.message));

    QByteArray body;
    IInboundAdapter* adapter = callerFormat.isEmpty() ? nullptr : m_inbound->adapterFor(callerFormat);
    if (adapter) {
        Result<QByteArray> encoded = adapter->encodeFailure(failure);
        if (encoded)
            body = *encoded;
    }
    if (body.isEmpty())
        body = QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact);

    sendHttpResponse(socket, failure.httpStatus(), body);
}

// ========================================================================
// buildMetadata
// ========================================================================

QMap<QString, QString> ProxyServer::buildMetadata(
    const HttpRequest& request,
    const EndpointBinding& binding) const
{
    QMap<QString, QString> meta;
    meta[QStringLiteral("inbound.format")]  = binding.callerFormat;
    meta[QStringLiteral("upstream.format")] = binding.upstreamFormat;
    meta[QStringLiteral("upstream.name")]   = binding.upstreamTarget;
    meta[QStringLiteral("request_path")]    = request.path;

    if (const UpstreamConfig* upstream = m_config.upstream(binding.upstreamTarget)) {
        meta[QStringLiteral("provider_base_url")] = upstream->baseUrl;
        meta[QStringLiteral("upstream.stream")] = streamModeName(upstream->streamMode);
        if (!upstream->apiKey.isEmpty())
            meta[QStringLiteral("api_key")] = upstream->apiKey;
        for (auto it = upstream->headers.cbegin(); it != upstream->headers.cend(); ++it) {
            meta[QStringLiteral("custom_header.%1").arg(it.key())] = it.value();
        }
    }

    for (const QString& name : forwardedHeaders()) {
        const QString value = request.headers.value(name);
        if (!value.isEmpty())
            meta[QStringLiteral("header.") + name] = value;
    }

    return meta;
}
