#pragma once
#include "request_router.h"
#include "config/config_types.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QPointer>
#include <QHash>

class Pipeline;
class InboundMultiRouter;
class StreamRelay;
class PipelineStreamSession;
class PipelineCall;

// HTTP/1.1 front end: parses requests, resolves the endpoint binding and
// hands the body to the pipeline. Streams go to a StreamRelay.
class ProxyServer : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kMaxBodySize = 32 * 1024 * 1024;

    ProxyServer(Pipeline* pipeline,
                InboundMultiRouter* inbound,
                const RequestRouter& router,
                const ProxyConfig& config,
                QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start();
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    QString lastError() const { return m_lastError; }

    // Caller headers forwarded to upstream adapters as "header.<name>".
    static const QStringList& forwardedHeaders();

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
    };

    // One request at a time per connection; the rest waits in the buffer.
    struct Connection {
        QByteArray buffer;
        QPointer<PipelineCall> call;
        QPointer<StreamRelay> relay;
        bool busy = false;
        bool closeAfter = false;
    };

    void processBuffer(QTcpSocket* socket);
    static HttpRequest parseHttpRequest(const QByteArray& head, const QByteArray& body);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"));
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure,
                     const QString& callerFormat = QString());
    void startStream(QTcpSocket* socket, PipelineStreamSession* session);
    void requestDone(QTcpSocket* socket, bool keepAlive = true);
    QMap<QString, QString> buildMetadata(const HttpRequest& request,
                                         const EndpointBinding& binding) const;

    QTcpServer* m_server = nullptr;
    Pipeline* m_pipeline;
    InboundMultiRouter* m_inbound;
    RequestRouter m_router;
    ProxyConfig m_config;
    QString m_lastError;
    QHash<QTcpSocket*, Connection> m_connections;
};
