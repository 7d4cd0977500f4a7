#pragma once
#include "config/config_types.h"
#include "config/transport_config.h"
#include <QObject>
#include <memory>

class ConnectionPool;
class QtExecutor;
class InboundMultiRouter;
class OutboundMultiRouter;
class Policy;
class Pipeline;
class ProxyServer;

// Wires the adapters, transport, pipeline and server for one process.
class Gateway : public QObject {
    Q_OBJECT

public:
    Gateway(const ProxyConfig& config, const TransportConfig& transport,
            QObject* parent = nullptr);
    ~Gateway() override;

    // Validates the bindings and starts listening. lastError() says why not.
    bool start();
    void stop();

    bool isRunning() const;
    quint16 serverPort() const;
    QString lastError() const { return m_lastError; }

    const ProxyConfig& config() const { return m_config; }
    ConnectionPool& connectionPool() { return *m_pool; }

private:
    ProxyConfig m_config;
    TransportConfig m_transport;
    std::unique_ptr<ConnectionPool> m_pool;
    std::unique_ptr<QtExecutor> m_executor;
    std::unique_ptr<InboundMultiRouter> m_inbound;
    std::unique_ptr<OutboundMultiRouter> m_outbound;
    std::unique_ptr<Policy> m_policy;
    Pipeline* m_pipeline = nullptr;
    ProxyServer* m_server = nullptr;
    QString m_lastError;
};
