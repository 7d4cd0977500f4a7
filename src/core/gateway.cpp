#include "gateway.h"
#include "log_manager.h"
#include "adapters/inbound/multi_router.h"
#include "adapters/inbound/anthropic.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/inbound/openai_native.h"
#include "adapters/inbound/openai_responses.h"
#include "adapters/inbound/codex.h"
#include "adapters/outbound/multi_router.h"
#include "adapters/outbound/anthropic.h"
#include "adapters/outbound/openai.h"
#include "adapters/outbound/responses.h"
#include "adapters/outbound/codex.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/pipeline.h"
#include "pipeline/middlewares/model_mapping_middleware.h"
#include "pipeline/middlewares/stream_mode_middleware.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "proxy/connection_pool.h"
#include "proxy/proxy_server.h"
#include "proxy/request_router.h"
#include "semantic/policy.h"

Gateway::Gateway(const ProxyConfig& config, const TransportConfig& transport, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_transport(transport)
{
    const RuntimeOptions& runtime = m_config.runtime;

    // --- Transport ---
    m_pool = std::make_unique<ConnectionPool>(m_transport, qMax(1, runtime.connectionPoolSize));
    m_executor = std::make_unique<QtExecutor>(*m_pool, m_transport);
    m_executor->setRequestTimeout(runtime.requestTimeout);
    m_executor->setConnectionTimeout(runtime.connectionTimeout);

    // --- Inbound adapters ---
    m_inbound = std::make_unique<InboundMultiRouter>();
    m_inbound->registerAdapter(std::make_unique<AnthropicAdapter>());
    m_inbound->registerAdapter(std::make_unique<OpenAINativeAdapter>());
    m_inbound->registerAdapter(std::make_unique<OpenAIChatAdapter>());
    m_inbound->registerAdapter(std::make_unique<OpenAIResponsesAdapter>());
    m_inbound->registerAdapter(std::make_unique<CodexAdapter>());

    // --- Outbound adapters ---
    m_outbound = std::make_unique<OutboundMultiRouter>();
    m_outbound->registerAdapter(std::make_unique<AnthropicOutbound>());
    m_outbound->registerAdapter(std::make_unique<OpenAIOutbound>());
    m_outbound->registerAdapter(std::make_unique<ResponsesOutbound>());
    m_outbound->registerAdapter(std::make_unique<CodexOutbound>());

    // --- Pipeline ---
    m_policy = std::make_unique<Policy>();
    m_policy->setDefaultMaxAttempts(runtime.maxAttempts);

    m_pipeline = new Pipeline(m_inbound.get(), m_outbound.get(), m_executor.get(), this);
    m_pipeline->setPolicy(m_policy.get());
    m_pipeline->setStreamIdleTimeout(runtime.streamIdleTimeout);
    m_pipeline->addMiddleware(std::make_unique<ModelMappingMiddleware>(m_config.modelMap));
    m_pipeline->addMiddleware(std::make_unique<StreamModeMiddleware>());
    m_pipeline->addMiddleware(std::make_unique<DebugMiddleware>(runtime.debugMode));
}

Gateway::~Gateway()
{
    stop();
    // The server and pipeline hold raw pointers into the adapters.
    delete m_server;
    m_server = nullptr;
    delete m_pipeline;
    m_pipeline = nullptr;
    // Replies left by the pipeline release their managers into the pool,
    // so the pool goes last.
    m_executor.reset();
    m_pool.reset();
}

bool Gateway::start()
{
    m_lastError.clear();

    const RequestRouter router = RequestRouter::fromConfig(m_config);
    if (VoidResult valid = router.validate(); !valid) {
        m_lastError = valid.error().message;
        LOG_ERROR(QStringLiteral("Gateway: %1").arg(m_lastError));
        return false;
    }
    for (const EndpointBinding& b : router.bindings()) {
        if (!m_inbound->adapterFor(b.callerFormat)) {
            m_lastError = QStringLiteral("Binding %1 uses unknown caller format '%2'")
                              .arg(b.pathPattern, b.callerFormat);
            LOG_ERROR(QStringLiteral("Gateway: %1").arg(m_lastError));
            return false;
        }
        if (!m_outbound->adapterFor(b.upstreamFormat)) {
            m_lastError = QStringLiteral("Binding %1 uses unknown upstream format '%2'")
                              .arg(b.pathPattern, b.upstreamFormat);
            LOG_ERROR(QStringLiteral("Gateway: %1").arg(m_lastError));
            return false;
        }
        LOG_INFO(QStringLiteral("Gateway: %1 %2%3 [%4] -> %5 [%6]")
                     .arg(b.method, b.pathPattern, b.prefix ? QStringLiteral("*") : QString(),
                          b.callerFormat, b.upstreamTarget, b.upstreamFormat));
    }

    if (!m_transport.verifyPeer()) {
        LOG_WARNING(QStringLiteral("Gateway: TLS verification of upstreams is disabled (SSL_VERIFY)"));
    }
    if (!m_transport.caBundlePath().isEmpty()) {
        LOG_INFO(QStringLiteral("Gateway: using CA bundle %1 (%2 certificates)")
                     .arg(m_transport.caBundlePath())
                     .arg(m_transport.caCertificateCount()));
    }

    delete m_server;
    m_server = new ProxyServer(m_pipeline, m_inbound.get(), router, m_config, this);
    if (!m_server->start()) {
        m_lastError = m_server->lastError();
        return false;
    }
    return true;
}

void Gateway::stop()
{
    if (m_server)
        m_server->stop();
    if (m_pool)
        m_pool->clear();
}

bool Gateway::isRunning() const
{
    return m_server && m_server->isRunning();
}

quint16 Gateway::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}
