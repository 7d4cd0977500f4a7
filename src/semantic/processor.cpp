#include "processor.h"
#include "upstream_call.h"
#include "validate.h"
#include "core/log_manager.h"

// ---------------------------------------------------------------------------
// ProcessorCall
// ---------------------------------------------------------------------------

ProcessorCall::ProcessorCall(Processor* processor, Mode mode, SemanticRequest request)
    : QObject(processor)
    , m_processor(processor)
    , m_mode(mode)
    , m_request(std::move(request))
{
    m_idle.setSingleShot(true);
    m_idle.setInterval(m_processor->m_streamIdleTimeoutMs);
    connect(&m_idle, &QTimer::timeout, this, [this]() {
        if (m_session) {
            m_session->fail(DomainFailure::streamTimeout(
                QStringLiteral("No upstream data for %1 ms").arg(m_idle.interval())));
        }
    });

    // Listeners connect after construction.
    QTimer::singleShot(0, this, [this]() { begin(); });
}

void ProcessorCall::abort()
{
    if (m_done) return;
    m_done = true;
    m_idle.stop();
    if (m_upstream) m_upstream->abort();
    if (m_session) m_session->abort();
    deleteLater();
}

void ProcessorCall::begin()
{
    if (m_done) return;

    Result<IOutboundAdapter*> pf = m_processor->preflight(m_request);
    if (!pf.has_value()) {
        finishFailed(pf.error());
        return;
    }
    m_outbound = *pf;

    if (m_processor->m_policy) {
        m_plan = m_processor->m_policy->plan(m_request);
    }
    startAttempt();
}

void ProcessorCall::startAttempt()
{
    const bool streaming = m_mode != Mode::Buffered;
    LOG_DEBUG(QStringLiteral("Processor: attempt %1/%2 model=%3%4")
                  .arg(m_attempt + 1)
                  .arg(m_plan.maxAttempts)
                  .arg(m_request.model)
                  .arg(streaming ? QStringLiteral(" (stream)") : QString()));

    SemanticRequest request = m_request;
    request.stream = streaming;
    Result<ProviderRequest> built = m_outbound->buildRequest(request);
    if (!built.has_value()) {
        retryOrFail(built.error());
        return;
    }

    m_providerRequest = *built;
    m_providerRequest.stream = streaming;

    UpstreamCall* upstream = m_processor->m_executor->start(m_providerRequest);
    upstream->setParent(this);
    m_upstream = upstream;
    connect(upstream, &UpstreamCall::responseReady, this, &ProcessorCall::onUpstreamResponse);
    connect(upstream, &UpstreamCall::streamOpened, this, &ProcessorCall::onStreamOpened);
    connect(upstream, &UpstreamCall::failed, this, &ProcessorCall::retryOrFail);
}

void ProcessorCall::onUpstreamResponse(const ProviderResponse& response)
{
    if (m_done) return;

    ProviderResponse resp = response;
    if (resp.adapterHint.isEmpty()) {
        resp.adapterHint = m_providerRequest.adapterHint;
    }

    // Check for HTTP-level errors before parsing
    if (resp.statusCode < 200 || resp.statusCode >= 300) {
        retryOrFail(m_outbound->mapFailure(resp.statusCode, resp.body));
        return;
    }

    Result<SemanticResponse> parsed = m_outbound->parseResponse(resp);
    if (!parsed.has_value()) {
        retryOrFail(parsed.error());
        return;
    }

    VoidResult valid = Validate::response(*parsed);
    if (!valid.has_value()) {
        retryOrFail(valid.error());
        return;
    }
    finishResponse(std::move(parsed));
}

void ProcessorCall::onStreamOpened(QNetworkReply* reply)
{
    if (m_done) {
        reply->abort();
        reply->deleteLater();
        return;
    }

    // Only connection-level failures are retried. Once a StreamSession
    // exists, bytes may have reached the caller and no retry happens.
    auto* session = new StreamSession(reply, m_outbound, m_providerRequest.adapterHint);
    session->setRequestInfo(m_request.model, m_request.constraints.reasoningEffort.value_or(QString()));
    if (m_mode == Mode::Collected) {
        collect(session);
        return;
    }

    m_done = true;
    emit streamReady(session);
    deleteLater();
}

void ProcessorCall::retryOrFail(const DomainFailure& failure)
{
    if (m_done) return;

    Policy* policy = m_processor->m_policy;
    if (!policy) {
        finishFailed(failure);
        return;
    }

    RetryDecision decision = policy->nextRetry(m_plan, m_attempt, failure);
    if (!decision.retry) {
        LOG_WARNING(QStringLiteral("Processor: not retrying after attempt %1: %2")
                        .arg(m_attempt + 1)
                        .arg(decision.reason));
        finishFailed(failure);
        return;
    }
    LOG_WARNING(QStringLiteral("Processor: retrying (attempt %1/%2): %3")
                    .arg(m_attempt + 2)
                    .arg(m_plan.maxAttempts)
                    .arg(decision.reason));
    ++m_attempt;
    startAttempt();
}

void ProcessorCall::collect(StreamSession* session)
{
    session->setParent(this);
    m_session = session;

    connect(session, &StreamSession::frameReady, this, [this](const StreamFrame& frame) {
        m_aggregator.addFrame(frame);
        restartIdle();
    });
    connect(session, &StreamSession::finished, this, [this]() {
        m_idle.stop();
        finishResponse(m_aggregator.finalize());
    });
    connect(session, &StreamSession::error, this, [this](const DomainFailure& failure) {
        m_idle.stop();
        finishFailed(failure);
    });
    restartIdle();
}

void ProcessorCall::restartIdle()
{
    if (m_idle.interval() > 0)
        m_idle.start();
}

void ProcessorCall::finishResponse(Result<SemanticResponse> response)
{
    if (!response.has_value()) {
        finishFailed(response.error());
        return;
    }
    if (m_done) return;
    m_done = true;
    emit responseReady(*response);
    deleteLater();
}

void ProcessorCall::finishFailed(const DomainFailure& failure)
{
    if (m_done) return;
    m_done = true;
    m_idle.stop();
    emit failed(failure);
    deleteLater();
}

// ---------------------------------------------------------------------------
// Processor
// ---------------------------------------------------------------------------

Processor::Processor(QObject* parent)
    : QObject(parent)
{
}

Result<IOutboundAdapter*> Processor::preflight(const SemanticRequest& request) const
{
    if (!m_outbound) {
        return std::unexpected(
            DomainFailure::internal(QStringLiteral("outbound adapter not set")));
    }
    if (!m_executor) {
        return std::unexpected(
            DomainFailure::internal(QStringLiteral("executor not set")));
    }

    VoidResult valResult = Validate::request(request);
    if (!valResult.has_value()) {
        return std::unexpected(valResult.error());
    }

    IOutboundAdapter* outbound = m_outbound->select(request);
    if (!outbound) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No upstream adapter for format '%1'")
                .arg(request.metadata.value(QStringLiteral("upstream.format")))));
    }

    // Ranges are checked against the upstream's documented bounds. Values
    // are never clamped.
    VoidResult bounds = Validate::constraints(request.constraints, outbound->parameterBounds());
    if (!bounds.has_value()) {
        return std::unexpected(bounds.error());
    }
    return outbound;
}

ProcessorCall* Processor::process(SemanticRequest request)
{
    return new ProcessorCall(this, ProcessorCall::Mode::Buffered, std::move(request));
}

ProcessorCall* Processor::processStream(SemanticRequest request)
{
    return new ProcessorCall(this, ProcessorCall::Mode::Stream, std::move(request));
}

ProcessorCall* Processor::processCollected(SemanticRequest request)
{
    return new ProcessorCall(this, ProcessorCall::Mode::Collected, std::move(request));
}
