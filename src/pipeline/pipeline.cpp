#include "pipeline.h"
#include "middlewares/stream_mode_middleware.h"
#include "semantic/processor.h"
#include "semantic/stream_session.h"
#include "semantic/features/stream_splitter.h"
#include "core/log_manager.h"
#include <QTimer>

namespace {
const QString kInboundProtocolKey = QStringLiteral("inbound_protocol");
}

// ========== PipelineStreamSession ==========

PipelineStreamSession::PipelineStreamSession(
        StreamSession* upstream,
        IInboundAdapter* inbound,
        const QString& inboundProtocol,
        const QList<IPipelineMiddleware*>& middlewares,
        QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_inbound(inbound)
    , m_inboundProtocol(inboundProtocol)
    , m_middlewares(middlewares)
{
    connectUpstream();
}

PipelineStreamSession::PipelineStreamSession(
        const QList<StreamFrame>& replay,
        IInboundAdapter* inbound,
        const QString& inboundProtocol,
        const QList<IPipelineMiddleware*>& middlewares,
        QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_inboundProtocol(inboundProtocol)
    , m_middlewares(middlewares)
    , m_replay(replay)
    , m_replaying(true)
{
    // Listeners connect after construction.
    scheduleReplay();
}

PipelineStreamSession::~PipelineStreamSession()
{
    if (m_upstream) m_upstream->abort();
}

void PipelineStreamSession::connectUpstream() {
    if (!m_upstream) return;
    m_upstream->setParent(this);
    connect(m_upstream, &StreamSession::frameReady,
            this, &PipelineStreamSession::onUpstreamFrame);
    connect(m_upstream, &StreamSession::finished,
            this, &PipelineStreamSession::onUpstreamFinished);
    connect(m_upstream, &StreamSession::error,
            this, &PipelineStreamSession::onUpstreamError);
}

void PipelineStreamSession::abort() {
    if (m_done) return;
    m_done = true;
    m_replay.clear();
    if (m_upstream) m_upstream->abort();
}

void PipelineStreamSession::fail(const DomainFailure& failure) {
    if (m_done) return;
    m_replay.clear();
    if (m_upstream) m_upstream->abort();
    emitFailure(failure);
}

void PipelineStreamSession::pause() {
    m_paused = true;
    if (m_upstream) m_upstream->pause();
}

void PipelineStreamSession::resume() {
    if (!m_paused) return;
    m_paused = false;
    if (m_upstream) m_upstream->resume();
    if (m_replaying) scheduleReplay();
}

void PipelineStreamSession::scheduleReplay() {
    QTimer::singleShot(0, this, [this]() { replayNext(); });
}

void PipelineStreamSession::replayNext() {
    if (m_done || m_paused) return;
    if (m_replay.isEmpty()) {
        m_replaying = false;
        finish();
        return;
    }
    onUpstreamFrame(m_replay.takeFirst());
    if (!m_done) scheduleReplay();
}

void PipelineStreamSession::onUpstreamFrame(const StreamFrame& frame) {
    if (m_done) return;
    emit upstreamActivity();

    StreamFrame f = frame;
    if (!m_inboundProtocol.isEmpty()) {
        f.extensions.set(kInboundProtocolKey, m_inboundProtocol);
    }
    for (auto* mw : m_middlewares) {
        auto r = mw->onFrame(std::move(f));
        if (!r) {
            fail(r.error());
            return;
        }
        f = *r;
    }

    auto encoded = m_inbound->encodeStreamFrame(f, m_state);
    if (!encoded) {
        fail(encoded.error());
        return;
    }
    if (!encoded->isEmpty())
        emit encodedFrameReady(*encoded);
}

void PipelineStreamSession::onUpstreamFinished() {
    finish();
}

void PipelineStreamSession::onUpstreamError(const DomainFailure& failure) {
    emitFailure(failure);
}

void PipelineStreamSession::emitFailure(const DomainFailure& failure) {
    if (m_done) return;
    m_failed = true;
    LOG_WARNING(QStringLiteral("Stream failed [%1]: %2 %3")
                    .arg(m_inboundProtocol, failure.code, failure.message));

    StreamFrame frame;
    frame.type = FrameType::Failed;
    frame.failure = failure;
    frame.isFinal = true;
    frame.model = m_state.model;
    frame.responseId = m_state.responseId;
    if (!m_inboundProtocol.isEmpty()) {
        frame.extensions.set(kInboundProtocolKey, m_inboundProtocol);
    }

    // Middlewares see the failure frame too, but cannot veto it.
    for (auto* mw : m_middlewares) {
        if (auto r = mw->onFrame(frame); r)
            frame = *r;
    }

    auto encoded = m_inbound->encodeStreamFrame(frame, m_state);
    if (encoded) {
        if (!encoded->isEmpty())
            emit encodedFrameReady(*encoded);
    } else {
        LOG_ERROR(QStringLiteral("Cannot encode stream failure for %1: %2")
                      .arg(m_inboundProtocol, encoded.error().message));
    }
    finish();
}

void PipelineStreamSession::finish() {
    if (m_done) return;
    m_done = true;
    emit finished();
}

// ========== PipelineCall ==========

PipelineCall::PipelineCall(Pipeline* pipeline, ProcessorCall* upstream,
                           const QString& inboundProtocol, bool callerStreams)
    : QObject(pipeline)
    , m_pipeline(pipeline)
    , m_upstream(upstream)
    , m_inboundProtocol(inboundProtocol)
    , m_callerStreams(callerStreams)
{
    connect(upstream, &ProcessorCall::responseReady, this, &PipelineCall::onResponse);
    connect(upstream, &ProcessorCall::streamReady, this, &PipelineCall::onStream);
    connect(upstream, &ProcessorCall::failed, this, &PipelineCall::onFailed);
}

void PipelineCall::abort() {
    if (m_done) return;
    m_done = true;
    if (m_upstream) m_upstream->abort();
    deleteLater();
}

void PipelineCall::onResponse(const SemanticResponse& response) {
    if (m_done) return;

    if (m_callerStreams) {
        // A buffered upstream answer replayed to a streaming caller.
        StreamSplitter splitter;
        auto* session = new PipelineStreamSession(splitter.split(response), m_pipeline->m_inbound,
                                                  m_inboundProtocol,
                                                  m_pipeline->reversedMiddlewares(), m_pipeline);
        m_done = true;
        emit streamReady(session);
        deleteLater();
        return;
    }

    Result<QByteArray> body = m_pipeline->encodeResponse(response, m_inboundProtocol);
    if (!body) {
        onFailed(body.error());
        return;
    }
    m_done = true;
    emit responseReady(*body);
    deleteLater();
}

void PipelineCall::onStream(StreamSession* session) {
    if (m_done) {
        session->abort();
        session->deleteLater();
        return;
    }
    auto* stream = new PipelineStreamSession(session, m_pipeline->m_inbound, m_inboundProtocol,
                                             m_pipeline->reversedMiddlewares(), m_pipeline);
    m_done = true;
    emit streamReady(stream);
    deleteLater();
}

void PipelineCall::onFailed(const DomainFailure& failure) {
    if (m_done) return;
    m_done = true;
    emit failed(failure);
    deleteLater();
}

// ========== Pipeline ==========

Pipeline::Pipeline(IInboundAdapter* inbound,
                   IOutboundAdapter* outbound,
                   IExecutor* executor,
                   QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_processor(new Processor(this))
{
    m_processor->setOutbound(outbound);
    m_processor->setExecutor(executor);
}

void Pipeline::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

void Pipeline::setPolicy(Policy* policy)
{
    m_processor->setPolicy(policy);
}

void Pipeline::setStreamIdleTimeout(int ms)
{
    m_processor->setStreamIdleTimeout(ms);
}

Result<SemanticRequest> Pipeline::decode(const QByteArray& requestBody,
                                         const QMap<QString, QString>& metadata) {
    auto decoded = m_inbound->decodeRequest(requestBody, metadata);
    if (!decoded) return std::unexpected(decoded.error());

    SemanticRequest req = std::move(*decoded);

    // Forward through middlewares in order
    for (auto& mw : m_middlewares) {
        auto r = mw->onRequest(std::move(req));
        if (!r) return std::unexpected(r.error());
        req = std::move(*r);
    }
    return req;
}

PipelineCall* Pipeline::process(SemanticRequest request) {
    const QString inboundProtocol = inboundProtocolOf(request);
    const bool callerStreams = request.stream;
    const bool upstreamStreams = StreamModeMiddleware::upstreamStreams(request);

    ProcessorCall* upstream = nullptr;
    if (!upstreamStreams) {
        upstream = m_processor->process(std::move(request));
    } else if (callerStreams) {
        upstream = m_processor->processStream(std::move(request));
    } else {
        // An upstream that only streams is folded back into one response.
        upstream = m_processor->processCollected(std::move(request));
    }
    return new PipelineCall(this, upstream, inboundProtocol, callerStreams);
}

QString Pipeline::inboundProtocolOf(const SemanticRequest& request) const {
    const QString declared = request.metadata.value(QStringLiteral("inbound.format"));
    return declared.isEmpty() ? m_inbound->protocol() : declared;
}

Result<QByteArray> Pipeline::encodeResponse(SemanticResponse response,
                                            const QString& inboundProtocol) {
    if (!inboundProtocol.isEmpty()) {
        response.extensions.set(kInboundProtocolKey, inboundProtocol);
    }
    // Reverse through middlewares
    for (auto* mw : reversedMiddlewares()) {
        auto r = mw->onResponse(std::move(response));
        if (!r) return std::unexpected(r.error());
        response = std::move(*r);
    }
    return m_inbound->encodeResponse(response);
}

QList<IPipelineMiddleware*> Pipeline::reversedMiddlewares() const {
    QList<IPipelineMiddleware*> list;
    list.reserve(m_middlewares.size());
    for (int i = int(m_middlewares.size()) - 1; i >= 0; --i)
        list.append(m_middlewares[i].get());
    return list;
}
