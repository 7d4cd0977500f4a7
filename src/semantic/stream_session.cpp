#include "stream_session.h"
#include "transport_errors.h"
#include "core/log_manager.h"
#include <QTimer>

StreamSession::StreamSession(QNetworkReply* reply,
                             IOutboundAdapter* outbound,
                             const QString& adapterHint,
                             QObject* parent)
    : QObject(parent)
    , m_reply(reply)
    , m_outbound(outbound)
    , m_adapterHint(adapterHint)
{
    Q_ASSERT(m_reply);
    Q_ASSERT(m_outbound);

    // Take ownership of the reply so it is cleaned up with this session
    m_reply->setParent(this);
    m_reply->setReadBufferSize(kReadBufferSize);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamSession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamSession::onReplyFinished);

    // Bytes may already be buffered (the executor waits for the first
    // readyRead). Drain them once the caller has connected its slots.
    QTimer::singleShot(0, this, [this]() { drain(); });
}

StreamSession::~StreamSession()
{
    releaseReply();
}

void StreamSession::releaseReply()
{
    if (!m_reply) return;
    m_reply->disconnect(this);
    if (m_reply->isRunning()) {
        m_reply->abort();
    }
    m_reply->deleteLater();
    m_reply = nullptr;
}

void StreamSession::abort()
{
    if (m_done) {
        releaseReply();
        return;
    }
    m_done = true;
    m_tools.discard();
    m_parser.clear();
    LOG_DEBUG(QStringLiteral("StreamSession [%1]: aborted by caller").arg(m_adapterHint));
    releaseReply();
}

void StreamSession::fail(const DomainFailure& failure)
{
    if (m_done) return;
    m_done = true;
    m_tools.discard();
    m_parser.clear();

    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2")
                  .arg(failure.code, failure.message));

    releaseReply();
    emit error(failure);
}

void StreamSession::pause()
{
    m_paused = true;
}

void StreamSession::resume()
{
    if (!m_paused) return;
    m_paused = false;
    QTimer::singleShot(0, this, [this]() { drain(); });
}

void StreamSession::onReadyRead()
{
    drain();
}

void StreamSession::onReplyFinished()
{
    drain();
}

void StreamSession::drain()
{
    if (m_draining) return;
    m_draining = true;

    while (!m_done && !m_paused) {
        if (std::optional<SseEvent> event = m_parser.next()) {
            processEvent(*event);
            continue;
        }
        if (m_reply && m_reply->bytesAvailable() > 0) {
            m_parser.feed(m_reply->read(kReadChunkSize));
            continue;
        }
        if (!m_reply || m_reply->isFinished()) {
            // Flush the last event block if the stream omitted its blank line.
            m_parser.finish();
            if (std::optional<SseEvent> event = m_parser.next()) {
                processEvent(*event);
                continue;
            }
            endOfUpstream();
        }
        break;
    }

    m_draining = false;
}

void StreamSession::endOfUpstream()
{
    if (m_done) return;

    if (m_reply && m_reply->error() != QNetworkReply::NoError) {
        const QNetworkReply::NetworkError code = m_reply->error();
        if (TransportErrors::isHttpStatusError(code)) {
            const int status = m_reply->attribute(
                QNetworkRequest::HttpStatusCodeAttribute).toInt();
            fail(m_outbound->mapFailure(status, m_reply->readAll()));
        } else {
            fail(TransportErrors::fromReply(m_reply));
        }
        return;
    }

    // Upstream closed cleanly without its own terminal marker.
    complete();
}

void StreamSession::setRequestInfo(const QString& model, const QString& reasoningEffort)
{
    m_requestModel = model;
    m_reasoningEffort = reasoningEffort;
}

void StreamSession::processEvent(const SseEvent& event)
{
    LOG_DEBUG(QStringLiteral("StreamSession [%1] model=%2 effort=%3: event '%4' (%5 bytes)")
                  .arg(m_adapterHint,
                       m_state.model.isEmpty() ? m_requestModel : m_state.model,
                       m_reasoningEffort.isEmpty() ? QStringLiteral("-") : m_reasoningEffort,
                       event.type)
                  .arg(event.data.size()));

    if (event.data == "[DONE]") {
        complete();
        return;
    }

    if (event.data.trimmed().isEmpty()) {
        return;
    }

    ProviderChunk chunk;
    chunk.type = event.type;
    chunk.data = event.data;
    chunk.adapterHint = m_adapterHint;

    Result<QList<StreamFrame>> result = m_outbound->parseChunk(chunk, m_state);
    if (!result) {
        LOG_WARNING(QStringLiteral("StreamSession: chunk parse error: %1")
                        .arg(result.error().message));
        fail(result.error());
        return;
    }

    for (const StreamFrame& frame : *result) {
        if (m_done) break;
        handleFrame(frame);
    }
}

void StreamSession::handleFrame(StreamFrame frame)
{
    switch (frame.type) {
    case FrameType::ActionDelta: {
        Result<QList<StreamFrame>> calls = m_tools.accept(frame);
        if (!calls) {
            fail(calls.error());
            return;
        }
        for (const StreamFrame& call : *calls) {
            emit frameReady(call);
        }
        return;
    }

    case FrameType::Finished:
        if (frame.stopCause) {
            m_pendingStop = frame.stopCause;
        }
        if (!frame.usageDelta.isEmpty()) {
            StreamFrame usage;
            usage.envelope = frame.envelope;
            usage.type = FrameType::UsageDelta;
            usage.candidateIndex = frame.candidateIndex;
            usage.usageDelta = frame.usageDelta;
            emit frameReady(usage);
        }
        if (frame.isFinal) {
            complete();
        }
        return;

    case FrameType::Failed:
        fail(frame.failure);
        return;

    case FrameType::Started:
        if (frame.responseId.isEmpty()) frame.responseId = m_state.responseId;
        if (frame.model.isEmpty()) frame.model = m_state.model;
        emit frameReady(frame);
        return;

    case FrameType::Delta:
    case FrameType::UsageDelta:
        emit frameReady(frame);
        return;
    }
}

void StreamSession::complete()
{
    if (m_done) return;
    m_done = true;

    // A call the upstream never closed is still delivered whole.
    const QList<StreamFrame> pending = m_tools.flush();
    for (const StreamFrame& call : pending) {
        emit frameReady(call);
    }

    StreamFrame last;
    last.type = FrameType::Finished;
    last.responseId = m_state.responseId;
    last.model = m_state.model;
    last.isFinal = true;
    if (m_pendingStop) {
        last.stopCause = m_pendingStop;
    } else {
        last.stopCause = m_state.sawToolCall ? StopCause::ToolCall
                                             : StopCause::Completed;
    }
    emit frameReady(last);

    releaseReply();
    emit finished();
}
