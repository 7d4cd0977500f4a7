#include "stream_relay.h"
#include "sse_writer.h"
#include "pipeline/pipeline.h"
#include "core/log_manager.h"

StreamRelay::StreamRelay(QTcpSocket* socket, PipelineStreamSession* session,
                         int idleTimeoutMs, QObject* parent)
    : QObject(parent)
    , m_socket(socket)
    , m_session(session)
    , m_idleTimeoutMs(idleTimeoutMs)
{
    m_idle.setSingleShot(true);
    m_idle.setInterval(m_idleTimeoutMs);
    connect(&m_idle, &QTimer::timeout, this, &StreamRelay::onIdleTimeout);

    connect(m_session, &PipelineStreamSession::encodedFrameReady,
            this, &StreamRelay::onEncodedFrame);
    connect(m_session, &PipelineStreamSession::finished,
            this, &StreamRelay::onSessionFinished);
    connect(m_session, &PipelineStreamSession::upstreamActivity,
            &m_idle, qOverload<>(&QTimer::start));

    connect(m_socket, &QTcpSocket::bytesWritten,
            this, &StreamRelay::onBytesWritten);
    connect(m_socket, &QTcpSocket::disconnected,
            this, &StreamRelay::onSocketDisconnected);
}

StreamRelay::~StreamRelay()
{
    if (m_session) {
        m_session->abort();
        m_session->deleteLater();
    }
}

void StreamRelay::start()
{
    SseWriter::writeStreamHeader(m_socket);
    if (m_idleTimeoutMs > 0)
        m_idle.start();
}

void StreamRelay::onEncodedFrame(const QByteArray& data)
{
    if (m_done || !m_socket) return;
    SseWriter::sendChunk(m_socket, data);
    checkBackpressure();
}

void StreamRelay::checkBackpressure()
{
    if (!m_socket || !m_session) return;
    const qint64 pending = m_socket->bytesToWrite();
    if (!m_paused && pending > kHighWaterMark) {
        m_paused = true;
        m_session->pause();
        LOG_DEBUG(QStringLiteral("StreamRelay: caller slow, %1 bytes pending, pausing upstream")
                      .arg(pending));
    } else if (m_paused && pending < kLowWaterMark) {
        m_paused = false;
        m_session->resume();
        LOG_DEBUG(QStringLiteral("StreamRelay: caller drained, resuming upstream"));
    }
}

void StreamRelay::onBytesWritten(qint64 bytes)
{
    Q_UNUSED(bytes);
    if (m_done) return;
    if (m_idleTimeoutMs > 0)
        m_idle.start();
    checkBackpressure();
}

void StreamRelay::onSessionFinished()
{
    if (m_done) return;
    const bool failed = m_session && m_session->hasFailed();
    SseWriter::sendTerminator(m_socket);
    // A failed stream closes the connection after its error event.
    end(!failed);
}

void StreamRelay::onSocketDisconnected()
{
    if (m_done) return;
    LOG_INFO(QStringLiteral("StreamRelay: caller disconnected, cancelling upstream"));
    if (m_session) m_session->abort();
    end(false);
}

void StreamRelay::onIdleTimeout()
{
    if (m_done || !m_session) return;
    LOG_WARNING(QStringLiteral("StreamRelay: no progress for %1 ms").arg(m_idleTimeoutMs));
    // Queued behind a full socket the error event may never be read; the
    // connection is closed after it either way.
    m_session->fail(DomainFailure::streamTimeout(
        QStringLiteral("Stream stalled for more than %1 ms").arg(m_idleTimeoutMs)));
}

void StreamRelay::closeSocket(QTcpSocket* socket, int graceMs)
{
    socket->disconnectFromHost();
    if (socket->state() == QAbstractSocket::UnconnectedState)
        return;
    // disconnectFromHost() waits for the write buffer to drain, which a
    // stalled caller never does.
    QTimer::singleShot(graceMs, socket, [socket]() {
        if (socket->state() != QAbstractSocket::UnconnectedState) {
            LOG_WARNING(QStringLiteral("StreamRelay: caller did not drain %1 bytes, dropping connection")
                            .arg(socket->bytesToWrite()));
            socket->abort();
        }
    });
}

void StreamRelay::end(bool keepAlive)
{
    m_done = true;
    m_idle.stop();
    if (m_socket) {
        disconnect(m_socket, nullptr, this, nullptr);
        if (!keepAlive)
            closeSocket(m_socket, m_idleTimeoutMs > 0 ? m_idleTimeoutMs : kCloseGraceMs);
    }
    emit finished(keepAlive);
}
