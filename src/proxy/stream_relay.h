#pragma once
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QTcpSocket>

class PipelineStreamSession;

// Writes one encoded stream to the caller socket as chunked SSE.
//
// Upstream reads are paused while the socket holds more than the high-water
// mark of unsent bytes and resumed below the low-water mark. The idle timer
// restarts on every upstream event and every drained write; on expiry the
// stream ends with a StreamTimeout error event. A caller disconnect cancels
// the upstream.
class StreamRelay : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kHighWaterMark = 256 * 1024;
    static constexpr qint64 kLowWaterMark = 64 * 1024;
    // How long a closing connection may take to drain without an idle timeout.
    static constexpr int kCloseGraceMs = 5000;

    StreamRelay(QTcpSocket* socket, PipelineStreamSession* session,
                int idleTimeoutMs, QObject* parent = nullptr);
    ~StreamRelay() override;

    void start();

    bool isPaused() const { return m_paused; }
    bool isDone() const { return m_done; }

signals:
    // The caller stream is complete (or the caller is gone). The relay
    // may be deleted from a slot connected here.
    void finished(bool keepAlive);

private slots:
    void onEncodedFrame(const QByteArray& data);
    void onSessionFinished();
    void onBytesWritten(qint64 bytes);
    void onSocketDisconnected();
    void onIdleTimeout();

private:
    QPointer<QTcpSocket> m_socket;
    QPointer<PipelineStreamSession> m_session;
    QTimer m_idle;
    int m_idleTimeoutMs;
    bool m_paused = false;
    bool m_done = false;

    void checkBackpressure();
    void end(bool keepAlive);
    static void closeSocket(QTcpSocket* socket, int graceMs);
};
