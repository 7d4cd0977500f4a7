#pragma once
#include "ports.h"
#include "sse_parser.h"
#include "features/tool_call_assembler.h"
#include <QObject>
#include <QNetworkReply>
#include <QPointer>
#include <optional>

// Decodes one upstream event stream into canonical frames.
//
// Guarantees toward listeners: frames arrive in upstream order, tool calls
// only as complete calls, and the stream ends with exactly one of
// finished() (preceded by one Finished frame) or error().
class StreamSession : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kReadBufferSize = 64 * 1024;
    static constexpr qint64 kReadChunkSize = 16 * 1024;

    explicit StreamSession(QNetworkReply* reply,
                           IOutboundAdapter* outbound,
                           const QString& adapterHint,
                           QObject* parent = nullptr);
    ~StreamSession() override;

    // Cancels the upstream read without emitting anything further.
    void abort();

    // Ends the stream with the given failure (idle timeout, relay errors).
    void fail(const DomainFailure& failure);

    // Labels the per-event log lines with the request they belong to.
    void setRequestInfo(const QString& model, const QString& reasoningEffort);

    void pause();
    void resume();
    bool isPaused() const { return m_paused; }
    bool isDone() const { return m_done; }

signals:
    void frameReady(const StreamFrame& frame);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onReadyRead();
    void onReplyFinished();

private:
    QPointer<QNetworkReply> m_reply;
    IOutboundAdapter* m_outbound;
    QString m_adapterHint;
    QString m_requestModel;
    QString m_reasoningEffort;
    SseParser m_parser;
    StreamDecodeState m_state;
    ToolCallAssembler m_tools;
    std::optional<StopCause> m_pendingStop;
    bool m_paused = false;
    bool m_draining = false;
    bool m_done = false;

    void drain();
    void processEvent(const SseEvent& event);
    void handleFrame(StreamFrame frame);
    void endOfUpstream();
    void complete();
    void releaseReply();
};
