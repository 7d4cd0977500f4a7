#pragma once
#include "middleware.h"
#include "semantic/ports.h"
#include "semantic/policy.h"
#include <QObject>
#include <QList>
#include <QPointer>
#include <memory>
#include <vector>

class Processor;
class ProcessorCall;
class StreamSession;
class Pipeline;

// Caller-facing side of one stream: runs the frames through the
// middlewares and the caller's encoder. The source is either a live
// upstream session or a buffered response replayed as frames.
//
// Emits encodedFrameReady() zero or more times, then finished() exactly
// once. A failure is encoded as the caller's error event before finished().
class PipelineStreamSession : public QObject {
    Q_OBJECT
public:
    PipelineStreamSession(StreamSession* upstream,
                          IInboundAdapter* inbound,
                          const QString& inboundProtocol,
                          const QList<IPipelineMiddleware*>& middlewares,
                          QObject* parent = nullptr);
    PipelineStreamSession(const QList<StreamFrame>& replay,
                          IInboundAdapter* inbound,
                          const QString& inboundProtocol,
                          const QList<IPipelineMiddleware*>& middlewares,
                          QObject* parent = nullptr);
    ~PipelineStreamSession() override;

    // Cancels the upstream without emitting anything further.
    void abort();
    // Cancels the upstream and ends the caller stream with this failure.
    void fail(const DomainFailure& failure);

    void pause();
    void resume();

    bool isDone() const { return m_done; }
    bool hasFailed() const { return m_failed; }
    const StreamEncodeState& encodeState() const { return m_state; }

signals:
    void encodedFrameReady(const QByteArray& sseData);
    // One per upstream event handed in, used to restart idle timers.
    void upstreamActivity();
    void finished();

private slots:
    void onUpstreamFrame(const StreamFrame& frame);
    void onUpstreamFinished();
    void onUpstreamError(const DomainFailure& failure);

private:
    QPointer<StreamSession> m_upstream;
    IInboundAdapter* m_inbound;
    QString m_inboundProtocol;
    QList<IPipelineMiddleware*> m_middlewares;
    StreamEncodeState m_state;
    QList<StreamFrame> m_replay;
    bool m_replaying = false;
    bool m_paused = false;
    bool m_done = false;
    bool m_failed = false;

    void connectUpstream();
    void scheduleReplay();
    void replayNext();
    void emitFailure(const DomainFailure& failure);
    void finish();
};

// One caller request in flight. Reports exactly one of responseReady(),
// streamReady() or failed(), always from the event loop, and deletes
// itself afterwards. abort() ends it silently and cancels the upstream.
class PipelineCall : public QObject {
    Q_OBJECT
public:
    void abort();
    bool isDone() const { return m_done; }

signals:
    // Encoded buffered body in the caller's format.
    void responseReady(const QByteArray& body);
    // Parented to the pipeline; the receiver deleteLater()s it once finished.
    void streamReady(PipelineStreamSession* session);
    void failed(const DomainFailure& failure);

private:
    friend class Pipeline;
    PipelineCall(Pipeline* pipeline, ProcessorCall* upstream,
                 const QString& inboundProtocol, bool callerStreams);

    Pipeline* m_pipeline;
    QPointer<ProcessorCall> m_upstream;
    QString m_inboundProtocol;
    bool m_callerStreams;
    bool m_done = false;

    void onResponse(const SemanticResponse& response);
    void onStream(StreamSession* session);
    void onFailed(const DomainFailure& failure);
};

class Pipeline : public QObject {
    Q_OBJECT
public:
    Pipeline(IInboundAdapter* inbound,
             IOutboundAdapter* outbound,
             IExecutor* executor,
             QObject* parent = nullptr);

    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);
    void setPolicy(Policy* policy);
    void setStreamIdleTimeout(int ms);

    IInboundAdapter* inbound() const { return m_inbound; }

    // Decodes the caller's body and runs the request-side middlewares.
    Result<SemanticRequest> decode(const QByteArray& requestBody,
                                   const QMap<QString, QString>& metadata);

    // Starts answering a decoded request: a buffered body for a buffered
    // caller, a stream session for a streaming one. Returns at once.
    PipelineCall* process(SemanticRequest request);

private:
    friend class PipelineCall;

    IInboundAdapter* m_inbound;
    Processor* m_processor;
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;

    QString inboundProtocolOf(const SemanticRequest& request) const;
    Result<QByteArray> encodeResponse(SemanticResponse response,
                                      const QString& inboundProtocol);
    QList<IPipelineMiddleware*> reversedMiddlewares() const;
};
