#pragma once
#include "ports.h"
#include "policy.h"
#include "stream_session.h"
#include "features/stream_aggregator.h"
#include <QObject>
#include <QPointer>
#include <QTimer>

class Processor;
class UpstreamCall;

// One canonical request in flight against the upstream, retries included.
//
// Reports exactly one of responseReady(), streamReady() or failed(), always
// from the event loop, and deletes itself afterwards. abort() ends the
// call silently and cancels whatever upstream exchange is open.
class ProcessorCall : public QObject {
    Q_OBJECT
public:
    enum class Mode {
        Buffered,   // one buffered upstream call
        Stream,     // a live upstream stream, handed to the receiver
        Collected   // a live upstream stream folded into one response
    };

    void abort();
    bool isDone() const { return m_done; }
    Mode mode() const { return m_mode; }

signals:
    void responseReady(const SemanticResponse& response);
    // The receiver takes ownership of the session.
    void streamReady(StreamSession* session);
    void failed(const DomainFailure& failure);

private:
    friend class Processor;
    ProcessorCall(Processor* processor, Mode mode, SemanticRequest request);

    Processor* m_processor;
    Mode m_mode;
    SemanticRequest m_request;
    IOutboundAdapter* m_outbound = nullptr;
    ExecutionPlan m_plan;
    ProviderRequest m_providerRequest;
    int m_attempt = 0;
    QPointer<UpstreamCall> m_upstream;
    QPointer<StreamSession> m_session;
    StreamAggregator m_aggregator;
    QTimer m_idle;
    bool m_done = false;

    void begin();
    void startAttempt();
    void onUpstreamResponse(const ProviderResponse& response);
    void onStreamOpened(QNetworkReply* reply);
    void retryOrFail(const DomainFailure& failure);
    void collect(StreamSession* session);
    void restartIdle();
    void finishResponse(Result<SemanticResponse> response);
    void finishFailed(const DomainFailure& failure);
};

// Runs canonical requests against one upstream: validation, parameter
// bounds, retry policy and the executor call. Every entry point returns at
// once with a call parented to the processor.
class Processor : public QObject {
    Q_OBJECT
public:
    explicit Processor(QObject* parent = nullptr);

    void setOutbound(IOutboundAdapter* outbound) { m_outbound = outbound; }
    void setExecutor(IExecutor* executor) { m_executor = executor; }
    void setPolicy(Policy* policy) { m_policy = policy; }
    void setStreamIdleTimeout(int ms) { m_streamIdleTimeoutMs = ms; }

    IOutboundAdapter* outbound() const { return m_outbound; }

    ProcessorCall* process(SemanticRequest request);
    ProcessorCall* processStream(SemanticRequest request);
    // Streams from the upstream and folds the frames into one response,
    // for upstreams that only answer in streaming mode.
    ProcessorCall* processCollected(SemanticRequest request);

private:
    friend class ProcessorCall;

    IOutboundAdapter* m_outbound = nullptr;
    IExecutor*        m_executor = nullptr;
    Policy*           m_policy = nullptr;
    int               m_streamIdleTimeoutMs = 60000;

    Result<IOutboundAdapter*> preflight(const SemanticRequest& request) const;
};
