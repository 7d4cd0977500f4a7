#pragma once
#include "ports.h"
#include <QObject>
#include <QNetworkReply>

// One exchange with an upstream, started by an IExecutor.
//
// Reports exactly one outcome and deletes itself afterwards:
//   responseReady()  the whole response arrived. For a streaming request
//                    this only happens on a non-2xx status.
//   streamOpened()   a streaming request got 2xx headers. The receiver
//                    takes ownership of the reply.
//   failed()         transport error or timeout.
// abort() ends the exchange without reporting anything.
class UpstreamCall : public QObject {
    Q_OBJECT
public:
    explicit UpstreamCall(QObject* parent = nullptr);

    virtual void abort();
    bool isDone() const { return m_done; }

    void complete(const ProviderResponse& response);
    void openStream(QNetworkReply* reply);
    void fail(const DomainFailure& failure);

signals:
    void responseReady(const ProviderResponse& response);
    void streamOpened(QNetworkReply* reply);
    void failed(const DomainFailure& failure);

private:
    bool m_done = false;

    bool settle();
};
