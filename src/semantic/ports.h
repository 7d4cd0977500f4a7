#pragma once
#include "request.h"
#include "response.h"
#include "frame.h"
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QJsonArray>
#include <QList>
#include <QMap>
#include <QNetworkReply>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

struct ProviderRequest {
    QString method = QStringLiteral("POST");
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
    QString adapterHint;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
    QString adapterHint;
};

struct ProviderChunk {
    QString type;
    QByteArray data;
    QString adapterHint;
};

// Per-stream decoding state, owned by the stream session.
struct StreamDecodeState {
    QString responseId;
    QString model;
    bool started = false;
    bool sawToolCall = false;
    QMap<int, QString> slotKinds;
    UsageEntry usage;
};

// Per-stream encoding state, owned by the pipeline stream session.
struct StreamEncodeState {
    QString responseId;
    QString model;
    qint64 createdAt = 0;
    bool started = false;
    bool finished = false;
    int sequence = 0;
    int nextIndex = 0;
    int openIndex = -1;
    QString openKind;
    QString openItemId;
    QString openText;
    QJsonObject openStructured;
    // Tool calls emitted so far, by candidate index.
    QMap<int, int> toolCallCounts;
    bool sawToolCall = false;
    UsageEntry usage;
    QJsonArray outputItems;
};

class IInboundAdapter {
public:
    virtual ~IInboundAdapter() = default;
    virtual QString protocol() const = 0;
    virtual Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) = 0;
    virtual Result<QByteArray> encodeResponse(
        const SemanticResponse& response) = 0;
    virtual Result<QByteArray> encodeStreamFrame(
        const StreamFrame& frame, StreamEncodeState& state) = 0;
    virtual Result<QByteArray> encodeFailure(
        const DomainFailure& failure) = 0;
};

class IOutboundAdapter {
public:
    virtual ~IOutboundAdapter() = default;
    virtual QString adapterId() const = 0;
    virtual Result<ProviderRequest> buildRequest(
        const SemanticRequest& request) = 0;
    virtual Result<SemanticResponse> parseResponse(
        const ProviderResponse& response) = 0;
    virtual Result<QList<StreamFrame>> parseChunk(
        const ProviderChunk& chunk, StreamDecodeState& state) = 0;
    virtual DomainFailure mapFailure(int httpStatus, const QByteArray& body) = 0;
    virtual ParameterBounds parameterBounds() const = 0;

    // The adapter that serves this request. Routers return the registered
    // adapter for the request's upstream format, or nullptr.
    virtual IOutboundAdapter* select(const SemanticRequest& request) {
        Q_UNUSED(request);
        return this;
    }
};

class UpstreamCall;

class IExecutor {
public:
    virtual ~IExecutor() = default;
    // Sends the request and returns at once. The call reports its outcome
    // through signals; request.stream selects the streaming contract.
    virtual UpstreamCall* start(const ProviderRequest& request) = 0;
};
