#pragma once
#include "adapters/inbound/inbound_adapter.h"

// Caller-facing OpenAI Responses API. Every stream event carries the
// upstream model and a sequence number; a stream ends with exactly one of
// response.completed, response.incomplete or response.failed.
class OpenAIResponsesAdapter : public IInboundAdapter {
public:
    OpenAIResponsesAdapter() = default;

    QString protocol() const override;
    Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;
    Result<QByteArray> encodeResponse(
        const SemanticResponse& response) override;
    Result<QByteArray> encodeStreamFrame(
        const StreamFrame& frame, StreamEncodeState& state) override;
    Result<QByteArray> encodeFailure(
        const DomainFailure& failure) override;

protected:
    Result<SemanticRequest> decodeResponsesBody(
        const QJsonObject& root,
        const QMap<QString, QString>& metadata) const;

private:
    static QByteArray event(StreamEncodeState& state, const QString& type, QJsonObject payload);
    static QJsonObject responseObject(const StreamEncodeState& state, const QString& status);
    static QByteArray responseCreated(const StreamFrame& frame, StreamEncodeState& state);
    static QByteArray openItem(StreamEncodeState& state, const QString& kind,
                               const QString& itemId, const QJsonObject& item);
    static QByteArray closeItem(StreamEncodeState& state);
    static Result<QByteArray> encodeSegments(const QList<Segment>& segments,
                                             StreamEncodeState& state);
    static QByteArray encodeToolCall(const ActionDelta& call, StreamEncodeState& state);
    static QByteArray responseDone(const StreamFrame& frame, StreamEncodeState& state);
};
