#pragma once
#include "adapters/inbound/inbound_adapter.h"

// Caller-facing Anthropic Messages API.
class AnthropicAdapter : public IInboundAdapter {
public:
    AnthropicAdapter() = default;

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

private:
    static QByteArray messageStart(const StreamFrame& frame, StreamEncodeState& state);
    static QByteArray openBlock(StreamEncodeState& state, const QString& kind,
                                const QJsonObject& contentBlock);
    static QByteArray closeBlock(StreamEncodeState& state);
    static QByteArray blockDelta(const StreamEncodeState& state, const QJsonObject& delta);
    static Result<QByteArray> encodeSegments(const QList<Segment>& segments,
                                             StreamEncodeState& state);
    static QByteArray encodeToolCall(const ActionDelta& call, StreamEncodeState& state);
    static QByteArray messageStop(const StreamFrame& frame, StreamEncodeState& state);
};
