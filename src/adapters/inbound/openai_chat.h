#pragma once
#include "adapters/inbound/inbound_adapter.h"

// Caller-facing OpenAI Chat Completions.
class OpenAIChatAdapter : public IInboundAdapter {
public:
    OpenAIChatAdapter() = default;

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
    static QByteArray chunk(const StreamEncodeState& state, int index,
                            const QJsonObject& delta, const QJsonValue& finishReason);
    static void ensureStarted(const StreamFrame& frame, StreamEncodeState& state);
};
