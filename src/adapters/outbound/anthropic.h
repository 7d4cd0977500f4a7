#pragma once
#include "outbound_adapter.h"

class AnthropicOutbound : public IOutboundAdapter {
public:
    AnthropicOutbound() = default;
    ~AnthropicOutbound() override = default;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;
    Result<SemanticResponse> parseResponse(const ProviderResponse& response) override;
    Result<QList<StreamFrame>> parseChunk(const ProviderChunk& chunk,
                                          StreamDecodeState& state) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;
    ParameterBounds parameterBounds() const override;

private:
    static StreamFrame blockStart(const QJsonObject& event, StreamDecodeState& state);
    static std::optional<StreamFrame> blockDelta(const QJsonObject& event,
                                                 const StreamDecodeState& state);
};
