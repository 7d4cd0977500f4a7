#pragma once
#include "outbound_adapter.h"

class OpenAIOutbound : public IOutboundAdapter {
public:
    OpenAIOutbound() = default;
    ~OpenAIOutbound() override = default;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;
    Result<SemanticResponse> parseResponse(const ProviderResponse& response) override;
    Result<QList<StreamFrame>> parseChunk(const ProviderChunk& chunk,
                                          StreamDecodeState& state) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;
    ParameterBounds parameterBounds() const override;

    // Tool-call slots of different choices never collide.
    static constexpr int kSlotsPerChoice = 1000;

private:
    static void parseChoice(const QJsonObject& choice, StreamDecodeState& state,
                            QList<StreamFrame>& frames);
};
