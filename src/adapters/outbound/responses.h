#pragma once
#include "outbound_adapter.h"

// Upstream speaking the OpenAI Responses API.
class ResponsesOutbound : public IOutboundAdapter {
public:
    ResponsesOutbound() = default;
    ~ResponsesOutbound() override = default;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;
    Result<SemanticResponse> parseResponse(const ProviderResponse& response) override;
    Result<QList<StreamFrame>> parseChunk(const ProviderChunk& chunk,
                                          StreamDecodeState& state) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;
    ParameterBounds parameterBounds() const override;

protected:
    virtual QString defaultBaseUrl() const;
    virtual QStringList forwardedHeaders() const;
    virtual void finishBody(QJsonObject& body, const SemanticRequest& request) const;

private:
    // Folds a complete event stream returned to a buffered call.
    Result<SemanticResponse> foldEventStream(const QByteArray& body);
    void parseItemDone(const QJsonObject& event, StreamDecodeState& state,
                       QList<StreamFrame>& frames) const;
};
