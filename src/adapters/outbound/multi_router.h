#pragma once
#include "outbound_adapter.h"
#include <QMap>
#include <memory>
#include <vector>

// Dispatches to the upstream-facing adapter named by metadata
// "upstream.format"; provider responses and chunks go back to the adapter
// named by their adapterHint.
class OutboundMultiRouter : public IOutboundAdapter {
public:
    OutboundMultiRouter() = default;
    ~OutboundMultiRouter() override = default;

    void registerAdapter(std::unique_ptr<IOutboundAdapter> adapter);
    IOutboundAdapter* adapterFor(const QString& adapterId) const;
    QStringList adapterIds() const;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;
    Result<SemanticResponse> parseResponse(const ProviderResponse& response) override;
    Result<QList<StreamFrame>> parseChunk(const ProviderChunk& chunk,
                                          StreamDecodeState& state) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;
    ParameterBounds parameterBounds() const override;
    IOutboundAdapter* select(const SemanticRequest& request) override;

private:
    QMap<QString, IOutboundAdapter*> m_adapters;
    std::vector<std::unique_ptr<IOutboundAdapter>> m_owned;
};
