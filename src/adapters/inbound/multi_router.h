#pragma once
#include "adapters/inbound/inbound_adapter.h"
#include <QMap>
#include <QString>
#include <memory>
#include <vector>

// Dispatches to the caller-facing adapter named by metadata
// "inbound.format" on decode and by the "inbound_protocol" extension the
// pipeline stamps on responses and frames.
class InboundMultiRouter : public IInboundAdapter {
public:
    InboundMultiRouter() = default;

    void registerAdapter(std::unique_ptr<IInboundAdapter> adapter);
    IInboundAdapter* adapterFor(const QString& protocol) const;
    QStringList protocols() const;

    QString protocol() const override;
    Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;
    Result<QByteArray> encodeResponse(
        const SemanticResponse& response) override;
    Result<QByteArray> encodeStreamFrame(
        const StreamFrame& frame, StreamEncodeState& state) override;
    // Without a protocol to go by, failures render in the canonical shape.
    Result<QByteArray> encodeFailure(
        const DomainFailure& failure) override;

private:
    Result<IInboundAdapter*> resolve(const ExtensionBag& extensions) const;

    QMap<QString, IInboundAdapter*> m_adapters;
    std::vector<std::unique_ptr<IInboundAdapter>> m_owned;
};
