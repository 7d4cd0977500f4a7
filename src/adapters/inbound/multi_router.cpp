#include "adapters/inbound/multi_router.h"
#include "adapters/wire/wire_util.h"

void InboundMultiRouter::registerAdapter(std::unique_ptr<IInboundAdapter> adapter)
{
    if (!adapter) return;
    const QString name = adapter->protocol().trimmed().toLower();
    if (name.isEmpty()) return;
    m_adapters.insert(name, adapter.get());
    m_owned.push_back(std::move(adapter));
}

IInboundAdapter* InboundMultiRouter::adapterFor(const QString& protocol) const
{
    return m_adapters.value(protocol.trimmed().toLower(), nullptr);
}

QStringList InboundMultiRouter::protocols() const
{
    return m_adapters.keys();
}

QString InboundMultiRouter::protocol() const
{
    return QStringLiteral("multi");
}

Result<IInboundAdapter*> InboundMultiRouter::resolve(const ExtensionBag& extensions) const
{
    const QString protocol = extensions.get(QStringLiteral("inbound_protocol")).toString();
    IInboundAdapter* adapter = adapterFor(protocol);
    if (!adapter) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No caller-facing adapter for protocol '%1'").arg(protocol)));
    }
    return adapter;
}

Result<SemanticRequest> InboundMultiRouter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    const QString format = metadata.value(QStringLiteral("inbound.format"));
    if (format.isEmpty()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("metadata[\"inbound.format\"] is required")));
    }

    IInboundAdapter* adapter = adapterFor(format);
    if (!adapter) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No adapter registered for format: %1").arg(format)));
    }
    return adapter->decodeRequest(body, metadata);
}

Result<QByteArray> InboundMultiRouter::encodeResponse(const SemanticResponse& response)
{
    Result<IInboundAdapter*> adapter = resolve(response.extensions);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->encodeResponse(response);
}

Result<QByteArray> InboundMultiRouter::encodeStreamFrame(const StreamFrame& frame,
                                                         StreamEncodeState& state)
{
    Result<IInboundAdapter*> adapter = resolve(frame.extensions);
    if (!adapter) return std::unexpected(adapter.error());
    return (*adapter)->encodeStreamFrame(frame, state);
}

Result<QByteArray> InboundMultiRouter::encodeFailure(const DomainFailure& failure)
{
    return WireUtil::compact(failure.toJson());
}
