#include "multi_router.h"

void OutboundMultiRouter::registerAdapter(std::unique_ptr<IOutboundAdapter> adapter)
{
    if (!adapter) {
        return;
    }
    const QString id = adapter->adapterId().trimmed().toLower();
    if (id.isEmpty()) {
        return;
    }
    m_adapters[id] = adapter.get();
    m_owned.push_back(std::move(adapter));
}

IOutboundAdapter* OutboundMultiRouter::adapterFor(const QString& adapterId) const
{
    if (adapterId.isEmpty()) {
        return nullptr;
    }
    return m_adapters.value(adapterId.trimmed().toLower(), nullptr);
}

QStringList OutboundMultiRouter::adapterIds() const
{
    return m_adapters.keys();
}

QString OutboundMultiRouter::adapterId() const
{
    return QStringLiteral("multi");
}

IOutboundAdapter* OutboundMultiRouter::select(const SemanticRequest& request)
{
    return adapterFor(request.metadata.value(QStringLiteral("upstream.format")));
}

Result<ProviderRequest> OutboundMultiRouter::buildRequest(const SemanticRequest& request)
{
    IOutboundAdapter* adapter = select(request);
    if (!adapter) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No upstream adapter for format '%1'")
                .arg(request.metadata.value(QStringLiteral("upstream.format")))));
    }
    return adapter->buildRequest(request);
}

Result<SemanticResponse> OutboundMultiRouter::parseResponse(const ProviderResponse& response)
{
    IOutboundAdapter* adapter = adapterFor(response.adapterHint);
    if (!adapter) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No upstream adapter for response hint '%1'").arg(response.adapterHint)));
    }
    return adapter->parseResponse(response);
}

Result<QList<StreamFrame>> OutboundMultiRouter::parseChunk(const ProviderChunk& chunk,
                                                           StreamDecodeState& state)
{
    IOutboundAdapter* adapter = adapterFor(chunk.adapterHint);
    if (!adapter) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("No upstream adapter for chunk hint '%1'").arg(chunk.adapterHint)));
    }
    return adapter->parseChunk(chunk, state);
}

DomainFailure OutboundMultiRouter::mapFailure(int httpStatus, const QByteArray& body)
{
    return OutboundRequest::plainFailure(httpStatus, body);
}

ParameterBounds OutboundMultiRouter::parameterBounds() const
{
    // Bounds belong to the selected adapter.
    return ParameterBounds{};
}
