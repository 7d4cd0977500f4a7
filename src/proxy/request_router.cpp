#include "request_router.h"
#include "core/log_manager.h"

namespace {

QString describe(const EndpointBinding& b)
{
    return QStringLiteral("%1 %2%3").arg(b.method, b.pathPattern,
                                         b.prefix ? QStringLiteral("*") : QString());
}

// True when the path lies under the prefix on a segment boundary.
bool underPrefix(const QString& path, const QString& prefix)
{
    if (!path.startsWith(prefix))
        return false;
    if (path.size() == prefix.size() || prefix.endsWith(QLatin1Char('/')))
        return true;
    return path.at(prefix.size()) == QLatin1Char('/');
}

}

RequestRouter::RequestRouter(const QList<EndpointBinding>& bindings)
    : m_bindings(bindings)
{
}

RequestRouter RequestRouter::fromConfig(const ProxyConfig& config)
{
    RequestRouter router;
    for (const BindingConfig& b : config.bindings) {
        EndpointBinding binding;
        binding.method = b.method.trimmed().toUpper();
        binding.pathPattern = b.path;
        binding.prefix = b.prefix;
        binding.callerFormat = b.format;
        binding.upstreamTarget = b.upstream;
        binding.upstreamFormat = b.upstreamFormat;
        if (binding.upstreamFormat.isEmpty()) {
            if (const UpstreamConfig* upstream = config.upstream(b.upstream))
                binding.upstreamFormat = upstream->format;
        }
        router.addBinding(binding);
    }
    return router;
}

void RequestRouter::addBinding(const EndpointBinding& binding)
{
    m_bindings.append(binding);
}

VoidResult RequestRouter::validate() const
{
    for (int i = 0; i < m_bindings.size(); ++i) {
        const EndpointBinding& a = m_bindings.at(i);
        if (!a.pathPattern.startsWith(QLatin1Char('/')))
            return std::unexpected(DomainFailure::invalidParameter(
                QStringLiteral("invalid_binding"),
                QStringLiteral("Binding path must start with '/': %1").arg(a.pathPattern)));

        for (int j = i + 1; j < m_bindings.size(); ++j) {
            const EndpointBinding& b = m_bindings.at(j);
            if (a.method != b.method)
                continue;

            bool overlap = false;
            if (!a.prefix && !b.prefix)
                overlap = a.pathPattern == b.pathPattern;
            else if (a.prefix && b.prefix)
                overlap = underPrefix(a.pathPattern, b.pathPattern)
                       || underPrefix(b.pathPattern, a.pathPattern);
            else if (a.prefix)
                overlap = underPrefix(b.pathPattern, a.pathPattern);
            else
                overlap = underPrefix(a.pathPattern, b.pathPattern);

            if (overlap)
                return std::unexpected(DomainFailure::invalidParameter(
                    QStringLiteral("overlapping_bindings"),
                    QStringLiteral("Bindings overlap: %1 and %2").arg(describe(a), describe(b))));
        }
    }
    return {};
}

Result<EndpointBinding> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    QString cleanPath = path;
    const int query = cleanPath.indexOf(QLatin1Char('?'));
    if (query >= 0)
        cleanPath.truncate(query);

    for (const EndpointBinding& b : m_bindings) {
        if (b.method != normalizedMethod)
            continue;
        if (b.prefix ? underPrefix(cleanPath, b.pathPattern) : cleanPath == b.pathPattern)
            return b;
    }

    LOG_DEBUG(QStringLiteral("RequestRouter: no binding for %1 %2").arg(normalizedMethod, cleanPath));
    return std::unexpected(DomainFailure::unroutable(
        QStringLiteral("No endpoint is bound to %1 %2").arg(normalizedMethod, cleanPath)));
}
