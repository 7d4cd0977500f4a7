#pragma once
#include "semantic/ports.h"
#include "config/config_types.h"
#include <QString>
#include <QList>

// One static route: inbound path to caller format, upstream target and
// upstream format. Fixed at startup.
struct EndpointBinding {
    QString method = QStringLiteral("POST");
    QString pathPattern;
    bool prefix = false;
    QString callerFormat;
    QString upstreamTarget;
    QString upstreamFormat;
};

class RequestRouter {
public:
    RequestRouter() = default;
    explicit RequestRouter(const QList<EndpointBinding>& bindings);

    static RequestRouter fromConfig(const ProxyConfig& config);

    void addBinding(const EndpointBinding& binding);

    // Rejects bindings that could both match one request: duplicate exact
    // paths, an exact path under a prefix, nested prefixes.
    VoidResult validate() const;

    // The query string is ignored.
    Result<EndpointBinding> match(const QString& method, const QString& path) const;

    const QList<EndpointBinding>& bindings() const { return m_bindings; }

private:
    QList<EndpointBinding> m_bindings;
};
