#include "outbound_adapter.h"

namespace OutboundRequest {

QString endpoint(const SemanticRequest& request,
                 const QString& defaultBase,
                 const QString& path)
{
    QString base = request.metadata.value(QStringLiteral("provider_base_url"));
    if (base.isEmpty())
        base = defaultBase;
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    if (base.endsWith(path))
        return base;
    return base + path;
}

void applyCredentials(ProviderRequest& pr,
                      const SemanticRequest& request,
                      bool apiKeyHeader)
{
    const QString apiKey = request.metadata.value(QStringLiteral("api_key"));
    if (!apiKey.isEmpty()) {
        if (apiKeyHeader)
            pr.headers[QStringLiteral("x-api-key")] = apiKey;
        else
            pr.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + apiKey;
        return;
    }

    const QString authorization = request.metadata.value(QStringLiteral("header.authorization"));
    if (!authorization.isEmpty())
        pr.headers[QStringLiteral("Authorization")] = authorization;
    const QString xApiKey = request.metadata.value(QStringLiteral("header.x-api-key"));
    if (!xApiKey.isEmpty())
        pr.headers[QStringLiteral("x-api-key")] = xApiKey;
}

void applyHeaders(ProviderRequest& pr,
                  const SemanticRequest& request,
                  const QStringList& forwarded)
{
    for (const QString& name : forwarded) {
        const QString value = request.metadata.value(QStringLiteral("header.") + name);
        if (!value.isEmpty())
            pr.headers[name] = value;
    }

    for (auto it = request.metadata.constBegin(); it != request.metadata.constEnd(); ++it) {
        if (it.key().startsWith(QStringLiteral("custom_header."))) {
            const QString headerName = it.key().mid(14);
            if (!headerName.isEmpty()) {
                pr.headers[headerName] = it.value();
            }
        }
    }
}

DomainFailure plainFailure(int httpStatus, const QByteArray& body)
{
    QString message = QString::fromUtf8(body.left(512)).trimmed();
    if (message.isEmpty())
        message = QStringLiteral("Upstream returned HTTP %1").arg(httpStatus);
    return DomainFailure::upstreamHttp(httpStatus, QStringLiteral("upstream_http_error"), message);
}

}
