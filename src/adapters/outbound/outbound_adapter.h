#pragma once
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>

// Request metadata understood by every upstream-facing adapter:
//   provider_base_url       upstream base URL, endpoint path is appended
//   api_key                 configured upstream credential (wins)
//   header.<name>           caller header, lower-case name
//   custom_header.<name>    static header from the upstream config
//   upstream.format         format id of the target upstream
namespace OutboundRequest {
    QString endpoint(const SemanticRequest& request,
                     const QString& defaultBase,
                     const QString& path);

    // Sets the credential header. A configured api_key is sent as
    // x-api-key (apiKeyHeader) or as a bearer token; otherwise the caller's
    // authorization / x-api-key headers are forwarded as they came.
    void applyCredentials(ProviderRequest& pr,
                          const SemanticRequest& request,
                          bool apiKeyHeader);

    // Copies the listed caller headers and every custom_header.* entry.
    void applyHeaders(ProviderRequest& pr,
                      const SemanticRequest& request,
                      const QStringList& forwarded);

    // Fallback failure for an error body that carries no error object.
    DomainFailure plainFailure(int httpStatus, const QByteArray& body);
}
