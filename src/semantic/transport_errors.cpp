#include "transport_errors.h"

namespace TransportErrors {

bool isHttpStatusError(QNetworkReply::NetworkError code)
{
    // Content and protocol error ranges carry an HTTP status from the server.
    return (code >= QNetworkReply::ContentAccessDenied
            && code <= QNetworkReply::UnknownContentError)
        || (code >= QNetworkReply::InternalServerError
            && code <= QNetworkReply::UnknownServerError);
}

DomainFailure fromNetworkError(QNetworkReply::NetworkError code, const QString& detail)
{
    switch (code) {
    case QNetworkReply::SslHandshakeFailedError:
        return DomainFailure::tlsVerifyFailed(
            QStringLiteral("TLS verification failed: %1").arg(detail));

    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::OperationCanceledError:
        return DomainFailure::upstreamTimeout(
            QStringLiteral("Upstream timed out: %1").arg(detail));

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::BackgroundRequestNotAllowedError:
    case QNetworkReply::TooManyRedirectsError:
    case QNetworkReply::InsecureRedirectError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyAuthenticationRequiredError:
    case QNetworkReply::UnknownProxyError:
        return DomainFailure::connectFailed(
            QStringLiteral("Upstream connection failed: %1").arg(detail));

    default:
        return DomainFailure::connectFailed(
            QStringLiteral("Upstream transport error (%1): %2")
                .arg(static_cast<int>(code))
                .arg(detail));
    }
}

DomainFailure fromReply(const QNetworkReply* reply)
{
    if (!reply) {
        return DomainFailure::internal(QStringLiteral("null reply"));
    }
    return fromNetworkError(reply->error(), reply->errorString());
}

}
