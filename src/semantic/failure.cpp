#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::Unroutable:        return 404;
    case ErrorKind::DecodeFailed:      return 400;
    case ErrorKind::InvalidParameter:  return 400;
    case ErrorKind::ConnectFailed:     return 502;
    case ErrorKind::TlsVerifyFailed:   return 502;
    case ErrorKind::UpstreamTimeout:   return 504;
    case ErrorKind::UpstreamHttp:      return 502;
    case ErrorKind::StreamTimeout:     return 504;
    case ErrorKind::EncodeFailed:      return 502;
    case ErrorKind::Internal:
    default:                           return 500;
    }
}

QString DomainFailure::typeName() const {
    switch (kind) {
    case ErrorKind::Unroutable:        return QStringLiteral("unroutable_request");
    case ErrorKind::DecodeFailed:      return QStringLiteral("decode_error");
    case ErrorKind::InvalidParameter:  return QStringLiteral("invalid_parameter");
    case ErrorKind::ConnectFailed:
    case ErrorKind::TlsVerifyFailed:
    case ErrorKind::UpstreamTimeout:
    case ErrorKind::UpstreamHttp:      return QStringLiteral("transport_error");
    case ErrorKind::StreamTimeout:     return QStringLiteral("stream_timeout");
    case ErrorKind::EncodeFailed:      return QStringLiteral("encode_error");
    case ErrorKind::Internal:
    default:                           return QStringLiteral("internal_error");
    }
}

QString DomainFailure::subkindName() const {
    switch (kind) {
    case ErrorKind::ConnectFailed:     return QStringLiteral("connect_failed");
    case ErrorKind::TlsVerifyFailed:   return QStringLiteral("tls_verify_failed");
    case ErrorKind::UpstreamTimeout:   return QStringLiteral("timeout");
    case ErrorKind::UpstreamHttp:      return QStringLiteral("upstream_http_error");
    default:                           return QString();
    }
}

QJsonObject DomainFailure::errorObject() const {
    QJsonObject err;
    err["type"] = typeName();
    const QString subkind = subkindName();
    if (!subkind.isEmpty())
        err["subkind"] = subkind;
    err["code"] = code;
    err["message"] = message;
    if (upstreamStatus > 0)
        err["upstream_status"] = upstreamStatus;
    return err;
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject root;
    root["error"] = errorObject();
    return root;
}

DomainFailure DomainFailure::unroutable(const QString& msg) {
    return {ErrorKind::Unroutable, "unroutable", msg, false, false, 0};
}

DomainFailure DomainFailure::decodeFailed(const QString& code, const QString& msg) {
    return {ErrorKind::DecodeFailed, code, msg, false, false, 0};
}

DomainFailure DomainFailure::invalidParameter(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidParameter, code, msg, false, false, 0};
}

DomainFailure DomainFailure::connectFailed(const QString& msg) {
    return {ErrorKind::ConnectFailed, "connect_failed", msg, true, true, 0};
}

DomainFailure DomainFailure::tlsVerifyFailed(const QString& msg) {
    return {ErrorKind::TlsVerifyFailed, "tls_verify_failed", msg, false, false, 0};
}

DomainFailure DomainFailure::upstreamTimeout(const QString& msg) {
    return {ErrorKind::UpstreamTimeout, "timeout", msg, true, true, 0};
}

DomainFailure DomainFailure::upstreamHttp(int status, const QString& code, const QString& msg) {
    const bool retryable = status == 408 || status == 429 || status == 500
        || status == 502 || status == 503 || status == 504 || status == 529;
    return {ErrorKind::UpstreamHttp,
            code.isEmpty() ? QStringLiteral("upstream_http_error") : code,
            msg, retryable, retryable, status};
}

DomainFailure DomainFailure::streamTimeout(const QString& msg) {
    return {ErrorKind::StreamTimeout, "stream_timeout", msg, false, true, 0};
}

DomainFailure DomainFailure::encodeFailed(const QString& code, const QString& msg) {
    return {ErrorKind::EncodeFailed, code, msg, false, false, 0};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false, 0};
}
