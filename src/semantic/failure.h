#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;
    int         upstreamStatus = 0;

    int httpStatus() const;
    QString typeName() const;
    QString subkindName() const;
    QJsonObject toJson() const;
    QJsonObject errorObject() const;

    static DomainFailure unroutable(const QString& msg);
    static DomainFailure decodeFailed(const QString& code, const QString& msg);
    static DomainFailure invalidParameter(const QString& code, const QString& msg);
    static DomainFailure connectFailed(const QString& msg);
    static DomainFailure tlsVerifyFailed(const QString& msg);
    static DomainFailure upstreamTimeout(const QString& msg);
    static DomainFailure upstreamHttp(int status, const QString& code, const QString& msg);
    static DomainFailure streamTimeout(const QString& msg);
    static DomainFailure encodeFailed(const QString& code, const QString& msg);
    static DomainFailure internal(const QString& msg);
};
