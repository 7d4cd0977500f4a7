#pragma once
#include "failure.h"
#include <QNetworkReply>

// Maps Qt network failures onto the transport taxonomy.
namespace TransportErrors {
    DomainFailure fromNetworkError(QNetworkReply::NetworkError code, const QString& detail);
    DomainFailure fromReply(const QNetworkReply* reply);
    bool isHttpStatusError(QNetworkReply::NetworkError code);
}
