#pragma once
#include "semantic/ports.h"
#include <QList>
#include <QNetworkProxy>
#include <QNetworkProxyFactory>
#include <QProcessEnvironment>
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QStringList>
#include <QUrl>

// Proxy and TLS settings every upstream request goes through, read from
// the process environment at startup.
class TransportConfig {
public:
    TransportConfig() = default;

    // HTTP_PROXY / HTTPS_PROXY / ALL_PROXY (lower-case fallbacks), NO_PROXY,
    // REQUESTS_CA_BUNDLE then SSL_CERT_FILE, SSL_VERIFY.
    static Result<TransportConfig> fromEnvironment(const QProcessEnvironment& env);

    static Result<QNetworkProxy> parseProxyUrl(const QString& value);

    QNetworkProxy proxyFor(const QUrl& url) const;
    QSslConfiguration sslConfiguration() const;

    // Owned by the caller, typically handed to QNetworkAccessManager.
    QNetworkProxyFactory* createProxyFactory() const;

    bool verifyPeer() const { return m_verifyPeer; }
    QString caBundlePath() const { return m_caBundlePath; }
    int caCertificateCount() const { return m_caCertificates.size(); }
    QStringList noProxy() const { return m_noProxy; }
    bool hasProxy() const;

private:
    bool bypassesProxy(const QString& host) const;

    QNetworkProxy m_httpProxy{QNetworkProxy::NoProxy};
    QNetworkProxy m_httpsProxy{QNetworkProxy::NoProxy};
    QNetworkProxy m_allProxy{QNetworkProxy::NoProxy};
    QStringList m_noProxy;
    QString m_caBundlePath;
    QList<QSslCertificate> m_caCertificates;
    bool m_verifyPeer = true;
};
