#include "transport_config.h"
#include "core/log_manager.h"
#include <QFile>
#include <QSslSocket>

namespace {

QString envValue(const QProcessEnvironment& env, const QString& name)
{
    QString value = env.value(name).trimmed();
    if (value.isEmpty())
        value = env.value(name.toLower()).trimmed();
    return value;
}

class TransportProxyFactory : public QNetworkProxyFactory {
public:
    explicit TransportProxyFactory(const TransportConfig& config)
        : m_config(config)
    {
    }

    QList<QNetworkProxy> queryProxy(const QNetworkProxyQuery& query) override
    {
        return {m_config.proxyFor(query.url())};
    }

private:
    TransportConfig m_config;
};

}

Result<QNetworkProxy> TransportConfig::parseProxyUrl(const QString& value)
{
    QString text = value.trimmed();
    if (!text.contains(QStringLiteral("://")))
        text.prepend(QStringLiteral("http://"));

    const QUrl url(text, QUrl::StrictMode);
    const QString scheme = url.scheme().toLower();
    if (!url.isValid() || url.host().isEmpty()) {
        return std::unexpected(DomainFailure::invalidParameter(
            QStringLiteral("invalid_proxy_url"),
            QStringLiteral("Cannot parse proxy URL '%1'").arg(value)));
    }

    QNetworkProxy proxy;
    if (scheme == QLatin1String("http") || scheme == QLatin1String("https")) {
        proxy.setType(QNetworkProxy::HttpProxy);
        proxy.setPort(static_cast<quint16>(url.port(scheme == QLatin1String("https") ? 443 : 80)));
    } else if (scheme == QLatin1String("socks5") || scheme == QLatin1String("socks5h")) {
        proxy.setType(QNetworkProxy::Socks5Proxy);
        proxy.setPort(static_cast<quint16>(url.port(1080)));
        // socks5 resolves names locally, socks5h on the proxy.
        QNetworkProxy::Capabilities caps = proxy.capabilities();
        if (scheme == QLatin1String("socks5"))
            caps &= ~QNetworkProxy::HostNameLookupCapability;
        else
            caps |= QNetworkProxy::HostNameLookupCapability;
        proxy.setCapabilities(caps);
    } else {
        return std::unexpected(DomainFailure::invalidParameter(
            QStringLiteral("invalid_proxy_url"),
            QStringLiteral("Unsupported proxy scheme '%1' in '%2'").arg(scheme, value)));
    }

    proxy.setHostName(url.host());
    if (!url.userName().isEmpty()) {
        proxy.setUser(url.userName(QUrl::FullyDecoded));
        proxy.setPassword(url.password(QUrl::FullyDecoded));
    }
    return proxy;
}

Result<TransportConfig> TransportConfig::fromEnvironment(const QProcessEnvironment& env)
{
    TransportConfig config;

    struct Slot {
        const char* name;
        QNetworkProxy* target;
    };
    const Slot proxyVars[] = {
        {"HTTP_PROXY", &config.m_httpProxy},
        {"HTTPS_PROXY", &config.m_httpsProxy},
        {"ALL_PROXY", &config.m_allProxy},
    };
    for (const Slot& slot : proxyVars) {
        const QString value = envValue(env, QLatin1String(slot.name));
        if (value.isEmpty())
            continue;
        Result<QNetworkProxy> proxy = parseProxyUrl(value);
        if (!proxy) return std::unexpected(proxy.error());
        *slot.target = *proxy;
        LOG_INFO(QStringLiteral("Transport: %1 -> %2:%3")
                     .arg(QLatin1String(slot.name), proxy->hostName())
                     .arg(proxy->port()));
    }

    for (const QString& entry : envValue(env, QStringLiteral("NO_PROXY")).split(QLatin1Char(','))) {
        const QString host = entry.trimmed().toLower();
        if (!host.isEmpty())
            config.m_noProxy.append(host);
    }

    QString bundle = env.value(QStringLiteral("REQUESTS_CA_BUNDLE")).trimmed();
    if (bundle.isEmpty())
        bundle = env.value(QStringLiteral("SSL_CERT_FILE")).trimmed();
    if (!bundle.isEmpty()) {
        QFile file(bundle);
        if (!file.open(QIODevice::ReadOnly)) {
            return std::unexpected(DomainFailure::invalidParameter(
                QStringLiteral("invalid_ca_bundle"),
                QStringLiteral("Cannot read CA bundle '%1': %2").arg(bundle, file.errorString())));
        }
        const QList<QSslCertificate> certs = QSslCertificate::fromData(file.readAll(), QSsl::Pem);
        if (certs.isEmpty()) {
            return std::unexpected(DomainFailure::invalidParameter(
                QStringLiteral("invalid_ca_bundle"),
                QStringLiteral("CA bundle '%1' contains no PEM certificates").arg(bundle)));
        }
        config.m_caBundlePath = bundle;
        config.m_caCertificates = certs;
        LOG_INFO(QStringLiteral("Transport: using CA bundle %1 (%2 certificates)")
                     .arg(bundle)
                     .arg(certs.size()));
    }

    const QString verify = env.value(QStringLiteral("SSL_VERIFY")).trimmed().toLower();
    if (verify == QLatin1String("0") || verify == QLatin1String("false")
        || verify == QLatin1String("no") || verify == QLatin1String("off")) {
        config.m_verifyPeer = false;
        LOG_WARNING(QStringLiteral("Transport: SSL_VERIFY is off, upstream certificates are not verified"));
    }

    return config;
}

bool TransportConfig::hasProxy() const
{
    return m_httpProxy.type() != QNetworkProxy::NoProxy
        || m_httpsProxy.type() != QNetworkProxy::NoProxy
        || m_allProxy.type() != QNetworkProxy::NoProxy;
}

bool TransportConfig::bypassesProxy(const QString& host) const
{
    const QString h = host.toLower();
    for (const QString& entry : m_noProxy) {
        if (entry == QLatin1String("*"))
            return true;
        QString suffix = entry;
        if (suffix.startsWith(QLatin1Char('.')))
            suffix.remove(0, 1);
        if (h == suffix || h.endsWith(QLatin1Char('.') + suffix))
            return true;
    }
    return false;
}

QNetworkProxy TransportConfig::proxyFor(const QUrl& url) const
{
    if (bypassesProxy(url.host()))
        return QNetworkProxy(QNetworkProxy::NoProxy);

    const QNetworkProxy& own = url.scheme().toLower() == QLatin1String("https")
        ? m_httpsProxy : m_httpProxy;
    if (own.type() != QNetworkProxy::NoProxy)
        return own;
    return m_allProxy;
}

QSslConfiguration TransportConfig::sslConfiguration() const
{
    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    if (!m_caCertificates.isEmpty())
        ssl.setCaCertificates(m_caCertificates);
    if (!m_verifyPeer)
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
    return ssl;
}

QNetworkProxyFactory* TransportConfig::createProxyFactory() const
{
    return new TransportProxyFactory(*this);
}
