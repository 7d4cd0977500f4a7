#pragma once
#include "config_types.h"
#include <QObject>
#include <QJsonObject>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // A missing file yields the built-in defaults; an unreadable or
    // malformed one fails with lastError() set.
    bool load(const QString& path);
    bool save();

    QString lastError() const { return m_lastError; }
    QString filePath() const { return m_filePath; }

    const ProxyConfig& proxyConfig() const { return m_config; }
    void setProxyConfig(const ProxyConfig& config);

    RuntimeOptions runtimeConfig() const { return m_config.runtime; }
    void setRuntimeOptions(const RuntimeOptions& runtime);
    void setListenOptions(const ListenOptions& listen);

signals:
    void configChanged();

private:
    ProxyConfig m_config = ProxyConfig::defaults();
    QString m_filePath;
    QString m_lastError;

    static QJsonObject upstreamToJson(const UpstreamConfig& u);
    static UpstreamConfig jsonToUpstream(const QJsonObject& obj);
    static QJsonObject bindingToJson(const BindingConfig& b);
    static BindingConfig jsonToBinding(const QJsonObject& obj);
};
