#pragma once
#include "semantic/types.h"
#include <QString>
#include <QStringList>
#include <QMap>
#include <QList>

struct ListenOptions {
    QString host = QStringLiteral("127.0.0.1");
    int port = 8000;
    QString tlsCert;
    QString tlsKey;

    bool useTls() const { return !tlsCert.isEmpty() && !tlsKey.isEmpty(); }
};

struct RuntimeOptions {
    int requestTimeout = 120000;
    int connectionTimeout = 30000;
    int streamIdleTimeout = 60000;
    int connectionPoolSize = 8;
    int maxAttempts = 1;
    bool debugMode = false;
    QString logDir;
};

struct UpstreamConfig {
    QString name;
    QString format;                     // anthropic | openai | openai.responses | codex
    QString baseUrl;
    QString apiKey;                     // empty: forward caller credentials
    QMap<QString, QString> headers;
    StreamMode streamMode = StreamMode::FollowClient;

    bool isValid() const {
        return !name.isEmpty() && !format.isEmpty() && !baseUrl.isEmpty();
    }
};

struct BindingConfig {
    QString path;
    QString method = QStringLiteral("POST");
    bool prefix = false;
    QString format;                     // caller-facing format
    QString upstream;                   // UpstreamConfig::name
    QString upstreamFormat;             // empty: the upstream's own format
};

struct ProxyConfig {
    ListenOptions listen;
    RuntimeOptions runtime;
    QList<UpstreamConfig> upstreams;
    QList<BindingConfig> bindings;
    QMap<QString, QString> modelMap;

    // Built-in endpoints and upstreams used when no file is present.
    static ProxyConfig defaults();

    const UpstreamConfig* upstream(const QString& name) const {
        for (const UpstreamConfig& u : upstreams) {
            if (u.name == name)
                return &u;
        }
        return nullptr;
    }
};

QString streamModeName(StreamMode mode);
StreamMode streamModeFromName(const QString& name);
