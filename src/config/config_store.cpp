#include "config_store.h"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = QString())
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

QMap<QString, QString> stringMap(const QJsonObject& obj)
{
    QMap<QString, QString> map;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it)
        map.insert(it.key(), it.value().toString());
    return map;
}

QJsonObject stringMapToJson(const QMap<QString, QString>& map)
{
    QJsonObject obj;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it)
        obj[it.key()] = it.value();
    return obj;
}

BindingConfig binding(const QString& path, const QString& format,
                      const QString& upstream, const QString& upstreamFormat = QString())
{
    BindingConfig b;
    b.path = path;
    b.format = format;
    b.upstream = upstream;
    b.upstreamFormat = upstreamFormat;
    return b;
}

}

QString streamModeName(StreamMode mode)
{
    switch (mode) {
    case StreamMode::ForceOn:  return QStringLiteral("always");
    case StreamMode::ForceOff: return QStringLiteral("never");
    case StreamMode::FollowClient: break;
    }
    return QStringLiteral("follow");
}

StreamMode streamModeFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("always")) return StreamMode::ForceOn;
    if (n == QLatin1String("never"))  return StreamMode::ForceOff;
    return StreamMode::FollowClient;
}

ProxyConfig ProxyConfig::defaults()
{
    ProxyConfig config;

    UpstreamConfig anthropic;
    anthropic.name = QStringLiteral("anthropic");
    anthropic.format = QStringLiteral("anthropic");
    anthropic.baseUrl = QStringLiteral("https://api.anthropic.com/v1");
    config.upstreams.append(anthropic);

    UpstreamConfig codex;
    codex.name = QStringLiteral("codex");
    codex.format = QStringLiteral("codex");
    codex.baseUrl = QStringLiteral("https://chatgpt.com/backend-api/codex");
    codex.streamMode = StreamMode::ForceOn;
    config.upstreams.append(codex);

    config.bindings.append(binding(QStringLiteral("/v1/messages"),
                                   QStringLiteral("anthropic"), QStringLiteral("anthropic")));
    config.bindings.append(binding(QStringLiteral("/openai/v1/chat/completions"),
                                   QStringLiteral("openai.native"), QStringLiteral("anthropic")));
    config.bindings.append(binding(QStringLiteral("/cc/openai/v1/chat/completions"),
                                   QStringLiteral("openai"), QStringLiteral("anthropic")));
    config.bindings.append(binding(QStringLiteral("/codex/responses"),
                                   QStringLiteral("codex"), QStringLiteral("codex")));
    return config;
}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    m_lastError.clear();
    m_config = ProxyConfig::defaults();

    if (m_filePath.isEmpty() || !QFileInfo::exists(m_filePath)) {
        emit configChanged();
        return true;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_lastError = QStringLiteral("%1 is not a JSON object: %2")
                          .arg(m_filePath, parseError.errorString());
        return false;
    }
    const QJsonObject root = doc.object();

    // listen
    const QJsonObject l = root["listen"].toObject();
    m_config.listen.host = jsonStringEither(l, "host", "host", m_config.listen.host);
    m_config.listen.port = jsonIntEither(l, "port", "port", m_config.listen.port);
    m_config.listen.tlsCert = jsonStringEither(l, "tls_cert", "tlsCert");
    m_config.listen.tlsKey = jsonStringEither(l, "tls_key", "tlsKey");

    // runtime
    const QJsonObject rt = root["runtime"].toObject();
    RuntimeOptions& r = m_config.runtime;
    r.requestTimeout = jsonIntEither(rt, "request_timeout_ms", "requestTimeoutMs", r.requestTimeout);
    r.connectionTimeout = jsonIntEither(rt, "connect_timeout_ms", "connectTimeoutMs", r.connectionTimeout);
    r.streamIdleTimeout = jsonIntEither(rt, "stream_idle_timeout_ms", "streamIdleTimeoutMs", r.streamIdleTimeout);
    r.connectionPoolSize = jsonIntEither(rt, "pool_size", "poolSize", r.connectionPoolSize);
    r.maxAttempts = qMax(1, jsonIntEither(rt, "max_attempts", "maxAttempts", r.maxAttempts));
    r.debugMode = jsonBoolEither(rt, "debug", "debug", r.debugMode);
    r.logDir = jsonStringEither(rt, "log_dir", "logDir", r.logDir);

    // upstreams and bindings replace the defaults when present
    if (root.contains("upstreams")) {
        m_config.upstreams.clear();
        for (const QJsonValue& uv : root["upstreams"].toArray())
            m_config.upstreams.append(jsonToUpstream(uv.toObject()));
    }
    if (root.contains("bindings")) {
        m_config.bindings.clear();
        for (const QJsonValue& bv : root["bindings"].toArray())
            m_config.bindings.append(jsonToBinding(bv.toObject()));
    }

    m_config.modelMap = stringMap(jsonValueEither(root, "model_map", "modelMap").toObject());

    for (const UpstreamConfig& u : std::as_const(m_config.upstreams)) {
        if (!u.isValid()) {
            m_lastError = QStringLiteral("Upstream '%1' needs a name, format and base_url").arg(u.name);
            return false;
        }
    }
    for (const BindingConfig& b : std::as_const(m_config.bindings)) {
        if (!m_config.upstream(b.upstream)) {
            m_lastError = QStringLiteral("Binding %1 names unknown upstream '%2'").arg(b.path, b.upstream);
            return false;
        }
    }

    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QJsonObject root;
    root["version"] = 1;

    QJsonObject l;
    l["host"] = m_config.listen.host;
    l["port"] = m_config.listen.port;
    if (!m_config.listen.tlsCert.isEmpty())
        l["tls_cert"] = m_config.listen.tlsCert;
    if (!m_config.listen.tlsKey.isEmpty())
        l["tls_key"] = m_config.listen.tlsKey;
    root["listen"] = l;

    QJsonObject rt;
    rt["request_timeout_ms"] = m_config.runtime.requestTimeout;
    rt["connect_timeout_ms"] = m_config.runtime.connectionTimeout;
    rt["stream_idle_timeout_ms"] = m_config.runtime.streamIdleTimeout;
    rt["pool_size"] = m_config.runtime.connectionPoolSize;
    rt["max_attempts"] = m_config.runtime.maxAttempts;
    rt["debug"] = m_config.runtime.debugMode;
    if (!m_config.runtime.logDir.isEmpty())
        rt["log_dir"] = m_config.runtime.logDir;
    root["runtime"] = rt;

    QJsonArray upstreams;
    for (const auto& u : m_config.upstreams)
        upstreams.append(upstreamToJson(u));
    root["upstreams"] = upstreams;

    QJsonArray bindings;
    for (const auto& b : m_config.bindings)
        bindings.append(bindingToJson(b));
    root["bindings"] = bindings;

    root["model_map"] = stringMapToJson(m_config.modelMap);

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

void ConfigStore::setProxyConfig(const ProxyConfig& config) {
    m_config = config;
    emit configChanged();
}

void ConfigStore::setRuntimeOptions(const RuntimeOptions& runtime) {
    m_config.runtime = runtime;
    emit configChanged();
}

void ConfigStore::setListenOptions(const ListenOptions& listen) {
    m_config.listen = listen;
    emit configChanged();
}

QJsonObject ConfigStore::upstreamToJson(const UpstreamConfig& u) {
    QJsonObject obj;
    obj["name"] = u.name;
    obj["format"] = u.format;
    obj["base_url"] = u.baseUrl;
    if (!u.apiKey.isEmpty())
        obj["api_key"] = u.apiKey;
    if (!u.headers.isEmpty())
        obj["headers"] = stringMapToJson(u.headers);
    obj["stream"] = streamModeName(u.streamMode);
    return obj;
}

UpstreamConfig ConfigStore::jsonToUpstream(const QJsonObject& obj) {
    UpstreamConfig u;
    u.name = obj["name"].toString();
    u.format = obj["format"].toString().trimmed().toLower();
    u.baseUrl = jsonStringEither(obj, "base_url", "baseUrl");
    u.apiKey = jsonStringEither(obj, "api_key", "apiKey");
    u.headers = stringMap(obj["headers"].toObject());
    u.streamMode = streamModeFromName(obj["stream"].toString());
    return u;
}

QJsonObject ConfigStore::bindingToJson(const BindingConfig& b) {
    QJsonObject obj;
    obj["path"] = b.path;
    obj["method"] = b.method;
    obj["match"] = b.prefix ? QStringLiteral("prefix") : QStringLiteral("exact");
    obj["format"] = b.format;
    obj["upstream"] = b.upstream;
    if (!b.upstreamFormat.isEmpty())
        obj["upstream_format"] = b.upstreamFormat;
    return obj;
}

BindingConfig ConfigStore::jsonToBinding(const QJsonObject& obj) {
    BindingConfig b;
    b.path = obj["path"].toString();
    b.method = obj["method"].toString(QStringLiteral("POST")).toUpper();
    b.prefix = obj["match"].toString() == QLatin1String("prefix");
    b.format = obj["format"].toString().trimmed().toLower();
    b.upstream = obj["upstream"].toString();
    b.upstreamFormat = jsonStringEither(obj, "upstream_format", "upstreamFormat").trimmed().toLower();
    return b;
}
