#include <QCoreApplication>
#include <QCommandLineParser>
#include <QProcessEnvironment>

#include "config/config_store.h"
#include "config/transport_config.h"
#include "core/gateway.h"
#include "core/log_manager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ccproxy"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("LLM API gateway translating between provider wire formats"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringLiteral("config"), QStringLiteral("JSON configuration file."), QStringLiteral("file"));
    const QCommandLineOption portOption(
        QStringLiteral("port"), QStringLiteral("Listen port (overrides listen.port)."), QStringLiteral("n"));
    const QCommandLineOption hostOption(
        QStringLiteral("host"), QStringLiteral("Listen address (overrides listen.host)."), QStringLiteral("addr"));
    const QCommandLineOption debugOption(
        QStringLiteral("debug"), QStringLiteral("Log at debug level."));
    const QCommandLineOption logDirOption(
        QStringLiteral("log-dir"), QStringLiteral("Directory for ccproxy.log."), QStringLiteral("dir"));
    parser.addOptions({configOption, portOption, hostOption, debugOption, logDirOption});
    parser.process(app);

    // --- 1. Config ---
    ConfigStore configStore;
    if (!configStore.load(parser.value(configOption))) {
        LOG_ERROR(QStringLiteral("Configuration error: %1").arg(configStore.lastError()));
        return 1;
    }
    ProxyConfig config = configStore.proxyConfig();

    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            LOG_ERROR(QStringLiteral("Invalid --port value: %1").arg(parser.value(portOption)));
            return 1;
        }
        config.listen.port = port;
    }
    if (parser.isSet(hostOption))
        config.listen.host = parser.value(hostOption);
    if (parser.isSet(debugOption))
        config.runtime.debugMode = true;
    if (parser.isSet(logDirOption))
        config.runtime.logDir = parser.value(logDirOption);

    // --- 2. Log ---
    LogManager& logs = LogManager::instance();
    logs.setMinimumLevel(config.runtime.debugMode ? LogManager::Debug : LogManager::Info);
    if (!logs.initialize(config.runtime.logDir)) {
        LOG_WARNING(QStringLiteral("Logging to stderr only"));
    } else if (!logs.logFilePath().isEmpty()) {
        LOG_INFO(QStringLiteral("Logging to %1").arg(logs.logFilePath()));
    }
    LOG_INFO(QStringLiteral("ccproxy %1 starting").arg(app.applicationVersion()));

    // --- 3. Transport ---
    Result<TransportConfig> transport =
        TransportConfig::fromEnvironment(QProcessEnvironment::systemEnvironment());
    if (!transport) {
        LOG_ERROR(QStringLiteral("Transport configuration error: %1").arg(transport.error().message));
        return 1;
    }

    // --- 4. Gateway ---
    Gateway gateway(config, *transport);
    if (!gateway.start()) {
        LOG_ERROR(QStringLiteral("Startup failed: %1").arg(gateway.lastError()));
        return 1;
    }

    const int rc = app.exec();
    gateway.stop();
    LOG_INFO(QStringLiteral("ccproxy stopped"));
    return rc;
}
