#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QProcessEnvironment>

#include "config/config_store.h"
#include "core/log_manager.h"
#include "gateway/cors_policy.h"
#include "gateway/gateway_dispatcher.h"
#include "gateway/gateway_server.h"
#include "gateway/router_registry.h"
#include "gateway/source_catalog.h"
#include "upstream/qt_upstream_client.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("devgate"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Developer platform aggregation gateway"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption hostOption(QStringLiteral("host"),
                                        QStringLiteral("Address to listen on."),
                                        QStringLiteral("address"));
    const QCommandLineOption portOption(QStringLiteral("port"),
                                        QStringLiteral("Port to listen on."),
                                        QStringLiteral("port"));
    const QCommandLineOption envFileOption(QStringLiteral("env-file"),
                                           QStringLiteral("Dotenv file with credentials."),
                                           QStringLiteral("path"),
                                           QStringLiteral(".env"));
    const QCommandLineOption logDirOption(QStringLiteral("log-dir"),
                                          QStringLiteral("Directory for devgate.log."),
                                          QStringLiteral("dir"));
    const QCommandLineOption debugOption(QStringLiteral("debug"),
                                         QStringLiteral("Enable debug logging."));
    parser.addOptions({hostOption, portOption, envFileOption, logDirOption, debugOption});
    parser.process(app);

    // --- 2. Config ---
    ConfigStore configStore;
    const QString envFile = parser.value(envFileOption);
    const bool envFileLoaded = configStore.loadDotEnv(envFile);
    configStore.loadEnvironment(QProcessEnvironment::systemEnvironment());
    if (parser.isSet(hostOption))
        configStore.setOverride(config_keys::kHost, parser.value(hostOption));
    if (parser.isSet(portOption))
        configStore.setOverride(config_keys::kPort, parser.value(portOption));
    if (parser.isSet(logDirOption))
        configStore.setOverride(config_keys::kLogDir, parser.value(logDirOption));
    if (parser.isSet(debugOption))
        configStore.setOverride(config_keys::kDebug, QStringLiteral("1"));

    const GatewayConfig& config = configStore.config();

    // --- 3. Log ---
    LogManager::instance().setDebugEnabled(config.server.debugMode);
    LogManager::instance().initialize(config.server.logDir);
    LOG_INFO(QStringLiteral("devgate v%1 starting").arg(app.applicationVersion()));
    if (envFileLoaded) {
        LOG_INFO(QStringLiteral("Loaded settings from %1").arg(QFileInfo(envFile).absoluteFilePath()));
    } else if (parser.isSet(envFileOption)) {
        LOG_WARNING(QStringLiteral("Env file %1 could not be read").arg(envFile));
    }

    // --- 4. Upstream client ---
    QtUpstreamClient upstreamClient(QStringLiteral("devgate/%1").arg(app.applicationVersion()));
    upstreamClient.setRequestTimeout(config.server.upstreamTimeout);

    // --- 5. Sources ---
    RouterRegistry registry;
    source_catalog::registerDefaultSources(registry, upstreamClient, config);

    // --- 6. Server ---
    GatewayDispatcher dispatcher(registry, CorsPolicy(config.server.allowedOrigins));
    GatewayServer server(dispatcher);
    if (!server.start(config.server.host, config.server.port)) {
        return 1;
    }

    return app.exec();
}
