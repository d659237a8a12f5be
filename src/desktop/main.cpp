#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QSystemTrayIcon>

#include <memory>

#include <nlohmann/json.hpp>

#include "commands/command_facade.hpp"
#include "commands/command_server.hpp"
#include "common/logging.hpp"
#include "config/config_store.hpp"
#include "desktop/BridgeTray.hpp"
#include "desktop/autostart.hpp"
#include "supervisor/process_supervisor.hpp"

using namespace officebridge;

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("office-bridge-desktop"));
    QApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption noBridgeOption(QStringList() << "no-bridge",
                                      "Do not start the bridge service on launch.");
    QCommandLineOption noTrayOption(QStringList() << "no-tray",
                                    "Run without a system tray icon.");
    parser.addOption(traceOption);
    parser.addOption(noBridgeOption);
    parser.addOption(noTrayOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("OFFICE_BRIDGE_TRACE") == 1;
    logging::initLogging(QStringLiteral("office-bridge-desktop"), trace);
    OBLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("desktop_start"),
               QStringLiteral("user_start"),
               QStringLiteral("qt_app"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"noBridge", parser.isSet(noBridgeOption)},
                               {"noTray", parser.isSet(noTrayOption)}}));

    ConfigStore store;
    ProcessSupervisor supervisor;
    Autostart autostart;
    CommandFacade facade(store, supervisor, autostart);

    CommandServer server(facade);
    if (!server.start()) {
        qWarning() << "Command socket unavailable:" << CommandServer::socketPath();
    }

    if (!parser.isSet(noBridgeOption)) {
        const CommandResponse<BridgeStatus> status = facade.getBridgeStatus();
        if (!status.data || !status.data->running) {
            OBLOG_INFO(QStringLiteral("main"),
                       QStringLiteral("main"),
                       QStringLiteral("auto_start_bridge"),
                       QStringLiteral("desktop_start"),
                       QStringLiteral("best_effort"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json::object());
            const CommandResponse<bool> started = facade.startBridgeService();
            if (!started.success) {
                qWarning() << "Bridge service did not start:"
                           << QString::fromStdString(started.error.value_or(std::string()));
            }
        }
    }

    std::unique_ptr<BridgeTray> tray;
    if (!parser.isSet(noTrayOption)) {
        if (QSystemTrayIcon::isSystemTrayAvailable()) {
            app.setQuitOnLastWindowClosed(false);
            tray = std::make_unique<BridgeTray>(facade);
        } else {
            qWarning() << "System tray not available. Running headless.";
        }
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&supervisor]() {
        if (!supervisor.isRunning()) {
            return;
        }
        const Status stopped = supervisor.stop();
        if (stopped) {
            OBLOG_ERROR(QStringLiteral("main"),
                        QStringLiteral("aboutToQuit"),
                        QStringLiteral("bridge_stop_failed"),
                        QString::fromStdString(toErrorKindString(stopped->kind)),
                        QStringLiteral("shutdown"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"error", stopped->message}}));
        }
    });

    return app.exec();
}
