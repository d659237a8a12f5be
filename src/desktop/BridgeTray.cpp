#include "desktop/BridgeTray.hpp"

#include <QAction>
#include <QCoreApplication>
#include <QDesktopServices>
#include <QIcon>
#include <QUrl>
#include <QtConcurrent/QtConcurrentRun>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace officebridge {

namespace {

constexpr int kRefreshIntervalMs = 10 * 1000;

} // namespace

BridgeTray::BridgeTray(CommandFacade &facade, QObject *parent)
    : QObject(parent)
    , m_facade(facade)
{
    OBLOG_INFO(QStringLiteral("BridgeTray"),
               QStringLiteral("BridgeTray"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               QStringLiteral("tray"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    connect(&m_statusWatcher, &QFutureWatcher<TraySnapshot>::finished,
            this, &BridgeTray::onStatusReady);
    connect(&m_toggleWatcher, &QFutureWatcher<CommandResponse<bool>>::finished,
            this, &BridgeTray::onToggleFinished);

    setupTrayIcon();
    setupMenu();
    scheduleRefresh();
}

BridgeTray::~BridgeTray()
{
    m_statusWatcher.waitForFinished();
    m_toggleWatcher.waitForFinished();
}

void BridgeTray::setupTrayIcon()
{
    m_trayIcon.setIcon(QIcon::fromTheme(QStringLiteral("network-server"),
                                        QIcon::fromTheme(QStringLiteral("applications-internet"))));
    m_trayIcon.setToolTip(QStringLiteral("Office Bridge"));

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &BridgeTray::onTrayActivated);

    m_trayIcon.show();
}

void BridgeTray::setupMenu()
{
    m_statusAction = m_menu.addAction(QStringLiteral("Bridge service: Unknown"));
    m_statusAction->setEnabled(false);

    m_startStopAction = m_menu.addAction(QStringLiteral("Start bridge service"));
    connect(m_startStopAction, &QAction::triggered, this, &BridgeTray::toggleBridgeService);

    m_menu.addSeparator();

    m_dashboardAction = m_menu.addAction(QStringLiteral("Open dashboard"));
    connect(m_dashboardAction, &QAction::triggered, this, &BridgeTray::openDashboard);

    m_menu.addSeparator();

    m_quitAction = m_menu.addAction(QStringLiteral("Quit"));
    connect(m_quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon.setContextMenu(&m_menu);
}

void BridgeTray::scheduleRefresh()
{
    m_refreshTimer.setInterval(kRefreshIntervalMs);
    connect(&m_refreshTimer, &QTimer::timeout, this, &BridgeTray::refreshStatus);
    m_refreshTimer.start();

    refreshStatus();
}

void BridgeTray::refreshStatus()
{
    if (m_statusWatcher.isRunning()) {
        return;
    }
    OBLOG_DEBUG(QStringLiteral("BridgeTray"),
                QStringLiteral("refreshStatus"),
                QStringLiteral("fetch_bridge_status"),
                QStringLiteral("timer_tick"),
                QStringLiteral("health_check"),
                logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    m_statusWatcher.setFuture(QtConcurrent::run([this]() {
        TraySnapshot snapshot;
        const CommandResponse<BridgeStatus> response = m_facade.getBridgeStatus();
        if (response.data) {
            snapshot.status = *response.data;
        }
        snapshot.supervised = m_facade.isBridgeServiceSupervised();
        return snapshot;
    }));
}

void BridgeTray::onStatusReady()
{
    applySnapshot(m_statusWatcher.result());
}

// Start/Stop follows supervisor ownership: a service started outside this
// app is shown as running but cannot be stopped from here.
void BridgeTray::applySnapshot(const TraySnapshot &snapshot)
{
    m_last = snapshot;
    const BridgeStatus &status = snapshot.status;

    QString state = QStringLiteral("Stopped");
    if (snapshot.supervised) {
        state = status.running ? QStringLiteral("Running") : QStringLiteral("Starting");
    } else if (status.running) {
        state = QStringLiteral("Running (external)");
    }
    m_statusAction->setText(QStringLiteral("Bridge service: %1").arg(state));

    m_startStopAction->setText(snapshot.supervised
                                   ? QStringLiteral("Stop bridge service")
                                   : QStringLiteral("Start bridge service"));
    m_startStopAction->setEnabled(!m_toggleWatcher.isRunning()
                                  && (snapshot.supervised || !status.running));

    m_trayIcon.setToolTip(status.running
                              ? QStringLiteral("Office Bridge - running on %1")
                                    .arg(QString::fromStdString(status.url))
                              : QStringLiteral("Office Bridge - stopped"));
}

void BridgeTray::toggleBridgeService()
{
    if (m_toggleWatcher.isRunning()) {
        return;
    }

    const bool stopping = m_last.supervised;
    OBLOG_INFO(QStringLiteral("BridgeTray"),
               QStringLiteral("toggleBridgeService"),
               stopping ? QStringLiteral("stop_bridge_service")
                        : QStringLiteral("start_bridge_service"),
               QStringLiteral("user_action"),
               QStringLiteral("tray_menu"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    m_startStopAction->setEnabled(false);
    m_toggleWatcher.setFuture(QtConcurrent::run([this, stopping]() {
        return stopping ? m_facade.stopBridgeService() : m_facade.startBridgeService();
    }));
}

void BridgeTray::onToggleFinished()
{
    m_startStopAction->setEnabled(true);
    const CommandResponse<bool> response = m_toggleWatcher.result();
    if (!response.success) {
        m_trayIcon.showMessage(QStringLiteral("Office Bridge"),
                               QString::fromStdString(response.error.value_or(std::string())),
                               QSystemTrayIcon::Warning);
    }
    refreshStatus();
}

void BridgeTray::openDashboard()
{
    QString url = QString::fromStdString(m_last.status.url);
    if (url.isEmpty()) {
        const CommandResponse<BridgeStatus> response = m_facade.getBridgeStatus();
        if (!response.data) {
            return;
        }
        url = QString::fromStdString(response.data->url);
    }
    OBLOG_INFO(QStringLiteral("BridgeTray"),
               QStringLiteral("openDashboard"),
               QStringLiteral("open_dashboard"),
               QStringLiteral("user_action"),
               QStringLiteral("desktop_services"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"url", url.toStdString()}}));
    QDesktopServices::openUrl(QUrl(url));
}

void BridgeTray::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        refreshStatus();
    } else if (reason == QSystemTrayIcon::DoubleClick) {
        openDashboard();
    }
}

} // namespace officebridge
