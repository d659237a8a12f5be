#pragma once

#include <QFutureWatcher>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <QTimer>

#include "commands/command_facade.hpp"

namespace officebridge {

struct TraySnapshot {
    BridgeStatus status;
    bool supervised = false;
};

// BridgeTray shows the bridge service state in the system tray and offers
// start/stop, the dashboard link and quit.
class BridgeTray : public QObject
{
    Q_OBJECT
public:
    explicit BridgeTray(CommandFacade &facade, QObject *parent = nullptr);
    ~BridgeTray() override;

private slots:
    void refreshStatus();
    void toggleBridgeService();
    void openDashboard();
    void onStatusReady();
    void onToggleFinished();
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void setupTrayIcon();
    void setupMenu();
    void scheduleRefresh();
    void applySnapshot(const TraySnapshot &snapshot);

    CommandFacade &m_facade;
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    QAction *m_statusAction = nullptr;
    QAction *m_startStopAction = nullptr;
    QAction *m_dashboardAction = nullptr;
    QAction *m_quitAction = nullptr;
    QTimer m_refreshTimer;

    QFutureWatcher<TraySnapshot> m_statusWatcher;
    QFutureWatcher<CommandResponse<bool>> m_toggleWatcher;
    TraySnapshot m_last;
};

} // namespace officebridge
