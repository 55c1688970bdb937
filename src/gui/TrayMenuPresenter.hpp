// src/gui/TrayMenuPresenter.hpp
#pragma once
#include <bluetray/Types.hpp>
#include <QSystemTrayIcon>
#include <memory>

namespace bluetray {

class ConfigManager;
class ConnectionCoordinator;
class DeviceRegistry;
struct MenuEntry;

class TrayMenuPresenter : public QSystemTrayIcon {
    Q_OBJECT

public:
    TrayMenuPresenter(DeviceRegistry& registry,
                      ConnectionCoordinator& coordinator,
                      const ConfigManager& config,
                      QObject* parent = nullptr);
    ~TrayMenuPresenter() override;

public slots:
    void redraw();

private slots:
    void scheduleRedraw();
    void handleActivated(QSystemTrayIcon::ActivationReason reason);
    void handleOperationFinished(const bluetray::DeviceAddress& address,
                                 bluetray::ConnectionState state);
    void handleOperationFailed(const bluetray::DeviceAddress& address,
                               const QString& reason);
    void showAbout();

private:
    void createMenu();
    void triggerEntry(const MenuEntry& entry);
    void showNotification(const QString& title, const QString& message,
                          QSystemTrayIcon::MessageIcon icon);

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace bluetray
