// src/gui/TrayMenuPresenter.cpp
#include "TrayMenuPresenter.hpp"
#include "TrayMenuModel.hpp"
#include "../core/ConnectionCoordinator.hpp"
#include "../core/DeviceRegistry.hpp"
#include "../core/Logger.hpp"
#include "../utils/ConfigManager.hpp"
#include <bluetray/Constants.hpp>
#include <QAction>
#include <QApplication>
#include <QCursor>
#include <QMenu>
#include <QMessageBox>
#include <QPainter>
#include <QPen>
#include <QPointF>
#include <QPixmap>
#include <QTimer>

namespace bluetray {

namespace {

QIcon makeIcon(const QColor& color) {
    QPixmap pixmap(32, 32);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(color);
    painter.drawEllipse(2, 2, 28, 28);

    // Bluetooth rune
    QPen pen(Qt::white, 2.5);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    const QPointF rune[] = {
        {10, 11}, {21, 21}, {16, 26}, {16, 6}, {21, 11}, {10, 21}
    };
    painter.drawPolyline(rune, 6);

    return QIcon(pixmap);
}

} // namespace

class TrayMenuPresenter::Private {
public:
    Private(DeviceRegistry& reg, ConnectionCoordinator& coord, const ConfigManager& cfg)
        : registry(reg), coordinator(coord), config(cfg), model(&cfg) {}

    DeviceRegistry& registry;
    ConnectionCoordinator& coordinator;
    const ConfigManager& config;
    TrayMenuModel model;

    std::unique_ptr<QMenu> trayMenu;
    QAction* devicesEnd{nullptr};
    std::vector<QAction*> deviceActions;
    bool redrawPending{false};

    QIcon idleIcon{makeIcon(QColor(0x80, 0x80, 0x80))};
    QIcon connectedIcon{makeIcon(QColor(0x00, 0x78, 0xd4))};
    QIcon failedIcon{makeIcon(QColor(0xc4, 0x2b, 0x1c))};
};

TrayMenuPresenter::TrayMenuPresenter(DeviceRegistry& registry,
                                     ConnectionCoordinator& coordinator,
                                     const ConfigManager& config,
                                     QObject* parent)
    : QSystemTrayIcon(parent)
    , d(std::make_unique<Private>(registry, coordinator, config)) {

    setIcon(d->idleIcon);
    setToolTip(QString::fromLatin1(APPLICATION_NAME));

    createMenu();

    connect(this, &QSystemTrayIcon::activated,
            this, &TrayMenuPresenter::handleActivated);

    connect(&registry, &DeviceRegistry::changed,
            this, &TrayMenuPresenter::scheduleRedraw);
    connect(&config, &ConfigManager::deviceConfigChanged,
            this, &TrayMenuPresenter::scheduleRedraw);
    connect(&coordinator, &ConnectionCoordinator::operationFinished,
            this, &TrayMenuPresenter::handleOperationFinished);
    connect(&coordinator, &ConnectionCoordinator::operationFailed,
            this, &TrayMenuPresenter::handleOperationFailed);

    redraw();
}

TrayMenuPresenter::~TrayMenuPresenter() {
    setContextMenu(nullptr);
}

void TrayMenuPresenter::createMenu() {
    d->trayMenu = std::make_unique<QMenu>();

    auto aboutAction = d->trayMenu->addAction(
        QStringLiteral("About %1").arg(QString::fromLatin1(APPLICATION_NAME)));
    connect(aboutAction, &QAction::triggered, this, &TrayMenuPresenter::showAbout);
    d->trayMenu->addSeparator();

    // Device entries are inserted in front of this separator
    d->devicesEnd = d->trayMenu->addSeparator();

    auto refreshAction = d->trayMenu->addAction(QStringLiteral("Refresh devices"));
    connect(refreshAction, &QAction::triggered,
            &d->coordinator, &ConnectionCoordinator::refresh);

    auto quitAction = d->trayMenu->addAction(QStringLiteral("Quit"));
    connect(quitAction, &QAction::triggered, qApp, &QApplication::quit);

    setContextMenu(d->trayMenu.get());
}

void TrayMenuPresenter::scheduleRedraw() {
    // Bursts of registry changes collapse into one rebuild
    if (d->redrawPending) {
        return;
    }
    d->redrawPending = true;
    QTimer::singleShot(0, this, &TrayMenuPresenter::redraw);
}

void TrayMenuPresenter::redraw() {
    d->redrawPending = false;

    for (QAction* action : d->deviceActions) {
        d->trayMenu->removeAction(action);
        action->deleteLater();
    }
    d->deviceActions.clear();

    const auto devices = d->registry.list();
    const auto entries = d->model.build(devices);

    bool anyConnected = false;
    bool anyFailed = false;

    if (entries.empty()) {
        auto placeholder = new QAction(QStringLiteral("No paired devices"), d->trayMenu.get());
        placeholder->setEnabled(false);
        d->trayMenu->insertAction(d->devicesEnd, placeholder);
        d->deviceActions.push_back(placeholder);
    }

    for (const auto& entry : entries) {
        auto action = new QAction(entry.label, d->trayMenu.get());
        action->setCheckable(true);
        action->setChecked(entry.checked);
        action->setEnabled(entry.enabled);
        if (entry.failed) {
            action->setIcon(d->failedIcon);
        }

        connect(action, &QAction::triggered, this, [this, entry]() {
            triggerEntry(entry);
        });

        d->trayMenu->insertAction(d->devicesEnd, action);
        d->deviceActions.push_back(action);

        anyConnected = anyConnected || entry.checked;
        anyFailed = anyFailed || entry.failed;
    }

    setIcon(anyFailed ? d->failedIcon : anyConnected ? d->connectedIcon : d->idleIcon);
    setToolTip(d->model.tooltip(devices));
}

void TrayMenuPresenter::triggerEntry(const MenuEntry& entry) {
    RequestStatus status = RequestStatus::Accepted;
    switch (entry.action) {
        case MenuAction::Connect:
            status = d->coordinator.requestConnect(entry.address);
            break;
        case MenuAction::Disconnect:
            status = d->coordinator.requestDisconnect(entry.address);
            break;
        case MenuAction::None:
            return;
    }

    if (status != RequestStatus::Accepted) {
        LOG_DEBUG("Menu request for " + entry.address.toString() + " returned " +
                  toString(status));
        // The entry was stale; show the current state again
        scheduleRedraw();
    }
}

void TrayMenuPresenter::handleActivated(QSystemTrayIcon::ActivationReason reason) {
    switch (reason) {
        case QSystemTrayIcon::Trigger:
            // Left click opens the same menu as right click
            d->trayMenu->popup(QCursor::pos());
            break;

        case QSystemTrayIcon::MiddleClick:
            d->coordinator.refresh();
            break;

        default:
            break;
    }
}

void TrayMenuPresenter::handleOperationFinished(const DeviceAddress& address,
                                                ConnectionState state) {
    if (state != ConnectionState::Connected) {
        return;
    }
    auto device = d->registry.get(address);
    if (device) {
        showNotification(QStringLiteral("Connected"),
                         QString::fromStdString(device->name),
                         QSystemTrayIcon::Information);
    }
}

void TrayMenuPresenter::handleOperationFailed(const DeviceAddress& address,
                                              const QString& reason) {
    auto device = d->registry.get(address);
    QString name = device ? QString::fromStdString(device->name)
                          : QString::fromStdString(address.toString());
    showNotification(QStringLiteral("Bluetooth operation failed"),
                     QStringLiteral("%1: %2").arg(name, reason),
                     QSystemTrayIcon::Warning);
}

void TrayMenuPresenter::showNotification(const QString& title, const QString& message,
                                         QSystemTrayIcon::MessageIcon icon) {
    if (!d->config.getBool(ConfigKeys::SHOW_NOTIFICATIONS, true)) {
        return;
    }
    if (supportsMessages()) {
        showMessage(title, message, icon, NOTIFICATION_DURATION);
    }
}

void TrayMenuPresenter::showAbout() {
    QMessageBox::about(nullptr,
        QStringLiteral("About %1").arg(QString::fromLatin1(APPLICATION_NAME)),
        QStringLiteral("%1 %2\n\n"
                       "Connect and disconnect paired Bluetooth devices "
                       "from the system tray.\n\n"
                       "Copyright bluetray")
            .arg(QString::fromLatin1(APPLICATION_NAME),
                 QString::fromLatin1(APPLICATION_VERSION)));
}

} // namespace bluetray
