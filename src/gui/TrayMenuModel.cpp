#include "TrayMenuModel.hpp"
#include "../utils/ConfigManager.hpp"
#include <bluetray/Constants.hpp>

namespace bluetray {

TrayMenuModel::TrayMenuModel(const ConfigManager* config)
    : configManager(config) {
}

std::vector<MenuEntry> TrayMenuModel::build(const std::vector<Device>& devices) const {
    std::vector<MenuEntry> entries;
    entries.reserve(devices.size());

    for (const auto& device : devices) {
        if (isHidden(device)) {
            continue;
        }

        MenuEntry entry;
        entry.address = device.address;
        entry.label = labelFor(device, displayName(device));
        entry.action = actionFor(device);
        entry.enabled = entry.action != MenuAction::None;
        entry.checked = device.state == ConnectionState::Connected;
        entry.failed = device.state == ConnectionState::Failed;
        entries.push_back(entry);
    }

    return entries;
}

QString TrayMenuModel::tooltip(const std::vector<Device>& devices) const {
    int connected = 0;
    for (const auto& device : devices) {
        if (device.state == ConnectionState::Connected && !isHidden(device)) {
            ++connected;
        }
    }

    QString tip = QString::fromLatin1(APPLICATION_NAME);
    if (connected == 0) {
        return tip + QStringLiteral(" - no devices connected");
    }
    if (connected == 1) {
        return tip + QStringLiteral(" - 1 device connected");
    }
    return tip + QStringLiteral(" - %1 devices connected").arg(connected);
}

MenuAction TrayMenuModel::actionFor(const Device& device) {
    if (isInFlight(device.state)) {
        return MenuAction::None;
    }
    // A failed entry retries toward where it came from
    return device.effectiveState() == ConnectionState::Connected
        ? MenuAction::Disconnect
        : MenuAction::Connect;
}

QString TrayMenuModel::labelFor(const Device& device, const QString& displayName) {
    switch (device.state) {
        case ConnectionState::Connecting:
            return displayName + QStringLiteral(" (connecting...)");
        case ConnectionState::Disconnecting:
            return displayName + QStringLiteral(" (disconnecting...)");
        case ConnectionState::Failed:
            return displayName + QStringLiteral(" (failed: %1)")
                .arg(QString::fromStdString(device.failureReason));
        case ConnectionState::Connected:
        case ConnectionState::Disconnected:
        default:
            return displayName;
    }
}

QString TrayMenuModel::displayName(const Device& device) const {
    if (configManager) {
        std::string alias = configManager->deviceAlias(device.address);
        if (!alias.empty()) {
            return QString::fromStdString(alias);
        }
    }
    if (device.name.empty()) {
        return QString::fromStdString(device.address.toString());
    }
    return QString::fromStdString(device.name);
}

bool TrayMenuModel::isHidden(const Device& device) const {
    return configManager && configManager->isDeviceHidden(device.address);
}

} // namespace bluetray
