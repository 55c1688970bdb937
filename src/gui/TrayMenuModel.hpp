#pragma once
#include <bluetray/Types.hpp>
#include <QString>
#include <vector>

namespace bluetray {

class ConfigManager;

enum class MenuAction {
    None,
    Connect,
    Disconnect
};

struct MenuEntry {
    DeviceAddress address;
    QString label;
    bool enabled{true};
    bool checked{false};
    bool failed{false};
    MenuAction action{MenuAction::None};
};

// Turns registry snapshots into tray menu entries. Has no widget
// dependencies so it can be exercised without a display.
class TrayMenuModel {
public:
    explicit TrayMenuModel(const ConfigManager* config = nullptr);

    std::vector<MenuEntry> build(const std::vector<Device>& devices) const;
    QString tooltip(const std::vector<Device>& devices) const;

    static MenuAction actionFor(const Device& device);
    static QString labelFor(const Device& device, const QString& displayName);

private:
    QString displayName(const Device& device) const;
    bool isHidden(const Device& device) const;

    const ConfigManager* configManager;
};

} // namespace bluetray
