#pragma once
#include <bluetray/Types.hpp>
#include <QObject>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace bluetray {

using ConfigValue = std::variant<bool, int, double, std::string>;

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager() override;

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    // Per-device display settings
    std::map<std::string, ConfigValue> getDeviceSettings(const DeviceAddress& address) const;
    void setDeviceSettings(const DeviceAddress& address,
                           const std::map<std::string, ConfigValue>& settings);
    std::string deviceAlias(const DeviceAddress& address) const;
    bool isDeviceHidden(const DeviceAddress& address) const;

    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);
    void deviceConfigChanged(const bluetray::DeviceAddress& address);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
