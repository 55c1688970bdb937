#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <bluetray/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <limits>
#include <optional>

namespace bluetray {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> globalSettings;
    std::map<DeviceAddress, std::map<std::string, ConfigValue>> deviceSettings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double v) -> QJsonValue { return v; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue{json.toBool()};
            case QJsonValue::Double: {
                double v = json.toDouble();
                double integral = 0.0;
                if (std::modf(v, &integral) == 0.0 &&
                    v >= std::numeric_limits<int>::min() &&
                    v <= std::numeric_limits<int>::max()) {
                    return ConfigValue{static_cast<int>(v)};
                }
                return ConfigValue{v};
            }
            case QJsonValue::String:
                return ConfigValue{json.toString().toStdString()};
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        globalSettings = {
            {ConfigKeys::FAILURE_COOLDOWN, DEFAULT_FAILURE_COOLDOWN},
            {ConfigKeys::GATEWAY_TIMEOUT, DEFAULT_GATEWAY_TIMEOUT},
            {ConfigKeys::MAX_CONCURRENT_OPERATIONS, DEFAULT_MAX_CONCURRENT_OPERATIONS},
            {ConfigKeys::SHOW_NOTIFICATIONS, true},
            {ConfigKeys::LOG_LEVEL, 1},
            {ConfigKeys::LOG_FILE, std::string()}
        };
    }

    template<typename T>
    T lookup(const std::string& key, const T& defaultValue) const {
        auto it = globalSettings.find(key);
        if (it != globalSettings.end() && std::holds_alternative<T>(it->second)) {
            return std::get<T>(it->second);
        }
        return defaultValue;
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    return d->lookup<bool>(key, defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    return d->lookup<int>(key, defaultValue);
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        // Whole numbers in the file load as int
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return d->lookup<double>(key, defaultValue);
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return d->lookup<std::string>(key, defaultValue);
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

std::map<std::string, ConfigValue> ConfigManager::getDeviceSettings(
    const DeviceAddress& address) const {
    auto it = d->deviceSettings.find(address);
    if (it != d->deviceSettings.end()) {
        return it->second;
    }
    return {};
}

void ConfigManager::setDeviceSettings(
    const DeviceAddress& address,
    const std::map<std::string, ConfigValue>& settings) {
    d->deviceSettings[address] = settings;
    emit deviceConfigChanged(address);
}

std::string ConfigManager::deviceAlias(const DeviceAddress& address) const {
    auto settings = getDeviceSettings(address);
    auto it = settings.find(ConfigKeys::DEVICE_ALIAS);
    if (it != settings.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return {};
}

bool ConfigManager::isDeviceHidden(const DeviceAddress& address) const {
    auto settings = getDeviceSettings(address);
    auto it = settings.find(ConfigKeys::DEVICE_HIDDEN);
    if (it != settings.end() && std::holds_alternative<bool>(it->second)) {
        return std::get<bool>(it->second);
    }
    return false;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR("Cannot open configuration file " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_ERROR("Malformed configuration file " + filename + ": " +
                  parseError.errorString().toStdString());
        return false;
    }

    QJsonObject root = doc.object();

    QJsonObject globals = root["global"].toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();
        auto value = d->fromJsonValue(it.value());
        if (!value) {
            LOG_WARNING("Ignoring unsupported value for configuration key " + key);
            continue;
        }
        d->globalSettings[key] = *value;
    }

    QJsonObject devices = root["devices"].toObject();
    for (auto it = devices.begin(); it != devices.end(); ++it) {
        auto address = DeviceAddress::fromString(it.key().toStdString());
        if (!address) {
            LOG_WARNING("Ignoring settings for invalid device address " +
                        it.key().toStdString());
            continue;
        }

        QJsonObject deviceSettings = it.value().toObject();
        std::map<std::string, ConfigValue> settings;
        for (auto sit = deviceSettings.begin(); sit != deviceSettings.end(); ++sit) {
            auto value = d->fromJsonValue(sit.value());
            if (value) {
                settings[sit.key().toStdString()] = *value;
            }
        }

        d->deviceSettings[*address] = std::move(settings);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject root;

    QJsonObject globals;
    for (const auto& [key, value] : d->globalSettings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }
    root["global"] = globals;

    QJsonObject devices;
    for (const auto& [address, settings] : d->deviceSettings) {
        QJsonObject deviceSettings;
        for (const auto& [key, value] : settings) {
            deviceSettings[QString::fromStdString(key)] = d->toJsonValue(value);
        }
        devices[QString::fromStdString(address.toString())] = deviceSettings;
    }
    root["devices"] = devices;

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR("Cannot write configuration file " + filename);
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();
    d->deviceSettings.clear();

    for (const auto& [key, _] : d->globalSettings) {
        emit configChanged(key);
    }
}

}
