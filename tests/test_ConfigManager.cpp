// tests/test_ConfigManager.cpp
#include <gtest/gtest.h>
#include "utils/ConfigManager.hpp"
#include "core/Logger.hpp"
#include <bluetray/Constants.hpp>
#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <memory>

namespace bluetray {
namespace testing {

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLogLevel(LogLevel::Critical);
        int argc = 1;
        char* argv[] = {(char*)"test"};
        app = std::make_unique<QCoreApplication>(argc, argv);
        config = std::make_unique<ConfigManager>();
        ASSERT_TRUE(dir.isValid());
    }

    void TearDown() override {
        config.reset();
        app.reset();
    }

    std::string writeFile(const char* name, const QByteArray& contents) {
        QString path = dir.filePath(name);
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(contents);
        return path.toStdString();
    }

    QTemporaryDir dir;
    std::unique_ptr<QCoreApplication> app;
    std::unique_ptr<ConfigManager> config;
};

TEST_F(ConfigManagerTest, DefaultsArePresent) {
    EXPECT_EQ(config->getInt(ConfigKeys::FAILURE_COOLDOWN), DEFAULT_FAILURE_COOLDOWN);
    EXPECT_EQ(config->getInt(ConfigKeys::MAX_CONCURRENT_OPERATIONS),
              DEFAULT_MAX_CONCURRENT_OPERATIONS);
    EXPECT_TRUE(config->getBool(ConfigKeys::SHOW_NOTIFICATIONS));
    EXPECT_EQ(config->getString("missing", "fallback"), "fallback");
    // Wrong type falls back to the default
    EXPECT_EQ(config->getString(ConfigKeys::FAILURE_COOLDOWN, "x"), "x");
}

TEST_F(ConfigManagerTest, SettersEmitConfigChanged) {
    std::string changedKey;
    QObject::connect(config.get(), &ConfigManager::configChanged,
        [&changedKey](const std::string& key) { changedKey = key; });

    config->setInt(ConfigKeys::FAILURE_COOLDOWN, 500);
    EXPECT_EQ(changedKey, ConfigKeys::FAILURE_COOLDOWN);
    EXPECT_EQ(config->getInt(ConfigKeys::FAILURE_COOLDOWN), 500);

    config->setDouble("scale", 1.5);
    EXPECT_DOUBLE_EQ(config->getDouble("scale"), 1.5);
    EXPECT_DOUBLE_EQ(config->getDouble(ConfigKeys::FAILURE_COOLDOWN), 500.0);
}

TEST_F(ConfigManagerTest, LoadsGlobalAndDeviceSettings) {
    auto path = writeFile("bluetray.json", R"({
        "global": {
            "failureCooldownMs": 1500,
            "showNotifications": false,
            "logFile": "/tmp/bluetray.log",
            "ignored": [1, 2]
        },
        "devices": {
            "aa:bb:cc:dd:ee:ff": { "alias": "My Headphones", "hidden": false },
            "11:22:33:44:55:66": { "hidden": true },
            "not-an-address": { "alias": "nope" }
        }
    })");

    ASSERT_TRUE(config->loadFromFile(path));
    EXPECT_EQ(config->getInt(ConfigKeys::FAILURE_COOLDOWN), 1500);
    EXPECT_FALSE(config->getBool(ConfigKeys::SHOW_NOTIFICATIONS, true));
    EXPECT_EQ(config->getString(ConfigKeys::LOG_FILE), "/tmp/bluetray.log");
    EXPECT_EQ(config->getInt("ignored", -1), -1);

    auto headphones = *DeviceAddress::fromString("AA:BB:CC:DD:EE:FF");
    auto hidden = *DeviceAddress::fromString("11:22:33:44:55:66");
    EXPECT_EQ(config->deviceAlias(headphones), "My Headphones");
    EXPECT_FALSE(config->isDeviceHidden(headphones));
    EXPECT_TRUE(config->isDeviceHidden(hidden));
    EXPECT_TRUE(config->deviceAlias(hidden).empty());
}

TEST_F(ConfigManagerTest, MalformedFileIsRejected) {
    auto path = writeFile("broken.json", "{ \"global\": ");
    EXPECT_FALSE(config->loadFromFile(path));
    EXPECT_EQ(config->getInt(ConfigKeys::FAILURE_COOLDOWN), DEFAULT_FAILURE_COOLDOWN);

    EXPECT_FALSE(config->loadFromFile(dir.filePath("missing.json").toStdString()));
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    auto address = *DeviceAddress::fromString("AA:BB:CC:DD:EE:FF");
    config->setInt(ConfigKeys::GATEWAY_TIMEOUT, 12000);
    config->setDeviceSettings(address, {{ConfigKeys::DEVICE_ALIAS, std::string("Desk Speaker")}});

    std::string path = dir.filePath("saved.json").toStdString();
    ASSERT_TRUE(config->saveToFile(path));

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    EXPECT_EQ(reloaded.getInt(ConfigKeys::GATEWAY_TIMEOUT), 12000);
    EXPECT_EQ(reloaded.deviceAlias(address), "Desk Speaker");
}

TEST_F(ConfigManagerTest, ResetClearsDeviceSettings) {
    auto address = *DeviceAddress::fromString("AA:BB:CC:DD:EE:FF");
    config->setDeviceSettings(address, {{ConfigKeys::DEVICE_HIDDEN, true}});
    config->setInt(ConfigKeys::FAILURE_COOLDOWN, 1);

    config->resetToDefaults();

    EXPECT_FALSE(config->isDeviceHidden(address));
    EXPECT_EQ(config->getInt(ConfigKeys::FAILURE_COOLDOWN), DEFAULT_FAILURE_COOLDOWN);
}

} // namespace testing
} // namespace bluetray
