// tests/test_BluezGateway.cpp
#include <gtest/gtest.h>
#include "bluez/BluezGateway.hpp"
#include "core/Logger.hpp"
#include <QCoreApplication>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QStringList>
#include <QVariantMap>
#include <memory>
#include <vector>

namespace bluetray {
namespace testing {

TEST(BluezGatewayTest, AddressFromObjectPath) {
    auto address = BluezGateway::addressFromPath("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->toString(), "AA:BB:CC:DD:EE:FF");

    EXPECT_FALSE(BluezGateway::addressFromPath("/org/bluez/hci0").has_value());
    EXPECT_FALSE(BluezGateway::addressFromPath("/org/bluez/hci0/dev_AA_BB").has_value());
    EXPECT_FALSE(BluezGateway::addressFromPath("").has_value());
}

TEST(BluezGatewayTest, TimeoutErrorsMapToTimeout) {
    EXPECT_EQ(BluezGateway::reasonFromError("org.freedesktop.DBus.Error.NoReply", "Did not receive a reply"),
              "timeout");
    EXPECT_EQ(BluezGateway::reasonFromError("org.freedesktop.DBus.Error.Timeout", ""), "timeout");
}

TEST(BluezGatewayTest, OtherErrorsKeepTheirMessage) {
    EXPECT_EQ(BluezGateway::reasonFromError("org.bluez.Error.InProgress", "In Progress"),
              "operation already in progress");
    EXPECT_EQ(BluezGateway::reasonFromError("org.bluez.Error.Failed", "Host is down"),
              "Host is down");
    EXPECT_EQ(BluezGateway::reasonFromError("org.bluez.Error.Failed", ""), "Failed");
    EXPECT_EQ(BluezGateway::reasonFromError("", ""), "unknown error");
}

namespace {

const char* HEADPHONES_PATH = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";

using InterfaceMap = QMap<QString, QVariantMap>;

// Exposes the bus signal handlers so locally built messages can be fed in.
class NotificationGateway : public BluezGateway {
public:
    using BluezGateway::onPropertiesChanged;
    using BluezGateway::onInterfacesAdded;
    using BluezGateway::onInterfacesRemoved;
};

QDBusMessage propertiesChanged(const QString& path, const QVariantMap& changed) {
    QDBusMessage message = QDBusMessage::createSignal(
        path, "org.freedesktop.DBus.Properties", "PropertiesChanged");
    message << QString("org.bluez.Device1") << changed << QStringList();
    return message;
}

QDBusMessage interfacesAdded(const QString& path, const QVariantMap& deviceProperties) {
    InterfaceMap interfaces;
    interfaces.insert("org.bluez.Device1", deviceProperties);
    QDBusMessage message = QDBusMessage::createSignal(
        "/", "org.freedesktop.DBus.ObjectManager", "InterfacesAdded");
    message << QVariant::fromValue(QDBusObjectPath(path))
            << QVariant::fromValue(interfaces);
    return message;
}

QDBusMessage interfacesRemoved(const QString& path, const QStringList& interfaces) {
    QDBusMessage message = QDBusMessage::createSignal(
        "/", "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved");
    message << QVariant::fromValue(QDBusObjectPath(path)) << interfaces;
    return message;
}

} // namespace

class BluezNotificationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLogLevel(LogLevel::Critical);
        int argc = 1;
        char* argv[] = {(char*)"test"};
        app = std::make_unique<QCoreApplication>(argc, argv);
        gateway = std::make_unique<NotificationGateway>();

        QObject::connect(gateway.get(), &BluetoothGateway::devicePaired,
            [this](const Device& device) { paired.push_back(device); });
        QObject::connect(gateway.get(), &BluetoothGateway::deviceUnpaired,
            [this](const DeviceAddress& address) { unpaired.push_back(address); });
        QObject::connect(gateway.get(), &BluetoothGateway::connectionStateChanged,
            [this](const DeviceAddress& address, ConnectionState state, Timestamp) {
                stateChanges.emplace_back(address, state);
            });
    }

    void TearDown() override {
        gateway.reset();
        app.reset();
    }

    std::unique_ptr<QCoreApplication> app;
    std::unique_ptr<NotificationGateway> gateway;
    std::vector<Device> paired;
    std::vector<DeviceAddress> unpaired;
    std::vector<std::pair<DeviceAddress, ConnectionState>> stateChanges;
};

TEST_F(BluezNotificationTest, ConnectedPropertyReportsStateChange) {
    gateway->onPropertiesChanged(propertiesChanged(HEADPHONES_PATH, {{"Connected", true}}));
    gateway->onPropertiesChanged(propertiesChanged(HEADPHONES_PATH, {{"Connected", false}}));

    ASSERT_EQ(stateChanges.size(), 2u);
    EXPECT_EQ(stateChanges[0].first.toString(), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(stateChanges[0].second, ConnectionState::Connected);
    EXPECT_EQ(stateChanges[1].second, ConnectionState::Disconnected);
    EXPECT_TRUE(paired.empty());
    EXPECT_TRUE(unpaired.empty());
}

TEST_F(BluezNotificationTest, PairedFalseReportsUnpairing) {
    gateway->onPropertiesChanged(propertiesChanged(HEADPHONES_PATH,
                                                   {{"Paired", false}, {"Connected", false}}));

    ASSERT_EQ(unpaired.size(), 1u);
    EXPECT_EQ(unpaired[0].toString(), "AA:BB:CC:DD:EE:FF");
    EXPECT_TRUE(stateChanges.empty());
}

TEST_F(BluezNotificationTest, OtherInterfacesAndPathsAreIgnored) {
    QDBusMessage adapterChange = QDBusMessage::createSignal(
        "/org/bluez/hci0", "org.freedesktop.DBus.Properties", "PropertiesChanged");
    adapterChange << QString("org.bluez.Adapter1") << QVariantMap{{"Powered", false}}
                  << QStringList();
    gateway->onPropertiesChanged(adapterChange);
    gateway->onPropertiesChanged(propertiesChanged("/org/bluez/hci0", {{"Connected", true}}));

    EXPECT_TRUE(stateChanges.empty());
    EXPECT_TRUE(unpaired.empty());
}

TEST_F(BluezNotificationTest, InterfacesAddedReportsPairedDevice) {
    gateway->onInterfacesAdded(interfacesAdded(HEADPHONES_PATH, {
        {"Paired", true}, {"Connected", true},
        {"Alias", "Headphones"}, {"Name", "WH-1000XM4"}
    }));

    ASSERT_EQ(paired.size(), 1u);
    EXPECT_EQ(paired[0].address.toString(), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(paired[0].name, "Headphones");
    EXPECT_EQ(paired[0].state, ConnectionState::Connected);
}

TEST_F(BluezNotificationTest, InterfacesAddedIgnoresUnpairedDevice) {
    // Discovered during a scan but never paired
    gateway->onInterfacesAdded(interfacesAdded(HEADPHONES_PATH, {
        {"Paired", false}, {"Connected", false}, {"Name", "Stranger"}
    }));

    EXPECT_TRUE(paired.empty());
}

TEST_F(BluezNotificationTest, InterfacesRemovedReportsUnpairing) {
    gateway->onInterfacesRemoved(interfacesRemoved(
        HEADPHONES_PATH, {"org.freedesktop.DBus.Properties", "org.bluez.Device1"}));
    gateway->onInterfacesRemoved(interfacesRemoved(
        "/org/bluez/hci0", {"org.bluez.Adapter1"}));

    ASSERT_EQ(unpaired.size(), 1u);
    EXPECT_EQ(unpaired[0].toString(), "AA:BB:CC:DD:EE:FF");
}

} // namespace testing
} // namespace bluetray
