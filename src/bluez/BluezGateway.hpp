#pragma once
#include "../core/BluetoothGateway.hpp"
#include <QString>
#include <chrono>
#include <memory>
#include <optional>

class QDBusMessage;

namespace bluetray {

// BluetoothGateway backed by BlueZ on the D-Bus system bus.
class BluezGateway : public BluetoothGateway {
    Q_OBJECT

public:
    explicit BluezGateway(QObject* parent = nullptr);
    ~BluezGateway() override;

    // Upper bound for Device1.Connect/Disconnect round trips.
    void setCallTimeout(std::chrono::milliseconds timeout);

    void initialize() override;
    std::vector<Device> listPairedDevices() override;
    GatewayResult connectDevice(const DeviceAddress& address) override;
    GatewayResult disconnectDevice(const DeviceAddress& address) override;

    // "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> AA:BB:CC:DD:EE:FF
    static std::optional<DeviceAddress> addressFromPath(const QString& path);
    // Maps a D-Bus error name onto the reason shown to the user.
    static std::string reasonFromError(const QString& errorName, const QString& errorMessage);

protected slots:
    void onPropertiesChanged(const QDBusMessage& message);
    void onInterfacesAdded(const QDBusMessage& message);
    void onInterfacesRemoved(const QDBusMessage& message);

private:
    GatewayResult callDevice(const DeviceAddress& address, const QString& method);
    QString devicePath(const DeviceAddress& address) const;
    std::optional<Device> readDevice(const QString& path);

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace bluetray
