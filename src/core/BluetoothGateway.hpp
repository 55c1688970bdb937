#pragma once
#include <bluetray/Types.hpp>
#include <QMetaType>
#include <QObject>
#include <stdexcept>
#include <string>
#include <vector>

namespace bluetray {

class BluetoothUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Narrow view of the operating system's Bluetooth stack.
//
// listPairedDevices(), connectDevice() and disconnectDevice() block until
// the OS answers and must be safe to call from worker threads. The signals
// may be emitted from any thread.
class BluetoothGateway : public QObject {
    Q_OBJECT

public:
    explicit BluetoothGateway(QObject* parent = nullptr) : QObject(parent) {}
    ~BluetoothGateway() override = default;

    // Throws BluetoothUnavailableError when no usable adapter exists.
    virtual void initialize() = 0;

    virtual std::vector<Device> listPairedDevices() = 0;
    virtual GatewayResult connectDevice(const DeviceAddress& address) = 0;
    virtual GatewayResult disconnectDevice(const DeviceAddress& address) = 0;

signals:
    void devicePaired(const bluetray::Device& device);
    void deviceUnpaired(const bluetray::DeviceAddress& address);
    void connectionStateChanged(const bluetray::DeviceAddress& address,
                                bluetray::ConnectionState state,
                                bluetray::Timestamp observedAt);
    // The whole paired list should be re-read (e.g. the OS stack restarted).
    void pairedDevicesInvalidated();
};

} // namespace bluetray

Q_DECLARE_METATYPE(bluetray::Device)
Q_DECLARE_METATYPE(bluetray::DeviceAddress)
Q_DECLARE_METATYPE(bluetray::ConnectionState)
Q_DECLARE_METATYPE(bluetray::Timestamp)
