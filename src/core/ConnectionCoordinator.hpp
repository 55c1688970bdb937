#pragma once
#include <bluetray/Types.hpp>
#include <QObject>
#include <QString>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace bluetray {

class BluetoothGateway;
class DeviceRegistry;

// Sole writer of the DeviceRegistry and sole issuer of connect/disconnect
// calls to the BluetoothGateway.
//
// Requests and notifications are handled on the thread the coordinator
// lives on. Gateway calls run on an internal thread pool and their results
// are posted back to that thread, so registry writes never race. Each
// device has at most one operation in flight; a second request for the same
// device is rejected rather than queued. OS notifications that arrive while
// an operation is in flight are held back and replayed in arrival order
// once the operation resolves.
class ConnectionCoordinator : public QObject {
    Q_OBJECT

public:
    ConnectionCoordinator(DeviceRegistry& registry,
                          BluetoothGateway& gateway,
                          QObject* parent = nullptr);
    ~ConnectionCoordinator() override;

    void setFailureCooldown(std::chrono::milliseconds cooldown);
    std::chrono::milliseconds failureCooldown() const;
    void setMaxConcurrentOperations(int count);

    RequestStatus requestConnect(const DeviceAddress& address);
    RequestStatus requestDisconnect(const DeviceAddress& address);

    bool isInFlight(const DeviceAddress& address) const;
    size_t inFlightCount() const;
    size_t deferredChangeCount(const DeviceAddress& address) const;

public slots:
    // Re-reads the paired device list from the OS and reconciles the registry.
    void refresh();

    void onExternalStateChange(const bluetray::DeviceAddress& address,
                               bluetray::ConnectionState state,
                               bluetray::Timestamp observedAt);
    void onDevicePaired(const bluetray::Device& device);
    void onDeviceUnpaired(const bluetray::DeviceAddress& address);

signals:
    void operationFinished(const bluetray::DeviceAddress& address,
                           bluetray::ConnectionState state);
    void operationFailed(const bluetray::DeviceAddress& address,
                         const QString& reason);
    void refreshFinished(bool success);

private:
    enum class Operation { Connect, Disconnect };

    void startOperation(const Device& device, Operation op);
    void completeOperation(const DeviceAddress& address, Operation op,
                           const GatewayResult& result);
    void completeRefresh(const std::vector<Device>& devices, bool success,
                         const std::string& error);
    void reconcile(const Device& reported);
    void removeDevice(const DeviceAddress& address);
    void applyExternal(const DeviceAddress& address, ConnectionState state,
                       Timestamp observedAt);
    void replayDeferred(const DeviceAddress& address);
    void startCooldown(const DeviceAddress& address);
    void cancelCooldown(const DeviceAddress& address);
    void finishCooldown(const DeviceAddress& address);

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace bluetray
