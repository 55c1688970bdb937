#pragma once
#include <bluetray/Types.hpp>
#include <QObject>
#include <memory>
#include <optional>
#include <vector>

namespace bluetray {

// Last-known set of paired devices. Writes are expected from a single
// owner (the ConnectionCoordinator); reads may happen from any thread and
// always observe a complete snapshot.
class DeviceRegistry : public QObject {
    Q_OBJECT

public:
    explicit DeviceRegistry(QObject* parent = nullptr);
    ~DeviceRegistry() override;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Inserts or replaces the record for device.address. A non-settled
    // update (Connecting/Disconnecting) never overrides a stored in-flight
    // state; name and observation time are still taken from the update.
    void upsert(const Device& device);

    // No-op if the address is unknown.
    void remove(const DeviceAddress& address);

    std::optional<Device> get(const DeviceAddress& address) const;
    bool contains(const DeviceAddress& address) const;

    // Ordered by display name (case-insensitive), then by address.
    std::vector<Device> list() const;
    size_t size() const;

signals:
    void changed();
    void deviceUpdated(const bluetray::Device& device);
    void deviceRemoved(const bluetray::DeviceAddress& address);

private:
    class Private;
    std::unique_ptr<Private> d;
};

} // namespace bluetray
