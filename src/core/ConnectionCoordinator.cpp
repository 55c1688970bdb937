#include "ConnectionCoordinator.hpp"
#include "BluetoothGateway.hpp"
#include "DeviceRegistry.hpp"
#include "Logger.hpp"
#include <bluetray/Constants.hpp>
#include <QThreadPool>
#include <QTimer>
#include <algorithm>
#include <deque>
#include <map>
#include <set>

namespace bluetray {

namespace {

struct DeferredChange {
    ConnectionState state;
    Timestamp observedAt;
};

// Per-device bookkeeping that is not part of the published record.
struct DeviceTrack {
    bool inFlight{false};
    bool orphaned{false};   // unpaired while the OS call was running
    std::deque<DeferredChange> deferred;
    QTimer* cooldownTimer{nullptr};
};

} // namespace

class ConnectionCoordinator::Private {
public:
    Private(DeviceRegistry& reg, BluetoothGateway& gw)
        : registry(reg), gateway(gw) {}

    DeviceRegistry& registry;
    BluetoothGateway& gateway;
    std::map<DeviceAddress, DeviceTrack> tracks;
    std::chrono::milliseconds cooldown{DEFAULT_FAILURE_COOLDOWN};
    QThreadPool pool;
    bool refreshRunning{false};
    bool refreshRequested{false};
    // Pairing changes seen while a listing was in progress; that listing
    // predates them and must not undo them.
    std::set<DeviceAddress> pairedDuringRefresh;
    std::set<DeviceAddress> unpairedDuringRefresh;

    DeviceTrack* findTrack(const DeviceAddress& address) {
        auto it = tracks.find(address);
        return it == tracks.end() ? nullptr : &it->second;
    }

    const DeviceTrack* findTrack(const DeviceAddress& address) const {
        auto it = tracks.find(address);
        return it == tracks.end() ? nullptr : &it->second;
    }

    // Drops bookkeeping that no longer carries any state.
    void pruneTrack(const DeviceAddress& address) {
        auto it = tracks.find(address);
        if (it != tracks.end() && !it->second.inFlight &&
            it->second.deferred.empty() && !it->second.cooldownTimer) {
            tracks.erase(it);
        }
    }
};

ConnectionCoordinator::ConnectionCoordinator(DeviceRegistry& registry,
                                             BluetoothGateway& gateway,
                                             QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>(registry, gateway)) {

    qRegisterMetaType<bluetray::Device>("bluetray::Device");
    qRegisterMetaType<bluetray::DeviceAddress>("bluetray::DeviceAddress");
    qRegisterMetaType<bluetray::ConnectionState>("bluetray::ConnectionState");
    qRegisterMetaType<bluetray::Timestamp>("bluetray::Timestamp");

    d->pool.setMaxThreadCount(DEFAULT_MAX_CONCURRENT_OPERATIONS);

    // Notifications may come from OS threads; Qt queues them onto ours.
    connect(&gateway, &BluetoothGateway::connectionStateChanged,
            this, &ConnectionCoordinator::onExternalStateChange);
    connect(&gateway, &BluetoothGateway::devicePaired,
            this, &ConnectionCoordinator::onDevicePaired);
    connect(&gateway, &BluetoothGateway::deviceUnpaired,
            this, &ConnectionCoordinator::onDeviceUnpaired);
    connect(&gateway, &BluetoothGateway::pairedDevicesInvalidated,
            this, &ConnectionCoordinator::refresh);
}

ConnectionCoordinator::~ConnectionCoordinator() {
    if (inFlightCount() > 0 || d->refreshRunning) {
        LOG_INFO("Waiting for outstanding Bluetooth operations to return");
    }
    d->pool.waitForDone();
}

void ConnectionCoordinator::setFailureCooldown(std::chrono::milliseconds cooldown) {
    d->cooldown = std::max(std::chrono::milliseconds(0), cooldown);
}

std::chrono::milliseconds ConnectionCoordinator::failureCooldown() const {
    return d->cooldown;
}

void ConnectionCoordinator::setMaxConcurrentOperations(int count) {
    d->pool.setMaxThreadCount(std::max(1, count));
}

RequestStatus ConnectionCoordinator::requestConnect(const DeviceAddress& address) {
    auto device = d->registry.get(address);
    if (!device) {
        LOG_WARNING("Connect rejected, unknown device " + address.toString());
        return RequestStatus::UnknownDevice;
    }

    const DeviceTrack* track = d->findTrack(address);
    if ((track && track->inFlight) || bluetray::isInFlight(device->state)) {
        LOG_INFO("Connect rejected, operation already in flight for " + address.toString());
        return RequestStatus::AlreadyInFlight;
    }

    if (device->effectiveState() == ConnectionState::Connected) {
        LOG_INFO("Connect ignored, " + address.toString() + " is already connected");
        return RequestStatus::AlreadyConnected;
    }

    startOperation(*device, Operation::Connect);
    return RequestStatus::Accepted;
}

RequestStatus ConnectionCoordinator::requestDisconnect(const DeviceAddress& address) {
    auto device = d->registry.get(address);
    if (!device) {
        LOG_WARNING("Disconnect rejected, unknown device " + address.toString());
        return RequestStatus::UnknownDevice;
    }

    const DeviceTrack* track = d->findTrack(address);
    if ((track && track->inFlight) || bluetray::isInFlight(device->state)) {
        LOG_INFO("Disconnect rejected, operation already in flight for " + address.toString());
        return RequestStatus::AlreadyInFlight;
    }

    if (device->effectiveState() != ConnectionState::Connected) {
        LOG_INFO("Disconnect rejected, " + address.toString() + " is not connected");
        return RequestStatus::NotConnected;
    }

    startOperation(*device, Operation::Disconnect);
    return RequestStatus::Accepted;
}

bool ConnectionCoordinator::isInFlight(const DeviceAddress& address) const {
    const DeviceTrack* track = d->findTrack(address);
    return track && track->inFlight;
}

size_t ConnectionCoordinator::inFlightCount() const {
    size_t count = 0;
    for (const auto& [_, track] : d->tracks) {
        if (track.inFlight) ++count;
    }
    return count;
}

size_t ConnectionCoordinator::deferredChangeCount(const DeviceAddress& address) const {
    const DeviceTrack* track = d->findTrack(address);
    return track ? track->deferred.size() : 0;
}

void ConnectionCoordinator::startOperation(const Device& device, Operation op) {
    const DeviceAddress address = device.address;
    cancelCooldown(address);

    Device next = device;
    next.revertState = device.effectiveState();
    next.state = (op == Operation::Connect) ? ConnectionState::Connecting
                                            : ConnectionState::Disconnecting;
    next.failureReason.clear();
    // OS notifications observed before this point are stale from now on
    next.lastObservedAt = std::chrono::system_clock::now();

    DeviceTrack& track = d->tracks[address];
    track.inFlight = true;
    track.orphaned = false;

    d->registry.upsert(next);
    LOG_INFO(std::string(op == Operation::Connect ? "Connecting to " : "Disconnecting from ") +
             address.toString() + " (" + device.name + ")");

    BluetoothGateway* gateway = &d->gateway;
    d->pool.start([this, gateway, address, op]() {
        GatewayResult result;
        try {
            result = (op == Operation::Connect) ? gateway->connectDevice(address)
                                                : gateway->disconnectDevice(address);
        } catch (const std::exception& e) {
            result = GatewayResult::failure(e.what());
        }

        QMetaObject::invokeMethod(this, [this, address, op, result]() {
            completeOperation(address, op, result);
        }, Qt::QueuedConnection);
    });
}

void ConnectionCoordinator::completeOperation(const DeviceAddress& address,
                                              Operation op,
                                              const GatewayResult& result) {
    DeviceTrack& track = d->tracks[address];
    track.inFlight = false;

    if (track.orphaned) {
        track.orphaned = false;
        LOG_INFO("Discarding result for unpaired device " + address.toString());
        replayDeferred(address);
        d->pruneTrack(address);
        return;
    }

    auto device = d->registry.get(address);
    if (!device) {
        replayDeferred(address);
        d->pruneTrack(address);
        return;
    }

    Device next = *device;
    if (result.success) {
        next.state = (op == Operation::Connect) ? ConnectionState::Connected
                                                : ConnectionState::Disconnected;
        next.revertState = next.state;
        next.failureReason.clear();
        d->registry.upsert(next);
        LOG_INFO(address.toString() + " is now " + toString(next.state));
        emit operationFinished(address, next.state);
    } else {
        next.state = ConnectionState::Failed;
        next.revertState = (op == Operation::Connect) ? ConnectionState::Disconnected
                                                      : ConnectionState::Connected;
        next.failureReason = result.reason.empty() ? std::string("unknown error")
                                                   : result.reason;
        d->registry.upsert(next);
        LOG_WARNING(std::string(op == Operation::Connect ? "Connect" : "Disconnect") +
                    " failed for " + address.toString() + ": " + next.failureReason);
        emit operationFailed(address, QString::fromStdString(next.failureReason));
        startCooldown(address);
    }

    replayDeferred(address);
    d->pruneTrack(address);
}

void ConnectionCoordinator::replayDeferred(const DeviceAddress& address) {
    DeviceTrack* track = d->findTrack(address);
    if (!track) {
        return;
    }

    // Applying a change never starts a new operation, so the queue cannot
    // grow while it is drained.
    std::deque<DeferredChange> deferred;
    deferred.swap(track->deferred);
    for (const auto& change : deferred) {
        LOG_DEBUG("Replaying deferred " + std::string(toString(change.state)) +
                  " for " + address.toString());
        applyExternal(address, change.state, change.observedAt);
    }
}

void ConnectionCoordinator::onExternalStateChange(const DeviceAddress& address,
                                                  ConnectionState state,
                                                  Timestamp observedAt) {
    if (bluetray::isInFlight(state)) {
        LOG_WARNING("Ignoring external transitional state " + std::string(toString(state)) +
                    " for " + address.toString());
        return;
    }

    if (!d->registry.contains(address)) {
        LOG_DEBUG("State change for unknown device " + address.toString());
        return;
    }

    DeviceTrack* track = d->findTrack(address);
    if (track && track->inFlight) {
        track->deferred.push_back({state, observedAt});
        LOG_DEBUG("Deferring external " + std::string(toString(state)) + " for " +
                  address.toString() + " until the pending operation resolves");
        return;
    }

    applyExternal(address, state, observedAt);
}

void ConnectionCoordinator::applyExternal(const DeviceAddress& address,
                                          ConnectionState state,
                                          Timestamp observedAt) {
    auto device = d->registry.get(address);
    if (!device) {
        return;
    }

    if (observedAt < device->lastObservedAt) {
        LOG_DEBUG("Dropping stale state change for " + address.toString());
        return;
    }

    if (device->state == state && device->failureReason.empty()) {
        // Nothing visible would change
        return;
    }

    cancelCooldown(address);

    Device next = *device;
    next.state = state;
    next.revertState = state;
    next.failureReason.clear();
    next.lastObservedAt = observedAt;

    if (device->state != state) {
        LOG_INFO(address.toString() + " reported " + toString(state) + " by the OS");
    }
    d->registry.upsert(next);
}

void ConnectionCoordinator::onDevicePaired(const Device& device) {
    if (d->refreshRunning) {
        d->pairedDuringRefresh.insert(device.address);
        d->unpairedDuringRefresh.erase(device.address);
    }
    reconcile(device);
}

void ConnectionCoordinator::onDeviceUnpaired(const DeviceAddress& address) {
    if (d->refreshRunning) {
        d->unpairedDuringRefresh.insert(address);
        d->pairedDuringRefresh.erase(address);
    }
    removeDevice(address);
}

void ConnectionCoordinator::removeDevice(const DeviceAddress& address) {
    cancelCooldown(address);

    DeviceTrack* track = d->findTrack(address);
    if (track) {
        track->deferred.clear();
        if (track->inFlight) {
            track->orphaned = true;
        }
    }

    if (d->registry.contains(address)) {
        LOG_INFO("Device unpaired: " + address.toString());
        d->registry.remove(address);
    }
    d->pruneTrack(address);
}

void ConnectionCoordinator::reconcile(const Device& reported) {
    ConnectionState osState = reported.state == ConnectionState::Connected
        ? ConnectionState::Connected
        : ConnectionState::Disconnected;
    Timestamp observedAt = reported.lastObservedAt == Timestamp{}
        ? std::chrono::system_clock::now()
        : reported.lastObservedAt;

    auto existing = d->registry.get(reported.address);
    if (!existing) {
        Device fresh = reported;
        fresh.state = osState;
        fresh.revertState = osState;
        fresh.failureReason.clear();
        fresh.lastObservedAt = observedAt;
        if (fresh.name.empty()) {
            fresh.name = fresh.address.toString();
        }
        LOG_INFO("Paired device: " + fresh.address.toString() + " (" + fresh.name + ")");
        d->registry.upsert(fresh);
        return;
    }

    if (!reported.name.empty() && existing->name != reported.name) {
        Device renamed = *existing;
        renamed.name = reported.name;
        d->registry.upsert(renamed);
    }

    // Listings are snapshots; while an operation runs, its own result and the
    // OS notifications queued behind it are authoritative.
    if (isInFlight(reported.address) || bluetray::isInFlight(existing->state)) {
        return;
    }
    // A listing that agrees with where a failed device is heading does not
    // cut its cool-down short.
    if (existing->state == ConnectionState::Failed && osState == existing->revertState) {
        return;
    }
    if (existing->state == osState) {
        return;
    }

    onExternalStateChange(reported.address, osState, observedAt);
}

void ConnectionCoordinator::refresh() {
    if (d->refreshRunning) {
        d->refreshRequested = true;
        return;
    }
    d->refreshRunning = true;

    BluetoothGateway* gateway = &d->gateway;
    d->pool.start([this, gateway]() {
        std::vector<Device> devices;
        bool success = true;
        std::string error;
        try {
            devices = gateway->listPairedDevices();
        } catch (const std::exception& e) {
            success = false;
            error = e.what();
        }

        QMetaObject::invokeMethod(this, [this, devices, success, error]() {
            completeRefresh(devices, success, error);
        }, Qt::QueuedConnection);
    });
}

void ConnectionCoordinator::completeRefresh(const std::vector<Device>& devices,
                                            bool success,
                                            const std::string& error) {
    d->refreshRunning = false;
    std::set<DeviceAddress> paired;
    std::set<DeviceAddress> unpaired;
    paired.swap(d->pairedDuringRefresh);
    unpaired.swap(d->unpairedDuringRefresh);

    if (!success) {
        LOG_ERROR("Failed to list paired devices: " + error);
        emit refreshFinished(false);
    } else {
        std::set<DeviceAddress> reported;
        for (const auto& device : devices) {
            reported.insert(device.address);
            if (unpaired.count(device.address)) {
                LOG_DEBUG("Listing predates unpairing of " + device.address.toString());
                continue;
            }
            reconcile(device);
        }

        for (const auto& device : d->registry.list()) {
            if (reported.count(device.address) || paired.count(device.address)) {
                continue;
            }
            removeDevice(device.address);
        }

        LOG_INFO("Found " + std::to_string(devices.size()) + " paired device(s)");
        emit refreshFinished(true);
    }

    if (d->refreshRequested) {
        d->refreshRequested = false;
        refresh();
    }
}

void ConnectionCoordinator::startCooldown(const DeviceAddress& address) {
    DeviceTrack& track = d->tracks[address];
    if (!track.cooldownTimer) {
        track.cooldownTimer = new QTimer(this);
        track.cooldownTimer->setSingleShot(true);
        connect(track.cooldownTimer, &QTimer::timeout, this, [this, address]() {
            finishCooldown(address);
        });
    }
    track.cooldownTimer->start(static_cast<int>(d->cooldown.count()));
}

void ConnectionCoordinator::cancelCooldown(const DeviceAddress& address) {
    DeviceTrack* track = d->findTrack(address);
    if (track && track->cooldownTimer) {
        track->cooldownTimer->stop();
        track->cooldownTimer->deleteLater();
        track->cooldownTimer = nullptr;
    }
}

void ConnectionCoordinator::finishCooldown(const DeviceAddress& address) {
    cancelCooldown(address);

    auto device = d->registry.get(address);
    if (device && device->state == ConnectionState::Failed && !isInFlight(address)) {
        Device next = *device;
        next.state = device->revertState;
        next.failureReason.clear();
        LOG_DEBUG("Cool-down over, " + address.toString() + " back to " +
                  toString(next.state));
        d->registry.upsert(next);
    }
    d->pruneTrack(address);
}

} // namespace bluetray
