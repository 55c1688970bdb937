#include "DeviceRegistry.hpp"
#include "Logger.hpp"
#include <QString>
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>

namespace bluetray {

using DeviceMap = std::map<DeviceAddress, Device>;

class DeviceRegistry::Private {
public:
    // Replaced wholesale on every write; readers load the pointer atomically.
    std::shared_ptr<const DeviceMap> devices{std::make_shared<const DeviceMap>()};
    std::mutex writeMutex;

    std::shared_ptr<const DeviceMap> snapshot() const {
        return std::atomic_load(&devices);
    }

    void publish(std::shared_ptr<const DeviceMap> next) {
        std::atomic_store(&devices, std::move(next));
    }
};

DeviceRegistry::DeviceRegistry(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
}

DeviceRegistry::~DeviceRegistry() = default;

void DeviceRegistry::upsert(const Device& device) {
    Device merged = device;
    {
        std::lock_guard<std::mutex> lock(d->writeMutex);
        auto current = d->snapshot();

        auto it = current->find(device.address);
        if (it != current->end()) {
            const Device& existing = it->second;
            if (isInFlight(existing.state) && isInFlight(device.state)) {
                merged = existing;
                merged.name = device.name;
                merged.lastObservedAt = std::max(existing.lastObservedAt,
                                                 device.lastObservedAt);
            }
            if (merged == existing) {
                return;
            }
        }

        auto next = std::make_shared<DeviceMap>(*current);
        (*next)[device.address] = merged;
        d->publish(std::move(next));
    }

    LOG_DEBUG("Registry: " + merged.address.toString() + " \"" + merged.name +
              "\" -> " + toString(merged.state));
    emit deviceUpdated(merged);
    emit changed();
}

void DeviceRegistry::remove(const DeviceAddress& address) {
    {
        std::lock_guard<std::mutex> lock(d->writeMutex);
        auto current = d->snapshot();
        if (current->find(address) == current->end()) {
            return;
        }

        auto next = std::make_shared<DeviceMap>(*current);
        next->erase(address);
        d->publish(std::move(next));
    }

    LOG_DEBUG("Registry: removed " + address.toString());
    emit deviceRemoved(address);
    emit changed();
}

std::optional<Device> DeviceRegistry::get(const DeviceAddress& address) const {
    auto current = d->snapshot();
    auto it = current->find(address);
    if (it == current->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DeviceRegistry::contains(const DeviceAddress& address) const {
    auto current = d->snapshot();
    return current->find(address) != current->end();
}

std::vector<Device> DeviceRegistry::list() const {
    auto current = d->snapshot();

    std::vector<Device> result;
    result.reserve(current->size());
    for (const auto& [_, device] : *current) {
        result.push_back(device);
    }

    std::stable_sort(result.begin(), result.end(),
        [](const Device& a, const Device& b) {
            int order = QString::fromStdString(a.name).compare(
                QString::fromStdString(b.name), Qt::CaseInsensitive);
            if (order != 0) {
                return order < 0;
            }
            return a.address < b.address;
        });

    return result;
}

size_t DeviceRegistry::size() const {
    return d->snapshot()->size();
}

} // namespace bluetray
