#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bluetray {

using Timestamp = std::chrono::system_clock::time_point;

struct DeviceAddress {
    std::array<uint8_t, 6> bytes{};

    // Accepts "AA:BB:CC:DD:EE:FF" with ':', '-' or '_' separators.
    static std::optional<DeviceAddress> fromString(const std::string& text);
    std::string toString() const;
    bool isNull() const;

    bool operator==(const DeviceAddress& other) const {
        return bytes == other.bytes;
    }
    bool operator!=(const DeviceAddress& other) const {
        return bytes != other.bytes;
    }
    bool operator<(const DeviceAddress& other) const {
        return bytes < other.bytes;
    }
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Failed
};

const char* toString(ConnectionState state);

inline bool isInFlight(ConnectionState state) {
    return state == ConnectionState::Connecting ||
           state == ConnectionState::Disconnecting;
}

inline bool isSettled(ConnectionState state) {
    return !isInFlight(state);
}

struct Device {
    DeviceAddress address;
    std::string name;
    ConnectionState state{ConnectionState::Disconnected};
    std::string failureReason;      // only set while Failed
    ConnectionState revertState{ConnectionState::Disconnected};
    Timestamp lastObservedAt;

    // State used to validate user requests; a Failed record behaves as the
    // state it will revert to.
    ConnectionState effectiveState() const {
        return state == ConnectionState::Failed ? revertState : state;
    }

    bool operator==(const Device& other) const {
        return address == other.address &&
               name == other.name &&
               state == other.state &&
               failureReason == other.failureReason &&
               revertState == other.revertState &&
               lastObservedAt == other.lastObservedAt;
    }
    bool operator!=(const Device& other) const {
        return !(*this == other);
    }
};

enum class RequestStatus {
    Accepted,
    UnknownDevice,
    AlreadyInFlight,
    NotConnected,
    AlreadyConnected
};

const char* toString(RequestStatus status);

struct GatewayResult {
    bool success{false};
    std::string reason;

    static GatewayResult ok() { return {true, {}}; }
    static GatewayResult failure(std::string why) { return {false, std::move(why)}; }
};

} // namespace bluetray

namespace std {

template<>
struct hash<bluetray::DeviceAddress> {
    size_t operator()(const bluetray::DeviceAddress& address) const noexcept {
        uint64_t value = 0;
        for (uint8_t b : address.bytes) {
            value = (value << 8) | b;
        }
        return hash<uint64_t>{}(value);
    }
};

} // namespace std
