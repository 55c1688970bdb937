#include <bluetray/Types.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bluetray {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isSeparator(char c) {
    return c == ':' || c == '-' || c == '_';
}

} // namespace

std::optional<DeviceAddress> DeviceAddress::fromString(const std::string& text) {
    // Six octets, five separators
    if (text.size() != 17) {
        return std::nullopt;
    }

    DeviceAddress address;
    for (size_t i = 0; i < address.bytes.size(); ++i) {
        size_t pos = i * 3;
        int hi = hexValue(text[pos]);
        int lo = hexValue(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        if (i + 1 < address.bytes.size() && !isSeparator(text[pos + 2])) {
            return std::nullopt;
        }
        address.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return address;
}

std::string DeviceAddress::toString() const {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) ss << ":";
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool DeviceAddress::isNull() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:  return "Disconnected";
        case ConnectionState::Connecting:    return "Connecting";
        case ConnectionState::Connected:     return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        case ConnectionState::Failed:        return "Failed";
        default:                             return "Unknown";
    }
}

const char* toString(RequestStatus status) {
    switch (status) {
        case RequestStatus::Accepted:         return "Accepted";
        case RequestStatus::UnknownDevice:    return "UnknownDevice";
        case RequestStatus::AlreadyInFlight:  return "AlreadyInFlight";
        case RequestStatus::NotConnected:     return "NotConnected";
        case RequestStatus::AlreadyConnected: return "AlreadyConnected";
        default:                              return "Unknown";
    }
}

} // namespace bluetray
