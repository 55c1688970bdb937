#pragma once

namespace bluetray {

constexpr const char* APPLICATION_NAME = "Bluetooth Tray";
constexpr const char* APPLICATION_VERSION = "1.0.0";

constexpr int DEFAULT_FAILURE_COOLDOWN = 3000;   // ms
constexpr int DEFAULT_GATEWAY_TIMEOUT = 30000;   // ms
constexpr int DEFAULT_MAX_CONCURRENT_OPERATIONS = 4;
constexpr int NOTIFICATION_DURATION = 3000;      // ms

namespace ConfigKeys {
    constexpr const char* FAILURE_COOLDOWN = "failureCooldownMs";
    constexpr const char* GATEWAY_TIMEOUT = "gatewayTimeoutMs";
    constexpr const char* MAX_CONCURRENT_OPERATIONS = "maxConcurrentOperations";
    constexpr const char* SHOW_NOTIFICATIONS = "showNotifications";
    constexpr const char* LOG_LEVEL = "logLevel";
    constexpr const char* LOG_FILE = "logFile";

    // Per-device keys
    constexpr const char* DEVICE_ALIAS = "alias";
    constexpr const char* DEVICE_HIDDEN = "hidden";
}

namespace ExitCodes {
    constexpr int SUCCESS = 0;
    constexpr int FATAL_ERROR = 1;
    constexpr int BLUETOOTH_UNAVAILABLE = 2;
}

}
