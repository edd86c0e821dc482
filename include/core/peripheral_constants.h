// include/core/peripheral_constants.h
// Identity of the payment peripheral and shared helpers used by both processes.
#pragma once

#include <string>

namespace kiosk_payment::core {

// --- Peripheral identity ---
constexpr const char* kPeripheralId   = "3f8a61c2-5d0e-4b7a-9c41-2e6f0d9b7a15";
constexpr const char* kPeripheralName = "UK_BARCLAYS_ECRUTILATL";
constexpr const char* kPeripheralType = "PAYMENT";
constexpr const char* kDriverVersion  = "1.0.0";
constexpr int kMinApiLevel = 1;

// --- Driver process defaults ---
constexpr const char* kDefaultDriverPath  = "driver/payment_driver";
constexpr const char* kDefaultEndpointDir = "/tmp";

/// Socket path of the driver endpoint, scoped to the peripheral name.
inline std::string endpointPathFor(const std::string& endpointDir) {
    std::string dir = endpointDir.empty() ? std::string(kDefaultEndpointDir) : endpointDir;
    if (dir.back() != '/') {
        dir += '/';
    }
    return dir + kPeripheralName + ".sock";
}

/// Returns true when the value is "1", "true", or "yes" (case-insensitive for true/yes).
inline bool isEnabled(const std::string& value) {
    return value == "1" || value == "true" || value == "True" || value == "TRUE"
        || value == "yes" || value == "Yes";
}

} // namespace kiosk_payment::core
