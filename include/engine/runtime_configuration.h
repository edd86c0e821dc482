// include/engine/runtime_configuration.h
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace kiosk_payment::engine {

// Terminal settings supplied with Init. Replaced wholesale by the next
// successful Init, never edited in place.
struct RuntimeConfiguration {
    std::string ipAddress;
    int posNumber = 0;
    bool forceOnline = false;

    nlohmann::json toJson() const {
        return {
            {"IpAddress", ipAddress},
            {"PosNumber", posNumber},
            {"ForceOnline", forceOnline}
        };
    }

    bool fromJson(const nlohmann::json& json) {
        try {
            ipAddress = json.value("IpAddress", "");
            posNumber = json.value("PosNumber", 0);
            forceOnline = json.value("ForceOnline", false);
            return true;
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }
};

} // namespace kiosk_payment::engine
