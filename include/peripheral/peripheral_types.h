// include/peripheral/peripheral_types.h
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kiosk_payment::peripheral {

// Editor type of a configurable setting
enum class SettingDataType {
    String,
    Bool,
    Int,
    IpAddress
};

// Convert setting type to string
inline std::string settingDataTypeToString(SettingDataType type) {
    switch (type) {
        case SettingDataType::String: return "String";
        case SettingDataType::Bool: return "Bool";
        case SettingDataType::Int: return "Int";
        case SettingDataType::IpAddress: return "IpAddress";
        default: return "String";
    }
}

// Convert string to setting type
inline SettingDataType stringToSettingDataType(const std::string& str) {
    if (str == "Bool") return SettingDataType::Bool;
    if (str == "Int") return SettingDataType::Int;
    if (str == "IpAddress") return SettingDataType::IpAddress;
    return SettingDataType::String; // Default
}

struct AdminPeripheralSetting {
    SettingDataType controlType = SettingDataType::String;
    std::string controlName;
    std::string realName;      // key matched by updateSettings
    std::string currentValue;
    std::string controlDescription;

    nlohmann::json toJson() const {
        return {
            {"ControlType", settingDataTypeToString(controlType)},
            {"ControlName", controlName},
            {"RealName", realName},
            {"CurrentValue", currentValue},
            {"ControlDescription", controlDescription}
        };
    }

    bool fromJson(const nlohmann::json& json) {
        try {
            controlType = stringToSettingDataType(json.value("ControlType", "String"));
            controlName = json.value("ControlName", "");
            realName = json.value("RealName", "");
            currentValue = json.value("CurrentValue", "");
            controlDescription = json.value("ControlDescription", "");
            return !realName.empty();
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }
};

// Factory description of the peripheral as shown to the host's admin tools
struct PaymentFactoryConfig {
    std::string id;
    std::string paymentName;
    std::string driverFolderName;
    std::vector<AdminPeripheralSetting> configurationSettings;

    nlohmann::json toJson() const {
        nlohmann::json settings = nlohmann::json::array();
        for (const auto& setting : configurationSettings) {
            settings.push_back(setting.toJson());
        }
        return {
            {"Id", id},
            {"PaymentName", paymentName},
            {"DriverFolderName", driverFolderName},
            {"ConfigurationSettings", settings}
        };
    }
};

struct PeripheralStatus {
    static constexpr int STATUS_OK = 0;
    static constexpr int STATUS_GENERIC_ERROR = 1;
    static constexpr int STATUS_NOT_CONFIGURED = 2;

    int status = STATUS_NOT_CONFIGURED;
    std::string description = "Not configured";

    bool isOk() const { return status == STATUS_OK; }

    static PeripheralStatus ok() { return {STATUS_OK, "OK"}; }
    static PeripheralStatus genericError() { return {STATUS_GENERIC_ERROR, "Generic error"}; }
    static PeripheralStatus notConfigured() { return {STATUS_NOT_CONFIGURED, "Not configured"}; }
};

struct PaymentCapability {
    bool acceptsCash = false;
    bool canRefund = false;
    bool receivePayProgressCalls = false;
};

struct PayRequest {
    int64_t amount = 0;   // minor currency units
};

struct PayDetails {
    int64_t paidAmount = 0;
    bool hasClientReceipt = false;
};

struct StatusDetails {
    int statusCode = 0;   // ResultCode of the driver call
    std::string description;
};

} // namespace kiosk_payment::peripheral
