// include/ipc/message_types.h
#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace kiosk_payment::ipc {

// Protocol version
constexpr const char* PROTOCOL_VERSION = "1.0";

// Message kinds
constexpr const char* MSG_KIND_COMMAND = "command";
constexpr const char* MSG_KIND_RESPONSE = "response";

// Status values
constexpr const char* STATUS_OK = "OK";
constexpr const char* STATUS_REJECTED = "REJECTED";
constexpr const char* STATUS_FAILED = "FAILED";

// Command types served by the driver
constexpr const char* CMD_INIT = "init";
constexpr const char* CMD_TEST = "test";
constexpr const char* CMD_PAY = "pay";
constexpr const char* CMD_SHUTDOWN = "shutdown";

// Error codes carried in Response::error
constexpr const char* ERR_INVALID_MESSAGE = "INVALID_MESSAGE";
constexpr const char* ERR_INVALID_PAYLOAD = "INVALID_PAYLOAD";
constexpr const char* ERR_UNKNOWN_COMMAND = "UNKNOWN_COMMAND";
constexpr const char* ERR_PROCESSING = "PROCESSING_ERROR";

int64_t currentTimestampMs();

// Base message structure
struct Message {
    std::string protocolVersion;
    std::string kind;
    int64_t timestampMs;

    Message() : protocolVersion(PROTOCOL_VERSION), timestampMs(0) {}
    virtual ~Message() = default;
    virtual nlohmann::json toJson() const = 0;
    virtual bool fromJson(const nlohmann::json& json) = 0;
};

// Command message
struct Command : public Message {
    std::string commandId;
    std::string type;
    nlohmann::json payload;

    Command() {
        kind = MSG_KIND_COMMAND;
        payload = nlohmann::json::object();
    }

    nlohmann::json toJson() const override {
        return {
            {"protocolVersion", protocolVersion},
            {"kind", kind},
            {"commandId", commandId},
            {"type", type},
            {"timestampMs", timestampMs},
            {"payload", payload}
        };
    }

    bool fromJson(const nlohmann::json& json) override {
        try {
            protocolVersion = json.value("protocolVersion", PROTOCOL_VERSION);
            kind = json.value("kind", MSG_KIND_COMMAND);
            commandId = json.value("commandId", "");
            type = json.value("type", "");
            timestampMs = json.value("timestampMs", static_cast<int64_t>(0));
            payload = json.value("payload", nlohmann::json::object());
            return kind == MSG_KIND_COMMAND && !type.empty();
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }
};

// Response message
struct Response : public Message {
    std::string commandId;
    std::string status;
    nlohmann::json error;  // null or {code, message}
    nlohmann::json result;

    Response() {
        kind = MSG_KIND_RESPONSE;
        status = STATUS_OK;
        result = nlohmann::json::object();
    }

    nlohmann::json toJson() const override {
        auto json = nlohmann::json{
            {"protocolVersion", protocolVersion},
            {"kind", kind},
            {"commandId", commandId},
            {"status", status},
            {"timestampMs", timestampMs},
            {"result", result}
        };
        if (!error.is_null()) {
            json["error"] = error;
        } else {
            json["error"] = nullptr;
        }
        return json;
    }

    bool fromJson(const nlohmann::json& json) override {
        try {
            protocolVersion = json.value("protocolVersion", PROTOCOL_VERSION);
            kind = json.value("kind", MSG_KIND_RESPONSE);
            commandId = json.value("commandId", "");
            status = json.value("status", STATUS_OK);
            timestampMs = json.value("timestampMs", static_cast<int64_t>(0));
            error = json.value("error", nlohmann::json());
            result = json.value("result", nlohmann::json::object());
            return kind == MSG_KIND_RESPONSE;
        } catch (const nlohmann::json::exception&) {
            return false;
        }
    }
};

// Parses one framed message body; false on malformed JSON or wrong kind.
bool parseCommand(const std::string& text, Command& command);
bool parseResponse(const std::string& text, Response& response);

} // namespace kiosk_payment::ipc
