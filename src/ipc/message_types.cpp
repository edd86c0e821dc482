// src/ipc/message_types.cpp
#include "ipc/message_types.h"
#include "logging/logger.h"
#include <chrono>

namespace kiosk_payment::ipc {

int64_t currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool parseCommand(const std::string& text, Command& command) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        logging::Logger::getInstance().warn("Discarding malformed command message");
        return false;
    }
    return command.fromJson(json);
}

bool parseResponse(const std::string& text, Response& response) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        logging::Logger::getInstance().warn("Discarding malformed response message");
        return false;
    }
    return response.fromJson(json);
}

} // namespace kiosk_payment::ipc
