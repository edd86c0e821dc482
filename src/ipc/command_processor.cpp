// src/ipc/command_processor.cpp
#include "ipc/command_processor.h"
#include "logging/logger.h"
#include <stdexcept>

namespace kiosk_payment::ipc {

CommandProcessor::CommandProcessor(std::shared_ptr<engine::PaymentService> service)
    : service_(std::move(service))
{
    if (!service_) {
        throw std::invalid_argument("CommandProcessor requires a payment service");
    }
}

std::string CommandProcessor::handleMessage(const std::string& message) {
    Command command;
    Response response;
    if (!parseCommand(message, command)) {
        response = createErrorResponse("", STATUS_REJECTED, ERR_INVALID_MESSAGE, "Malformed command message");
    } else {
        response = processCommand(command);
    }
    return response.toJson().dump();
}

Response CommandProcessor::processCommand(const Command& command) {
    logging::Logger::getInstance().debug("Processing command " + command.type + " (" + command.commandId + ")");

    Response response;
    if (command.type == CMD_INIT) {
        response = handleInit(command);
    } else if (command.type == CMD_TEST) {
        response = handleTest(command);
    } else if (command.type == CMD_PAY) {
        response = handlePay(command);
    } else if (command.type == CMD_SHUTDOWN) {
        response = handleShutdown(command);
    } else {
        response = handleUnknownCommand(command);
    }

    response.timestampMs = currentTimestampMs();
    return response;
}

void CommandProcessor::clearCache() {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    payCache_.clear();
    payCacheOrder_.clear();
}

Response CommandProcessor::handleInit(const Command& command) {
    try {
        if (!command.payload.contains("configuration") || command.payload["configuration"].is_null()) {
            return createOutcomeResponse(command.commandId, service_->init(nullptr));
        }

        engine::RuntimeConfiguration configuration;
        if (!command.payload["configuration"].is_object() || !configuration.fromJson(command.payload["configuration"])) {
            return createErrorResponse(command.commandId, STATUS_REJECTED, ERR_INVALID_PAYLOAD,
                "configuration must be an object with IpAddress, PosNumber, ForceOnline");
        }
        return createOutcomeResponse(command.commandId, service_->init(&configuration));
    } catch (const std::exception& e) {
        return createErrorResponse(command.commandId, STATUS_FAILED, ERR_PROCESSING, e.what());
    }
}

Response CommandProcessor::handleTest(const Command& command) {
    return createOutcomeResponse(command.commandId, service_->test());
}

Response CommandProcessor::handlePay(const Command& command) {
    Response cached;
    if (!command.commandId.empty() && findCachedPay(command.commandId, cached)) {
        logging::Logger::getInstance().warn("Duplicate pay command " + command.commandId + ", returning recorded result");
        return cached;
    }

    try {
        auto it = command.payload.find("amount");
        if (it == command.payload.end() || !it->is_number_integer()) {
            return createErrorResponse(command.commandId, STATUS_REJECTED, ERR_INVALID_PAYLOAD,
                "amount (integer, minor units) is required");
        }

        const engine::PaymentOutcome outcome = service_->pay(it->get<int64_t>());
        Response response = createOutcomeResponse(command.commandId, outcome);
        // A call turned away by the single-flight guard never ran, so it may be retried
        const bool rejected = outcome.message == engine::MSG_PAYMENT_IN_PROGRESS
            || outcome.message == engine::MSG_INIT_IN_PROGRESS;
        if (!command.commandId.empty() && !rejected) {
            cachePay(response);
        }
        return response;
    } catch (const std::exception& e) {
        return createErrorResponse(command.commandId, STATUS_FAILED, ERR_PROCESSING, e.what());
    }
}

Response CommandProcessor::handleShutdown(const Command& command) {
    service_->shutdown();

    Response response;
    response.commandId = command.commandId;
    response.status = STATUS_OK;
    return response;
}

Response CommandProcessor::handleUnknownCommand(const Command& command) {
    return createErrorResponse(command.commandId, STATUS_REJECTED, ERR_UNKNOWN_COMMAND,
        "Unknown command type: " + command.type);
}

bool CommandProcessor::findCachedPay(const std::string& commandId, Response& response) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = payCache_.find(commandId);
    if (it == payCache_.end()) {
        return false;
    }
    response = it->second;
    return true;
}

void CommandProcessor::cachePay(const Response& response) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    if (payCache_.count(response.commandId) == 0) {
        payCacheOrder_.push_back(response.commandId);
    }
    payCache_[response.commandId] = response;

    while (payCacheOrder_.size() > PAY_CACHE_SIZE) {
        payCache_.erase(payCacheOrder_.front());
        payCacheOrder_.pop_front();
    }
}

Response CommandProcessor::createOutcomeResponse(const std::string& commandId, const engine::PaymentOutcome& outcome) {
    Response response;
    response.commandId = commandId;
    response.status = STATUS_OK;
    response.result = outcome.toJson();
    return response;
}

Response CommandProcessor::createErrorResponse(const std::string& commandId,
                                               const std::string& status,
                                               const std::string& errorCode,
                                               const std::string& errorMessage) {
    logging::Logger::getInstance().warn("Command " + commandId + " " + status + ": " + errorCode + " " + errorMessage);

    Response response;
    response.commandId = commandId;
    response.status = status;
    response.error = {
        {"code", errorCode},
        {"message", errorMessage}
    };
    response.timestampMs = currentTimestampMs();
    return response;
}

} // namespace kiosk_payment::ipc
