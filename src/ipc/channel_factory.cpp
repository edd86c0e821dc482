// src/ipc/channel_factory.cpp
#include "ipc/channel_factory.h"
#include "common/uuid_generator.h"
#include "config/config_manager.h"
#include "ipc/local_socket.h"
#include "logging/logger.h"

namespace kiosk_payment::ipc {

ChannelOptions ChannelOptions::fromConfig() {
    auto& config = config::ConfigManager::getInstance();
    ChannelOptions options;
    options.openTimeout = config.getMilliseconds(config::KEY_IPC_OPEN_TIMEOUT);
    options.sendTimeout = config.getMilliseconds(config::KEY_IPC_SEND_TIMEOUT);
    options.receiveTimeout = config.getMilliseconds(config::KEY_IPC_RECEIVE_TIMEOUT);
    options.closeTimeout = config.getMilliseconds(config::KEY_IPC_CLOSE_TIMEOUT);
    return options;
}

ChannelSession::ChannelSession(const std::string& endpointPath, const ChannelOptions& options)
    : endpointPath_(endpointPath)
    , options_(options) {
}

Command ChannelSession::makeCommand(const std::string& type) const {
    Command command;
    command.commandId = UUIDGenerator::generate();
    command.type = type;
    command.timestampMs = currentTimestampMs();
    return command;
}

Response ChannelSession::call(const Command& command, std::chrono::milliseconds replyTimeout) {
    LocalSocket socket;
    if (!socket.connectTo(endpointPath_, options_.openTimeout)) {
        throw ChannelError("Cannot open channel to " + endpointPath_ + ": " + socket.getLastError(), false);
    }

    if (!socket.sendMessage(command.toJson().dump(), options_.sendTimeout)) {
        throw ChannelError("Cannot send " + command.type + " request: " + socket.getLastError(), false);
    }

    std::string reply;
    if (!socket.receiveMessage(reply, replyTimeout)) {
        throw ChannelError("No reply to " + command.type + " request: " + socket.getLastError(), true);
    }

    Response response;
    if (!parseResponse(reply, response)) {
        throw ChannelError("Malformed reply to " + command.type + " request", true);
    }
    if (!response.commandId.empty() && response.commandId != command.commandId) {
        throw ChannelError("Reply does not match " + command.type + " request " + command.commandId, true);
    }
    return response;
}

engine::PaymentOutcome ChannelSession::toOutcome(const Response& response) const {
    if (response.status != STATUS_OK) {
        std::string message = "Driver " + response.status;
        if (response.error.is_object()) {
            message += ": " + response.error.value("code", std::string()) + " " + response.error.value("message", std::string());
        }
        return engine::PaymentOutcome::make(ResultCode::GenericError, message);
    }

    engine::PaymentOutcome outcome;
    if (!outcome.fromJson(response.result)) {
        return engine::PaymentOutcome::make(ResultCode::GenericError, "Unreadable result from driver");
    }
    return outcome;
}

engine::PaymentOutcome ChannelSession::init(const engine::RuntimeConfiguration& configuration) {
    Command command = makeCommand(CMD_INIT);
    command.payload = {{"configuration", configuration.toJson()}};
    return toOutcome(call(command, options_.receiveTimeout));
}

engine::PaymentOutcome ChannelSession::test() {
    return toOutcome(call(makeCommand(CMD_TEST), options_.receiveTimeout));
}

engine::PaymentOutcome ChannelSession::pay(int64_t amount) {
    Command command = makeCommand(CMD_PAY);
    command.payload = {{"amount", amount}};
    return toOutcome(call(command, options_.receiveTimeout));
}

void ChannelSession::shutdown() {
    Response response = call(makeCommand(CMD_SHUTDOWN), options_.closeTimeout);
    if (response.status != STATUS_OK) {
        logging::Logger::getInstance().warn("Driver answered shutdown with " + response.status);
    }
}

ChannelFactory::ChannelFactory(const std::string& endpointPath, const ChannelOptions& options)
    : endpointPath_(endpointPath)
    , options_(options) {
}

std::unique_ptr<ChannelSession> ChannelFactory::createChannel() const {
    return std::make_unique<ChannelSession>(endpointPath_, options_);
}

bool ChannelFactory::probe(std::chrono::milliseconds timeout) const {
    LocalSocket socket;
    return socket.connectTo(endpointPath_, timeout);
}

} // namespace kiosk_payment::ipc
