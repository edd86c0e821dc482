// src/terminal/terminal_connection.cpp
#include "terminal/terminal_connection.h"
#include "logging/logger.h"
#include <stdexcept>

namespace kiosk_payment::terminal {

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

TerminalConnection::TerminalConnection(std::unique_ptr<ITerminalApi> api)
    : api_(std::move(api))
    , state_(ConnectionState::Disconnected) {
    if (!api_) {
        throw std::invalid_argument("TerminalConnection requires a terminal API instance");
    }
}

TerminalConnection::~TerminalConnection() {
    try {
        TerminalErrc result = close();
        if (result != TerminalErrc::OK) {
            logging::Logger::getInstance().warn(
                "Terminal disconnect on release returned " + terminalErrcToString(result));
        }
    } catch (const std::exception& e) {
        logging::Logger::getInstance().error("Terminal disconnect on release threw: " + std::string(e.what()));
    }
}

TerminalErrc TerminalConnection::open(const std::string& address) {
    address_ = address;
    state_ = ConnectionState::Connecting;

    TerminalErrc result = api_->connect(address);
    state_ = (result == TerminalErrc::OK) ? ConnectionState::Connected : ConnectionState::Failed;
    return result;
}

TerminalErrc TerminalConnection::pay(int64_t amount, TransactionResponse& response) {
    if (state_ != ConnectionState::Connected) {
        return TerminalErrc::NotConnected;
    }
    return api_->pay(amount, response);
}

TerminalErrc TerminalConnection::reverse(int64_t amount, TransactionResponse& response) {
    if (state_ != ConnectionState::Connected) {
        return TerminalErrc::NotConnected;
    }
    return api_->reverse(amount, response);
}

TerminalErrc TerminalConnection::close() {
    if (state_ != ConnectionState::Connected) {
        state_ = ConnectionState::Disconnected;
        return TerminalErrc::OK;
    }
    // Mark first so a throwing SDK is not called twice
    state_ = ConnectionState::Disconnected;
    return api_->disconnect();
}

} // namespace kiosk_payment::terminal
