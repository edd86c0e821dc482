// include/terminal/terminal_connection.h
#pragma once

#include "terminal/iterminal_api.h"
#include <memory>
#include <string>

namespace kiosk_payment::terminal {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

std::string connectionStateToString(ConnectionState state);

// One logical session to the terminal, owned by the operation that opens it.
// The destructor disconnects a still-connected session, so every exit path
// of the owning call releases the terminal.
class TerminalConnection {
public:
    explicit TerminalConnection(std::unique_ptr<ITerminalApi> api);
    ~TerminalConnection();

    TerminalConnection(const TerminalConnection&) = delete;
    TerminalConnection& operator=(const TerminalConnection&) = delete;

    TerminalErrc open(const std::string& address);
    TerminalErrc pay(int64_t amount, TransactionResponse& response);
    TerminalErrc reverse(int64_t amount, TransactionResponse& response);

    /// Disconnects if connected; returns OK when nothing was open.
    TerminalErrc close();

    ConnectionState getState() const { return state_; }
    const std::string& getAddress() const { return address_; }

private:
    std::unique_ptr<ITerminalApi> api_;
    std::string address_;
    ConnectionState state_;
};

} // namespace kiosk_payment::terminal
