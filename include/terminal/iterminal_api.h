// include/terminal/iterminal_api.h
#pragma once

#include "terminal/terminal_types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kiosk_payment::terminal {

// Outbound terminal contract, implemented by the vendor SDK binding.
// Every call is a synchronous round-trip to the physical terminal.
class ITerminalApi {
public:
    virtual ~ITerminalApi() = default;

    virtual TerminalErrc connect(const std::string& address) = 0;

    /// amount: minor currency units
    virtual TerminalErrc pay(int64_t amount, TransactionResponse& response) = 0;

    /// Unwinds a just-authorised charge of `amount`.
    virtual TerminalErrc reverse(int64_t amount, TransactionResponse& response) = 0;

    virtual TerminalErrc disconnect() = 0;
};

// Creates a fresh SDK instance per logical session.
using TerminalApiFactory = std::function<std::unique_ptr<ITerminalApi>()>;

} // namespace kiosk_payment::terminal
