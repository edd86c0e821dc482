// include/vendor_adapters/simulator/simulated_terminal.h
// Scripted terminal backend (terminal.backend=simulator). Lets the driver run
// on a bench or in CI without the vendor SDK or a physical terminal.
#pragma once

#include "terminal/iterminal_api.h"
#include <chrono>
#include <string>

namespace kiosk_payment::vendor::simulator {

struct SimulatorSettings {
    terminal::TerminalErrc connectResult = terminal::TerminalErrc::OK;
    terminal::TerminalErrc payResult = terminal::TerminalErrc::OK;
    terminal::TerminalErrc reverseResult = terminal::TerminalErrc::OK;
    std::string transactionStatus = "0";   // approved online
    std::string entryMethod = "1";         // chip
    std::string cvm = "1";                 // PIN
    std::string diagRequestOut = "0";
    std::string currency = "826";
    std::chrono::milliseconds processingDelay{0};

    // Reads simulator.* keys from ConfigManager.
    static SimulatorSettings fromConfig();
};

class SimulatedTerminal : public terminal::ITerminalApi {
public:
    explicit SimulatedTerminal(SimulatorSettings settings);
    ~SimulatedTerminal() override = default;

    terminal::TerminalErrc connect(const std::string& address) override;
    terminal::TerminalErrc pay(int64_t amount, terminal::TransactionResponse& response) override;
    terminal::TerminalErrc reverse(int64_t amount, terminal::TransactionResponse& response) override;
    terminal::TerminalErrc disconnect() override;

private:
    terminal::TransactionResponse buildResponse(int64_t amount, const std::string& transactionType,
                                                const std::string& status);

    SimulatorSettings settings_;
    std::string address_;
    bool connected_;
    unsigned int receiptCounter_;
};

} // namespace kiosk_payment::vendor::simulator
