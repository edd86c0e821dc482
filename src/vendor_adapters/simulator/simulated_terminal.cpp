// src/vendor_adapters/simulator/simulated_terminal.cpp
#include "vendor_adapters/simulator/simulated_terminal.h"
#include "config/config_manager.h"
#include "logging/logger.h"
#include "terminal/transaction_codes.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace kiosk_payment::vendor::simulator {

namespace {

std::string stringOr(const config::ConfigManager& config, const char* key, const std::string& fallback) {
    std::string value = config.getString(key);
    return value.empty() ? fallback : value;
}

terminal::TerminalErrc errcOr(const config::ConfigManager& config, const char* key, terminal::TerminalErrc fallback) {
    std::string value = config.getString(key);
    return value.empty() ? fallback : terminal::parseTerminalErrc(value);
}

} // namespace

SimulatorSettings SimulatorSettings::fromConfig() {
    auto& config = config::ConfigManager::getInstance();
    SimulatorSettings settings;
    settings.connectResult = errcOr(config, "simulator.connect_result", settings.connectResult);
    settings.payResult = errcOr(config, "simulator.pay_result", settings.payResult);
    settings.reverseResult = errcOr(config, "simulator.reverse_result", settings.reverseResult);
    settings.transactionStatus = stringOr(config, "simulator.transaction_status", settings.transactionStatus);
    settings.entryMethod = stringOr(config, "simulator.entry_method", settings.entryMethod);
    settings.cvm = stringOr(config, "simulator.cvm", settings.cvm);
    settings.diagRequestOut = stringOr(config, "simulator.diag_result", settings.diagRequestOut);
    settings.currency = stringOr(config, "simulator.currency", settings.currency);
    settings.processingDelay = config.getMilliseconds("simulator.processing_delay_ms");
    return settings;
}

SimulatedTerminal::SimulatedTerminal(SimulatorSettings settings)
    : settings_(std::move(settings))
    , connected_(false)
    , receiptCounter_(0) {
}

terminal::TerminalErrc SimulatedTerminal::connect(const std::string& address) {
    if (connected_) {
        return terminal::TerminalErrc::AlreadyConnected;
    }
    logging::Logger::getInstance().debug("Simulator: connect to " + address);
    if (settings_.connectResult == terminal::TerminalErrc::OK) {
        address_ = address;
        connected_ = true;
    }
    return settings_.connectResult;
}

terminal::TerminalErrc SimulatedTerminal::pay(int64_t amount, terminal::TransactionResponse& response) {
    if (!connected_) {
        return terminal::TerminalErrc::NotConnected;
    }
    if (amount <= 0) {
        return terminal::TerminalErrc::InvalidParameter;
    }
    if (settings_.processingDelay.count() > 0) {
        std::this_thread::sleep_for(settings_.processingDelay);
    }
    response = buildResponse(amount, "0", settings_.transactionStatus);
    return settings_.payResult;
}

terminal::TerminalErrc SimulatedTerminal::reverse(int64_t amount, terminal::TransactionResponse& response) {
    if (!connected_) {
        return terminal::TerminalErrc::NotConnected;
    }
    response = buildResponse(amount, "2", terminal::STATUS_REVERSED);
    return settings_.reverseResult;
}

terminal::TerminalErrc SimulatedTerminal::disconnect() {
    if (!connected_) {
        return terminal::TerminalErrc::NotConnected;
    }
    connected_ = false;
    return terminal::TerminalErrc::OK;
}

terminal::TransactionResponse SimulatedTerminal::buildResponse(int64_t amount, const std::string& transactionType,
                                                               const std::string& status) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream dateTime;
    dateTime << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

    terminal::TransactionResponse response;
    response.transactionStatus = status;
    response.entryMethod = settings_.entryMethod;
    response.merchantName = "KIOSK SIMULATOR";
    response.merchantAddress1 = "1 TEST STREET";
    response.merchantAddress2 = "LONDON";
    response.acquirerMerchantId = "0000000001";
    response.terminalId = address_.empty() ? "SIM00001" : "SIM-" + address_;
    response.aid = "A0000000031010";
    response.cardSchemeName = "VISA";
    response.pan = "************0119";
    response.panSeqNum = "01";
    response.transactionType = transactionType;
    response.currency = settings_.currency;
    response.transactionAmount = std::to_string(amount);
    response.totalAmount = std::to_string(amount);
    response.cvm = settings_.cvm;
    response.hostMessage = "AUTH CODE: 123456";
    response.diagRequestOut = settings_.diagRequestOut;
    response.acquirerResponseCode = "00";
    response.receiptNumber = std::to_string(++receiptCounter_);
    response.txnDateTime = dateTime.str();
    return response;
}

} // namespace kiosk_payment::vendor::simulator
