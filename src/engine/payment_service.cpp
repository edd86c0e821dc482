// src/engine/payment_service.cpp
#include "engine/payment_service.h"
#include "logging/logger.h"
#include "persistence/receipt_builder.h"
#include "terminal/transaction_codes.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kiosk_payment::engine {

using terminal::TerminalErrc;
using terminal::TransactionResult;
using terminal::terminalErrcToString;

namespace {

std::string formatAmount(int64_t amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(amount) / 100.0);
    return oss.str();
}

} // namespace

PaymentService::PaymentService(std::shared_ptr<EngineContext> context,
                               terminal::TerminalApiFactory apiFactory,
                               std::shared_ptr<persistence::TransactionStore> store,
                               ShutdownHandler shutdownHandler)
    : context_(std::move(context))
    , apiFactory_(std::move(apiFactory))
    , store_(std::move(store))
    , shutdownHandler_(std::move(shutdownHandler))
    , payInProgress_(false) {
    if (!context_ || !apiFactory_ || !store_) {
        throw std::invalid_argument("PaymentService requires a context, a terminal factory and a store");
    }
}

PaymentOutcome PaymentService::init(const RuntimeConfiguration* configuration) {
    auto& logger = logging::Logger::getInstance();
    logger.info("Init method started...");

    std::unique_lock<std::mutex> lock(operationMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        PaymentOutcome outcome = busyOutcome();
        logger.warn("Init rejected: " + outcome.message);
        logger.info("Init method finished.");
        return outcome;
    }

    PaymentOutcome outcome;
    try {
        outcome = runInit(configuration);
    } catch (const std::exception& e) {
        logger.error("Init exception: " + std::string(e.what()));
        outcome = PaymentOutcome::make(ResultCode::GenericError, e.what());
    }

    logger.info("Init method finished.");
    return outcome;
}

PaymentOutcome PaymentService::runInit(const RuntimeConfiguration* configuration) {
    auto& logger = logging::Logger::getInstance();

    if (configuration == nullptr) {
        logger.info("Can not set configuration to null.");
        return PaymentOutcome::make(ResultCode::ValidationError, "Configuration is missing");
    }

    logger.info("IP Address value : " + configuration->ipAddress);

    if (configuration->posNumber <= 0) {
        logger.info("Invalid PosNumber " + std::to_string(configuration->posNumber) + ".");
        return PaymentOutcome::make(ResultCode::ValidationError,
            "Invalid PosNumber " + std::to_string(configuration->posNumber));
    }
    if (configuration->ipAddress.empty()) {
        logger.info("Invalid IPAddress " + configuration->ipAddress + ".");
        return PaymentOutcome::make(ResultCode::ValidationError, "Invalid IpAddress");
    }

    terminal::TerminalConnection connection(apiFactory_());
    TerminalErrc connectResult = connection.open(configuration->ipAddress);
    logger.info("Connect Result: " + terminalErrcToString(connectResult));

    if (connectResult != TerminalErrc::OK) {
        return PaymentOutcome::make(ResultCode::ConnectError,
            "Connect failed: " + terminalErrcToString(connectResult), static_cast<int>(connectResult));
    }

    context_->setConfiguration(*configuration);
    context_->heartbeat().start();
    logger.info("Init success!");

    closeConnection(connection);
    return PaymentOutcome::make(ResultCode::Success, "Init success");
}

PaymentOutcome PaymentService::test() const {
    const bool alive = context_->heartbeat().alive();
    logging::Logger::getInstance().debug(std::string("Test status: ") + (alive ? "true" : "false"));
    if (!alive) {
        return PaymentOutcome::make(ResultCode::GenericError, "Heartbeat is not alive");
    }
    return PaymentOutcome::make(ResultCode::Success, "Alive");
}

PaymentOutcome PaymentService::pay(int64_t amount) {
    auto& logger = logging::Logger::getInstance();
    logger.info("Pay method started...");
    logger.info("Amount = " + formatAmount(amount) + ".");

    std::unique_lock<std::mutex> lock(operationMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        PaymentOutcome outcome = busyOutcome();
        logger.warn("Pay rejected: " + outcome.message);
        logger.info("Pay method finished.");
        return outcome;
    }

    payInProgress_ = true;
    PaymentOutcome outcome;
    try {
        outcome = runPayment(amount);
    } catch (const std::exception& e) {
        logger.error("Pay exception: " + std::string(e.what()));
        outcome = PaymentOutcome::make(ResultCode::GenericError, e.what());
    }
    payInProgress_ = false;

    logger.info("Pay outcome: " + resultCodeToString(outcome.code) + " / "
        + paymentResultToString(outcome.data.result) + ", paid " + formatAmount(outcome.data.paidAmount));
    logger.info("Pay method finished.");
    return outcome;
}

PaymentOutcome PaymentService::runPayment(int64_t amount) {
    auto& logger = logging::Logger::getInstance();

    // A ticket left by an earlier attempt must never reach this customer
    if (!store_->deletePendingTicket()) {
        logger.warn("Stale customer ticket could not be removed");
    }

    if (amount <= 0) {
        logger.info("Invalid pay amount.");
        return PaymentOutcome::make(ResultCode::ValidationError, "Invalid pay amount");
    }

    RuntimeConfiguration configuration;
    if (!context_->getConfiguration(configuration)) {
        logger.error("Pay called before a successful Init.");
        return PaymentOutcome::make(ResultCode::GenericError, "Payment service is not initialised");
    }

    logger.info("Calling payment driver...");

    terminal::TerminalConnection connection(apiFactory_());
    TerminalErrc connectResult = connection.open(configuration.ipAddress);
    logger.info("Connect Result: " + terminalErrcToString(connectResult));

    if (connectResult != TerminalErrc::OK) {
        return PaymentOutcome::make(ResultCode::ConnectError,
            "Connect failed: " + terminalErrcToString(connectResult), static_cast<int>(connectResult));
    }

    terminal::TransactionResponse payResponse;
    TerminalErrc payResult = connection.pay(amount, payResponse);
    logger.info("Pay Result: " + terminalErrcToString(payResult));

    if (payResult != TerminalErrc::OK) {
        return PaymentOutcome::make(ResultCode::SubmitError,
            "Pay request failed: " + terminalErrcToString(payResult), static_cast<int>(payResult));
    }

    const TransactionResult status = terminal::getTransactionOutResult(payResponse.transactionStatus);
    logger.info("Pay Response Data: " + terminal::transactionResultToString(status));

    if (status == TransactionResult::Failed) {
        logger.info("Payment Failed.");
        persistTransaction(payResponse);
        createCustomerTicket(persistence::PAYMENT_FAILURE_NOTICE);

        PaymentOutcome outcome = PaymentOutcome::make(ResultCode::TransactionFailed,
            terminal::diagTxnStatus(payResponse.transactionStatus));
        outcome.data.result = PaymentResult::Failed;
        outcome.data.hasClientReceipt = true;
        return outcome;
    }

    if (status != TransactionResult::Successful) {
        // Neither approved nor declined. Cancelled stays reserved for reversals,
        // which always carry a customer notice.
        logger.info("Payment not completed: " + terminal::diagTxnStatus(payResponse.transactionStatus));
        persistTransaction(payResponse);

        PaymentOutcome outcome = PaymentOutcome::make(ResultCode::Success,
            terminal::diagTxnStatus(payResponse.transactionStatus), static_cast<int>(payResult));
        outcome.data.result = PaymentResult::Error;
        return outcome;
    }

    return completeAuthorisedPayment(connection, amount, payResponse);
}

PaymentOutcome PaymentService::completeAuthorisedPayment(terminal::TerminalConnection& connection, int64_t amount,
                                                         const terminal::TransactionResponse& payResponse) {
    auto& logger = logging::Logger::getInstance();

    PaymentOutcome outcome;
    outcome.data.result = PaymentResult::Successful;
    outcome.data.paidAmount = amount;

    if (terminal::requiresSignature(payResponse)) {
        logger.info("This transaction requires a signature. We will reverse it");

        terminal::TransactionResponse reverseResponse;
        TerminalErrc reverseResult = TerminalErrc::Unknown;
        try {
            reverseResult = connection.reverse(amount, reverseResponse);
        } catch (const std::exception& e) {
            // The sale is authorised at this point, so the notice and record below still apply
            logger.error("Reverse exception: " + std::string(e.what()));
        }
        logger.info("Reverse Result: " + terminalErrcToString(reverseResult));
        logger.info("Reverse Response Data: " + terminal::transactionResultToString(
            terminal::getTransactionOutResult(reverseResponse.transactionStatus)));

        createCustomerTicket(persistence::PAYMENT_FAILURE_NOTICE);

        if (reverseResult == TerminalErrc::OK) {
            persistTransaction(reverseResponse);
        } else {
            // Keep the authorisation on record when the terminal gave no reversal
            logger.error("Reversal failed, the authorisation may still be captured");
            persistTransaction(payResponse);
            outcome.data.uncertain = true;
        }

        outcome.code = ResultCode::TransactionCancelled;
        outcome.terminalCode = static_cast<int>(reverseResult);
        outcome.message = "Signature required, transaction reversed";
        outcome.data.result = PaymentResult::Cancelled;
        outcome.data.paidAmount = 0;
        outcome.data.hasClientReceipt = true;

        logger.info("Cancelling the transaction");
        closeConnection(connection);
        return outcome;
    }

    const bool confirmed = terminal::parseTerminalErrc(payResponse.diagRequestOut) == TerminalErrc::OK;
    if (confirmed) {
        logger.info("transaction status: " + terminal::diagTxnStatus(payResponse.transactionStatus));
    }

    if (confirmed && terminal::getTransactionOutResult(payResponse.transactionStatus) == TransactionResult::Successful) {
        logger.info("Transaction Successful");
        createCustomerTicket(persistence::ReceiptBuilder::buildCustomerReceipt(
            payResponse, std::chrono::system_clock::now()));

        outcome.code = ResultCode::Success;
        outcome.message = "Payment succeeded";
        outcome.data.hasClientReceipt = true;
        logger.info("Payment succeeded.");
    } else {
        logger.error("Authorisation could not be confirmed (diagnostic " + payResponse.diagRequestOut + ")");
        outcome.code = ResultCode::GenericError;
        outcome.message = "Authorisation could not be confirmed";
        outcome.data.result = PaymentResult::Error;
        outcome.data.paidAmount = 0;
        outcome.data.uncertain = true;
    }

    persistTransaction(payResponse);
    closeConnection(connection);
    return outcome;
}

void PaymentService::shutdown() {
    logging::Logger::getInstance().info("Shutting down...");
    context_->heartbeat().stop();
    if (shutdownHandler_) {
        shutdownHandler_();
    }
}

void PaymentService::persistTransaction(const terminal::TransactionResponse& response) {
    if (!store_->persistTransaction(response)) {
        logging::Logger::getInstance().warn("Transaction record not written: " + store_->getLastError());
    }
}

void PaymentService::createCustomerTicket(const std::string& content) {
    if (!store_->writeCustomerTicket(content)) {
        logging::Logger::getInstance().warn("Customer ticket not written: " + store_->getLastError());
    }
}

void PaymentService::closeConnection(terminal::TerminalConnection& connection) {
    TerminalErrc disconnectResult = connection.close();
    logging::Logger::getInstance().info("Disconnect Result: " + terminalErrcToString(disconnectResult));
    if (disconnectResult != TerminalErrc::OK) {
        logging::Logger::getInstance().warn("Terminal disconnect failed, outcome unchanged");
    }
}

PaymentOutcome PaymentService::busyOutcome() const {
    return PaymentOutcome::make(ResultCode::GenericError,
        payInProgress_ ? MSG_PAYMENT_IN_PROGRESS : MSG_INIT_IN_PROGRESS);
}

} // namespace kiosk_payment::engine
