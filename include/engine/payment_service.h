// include/engine/payment_service.h
#pragma once

#include "engine/engine_context.h"
#include "engine/payment_outcome.h"
#include "engine/runtime_configuration.h"
#include "persistence/transaction_store.h"
#include "terminal/iterminal_api.h"
#include "terminal/terminal_connection.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace kiosk_payment::engine {

// Messages of the GenericError returned to a call rejected by the single-flight guard
constexpr const char* MSG_PAYMENT_IN_PROGRESS = "Payment already in progress";
constexpr const char* MSG_INIT_IN_PROGRESS = "Initialisation already in progress";

// Transaction engine hosted by the driver process.
//
// Every operation opens its own terminal session and closes it before
// returning; only the EngineContext outlives a call. Pay and Init are
// single-flight: a call arriving while a Pay runs is rejected, not queued.
// No operation throws.
class PaymentService {
public:
    using ShutdownHandler = std::function<void()>;

    PaymentService(std::shared_ptr<EngineContext> context,
                   terminal::TerminalApiFactory apiFactory,
                   std::shared_ptr<persistence::TransactionStore> store,
                   ShutdownHandler shutdownHandler = nullptr);
    ~PaymentService() = default;

    PaymentService(const PaymentService&) = delete;
    PaymentService& operator=(const PaymentService&) = delete;

    /// Validates the configuration and performs a connect handshake.
    /// On success the configuration becomes active and the heartbeat starts;
    /// on failure the previous state is left untouched.
    PaymentOutcome init(const RuntimeConfiguration* configuration);

    /// Success iff the heartbeat is alive. No terminal I/O.
    PaymentOutcome test() const;

    /// amount: minor currency units, must be > 0
    PaymentOutcome pay(int64_t amount);

    /// Stops the heartbeat and asks the hosting process to stop serving.
    void shutdown();

    const EngineContext& getContext() const { return *context_; }

private:
    PaymentOutcome runInit(const RuntimeConfiguration* configuration);
    PaymentOutcome runPayment(int64_t amount);
    PaymentOutcome completeAuthorisedPayment(terminal::TerminalConnection& connection, int64_t amount,
                                             const terminal::TransactionResponse& payResponse);

    void persistTransaction(const terminal::TransactionResponse& response);
    void createCustomerTicket(const std::string& content);
    void closeConnection(terminal::TerminalConnection& connection);

    PaymentOutcome busyOutcome() const;

    std::shared_ptr<EngineContext> context_;
    terminal::TerminalApiFactory apiFactory_;
    std::shared_ptr<persistence::TransactionStore> store_;
    ShutdownHandler shutdownHandler_;

    std::mutex operationMutex_;
    std::atomic<bool> payInProgress_;
};

} // namespace kiosk_payment::engine
