// include/ipc/command_processor.h
#pragma once

#include "engine/payment_outcome.h"
#include "engine/payment_service.h"
#include "ipc/message_types.h"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace kiosk_payment::ipc {

// CommandProcessor - maps driver commands onto the payment engine
// Part of IPC Layer
class CommandProcessor {
public:
    explicit CommandProcessor(std::shared_ptr<engine::PaymentService> service);
    ~CommandProcessor() = default;

    // Process command and return response
    // Pay is idempotent: a repeated commandId returns the recorded response
    // instead of charging the card again
    Response processCommand(const Command& command);

    // Raw entry point for the socket server: parse, process, serialize
    std::string handleMessage(const std::string& message);

    // Clear pay response cache (for testing or admin purposes)
    void clearCache();

private:
    std::shared_ptr<engine::PaymentService> service_;

    // Idempotency cache: commandId -> Response, oldest evicted first
    std::mutex cacheMutex_;
    std::unordered_map<std::string, Response> payCache_;
    std::deque<std::string> payCacheOrder_;

    static constexpr size_t PAY_CACHE_SIZE = 64;

    // Command handlers
    Response handleInit(const Command& command);
    Response handleTest(const Command& command);
    Response handlePay(const Command& command);
    Response handleShutdown(const Command& command);
    Response handleUnknownCommand(const Command& command);

    bool findCachedPay(const std::string& commandId, Response& response);
    void cachePay(const Response& response);

    Response createOutcomeResponse(const std::string& commandId, const engine::PaymentOutcome& outcome);

    // Helper to create error response
    Response createErrorResponse(const std::string& commandId,
                                 const std::string& status,
                                 const std::string& errorCode,
                                 const std::string& errorMessage);
};

} // namespace kiosk_payment::ipc
