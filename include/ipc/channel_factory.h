// include/ipc/channel_factory.h
#pragma once

#include "engine/payment_outcome.h"
#include "engine/runtime_configuration.h"
#include "ipc/message_types.h"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace kiosk_payment::ipc {

// Client-side timeouts for one call to the driver.
struct ChannelOptions {
    std::chrono::milliseconds openTimeout{30000};
    std::chrono::milliseconds sendTimeout{60000};
    std::chrono::milliseconds receiveTimeout{900000};   // covers a full card transaction
    std::chrono::milliseconds closeTimeout{5000};       // reply wait for shutdown

    // Reads ipc.*_timeout_ms from ConfigManager.
    static ChannelOptions fromConfig();
};

// The driver could not be reached or did not answer.
class ChannelError : public std::runtime_error {
public:
    ChannelError(const std::string& message, bool requestDelivered)
        : std::runtime_error(message)
        , requestDelivered_(requestDelivered) {}

    // True when the request reached the driver before the failure, so the
    // operation may have run.
    bool requestDelivered() const { return requestDelivered_; }

private:
    bool requestDelivered_;
};

// Proxy for the driver's operations. Every call opens its own connection,
// exchanges one request/response pair and closes it.
// Throws ChannelError on transport failure; a driver-side rejection comes
// back as a GenericError outcome.
class ChannelSession {
public:
    ChannelSession(const std::string& endpointPath, const ChannelOptions& options);

    engine::PaymentOutcome init(const engine::RuntimeConfiguration& configuration);
    engine::PaymentOutcome test();
    engine::PaymentOutcome pay(int64_t amount);
    void shutdown();

    // Lower-level access used by the operations above.
    Response call(const Command& command, std::chrono::milliseconds replyTimeout);

private:
    engine::PaymentOutcome toOutcome(const Response& response) const;
    Command makeCommand(const std::string& type) const;

    std::string endpointPath_;
    ChannelOptions options_;
};

// Reusable factory bound to the driver's endpoint.
class ChannelFactory {
public:
    ChannelFactory(const std::string& endpointPath, const ChannelOptions& options);

    std::unique_ptr<ChannelSession> createChannel() const;

    // True when the driver accepts a connection within `timeout`.
    bool probe(std::chrono::milliseconds timeout) const;

    const std::string& getEndpointPath() const { return endpointPath_; }
    const ChannelOptions& getOptions() const { return options_; }

private:
    std::string endpointPath_;
    ChannelOptions options_;
};

} // namespace kiosk_payment::ipc
