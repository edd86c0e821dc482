// include/supervisor/driver_supervisor.h
#pragma once

#include "ipc/channel_factory.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace kiosk_payment::supervisor {

struct SupervisorOptions {
    std::string driverPath;
    std::string endpointPath;
    std::vector<std::string> driverArgs;
    ipc::ChannelOptions channelOptions;

    std::chrono::milliseconds settleDelay{0};
    std::chrono::milliseconds readinessTimeout{10000};
    std::chrono::milliseconds initialPollInterval{100};
    std::chrono::milliseconds maxPollInterval{2000};
    double backoffMultiplier{2.0};

    // driver.*, ipc.* keys from ConfigManager; the driver is started with
    // --config and --endpoint pointing at the same file and endpoint.
    static SupervisorOptions fromConfig();
};

// Owns the terminal-driver process and the channel factory bound to it.
// Guarantees a single running instance: stale instances (found by process
// name) are killed before a launch and again at teardown.
// Failures are not retried here; they are reported as false with
// getLastError().
class DriverSupervisor {
public:
    explicit DriverSupervisor(SupervisorOptions options);
    ~DriverSupervisor();

    DriverSupervisor(const DriverSupervisor&) = delete;
    DriverSupervisor& operator=(const DriverSupervisor&) = delete;

    // Kills every process named like the driver and waits for each to exit.
    bool ensureSingleInstance();

    // Starts the driver in its own directory, detached from the terminal.
    bool launch();

    // Polls the endpoint with exponential backoff until the driver accepts a
    // connection, the readiness timeout elapses or the driver exits.
    bool waitUntilReady();

    // Verifies the endpoint and publishes the channel factory.
    std::shared_ptr<ipc::ChannelFactory> openChannel();

    // ensureSingleInstance + launch + waitUntilReady + openChannel
    bool start();

    // Drops the channel factory and kills the driver, even mid-transaction.
    bool teardown();

    std::shared_ptr<ipc::ChannelFactory> getChannelFactory() const;
    pid_t getDriverPid() const;
    bool isDriverRunning() const;
    std::string getDriverProcessName() const;
    const SupervisorOptions& getOptions() const { return options_; }
    std::string getLastError() const;

private:
    bool killAllInstances();
    bool reapIfExited(int& status);
    std::chrono::milliseconds calculateBackoff(int attempt) const;
    void setLastError(const std::string& error);

    SupervisorOptions options_;
    pid_t driverPid_;
    std::shared_ptr<ipc::ChannelFactory> channelFactory_;

    mutable std::mutex mutex_;
    std::string lastError_;
};

} // namespace kiosk_payment::supervisor
