// src/supervisor/driver_supervisor.cpp
#include "supervisor/driver_supervisor.h"
#include "config/config_manager.h"
#include "core/peripheral_constants.h"
#include "logging/logger.h"
#include "supervisor/process_utils.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

namespace kiosk_payment::supervisor {

SupervisorOptions SupervisorOptions::fromConfig() {
    auto& config = config::ConfigManager::getInstance();

    SupervisorOptions options;
    options.driverPath = config.getDriverPath();
    options.endpointPath = core::endpointPathFor(config.getPath(config::KEY_IPC_ENDPOINT_DIR).string());
    options.channelOptions = ipc::ChannelOptions::fromConfig();
    options.settleDelay = config.getMilliseconds(config::KEY_DRIVER_SETTLE_MS);
    options.readinessTimeout = config.getMilliseconds(config::KEY_DRIVER_READY_TIMEOUT);
    options.initialPollInterval = config.getMilliseconds(config::KEY_DRIVER_READY_POLL);

    options.driverArgs = {"--endpoint", options.endpointPath};
    const std::string configFile = config.getConfigFilePath();
    if (!configFile.empty()) {
        options.driverArgs.push_back("--config");
        options.driverArgs.push_back(std::filesystem::absolute(configFile).string());
    }
    return options;
}

DriverSupervisor::DriverSupervisor(SupervisorOptions options)
    : options_(std::move(options))
    , driverPid_(-1) {
}

DriverSupervisor::~DriverSupervisor() {
    if (driverPid_ > 0 && !teardown()) {
        logging::Logger::getInstance().error("Driver teardown on release failed: " + getLastError());
    }
}

std::string DriverSupervisor::getDriverProcessName() const {
    return std::filesystem::path(options_.driverPath).filename().string();
}

bool DriverSupervisor::killAllInstances() {
    auto& logger = logging::Logger::getInstance();

    bool ok = true;
    // Our own child first: once reaped its pid is free for reuse and must not be signalled again
    if (driverPid_ > 0) {
        std::string error;
        if (!killAndWait(driverPid_, error)) {
            setLastError(error);
            logger.error("Cannot kill launched driver: " + error);
            ok = false;
        }
        driverPid_ = -1;
    }

    for (pid_t pid : findProcessesByName(getDriverProcessName())) {
        logger.info("Driver is already running (pid " + std::to_string(pid) + "), killing it.");
        std::string error;
        if (!killAndWait(pid, error)) {
            setLastError(error);
            logger.error("Cannot kill driver: " + error);
            ok = false;
            continue;
        }
        logger.info("Running process exited!");
    }
    return ok;
}

bool DriverSupervisor::ensureSingleInstance() {
    logging::Logger::getInstance().debug("Looking for running instances of " + getDriverProcessName());
    return killAllInstances();
}

bool DriverSupervisor::launch() {
    auto& logger = logging::Logger::getInstance();

    const std::filesystem::path driverPath = std::filesystem::absolute(options_.driverPath);
    if (::access(driverPath.c_str(), X_OK) != 0) {
        setLastError("Driver is not executable: " + driverPath.string() + " (" + std::strerror(errno) + ")");
        logger.error(getLastError());
        return false;
    }

    // Everything the child touches is prepared before fork
    const std::string workingDirectory = driverPath.parent_path().string();
    const std::string program = driverPath.string();
    std::vector<std::string> args;
    args.push_back(program);
    args.insert(args.end(), options_.driverArgs.begin(), options_.driverArgs.end());
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    logger.info("Starting the driver: " + program);

    const pid_t pid = ::fork();
    if (pid < 0) {
        setLastError(std::string("fork: ") + std::strerror(errno));
        logger.error("Cannot start driver: " + getLastError());
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        if (::chdir(workingDirectory.c_str()) != 0) {
            ::_exit(126);
        }
        (void)::setsid();
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            (void)::dup2(devNull, STDIN_FILENO);
            (void)::close(devNull);
        }
        ::execv(program.c_str(), argv.data());
        ::_exit(127);
    }

    driverPid_ = pid;
    logger.info("Driver started with pid " + std::to_string(pid));

    if (options_.settleDelay.count() > 0) {
        std::this_thread::sleep_for(options_.settleDelay);
    }
    return true;
}

bool DriverSupervisor::reapIfExited(int& status) {
    if (driverPid_ <= 0) {
        return false;
    }
    const pid_t reaped = ::waitpid(driverPid_, &status, WNOHANG);
    if (reaped == driverPid_) {
        driverPid_ = -1;
        return true;
    }
    return false;
}

bool DriverSupervisor::waitUntilReady() {
    auto& logger = logging::Logger::getInstance();
    ipc::ChannelFactory factory(options_.endpointPath, options_.channelOptions);

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options_.readinessTimeout;
    const auto probeTimeout = std::min(options_.channelOptions.openTimeout, std::chrono::milliseconds(1000));

    for (int attempt = 1;; ++attempt) {
        int status = 0;
        if (reapIfExited(status)) {
            std::string reason = WIFEXITED(status)
                ? "exit code " + std::to_string(WEXITSTATUS(status))
                : "signal " + std::to_string(WTERMSIG(status));
            setLastError("Driver exited during startup (" + reason + ")");
            logger.error(getLastError());
            return false;
        }

        if (factory.probe(probeTimeout)) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            logger.info("Driver ready after " + std::to_string(attempt) + " probe(s), "
                + std::to_string(elapsed.count()) + " ms");
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            setLastError("Driver endpoint " + options_.endpointPath + " not ready after "
                + std::to_string(options_.readinessTimeout.count()) + " ms");
            logger.error(getLastError());
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(calculateBackoff(attempt), remaining));
    }
}

std::shared_ptr<ipc::ChannelFactory> DriverSupervisor::openChannel() {
    auto factory = std::make_shared<ipc::ChannelFactory>(options_.endpointPath, options_.channelOptions);
    if (!factory->probe(options_.channelOptions.openTimeout)) {
        setLastError("Cannot open channel to " + options_.endpointPath);
        logging::Logger::getInstance().error(getLastError());
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    channelFactory_ = factory;
    return factory;
}

bool DriverSupervisor::start() {
    if (!ensureSingleInstance()) {
        return false;
    }
    if (!launch()) {
        return false;
    }
    if (!waitUntilReady()) {
        return false;
    }
    return openChannel() != nullptr;
}

bool DriverSupervisor::teardown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channelFactory_.reset();
    }
    return killAllInstances();
}

std::shared_ptr<ipc::ChannelFactory> DriverSupervisor::getChannelFactory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channelFactory_;
}

pid_t DriverSupervisor::getDriverPid() const {
    return driverPid_;
}

bool DriverSupervisor::isDriverRunning() const {
    return driverPid_ > 0 && isProcessAlive(driverPid_);
}

std::string DriverSupervisor::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void DriverSupervisor::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}

std::chrono::milliseconds DriverSupervisor::calculateBackoff(int attempt) const {
    auto backoff = options_.initialPollInterval;
    for (int i = 1; i < attempt; i++) {
        backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
            backoff * options_.backoffMultiplier);
        if (backoff > options_.maxPollInterval) {
            backoff = options_.maxPollInterval;
            break;
        }
    }
    return backoff;
}

} // namespace kiosk_payment::supervisor
