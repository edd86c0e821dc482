// include/engine/engine_context.h
#pragma once

#include "engine/runtime_configuration.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace kiosk_payment::engine {

// Liveness flag read by Test. Alive only between a successful Init and
// the next Shutdown.
class Heartbeat {
public:
    Heartbeat() : alive_(false) {}

    void start() { alive_.store(true); }
    void stop() { alive_.store(false); }
    bool alive() const { return alive_.load(); }

private:
    std::atomic<bool> alive_;
};

// State shared across calls of one engine instance: the active
// configuration (single writer, many readers) and the heartbeat.
class EngineContext {
public:
    EngineContext() = default;

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    /// Returns false while no Init has succeeded.
    bool getConfiguration(RuntimeConfiguration& configuration) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!configuration_) {
            return false;
        }
        configuration = *configuration_;
        return true;
    }

    void setConfiguration(const RuntimeConfiguration& configuration) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        configuration_ = std::make_unique<RuntimeConfiguration>(configuration);
    }

    bool hasConfiguration() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return configuration_ != nullptr;
    }

    Heartbeat& heartbeat() { return heartbeat_; }
    const Heartbeat& heartbeat() const { return heartbeat_; }

private:
    mutable std::shared_mutex mutex_;
    std::unique_ptr<RuntimeConfiguration> configuration_;
    Heartbeat heartbeat_;
};

} // namespace kiosk_payment::engine
