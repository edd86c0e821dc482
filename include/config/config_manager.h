// include/config/config_manager.h
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace kiosk_payment::config {

// Configuration keys
constexpr const char* KEY_DRIVER_PATH          = "driver.path";
constexpr const char* KEY_DRIVER_SETTLE_MS     = "driver.settle_delay_ms";
constexpr const char* KEY_DRIVER_READY_TIMEOUT = "driver.ready_timeout_ms";
constexpr const char* KEY_DRIVER_READY_POLL    = "driver.ready_poll_ms";
constexpr const char* KEY_IPC_ENDPOINT_DIR     = "ipc.endpoint_dir";
constexpr const char* KEY_IPC_OPEN_TIMEOUT     = "ipc.open_timeout_ms";
constexpr const char* KEY_IPC_SEND_TIMEOUT     = "ipc.send_timeout_ms";
constexpr const char* KEY_IPC_RECEIVE_TIMEOUT  = "ipc.receive_timeout_ms";
constexpr const char* KEY_IPC_CLOSE_TIMEOUT    = "ipc.close_timeout_ms";
constexpr const char* KEY_OUTPUT_PATH          = "output.path";
constexpr const char* KEY_TICKET_PATH          = "ticket.path";
constexpr const char* KEY_LOG_FILE             = "log.file";
constexpr const char* KEY_LOG_LEVEL            = "log.level";
constexpr const char* KEY_TERMINAL_BACKEND     = "terminal.backend";

// Flat key=value configuration shared by the driver and the host side.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Initialize configuration (load from file or write defaults).
    // Empty path means config.ini beside the running executable.
    void initialize(const std::string& configPath = "");

    std::string getConfigFilePath() const;

    std::string getString(const std::string& key) const;
    int64_t getInt(const std::string& key) const;
    bool getBool(const std::string& key) const;
    std::chrono::milliseconds getMilliseconds(const std::string& key) const;

    // Relative paths resolve against the config file's directory.
    std::filesystem::path getPath(const std::string& key) const;

    std::string getDriverPath() const { return getPath(KEY_DRIVER_PATH).string(); }
    std::string getOutputPath() const { return getPath(KEY_OUTPUT_PATH).string(); }
    std::string getTicketPath() const { return getPath(KEY_TICKET_PATH).string(); }
    std::string getTerminalBackend() const { return getString(KEY_TERMINAL_BACKEND); }

    void set(const std::string& key, const std::string& value);

    // Bulk get/set (key = e.g. "ipc.receive_timeout_ms")
    std::map<std::string, std::string> getAll() const;
    void setFromMap(const std::map<std::string, std::string>& kv);
    void saveIfInitialized();

    // Restore built-in defaults and forget the file (tests).
    void reset();

    static std::filesystem::path executableDirectory();

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadDefaults();
    void loadFromFile(const std::string& configPath);
    void saveToFile(const std::string& configPath) const;

    mutable std::mutex mutex_;
    std::string configFilePath_;
    std::map<std::string, std::string> values_;
};

} // namespace kiosk_payment::config
