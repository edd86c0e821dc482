// src/config/config_manager.cpp
#include "config/config_manager.h"
#include "core/peripheral_constants.h"
#include "logging/logger.h"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace kiosk_payment::config {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager() {
    loadDefaults();
}

std::filesystem::path ConfigManager::executableDirectory() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::filesystem::current_path();
    }
    return exe.parent_path();
}

void ConfigManager::initialize(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configPath.empty()) {
        configFilePath_ = (executableDirectory() / "config.ini").string();
    } else {
        configFilePath_ = configPath;
    }
    logging::Logger::getInstance().info("Config path: " + configFilePath_);

    loadDefaults();
    if (std::filesystem::exists(configFilePath_)) {
        try {
            loadFromFile(configFilePath_);
            logging::Logger::getInstance().info("Configuration loaded from: " + configFilePath_);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().warn("Failed to load config file, using defaults: " + std::string(e.what()));
            loadDefaults();
        }
    } else {
        logging::Logger::getInstance().info("Config file not found, using defaults");
        try {
            saveToFile(configFilePath_);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().warn("Failed to save default config: " + std::string(e.what()));
        }
    }
}

std::string ConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configFilePath_;
}

void ConfigManager::loadDefaults() {
    values_.clear();
    values_[KEY_DRIVER_PATH] = core::kDefaultDriverPath;
    values_[KEY_DRIVER_SETTLE_MS] = "0";
    values_[KEY_DRIVER_READY_TIMEOUT] = "10000";
    values_[KEY_DRIVER_READY_POLL] = "100";
    values_[KEY_IPC_ENDPOINT_DIR] = core::kDefaultEndpointDir;
    values_[KEY_IPC_OPEN_TIMEOUT] = "30000";
    values_[KEY_IPC_SEND_TIMEOUT] = "60000";
    values_[KEY_IPC_RECEIVE_TIMEOUT] = "900000";  // 15 minutes: customer interaction at the terminal
    values_[KEY_IPC_CLOSE_TIMEOUT] = "5000";
    values_[KEY_OUTPUT_PATH] = "transactions";
    values_[KEY_TICKET_PATH] = "ticket";
    values_[KEY_LOG_FILE] = "";
    values_[KEY_LOG_LEVEL] = "info";
    values_[KEY_TERMINAL_BACKEND] = "simulator";
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    configFilePath_.clear();
    loadDefaults();
}

void ConfigManager::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + configPath);
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Simple INI parsing: key=value
        size_t eqPos = line.find('=');
        if (eqPos != std::string::npos) {
            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            // Trim whitespace
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t\r") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);

            if (!key.empty()) {
                values_[key] = value;
            }
        }
    }
}

void ConfigManager::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + configPath);
    }

    file << "# Kiosk Payment Driver Configuration\n";
    for (const auto& kv : values_) {
        file << kv.first << "=" << kv.second << "\n";
    }
}

std::string ConfigManager::getString(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it != values_.end() ? it->second : std::string();
}

int64_t ConfigManager::getInt(const std::string& key) const {
    std::string value = getString(key);
    if (value.empty()) {
        return 0;
    }
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        logging::Logger::getInstance().warn("Invalid integer for " + key + ": " + value);
        return 0;
    }
}

bool ConfigManager::getBool(const std::string& key) const {
    return core::isEnabled(getString(key));
}

std::chrono::milliseconds ConfigManager::getMilliseconds(const std::string& key) const {
    return std::chrono::milliseconds(getInt(key));
}

std::filesystem::path ConfigManager::getPath(const std::string& key) const {
    std::filesystem::path path(getString(key));
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    std::string configFile = getConfigFilePath();
    std::filesystem::path base = configFile.empty()
        ? executableDirectory()
        : std::filesystem::path(configFile).parent_path();
    return base / path;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::map<std::string, std::string> ConfigManager::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
}

void ConfigManager::setFromMap(const std::map<std::string, std::string>& kv) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : kv) {
        values_[p.first] = p.second;
    }
}

void ConfigManager::saveIfInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configFilePath_.empty()) {
        return;
    }
    try {
        saveToFile(configFilePath_);
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("Failed to save config: " + std::string(e.what()));
    }
}

} // namespace kiosk_payment::config
