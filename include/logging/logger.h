// include/logging/logger.h
#pragma once

#ifndef KIOSK_PAYMENT_LOGGER_H
#define KIOSK_PAYMENT_LOGGER_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace kiosk_payment::logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR   // named ERR to avoid clashing with ERROR macros
};

LogLevel stringToLogLevel(const std::string& str);

// Process-wide logger: console always, optional rotating file output.
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Empty path keeps console-only output.
    void initialize(const std::string& logFilePath);
    void shutdown();

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatLogMessage(LogLevel level, const std::string& message) const;
    void openLogFile();
    void closeLogFile();
    void rotate();

    mutable std::mutex logMutex_;
    LogLevel minLevel_{LogLevel::INFO};
    std::string logFilePath_;
    std::ofstream logFile_;
    std::size_t currentFileSize_{0};

    static constexpr std::size_t MAX_FILE_SIZE = 10 * 1024 * 1024;
};

} // namespace kiosk_payment::logging

#endif // KIOSK_PAYMENT_LOGGER_H
