// src/logging/logger.cpp
#include "logging/logger.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace kiosk_payment::logging {

LogLevel stringToLogLevel(const std::string& str) {
    if (str == "debug" || str == "DEBUG") return LogLevel::DEBUG;
    if (str == "warn" || str == "WARN" || str == "warning") return LogLevel::WARN;
    if (str == "error" || str == "ERROR") return LogLevel::ERR;
    return LogLevel::INFO;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::initialize(const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logFilePath_ = logFilePath;
    if (logFilePath_.empty()) {
        return;
    }

    try {
        std::filesystem::path parent = std::filesystem::path(logFilePath_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::exception&) {
        // Ignore directory creation errors - will try to open file anyway
    }
    openLogFile();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logFilePath_.clear();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex_);
    minLevel_ = level;
}

LogLevel Logger::getLevel() const {
    std::lock_guard<std::mutex> lock(logMutex_);
    return minLevel_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (static_cast<int>(level) < static_cast<int>(minLevel_)) {
        return;
    }

    std::string formatted = formatLogMessage(level, message);
    std::cout << formatted << std::endl;

    if (!logFile_.is_open()) {
        return;
    }
    if (currentFileSize_ > MAX_FILE_SIZE) {
        rotate();
        if (!logFile_.is_open()) {
            return;
        }
    }
    logFile_ << formatted << std::endl;
    currentFileSize_ += formatted.length() + 1;
}

std::string Logger::formatLogMessage(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();

    const char* levelStr = "INFO ";
    switch (level) {
        case LogLevel::DEBUG: levelStr = "DEBUG"; break;
        case LogLevel::INFO:  levelStr = "INFO "; break;
        case LogLevel::WARN:  levelStr = "WARN "; break;
        case LogLevel::ERR:   levelStr = "ERROR"; break;
    }

    ss << " [" << levelStr << "] " << message;
    return ss.str();
}

void Logger::rotate() {
    closeLogFile();

    try {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&time_t, &tm);
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
        std::string rotatedPath = logFilePath_ + "." + ss.str();

        if (std::filesystem::exists(logFilePath_)) {
            std::filesystem::rename(logFilePath_, rotatedPath);
        }
    } catch (const std::exception&) {
        // Ignore rotation errors - continue with new file
    }

    openLogFile();
}

void Logger::openLogFile() {
    logFile_.open(logFilePath_, std::ios::app);
    currentFileSize_ = 0;
    if (logFile_.is_open()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(logFilePath_, ec);
        if (!ec) {
            currentFileSize_ = static_cast<std::size_t>(size);
        }
    } else {
        std::cerr << "Failed to open log file: " << logFilePath_ << std::endl;
    }
}

void Logger::closeLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

} // namespace kiosk_payment::logging
