// src/persistence/transaction_store.cpp
#include "persistence/transaction_store.h"
#include "logging/logger.h"
#include "persistence/receipt_builder.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace kiosk_payment::persistence {

namespace {

constexpr const char* RECORD_SUFFIX = "_ticket.txt";

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d%H%M%S");
    return oss.str();
}

// "<stamp>_ticket.txt" is attempt 0 of that second, "<stamp>_<n>_ticket.txt" attempt n
std::pair<std::string, long> recordOrderKey(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    const std::string stem = name.substr(0, name.size() - std::string(RECORD_SUFFIX).size());
    const auto separator = stem.find('_');
    if (separator == std::string::npos) {
        return {stem, 0};
    }
    return {stem.substr(0, separator), std::strtol(stem.c_str() + separator + 1, nullptr, 10)};
}

bool writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.flush();
    return static_cast<bool>(file);
}

} // namespace

TransactionStore::TransactionStore(std::filesystem::path outputDirectory, std::filesystem::path ticketPath)
    : outputDirectory_(std::move(outputDirectory))
    , ticketPath_(std::move(ticketPath)) {
}

std::filesystem::path TransactionStore::nextRecordPath() const {
    const std::string stamp = timestampNow();
    std::filesystem::path candidate = outputDirectory_ / (stamp + RECORD_SUFFIX);
    for (int n = 1; std::filesystem::exists(candidate); ++n) {
        candidate = outputDirectory_ / (stamp + "_" + std::to_string(n) + RECORD_SUFFIX);
    }
    return candidate;
}

bool TransactionStore::persistTransaction(const terminal::TransactionResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (!std::filesystem::exists(outputDirectory_)) {
            std::filesystem::create_directories(outputDirectory_);
        }

        std::filesystem::path outputPath = nextRecordPath();
        logging::Logger::getInstance().info("Persisting Customer and Merchant ticket to " + outputPath.string());

        if (!writeFile(outputPath, ReceiptBuilder::buildTransactionRecord(response))) {
            setLastError("Cannot write transaction record: " + outputPath.string());
            logging::Logger::getInstance().error("Persist Transaction failed: " + lastError_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        setLastError(e.what());
        logging::Logger::getInstance().error("Persist Transaction exception: " + lastError_);
        return false;
    }
}

bool TransactionStore::writeCustomerTicket(const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        logging::Logger::getInstance().info("Persisting Customer ticket to " + ticketPath_.string());
        std::filesystem::path parent = ticketPath_.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }
        if (!writeFile(ticketPath_, content)) {
            setLastError("Cannot write customer ticket: " + ticketPath_.string());
            logging::Logger::getInstance().error("Error persisting ticket: " + lastError_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        setLastError(e.what());
        logging::Logger::getInstance().error("Error persisting ticket: " + lastError_);
        return false;
    }
}

bool TransactionStore::deletePendingTicket() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(ticketPath_, ec);
    if (ec) {
        setLastError("Cannot delete pending ticket: " + ec.message());
        logging::Logger::getInstance().error(lastError_);
        return false;
    }
    return true;
}

bool TransactionStore::hasPendingTicket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return std::filesystem::exists(ticketPath_, ec);
}

std::string TransactionStore::readPendingTicket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(ticketPath_, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::vector<std::filesystem::path> TransactionStore::listRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::filesystem::path> records;
    std::error_code ec;
    if (!std::filesystem::is_directory(outputDirectory_, ec)) {
        return records;
    }
    for (const auto& entry : std::filesystem::directory_iterator(outputDirectory_, ec)) {
        const std::string name = entry.path().filename().string();
        const std::string suffix(RECORD_SUFFIX);
        if (entry.is_regular_file() && name.size() > suffix.size()
            && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            records.push_back(entry.path());
        }
    }
    std::sort(records.begin(), records.end(),
        [](const std::filesystem::path& a, const std::filesystem::path& b) {
            return recordOrderKey(a) < recordOrderKey(b);
        });
    return records;
}

std::string TransactionStore::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void TransactionStore::setLastError(const std::string& error) {
    lastError_ = error;
}

} // namespace kiosk_payment::persistence
