// include/persistence/transaction_store.h
#pragma once

#include "terminal/terminal_types.h"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace kiosk_payment::persistence {

// Durable audit trail plus the transient customer ticket.
//
// Records: one "<yyyyMMddHHmmss>_ticket.txt" file per transaction attempt in
// the output directory (created on demand). A record is never overwritten: a
// second attempt within the same second gets a "_<n>" suffix.
//
// Ticket: a single file at a fixed path, rewritten per attempt and deleted at
// the start of the next payment.
//
// No method throws; failures are logged and reported as false.
class TransactionStore {
public:
    TransactionStore(std::filesystem::path outputDirectory, std::filesystem::path ticketPath);

    bool persistTransaction(const terminal::TransactionResponse& response);

    bool writeCustomerTicket(const std::string& content);

    /// Idempotent: succeeds when no ticket exists.
    bool deletePendingTicket();

    bool hasPendingTicket() const;
    std::string readPendingTicket() const;

    std::vector<std::filesystem::path> listRecords() const;

    const std::filesystem::path& getOutputDirectory() const { return outputDirectory_; }
    const std::filesystem::path& getTicketPath() const { return ticketPath_; }
    std::string getLastError() const;

private:
    std::filesystem::path nextRecordPath() const;
    void setLastError(const std::string& error);

    std::filesystem::path outputDirectory_;
    std::filesystem::path ticketPath_;

    mutable std::mutex mutex_;
    std::string lastError_;
};

} // namespace kiosk_payment::persistence
