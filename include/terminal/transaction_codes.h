// include/terminal/transaction_codes.h
// Decoding of the text codes carried by TransactionResponse.
#pragma once

#include "terminal/terminal_types.h"
#include <string>

namespace kiosk_payment::terminal {

// Transaction status codes reported by the terminal
constexpr const char* STATUS_APPROVED_ONLINE  = "0";
constexpr const char* STATUS_APPROVED_OFFLINE = "1";
constexpr const char* STATUS_DECLINED_ONLINE  = "2";
constexpr const char* STATUS_DECLINED_OFFLINE = "3";
constexpr const char* STATUS_DECLINED_BY_CARD = "4";
constexpr const char* STATUS_CANCELLED        = "5";
constexpr const char* STATUS_CARD_REMOVED     = "6";
constexpr const char* STATUS_TIMEOUT          = "7";
constexpr const char* STATUS_COMMS_FAILURE    = "8";
constexpr const char* STATUS_REVERSED         = "9";

// Entry method codes
constexpr const char* ENTRY_CHIP        = "1";
constexpr const char* ENTRY_SWIPE       = "2";
constexpr const char* ENTRY_CONTACTLESS = "3";
constexpr const char* ENTRY_MANUAL      = "4";

// Business classification of a transaction status
enum class TransactionResult {
    Successful,
    Failed,
    Cancelled,
    Unknown
};

enum class EntryMethod {
    Unknown,
    Chip,
    Swipe,
    Contactless,
    Manual
};

TransactionResult getTransactionOutResult(const std::string& transactionStatus);
std::string transactionResultToString(TransactionResult result);

/// Human readable status line printed at the bottom of receipts.
std::string diagTxnStatus(const std::string& transactionStatus);

EntryMethod parseEntryMethod(const std::string& entryMethod);
std::string cardEntryMethod(const std::string& entryMethod);

/// A swipe-authorised sale needs a handwritten signature, which an
/// unattended kiosk cannot collect.
bool requiresSignature(const TransactionResponse& response);

std::string cardVerification(const std::string& cvm);
std::string transactionTypeString(const std::string& transactionType);
std::string currencySymbol(const std::string& currency);

/// "2500" -> "25.00"; non-numeric input is returned unchanged.
std::string formatReceiptAmount(const std::string& minorUnits);

/// Decode a numeric TerminalErrc carried as text (diagRequestOut).
TerminalErrc parseTerminalErrc(const std::string& value);

} // namespace kiosk_payment::terminal
