// src/terminal/transaction_codes.cpp
#include "terminal/transaction_codes.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace kiosk_payment::terminal {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool isDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

constexpr size_t MAX_ERRC_DIGITS = 9;

// Strips leading zeros so "02" and "2" decode the same.
std::string normalizeCode(const std::string& value) {
    std::string code = trim(value);
    if (!isDigits(code)) {
        return code;
    }
    auto nonZero = code.find_first_not_of('0');
    return nonZero == std::string::npos ? "0" : code.substr(nonZero);
}

} // namespace

TransactionResult getTransactionOutResult(const std::string& transactionStatus) {
    const std::string code = normalizeCode(transactionStatus);
    if (code == STATUS_APPROVED_ONLINE || code == STATUS_APPROVED_OFFLINE) {
        return TransactionResult::Successful;
    }
    if (code == STATUS_DECLINED_ONLINE || code == STATUS_DECLINED_OFFLINE
        || code == STATUS_DECLINED_BY_CARD || code == STATUS_CARD_REMOVED) {
        return TransactionResult::Failed;
    }
    if (code == STATUS_CANCELLED || code == STATUS_TIMEOUT || code == STATUS_REVERSED) {
        return TransactionResult::Cancelled;
    }
    return TransactionResult::Unknown;
}

std::string transactionResultToString(TransactionResult result) {
    switch (result) {
        case TransactionResult::Successful: return "Successful";
        case TransactionResult::Failed: return "Failed";
        case TransactionResult::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

std::string diagTxnStatus(const std::string& transactionStatus) {
    const std::string code = normalizeCode(transactionStatus);
    if (code == STATUS_APPROVED_ONLINE) return "TRANSACTION APPROVED ONLINE";
    if (code == STATUS_APPROVED_OFFLINE) return "TRANSACTION APPROVED OFFLINE";
    if (code == STATUS_DECLINED_ONLINE) return "TRANSACTION DECLINED ONLINE";
    if (code == STATUS_DECLINED_OFFLINE) return "TRANSACTION DECLINED OFFLINE";
    if (code == STATUS_DECLINED_BY_CARD) return "TRANSACTION DECLINED BY CARD";
    if (code == STATUS_CANCELLED) return "TRANSACTION CANCELLED";
    if (code == STATUS_CARD_REMOVED) return "CARD REMOVED";
    if (code == STATUS_TIMEOUT) return "TRANSACTION TIMED OUT";
    if (code == STATUS_COMMS_FAILURE) return "COMMUNICATION FAILURE";
    if (code == STATUS_REVERSED) return "TRANSACTION REVERSED";
    return "TRANSACTION STATUS UNKNOWN (" + trim(transactionStatus) + ")";
}

EntryMethod parseEntryMethod(const std::string& entryMethod) {
    const std::string code = normalizeCode(entryMethod);
    if (code == ENTRY_CHIP) return EntryMethod::Chip;
    if (code == ENTRY_SWIPE) return EntryMethod::Swipe;
    if (code == ENTRY_CONTACTLESS) return EntryMethod::Contactless;
    if (code == ENTRY_MANUAL) return EntryMethod::Manual;
    return EntryMethod::Unknown;
}

std::string cardEntryMethod(const std::string& entryMethod) {
    switch (parseEntryMethod(entryMethod)) {
        case EntryMethod::Chip: return "ICC";
        case EntryMethod::Swipe: return "SWIPED";
        case EntryMethod::Contactless: return "CONTACTLESS";
        case EntryMethod::Manual: return "KEYED";
        default: return "UNKNOWN";
    }
}

bool requiresSignature(const TransactionResponse& response) {
    return parseEntryMethod(response.entryMethod) == EntryMethod::Swipe;
}

std::string cardVerification(const std::string& cvm) {
    const std::string code = normalizeCode(cvm);
    if (code == "0") return "NO CARDHOLDER VERIFICATION";
    if (code == "1") return "PIN VERIFIED";
    if (code == "2") return "SIGNATURE REQUIRED";
    if (code == "3") return "PIN VERIFIED AND SIGNATURE REQUIRED";
    if (code == "4") return "CARDHOLDER DEVICE VERIFIED";
    return "CVM UNKNOWN";
}

std::string transactionTypeString(const std::string& transactionType) {
    const std::string code = normalizeCode(transactionType);
    if (code == "0") return "SALE";
    if (code == "1") return "REFUND";
    if (code == "2") return "REVERSAL";
    return "UNKNOWN TRANSACTION";
}

std::string currencySymbol(const std::string& currency) {
    const std::string code = normalizeCode(currency);
    if (code == "826") return "GBP ";
    if (code == "978") return "EUR ";
    if (code == "840") return "USD ";
    return "";
}

std::string formatReceiptAmount(const std::string& minorUnits) {
    std::string value = trim(minorUnits);
    bool negative = !value.empty() && value[0] == '-';
    std::string digits = negative ? value.substr(1) : value;
    if (!isDigits(digits)) {
        return value;
    }

    long long amount = std::strtoll(digits.c_str(), nullptr, 10);
    std::ostringstream oss;
    if (negative) {
        oss << '-';
    }
    oss << amount / 100 << '.' << std::setw(2) << std::setfill('0') << amount % 100;
    return oss.str();
}

TerminalErrc parseTerminalErrc(const std::string& value) {
    const std::string code = normalizeCode(value);
    // Leading zeros are already gone; anything wider than an int cannot be a known code
    if (!isDigits(code) || code.size() > MAX_ERRC_DIGITS) {
        return TerminalErrc::Unknown;
    }
    int numeric = std::atoi(code.c_str());
    switch (numeric) {
        case 0: return TerminalErrc::OK;
        case 1: return TerminalErrc::NotConnected;
        case 2: return TerminalErrc::ConnectFailed;
        case 3: return TerminalErrc::AlreadyConnected;
        case 4: return TerminalErrc::SendFailed;
        case 5: return TerminalErrc::ReceiveFailed;
        case 6: return TerminalErrc::Timeout;
        case 7: return TerminalErrc::Busy;
        case 8: return TerminalErrc::InvalidParameter;
        default: return TerminalErrc::Unknown;
    }
}

} // namespace kiosk_payment::terminal
