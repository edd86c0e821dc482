// include/terminal/terminal_types.h
#pragma once

#include <string>

namespace kiosk_payment::terminal {

// Result of a call into the terminal SDK (connect / pay / reverse / disconnect).
enum class TerminalErrc {
    OK = 0,
    NotConnected = 1,
    ConnectFailed = 2,
    AlreadyConnected = 3,
    SendFailed = 4,
    ReceiveFailed = 5,
    Timeout = 6,
    Busy = 7,
    InvalidParameter = 8,
    Unknown = 99
};

inline std::string terminalErrcToString(TerminalErrc errc) {
    switch (errc) {
        case TerminalErrc::OK: return "OK";
        case TerminalErrc::NotConnected: return "NOT_CONNECTED";
        case TerminalErrc::ConnectFailed: return "CONNECT_FAILED";
        case TerminalErrc::AlreadyConnected: return "ALREADY_CONNECTED";
        case TerminalErrc::SendFailed: return "SEND_FAILED";
        case TerminalErrc::ReceiveFailed: return "RECEIVE_FAILED";
        case TerminalErrc::Timeout: return "TIMEOUT";
        case TerminalErrc::Busy: return "BUSY";
        case TerminalErrc::InvalidParameter: return "INVALID_PARAMETER";
        default: return "UNKNOWN";
    }
}

// Terminal's answer to a pay or reverse request. All fields arrive as text
// from the terminal; numeric ones are decoded by transaction_codes.h.
struct TransactionResponse {
    std::string transactionStatus;    // see TransactionStatus codes
    std::string entryMethod;          // "1" chip, "2" swipe, "3" contactless, "4" manual
    std::string merchantName;
    std::string merchantAddress1;
    std::string merchantAddress2;
    std::string acquirerMerchantId;
    std::string terminalId;
    std::string aid;
    std::string cardSchemeName;
    std::string pan;                  // masked
    std::string panSeqNum;
    std::string transactionType;      // "0" sale, "1" refund, "2" reversal
    std::string currency;             // ISO 4217 numeric, e.g. "826"
    std::string transactionAmount;    // minor units
    std::string totalAmount;          // minor units
    std::string cvm;
    std::string hostMessage;
    std::string diagRequestOut;       // TerminalErrc of the confirmation step
    std::string acquirerResponseCode;
    std::string receiptNumber;
    std::string txnDateTime;
};

} // namespace kiosk_payment::terminal
