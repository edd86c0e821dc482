// include/common/result_code.h
#pragma once

#include <string>

namespace kiosk_payment {

// Call-level result of a driver operation. The business outcome of a payment
// is carried separately (engine::PaymentResult).
enum class ResultCode {
    Success = 0,
    GenericError = 1,
    ValidationError = 2,          // bad amount / configuration, rejected before any I/O
    ConnectError = 3,             // terminal unreachable
    SubmitError = 4,              // terminal rejected the request
    TransactionFailed = 5,        // terminal processed and declined
    TransactionCancelled = 6,     // business-rule unwind (signature reversal)
    ProcessSupervisionError = 7   // driver process could not be killed / launched / reached
};

inline std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::Success: return "Success";
        case ResultCode::GenericError: return "GenericError";
        case ResultCode::ValidationError: return "ValidationError";
        case ResultCode::ConnectError: return "ConnectError";
        case ResultCode::SubmitError: return "SubmitError";
        case ResultCode::TransactionFailed: return "TransactionFailed";
        case ResultCode::TransactionCancelled: return "TransactionCancelled";
        case ResultCode::ProcessSupervisionError: return "ProcessSupervisionError";
        default: return "Unknown";
    }
}

inline ResultCode resultCodeFromInt(int value) {
    if (value < 0 || value > static_cast<int>(ResultCode::ProcessSupervisionError)) {
        return ResultCode::GenericError;
    }
    return static_cast<ResultCode>(value);
}

} // namespace kiosk_payment
