// include/engine/payment_outcome.h
#pragma once

#include "common/result_code.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace kiosk_payment::engine {

// Business outcome of a payment, decided by the transaction status only.
enum class PaymentResult {
    Successful = 0,
    Failed = 1,
    Cancelled = 2,
    Error = 3
};

std::string paymentResultToString(PaymentResult result);
PaymentResult paymentResultFromString(const std::string& value);

struct PaymentData {
    PaymentResult result = PaymentResult::Error;
    int64_t paidAmount = 0;
    bool hasClientReceipt = false;
    // Authorised at the terminal but the confirmation could not be verified.
    bool uncertain = false;
};

struct PaymentOutcome {
    ResultCode code = ResultCode::GenericError;
    int terminalCode = 0;   // raw terminal result, 0 when not applicable
    std::string message;
    PaymentData data;

    bool succeeded() const {
        return code == ResultCode::Success && data.result == PaymentResult::Successful;
    }

    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json& json);

    static PaymentOutcome make(ResultCode code, const std::string& message, int terminalCode = 0);
};

} // namespace kiosk_payment::engine
