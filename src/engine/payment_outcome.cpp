// src/engine/payment_outcome.cpp
#include "engine/payment_outcome.h"

namespace kiosk_payment::engine {

std::string paymentResultToString(PaymentResult result) {
    switch (result) {
        case PaymentResult::Successful: return "Successful";
        case PaymentResult::Failed: return "Failed";
        case PaymentResult::Cancelled: return "Cancelled";
        case PaymentResult::Error: return "Error";
        default: return "Error";
    }
}

PaymentResult paymentResultFromString(const std::string& value) {
    if (value == "Successful") return PaymentResult::Successful;
    if (value == "Failed") return PaymentResult::Failed;
    if (value == "Cancelled") return PaymentResult::Cancelled;
    return PaymentResult::Error;
}

nlohmann::json PaymentOutcome::toJson() const {
    return {
        {"resultCode", static_cast<int>(code)},
        {"resultName", resultCodeToString(code)},
        {"terminalCode", terminalCode},
        {"message", message},
        {"data", {
            {"result", paymentResultToString(data.result)},
            {"paidAmount", data.paidAmount},
            {"hasClientReceipt", data.hasClientReceipt},
            {"uncertain", data.uncertain}
        }}
    };
}

bool PaymentOutcome::fromJson(const nlohmann::json& json) {
    try {
        code = resultCodeFromInt(json.value("resultCode", static_cast<int>(ResultCode::GenericError)));
        terminalCode = json.value("terminalCode", 0);
        message = json.value("message", "");

        const nlohmann::json dataJson = json.value("data", nlohmann::json::object());
        data.result = paymentResultFromString(dataJson.value("result", "Error"));
        data.paidAmount = dataJson.value("paidAmount", static_cast<int64_t>(0));
        data.hasClientReceipt = dataJson.value("hasClientReceipt", false);
        data.uncertain = dataJson.value("uncertain", false);
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

PaymentOutcome PaymentOutcome::make(ResultCode code, const std::string& message, int terminalCode) {
    PaymentOutcome outcome;
    outcome.code = code;
    outcome.message = message;
    outcome.terminalCode = terminalCode;
    return outcome;
}

} // namespace kiosk_payment::engine
