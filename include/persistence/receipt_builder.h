// include/persistence/receipt_builder.h
#pragma once

#include "terminal/terminal_types.h"
#include <chrono>
#include <string>

namespace kiosk_payment::persistence {

// Customer notice written when no money was taken (declined or reversed).
constexpr const char* PAYMENT_FAILURE_NOTICE =
    "-----\n\n"
    "Payment failure with\n"
    "your card or issuer\n"
    "NO payment has been taken.\n\n"
    "Please try again with another card,\n"
    "or at a manned till.\n\n"
    "-----";

class ReceiptBuilder {
public:
    /// Customer + merchant sections of the persisted audit record.
    static std::string buildTransactionRecord(const terminal::TransactionResponse& response);

    /// Card-holder copy for a successful sale.
    static std::string buildCustomerReceipt(const terminal::TransactionResponse& response,
                                            std::chrono::system_clock::time_point printedAt);

private:
    static std::string buildCustomerSection(const terminal::TransactionResponse& response);
    static std::string buildMerchantSection(const terminal::TransactionResponse& response);
};

} // namespace kiosk_payment::persistence
