// src/persistence/receipt_builder.cpp
#include "persistence/receipt_builder.h"
#include "terminal/transaction_codes.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kiosk_payment::persistence {

using terminal::cardEntryMethod;
using terminal::cardVerification;
using terminal::currencySymbol;
using terminal::diagTxnStatus;
using terminal::formatReceiptAmount;
using terminal::transactionTypeString;

std::string ReceiptBuilder::buildTransactionRecord(const terminal::TransactionResponse& response) {
    return buildCustomerSection(response) + buildMerchantSection(response);
}

std::string ReceiptBuilder::buildCustomerSection(const terminal::TransactionResponse& r) {
    const std::string symbol = currencySymbol(r.currency);

    std::ostringstream oss;
    oss << "\nCUSTOMER RECEIPT\n";
    oss << "**********************\n\n";
    oss << "MERCHANT NAME:  " << r.merchantName << "\n";
    oss << "MERCHANT ADDR1: " << r.merchantAddress1 << "\n";
    oss << "MERCHANT ADDR2: " << r.merchantAddress2 << "\n";
    oss << "ACQUIRER MERCHANT ID: " << r.acquirerMerchantId << "\n";
    oss << "ENTRY METHOD: " << cardEntryMethod(r.entryMethod) << "\n";
    oss << "TID: " << r.terminalId << "\n";
    oss << "AID: " << r.aid << "\n";
    oss << "CARD SCHEME NAME: " << r.cardSchemeName << "\n";
    oss << "PAN: " << r.pan << "\n";
    oss << "PAN SEQUENCE NUMBER: PAN.SEQ " << r.panSeqNum << "\n";
    oss << "TRANSACTION TYPE: " << transactionTypeString(r.transactionType) << "\n";
    oss << "CURRENCY: " << symbol << "\n";
    oss << "AMOUNT: " << symbol << formatReceiptAmount(r.transactionAmount) << "\n";
    oss << "TOTAL AMOUNT: " << formatReceiptAmount(r.totalAmount) << "\n";
    oss << "CVM: " << cardVerification(r.cvm) << "\n";
    oss << "HOST MESSAGE: " << r.hostMessage << "\n\n";
    oss << "***********************\n";
    oss << diagTxnStatus(r.transactionStatus) << "\n";
    oss << "***********************\n";
    return oss.str();
}

std::string ReceiptBuilder::buildMerchantSection(const terminal::TransactionResponse& r) {
    const std::string symbol = currencySymbol(r.currency);

    std::ostringstream oss;
    oss << "\n\nMERCHANT RECEIPT\n";
    oss << "**********************\n\n";
    oss << "ACQUIRER MERCHANT ID: " << r.acquirerMerchantId << "\n";
    oss << "MERCHANT NAME:  " << r.merchantName << "\n";
    oss << "MERCHANT ADDR1: " << r.merchantAddress1 << "\n";
    oss << "MERCHANT ADDR2: " << r.merchantAddress2 << "\n";
    oss << "ENTRY METHOD: " << cardEntryMethod(r.entryMethod) << "\n";
    oss << "TID: " << r.terminalId << "\n";
    oss << "AID: " << r.aid << "\n";
    oss << "CARD SCHEME NAME: " << r.cardSchemeName << "\n";
    oss << "PAN: " << r.pan << "\n";
    oss << "PAN SEQUENCE NUMBER: PAN.SEQ " << r.panSeqNum << "\n";
    oss << "TRANSACTION TYPE: " << transactionTypeString(r.transactionType) << "\n";
    oss << "CURRENCY: " << symbol << "\n";
    oss << "AMOUNT: " << symbol << formatReceiptAmount(r.transactionAmount) << "\n";
    oss << "TOTAL AMOUNT: " << formatReceiptAmount(r.totalAmount) << "\n";
    oss << "TRANSACTION DATE TIME: " << r.txnDateTime << "\n";
    oss << "CVM: " << cardVerification(r.cvm) << "\n";
    oss << "HOST MESSAGE: " << r.hostMessage << "\n";
    oss << "ACQUIRER RESPONSE CODE: " << r.acquirerResponseCode << "\n";
    oss << "RECEIPT NUMBER: " << r.receiptNumber << "\n\n";
    oss << "***********************\n";
    oss << diagTxnStatus(r.transactionStatus) << "\n";
    oss << "***********************\n";
    return oss.str();
}

std::string ReceiptBuilder::buildCustomerReceipt(const terminal::TransactionResponse& r,
                                                 std::chrono::system_clock::time_point printedAt) {
    std::time_t t = std::chrono::system_clock::to_time_t(printedAt);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << "\n\tCUSTOMER RECEIPT\n";
    oss << "\t*********************\n\n";
    oss << "\t" << r.merchantName << "\n";
    oss << "\t" << r.merchantAddress1 << "\n";
    oss << "\t" << r.merchantAddress2 << "\n";
    oss << "\t" << r.acquirerMerchantId << "\t";
    oss << "\t" << r.terminalId << "\n";
    oss << "\t" << r.cardSchemeName << "\n";
    oss << "\t" << r.aid << "\n";
    oss << "\t" << r.pan << "\n";
    oss << "\tICC PAN.SEQ " << r.panSeqNum << "\n";
    oss << "\t" << cardEntryMethod(r.entryMethod) << "\n";
    oss << "\t" << transactionTypeString(r.transactionType) << "\n";
    oss << "\tCARD HOLDER COPY\n";
    oss << "\tPURCHASE AMOUNT: " << currencySymbol(r.currency) << formatReceiptAmount(r.transactionAmount) << "\n";
    oss << "\t" << std::put_time(&tm, "%H:%M %d/%m/%Y") << "\n";
    oss << "\t" << cardVerification(r.cvm) << "\n";
    oss << "\n\tTHANK YOU\n";
    oss << "\t" << r.hostMessage << "\n";
    oss << "\n\t***********************\n";
    oss << "\t" << diagTxnStatus(r.transactionStatus) << "\n";
    oss << "\t***********************\n";
    return oss.str();
}

} // namespace kiosk_payment::persistence
