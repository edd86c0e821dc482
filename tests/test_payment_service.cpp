// tests/test_payment_service.cpp
#include "engine/payment_service.h"
#include "persistence/receipt_builder.h"
#include "mock_terminal_api.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace kiosk_payment::test {

namespace fs = std::filesystem;
using engine::PaymentOutcome;
using engine::PaymentResult;
using engine::PaymentService;
using engine::RuntimeConfiguration;
using terminal::TerminalErrc;
using terminal::TransactionResponse;
using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SetArgReferee;
using testing::Throw;

namespace {

TransactionResponse terminalResponse(const std::string& status, const std::string& entryMethod,
                                     const std::string& diag = "0") {
    TransactionResponse response;
    response.transactionStatus = status;
    response.entryMethod = entryMethod;
    response.diagRequestOut = diag;
    response.transactionType = "0";
    response.currency = "826";
    response.cvm = "1";
    response.merchantName = "KIOSK CAFE";
    return response;
}

RuntimeConfiguration validConfiguration() {
    RuntimeConfiguration configuration;
    configuration.ipAddress = "192.168.1.50";
    configuration.posNumber = 1;
    return configuration;
}

} // namespace

class PaymentServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("kiosk_engine_" + std::to_string(::getpid()) + "_"
            + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);

        store_ = std::make_shared<persistence::TransactionStore>(root_ / "records", root_ / "ticket");
        context_ = std::make_shared<engine::EngineContext>();
        service_ = std::make_unique<PaymentService>(context_, terminals_.factory(), store_,
            [this]() { shutdownRequested_ = true; });
    }

    void TearDown() override {
        service_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void initialise() {
        auto* api = terminals_.push();
        EXPECT_CALL(*api, connect("192.168.1.50")).WillOnce(Return(TerminalErrc::OK));
        EXPECT_CALL(*api, disconnect()).WillOnce(Return(TerminalErrc::OK));

        const RuntimeConfiguration configuration = validConfiguration();
        ASSERT_EQ(service_->init(&configuration).code, ResultCode::Success);
    }

    // Connected session whose pay returns `response`
    MockTerminalApi* expectPay(int64_t amount, const TransactionResponse& response,
                               TerminalErrc payResult = TerminalErrc::OK) {
        auto* api = terminals_.push();
        EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::OK));
        EXPECT_CALL(*api, pay(amount, _)).WillOnce(DoAll(SetArgReferee<1>(response), Return(payResult)));
        EXPECT_CALL(*api, disconnect()).WillOnce(Return(TerminalErrc::OK));
        return api;
    }

    std::string recordContent(size_t index) const {
        std::ifstream file(store_->listRecords().at(index));
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    fs::path root_;
    MockTerminalQueue terminals_;
    std::shared_ptr<persistence::TransactionStore> store_;
    std::shared_ptr<engine::EngineContext> context_;
    std::unique_ptr<PaymentService> service_;
    bool shutdownRequested_ = false;
};

// --- Init / Test / Shutdown ---

TEST_F(PaymentServiceTest, TestFailsBeforeInit) {
    EXPECT_EQ(service_->test().code, ResultCode::GenericError);
}

TEST_F(PaymentServiceTest, InitStartsHeartbeat) {
    initialise();

    EXPECT_EQ(service_->test().code, ResultCode::Success);
    RuntimeConfiguration active;
    ASSERT_TRUE(context_->getConfiguration(active));
    EXPECT_EQ(active.ipAddress, "192.168.1.50");
    EXPECT_EQ(active.posNumber, 1);
}

TEST_F(PaymentServiceTest, InitRejectsMissingConfiguration) {
    const PaymentOutcome outcome = service_->init(nullptr);

    EXPECT_EQ(outcome.code, ResultCode::ValidationError);
    EXPECT_EQ(terminals_.createdCount(), 0);
    EXPECT_EQ(service_->test().code, ResultCode::GenericError);
}

TEST_F(PaymentServiceTest, InitRejectsNonPositivePosNumber) {
    RuntimeConfiguration configuration = validConfiguration();
    configuration.posNumber = 0;

    EXPECT_EQ(service_->init(&configuration).code, ResultCode::ValidationError);
    EXPECT_FALSE(context_->hasConfiguration());
    EXPECT_EQ(terminals_.createdCount(), 0);
}

TEST_F(PaymentServiceTest, InitRejectsEmptyAddress) {
    RuntimeConfiguration configuration = validConfiguration();
    configuration.ipAddress.clear();

    EXPECT_EQ(service_->init(&configuration).code, ResultCode::ValidationError);
    EXPECT_EQ(terminals_.createdCount(), 0);
}

TEST_F(PaymentServiceTest, InitConnectFailureKeepsServiceDown) {
    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::ConnectFailed));
    EXPECT_CALL(*api, disconnect()).Times(0);

    const RuntimeConfiguration configuration = validConfiguration();
    const PaymentOutcome outcome = service_->init(&configuration);

    EXPECT_EQ(outcome.code, ResultCode::ConnectError);
    EXPECT_EQ(outcome.terminalCode, static_cast<int>(TerminalErrc::ConnectFailed));
    EXPECT_FALSE(context_->hasConfiguration());
    EXPECT_EQ(service_->test().code, ResultCode::GenericError);
}

TEST_F(PaymentServiceTest, ShutdownStopsHeartbeatAndNotifiesHost) {
    initialise();
    ASSERT_EQ(service_->test().code, ResultCode::Success);

    service_->shutdown();

    EXPECT_TRUE(shutdownRequested_);
    EXPECT_EQ(service_->test().code, ResultCode::GenericError);
}

// --- Pay ---

TEST_F(PaymentServiceTest, ChipPaymentSucceedsWithReceipt) {
    initialise();
    expectPay(2500, terminalResponse("0", "1"));

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::Success);
    EXPECT_EQ(outcome.data.result, PaymentResult::Successful);
    EXPECT_EQ(outcome.data.paidAmount, 2500);
    EXPECT_TRUE(outcome.data.hasClientReceipt);
    EXPECT_FALSE(outcome.data.uncertain);
    EXPECT_TRUE(outcome.succeeded());

    EXPECT_NE(store_->readPendingTicket().find("CARD HOLDER COPY"), std::string::npos);
    EXPECT_EQ(store_->listRecords().size(), 1u);
}

TEST_F(PaymentServiceTest, SwipePaymentIsReversed) {
    initialise();
    auto* api = expectPay(1000, terminalResponse("0", "2"));
    TransactionResponse reversal = terminalResponse("9", "2");
    reversal.transactionType = "2";
    EXPECT_CALL(*api, reverse(1000, _)).WillOnce(DoAll(SetArgReferee<1>(reversal), Return(TerminalErrc::OK)));

    const PaymentOutcome outcome = service_->pay(1000);

    EXPECT_EQ(outcome.code, ResultCode::TransactionCancelled);
    EXPECT_EQ(outcome.data.result, PaymentResult::Cancelled);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(outcome.data.hasClientReceipt);
    EXPECT_FALSE(outcome.data.uncertain);

    EXPECT_EQ(store_->readPendingTicket(), persistence::PAYMENT_FAILURE_NOTICE);
    ASSERT_EQ(store_->listRecords().size(), 1u);
    EXPECT_NE(recordContent(0).find("TRANSACTION TYPE: REVERSAL"), std::string::npos);
}

TEST_F(PaymentServiceTest, FailedReversalIsFlaggedUncertain) {
    initialise();
    auto* api = expectPay(1000, terminalResponse("0", "2"));
    EXPECT_CALL(*api, reverse(1000, _)).WillOnce(Return(TerminalErrc::SendFailed));

    const PaymentOutcome outcome = service_->pay(1000);

    EXPECT_EQ(outcome.code, ResultCode::TransactionCancelled);
    EXPECT_EQ(outcome.terminalCode, static_cast<int>(TerminalErrc::SendFailed));
    EXPECT_EQ(outcome.data.result, PaymentResult::Cancelled);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(outcome.data.uncertain);
    ASSERT_EQ(store_->listRecords().size(), 1u);
    EXPECT_NE(recordContent(0).find("TRANSACTION TYPE: SALE"), std::string::npos);
}

TEST_F(PaymentServiceTest, ThrowingReversalStillLeavesNoticeAndRecord) {
    initialise();
    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::OK));
    EXPECT_CALL(*api, pay(1000, _)).WillOnce(DoAll(SetArgReferee<1>(terminalResponse("0", "2")),
                                                   Return(TerminalErrc::OK)));
    EXPECT_CALL(*api, reverse(1000, _)).WillOnce(Throw(std::runtime_error("sdk")));
    EXPECT_CALL(*api, disconnect()).WillOnce(Return(TerminalErrc::OK));

    const PaymentOutcome outcome = service_->pay(1000);

    EXPECT_EQ(outcome.code, ResultCode::TransactionCancelled);
    EXPECT_EQ(outcome.terminalCode, static_cast<int>(TerminalErrc::Unknown));
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(outcome.data.hasClientReceipt);
    EXPECT_TRUE(outcome.data.uncertain);
    EXPECT_EQ(store_->readPendingTicket(), persistence::PAYMENT_FAILURE_NOTICE);
    ASSERT_EQ(store_->listRecords().size(), 1u);
    EXPECT_NE(recordContent(0).find("TRANSACTION TYPE: SALE"), std::string::npos);
}

TEST_F(PaymentServiceTest, ThrowingPayBecomesGenericError) {
    initialise();
    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::OK));
    EXPECT_CALL(*api, pay(2500, _)).WillOnce(Throw(std::runtime_error("sdk")));
    EXPECT_CALL(*api, disconnect()).WillOnce(Return(TerminalErrc::OK));

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::GenericError);
    EXPECT_EQ(outcome.message, "sdk");
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_FALSE(outcome.data.hasClientReceipt);
    EXPECT_FALSE(store_->hasPendingTicket());
    EXPECT_TRUE(store_->listRecords().empty());

    // The engine stays usable after the exception
    expectPay(500, terminalResponse("0", "1"));
    EXPECT_EQ(service_->pay(500).code, ResultCode::Success);
}

TEST_F(PaymentServiceTest, ThrowingConnectDuringInitBecomesGenericError) {
    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Throw(std::runtime_error("sdk")));

    const RuntimeConfiguration configuration = validConfiguration();
    const PaymentOutcome outcome = service_->init(&configuration);

    EXPECT_EQ(outcome.code, ResultCode::GenericError);
    EXPECT_EQ(service_->test().code, ResultCode::GenericError);
}

TEST_F(PaymentServiceTest, DeclinedPaymentWritesFailureNotice) {
    initialise();
    expectPay(700, terminalResponse("2", "1"));

    const PaymentOutcome outcome = service_->pay(700);

    EXPECT_EQ(outcome.code, ResultCode::TransactionFailed);
    EXPECT_EQ(outcome.data.result, PaymentResult::Failed);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(outcome.data.hasClientReceipt);
    EXPECT_EQ(store_->readPendingTicket(), persistence::PAYMENT_FAILURE_NOTICE);
    EXPECT_EQ(store_->listRecords().size(), 1u);
}

TEST_F(PaymentServiceTest, CustomerCancelIsNeitherPaidNorFailed) {
    initialise();
    expectPay(700, terminalResponse("5", "1"));

    const PaymentOutcome outcome = service_->pay(700);

    EXPECT_EQ(outcome.code, ResultCode::Success);
    EXPECT_EQ(outcome.data.result, PaymentResult::Error);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_FALSE(outcome.data.hasClientReceipt);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_FALSE(store_->hasPendingTicket());
    EXPECT_EQ(store_->listRecords().size(), 1u);
}

TEST_F(PaymentServiceTest, UnconfirmedAuthorisationIsUncertain) {
    initialise();
    expectPay(2500, terminalResponse("0", "1", "6"));

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::GenericError);
    EXPECT_EQ(outcome.data.result, PaymentResult::Error);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(outcome.data.uncertain);
    EXPECT_FALSE(store_->hasPendingTicket());
    EXPECT_EQ(store_->listRecords().size(), 1u);
}

TEST_F(PaymentServiceTest, NonPositiveAmountIsRejectedAfterTicketCleanup) {
    initialise();
    ASSERT_TRUE(store_->writeCustomerTicket("stale receipt"));
    const int sessionsBefore = terminals_.createdCount();

    const PaymentOutcome outcome = service_->pay(-5);

    EXPECT_EQ(outcome.code, ResultCode::ValidationError);
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_FALSE(store_->hasPendingTicket());
    EXPECT_EQ(terminals_.createdCount(), sessionsBefore);
    EXPECT_TRUE(store_->listRecords().empty());
}

TEST_F(PaymentServiceTest, PayBeforeInitIsRejected) {
    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::GenericError);
    EXPECT_EQ(terminals_.createdCount(), 0);
}

TEST_F(PaymentServiceTest, PayConnectFailure) {
    initialise();
    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::Timeout));
    EXPECT_CALL(*api, pay(_, _)).Times(0);

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::ConnectError);
    EXPECT_EQ(outcome.terminalCode, static_cast<int>(TerminalErrc::Timeout));
    EXPECT_TRUE(store_->listRecords().empty());
}

TEST_F(PaymentServiceTest, PaySubmitFailure) {
    initialise();
    expectPay(2500, TransactionResponse(), TerminalErrc::SendFailed);

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::SubmitError);
    EXPECT_EQ(outcome.terminalCode, static_cast<int>(TerminalErrc::SendFailed));
    EXPECT_EQ(outcome.data.paidAmount, 0);
    EXPECT_TRUE(store_->listRecords().empty());
}

TEST_F(PaymentServiceTest, PersistenceFailureDoesNotChangeOutcome) {
    std::ofstream(root_ / "not_a_directory") << "x";
    store_ = std::make_shared<persistence::TransactionStore>(root_ / "not_a_directory", root_ / "ticket");
    service_ = std::make_unique<PaymentService>(context_, terminals_.factory(), store_);

    initialise();
    expectPay(2500, terminalResponse("0", "1"));

    const PaymentOutcome outcome = service_->pay(2500);

    EXPECT_EQ(outcome.code, ResultCode::Success);
    EXPECT_EQ(outcome.data.paidAmount, 2500);
    EXPECT_TRUE(store_->hasPendingTicket());
    EXPECT_FALSE(store_->getLastError().empty());
}

TEST_F(PaymentServiceTest, ConcurrentCallsAreRejectedWhilePaying) {
    initialise();

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto* api = terminals_.push();
    EXPECT_CALL(*api, connect(_)).WillOnce(Return(TerminalErrc::OK));
    EXPECT_CALL(*api, pay(2500, _)).WillOnce(
        [&entered, released](int64_t, TransactionResponse& response) {
            entered.set_value();
            released.wait();
            response = terminalResponse("0", "1");
            return TerminalErrc::OK;
        });
    EXPECT_CALL(*api, disconnect()).WillOnce(Return(TerminalErrc::OK));

    std::future<PaymentOutcome> first = std::async(std::launch::async, [this]() { return service_->pay(2500); });
    entered.get_future().wait();

    const PaymentOutcome secondPay = service_->pay(100);
    const RuntimeConfiguration configuration = validConfiguration();
    const PaymentOutcome concurrentInit = service_->init(&configuration);
    const PaymentOutcome liveness = service_->test();

    release.set_value();
    const PaymentOutcome firstPay = first.get();

    EXPECT_EQ(secondPay.code, ResultCode::GenericError);
    EXPECT_EQ(secondPay.message, engine::MSG_PAYMENT_IN_PROGRESS);
    EXPECT_EQ(concurrentInit.code, ResultCode::GenericError);
    EXPECT_EQ(liveness.code, ResultCode::Success);
    EXPECT_EQ(firstPay.code, ResultCode::Success);
    EXPECT_EQ(firstPay.data.paidAmount, 2500);
}

} // namespace kiosk_payment::test
