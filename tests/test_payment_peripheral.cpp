// tests/test_payment_peripheral.cpp
// Host adapter end to end: supervises a real payment_driver running the
// simulator backend and drives Init/Test/Pay/Unload over the local endpoint.
#include "config/config_manager.h"
#include "core/peripheral_constants.h"
#include "peripheral/payment_peripheral.h"
#include "supervisor/process_utils.h"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

#ifndef PAYMENT_DRIVER_BINARY
#error "PAYMENT_DRIVER_BINARY must name the built payment_driver executable"
#endif

namespace kiosk_payment::test {

namespace fs = std::filesystem;
using peripheral::PaymentPeripheral;
using peripheral::PayDetails;
using peripheral::PayRequest;
using peripheral::PeripheralStatus;
using peripheral::StatusDetails;

class PaymentPeripheralTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        const std::string suffix = std::to_string(::getpid()) + "_" + std::to_string(counter++);
        root_ = fs::temp_directory_path() / ("kpp_" + suffix);
        fs::remove_all(root_);
        fs::create_directories(root_ / "driver");

        // A private copy, so single-instance cleanup only sees this test's driver
        driverPath_ = root_ / "driver" / ("pd" + suffix).substr(0, 15);
        fs::copy_file(PAYMENT_DRIVER_BINARY, driverPath_, fs::copy_options::overwrite_existing);
        fs::permissions(driverPath_, fs::perms::owner_all, fs::perm_options::add);
    }

    void TearDown() override {
        peripheral_.reset();
        config::ConfigManager::getInstance().reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    // Writes config.ini and builds the peripheral from it
    void createPeripheral(const std::map<std::string, std::string>& simulator = {}) {
        const fs::path configPath = root_ / "config.ini";
        {
            std::ofstream file(configPath);
            file << config::KEY_DRIVER_PATH << "=" << driverPath_.string() << "\n";
            file << config::KEY_DRIVER_READY_TIMEOUT << "=10000\n";
            file << config::KEY_DRIVER_READY_POLL << "=20\n";
            file << config::KEY_IPC_ENDPOINT_DIR << "=" << root_.string() << "\n";
            file << config::KEY_IPC_OPEN_TIMEOUT << "=2000\n";
            file << config::KEY_IPC_RECEIVE_TIMEOUT << "=20000\n";
            file << config::KEY_OUTPUT_PATH << "=" << (root_ / "records").string() << "\n";
            file << config::KEY_TICKET_PATH << "=" << (root_ / "ticket").string() << "\n";
            file << config::KEY_LOG_LEVEL << "=warn\n";
            file << config::KEY_TERMINAL_BACKEND << "=simulator\n";
            for (const auto& kv : simulator) {
                file << "simulator." << kv.first << "=" << kv.second << "\n";
            }
        }

        auto& config = config::ConfigManager::getInstance();
        config.reset();
        config.initialize(configPath.string());
        peripheral_ = std::make_unique<PaymentPeripheral>(supervisor::SupervisorOptions::fromConfig());
    }

    bool configureTerminal(const std::string& ipAddress, const std::string& posNumber = "1") {
        nlohmann::json settings = {{"ConfigurationSettings", {
            {{"RealName", "IpAddress"}, {"CurrentValue", ipAddress}},
            {{"RealName", "PosNumber"}, {"CurrentValue", posNumber}}
        }}};
        return peripheral_->updateSettings(settings.dump());
    }

    size_t recordCount() const {
        if (!fs::exists(root_ / "records")) {
            return 0;
        }
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(root_ / "records")) {
            count += entry.is_regular_file() ? 1 : 0;
        }
        return count;
    }

    std::string driverName() const {
        return driverPath_.filename().string();
    }

    fs::path root_;
    fs::path driverPath_;
    std::unique_ptr<PaymentPeripheral> peripheral_;
};

TEST_F(PaymentPeripheralTest, FactoryDetailsDescribeSettings) {
    createPeripheral();

    const nlohmann::json details = nlohmann::json::parse(peripheral_->getPaymentFactoryDetails());
    ASSERT_TRUE(details["Payment"].is_array());
    ASSERT_EQ(details["Payment"].size(), 1u);

    const nlohmann::json& payment = details["Payment"][0];
    EXPECT_EQ(payment["Id"], core::kPeripheralId);
    EXPECT_EQ(payment["PaymentName"], core::kPeripheralName);
    EXPECT_EQ(payment["DriverFolderName"], "driver");
    ASSERT_EQ(payment["ConfigurationSettings"].size(), 3u);
    EXPECT_EQ(payment["ConfigurationSettings"][0]["RealName"], "IpAddress");
    EXPECT_EQ(payment["ConfigurationSettings"][0]["ControlType"], "IpAddress");
    EXPECT_EQ(payment["ConfigurationSettings"][2]["CurrentValue"], "1");
}

TEST_F(PaymentPeripheralTest, SettingsAreMergedByName) {
    createPeripheral();

    EXPECT_TRUE(configureTerminal("192.168.0.20", "7"));
    EXPECT_FALSE(peripheral_->updateSettings("not json"));

    const engine::RuntimeConfiguration configuration = peripheral_->buildRuntimeConfiguration();
    EXPECT_EQ(configuration.ipAddress, "192.168.0.20");
    EXPECT_EQ(configuration.posNumber, 7);
    EXPECT_FALSE(configuration.forceOnline);
}

TEST_F(PaymentPeripheralTest, CallsBeforeInitFail) {
    createPeripheral();

    PayRequest request;
    request.amount = 2500;
    PayDetails details;
    StatusDetails status;
    bool uncertain = true;

    EXPECT_FALSE(peripheral_->test());
    EXPECT_FALSE(peripheral_->pay(request, details, status, uncertain));
    EXPECT_FALSE(uncertain);
    EXPECT_EQ(peripheral_->getLastStatus().status, PeripheralStatus::STATUS_NOT_CONFIGURED);
}

TEST_F(PaymentPeripheralTest, SuccessfulPaymentEndToEnd) {
    createPeripheral();
    ASSERT_TRUE(configureTerminal("10.0.0.1"));

    ASSERT_TRUE(peripheral_->init()) << peripheral_->getSupervisor().getLastError();
    EXPECT_TRUE(peripheral_->getLastStatus().isOk());
    EXPECT_TRUE(peripheral_->getSupervisor().isDriverRunning());
    EXPECT_TRUE(peripheral_->test());

    PayRequest request;
    request.amount = 2500;
    PayDetails details;
    StatusDetails status;
    bool uncertain = true;

    EXPECT_TRUE(peripheral_->pay(request, details, status, uncertain));
    EXPECT_EQ(details.paidAmount, 2500);
    EXPECT_TRUE(details.hasClientReceipt);
    EXPECT_EQ(status.statusCode, static_cast<int>(ResultCode::Success));
    EXPECT_FALSE(uncertain);
    EXPECT_TRUE(fs::exists(root_ / "ticket"));
    EXPECT_EQ(recordCount(), 1u);

    const pid_t driverPid = peripheral_->getSupervisor().getDriverPid();
    EXPECT_TRUE(peripheral_->unload());
    EXPECT_FALSE(supervisor::isProcessAlive(driverPid));
    EXPECT_TRUE(supervisor::findProcessesByName(driverName()).empty());
    EXPECT_FALSE(peripheral_->test());
}

TEST_F(PaymentPeripheralTest, SwipedCardIsReversed) {
    createPeripheral({{"entry_method", "2"}});
    ASSERT_TRUE(configureTerminal("10.0.0.1"));
    ASSERT_TRUE(peripheral_->init());

    PayRequest request;
    request.amount = 1000;
    PayDetails details;
    StatusDetails status;
    bool uncertain = true;

    EXPECT_FALSE(peripheral_->pay(request, details, status, uncertain));
    EXPECT_EQ(details.paidAmount, 0);
    EXPECT_TRUE(details.hasClientReceipt);
    EXPECT_EQ(status.statusCode, static_cast<int>(ResultCode::TransactionCancelled));
    EXPECT_FALSE(uncertain);

    EXPECT_TRUE(peripheral_->unload());
}

TEST_F(PaymentPeripheralTest, InvalidAmountIsRejectedByDriver) {
    createPeripheral();
    ASSERT_TRUE(configureTerminal("10.0.0.1"));
    ASSERT_TRUE(peripheral_->init());

    PayRequest request;
    request.amount = -5;
    PayDetails details;
    StatusDetails status;
    bool uncertain = true;

    EXPECT_FALSE(peripheral_->pay(request, details, status, uncertain));
    EXPECT_EQ(status.statusCode, static_cast<int>(ResultCode::ValidationError));
    EXPECT_EQ(details.paidAmount, 0);
    EXPECT_FALSE(uncertain);
    EXPECT_EQ(recordCount(), 0u);

    EXPECT_TRUE(peripheral_->unload());
}

TEST_F(PaymentPeripheralTest, InitWithoutAddressFails) {
    createPeripheral();

    EXPECT_FALSE(peripheral_->init());
    EXPECT_EQ(peripheral_->getLastStatus().status, PeripheralStatus::STATUS_GENERIC_ERROR);
    EXPECT_TRUE(peripheral_->unload());
    EXPECT_EQ(peripheral_->getLastStatus().status, PeripheralStatus::STATUS_NOT_CONFIGURED);
}

TEST_F(PaymentPeripheralTest, UnreachableTerminalFailsInit) {
    createPeripheral({{"connect_result", "2"}});
    ASSERT_TRUE(configureTerminal("10.0.0.1"));

    EXPECT_FALSE(peripheral_->init());
    EXPECT_FALSE(peripheral_->test());
    EXPECT_TRUE(peripheral_->unload());
}

TEST_F(PaymentPeripheralTest, ReinitReplacesRunningDriver) {
    createPeripheral();
    ASSERT_TRUE(configureTerminal("10.0.0.1"));

    ASSERT_TRUE(peripheral_->init());
    const pid_t firstPid = peripheral_->getSupervisor().getDriverPid();
    ASSERT_TRUE(peripheral_->init());
    const pid_t secondPid = peripheral_->getSupervisor().getDriverPid();

    EXPECT_NE(firstPid, secondPid);
    EXPECT_FALSE(supervisor::isProcessAlive(firstPid));
    EXPECT_EQ(supervisor::findProcessesByName(driverName()).size(), 1u);
    EXPECT_TRUE(peripheral_->test());

    EXPECT_TRUE(peripheral_->unload());
}

TEST_F(PaymentPeripheralTest, MissingDriverBinaryFailsInit) {
    createPeripheral();
    fs::remove(driverPath_);
    ASSERT_TRUE(configureTerminal("10.0.0.1"));

    EXPECT_FALSE(peripheral_->init());
    EXPECT_EQ(peripheral_->getLastStatus().status, PeripheralStatus::STATUS_GENERIC_ERROR);
    EXPECT_NE(peripheral_->getSupervisor().getLastError().find("not executable"), std::string::npos);
}

} // namespace kiosk_payment::test
