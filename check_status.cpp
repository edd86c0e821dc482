// check_status.cpp - Payment peripheral check from the host side
// Starts the driver, runs Init and Test, optionally a Pay, then unloads.
#include "logging/logger.h"
#include "config/config_manager.h"
#include "peripheral/payment_peripheral.h"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace kiosk_payment;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <config.ini>] [--settings <settings.json>]"
              << " [--ip <address>] [--pay <amount in minor units>] [--keep]" << std::endl;
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    content = oss.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string settingsPath;
    std::string ipAddress;
    int64_t amount = 0;
    bool keepDriver = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            settingsPath = argv[++i];
        } else if (arg == "--ip" && i + 1 < argc) {
            ipAddress = argv[++i];
        } else if (arg == "--pay" && i + 1 < argc) {
            try {
                amount = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                printUsage(argv[0]);
                return 2;
            }
        } else if (arg == "--keep") {
            keepDriver = true;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    auto& config = config::ConfigManager::getInstance();
    config.initialize(configPath);
    auto& logger = logging::Logger::getInstance();
    logger.setLevel(logging::stringToLogLevel(config.getString(config::KEY_LOG_LEVEL)));

    std::cout << "=== Payment Peripheral Status Check ===" << std::endl;

    peripheral::PaymentPeripheral payment(supervisor::SupervisorOptions::fromConfig());
    std::cout << "Peripheral: " << payment.getPeripheralName() << " (" << payment.getDriverId() << ")"
              << ", driver " << payment.getDriverVersion() << std::endl;

    // 1. Settings
    std::cout << "\n[1] Applying settings..." << std::endl;
    if (!settingsPath.empty()) {
        std::string settings;
        if (!readFile(settingsPath, settings) || !payment.updateSettings(settings)) {
            std::cerr << "ERROR: cannot apply settings from " << settingsPath << std::endl;
            return 1;
        }
    }
    if (!ipAddress.empty()) {
        nlohmann::json settings = {{"ConfigurationSettings", {{{"RealName", "IpAddress"}, {"CurrentValue", ipAddress}}}}};
        if (!payment.updateSettings(settings.dump())) {
            std::cerr << "ERROR: cannot apply terminal address" << std::endl;
            return 1;
        }
    }
    std::cout << "  -> " << payment.getPaymentFactoryDetails() << std::endl;

    // 2. Init
    std::cout << "\n[2] Starting driver and initialising terminal..." << std::endl;
    if (!payment.init()) {
        std::cout << "  -> Init failed (status " << payment.getLastStatus().description << ")" << std::endl;
        if (!payment.unload()) {
            std::cerr << "  -> Unload failed" << std::endl;
        }
        return 1;
    }
    std::cout << "  -> Init OK" << std::endl;

    // 3. Test
    std::cout << "\n[3] Testing driver..." << std::endl;
    const bool alive = payment.test();
    std::cout << "  -> " << (alive ? "Alive" : "Not alive") << std::endl;

    // 4. Pay
    int exitCode = alive ? 0 : 1;
    if (amount != 0) {
        std::cout << "\n[4] Paying " << amount << "..." << std::endl;
        peripheral::PayRequest request;
        request.amount = amount;
        peripheral::PayDetails details;
        peripheral::StatusDetails status;
        bool uncertain = false;

        const bool paid = payment.pay(request, details, status, uncertain);
        std::cout << "  -> " << (paid ? "Paid" : "Not paid")
                  << ", amount " << details.paidAmount
                  << ", receipt " << (details.hasClientReceipt ? "yes" : "no")
                  << ", status " << status.statusCode << " " << status.description << std::endl;
        if (uncertain) {
            std::cout << "  -> WARNING: uncertain payment, check the terminal journal" << std::endl;
        }
        if (!paid) {
            exitCode = 1;
        }
    }

    // 5. Unload
    if (!keepDriver) {
        std::cout << "\n[5] Unloading..." << std::endl;
        if (!payment.unload()) {
            std::cerr << "  -> Unload failed" << std::endl;
            exitCode = 1;
        }
    }

    std::cout << "\n=== Check Complete ===" << std::endl;
    return exitCode;
}
