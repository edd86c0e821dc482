// src/main.cpp
// Payment Driver - Main Entry Point
// Hosts the transaction engine behind the local endpoint until Shutdown or a signal.

#include "logging/logger.h"
#include "config/config_manager.h"
#include "core/peripheral_constants.h"
#include "engine/engine_context.h"
#include "engine/payment_service.h"
#include "ipc/command_processor.h"
#include "ipc/local_socket_server.h"
#include "persistence/transaction_store.h"
#include "vendor_adapters/simulator/simulated_terminal.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace kiosk_payment;

namespace {
    std::atomic<bool> g_running(true);

    struct DriverArguments {
        std::string configPath;
        std::string endpointPath;
    };

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " [--config <config.ini>] [--endpoint <socket path>]" << std::endl;
    }

    bool parseArguments(int argc, char* argv[], DriverArguments& args) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                args.configPath = argv[++i];
            } else if (arg == "--endpoint" && i + 1 < argc) {
                args.endpointPath = argv[++i];
            } else {
                return false;
            }
        }
        return true;
    }

    // The pending ticket lives beside the driver binary unless configured absolute
    std::filesystem::path resolveTicketPath(const config::ConfigManager& config) {
        std::filesystem::path ticket(config.getString(config::KEY_TICKET_PATH));
        if (ticket.empty()) {
            ticket = "ticket";
        }
        if (ticket.is_relative()) {
            ticket = config::ConfigManager::executableDirectory() / ticket;
        }
        return ticket;
    }
}

// Signal handler for graceful shutdown
void SignalHandler(int /*signal*/) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    DriverArguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto& config = config::ConfigManager::getInstance();
        config.initialize(args.configPath);

        auto& logger = logging::Logger::getInstance();
        logger.setLevel(logging::stringToLogLevel(config.getString(config::KEY_LOG_LEVEL)));
        logger.initialize(config.getPath(config::KEY_LOG_FILE).string());
        logger.info("Payment driver " + std::string(core::kDriverVersion) + " starting...");
        logger.info("Using config file " + config.getConfigFilePath());

        const std::string backend = config.getTerminalBackend();
        if (backend != "simulator") {
            logger.error("Unsupported terminal backend: " + backend);
            return 1;
        }
        const vendor::simulator::SimulatorSettings terminalSettings = vendor::simulator::SimulatorSettings::fromConfig();
        terminal::TerminalApiFactory terminalFactory = [terminalSettings]() -> std::unique_ptr<terminal::ITerminalApi> {
            return std::make_unique<vendor::simulator::SimulatedTerminal>(terminalSettings);
        };

        auto store = std::make_shared<persistence::TransactionStore>(config.getOutputPath(), resolveTicketPath(config));
        logger.info("Transaction records: " + store->getOutputDirectory().string()
            + ", customer ticket: " + store->getTicketPath().string());

        auto context = std::make_shared<engine::EngineContext>();
        auto service = std::make_shared<engine::PaymentService>(context, terminalFactory, store, []() {
            g_running = false;
        });
        ipc::CommandProcessor processor(service);

        const std::string endpoint = args.endpointPath.empty()
            ? core::endpointPathFor(config.getPath(config::KEY_IPC_ENDPOINT_DIR).string())
            : args.endpointPath;

        ipc::LocalSocketServer server(endpoint, config.getMilliseconds(config::KEY_IPC_SEND_TIMEOUT));
        if (!server.start([&processor](const std::string& request) { return processor.handleMessage(request); })) {
            logger.error("Failed to start driver endpoint: " + server.getLastError());
            return 1;
        }

        logger.info("Payment driver started successfully");

        // Main loop
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        server.stop();
        logger.info("Payment driver stopped");
        logger.shutdown();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().error("Exception in main: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
