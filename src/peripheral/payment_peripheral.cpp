// src/peripheral/payment_peripheral.cpp
#include "peripheral/payment_peripheral.h"
#include "core/peripheral_constants.h"
#include "logging/logger.h"
#include <filesystem>

namespace kiosk_payment::peripheral {

namespace {

constexpr const char* SETTING_IP_ADDRESS = "IpAddress";
constexpr const char* SETTING_FORCE_ONLINE = "ForceOnline";
constexpr const char* SETTING_POS_NUMBER = "PosNumber";

AdminPeripheralSetting makeSetting(SettingDataType type, const std::string& controlName, const std::string& realName,
                                   const std::string& currentValue, const std::string& description) {
    AdminPeripheralSetting setting;
    setting.controlType = type;
    setting.controlName = controlName;
    setting.realName = realName;
    setting.currentValue = currentValue;
    setting.controlDescription = description;
    return setting;
}

} // namespace

PaymentPeripheral::PaymentPeripheral(supervisor::SupervisorOptions options)
    : supervisor_(std::make_unique<supervisor::DriverSupervisor>(std::move(options)))
    , lastStatus_(PeripheralStatus::notConfigured()) {
    auto& logger = logging::Logger::getInstance();
    logger.info(std::string(core::kPeripheralName) + " " + core::kDriverVersion);
    logger.info("Loader method started...");

    const std::filesystem::path driverPath(supervisor_->getOptions().driverPath);

    currentConfig_.id = core::kPeripheralId;
    currentConfig_.paymentName = core::kPeripheralName;
    currentConfig_.driverFolderName = driverPath.parent_path().filename().string();
    currentConfig_.configurationSettings = {
        makeSetting(SettingDataType::IpAddress, "Terminal IP address", SETTING_IP_ADDRESS, "",
                    "Network address of the EFT terminal"),
        makeSetting(SettingDataType::Bool, "Force online transaction", SETTING_FORCE_ONLINE, "False",
                    "Force online transaction"),
        makeSetting(SettingDataType::Int, "POS Number", SETTING_POS_NUMBER, "1", "POS Number")
    };
}

PaymentPeripheral::~PaymentPeripheral() = default;

bool PaymentPeripheral::init() {
    auto& logger = logging::Logger::getInstance();
    logger.info("Initializing payment...");

    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            channelFactory_.reset();
        }

        // Kill a stale driver, start a fresh one and wait for its endpoint
        if (!supervisor_->start()) {
            logger.error("Failed to start payment driver: " + supervisor_->getLastError()
                + " (" + resultCodeToString(ResultCode::ProcessSupervisionError) + ")");
            setLastStatus(PeripheralStatus::genericError());
            logger.info("Init method finished.");
            return false;
        }

        logger.info("Creating channel factory...");
        auto factory = supervisor_->getChannelFactory();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            channelFactory_ = factory;
        }

        const engine::RuntimeConfiguration configuration = buildRuntimeConfiguration();
        logger.info("Serialized Configuration: " + configuration.toJson().dump());

        auto proxy = factory->createChannel();
        const engine::PaymentOutcome result = proxy->init(configuration);

        if (result.code == ResultCode::Success) {
            setLastStatus(PeripheralStatus::ok());
            logger.info("Driver successfully initialized.");
        } else {
            setLastStatus(PeripheralStatus::genericError());
            logger.info("Driver failed to initialize: " + resultCodeToString(result.code) + " " + result.message);
        }

        logger.info("Init method finished.");
        return result.code == ResultCode::Success;
    } catch (const std::exception& e) {
        setLastStatus(PeripheralStatus::genericError());
        logger.error("Failed to initialize payment driver.");
        logger.error(e.what());
        logger.info("Init method finished.");
        return false;
    }
}

bool PaymentPeripheral::init(const std::string& settingsJson) {
    if (!updateSettings(settingsJson)) {
        setLastStatus(PeripheralStatus::genericError());
        return false;
    }
    return init();
}

bool PaymentPeripheral::updateSettings(const std::string& configJson, bool overwrite) {
    auto& logger = logging::Logger::getInstance();
    logger.info("UpdateSettings method started...");

    // Values are always merged by RealName; overwrite is part of the host contract only
    (void)overwrite;

    nlohmann::json json = nlohmann::json::parse(configJson, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        logger.error("Failed to update payment settings: malformed document");
        logger.info("UpdateSettings method finished.");
        return false;
    }

    try {
        const nlohmann::json settings = json.value("ConfigurationSettings", nlohmann::json::array());
        if (!settings.is_array()) {
            logger.error("Failed to update payment settings: ConfigurationSettings is not an array");
            logger.info("UpdateSettings method finished.");
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : settings) {
            AdminPeripheralSetting incoming;
            if (!entry.is_object() || !incoming.fromJson(entry)) {
                logger.warn("Skipping unreadable setting: " + entry.dump());
                continue;
            }
            for (auto& current : currentConfig_.configurationSettings) {
                if (current.realName == incoming.realName) {
                    current.currentValue = incoming.currentValue;
                    logger.debug("Setting " + current.realName + " = " + current.currentValue);
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        logger.error("Failed to update payment settings.");
        logger.error(e.what());
        logger.info("UpdateSettings method finished.");
        return false;
    }

    logger.info("UpdateSettings method finished.");
    return true;
}

bool PaymentPeripheral::test() {
    auto& logger = logging::Logger::getInstance();

    auto factory = currentChannelFactory();
    if (!factory) {
        logger.debug("Test called before Init.");
        logger.debug("Test method finished.");
        return false;
    }

    try {
        auto proxy = factory->createChannel();
        const engine::PaymentOutcome result = proxy->test();

        setLastStatus(result.code == ResultCode::Success ? PeripheralStatus::ok() : PeripheralStatus::genericError());
        if (result.code != ResultCode::Success) {
            logger.error("Payment driver test returned an error.");
        }
    } catch (const std::exception& e) {
        setLastStatus(PeripheralStatus::genericError());
        logger.error("Failed to test payment driver.");
        logger.error(e.what());
        logger.debug("Test method finished.");
        return false;
    }

    logger.debug("Test method finished.");
    return getLastStatus().isOk();
}

bool PaymentPeripheral::pay(const PayRequest& request, PayDetails& payDetails,
                            StatusDetails& statusDetails, bool& wasUncertainPaymentDetected) {
    auto& logger = logging::Logger::getInstance();
    logger.info("Pay method started...");
    logger.debug("PayRequest: " + nlohmann::json{{"Amount", request.amount}}.dump());

    payDetails = PayDetails();
    statusDetails = StatusDetails();
    wasUncertainPaymentDetected = false;

    auto factory = currentChannelFactory();
    if (!factory) {
        logger.error("Pay called before Init.");
        statusDetails.statusCode = static_cast<int>(ResultCode::GenericError);
        statusDetails.description = "Payment peripheral is not initialised";
        logger.info("Pay method finished.");
        return false;
    }

    try {
        auto proxy = factory->createChannel();
        const engine::PaymentOutcome result = proxy->pay(request.amount);

        if (result.succeeded()) {
            logger.info("Payment has been succeeded.");
            setLastStatus(PeripheralStatus::ok());
            payDetails.paidAmount = result.data.paidAmount;
        } else {
            logger.info("Payment has been failed.");
        }
        payDetails.hasClientReceipt = result.data.hasClientReceipt;

        if (result.data.uncertain) {
            logger.warn("Uncertain payment detected: " + result.message);
            wasUncertainPaymentDetected = true;
        }

        statusDetails.statusCode = static_cast<int>(result.code);
        statusDetails.description = result.message;

        logger.info("Pay method finished.");
        return result.succeeded();
    } catch (const ipc::ChannelError& e) {
        logger.error("Payment exception has been thrown.");
        logger.error(e.what());
        setLastStatus(PeripheralStatus::genericError());
        // The driver may have charged the card before the channel broke
        wasUncertainPaymentDetected = e.requestDelivered();
        statusDetails.statusCode = static_cast<int>(ResultCode::GenericError);
        statusDetails.description = e.what();
        logger.info("Pay method finished.");
        return false;
    } catch (const std::exception& e) {
        logger.error("Payment exception has been thrown.");
        logger.error(e.what());
        statusDetails.statusCode = static_cast<int>(ResultCode::GenericError);
        statusDetails.description = e.what();
        logger.info("Pay method finished.");
        return false;
    }
}

bool PaymentPeripheral::unload() {
    auto& logger = logging::Logger::getInstance();
    logger.info("Unload method started...");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        channelFactory_.reset();
    }

    const bool stopped = supervisor_->teardown();
    if (!stopped) {
        logger.error("Unload failed: " + supervisor_->getLastError());
    }
    setLastStatus(PeripheralStatus::notConfigured());

    logger.info("Unload method finished.");
    return stopped;
}

std::string PaymentPeripheral::getPaymentFactoryDetails() const {
    auto& logger = logging::Logger::getInstance();
    logger.info("GetPaymentFactoryDetails method started...");

    nlohmann::json details;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        details = {{"Payment", nlohmann::json::array({currentConfig_.toJson()})}};
    }

    logger.info("GetPaymentFactoryDetails method finished.");
    return details.dump();
}

engine::RuntimeConfiguration PaymentPeripheral::buildRuntimeConfiguration() const {
    engine::RuntimeConfiguration configuration;
    configuration.ipAddress = getSettingValue(SETTING_IP_ADDRESS);
    configuration.forceOnline = core::isEnabled(getSettingValue(SETTING_FORCE_ONLINE));

    const std::string posNumber = getSettingValue(SETTING_POS_NUMBER);
    try {
        configuration.posNumber = posNumber.empty() ? 0 : std::stoi(posNumber);
    } catch (const std::exception&) {
        // Left at 0 so the driver rejects it
        logging::Logger::getInstance().warn("PosNumber is not a number: " + posNumber);
        configuration.posNumber = 0;
    }
    return configuration;
}

std::string PaymentPeripheral::getSettingValue(const std::string& realName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& setting : currentConfig_.configurationSettings) {
        if (setting.realName == realName) {
            return setting.currentValue;
        }
    }
    return "";
}

std::shared_ptr<ipc::ChannelFactory> PaymentPeripheral::currentChannelFactory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channelFactory_;
}

PeripheralStatus PaymentPeripheral::getLastStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastStatus_;
}

void PaymentPeripheral::setLastStatus(const PeripheralStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastStatus_ = status;
}

std::string PaymentPeripheral::getDriverId() const {
    return core::kPeripheralId;
}

std::string PaymentPeripheral::getPeripheralName() const {
    return core::kPeripheralName;
}

std::string PaymentPeripheral::getPeripheralType() const {
    return core::kPeripheralType;
}

std::string PaymentPeripheral::getDriverVersion() const {
    return core::kDriverVersion;
}

int PaymentPeripheral::getMinApiLevel() const {
    return core::kMinApiLevel;
}

} // namespace kiosk_payment::peripheral
