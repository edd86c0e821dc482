// include/peripheral/payment_peripheral.h
#pragma once

#include "engine/runtime_configuration.h"
#include "ipc/channel_factory.h"
#include "peripheral/ipayment_peripheral.h"
#include "supervisor/driver_supervisor.h"
#include <memory>
#include <mutex>

namespace kiosk_payment::peripheral {

// Host-side adapter: owns the driver supervisor and forwards each operation
// to the driver over a fresh channel session.
class PaymentPeripheral : public IPaymentPeripheral {
public:
    explicit PaymentPeripheral(supervisor::SupervisorOptions options);
    ~PaymentPeripheral() override;

    PaymentPeripheral(const PaymentPeripheral&) = delete;
    PaymentPeripheral& operator=(const PaymentPeripheral&) = delete;

    bool init() override;
    // updateSettings(settingsJson) followed by init()
    bool init(const std::string& settingsJson);
    bool test() override;
    bool pay(const PayRequest& request, PayDetails& payDetails,
             StatusDetails& statusDetails, bool& wasUncertainPaymentDetected) override;
    bool unload() override;

    bool updateSettings(const std::string& configJson, bool overwrite = false) override;
    std::string getPaymentFactoryDetails() const override;

    PeripheralStatus getLastStatus() const override;
    PaymentCapability getCapability() const override { return PaymentCapability(); }
    std::string getDriverId() const override;
    std::string getPeripheralName() const override;
    std::string getPeripheralType() const override;
    std::string getDriverVersion() const override;
    int getMinApiLevel() const override;

    // Current settings as the configuration sent with Init
    engine::RuntimeConfiguration buildRuntimeConfiguration() const;

    const supervisor::DriverSupervisor& getSupervisor() const { return *supervisor_; }

private:
    std::shared_ptr<ipc::ChannelFactory> currentChannelFactory() const;
    std::string getSettingValue(const std::string& realName) const;
    void setLastStatus(const PeripheralStatus& status);

    std::unique_ptr<supervisor::DriverSupervisor> supervisor_;
    std::shared_ptr<ipc::ChannelFactory> channelFactory_;
    PaymentFactoryConfig currentConfig_;
    PeripheralStatus lastStatus_;

    mutable std::mutex mutex_;
};

} // namespace kiosk_payment::peripheral
