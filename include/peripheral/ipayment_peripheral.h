// include/peripheral/ipayment_peripheral.h
#pragma once

#include "peripheral/peripheral_types.h"
#include <string>

namespace kiosk_payment::peripheral {

// Inbound contract consumed by the host kiosk platform.
// No method throws; failures are reported as false and through getLastStatus().
class IPaymentPeripheral {
public:
    virtual ~IPaymentPeripheral() = default;

    // Starts the driver and initialises the terminal with the current settings
    virtual bool init() = 0;
    virtual bool test() = 0;
    virtual bool pay(const PayRequest& request, PayDetails& payDetails,
                     StatusDetails& statusDetails, bool& wasUncertainPaymentDetected) = 0;
    virtual bool unload() = 0;

    virtual bool updateSettings(const std::string& configJson, bool overwrite = false) = 0;
    virtual std::string getPaymentFactoryDetails() const = 0;

    virtual PeripheralStatus getLastStatus() const = 0;
    virtual PaymentCapability getCapability() const = 0;
    virtual std::string getDriverId() const = 0;
    virtual std::string getPeripheralName() const = 0;
    virtual std::string getPeripheralType() const = 0;
    virtual std::string getDriverVersion() const = 0;
    virtual int getMinApiLevel() const = 0;
};

} // namespace kiosk_payment::peripheral
