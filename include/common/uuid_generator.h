// include/common/uuid_generator.h
#pragma once

#include <string>

namespace kiosk_payment {

// UUIDGenerator - generates UUIDs for IPC command ids
class UUIDGenerator {
public:
    // Generate a UUID v4 string
    static std::string generate();
};

} // namespace kiosk_payment
