// src/common/uuid_generator.cpp
#include "common/uuid_generator.h"
#include <random>

namespace kiosk_payment {

std::string UUIDGenerator::generate() {
    // 'x' = any hex digit, 'y' = one of 8, 9, a, b
    static constexpr char kPattern[] = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    static constexpr char kHex[] = "0123456789abcdef";

    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> nibble(0, 15);
    std::uniform_int_distribution<> variant(8, 11);

    std::string uuid(kPattern);
    for (auto& c : uuid) {
        if (c == 'x') {
            c = kHex[nibble(gen)];
        } else if (c == 'y') {
            c = kHex[variant(gen)];
        }
    }
    return uuid;
}

} // namespace kiosk_payment
