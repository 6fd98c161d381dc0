#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string, e.g. "2024-03-01T12:00:00.000Z"
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string (Z or +HH:MM offset) to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Unix seconds (Kraken wire format) <-> Timestamp
    Timestamp fromUnixSeconds(double seconds);
    long long toUnixSeconds(const Timestamp& ts);

    // True when both timestamps fall on the same UTC calendar day
    bool sameUtcDay(const Timestamp& a, const Timestamp& b);

    // Round to a fixed number of decimal places (exchange precision)
    double roundTo(double value, int decimals);

    // Strictly increasing value suitable as a Kraken nonce (microseconds since epoch)
    unsigned long long nextNonce();

} // namespace utils
} // namespace core
