// utils_test.cpp - timestamp conversion, UTC day comparison, rounding, nonces

#include <gtest/gtest.h>

#include "utils.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>

// ===========================================================================
// Timestamps
// ===========================================================================

TEST(UtilsTimestampTest, FormatsAsIsoUtcWithMilliseconds) {
    core::Timestamp ts = core::utils::fromUnixSeconds(1709251200.25);
    EXPECT_EQ(core::utils::timestampToString(ts), "2024-03-01T00:00:00.250Z");
}

TEST(UtilsTimestampTest, ParsesZuluAndOffsetForms) {
    core::Timestamp zulu = core::utils::stringToTimestamp("2024-03-01T00:00:00Z");
    core::Timestamp offset = core::utils::stringToTimestamp("2024-03-01T05:30:00+05:30");
    EXPECT_EQ(zulu, offset);
    EXPECT_EQ(core::utils::toUnixSeconds(zulu), 1709251200LL);
}

TEST(UtilsTimestampTest, StringRoundTripKeepsMilliseconds) {
    core::Timestamp ts = core::utils::fromUnixSeconds(1709251200.0) + std::chrono::milliseconds(123);
    core::Timestamp parsed = core::utils::stringToTimestamp(core::utils::timestampToString(ts));
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(parsed.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()));
}

TEST(UtilsTimestampTest, RejectsGarbage) {
    EXPECT_THROW(core::utils::stringToTimestamp("not-a-date"), std::runtime_error);
    EXPECT_THROW(core::utils::stringToTimestamp("2024-03-01T00:00:00X"), std::runtime_error);
}

TEST(UtilsTimestampTest, SameUtcDayBoundaries) {
    core::Timestamp midnight = core::utils::stringToTimestamp("2024-03-01T00:00:00Z");
    core::Timestamp late = core::utils::stringToTimestamp("2024-03-01T23:59:59Z");
    core::Timestamp next = core::utils::stringToTimestamp("2024-03-02T00:00:00Z");
    EXPECT_TRUE(core::utils::sameUtcDay(midnight, late));
    EXPECT_FALSE(core::utils::sameUtcDay(late, next));
}

// ===========================================================================
// Rounding and nonces
// ===========================================================================

TEST(UtilsNumericTest, RoundToPrecision) {
    EXPECT_DOUBLE_EQ(core::utils::roundTo(100.4567, 2), 100.46);
    EXPECT_DOUBLE_EQ(core::utils::roundTo(0.123456789, 8), 0.12345679);
    EXPECT_DOUBLE_EQ(core::utils::roundTo(42.5, 0), 43.0);
    EXPECT_DOUBLE_EQ(core::utils::roundTo(1.23456, -1), 1.23456);
}

TEST(UtilsNumericTest, NoncesStrictlyIncrease) {
    std::set<unsigned long long> seen;
    unsigned long long previous = 0;
    for (int i = 0; i < 1000; ++i) {
        unsigned long long nonce = core::utils::nextNonce();
        EXPECT_GT(nonce, previous);
        previous = nonce;
        seen.insert(nonce);
    }
    EXPECT_EQ(seen.size(), 1000u);
}
