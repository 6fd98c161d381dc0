// rate_limiter_test.cpp - minimum spacing between outbound exchange requests

#include <gtest/gtest.h>

#include "rate_limiter.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

using SteadyClock = std::chrono::steady_clock;

long long elapsedMs(SteadyClock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - since).count();
}

}  // namespace

TEST(RateLimiterTest, FirstAcquireDoesNotWait) {
    data::RateLimiter limiter(500ms);
    auto start = SteadyClock::now();
    limiter.acquire();
    EXPECT_LT(elapsedMs(start), 250);
    EXPECT_EQ(limiter.getMinInterval(), 500ms);
}

TEST(RateLimiterTest, ConsecutiveAcquiresAreSpaced) {
    data::RateLimiter limiter(100ms);
    limiter.acquire();
    auto start = SteadyClock::now();
    limiter.acquire();
    EXPECT_GE(elapsedMs(start), 90);
}

TEST(RateLimiterTest, ConcurrentCallersQueue) {
    data::RateLimiter limiter(60ms);
    auto start = SteadyClock::now();

    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&limiter] { limiter.acquire(); });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    // Four requests need three full gaps
    EXPECT_GE(elapsedMs(start), 170);
}

TEST(RateLimiterTest, ZeroIntervalNeverWaits) {
    data::RateLimiter limiter(0ms);
    auto start = SteadyClock::now();
    for (int i = 0; i < 100; ++i) {
        limiter.acquire();
    }
    EXPECT_LT(elapsedMs(start), 250);
}

TEST(RateLimiterTest, RejectsNegativeInterval) {
    EXPECT_THROW(data::RateLimiter(std::chrono::milliseconds(-1)), std::invalid_argument);
}
