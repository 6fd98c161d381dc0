#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace data {

    // Enforces a minimum spacing between consecutive outbound requests.
    // Shared by every exchange call; acquire() blocks until the caller may send.
    class RateLimiter {
    public:
        explicit RateLimiter(std::chrono::milliseconds min_interval);

        RateLimiter(const RateLimiter&) = delete;
        RateLimiter& operator=(const RateLimiter&) = delete;

        void acquire();

        std::chrono::milliseconds getMinInterval() const { return min_interval_; }

    private:
        using Clock = std::chrono::steady_clock;

        const std::chrono::milliseconds min_interval_;
        std::mutex mutex_;
        std::optional<Clock::time_point> last_request_;
    };

} // namespace data
