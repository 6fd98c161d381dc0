#include "rate_limiter.hpp"
#include "logging.hpp"
#include <thread>
#include <stdexcept>

namespace data {

    RateLimiter::RateLimiter(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {
        if (min_interval_.count() < 0) {
            throw std::invalid_argument("Rate limiter interval must be non-negative.");
        }
    }

    void RateLimiter::acquire() {
        // Held while sleeping so concurrent callers queue up behind each other
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_request_) {
            auto elapsed = Clock::now() - *last_request_;
            if (elapsed < min_interval_) {
                auto wait = min_interval_ - elapsed;
                core::logging::getLogger()->trace("Rate limiter waiting {} ms",
                    std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
                std::this_thread::sleep_for(wait);
            }
        }
        last_request_ = Clock::now();
    }

} // namespace data
