#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }

    // One bar is consumed by the price deltas, period-1 more by the averaging
    int ma_lookback = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (ma_lookback < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", ma_lookback));
    }
    lookback_ = ma_lookback + 1;

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->trace("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() < static_cast<size_t>(getMinimumSamples())) {
        logger->trace("Input size ({}) below minimum ({}) for {}. Unavailable.",
                      input.size(), getMinimumSamples(), name_);
        return;
    }

    // Split close-to-close deltas into gain and loss arrays
    std::vector<double> close_prices = closePrices(input);
    std::vector<double> gains(close_prices.size() - 1, 0.0);
    std::vector<double> losses(close_prices.size() - 1, 0.0);
    for (size_t i = 1; i < close_prices.size(); ++i) {
        double delta = close_prices[i] - close_prices[i - 1];
        if (delta > 0) {
            gains[i - 1] = delta;
        } else {
            losses[i - 1] = -delta;
        }
    }

    std::vector<double> avg_gain(gains.size());
    std::vector<double> avg_loss(losses.size());
    int gain_begin = 0, gain_count = 0;
    int loss_begin = 0, loss_count = 0;
    const int end_idx = static_cast<int>(gains.size()) - 1;

    TA_RetCode ret_code = TA_MA(0, end_idx, gains.data(), period_, TA_MAType_SMA,
                                &gain_begin, &gain_count, avg_gain.data());
    if (ret_code == TA_SUCCESS) {
        ret_code = TA_MA(0, end_idx, losses.data(), period_, TA_MAType_SMA,
                         &loss_begin, &loss_count, avg_loss.data());
    }
    if (ret_code != TA_SUCCESS || gain_count != loss_count) {
        logger->error("TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        return;
    }

    results_.reserve(gain_count);
    for (int i = 0; i < gain_count; ++i) {
        if (avg_loss[i] == 0.0) {
            results_.push_back(100.0);
            continue;
        }
        double rs = avg_gain[i] / avg_loss[i];
        results_.push_back(100.0 - 100.0 / (1.0 + rs));
    }
}

} // namespace indicators
