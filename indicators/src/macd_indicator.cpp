#include "macd_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0)
{
    if (fast_period_ < 2 || slow_period_ < 2 || signal_period_ < 1) {
        throw std::invalid_argument("MACD periods must be fast >= 2, slow >= 2, signal >= 1.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

int MacdIndicator::getMinimumSamples() const {
    return slow_period_ + signal_period_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

const core::TimeSeries<double>& MacdIndicator::getSignalLine() const {
    return signal_;
}

const core::TimeSeries<double>& MacdIndicator::getHistogram() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() < static_cast<size_t>(getMinimumSamples())) {
        logger->trace("Input size ({}) below minimum ({}) for {}. Unavailable.",
                      input.size(), getMinimumSamples(), name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    size_t output_size = close_prices.size() - lookback_;
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_MACD calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        macd_.clear();
        signal_.clear();
        histogram_.clear();
        return;
    }
    macd_.resize(out_nb_element);
    signal_.resize(out_nb_element);
    histogram_.resize(out_nb_element);
}

} // namespace indicators
