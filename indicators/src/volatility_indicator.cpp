#include "volatility_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

VolatilityIndicator::VolatilityIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("Volatility period must be at least 2.");
    }

    int stddev_lookback = TA_STDDEV_Lookback(period_, 1.0);
    if (stddev_lookback < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_STDDEV_Lookback returned an unexpected value: {}", stddev_lookback));
    }
    // +1 for the bar consumed by the first return
    lookback_ = stddev_lookback + 1;

    name_ = fmt::format("VOL({})", period_);
}

std::string VolatilityIndicator::getName() const {
    return name_;
}

int VolatilityIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& VolatilityIndicator::getResult() const {
    return results_;
}

void VolatilityIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() < static_cast<size_t>(getMinimumSamples())) {
        logger->trace("Input size ({}) below minimum ({}) for {}. Unavailable.",
                      input.size(), getMinimumSamples(), name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    std::vector<double> log_returns;
    log_returns.reserve(close_prices.size() - 1);
    for (size_t i = 1; i < close_prices.size(); ++i) {
        if (close_prices[i] <= 0.0 || close_prices[i - 1] <= 0.0) {
            logger->warn("Non-positive close price in input for {}. Unavailable.", name_);
            return;
        }
        log_returns.push_back(std::log(close_prices[i] / close_prices[i - 1]));
    }

    results_.resize(log_returns.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_STDDEV(
        0,
        static_cast<int>(log_returns.size()) - 1,
        log_returns.data(),
        period_,
        1.0,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_STDDEV calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        return;
    }
    results_.resize(out_nb_element);

    const double annualization = std::sqrt(kAnnualizationPeriods);
    for (double& value : results_) {
        value *= annualization;
    }
}

} // namespace indicators
