#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() < static_cast<size_t>(getMinimumSamples())) {
        logger->trace("Input size ({}) below minimum ({}) for {}. Unavailable.",
                      input.size(), getMinimumSamples(), name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    results_.resize(close_prices.size() - lookback_);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        return;
    }
    results_.resize(out_nb_element);
}

} // namespace indicators
