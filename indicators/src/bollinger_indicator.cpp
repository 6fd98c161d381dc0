#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(int period, double num_std_dev)
    : period_(period), num_std_dev_(num_std_dev), lookback_(0)
{
    if (period_ < 2) {
        throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (num_std_dev_ <= 0.0) {
        throw std::invalid_argument("Bollinger standard deviation multiplier must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, num_std_dev_, num_std_dev_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{:.1f})", period_, num_std_dev_);
}

std::string BollingerIndicator::getName() const {
    return name_;
}

int BollingerIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerIndicator::getResult() const {
    return middle_;
}

const core::TimeSeries<double>& BollingerIndicator::getUpperBand() const {
    return upper_;
}

const core::TimeSeries<double>& BollingerIndicator::getLowerBand() const {
    return lower_;
}

void BollingerIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    auto logger = core::logging::getLogger();
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() < static_cast<size_t>(getMinimumSamples())) {
        logger->trace("Input size ({}) below minimum ({}) for {}. Unavailable.",
                      input.size(), getMinimumSamples(), name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    size_t output_size = close_prices.size() - lookback_;
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_dev_,
        num_std_dev_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_BBANDS calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        upper_.clear();
        middle_.clear();
        lower_.clear();
        return;
    }
    upper_.resize(out_nb_element);
    middle_.resize(out_nb_element);
    lower_.resize(out_nb_element);
}

} // namespace indicators
