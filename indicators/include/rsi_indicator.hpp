#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// RSI over simple (not Wilder-smoothed) averages of the trailing `period`
// gains and losses. Average loss of exactly zero reports 100.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period = 14);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
