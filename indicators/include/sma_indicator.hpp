#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Simple moving average of closing prices
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

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
