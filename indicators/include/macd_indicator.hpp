#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period = 12, int slow_period = 26, int signal_period = 9);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    // A full slow window plus a full signal window
    int getMinimumSamples() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;

    // MACD line
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getSignalLine() const;
    const core::TimeSeries<double>& getHistogram() const;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
