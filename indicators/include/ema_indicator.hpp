#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

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
