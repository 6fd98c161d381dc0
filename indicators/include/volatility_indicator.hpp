#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Population standard deviation of log returns over the trailing window,
// annualized for hourly bars (sqrt(365 * 24)).
class VolatilityIndicator : public IIndicator {
public:
    explicit VolatilityIndicator(int period = 20);

    virtual ~VolatilityIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    static constexpr double kAnnualizationPeriods = 365.0 * 24.0;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
