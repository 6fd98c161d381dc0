#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// SMA middle band with upper/lower bands at +/- k standard deviations
class BollingerIndicator : public IIndicator {
public:
    explicit BollingerIndicator(int period = 20, double num_std_dev = 2.0);

    virtual ~BollingerIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;

    // Middle band
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getUpperBand() const;
    const core::TimeSeries<double>& getLowerBand() const;

private:
    const int period_;
    const double num_std_dev_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
