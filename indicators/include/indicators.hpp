#pragma once

#include "datatypes.hpp" // Needs PriceBar, TimeSeries
#include <string>
#include <vector>
#include <optional>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first output value.
    // getResult()[i] is aligned with input[i + getLookback()].
    virtual int getLookback() const = 0;

    // Fewest input bars for which a value is reported. Below this the
    // indicator is "unavailable" and getResult() stays empty.
    virtual int getMinimumSamples() const { return getLookback() + 1; }

    // Calculate over chronologically ordered bars (oldest first).
    // Results are stored internally.
    virtual void calculate(const core::TimeSeries<core::PriceBar>& input) = 0;

    // Calculated results (primary line for multi-line indicators)
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Latest value of a calculated series, empty when the indicator is unavailable
inline std::optional<double> latestValue(const core::TimeSeries<double>& series) {
    if (series.empty()) {
        return std::nullopt;
    }
    return series.back();
}

inline std::optional<double> latestValue(const IIndicator& indicator) {
    return latestValue(indicator.getResult());
}

// Column extraction helpers for TA-Lib input arrays
std::vector<double> closePrices(const core::TimeSeries<core::PriceBar>& bars);
std::vector<double> highPrices(const core::TimeSeries<core::PriceBar>& bars);
std::vector<double> lowPrices(const core::TimeSeries<core::PriceBar>& bars);
std::vector<double> volumes(const core::TimeSeries<core::PriceBar>& bars);

} // namespace indicators
