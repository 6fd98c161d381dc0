#pragma once

#include "datatypes.hpp"
#include <optional>

namespace indicators {

    struct SupportResistance {
        double support = 0.0;    // Lowest low in the window
        double resistance = 0.0; // Highest high in the window
    };

    // Least-squares slope of the trailing closes divided by their mean,
    // scaled by 1000 and clamped to [0, 1]. 0.0 below `period` bars.
    double trendStrength(const core::TimeSeries<core::PriceBar>& bars, int period = 20);

    // Latest volume relative to the trailing mean: HIGH > 1.5, MEDIUM > 0.8, else LOW.
    // UNKNOWN below `period` bars or when the mean volume is zero.
    core::VolumeRegime volumeRegime(const core::TimeSeries<core::PriceBar>& bars, int period = 20);

    // Unavailable below `lookback` bars
    std::optional<SupportResistance> supportResistance(const core::TimeSeries<core::PriceBar>& bars, int lookback = 20);

} // namespace indicators
