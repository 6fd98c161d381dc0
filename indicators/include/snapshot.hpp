#pragma once

#include "datatypes.hpp"
#include <optional>
#include <cstddef>

namespace indicators {

    // Fewest bars for which a snapshot is produced (SMA-50 window)
    constexpr std::size_t kSnapshotMinimumBars = 50;

    // Indicator overlay for the newest bar of `bars` (oldest first).
    // Empty below kSnapshotMinimumBars; individual fields stay empty when
    // their own window is not yet filled.
    std::optional<core::IndicatorSnapshot> computeSnapshot(const core::TimeSeries<core::PriceBar>& bars);

} // namespace indicators
