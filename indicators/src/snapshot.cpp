#include "snapshot.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "logging.hpp"

namespace indicators {

    std::optional<core::IndicatorSnapshot> computeSnapshot(const core::TimeSeries<core::PriceBar>& bars) {
        auto logger = core::logging::getLogger();
        if (bars.size() < kSnapshotMinimumBars) {
            logger->debug("Snapshot skipped: {} bars available, {} required.", bars.size(), kSnapshotMinimumBars);
            return std::nullopt;
        }

        core::IndicatorSnapshot snapshot;

        RsiIndicator rsi(14);
        rsi.calculate(bars);
        snapshot.rsi_14 = latestValue(rsi);

        MacdIndicator macd(12, 26, 9);
        macd.calculate(bars);
        snapshot.macd = latestValue(macd);
        snapshot.macd_signal = latestValue(macd.getSignalLine());
        snapshot.macd_histogram = latestValue(macd.getHistogram());

        BollingerIndicator bollinger(20, 2.0);
        bollinger.calculate(bars);
        snapshot.bb_upper = latestValue(bollinger.getUpperBand());
        snapshot.bb_middle = latestValue(bollinger);
        snapshot.bb_lower = latestValue(bollinger.getLowerBand());

        SmaIndicator sma20(20);
        SmaIndicator sma50(50);
        sma20.calculate(bars);
        sma50.calculate(bars);
        snapshot.sma_20 = latestValue(sma20);
        snapshot.sma_50 = latestValue(sma50);

        EmaIndicator ema12(12);
        EmaIndicator ema26(26);
        ema12.calculate(bars);
        ema26.calculate(bars);
        snapshot.ema_12 = latestValue(ema12);
        snapshot.ema_26 = latestValue(ema26);

        logger->trace("Snapshot computed over {} bars: RSI={}, SMA20={}, SMA50={}",
                      bars.size(), snapshot.rsi_14.value_or(-1.0),
                      snapshot.sma_20.value_or(-1.0), snapshot.sma_50.value_or(-1.0));
        return snapshot;
    }

} // namespace indicators
