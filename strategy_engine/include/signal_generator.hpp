#pragma once

#include <optional>
#include "datatypes.hpp"
#include "market_structure.hpp"
#include "strategy_parameters.hpp"

namespace strategy_engine {

    // Market context beyond the stored indicator snapshot
    struct MarketAnalysis {
        double trend_strength = 0.0;
        std::optional<double> volatility;
        core::VolumeRegime volume_regime = core::VolumeRegime::Unknown;
        std::optional<indicators::SupportResistance> levels;
    };

    // Result of the weighted vote before the confidence cut
    struct SignalScore {
        core::SignalType type = core::SignalType::Hold;
        double score = 0.0;       // [-1, 1]
        double confidence = 0.0;  // min(|score|, 1)
        int votes = 0;
    };

    struct TradeLevels {
        double entry = 0.0;
        double target = 0.0;
        double stop_loss = 0.0;
    };

    class SignalGenerator {
    public:
        explicit SignalGenerator(StrategyParameters params = StrategyParameters{});

        const StrategyParameters& getParameters() const { return params_; }

        // Trend, volatility, volume regime and support/resistance over `bars`
        MarketAnalysis analyze(const core::TimeSeries<core::PriceBar>& bars) const;

        // Weighted vote of the available indicators
        SignalScore score(const core::IndicatorSnapshot& snapshot,
                          double current_price,
                          const MarketAnalysis& analysis) const;

        // Entry/target/stop around `entry` for a directional signal type
        TradeLevels tradeLevels(core::SignalType type,
                                double entry,
                                double volatility,
                                const std::optional<indicators::SupportResistance>& levels) const;

        // Recommended percent of available balance
        double positionSizePct(double confidence, double volatility) const;

        // At most one signal for the pair. Empty for HOLD, low confidence, or
        // insufficient data (logged at debug).
        std::optional<core::TradingSignal> generate(const core::TradingPair& pair,
                                                    const core::TimeSeries<core::PriceBar>& bars,
                                                    const core::IndicatorSnapshot& snapshot,
                                                    core::Timestamp now) const;

    private:
        StrategyParameters params_;
    };

} // namespace strategy_engine
