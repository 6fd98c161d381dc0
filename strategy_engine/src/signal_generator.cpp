#include "signal_generator.hpp"
#include "volatility_indicator.hpp"
#include "indicators.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace strategy_engine {

    namespace {

        struct Vote {
            int direction;
            double weight;
        };

        int netDirection(const std::vector<Vote>& votes) {
            int sum = 0;
            for (const auto& vote : votes) sum += vote.direction;
            return (sum > 0) - (sum < 0);
        }

    } // end anonymous namespace

    SignalGenerator::SignalGenerator(StrategyParameters params) : params_(std::move(params)) {
        params_.validate();
    }

    MarketAnalysis SignalGenerator::analyze(const core::TimeSeries<core::PriceBar>& bars) const {
        MarketAnalysis analysis;
        analysis.trend_strength = indicators::trendStrength(bars, params_.trend_period);
        analysis.volume_regime = indicators::volumeRegime(bars, params_.volume_period);
        analysis.levels = indicators::supportResistance(bars, params_.support_resistance_lookback);

        indicators::VolatilityIndicator volatility(params_.volatility_period);
        volatility.calculate(bars);
        analysis.volatility = indicators::latestValue(volatility);
        return analysis;
    }

    SignalScore SignalGenerator::score(const core::IndicatorSnapshot& snapshot,
                                       double current_price,
                                       const MarketAnalysis& analysis) const
    {
        std::vector<Vote> votes;

        // RSI: mean reversion at the extremes
        if (snapshot.rsi_14) {
            double rsi = *snapshot.rsi_14;
            if (rsi < params_.rsi_oversold) {
                votes.push_back({1, params_.rsi_weight});
            } else if (rsi > params_.rsi_overbought) {
                votes.push_back({-1, params_.rsi_weight});
            } else {
                votes.push_back({0, params_.neutral_weight});
            }
        }

        // MACD line vs signal line
        if (snapshot.macd && snapshot.macd_signal) {
            votes.push_back({*snapshot.macd > *snapshot.macd_signal ? 1 : -1, params_.macd_weight});
        }

        // SMA crossover with price confirmation
        if (snapshot.sma_20 && snapshot.sma_50) {
            double sma20 = *snapshot.sma_20;
            double sma50 = *snapshot.sma_50;
            if (sma20 > sma50 && current_price > sma20) {
                votes.push_back({1, params_.sma_weight});
            } else if (sma20 < sma50 && current_price < sma20) {
                votes.push_back({-1, params_.sma_weight});
            } else {
                votes.push_back({0, params_.neutral_weight});
            }
        }

        // Confirmations only reinforce an existing net direction
        int direction = netDirection(votes);
        if (direction != 0 && analysis.trend_strength > params_.trend_threshold) {
            votes.push_back({direction, params_.trend_weight});
        }
        direction = netDirection(votes);
        if (direction != 0 && analysis.volume_regime == core::VolumeRegime::High) {
            votes.push_back({direction, params_.volume_weight});
        }

        SignalScore result;
        result.votes = static_cast<int>(votes.size());
        if (votes.empty()) {
            return result;
        }

        double weighted = 0.0;
        double total_weight = 0.0;
        for (const auto& vote : votes) {
            weighted += vote.direction * vote.weight;
            total_weight += vote.weight;
        }
        result.score = weighted / total_weight;

        if (result.score > params_.signal_threshold) {
            result.type = result.score > params_.strong_threshold ? core::SignalType::StrongBuy : core::SignalType::Buy;
        } else if (result.score < -params_.signal_threshold) {
            result.type = result.score < -params_.strong_threshold ? core::SignalType::StrongSell : core::SignalType::Sell;
        } else {
            result.type = core::SignalType::Hold;
        }
        result.confidence = std::min(std::abs(result.score), 1.0);
        return result;
    }

    TradeLevels SignalGenerator::tradeLevels(core::SignalType type,
                                             double entry,
                                             double volatility,
                                             const std::optional<indicators::SupportResistance>& levels) const
    {
        TradeLevels result;
        result.entry = entry;

        // Volatility (annualized, in the same units as the indicator) mapped to a price fraction
        double vol_factor = std::clamp(volatility / 100.0, params_.min_volatility_factor, params_.max_volatility_factor);

        bool is_long = (type == core::SignalType::Buy || type == core::SignalType::StrongBuy);
        if (is_long) {
            result.target = entry * (1.0 + vol_factor * params_.target_multiplier);
            result.stop_loss = entry * (1.0 - vol_factor * params_.stop_multiplier);
            if (levels && levels->resistance > entry) {
                result.target = std::min(result.target, levels->resistance * (1.0 - params_.level_margin));
            }
        } else {
            result.target = entry * (1.0 - vol_factor * params_.target_multiplier);
            result.stop_loss = entry * (1.0 + vol_factor * params_.stop_multiplier);
            if (levels && levels->support < entry) {
                result.target = std::max(result.target, levels->support * (1.0 + params_.level_margin));
            }
        }
        return result;
    }

    double SignalGenerator::positionSizePct(double confidence, double volatility) const {
        double volatility_damping = std::max(params_.min_volatility_damping,
                                             1.0 - volatility / params_.volatility_damping_divisor);
        double size = params_.base_position_pct * confidence * volatility_damping;
        return std::min(size, params_.max_position_pct);
    }

    std::optional<core::TradingSignal> SignalGenerator::generate(const core::TradingPair& pair,
                                                                 const core::TimeSeries<core::PriceBar>& bars,
                                                                 const core::IndicatorSnapshot& snapshot,
                                                                 core::Timestamp now) const
    {
        auto logger = core::logging::getLogger();
        if (bars.empty()) {
            logger->debug("No bars for {}: no signal.", pair.symbol);
            return std::nullopt;
        }

        MarketAnalysis analysis = analyze(bars);
        if (!analysis.volatility) {
            logger->debug("Volatility unavailable for {} ({} bars): no signal.", pair.symbol, bars.size());
            return std::nullopt;
        }

        const double current_price = bars.back().close;
        SignalScore vote = score(snapshot, current_price, analysis);
        logger->debug("{} vote: type={}, score={:.3f}, confidence={:.3f}, votes={}",
                      pair.symbol, core::toString(vote.type), vote.score, vote.confidence, vote.votes);

        if (vote.type == core::SignalType::Hold || vote.confidence < params_.min_confidence) {
            return std::nullopt;
        }

        TradeLevels levels = tradeLevels(vote.type, current_price, *analysis.volatility, analysis.levels);

        core::TradingSignal signal;
        signal.pair_id = pair.id;
        signal.signal_type = vote.type;
        signal.confidence = vote.confidence;
        signal.entry_price = levels.entry;
        signal.target_price = levels.target;
        signal.stop_loss_price = levels.stop_loss;
        signal.trend_strength = analysis.trend_strength;
        signal.volatility = *analysis.volatility;
        signal.volume_profile = analysis.volume_regime;
        if (analysis.levels) {
            signal.support_level = analysis.levels->support;
            signal.resistance_level = analysis.levels->resistance;
        }
        signal.strategy_type = params_.strategy_type;
        signal.position_size_pct = positionSizePct(vote.confidence, *analysis.volatility);
        signal.time_horizon_minutes = params_.time_horizon_minutes;
        signal.created_at = now;
        signal.expires_at = now + std::chrono::minutes(params_.signal_ttl_minutes);
        signal.is_active = true;

        logger->info("Signal {} for {}: confidence={:.2f}, entry={:.4f}, target={:.4f}, stop={:.4f}, size={:.2f}%",
                     core::toString(signal.signal_type), pair.symbol, signal.confidence,
                     signal.entry_price, signal.target_price, signal.stop_loss_price, signal.position_size_pct);
        return signal;
    }

} // namespace strategy_engine
