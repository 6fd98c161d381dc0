#include "strategy_parameters.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    namespace { // File-local helpers

        template<typename T>
        void readKey(const json& config, const char* key, T& target) {
            if (!config.contains(key) || config[key].is_null()) {
                return;
            }
            try {
                target = config[key].get<T>();
            } catch (const json::exception& e) {
                throw core::ConfigException(fmt::format("Invalid strategy parameter '{}': {}", key, e.what()));
            }
        }

        void requirePositive(double value, const char* name) {
            if (value <= 0.0) {
                throw core::ConfigException(fmt::format("Strategy parameter '{}' must be positive (got {}).", name, value));
            }
        }

    } // end anonymous namespace

    StrategyParameters StrategyParameters::fromJson(const json& config) {
        StrategyParameters params;
        if (config.is_null()) {
            return params;
        }
        if (!config.is_object()) {
            throw core::ConfigException("Strategy config must be a JSON object.");
        }

        readKey(config, "strategy_type", params.strategy_type);
        readKey(config, "rsi_period", params.rsi_period);
        readKey(config, "trend_period", params.trend_period);
        readKey(config, "volatility_period", params.volatility_period);
        readKey(config, "volume_period", params.volume_period);
        readKey(config, "support_resistance_lookback", params.support_resistance_lookback);
        readKey(config, "rsi_oversold", params.rsi_oversold);
        readKey(config, "rsi_overbought", params.rsi_overbought);
        readKey(config, "rsi_weight", params.rsi_weight);
        readKey(config, "macd_weight", params.macd_weight);
        readKey(config, "sma_weight", params.sma_weight);
        readKey(config, "neutral_weight", params.neutral_weight);
        readKey(config, "trend_weight", params.trend_weight);
        readKey(config, "trend_threshold", params.trend_threshold);
        readKey(config, "volume_weight", params.volume_weight);
        readKey(config, "signal_threshold", params.signal_threshold);
        readKey(config, "strong_threshold", params.strong_threshold);
        readKey(config, "min_confidence", params.min_confidence);
        readKey(config, "min_volatility_factor", params.min_volatility_factor);
        readKey(config, "max_volatility_factor", params.max_volatility_factor);
        readKey(config, "target_multiplier", params.target_multiplier);
        readKey(config, "stop_multiplier", params.stop_multiplier);
        readKey(config, "level_margin", params.level_margin);
        readKey(config, "base_position_pct", params.base_position_pct);
        readKey(config, "max_position_pct", params.max_position_pct);
        readKey(config, "min_volatility_damping", params.min_volatility_damping);
        readKey(config, "volatility_damping_divisor", params.volatility_damping_divisor);
        readKey(config, "signal_ttl_minutes", params.signal_ttl_minutes);
        readKey(config, "time_horizon_minutes", params.time_horizon_minutes);

        params.validate();
        core::logging::getLogger()->debug("Strategy parameters loaded: type={}, min_confidence={:.2f}, ttl={}min",
                                          params.strategy_type, params.min_confidence, params.signal_ttl_minutes);
        return params;
    }

    void StrategyParameters::validate() const {
        if (rsi_period < 1 || trend_period < 2 || volatility_period < 2 ||
            volume_period < 1 || support_resistance_lookback < 2) {
            throw core::ConfigException("Strategy indicator windows are too short.");
        }
        if (!(rsi_oversold < rsi_overbought)) {
            throw core::ConfigException("rsi_oversold must be below rsi_overbought.");
        }
        requirePositive(rsi_weight, "rsi_weight");
        requirePositive(macd_weight, "macd_weight");
        requirePositive(sma_weight, "sma_weight");
        requirePositive(neutral_weight, "neutral_weight");
        requirePositive(trend_weight, "trend_weight");
        requirePositive(volume_weight, "volume_weight");
        requirePositive(min_volatility_factor, "min_volatility_factor");
        requirePositive(target_multiplier, "target_multiplier");
        requirePositive(stop_multiplier, "stop_multiplier");
        requirePositive(base_position_pct, "base_position_pct");
        requirePositive(max_position_pct, "max_position_pct");
        requirePositive(volatility_damping_divisor, "volatility_damping_divisor");
        if (min_volatility_factor > max_volatility_factor) {
            throw core::ConfigException("min_volatility_factor must not exceed max_volatility_factor.");
        }
        if (!(signal_threshold >= 0.0 && signal_threshold <= strong_threshold && strong_threshold <= 1.0)) {
            throw core::ConfigException("Thresholds must satisfy 0 <= signal_threshold <= strong_threshold <= 1.");
        }
        if (min_confidence < 0.0 || min_confidence > 1.0) {
            throw core::ConfigException("min_confidence must be within [0, 1].");
        }
        if (level_margin < 0.0 || level_margin >= 1.0) {
            throw core::ConfigException("level_margin must be within [0, 1).");
        }
        if (signal_ttl_minutes <= 0) {
            throw core::ConfigException("signal_ttl_minutes must be positive.");
        }
    }

} // namespace strategy_engine
