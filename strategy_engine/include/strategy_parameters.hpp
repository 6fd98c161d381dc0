#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    // Tunables for the weighted-vote scalping strategy. Defaults are the
    // production values; the "strategy" block of the bot config overrides them.
    struct StrategyParameters {
        std::string strategy_type = "SCALP";

        // --- Indicator windows ---
        int rsi_period = 14;
        int trend_period = 20;
        int volatility_period = 20;
        int volume_period = 20;
        int support_resistance_lookback = 20;

        // --- Votes ---
        double rsi_oversold = 30.0;
        double rsi_overbought = 70.0;
        double rsi_weight = 0.3;
        double macd_weight = 0.25;
        double sma_weight = 0.2;
        double neutral_weight = 0.1;   // Weight of a 0 vote (RSI or SMA undecided)
        double trend_weight = 0.15;
        double trend_threshold = 0.7;
        double volume_weight = 0.1;

        // --- Classification ---
        double signal_threshold = 0.3; // |score| above -> BUY/SELL
        double strong_threshold = 0.6; // |score| above -> STRONG_*
        double min_confidence = 0.6;   // Signals below are discarded

        // --- Trade levels ---
        double min_volatility_factor = 0.005;
        double max_volatility_factor = 0.05;
        double target_multiplier = 2.0;
        double stop_multiplier = 1.0;
        double level_margin = 0.01;    // Distance kept from support/resistance

        // --- Sizing (percent of available balance) ---
        double base_position_pct = 2.0;
        double max_position_pct = 5.0;
        double min_volatility_damping = 0.5;
        double volatility_damping_divisor = 10.0;

        // --- Lifetime ---
        int signal_ttl_minutes = 120;
        int time_horizon_minutes = 60;

        // Throws core::ConfigException on invalid values
        static StrategyParameters fromJson(const json& config);

        void validate() const;
    };

} // namespace strategy_engine
