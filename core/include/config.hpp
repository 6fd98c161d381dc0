#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace core {

    using json = nlohmann::json;

    struct ExchangeConfig {
        std::string base_url = "https://api.kraken.com";
        std::string api_version = "0";
        std::string api_key;          // From KRAKEN_API_KEY
        std::string private_key;      // From KRAKEN_PRIVATE_KEY (base64)
        long request_timeout_ms = 15000;
        long min_request_interval_ms = 1000;
        std::string quote_balance_asset = "ZUSD";
    };

    struct DatabaseConfig {
        std::string path = "trading_bot.db";
    };

    struct SchedulerConfig {
        int market_data_interval_s = 60;
        int signal_interval_s = 300;
        int monitoring_interval_s = 30;
        int portfolio_interval_s = 180;
        int tick_sleep_ms = 1000;          // Idle wait between ticks
        int ohlc_interval_minutes = 60;
        int bars_per_refresh = 10;         // Newest bars persisted per refresh
        int history_bars = 100;            // Bars reloaded for indicator computation
        int max_signals_per_cycle = 3;
        double min_position_usd = 50.0;
    };

    struct RiskConfig {
        double max_position_size_pct = 5.0;
        double max_daily_loss_pct = 2.0;
        double max_total_exposure_pct = 50.0;
    };

    enum class ClosePolicy {
        ConfirmThenClose, // Closed once the exchange reports the close order filled
        Optimistic        // Closed immediately at the last known price
    };

    struct ExecutionConfig {
        ClosePolicy close_policy = ClosePolicy::ConfirmThenClose;
        std::optional<double> trailing_stop_pct; // Trailing distance as % of the fill price
    };

    struct LoggingConfig {
        std::string console_level = "info";
        std::string file_level = "debug";
        std::string directory = "logs";
        std::string base_filename = "trading_bot";
    };

    struct BotConfig {
        ExchangeConfig exchange;
        DatabaseConfig database;
        SchedulerConfig scheduler;
        RiskConfig risk;
        ExecutionConfig execution;
        LoggingConfig logging;
        std::vector<TradingPair> pairs;
        json strategy = json::object(); // Parsed by strategy_engine::StrategyParameters

        // Throws ConfigException on malformed input. Missing keys keep their defaults.
        static BotConfig fromJson(const json& config);

        // Reads and parses a JSON file, then overlays credentials from the environment
        static BotConfig loadFromFile(const std::string& path);

        // KRAKEN_API_KEY / KRAKEN_PRIVATE_KEY
        void applyEnvironment();

        bool hasCredentials() const {
            return !exchange.api_key.empty() && !exchange.private_key.empty();
        }
    };

    std::string toString(ClosePolicy policy);
    ClosePolicy closePolicyFromString(const std::string& str);

} // namespace core
