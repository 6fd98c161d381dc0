#include "config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <cstdlib>

namespace core {

    namespace {

        // Reads an optional key into `target`, keeping the default when absent
        template<typename T>
        void readOptional(const json& section, const char* key, T& target, const std::string& section_name) {
            if (!section.contains(key) || section[key].is_null()) {
                return;
            }
            try {
                target = section[key].get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section_name, key, e.what()));
            }
        }

        const json& sectionOrEmpty(const json& config, const char* name) {
            static const json empty = json::object();
            if (!config.contains(name)) {
                return empty;
            }
            if (!config[name].is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return config[name];
        }

        TradingPair parsePair(const json& pair_config) {
            if (!pair_config.is_object() || !pair_config.contains("symbol") || !pair_config["symbol"].is_string()) {
                throw ConfigException("Each entry in 'pairs' must be an object with a 'symbol' (string).");
            }
            TradingPair pair;
            pair.symbol = pair_config["symbol"].get<std::string>();
            readOptional(pair_config, "base_asset", pair.base_asset, "pairs");
            readOptional(pair_config, "quote_asset", pair.quote_asset, "pairs");
            readOptional(pair_config, "display_name", pair.display_name, "pairs");
            readOptional(pair_config, "price_precision", pair.price_precision, "pairs");
            readOptional(pair_config, "volume_precision", pair.volume_precision, "pairs");
            readOptional(pair_config, "min_order_size", pair.min_order_size, "pairs");
            readOptional(pair_config, "active", pair.is_active, "pairs");
            if (pair.display_name.empty() && !pair.base_asset.empty() && !pair.quote_asset.empty()) {
                pair.display_name = pair.base_asset + "/" + pair.quote_asset;
            }
            if (pair.price_precision < 0 || pair.volume_precision < 0 || pair.min_order_size < 0.0) {
                throw ConfigException(fmt::format("Pair '{}' has negative precision or minimum order size.", pair.symbol));
            }
            return pair;
        }

    } // end anonymous namespace

    std::string toString(ClosePolicy policy) {
        return policy == ClosePolicy::Optimistic ? "optimistic" : "confirm_then_close";
    }

    ClosePolicy closePolicyFromString(const std::string& str) {
        if (str == "confirm_then_close") return ClosePolicy::ConfirmThenClose;
        if (str == "optimistic") return ClosePolicy::Optimistic;
        throw ConfigException("Unknown close policy: " + str);
    }

    BotConfig BotConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Bot config root must be a JSON object.");
        }
        BotConfig result;

        const json& exchange = sectionOrEmpty(config, "exchange");
        readOptional(exchange, "base_url", result.exchange.base_url, "exchange");
        readOptional(exchange, "api_version", result.exchange.api_version, "exchange");
        readOptional(exchange, "request_timeout_ms", result.exchange.request_timeout_ms, "exchange");
        readOptional(exchange, "min_request_interval_ms", result.exchange.min_request_interval_ms, "exchange");
        readOptional(exchange, "quote_balance_asset", result.exchange.quote_balance_asset, "exchange");
        if (result.exchange.request_timeout_ms <= 0 || result.exchange.min_request_interval_ms < 0) {
            throw ConfigException("exchange.request_timeout_ms must be positive and min_request_interval_ms non-negative.");
        }

        const json& database = sectionOrEmpty(config, "database");
        readOptional(database, "path", result.database.path, "database");

        const json& scheduler = sectionOrEmpty(config, "scheduler");
        auto& sched = result.scheduler;
        readOptional(scheduler, "market_data_interval_s", sched.market_data_interval_s, "scheduler");
        readOptional(scheduler, "signal_interval_s", sched.signal_interval_s, "scheduler");
        readOptional(scheduler, "monitoring_interval_s", sched.monitoring_interval_s, "scheduler");
        readOptional(scheduler, "portfolio_interval_s", sched.portfolio_interval_s, "scheduler");
        readOptional(scheduler, "tick_sleep_ms", sched.tick_sleep_ms, "scheduler");
        readOptional(scheduler, "ohlc_interval_minutes", sched.ohlc_interval_minutes, "scheduler");
        readOptional(scheduler, "bars_per_refresh", sched.bars_per_refresh, "scheduler");
        readOptional(scheduler, "history_bars", sched.history_bars, "scheduler");
        readOptional(scheduler, "max_signals_per_cycle", sched.max_signals_per_cycle, "scheduler");
        readOptional(scheduler, "min_position_usd", sched.min_position_usd, "scheduler");
        if (sched.market_data_interval_s < 0 || sched.signal_interval_s < 0 ||
            sched.monitoring_interval_s < 0 || sched.portfolio_interval_s < 0) {
            throw ConfigException("scheduler intervals must be non-negative.");
        }
        if (sched.history_bars < 50) {
            throw ConfigException("scheduler.history_bars must be at least 50 (indicator snapshot minimum).");
        }

        const json& risk = sectionOrEmpty(config, "risk");
        readOptional(risk, "max_position_size_pct", result.risk.max_position_size_pct, "risk");
        readOptional(risk, "max_daily_loss_pct", result.risk.max_daily_loss_pct, "risk");
        readOptional(risk, "max_total_exposure_pct", result.risk.max_total_exposure_pct, "risk");

        const json& execution = sectionOrEmpty(config, "execution");
        std::string close_policy = toString(result.execution.close_policy);
        readOptional(execution, "close_policy", close_policy, "execution");
        result.execution.close_policy = closePolicyFromString(close_policy);
        if (execution.contains("trailing_stop_pct") && !execution["trailing_stop_pct"].is_null()) {
            double pct = 0.0;
            readOptional(execution, "trailing_stop_pct", pct, "execution");
            if (pct <= 0.0) {
                throw ConfigException("execution.trailing_stop_pct must be positive when set.");
            }
            result.execution.trailing_stop_pct = pct;
        }

        const json& logging_section = sectionOrEmpty(config, "logging");
        readOptional(logging_section, "console_level", result.logging.console_level, "logging");
        readOptional(logging_section, "file_level", result.logging.file_level, "logging");
        readOptional(logging_section, "directory", result.logging.directory, "logging");
        readOptional(logging_section, "base_filename", result.logging.base_filename, "logging");

        if (config.contains("strategy")) {
            if (!config["strategy"].is_object()) {
                throw ConfigException("Config section 'strategy' must be an object.");
            }
            result.strategy = config["strategy"];
        }

        if (config.contains("pairs")) {
            if (!config["pairs"].is_array()) {
                throw ConfigException("Config key 'pairs' must be an array.");
            }
            for (const auto& pair_config : config["pairs"]) {
                result.pairs.push_back(parsePair(pair_config));
            }
        }
        return result;
    }

    BotConfig BotConfig::loadFromFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        BotConfig result = fromJson(config);
        result.applyEnvironment();
        return result;
    }

    void BotConfig::applyEnvironment() {
        const char* api_key_env = std::getenv("KRAKEN_API_KEY");
        const char* private_key_env = std::getenv("KRAKEN_PRIVATE_KEY");
        if (api_key_env) exchange.api_key = api_key_env;
        if (private_key_env) exchange.private_key = private_key_env;
    }

} // namespace core
