// config_test.cpp - BotConfig parsing, defaults and environment overlay;
// StrategyParameters overrides and validation; enum string mapping

#include <gtest/gtest.h>

#include "config.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "strategy_parameters.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

using json = nlohmann::json;

// Sets or clears an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        const char* old = std::getenv(name);
        if (old) previous_ = old;
        had_previous_ = old != nullptr;
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~EnvGuard() {
        if (had_previous_) {
            setenv(name_.c_str(), previous_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string previous_;
    bool had_previous_ = false;
};

}  // namespace

// ===========================================================================
// BotConfig
// ===========================================================================

TEST(BotConfigTest, EmptyObjectKeepsDefaults) {
    core::BotConfig config = core::BotConfig::fromJson(json::object());

    EXPECT_EQ(config.exchange.base_url, "https://api.kraken.com");
    EXPECT_EQ(config.exchange.request_timeout_ms, 15000);
    EXPECT_EQ(config.exchange.min_request_interval_ms, 1000);
    EXPECT_EQ(config.exchange.quote_balance_asset, "ZUSD");
    EXPECT_EQ(config.scheduler.market_data_interval_s, 60);
    EXPECT_EQ(config.scheduler.signal_interval_s, 300);
    EXPECT_EQ(config.scheduler.monitoring_interval_s, 30);
    EXPECT_EQ(config.scheduler.portfolio_interval_s, 180);
    EXPECT_EQ(config.scheduler.ohlc_interval_minutes, 60);
    EXPECT_EQ(config.scheduler.max_signals_per_cycle, 3);
    EXPECT_DOUBLE_EQ(config.scheduler.min_position_usd, 50.0);
    EXPECT_DOUBLE_EQ(config.risk.max_position_size_pct, 5.0);
    EXPECT_DOUBLE_EQ(config.risk.max_daily_loss_pct, 2.0);
    EXPECT_DOUBLE_EQ(config.risk.max_total_exposure_pct, 50.0);
    EXPECT_EQ(config.execution.close_policy, core::ClosePolicy::ConfirmThenClose);
    EXPECT_FALSE(config.execution.trailing_stop_pct.has_value());
    EXPECT_TRUE(config.pairs.empty());
}

TEST(BotConfigTest, OverridesAndPairs) {
    json raw = {
        {"exchange", {{"request_timeout_ms", 5000}, {"quote_balance_asset", "USD"}}},
        {"scheduler", {{"signal_interval_s", 120}, {"history_bars", 200}}},
        {"risk", {{"max_total_exposure_pct", 40.0}}},
        {"execution", {{"close_policy", "optimistic"}, {"trailing_stop_pct", 1.5}}},
        {"pairs", json::array({
            {{"symbol", "XBTUSD"}, {"base_asset", "XBT"}, {"quote_asset", "USD"}, {"price_precision", 1}},
            {{"symbol", "ETHUSD"}, {"active", false}}
        })}
    };
    core::BotConfig config = core::BotConfig::fromJson(raw);

    EXPECT_EQ(config.exchange.request_timeout_ms, 5000);
    EXPECT_EQ(config.exchange.quote_balance_asset, "USD");
    EXPECT_EQ(config.scheduler.signal_interval_s, 120);
    EXPECT_EQ(config.scheduler.history_bars, 200);
    EXPECT_EQ(config.scheduler.market_data_interval_s, 60);
    EXPECT_DOUBLE_EQ(config.risk.max_total_exposure_pct, 40.0);
    EXPECT_EQ(config.execution.close_policy, core::ClosePolicy::Optimistic);
    ASSERT_TRUE(config.execution.trailing_stop_pct.has_value());
    EXPECT_DOUBLE_EQ(*config.execution.trailing_stop_pct, 1.5);

    ASSERT_EQ(config.pairs.size(), 2u);
    EXPECT_EQ(config.pairs[0].symbol, "XBTUSD");
    EXPECT_EQ(config.pairs[0].display_name, "XBT/USD");
    EXPECT_EQ(config.pairs[0].price_precision, 1);
    EXPECT_TRUE(config.pairs[0].is_active);
    EXPECT_FALSE(config.pairs[1].is_active);
}

TEST(BotConfigTest, MalformedValuesThrowConfigException) {
    EXPECT_THROW(core::BotConfig::fromJson(json::array()), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"exchange", "kraken"}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"scheduler", {{"signal_interval_s", "often"}}}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"scheduler", {{"history_bars", 20}}}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"execution", {{"close_policy", "eventually"}}}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"execution", {{"trailing_stop_pct", -1.0}}}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"pairs", json::array({{{"base_asset", "XBT"}}})}}), core::ConfigException);
    EXPECT_THROW(core::BotConfig::fromJson({{"pairs", {{"symbol", "XBTUSD"}}}}), core::ConfigException);
}

TEST(BotConfigTest, LoadFromFileOverlaysEnvironmentCredentials) {
    const std::string path = "config_test_bot.json";
    {
        std::ofstream out(path);
        out << R"({"database": {"path": ":memory:"}, "pairs": [{"symbol": "XBTUSD"}]})";
    }
    EnvGuard key("KRAKEN_API_KEY", "test-key");
    EnvGuard secret("KRAKEN_PRIVATE_KEY", "dGVzdC1zZWNyZXQ=");

    core::BotConfig config = core::BotConfig::loadFromFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.database.path, ":memory:");
    EXPECT_EQ(config.exchange.api_key, "test-key");
    EXPECT_EQ(config.exchange.private_key, "dGVzdC1zZWNyZXQ=");
    EXPECT_TRUE(config.hasCredentials());
}

TEST(BotConfigTest, MissingCredentialsAreReported) {
    EnvGuard key("KRAKEN_API_KEY", nullptr);
    EnvGuard secret("KRAKEN_PRIVATE_KEY", nullptr);
    core::BotConfig config = core::BotConfig::fromJson(json::object());
    config.applyEnvironment();
    EXPECT_FALSE(config.hasCredentials());
}

TEST(BotConfigTest, MissingOrInvalidFileThrows) {
    EXPECT_THROW(core::BotConfig::loadFromFile("does/not/exist.json"), core::ConfigException);

    const std::string path = "config_test_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(core::BotConfig::loadFromFile(path), core::ConfigException);
    std::remove(path.c_str());
}

// ===========================================================================
// StrategyParameters
// ===========================================================================

TEST(StrategyParametersTest, DefaultsMatchProductionValues) {
    strategy_engine::StrategyParameters params = strategy_engine::StrategyParameters::fromJson(json::object());
    EXPECT_EQ(params.strategy_type, "SCALP");
    EXPECT_DOUBLE_EQ(params.rsi_weight, 0.3);
    EXPECT_DOUBLE_EQ(params.macd_weight, 0.25);
    EXPECT_DOUBLE_EQ(params.sma_weight, 0.2);
    EXPECT_DOUBLE_EQ(params.signal_threshold, 0.3);
    EXPECT_DOUBLE_EQ(params.min_confidence, 0.6);
    EXPECT_EQ(params.signal_ttl_minutes, 120);
}

TEST(StrategyParametersTest, OverridesAndValidation) {
    auto params = strategy_engine::StrategyParameters::fromJson({{"min_confidence", 0.7}, {"rsi_period", 10}});
    EXPECT_DOUBLE_EQ(params.min_confidence, 0.7);
    EXPECT_EQ(params.rsi_period, 10);

    EXPECT_THROW(strategy_engine::StrategyParameters::fromJson({{"rsi_oversold", 80.0}, {"rsi_overbought", 20.0}}),
                 core::ConfigException);
    EXPECT_THROW(strategy_engine::StrategyParameters::fromJson({{"rsi_period", "fourteen"}}), core::ConfigException);
    EXPECT_THROW(strategy_engine::StrategyParameters::fromJson(json::array()), core::ConfigException);
}

// ===========================================================================
// Enum strings
// ===========================================================================

TEST(DataTypesTest, EnumStringsRoundTrip) {
    EXPECT_EQ(core::toString(core::SignalType::StrongBuy), "STRONG_BUY");
    EXPECT_EQ(core::signalTypeFromString("SELL"), core::SignalType::Sell);
    EXPECT_EQ(core::toString(core::OrderKind::StopLoss), "stop-loss");
    EXPECT_EQ(core::orderStatusFromString("pending"), core::OrderStatus::Pending);
    EXPECT_EQ(core::bracketStateFromString("PROTECTED"), core::BracketState::Protected);
    EXPECT_THROW(core::orderRoleFromString("hedge"), std::invalid_argument);
}

TEST(DataTypesTest, PositionPnlIsSideAware) {
    core::Position position;
    position.entry_price = 100.0;
    position.remaining_amount = 2.0;

    position.side = core::PositionSide::Long;
    EXPECT_DOUBLE_EQ(position.pnlAt(105.0), 10.0);

    position.side = core::PositionSide::Short;
    EXPECT_DOUBLE_EQ(position.pnlAt(105.0), -10.0);
}
