#pragma once

#include <memory>
#include <vector>

#include "config.hpp"
#include "database_manager.hpp"
#include "rate_limiter.hpp"
#include "exchange_client.hpp"
#include "entity_lock_registry.hpp"
#include "signal_generator.hpp"
#include "bracket_order_manager.hpp"
#include "portfolio_accountant.hpp"
#include "market_data_service.hpp"
#include "cycle_scheduler.hpp"

namespace bot {

    // Owns every long-lived component of the bot. Constructed once in main().
    class TradingContext {
    public:
        // Connects to Kraken with the configured credentials
        explicit TradingContext(core::BotConfig config);
        // Uses the given exchange client instead
        TradingContext(core::BotConfig config, std::unique_ptr<data::IExchangeClient> exchange);

        TradingContext(const TradingContext&) = delete;
        TradingContext& operator=(const TradingContext&) = delete;

        // Upserts configured pairs (exchange metadata when available), rebuilds the
        // correlation cache and refreshes the portfolio row. Throws DatabaseException
        // when the pairs cannot be stored.
        void bootstrap();

        const core::BotConfig& getConfig() const { return config_; }
        data::DatabaseManager& getStore() { return *store_; }
        data::IExchangeClient& getExchange() { return *exchange_; }
        execution::BracketOrderManager& getOrderManager() { return *orders_; }
        portfolio::PortfolioAccountant& getAccountant() { return *accountant_; }
        CycleScheduler& getScheduler() { return *scheduler_; }

    private:
        std::vector<core::TradingPair> resolvePairs();

        core::BotConfig config_;
        std::unique_ptr<data::DatabaseManager> store_;
        std::unique_ptr<data::IExchangeClient> exchange_;
        execution::EntityLockRegistry locks_;
        std::unique_ptr<strategy_engine::SignalGenerator> generator_;
        std::unique_ptr<execution::BracketOrderManager> orders_;
        std::unique_ptr<portfolio::PortfolioAccountant> accountant_;
        std::unique_ptr<MarketDataService> market_data_;
        std::unique_ptr<CycleScheduler> scheduler_;
    };

} // namespace bot
