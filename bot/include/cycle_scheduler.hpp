#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "config.hpp"
#include "trade_store.hpp"
#include "signal_generator.hpp"
#include "bracket_order_manager.hpp"
#include "portfolio_accountant.hpp"
#include "market_data_service.hpp"

namespace bot {

    using json = nlohmann::json;

    // Outcome of one scheduler tick, logged as a single JSON line
    struct CycleResult {
        core::Timestamp timestamp;
        bool market_data_updated = false;
        int signals_generated = 0;
        int positions_opened = 0;
        int positions_monitored = 0;
        bool portfolio_updated = false;
        std::vector<std::string> errors;

        json toJson() const;
    };

    class CycleScheduler {
    public:
        CycleScheduler(MarketDataService& market_data,
                       const strategy_engine::SignalGenerator& generator,
                       execution::BracketOrderManager& orders,
                       portfolio::PortfolioAccountant& accountant,
                       data::ITradeStore& store,
                       core::SchedulerConfig config,
                       core::RiskConfig risk,
                       std::string quote_asset,
                       execution::Clock clock = [] { return std::chrono::system_clock::now(); });

        // Runs every activity whose interval has elapsed since its last successful run.
        // `stop_requested` is checked between activities.
        CycleResult tick(const std::atomic<bool>& stop_requested);
        CycleResult tick();

        // Ticks until `stop_requested` is set; the running activity always completes
        void run(const std::atomic<bool>& stop_requested);

        std::optional<core::Timestamp> lastMarketDataRun() const { return last_market_data_; }
        std::optional<core::Timestamp> lastSignalRun() const { return last_signals_; }
        std::optional<core::Timestamp> lastMonitoringRun() const { return last_monitoring_; }
        std::optional<core::Timestamp> lastPortfolioRun() const { return last_portfolio_; }

    private:
        bool isDue(const std::optional<core::Timestamp>& last_run, int interval_s, core::Timestamp now) const;

        // Each returns true when the activity succeeded
        bool runMarketData(CycleResult& result);
        bool runSignals(CycleResult& result, core::Timestamp now);
        bool runMonitoring(CycleResult& result);
        bool runPortfolio(CycleResult& result);

        MarketDataService& market_data_;
        const strategy_engine::SignalGenerator& generator_;
        execution::BracketOrderManager& orders_;
        portfolio::PortfolioAccountant& accountant_;
        data::ITradeStore& store_;
        core::SchedulerConfig config_;
        core::RiskConfig risk_;
        std::string quote_asset_;
        execution::Clock clock_;

        std::optional<core::Timestamp> last_market_data_;
        std::optional<core::Timestamp> last_signals_;
        std::optional<core::Timestamp> last_monitoring_;
        std::optional<core::Timestamp> last_portfolio_;
    };

} // namespace bot
