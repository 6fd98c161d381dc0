#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "result.hpp"
#include "logging.hpp"   // PortfolioMetrics::logMetrics
#include "exchange_client.hpp"
#include "trade_store.hpp"
#include "entity_lock_registry.hpp"
#include "bracket_order_manager.hpp" // execution::Clock

namespace portfolio {

    // Aggregates derived from the full position ledger
    struct PortfolioMetrics {
        double realized_pnl = 0.0;
        double unrealized_pnl = 0.0;
        double total_pnl = 0.0;
        double daily_pnl = 0.0;
        int total_trades = 0;        // Closed positions
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;       // Fraction of closed positions with realized P&L > 0
        double average_win = 0.0;
        double average_loss = 0.0;   // Mean of the losing trades (negative)
        double profit_factor = 0.0;  // Sum of wins / |sum of losses|, 0 without losses
        double current_drawdown = 0.0;
        double max_drawdown = 0.0;
        int open_positions = 0;
        double total_exposure = 0.0;

        void applyTo(core::Portfolio& portfolio) const;

        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Portfolio Metrics ---");
            logger->info("Total PnL: {:.2f} (realized {:.2f}, unrealized {:.2f})",
                         total_pnl, realized_pnl, unrealized_pnl);
            logger->info("Daily PnL: {:.2f}", daily_pnl);
            logger->info("Closed Trades: {} ({} won / {} lost)", total_trades, winning_trades, losing_trades);
            logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Avg Win PnL: {:.2f}", average_win);
            logger->info("Avg Loss PnL: {:.2f}", average_loss);
            logger->info("Drawdown: {:.2f} (max {:.2f})", current_drawdown, max_drawdown);
            logger->info("Open Positions: {} (exposure {:.2f})", open_positions, total_exposure);
            logger->info("-------------------------");
        }
    };

    class PortfolioAccountant {
    public:
        PortfolioAccountant(data::ITradeStore& store,
                            data::IExchangeClient& exchange,
                            execution::EntityLockRegistry& locks,
                            execution::Clock clock = [] { return std::chrono::system_clock::now(); });

        // Pure aggregation. `now` selects the UTC day for daily P&L.
        static PortfolioMetrics computeMetrics(const std::vector<core::Position>& positions,
                                               core::Timestamp now,
                                               double previous_max_drawdown);

        // Recomputes every metric from the ledger and writes the Portfolio row back
        core::Result<core::Portfolio> recompute();

        // total = quote balance, available = total - exposure (never negative), locked = the rest
        core::Result<core::Portfolio> updateAccountBalance(const std::string& quote_asset);

    private:
        data::ITradeStore& store_;
        data::IExchangeClient& exchange_;
        execution::EntityLockRegistry& locks_;
        execution::Clock clock_;
    };

} // namespace portfolio
