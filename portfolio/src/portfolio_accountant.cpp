#include "portfolio_accountant.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace portfolio {

    namespace {

        constexpr long long kPortfolioId = 1;

        double exposureOf(const core::Position& position) {
            return position.current_price.value_or(position.entry_price) * position.remaining_amount;
        }

    } // end anonymous namespace

    void PortfolioMetrics::applyTo(core::Portfolio& target) const {
        target.realized_pnl = realized_pnl;
        target.unrealized_pnl = unrealized_pnl;
        target.total_pnl = total_pnl;
        target.daily_pnl = daily_pnl;
        target.total_trades = total_trades;
        target.winning_trades = winning_trades;
        target.losing_trades = losing_trades;
        target.win_rate = win_rate;
        target.average_win = average_win;
        target.average_loss = average_loss;
        target.profit_factor = profit_factor;
        target.current_drawdown = current_drawdown;
        target.max_drawdown = max_drawdown;
        target.open_positions = open_positions;
        target.total_exposure = total_exposure;
    }

    PortfolioAccountant::PortfolioAccountant(data::ITradeStore& store,
                                             data::IExchangeClient& exchange,
                                             execution::EntityLockRegistry& locks,
                                             execution::Clock clock)
        : store_(store), exchange_(exchange), locks_(locks), clock_(std::move(clock))
    {
        if (!clock_) {
            throw std::invalid_argument("PortfolioAccountant requires a clock.");
        }
    }

    PortfolioMetrics PortfolioAccountant::computeMetrics(const std::vector<core::Position>& positions,
                                                         core::Timestamp now,
                                                         double previous_max_drawdown) {
        PortfolioMetrics metrics;
        double gross_wins = 0.0;
        double gross_losses = 0.0;
        double peak_pnl = 0.0;

        for (const auto& position : positions) {
            peak_pnl = std::max(peak_pnl, position.max_unrealized_pnl);

            if (position.is_open) {
                metrics.open_positions++;
                metrics.total_exposure += exposureOf(position);
                if (position.current_price) {
                    metrics.unrealized_pnl += position.pnlAt(*position.current_price);
                }
                continue;
            }

            // Withdrawn entries never traded
            if (position.state == core::BracketState::Canceled) {
                continue;
            }

            metrics.total_trades++;
            metrics.realized_pnl += position.realized_pnl;
            if (position.realized_pnl > 0.0) {
                metrics.winning_trades++;
                gross_wins += position.realized_pnl;
            } else if (position.realized_pnl < 0.0) {
                metrics.losing_trades++;
                gross_losses += position.realized_pnl;
            }
            if (core::utils::sameUtcDay(position.opened_at, now)) {
                metrics.daily_pnl += position.realized_pnl;
            }
        }

        metrics.total_pnl = metrics.realized_pnl + metrics.unrealized_pnl;
        if (metrics.total_trades > 0) {
            metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades;
        }
        if (metrics.winning_trades > 0) {
            metrics.average_win = gross_wins / metrics.winning_trades;
        }
        if (metrics.losing_trades > 0) {
            metrics.average_loss = gross_losses / metrics.losing_trades;
            metrics.profit_factor = gross_wins / std::fabs(gross_losses);
        }

        metrics.current_drawdown = std::max(0.0, peak_pnl - metrics.total_pnl);
        metrics.max_drawdown = std::max(previous_max_drawdown, metrics.current_drawdown);
        return metrics;
    }

    core::Result<core::Portfolio> PortfolioAccountant::recompute() {
        auto guard = locks_.lock(execution::EntityKind::Portfolio, kPortfolioId);

        auto stored = store_.loadPortfolio();
        if (!stored) {
            return stored.error();
        }
        auto positions = store_.queryPositions(data::PositionFilter{});
        if (!positions) {
            return positions.error();
        }

        core::Portfolio updated = stored.value();
        PortfolioMetrics metrics = computeMetrics(positions.value(), clock_(), updated.max_drawdown);
        metrics.applyTo(updated);
        updated.updated_at = clock_();

        auto saved = store_.savePortfolio(updated);
        if (!saved) {
            return saved.error();
        }
        metrics.logMetrics();
        return updated;
    }

    core::Result<core::Portfolio> PortfolioAccountant::updateAccountBalance(const std::string& quote_asset) {
        auto balances = exchange_.getBalances();
        if (!balances) {
            return balances.error();
        }
        auto it = balances.value().find(quote_asset);
        if (it == balances.value().end()) {
            return core::makeError(core::ErrorKind::Validation,
                                   fmt::format("No balance reported for asset '{}'", quote_asset));
        }

        auto guard = locks_.lock(execution::EntityKind::Portfolio, kPortfolioId);
        auto stored = store_.loadPortfolio();
        if (!stored) {
            return stored.error();
        }

        core::Portfolio updated = stored.value();
        updated.total_balance = it->second;
        updated.available_balance = std::max(0.0, updated.total_balance - updated.total_exposure);
        updated.locked_balance = updated.total_balance - updated.available_balance;
        updated.updated_at = clock_();

        auto saved = store_.savePortfolio(updated);
        if (!saved) {
            return saved.error();
        }
        core::logging::getLogger()->info("Account balance {}: total {:.2f}, available {:.2f}, locked {:.2f}",
                                         quote_asset, updated.total_balance,
                                         updated.available_balance, updated.locked_balance);
        return updated;
    }

} // namespace portfolio
