#include "cycle_scheduler.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "risk_gate.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace bot {

    namespace {

        struct Candidate {
            core::TradingSignal signal;
            core::TradingPair pair;
        };

        void appendErrors(std::vector<std::string>& target, const std::vector<std::string>& source) {
            target.insert(target.end(), source.begin(), source.end());
        }

        void recordError(CycleResult& result, const std::string& context, const core::Error& error) {
            std::string message = fmt::format("{}: {}", context, error.describe());
            core::logging::getLogger()->error("{}", message);
            result.errors.push_back(std::move(message));
        }

    } // end anonymous namespace

    json CycleResult::toJson() const {
        return json{
            {"timestamp", core::utils::timestampToString(timestamp)},
            {"market_data_updated", market_data_updated},
            {"signals_generated", signals_generated},
            {"positions_opened", positions_opened},
            {"positions_monitored", positions_monitored},
            {"portfolio_updated", portfolio_updated},
            {"errors", errors}
        };
    }

    CycleScheduler::CycleScheduler(MarketDataService& market_data,
                                   const strategy_engine::SignalGenerator& generator,
                                   execution::BracketOrderManager& orders,
                                   portfolio::PortfolioAccountant& accountant,
                                   data::ITradeStore& store,
                                   core::SchedulerConfig config,
                                   core::RiskConfig risk,
                                   std::string quote_asset,
                                   execution::Clock clock)
        : market_data_(market_data),
          generator_(generator),
          orders_(orders),
          accountant_(accountant),
          store_(store),
          config_(std::move(config)),
          risk_(std::move(risk)),
          quote_asset_(std::move(quote_asset)),
          clock_(std::move(clock))
    {
        if (!clock_) {
            throw std::invalid_argument("CycleScheduler requires a clock.");
        }
        if (config_.market_data_interval_s < 0 || config_.signal_interval_s < 0 ||
            config_.monitoring_interval_s < 0 || config_.portfolio_interval_s < 0) {
            throw std::invalid_argument("Scheduler intervals must not be negative.");
        }
        if (config_.max_signals_per_cycle <= 0) {
            throw std::invalid_argument("max_signals_per_cycle must be positive.");
        }
    }

    bool CycleScheduler::isDue(const std::optional<core::Timestamp>& last_run, int interval_s,
                               core::Timestamp now) const {
        return !last_run || (now - *last_run) >= std::chrono::seconds(interval_s);
    }

    bool CycleScheduler::runMarketData(CycleResult& result) {
        auto pairs = store_.getPairs(true);
        if (!pairs) {
            recordError(result, "Loading active pairs", pairs.error());
            return false;
        }
        RefreshReport report = market_data_.refreshAll(pairs.value());
        appendErrors(result.errors, report.errors);
        result.market_data_updated = report.pairs_refreshed > 0;
        return report.ok();
    }

    bool CycleScheduler::runSignals(CycleResult& result, core::Timestamp now) {
        auto logger = core::logging::getLogger();

        auto pairs = store_.getPairs(true);
        if (!pairs) {
            recordError(result, "Loading active pairs", pairs.error());
            return false;
        }

        bool succeeded = true;
        std::vector<Candidate> candidates;
        for (const auto& pair : pairs.value()) {
            auto bars = store_.latestBars(pair.id, config_.history_bars);
            if (!bars) {
                recordError(result, fmt::format("Loading bars for {}", pair.symbol), bars.error());
                succeeded = false;
                continue;
            }
            auto snapshot = store_.latestSnapshot(pair.id);
            if (!snapshot) {
                recordError(result, fmt::format("Loading indicators for {}", pair.symbol), snapshot.error());
                succeeded = false;
                continue;
            }
            if (!snapshot.value()) {
                logger->debug("{}: no indicator snapshot on the latest bar yet.", pair.symbol);
                continue;
            }

            auto signal = generator_.generate(pair, bars.value(), *snapshot.value(), now);
            if (!signal) {
                continue;
            }
            auto id = store_.insertSignal(*signal);
            if (!id) {
                recordError(result, fmt::format("Storing signal for {}", pair.symbol), id.error());
                succeeded = false;
                continue;
            }
            signal->id = id.value();
            candidates.push_back(Candidate{*signal, pair});
        }
        result.signals_generated = static_cast<int>(candidates.size());
        if (candidates.empty()) {
            return succeeded;
        }

        std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return a.signal.confidence > b.signal.confidence;
        });
        if (candidates.size() > static_cast<std::size_t>(config_.max_signals_per_cycle)) {
            candidates.resize(static_cast<std::size_t>(config_.max_signals_per_cycle));
        }

        auto account = store_.loadPortfolio();
        if (!account) {
            recordError(result, "Loading portfolio", account.error());
            return false;
        }
        if (!account.value().is_trading_enabled) {
            logger->info("Trading disabled; {} signal(s) not executed.", candidates.size());
            return succeeded;
        }

        data::PositionFilter open_filter;
        open_filter.is_open = true;
        auto open_positions = store_.queryPositions(open_filter);
        if (!open_positions) {
            recordError(result, "Loading open positions", open_positions.error());
            return false;
        }
        portfolio::RiskReport risk = portfolio::RiskGate::evaluate(account.value(), open_positions.value(), risk_);
        if (risk.blocksTrading()) {
            logger->warn("Risk status {}; skipping execution of {} signal(s).",
                         portfolio::toString(risk.status), candidates.size());
            return succeeded;
        }

        double available = account.value().available_balance;
        for (const auto& candidate : candidates) {
            double notional = available * candidate.signal.position_size_pct / 100.0;
            if (notional < config_.min_position_usd) {
                logger->info("{}: position size {:.2f} below minimum {:.2f}, skipped.",
                             candidate.pair.symbol, notional, config_.min_position_usd);
                continue;
            }
            auto position = orders_.openBracket(candidate.signal, candidate.pair, notional);
            if (!position) {
                // Rejected entries are not retried; the signal stays until it expires
                recordError(result, fmt::format("Opening bracket for {}", candidate.pair.symbol), position.error());
                continue;
            }
            result.positions_opened++;
            available -= notional;
        }
        return succeeded;
    }

    bool CycleScheduler::runMonitoring(CycleResult& result) {
        execution::ReconcileReport reconciled = orders_.reconcile();
        appendErrors(result.errors, reconciled.errors);

        execution::MonitorReport monitored = orders_.monitorPositions();
        appendErrors(result.errors, monitored.errors);
        result.positions_monitored = monitored.positions_monitored;

        return reconciled.errors.empty() && monitored.errors.empty();
    }

    bool CycleScheduler::runPortfolio(CycleResult& result) {
        auto recomputed = accountant_.recompute();
        if (!recomputed) {
            recordError(result, "Recomputing portfolio metrics", recomputed.error());
            return false;
        }
        auto balance = accountant_.updateAccountBalance(quote_asset_);
        if (!balance) {
            recordError(result, "Updating account balance", balance.error());
            return false;
        }
        result.portfolio_updated = true;
        return true;
    }

    CycleResult CycleScheduler::tick() {
        std::atomic<bool> never(false);
        return tick(never);
    }

    CycleResult CycleScheduler::tick(const std::atomic<bool>& stop_requested) {
        CycleResult result;
        const core::Timestamp now = clock_();
        result.timestamp = now;

        auto finish = [&result]() {
            core::logging::getLogger()->info("{}", result.toJson().dump());
            return result;
        };

        if (isDue(last_market_data_, config_.market_data_interval_s, now) && runMarketData(result)) {
            last_market_data_ = now;
        }
        if (stop_requested.load()) return finish();

        if (isDue(last_signals_, config_.signal_interval_s, now) && runSignals(result, now)) {
            last_signals_ = now;
        }
        if (stop_requested.load()) return finish();

        if (isDue(last_monitoring_, config_.monitoring_interval_s, now) && runMonitoring(result)) {
            last_monitoring_ = now;
        }
        if (stop_requested.load()) return finish();

        if (isDue(last_portfolio_, config_.portfolio_interval_s, now) && runPortfolio(result)) {
            last_portfolio_ = now;
        }
        return finish();
    }

    void CycleScheduler::run(const std::atomic<bool>& stop_requested) {
        auto logger = core::logging::getLogger();
        logger->info("Scheduler started (market data {}s, signals {}s, monitoring {}s, portfolio {}s).",
                     config_.market_data_interval_s, config_.signal_interval_s,
                     config_.monitoring_interval_s, config_.portfolio_interval_s);

        const auto slice = std::chrono::milliseconds(100);
        while (!stop_requested.load()) {
            tick(stop_requested);

            auto remaining = std::chrono::milliseconds(std::max(0, config_.tick_sleep_ms));
            while (remaining.count() > 0 && !stop_requested.load()) {
                auto step = std::min(remaining, slice);
                std::this_thread::sleep_for(step);
                remaining -= step;
            }
        }
        logger->info("Scheduler stopped.");
    }

} // namespace bot
