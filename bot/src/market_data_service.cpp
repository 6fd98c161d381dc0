#include "market_data_service.hpp"
#include "logging.hpp"
#include "snapshot.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

namespace bot {

    namespace {

        struct PairOutcome {
            core::Result<bool> stored;
            int bars_inserted = 0;
        };

    } // end anonymous namespace

    MarketDataService::MarketDataService(data::IExchangeClient& exchange,
                                         data::ITradeStore& store,
                                         core::SchedulerConfig config)
        : exchange_(exchange), store_(store), config_(std::move(config))
    {
        if (config_.bars_per_refresh <= 0 || config_.history_bars <= 0) {
            throw std::invalid_argument("bars_per_refresh and history_bars must be positive.");
        }
        if (config_.ohlc_interval_minutes <= 0) {
            throw std::invalid_argument("ohlc_interval_minutes must be positive.");
        }
    }

    core::Result<bool> MarketDataService::refreshPair(const core::TradingPair& pair, int* bars_inserted) {
        auto logger = core::logging::getLogger();

        auto fetched = exchange_.getOHLC(pair.symbol, config_.ohlc_interval_minutes);
        if (!fetched) {
            return fetched.error();
        }

        core::TimeSeries<core::PriceBar>& bars = fetched.value();
        std::size_t keep = std::min<std::size_t>(bars.size(), static_cast<std::size_t>(config_.bars_per_refresh));
        core::TimeSeries<core::PriceBar> newest(bars.end() - static_cast<std::ptrdiff_t>(keep), bars.end());
        for (auto& bar : newest) {
            bar.pair_id = pair.id;
        }

        auto inserted = store_.insertBars(pair.id, newest);
        if (!inserted) {
            return inserted.error();
        }
        if (bars_inserted) {
            *bars_inserted = inserted.value();
        }
        logger->debug("{}: {} of {} fetched bars were new.", pair.symbol, inserted.value(), newest.size());

        auto history = store_.latestBars(pair.id, config_.history_bars);
        if (!history) {
            return history.error();
        }
        if (history.value().empty()) {
            return false;
        }

        auto snapshot = indicators::computeSnapshot(history.value());
        if (!snapshot) {
            logger->debug("{}: {} stored bars, need {} for indicators.", pair.symbol,
                          history.value().size(), indicators::kSnapshotMinimumBars);
            return false;
        }

        auto saved = store_.saveSnapshot(pair.id, history.value().back().timestamp, *snapshot);
        if (!saved) {
            return saved.error();
        }
        return true;
    }

    RefreshReport MarketDataService::refreshAll(const std::vector<core::TradingPair>& pairs) {
        std::vector<std::future<PairOutcome>> pending;
        pending.reserve(pairs.size());
        for (const auto& pair : pairs) {
            pending.push_back(std::async(std::launch::async, [this, pair]() {
                int inserted = 0;
                auto stored = refreshPair(pair, &inserted);
                return PairOutcome{std::move(stored), inserted};
            }));
        }

        RefreshReport report;
        for (std::size_t i = 0; i < pending.size(); ++i) {
            const auto& pair = pairs[i];
            try {
                PairOutcome outcome = pending[i].get();
                if (!outcome.stored) {
                    std::string message = fmt::format("Market data refresh for {} failed: {}",
                                                      pair.symbol, outcome.stored.error().describe());
                    core::logging::getLogger()->error("{}", message);
                    report.errors.push_back(message);
                    continue;
                }
                report.pairs_refreshed++;
                report.bars_inserted += outcome.bars_inserted;
                if (outcome.stored.value()) {
                    report.snapshots_saved++;
                }
            } catch (const std::exception& e) {
                std::string message = fmt::format("Market data refresh for {} threw: {}", pair.symbol, e.what());
                core::logging::getLogger()->error("{}", message);
                report.errors.push_back(message);
            }
        }

        core::logging::getLogger()->info("Market data refreshed for {}/{} pairs ({} new bars, {} snapshots).",
                                         report.pairs_refreshed, pairs.size(),
                                         report.bars_inserted, report.snapshots_saved);
        return report;
    }

} // namespace bot
