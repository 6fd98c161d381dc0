#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "result.hpp"
#include "config.hpp"
#include "exchange_client.hpp"
#include "trade_store.hpp"

namespace bot {

    struct RefreshReport {
        int pairs_refreshed = 0;
        int bars_inserted = 0;
        int snapshots_saved = 0;
        std::vector<std::string> errors;

        bool ok() const { return errors.empty(); }
    };

    // Keeps the stored bars and indicator snapshots of every active pair current
    class MarketDataService {
    public:
        MarketDataService(data::IExchangeClient& exchange,
                          data::ITradeStore& store,
                          core::SchedulerConfig config);

        // One asynchronous refresh per pair; waits for all of them
        RefreshReport refreshAll(const std::vector<core::TradingPair>& pairs);

        // Fetch OHLC, persist the newest bars, recompute the snapshot on the latest stored bar.
        // Returns true when a snapshot was stored (false: not enough history yet).
        core::Result<bool> refreshPair(const core::TradingPair& pair, int* bars_inserted = nullptr);

    private:
        data::IExchangeClient& exchange_;
        data::ITradeStore& store_;
        core::SchedulerConfig config_;
    };

} // namespace bot
