#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp"
#include "result.hpp"

namespace data {

    // All set fields must match
    struct OrderFilter {
        std::optional<core::OrderStatus> status;
        std::optional<core::OrderRole> role;
        std::optional<long long> pair_id;
        std::optional<long long> parent_order_id;
        bool require_exchange_id = false;
    };

    struct PositionFilter {
        std::optional<bool> is_open;
        std::optional<core::BracketState> state;
        std::optional<long long> pair_id;
        std::optional<long long> entry_order_id;
    };

    // Persistence capability for the trading pipeline. Consistency is per entity;
    // there are no cross-entity transactions.
    class ITradeStore {
    public:
        virtual ~ITradeStore() = default;

        // --- Pairs ---
        // Insert or update by symbol; returns the pair id
        virtual core::Result<long long> upsertPair(const core::TradingPair& pair) = 0;
        virtual core::Result<std::vector<core::TradingPair>> getPairs(bool active_only) = 0;

        // --- Price bars and indicator snapshots ---
        // Duplicate (pair, timestamp) rows are ignored; returns the number actually inserted
        virtual core::Result<int> insertBars(long long pair_id, const core::TimeSeries<core::PriceBar>& bars) = 0;
        // The newest `count` bars, oldest first
        virtual core::Result<core::TimeSeries<core::PriceBar>> latestBars(long long pair_id, int count) = 0;
        virtual core::Status saveSnapshot(long long pair_id, core::Timestamp bar_time,
                                          const core::IndicatorSnapshot& snapshot) = 0;
        // Snapshot stored on the newest bar, if one was computed for it
        virtual core::Result<std::optional<core::IndicatorSnapshot>> latestSnapshot(long long pair_id) = 0;

        // --- Signals ---
        virtual core::Result<long long> insertSignal(const core::TradingSignal& signal) = 0;
        virtual core::Status updateSignal(const core::TradingSignal& signal) = 0;
        virtual core::Result<core::TradingSignal> getSignal(long long id) = 0;

        // --- Orders ---
        virtual core::Result<long long> insertOrder(const core::Order& order) = 0;
        virtual core::Status updateOrder(const core::Order& order) = 0;
        virtual core::Result<core::Order> getOrder(long long id) = 0;
        virtual core::Result<std::vector<core::Order>> queryOrders(const OrderFilter& filter) = 0;

        // --- Positions ---
        virtual core::Result<long long> insertPosition(const core::Position& position) = 0;
        virtual core::Status updatePosition(const core::Position& position) = 0;
        virtual core::Result<core::Position> getPosition(long long id) = 0;
        virtual core::Result<std::vector<core::Position>> queryPositions(const PositionFilter& filter) = 0;

        // --- Portfolio singleton (created with defaults if absent) ---
        virtual core::Result<core::Portfolio> loadPortfolio() = 0;
        virtual core::Status savePortfolio(const core::Portfolio& portfolio) = 0;
    };

} // namespace data
