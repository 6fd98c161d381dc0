#pragma once

#include <string>
#include <vector>
#include <mutex>

#include <sqlite3.h>

#include "trade_store.hpp"

namespace data {

class DatabaseManager : public ITradeStore {
public:
    // ":memory:" opens a private in-memory database
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates every table and index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // --- ITradeStore ---
    core::Result<long long> upsertPair(const core::TradingPair& pair) override;
    core::Result<std::vector<core::TradingPair>> getPairs(bool active_only) override;

    core::Result<int> insertBars(long long pair_id, const core::TimeSeries<core::PriceBar>& bars) override;
    core::Result<core::TimeSeries<core::PriceBar>> latestBars(long long pair_id, int count) override;
    core::Status saveSnapshot(long long pair_id, core::Timestamp bar_time,
                              const core::IndicatorSnapshot& snapshot) override;
    core::Result<std::optional<core::IndicatorSnapshot>> latestSnapshot(long long pair_id) override;

    core::Result<long long> insertSignal(const core::TradingSignal& signal) override;
    core::Status updateSignal(const core::TradingSignal& signal) override;
    core::Result<core::TradingSignal> getSignal(long long id) override;

    core::Result<long long> insertOrder(const core::Order& order) override;
    core::Status updateOrder(const core::Order& order) override;
    core::Result<core::Order> getOrder(long long id) override;
    core::Result<std::vector<core::Order>> queryOrders(const OrderFilter& filter) override;

    core::Result<long long> insertPosition(const core::Position& position) override;
    core::Status updatePosition(const core::Position& position) override;
    core::Result<core::Position> getPosition(long long id) override;
    core::Result<std::vector<core::Position>> queryPositions(const PositionFilter& filter) override;

    core::Result<core::Portfolio> loadPortfolio() override;
    core::Status savePortfolio(const core::Portfolio& portfolio) override;

private:
    core::Error storageError(const std::string& context) const;

    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
    // Recursive: public calls nest (e.g. insertBars -> executeSQL for the transaction)
    mutable std::recursive_mutex db_mutex_;
};

} // namespace data
