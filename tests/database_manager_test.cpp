// database_manager_test.cpp - SQLite trade store over an in-memory database
//
// Tests for:
//   - pair upsert by symbol and active filtering
//   - bar insert with duplicate suppression, newest-window reads
//   - snapshots attached to the newest bar
//   - signal, order and position round trips and filters
//   - portfolio singleton creation and replacement

#include <gtest/gtest.h>

#include "database_manager.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <memory>

using test_support::hoursAfterBase;
using test_support::risingSeries;

namespace {

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<data::DatabaseManager>(":memory:");
        ASSERT_TRUE(db_->connect());
        ASSERT_TRUE(db_->initializeSchema());
    }

    long long addPair(const std::string& symbol, bool active = true) {
        core::TradingPair pair;
        pair.symbol = symbol;
        pair.base_asset = symbol.substr(0, 3);
        pair.quote_asset = "USD";
        pair.display_name = pair.base_asset + "/USD";
        pair.is_active = active;
        auto id = db_->upsertPair(pair);
        EXPECT_TRUE(id.ok());
        return id.ok() ? id.value() : 0;
    }

    core::Order makeOrder(long long pair_id, core::OrderRole role, core::OrderStatus status) {
        core::Order order;
        order.pair_id = pair_id;
        order.role = role;
        order.side = core::OrderSide::Buy;
        order.kind = core::OrderKind::Limit;
        order.amount = 1.0;
        order.price = 100.0;
        order.status = status;
        order.created_at = hoursAfterBase(0);
        order.updated_at = order.created_at;
        return order;
    }

    std::unique_ptr<data::DatabaseManager> db_;
};

}  // namespace

// ===========================================================================
// Connection
// ===========================================================================

TEST(DatabaseManagerConnectionTest, CallsBeforeConnectAreStorageErrors) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());

    auto pairs = db.getPairs(false);
    ASSERT_FALSE(pairs.ok());
    EXPECT_EQ(pairs.error().kind, core::ErrorKind::Storage);
}

// ===========================================================================
// Pairs
// ===========================================================================

TEST_F(DatabaseManagerTest, UpsertPairKeepsIdAndUpdatesFields) {
    long long first = addPair("XBTUSD");
    core::TradingPair changed;
    changed.symbol = "XBTUSD";
    changed.base_asset = "XBT";
    changed.quote_asset = "USD";
    changed.display_name = "BTC/USD";
    changed.price_precision = 1;
    changed.min_order_size = 0.0001;
    auto second = db_->upsertPair(changed);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value(), first);

    auto pairs = db_->getPairs(false);
    ASSERT_TRUE(pairs.ok());
    ASSERT_EQ(pairs.value().size(), 1u);
    EXPECT_EQ(pairs.value()[0].display_name, "BTC/USD");
    EXPECT_EQ(pairs.value()[0].price_precision, 1);
    EXPECT_DOUBLE_EQ(pairs.value()[0].min_order_size, 0.0001);
}

TEST_F(DatabaseManagerTest, ActiveFilterSkipsInactivePairs) {
    addPair("XBTUSD");
    addPair("ETHUSD", false);

    auto all = db_->getPairs(false);
    auto active = db_->getPairs(true);
    ASSERT_TRUE(all.ok());
    ASSERT_TRUE(active.ok());
    EXPECT_EQ(all.value().size(), 2u);
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].symbol, "XBTUSD");
}

// ===========================================================================
// Bars and snapshots
// ===========================================================================

TEST_F(DatabaseManagerTest, DuplicateBarsAreIgnored) {
    long long pair_id = addPair("XBTUSD");
    auto bars = risingSeries(10);

    auto first = db_->insertBars(pair_id, bars);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 10);

    auto overlap = risingSeries(12);
    auto second = db_->insertBars(pair_id, overlap);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value(), 2);

    auto stored = db_->latestBars(pair_id, 100);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().size(), 12u);
}

TEST_F(DatabaseManagerTest, LatestBarsReturnsNewestWindowOldestFirst) {
    long long pair_id = addPair("XBTUSD");
    auto bars = risingSeries(20);
    ASSERT_TRUE(db_->insertBars(pair_id, bars).ok());

    auto window = db_->latestBars(pair_id, 5);
    ASSERT_TRUE(window.ok());
    ASSERT_EQ(window.value().size(), 5u);
    EXPECT_EQ(core::utils::toUnixSeconds(window.value().front().timestamp),
              core::utils::toUnixSeconds(bars[15].timestamp));
    EXPECT_EQ(core::utils::toUnixSeconds(window.value().back().timestamp),
              core::utils::toUnixSeconds(bars[19].timestamp));
    EXPECT_DOUBLE_EQ(window.value().back().close, bars[19].close);
    EXPECT_EQ(window.value().back().pair_id, pair_id);
}

TEST_F(DatabaseManagerTest, SnapshotOnlyReadFromNewestBar) {
    long long pair_id = addPair("XBTUSD");
    auto bars = risingSeries(3);
    ASSERT_TRUE(db_->insertBars(pair_id, bars).ok());

    auto none = db_->latestSnapshot(pair_id);
    ASSERT_TRUE(none.ok());
    EXPECT_FALSE(none.value().has_value());

    core::IndicatorSnapshot snapshot;
    snapshot.rsi_14 = 55.5;
    snapshot.sma_20 = 101.0;
    ASSERT_TRUE(db_->saveSnapshot(pair_id, bars.back().timestamp, snapshot).ok());

    auto stored = db_->latestSnapshot(pair_id);
    ASSERT_TRUE(stored.ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_DOUBLE_EQ(*stored.value()->rsi_14, 55.5);
    EXPECT_DOUBLE_EQ(*stored.value()->sma_20, 101.0);
    EXPECT_FALSE(stored.value()->sma_50.has_value());

    // A newer bar without indicators hides the older snapshot
    ASSERT_TRUE(db_->insertBars(pair_id, {test_support::makeBar(hoursAfterBase(3), 110.0)}).ok());
    auto hidden = db_->latestSnapshot(pair_id);
    ASSERT_TRUE(hidden.ok());
    EXPECT_FALSE(hidden.value().has_value());
}

TEST_F(DatabaseManagerTest, SnapshotWithoutBarIsRejected) {
    long long pair_id = addPair("XBTUSD");
    core::Status status = db_->saveSnapshot(pair_id, hoursAfterBase(5), core::IndicatorSnapshot{});
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, core::ErrorKind::Storage);
}

// ===========================================================================
// Signals
// ===========================================================================

TEST_F(DatabaseManagerTest, SignalRoundTripAndConsume) {
    long long pair_id = addPair("XBTUSD");
    core::TradingSignal signal;
    signal.pair_id = pair_id;
    signal.signal_type = core::SignalType::StrongBuy;
    signal.confidence = 0.86;
    signal.entry_price = 100.0;
    signal.target_price = 102.8;
    signal.stop_loss_price = 98.6;
    signal.volume_profile = core::VolumeRegime::High;
    signal.resistance_level = 103.0;
    signal.position_size_pct = 1.5;
    signal.created_at = hoursAfterBase(0);
    signal.expires_at = hoursAfterBase(2);

    auto id = db_->insertSignal(signal);
    ASSERT_TRUE(id.ok());

    auto loaded = db_->getSignal(id.value());
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.value().signal_type, core::SignalType::StrongBuy);
    EXPECT_DOUBLE_EQ(loaded.value().confidence, 0.86);
    EXPECT_EQ(loaded.value().volume_profile, core::VolumeRegime::High);
    EXPECT_FALSE(loaded.value().support_level.has_value());
    ASSERT_TRUE(loaded.value().resistance_level.has_value());
    EXPECT_DOUBLE_EQ(*loaded.value().resistance_level, 103.0);
    EXPECT_EQ(core::utils::toUnixSeconds(loaded.value().expires_at),
              core::utils::toUnixSeconds(signal.expires_at));
    EXPECT_TRUE(loaded.value().is_active);

    core::TradingSignal consumed = loaded.value();
    consumed.is_active = false;
    ASSERT_TRUE(db_->updateSignal(consumed).ok());
    EXPECT_FALSE(db_->getSignal(id.value()).value().is_active);

    auto missing = db_->getSignal(9999);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().kind, core::ErrorKind::Storage);
}

// ===========================================================================
// Orders
// ===========================================================================

TEST_F(DatabaseManagerTest, OrderFiltersCombine) {
    long long pair_id = addPair("XBTUSD");

    core::Order entry = makeOrder(pair_id, core::OrderRole::Entry, core::OrderStatus::Open);
    entry.exchange_order_id = "TX-1";
    auto entry_id = db_->insertOrder(entry);
    ASSERT_TRUE(entry_id.ok());

    core::Order stop = makeOrder(pair_id, core::OrderRole::StopLoss, core::OrderStatus::Open);
    stop.kind = core::OrderKind::StopLoss;
    stop.side = core::OrderSide::Sell;
    stop.parent_order_id = entry_id.value();
    stop.exchange_order_id = "TX-2";
    ASSERT_TRUE(db_->insertOrder(stop).ok());

    core::Order local_only = makeOrder(pair_id, core::OrderRole::Entry, core::OrderStatus::Pending);
    ASSERT_TRUE(db_->insertOrder(local_only).ok());

    data::OrderFilter open_filter;
    open_filter.status = core::OrderStatus::Open;
    EXPECT_EQ(db_->queryOrders(open_filter).value().size(), 2u);

    data::OrderFilter children;
    children.parent_order_id = entry_id.value();
    auto found = db_->queryOrders(children);
    ASSERT_TRUE(found.ok());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].role, core::OrderRole::StopLoss);
    EXPECT_EQ(found.value()[0].kind, core::OrderKind::StopLoss);

    data::OrderFilter acknowledged_entries;
    acknowledged_entries.role = core::OrderRole::Entry;
    acknowledged_entries.require_exchange_id = true;
    auto entries = db_->queryOrders(acknowledged_entries);
    ASSERT_TRUE(entries.ok());
    ASSERT_EQ(entries.value().size(), 1u);
    EXPECT_EQ(*entries.value()[0].exchange_order_id, "TX-1");
}

TEST_F(DatabaseManagerTest, OrderUpdatePersistsFill) {
    long long pair_id = addPair("XBTUSD");
    auto id = db_->insertOrder(makeOrder(pair_id, core::OrderRole::Entry, core::OrderStatus::Open));
    ASSERT_TRUE(id.ok());

    core::Order order = db_->getOrder(id.value()).value();
    order.status = core::OrderStatus::Closed;
    order.filled_amount = 1.0;
    order.average_fill_price = 100.5;
    order.fee = 0.16;
    order.filled_at = hoursAfterBase(1);
    ASSERT_TRUE(db_->updateOrder(order).ok());

    core::Order reloaded = db_->getOrder(id.value()).value();
    EXPECT_EQ(reloaded.status, core::OrderStatus::Closed);
    EXPECT_TRUE(reloaded.isTerminal());
    EXPECT_DOUBLE_EQ(reloaded.filled_amount, 1.0);
    ASSERT_TRUE(reloaded.average_fill_price.has_value());
    EXPECT_DOUBLE_EQ(*reloaded.average_fill_price, 100.5);
    ASSERT_TRUE(reloaded.filled_at.has_value());
    EXPECT_EQ(core::utils::toUnixSeconds(*reloaded.filled_at), core::utils::toUnixSeconds(hoursAfterBase(1)));

    core::Order ghost = order;
    ghost.id = 4242;
    EXPECT_FALSE(db_->updateOrder(ghost).ok());
}

// ===========================================================================
// Positions
// ===========================================================================

TEST_F(DatabaseManagerTest, PositionFiltersAndUpdate) {
    long long pair_id = addPair("XBTUSD");

    core::Position open;
    open.pair_id = pair_id;
    open.entry_order_id = 1;
    open.amount = 1.0;
    open.remaining_amount = 1.0;
    open.entry_price = 100.0;
    open.stop_loss_price = 98.0;
    open.take_profit_price = 104.0;
    open.trailing_stop_distance = 1.0;
    open.state = core::BracketState::Protected;
    open.opened_at = hoursAfterBase(0);
    open.updated_at = open.opened_at;
    auto open_id = db_->insertPosition(open);
    ASSERT_TRUE(open_id.ok());

    core::Position closed = open;
    closed.entry_order_id = 2;
    closed.is_open = false;
    closed.state = core::BracketState::Closed;
    closed.realized_pnl = 3.5;
    closed.closed_at = hoursAfterBase(2);
    ASSERT_TRUE(db_->insertPosition(closed).ok());

    data::PositionFilter open_only;
    open_only.is_open = true;
    auto found = db_->queryPositions(open_only);
    ASSERT_TRUE(found.ok());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].id, open_id.value());
    ASSERT_TRUE(found.value()[0].trailing_stop_distance.has_value());
    EXPECT_DOUBLE_EQ(*found.value()[0].trailing_stop_distance, 1.0);

    data::PositionFilter by_entry;
    by_entry.entry_order_id = 2;
    auto second = db_->queryPositions(by_entry);
    ASSERT_TRUE(second.ok());
    ASSERT_EQ(second.value().size(), 1u);
    EXPECT_EQ(second.value()[0].state, core::BracketState::Closed);
    EXPECT_DOUBLE_EQ(second.value()[0].realized_pnl, 3.5);
    EXPECT_TRUE(second.value()[0].closed_at.has_value());

    core::Position moved = db_->getPosition(open_id.value()).value();
    moved.stop_loss_price = 99.0;
    moved.current_price = 101.0;
    ASSERT_TRUE(db_->updatePosition(moved).ok());
    core::Position reloaded = db_->getPosition(open_id.value()).value();
    EXPECT_DOUBLE_EQ(reloaded.stop_loss_price, 99.0);
    ASSERT_TRUE(reloaded.current_price.has_value());
    EXPECT_DOUBLE_EQ(*reloaded.current_price, 101.0);

    EXPECT_EQ(db_->queryPositions(data::PositionFilter{}).value().size(), 2u);
}

// ===========================================================================
// Portfolio
// ===========================================================================

TEST_F(DatabaseManagerTest, PortfolioIsCreatedOnceAndReplaced) {
    auto created = db_->loadPortfolio();
    ASSERT_TRUE(created.ok());
    EXPECT_EQ(created.value().id, 1);
    EXPECT_DOUBLE_EQ(created.value().max_position_size_pct, 5.0);
    EXPECT_TRUE(created.value().is_trading_enabled);

    core::Portfolio updated = created.value();
    updated.total_balance = 10000.0;
    updated.available_balance = 9000.0;
    updated.locked_balance = 1000.0;
    updated.win_rate = 0.5;
    updated.is_trading_enabled = false;
    ASSERT_TRUE(db_->savePortfolio(updated).ok());

    auto reloaded = db_->loadPortfolio();
    ASSERT_TRUE(reloaded.ok());
    EXPECT_EQ(reloaded.value().id, 1);
    EXPECT_DOUBLE_EQ(reloaded.value().total_balance, 10000.0);
    EXPECT_DOUBLE_EQ(reloaded.value().available_balance, 9000.0);
    EXPECT_DOUBLE_EQ(reloaded.value().win_rate, 0.5);
    EXPECT_FALSE(reloaded.value().is_trading_enabled);
}
