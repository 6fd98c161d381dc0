// portfolio_accountant_test.cpp - metrics over the position ledger and the
// persisted portfolio row

#include <gtest/gtest.h>

#include "portfolio_accountant.hpp"
#include "database_manager.hpp"
#include "entity_lock_registry.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <vector>

using test_support::FakeExchangeClient;
using test_support::hoursAfterBase;

namespace {

core::Position closedPosition(double realized, core::Timestamp opened_at) {
    core::Position position;
    position.pair_id = 1;
    position.entry_order_id = 1;
    position.amount = 1.0;
    position.remaining_amount = 0.0;
    position.entry_price = 100.0;
    position.realized_pnl = realized;
    position.state = core::BracketState::Closed;
    position.is_open = false;
    position.opened_at = opened_at;
    position.updated_at = opened_at;
    position.closed_at = opened_at + std::chrono::hours(1);
    return position;
}

core::Position openPosition(double entry, double amount, std::optional<double> current) {
    core::Position position;
    position.pair_id = 1;
    position.entry_order_id = 2;
    position.amount = amount;
    position.remaining_amount = amount;
    position.entry_price = entry;
    position.current_price = current;
    position.state = core::BracketState::Protected;
    position.is_open = true;
    position.opened_at = hoursAfterBase(2);
    position.updated_at = position.opened_at;
    return position;
}

// 2024-03-01T12:00:00Z
core::Timestamp middayNow() {
    return hoursAfterBase(12);
}

// Three trades (+3 and +1 today, -1 yesterday), one withdrawn entry, two open positions
std::vector<core::Position> ledger() {
    std::vector<core::Position> positions;

    core::Position best = closedPosition(3.0, hoursAfterBase(1));
    best.max_unrealized_pnl = 4.0;
    positions.push_back(best);
    positions.push_back(closedPosition(-1.0, hoursAfterBase(-5)));
    positions.push_back(closedPosition(1.0, hoursAfterBase(3)));

    core::Position withdrawn = closedPosition(0.0, hoursAfterBase(4));
    withdrawn.state = core::BracketState::Canceled;
    positions.push_back(withdrawn);

    positions.push_back(openPosition(100.0, 2.0, 101.0));
    positions.push_back(openPosition(50.0, 1.0, std::nullopt));
    return positions;
}

}  // namespace

// ===========================================================================
// computeMetrics
// ===========================================================================

TEST(PortfolioMetricsTest, AggregatesLedger) {
    auto metrics = portfolio::PortfolioAccountant::computeMetrics(ledger(), middayNow(), 1.5);

    EXPECT_EQ(metrics.total_trades, 3);
    EXPECT_EQ(metrics.winning_trades, 2);
    EXPECT_EQ(metrics.losing_trades, 1);
    EXPECT_DOUBLE_EQ(metrics.realized_pnl, 3.0);
    EXPECT_DOUBLE_EQ(metrics.unrealized_pnl, 2.0);
    EXPECT_DOUBLE_EQ(metrics.total_pnl, 5.0);
    EXPECT_DOUBLE_EQ(metrics.daily_pnl, 4.0);
    EXPECT_NEAR(metrics.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.average_win, 2.0);
    EXPECT_DOUBLE_EQ(metrics.average_loss, -1.0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 4.0);
    EXPECT_EQ(metrics.open_positions, 2);
    EXPECT_DOUBLE_EQ(metrics.total_exposure, 252.0);
    EXPECT_DOUBLE_EQ(metrics.current_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, 1.5);
}

TEST(PortfolioMetricsTest, DrawdownFromBestExcursion) {
    std::vector<core::Position> positions;
    core::Position faded = closedPosition(5.0, hoursAfterBase(1));
    faded.max_unrealized_pnl = 10.0;
    positions.push_back(faded);

    auto metrics = portfolio::PortfolioAccountant::computeMetrics(positions, middayNow(), 2.0);
    EXPECT_DOUBLE_EQ(metrics.current_drawdown, 5.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, 5.0);
    // No losing trade
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.average_loss, 0.0);
}

TEST(PortfolioMetricsTest, EmptyLedgerIsZero) {
    auto metrics = portfolio::PortfolioAccountant::computeMetrics({}, middayNow(), 0.0);
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(metrics.total_pnl, 0.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, 0.0);
    EXPECT_EQ(metrics.open_positions, 0);
}

TEST(PortfolioMetricsTest, ApplyToCopiesEveryAggregate) {
    auto metrics = portfolio::PortfolioAccountant::computeMetrics(ledger(), middayNow(), 0.0);
    core::Portfolio account;
    account.total_balance = 1000.0;
    metrics.applyTo(account);

    EXPECT_DOUBLE_EQ(account.total_balance, 1000.0);
    EXPECT_DOUBLE_EQ(account.total_pnl, 5.0);
    EXPECT_EQ(account.total_trades, 3);
    EXPECT_DOUBLE_EQ(account.total_exposure, 252.0);
    EXPECT_EQ(account.open_positions, 2);
}

// ===========================================================================
// PortfolioAccountant against the store
// ===========================================================================

namespace {

class PortfolioAccountantTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<data::DatabaseManager>(":memory:");
        ASSERT_TRUE(store_->connect());
        ASSERT_TRUE(store_->initializeSchema());
        for (const auto& position : ledger()) {
            ASSERT_TRUE(store_->insertPosition(position).ok());
        }
        accountant_ = std::make_unique<portfolio::PortfolioAccountant>(
            *store_, exchange_, locks_, [] { return middayNow(); });
    }

    FakeExchangeClient exchange_;
    std::unique_ptr<data::DatabaseManager> store_;
    execution::EntityLockRegistry locks_;
    std::unique_ptr<portfolio::PortfolioAccountant> accountant_;
};

}  // namespace

TEST_F(PortfolioAccountantTest, RecomputeIsIdempotent) {
    auto first = accountant_->recompute();
    ASSERT_TRUE(first.ok());
    auto second = accountant_->recompute();
    ASSERT_TRUE(second.ok());

    EXPECT_DOUBLE_EQ(first.value().total_pnl, 5.0);
    EXPECT_DOUBLE_EQ(second.value().total_pnl, first.value().total_pnl);
    EXPECT_EQ(second.value().total_trades, first.value().total_trades);
    EXPECT_DOUBLE_EQ(second.value().win_rate, first.value().win_rate);
    EXPECT_DOUBLE_EQ(second.value().max_drawdown, first.value().max_drawdown);

    auto stored = store_->loadPortfolio();
    ASSERT_TRUE(stored.ok());
    EXPECT_DOUBLE_EQ(stored.value().daily_pnl, 4.0);
    EXPECT_DOUBLE_EQ(stored.value().total_exposure, 252.0);
}

TEST_F(PortfolioAccountantTest, BalanceSplitsAvailableAndLocked) {
    ASSERT_TRUE(accountant_->recompute().ok());
    exchange_.setBalance("ZUSD", 1000.0);

    auto updated = accountant_->updateAccountBalance("ZUSD");
    ASSERT_TRUE(updated.ok());
    EXPECT_DOUBLE_EQ(updated.value().total_balance, 1000.0);
    EXPECT_DOUBLE_EQ(updated.value().available_balance, 748.0);
    EXPECT_DOUBLE_EQ(updated.value().locked_balance, 252.0);
    EXPECT_DOUBLE_EQ(store_->loadPortfolio().value().available_balance, 748.0);
}

TEST_F(PortfolioAccountantTest, AvailableNeverNegative) {
    ASSERT_TRUE(accountant_->recompute().ok());
    exchange_.setBalance("ZUSD", 100.0);

    auto updated = accountant_->updateAccountBalance("ZUSD");
    ASSERT_TRUE(updated.ok());
    EXPECT_DOUBLE_EQ(updated.value().available_balance, 0.0);
    EXPECT_DOUBLE_EQ(updated.value().locked_balance, 100.0);
}

TEST_F(PortfolioAccountantTest, BalanceFailuresLeaveRowUntouched) {
    exchange_.setBalance("XXBT", 0.5);
    auto missing = accountant_->updateAccountBalance("ZUSD");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().kind, core::ErrorKind::Validation);

    exchange_.setTransportDown(true);
    auto down = accountant_->updateAccountBalance("ZUSD");
    ASSERT_FALSE(down.ok());
    EXPECT_EQ(down.error().kind, core::ErrorKind::Transport);

    EXPECT_DOUBLE_EQ(store_->loadPortfolio().value().total_balance, 0.0);
}
