#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "result.hpp"
#include "config.hpp"
#include "exchange_client.hpp"
#include "trade_store.hpp"
#include "bracket_correlation.hpp"
#include "entity_lock_registry.hpp"

namespace execution {

    using Clock = std::function<core::Timestamp()>;

    struct ReconcileReport {
        int orders_checked = 0;
        int orders_updated = 0;
        int entries_filled = 0;
        int positions_protected = 0;
        int positions_closed = 0;
        int positions_canceled = 0;
        std::vector<std::string> errors;
    };

    struct MonitorReport {
        int positions_monitored = 0;
        int stops_adjusted = 0;
        std::vector<std::string> errors;
    };

    // Owns the order/position state machine of every bracket:
    // SIGNALED -> ENTRY_PLACED -> ENTRY_FILLED -> PROTECTED -> (CLOSING) -> CLOSED,
    // with CANCELED reachable before CLOSED. The exchange is authoritative for order status.
    class BracketOrderManager {
    public:
        BracketOrderManager(data::IExchangeClient& exchange,
                            data::ITradeStore& store,
                            EntityLockRegistry& locks,
                            core::ExecutionConfig config,
                            Clock clock = [] { return std::chrono::system_clock::now(); });

        // Places a limit entry for the signal and records Order, Position and correlation.
        // Rejects consumed, expired and HOLD signals and amounts below the pair minimum.
        core::Result<core::Position> openBracket(const core::TradingSignal& signal,
                                                 const core::TradingPair& pair,
                                                 double notional_usd);

        // Polls every open order, applies status changes, then runs the protection sweep
        ReconcileReport reconcile();

        // Places missing protective orders for filled open positions
        std::vector<std::string> ensureProtection();

        // Marks open positions to market and ratchets trailing stops
        MonitorReport monitorPositions();

        // true if the stop moved; false if the candidate would not tighten risk
        core::Result<bool> adjustStop(long long position_id, double candidate_stop);

        core::Status closePosition(long long position_id, const std::string& reason);

        // Re-creates correlation entries for open, unprotected entry orders. Returns the count.
        int rebuildCorrelation();

        const BracketCorrelation& getCorrelation() const { return correlation_; }

    private:
        core::Result<std::map<long long, core::TradingPair>> loadPairs();
        core::Result<core::TradingPair> pairFor(long long pair_id);
        core::Result<core::Position> positionForOrder(const core::Order& order);

        // Returns the number of positions fully protected
        int protectionSweep(const std::set<long long>& skip, std::vector<std::string>& errors);

        // Handlers run with the position lock held. true when protection was attempted.
        bool applyEntryUpdate(core::Order& entry, core::Position& position, ReconcileReport& report);
        void applyProtectiveUpdate(core::Order& child, core::Position& position, ReconcileReport& report);
        void applyCloseUpdate(core::Order& close_order, core::Position& position, ReconcileReport& report);

        // Places whichever protective children are missing; returns the errors encountered
        std::vector<std::string> protect(core::Position& position, core::Order& entry);
        void recordEntryFill(core::Position& position, const core::Order& entry, core::Timestamp now);
        // Reloads a just-canceled entry with the exchange's final fill figures
        core::Result<core::Order> settleWithdrawnEntry(long long entry_id);
        core::Result<long long> placeChild(const core::Position& position,
                                           const core::Order& entry,
                                           core::OrderRole role,
                                           double price);

        void closeAtPrice(core::Position& position, double price, double extra_fee);
        core::Status cancelIfLive(std::optional<long long> order_id);

        std::string reportError(const core::Error& error, const std::string& context);

        data::IExchangeClient& exchange_;
        data::ITradeStore& store_;
        EntityLockRegistry& locks_;
        core::ExecutionConfig config_;
        Clock clock_;
        BracketCorrelation correlation_;
    };

} // namespace execution
