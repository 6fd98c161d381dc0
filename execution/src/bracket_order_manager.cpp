#include "bracket_order_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace execution {

    namespace {

        bool tightensRisk(core::PositionSide side, double current_stop, double candidate) {
            return side == core::PositionSide::Long ? candidate > current_stop : candidate < current_stop;
        }

        bool isFilledState(core::BracketState state) {
            return state == core::BracketState::EntryFilled || state == core::BracketState::Protected;
        }

        std::string describeRef(const std::optional<long long>& id) {
            return id ? std::to_string(*id) : "none";
        }

    } // end anonymous namespace

    BracketOrderManager::BracketOrderManager(data::IExchangeClient& exchange,
                                             data::ITradeStore& store,
                                             EntityLockRegistry& locks,
                                             core::ExecutionConfig config,
                                             Clock clock)
        : exchange_(exchange),
          store_(store),
          locks_(locks),
          config_(std::move(config)),
          clock_(std::move(clock))
    {
        if (!clock_) {
            throw std::invalid_argument("BracketOrderManager requires a clock.");
        }
        if (config_.trailing_stop_pct && *config_.trailing_stop_pct <= 0.0) {
            throw std::invalid_argument("Trailing stop percentage must be positive.");
        }
        core::logging::getLogger()->debug("BracketOrderManager created (close policy: {}).",
                                          core::toString(config_.close_policy));
    }

    std::string BracketOrderManager::reportError(const core::Error& error, const std::string& context) {
        std::string message = fmt::format("{}: {}", context, error.describe());
        auto logger = core::logging::getLogger();
        if (error.kind == core::ErrorKind::InvariantViolation) {
            logger->critical("{}", message);
        } else {
            logger->error("{}", message);
        }
        return message;
    }

    core::Result<std::map<long long, core::TradingPair>> BracketOrderManager::loadPairs() {
        auto pairs = store_.getPairs(false);
        if (!pairs) {
            return pairs.error();
        }
        std::map<long long, core::TradingPair> by_id;
        for (const auto& pair : pairs.value()) {
            by_id[pair.id] = pair;
        }
        return by_id;
    }

    core::Result<core::TradingPair> BracketOrderManager::pairFor(long long pair_id) {
        auto pairs = loadPairs();
        if (!pairs) {
            return pairs.error();
        }
        auto it = pairs.value().find(pair_id);
        if (it == pairs.value().end()) {
            return core::makeError(core::ErrorKind::InvariantViolation,
                                   fmt::format("Unknown trading pair id {}", pair_id));
        }
        return it->second;
    }

    core::Result<core::Position> BracketOrderManager::positionForOrder(const core::Order& order) {
        long long entry_id = (order.role == core::OrderRole::Entry) ? order.id : order.parent_order_id.value_or(0);
        if (entry_id == 0) {
            return core::makeError(core::ErrorKind::InvariantViolation,
                                   fmt::format("Order {} has no parent entry order", order.id));
        }
        data::PositionFilter filter;
        filter.entry_order_id = entry_id;
        auto positions = store_.queryPositions(filter);
        if (!positions) {
            return positions.error();
        }
        if (positions.value().empty()) {
            return core::makeError(core::ErrorKind::InvariantViolation,
                                   fmt::format("No position for entry order {}", entry_id));
        }
        return positions.value().front();
    }

    // --- Open ---

    core::Result<core::Position> BracketOrderManager::openBracket(const core::TradingSignal& signal,
                                                                  const core::TradingPair& pair,
                                                                  double notional_usd)
    {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = clock_();

        if (!signal.is_active) {
            return core::makeError(core::ErrorKind::Validation, fmt::format("Signal {} was already consumed", signal.id));
        }
        if (signal.isExpired(now)) {
            return core::makeError(core::ErrorKind::Validation, fmt::format("Signal {} has expired", signal.id));
        }
        if (signal.signal_type == core::SignalType::Hold) {
            return core::makeError(core::ErrorKind::Validation, fmt::format("Signal {} is HOLD", signal.id));
        }
        if (signal.entry_price <= 0.0 || notional_usd <= 0.0) {
            return core::makeError(core::ErrorKind::Validation,
                                   fmt::format("Invalid entry {} or notional {} for signal {}",
                                               signal.entry_price, notional_usd, signal.id));
        }

        const double amount = core::utils::roundTo(notional_usd / signal.entry_price, pair.volume_precision);
        if (amount <= 0.0 || amount < pair.min_order_size) {
            return core::makeError(core::ErrorKind::Validation,
                                   fmt::format("Amount {} {} is below the minimum order size {}",
                                               amount, pair.symbol, pair.min_order_size));
        }

        const auto position_side = signal.isBullish() ? core::PositionSide::Long : core::PositionSide::Short;
        const auto entry_side = core::entrySideFor(position_side);
        const double entry_price = core::utils::roundTo(signal.entry_price, pair.price_precision);

        data::OrderRequest request;
        request.pair_symbol = pair.symbol;
        request.side = entry_side;
        request.kind = core::OrderKind::Limit;
        request.amount = amount;
        request.price = entry_price;

        auto placed = exchange_.placeOrder(request);
        if (!placed) {
            logger->warn("Entry for signal {} on {} not placed: {}", signal.id, pair.symbol, placed.error().describe());
            return placed.error();
        }

        const std::optional<long long> signal_id = signal.id > 0 ? std::optional<long long>(signal.id) : std::nullopt;

        core::Order entry;
        entry.exchange_order_id = placed.value();
        entry.pair_id = pair.id;
        entry.signal_id = signal_id;
        entry.role = core::OrderRole::Entry;
        entry.side = entry_side;
        entry.kind = core::OrderKind::Limit;
        entry.amount = amount;
        entry.price = entry_price;
        entry.status = core::OrderStatus::Open;
        entry.created_at = now;
        entry.updated_at = now;

        auto entry_id = store_.insertOrder(entry);
        if (!entry_id) {
            // Live at the exchange but unrecorded: withdraw it
            reportError(entry_id.error(), fmt::format("Recording entry {} failed", placed.value()));
            auto withdrawn = exchange_.cancelOrder(placed.value());
            if (!withdrawn) {
                reportError(core::makeError(core::ErrorKind::InvariantViolation, withdrawn.error().message),
                            fmt::format("Unrecorded entry {} could not be canceled", placed.value()));
            }
            return entry_id.error();
        }
        entry.id = entry_id.value();

        core::Position position;
        position.pair_id = pair.id;
        position.entry_order_id = entry.id;
        position.signal_id = signal_id;
        position.side = position_side;
        position.amount = amount;
        position.remaining_amount = amount;
        position.entry_price = entry_price;
        position.stop_loss_price = core::utils::roundTo(signal.stop_loss_price, pair.price_precision);
        position.take_profit_price = core::utils::roundTo(signal.target_price, pair.price_precision);
        position.state = core::BracketState::EntryPlaced;
        position.is_open = true;
        position.strategy_type = signal.strategy_type;
        position.opened_at = now;
        position.updated_at = now;

        auto position_id = store_.insertPosition(position);
        if (!position_id) {
            reportError(position_id.error(), fmt::format("Recording position for entry {} failed", entry.id));
            auto withdrawn = cancelIfLive(entry.id);
            if (!withdrawn) {
                reportError(withdrawn.error(), fmt::format("Withdrawing entry {} failed", entry.id));
            }
            return position_id.error();
        }
        position.id = position_id.value();

        CorrelationEntry correlation;
        correlation.position_id = position.id;
        correlation.signal_id = signal_id;
        correlation.stop_price = position.stop_loss_price;
        correlation.target_price = position.take_profit_price;
        correlation.side = position_side;
        correlation.amount = amount;
        correlation_.put(entry.id, correlation);

        if (signal_id) {
            core::TradingSignal consumed = signal;
            consumed.is_active = false;
            auto saved = store_.updateSignal(consumed);
            if (!saved) {
                reportError(saved.error(), fmt::format("Marking signal {} consumed failed", signal.id));
            }
        }

        logger->info("Bracket opened: position {} {} {} {} @ {} (stop {}, target {}), entry order {} [{}]",
                     position.id, core::toString(position_side), amount, pair.symbol, entry_price,
                     position.stop_loss_price, position.take_profit_price, entry.id, placed.value());
        return position;
    }

    // --- Reconcile ---

    ReconcileReport BracketOrderManager::reconcile() {
        ReconcileReport report;
        auto logger = core::logging::getLogger();
        const core::Timestamp now = clock_();

        data::OrderFilter filter;
        filter.status = core::OrderStatus::Open;
        filter.require_exchange_id = true;
        auto open_orders = store_.queryOrders(filter);
        if (!open_orders) {
            report.errors.push_back(reportError(open_orders.error(), "Loading open orders"));
            return report;
        }

        std::set<long long> protection_attempted;

        if (!open_orders.value().empty()) {
            std::vector<std::string> exchange_ids;
            for (const auto& order : open_orders.value()) {
                exchange_ids.push_back(*order.exchange_order_id);
            }

            auto statuses = exchange_.queryOrders(exchange_ids);
            if (!statuses) {
                report.errors.push_back(reportError(statuses.error(), "Querying order status"));
            } else {
                for (const auto& order : open_orders.value()) {
                    report.orders_checked++;
                    auto remote_it = statuses.value().find(*order.exchange_order_id);
                    if (remote_it == statuses.value().end()) {
                        logger->warn("Exchange did not report order {} [{}].", order.id, *order.exchange_order_id);
                        continue;
                    }
                    const auto& remote = remote_it->second;
                    // Not yet on the book counts as open locally
                    const auto remote_status = (remote.status == core::OrderStatus::Pending)
                                                   ? core::OrderStatus::Open : remote.status;
                    if (remote_status == order.status && remote.filled_amount == order.filled_amount) {
                        continue;
                    }

                    auto owner = positionForOrder(order);
                    if (!owner) {
                        report.errors.push_back(reportError(owner.error(), fmt::format("Order {}", order.id)));
                        continue;
                    }
                    auto lock = locks_.lock(EntityKind::Position, owner.value().id);

                    // Reload under the lock: a concurrent stop adjustment may have replaced the order
                    auto current_order = store_.getOrder(order.id);
                    auto current_position = store_.getPosition(owner.value().id);
                    if (!current_order || !current_position) {
                        const auto& error = !current_order ? current_order.error() : current_position.error();
                        report.errors.push_back(reportError(error, fmt::format("Reloading order {}", order.id)));
                        continue;
                    }
                    core::Order updated = current_order.value();
                    core::Position position = current_position.value();
                    if (updated.isTerminal()) {
                        continue;
                    }

                    updated.status = remote_status;
                    updated.filled_amount = remote.filled_amount;
                    if (remote.average_price) {
                        updated.average_fill_price = remote.average_price;
                    }
                    updated.fee = remote.fee;
                    updated.updated_at = now;
                    if (remote_status == core::OrderStatus::Closed) {
                        updated.filled_at = now;
                    }
                    auto saved = store_.updateOrder(updated);
                    if (!saved) {
                        report.errors.push_back(reportError(saved.error(), fmt::format("Updating order {}", updated.id)));
                        continue;
                    }
                    report.orders_updated++;
                    logger->info("Order {} ({} {}) is now {} (filled {} of {})",
                                 updated.id, core::toString(updated.role), core::toString(updated.side),
                                 core::toString(updated.status), updated.filled_amount, updated.amount);

                    switch (updated.role) {
                        case core::OrderRole::Entry:
                            if (applyEntryUpdate(updated, position, report)) {
                                protection_attempted.insert(position.id);
                            }
                            break;
                        case core::OrderRole::StopLoss:
                        case core::OrderRole::TakeProfit:
                            applyProtectiveUpdate(updated, position, report);
                            break;
                        case core::OrderRole::Close:
                            applyCloseUpdate(updated, position, report);
                            break;
                    }
                }
            }
        }

        // Positions whose protection was just attempted on fill retry on the next pass
        report.positions_protected += protectionSweep(protection_attempted, report.errors);

        logger->debug("Reconcile: checked={}, updated={}, filled={}, protected={}, closed={}, canceled={}, errors={}",
                      report.orders_checked, report.orders_updated, report.entries_filled,
                      report.positions_protected, report.positions_closed, report.positions_canceled,
                      report.errors.size());
        return report;
    }

    std::vector<std::string> BracketOrderManager::ensureProtection() {
        std::vector<std::string> errors;
        protectionSweep({}, errors);
        return errors;
    }

    int BracketOrderManager::protectionSweep(const std::set<long long>& skip, std::vector<std::string>& errors) {
        auto logger = core::logging::getLogger();
        data::PositionFilter filter;
        filter.is_open = true;
        auto positions = store_.queryPositions(filter);
        if (!positions) {
            errors.push_back(reportError(positions.error(), "Protection sweep"));
            return 0;
        }

        int protected_count = 0;
        for (const auto& candidate : positions.value()) {
            if (skip.count(candidate.id) > 0 || !isFilledState(candidate.state)) {
                continue;
            }
            auto lock = locks_.lock(EntityKind::Position, candidate.id);
            auto position = store_.getPosition(candidate.id);
            auto entry = store_.getOrder(candidate.entry_order_id);
            if (!position || !entry) {
                errors.push_back(reportError(!position ? position.error() : entry.error(), "Protection sweep"));
                continue;
            }
            core::Position current = position.value();
            core::Order entry_order = entry.value();
            if (!current.is_open || !isFilledState(current.state)) {
                continue;
            }
            if (current.state == core::BracketState::Protected &&
                entry_order.stop_loss_order_id && entry_order.take_profit_order_id) {
                continue;
            }
            logger->warn("Restoring protection for position {} (stop order: {}, target order: {}).",
                         current.id, describeRef(entry_order.stop_loss_order_id),
                         describeRef(entry_order.take_profit_order_id));
            auto placed = protect(current, entry_order);
            if (placed.empty()) {
                ++protected_count;
            }
            errors.insert(errors.end(), placed.begin(), placed.end());
        }
        return protected_count;
    }

    void BracketOrderManager::recordEntryFill(core::Position& position, const core::Order& entry, core::Timestamp now) {
        const double fill_price = entry.average_fill_price.value_or(entry.price.value_or(position.entry_price));
        const double fill_amount = entry.filled_amount > 0.0 ? entry.filled_amount : entry.amount;

        position.entry_price = fill_price;
        position.current_price = fill_price;
        position.amount = fill_amount;
        position.remaining_amount = fill_amount;
        position.unrealized_pnl = 0.0;
        position.total_fees += entry.fee;
        if (config_.trailing_stop_pct) {
            position.trailing_stop_distance = fill_price * *config_.trailing_stop_pct / 100.0;
        }
        position.state = core::BracketState::EntryFilled;
        position.updated_at = now;
    }

    core::Result<core::Order> BracketOrderManager::settleWithdrawnEntry(long long entry_id) {
        auto logger = core::logging::getLogger();
        auto loaded = store_.getOrder(entry_id);
        if (!loaded) {
            return loaded.error();
        }
        core::Order entry = loaded.value();
        if (!entry.exchange_order_id) {
            return entry;
        }

        // The exchange's last word on the withdrawn order; a failed query keeps what was already recorded
        auto reports = exchange_.queryOrders({*entry.exchange_order_id});
        if (!reports) {
            logger->warn("Could not confirm final fill of withdrawn entry {}: {}", entry_id, reports.error().describe());
            return entry;
        }
        auto it = reports.value().find(*entry.exchange_order_id);
        if (it == reports.value().end() || it->second.filled_amount <= entry.filled_amount) {
            return entry;
        }
        entry.filled_amount = it->second.filled_amount;
        if (it->second.average_price) {
            entry.average_fill_price = it->second.average_price;
        }
        entry.fee = std::max(entry.fee, it->second.fee);
        entry.updated_at = clock_();
        auto saved = store_.updateOrder(entry);
        if (!saved) {
            return saved.error();
        }
        return entry;
    }

    bool BracketOrderManager::applyEntryUpdate(core::Order& entry, core::Position& position, ReconcileReport& report) {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = clock_();

        if (entry.status == core::OrderStatus::Open) {
            return false;
        }
        if (position.state != core::BracketState::EntryPlaced) {
            logger->warn("Entry order {} changed to {} but position {} is already {}.", entry.id,
                         core::toString(entry.status), position.id, core::toString(position.state));
            return false;
        }

        const bool filled = entry.status == core::OrderStatus::Closed || entry.filled_amount > 0.0;
        if (!filled) {
            position.state = core::BracketState::Canceled;
            position.is_open = false;
            position.remaining_amount = 0.0;
            position.closed_at = now;
            position.updated_at = now;
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Canceling position {}", position.id)));
                return false;
            }
            correlation_.erase(entry.id);
            report.positions_canceled++;
            logger->info("Entry order {} {} unfilled: position {} canceled.", entry.id,
                         core::toString(entry.status), position.id);
            return false;
        }

        // Full fill, or a canceled/expired entry treated as a fill of what executed
        if (!correlation_.find(entry.id)) {
            report.errors.push_back(reportError(
                core::makeError(core::ErrorKind::InvariantViolation,
                                fmt::format("Filled entry order {} has no correlation record", entry.id)),
                fmt::format("Position {}", position.id)));
        }

        recordEntryFill(position, entry, now);
        auto saved = store_.updatePosition(position);
        if (!saved) {
            report.errors.push_back(reportError(saved.error(), fmt::format("Recording fill of position {}", position.id)));
            return false;
        }
        report.entries_filled++;
        logger->info("Entry order {} filled: {} @ {} for position {}.", entry.id, position.amount,
                     position.entry_price, position.id);

        auto errors = protect(position, entry);
        if (errors.empty()) {
            report.positions_protected++;
        }
        report.errors.insert(report.errors.end(), errors.begin(), errors.end());
        return true;
    }

    void BracketOrderManager::applyProtectiveUpdate(core::Order& child, core::Position& position, ReconcileReport& report) {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = clock_();

        if (child.status == core::OrderStatus::Open) {
            return;
        }
        if (!position.is_open) {
            if (child.status == core::OrderStatus::Closed) {
                report.errors.push_back(reportError(
                    core::makeError(core::ErrorKind::InvariantViolation,
                                    fmt::format("Protective order {} filled after position {} was closed",
                                                child.id, position.id)),
                    "Reconcile"));
            }
            return;
        }
        if (position.state == core::BracketState::Closing) {
            return;
        }

        auto entry_loaded = store_.getOrder(position.entry_order_id);
        if (!entry_loaded) {
            report.errors.push_back(reportError(entry_loaded.error(), fmt::format("Position {}", position.id)));
            return;
        }
        core::Order entry = entry_loaded.value();
        const bool is_stop = child.role == core::OrderRole::StopLoss;

        if (child.status == core::OrderStatus::Closed) {
            const double fill_price = child.average_fill_price.value_or(
                child.price.value_or(position.current_price.value_or(position.entry_price)));

            auto sibling = is_stop ? entry.take_profit_order_id : entry.stop_loss_order_id;
            auto canceled = cancelIfLive(sibling);
            if (!canceled) {
                report.errors.push_back(reportError(canceled.error(),
                    fmt::format("Canceling sibling order {} of position {}", describeRef(sibling), position.id)));
            }

            closeAtPrice(position, fill_price, child.fee);
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Closing position {}", position.id)));
                return;
            }
            correlation_.erase(entry.id);
            report.positions_closed++;
            logger->info("Position {} closed by {} fill @ {}: realized P&L {:.2f}.", position.id,
                         core::toString(child.role), fill_price, position.realized_pnl);
            return;
        }

        // Canceled or expired at the exchange while the position is still open
        if (is_stop && entry.stop_loss_order_id == child.id) {
            entry.stop_loss_order_id.reset();
        } else if (!is_stop && entry.take_profit_order_id == child.id) {
            entry.take_profit_order_id.reset();
        }
        entry.updated_at = now;
        auto entry_saved = store_.updateOrder(entry);
        if (!entry_saved) {
            report.errors.push_back(reportError(entry_saved.error(), fmt::format("Entry order {}", entry.id)));
        }
        if (position.state == core::BracketState::Protected) {
            position.state = core::BracketState::EntryFilled;
            position.updated_at = now;
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Position {}", position.id)));
            }
        }
        logger->warn("{} order {} was {} at the exchange; position {} will be re-protected.",
                     core::toString(child.role), child.id, core::toString(child.status), position.id);
    }

    void BracketOrderManager::applyCloseUpdate(core::Order& close_order, core::Position& position, ReconcileReport& report) {
        auto logger = core::logging::getLogger();

        if (close_order.status == core::OrderStatus::Open) {
            return;
        }

        if (close_order.status == core::OrderStatus::Closed) {
            if (position.state != core::BracketState::Closing) {
                // Optimistic close: already booked at the last known price
                return;
            }
            const double fill_price = close_order.average_fill_price.value_or(
                position.current_price.value_or(position.entry_price));
            closeAtPrice(position, fill_price, close_order.fee);
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Closing position {}", position.id)));
                return;
            }
            report.positions_closed++;
            logger->info("Close order {} filled @ {}: position {} closed, realized P&L {:.2f}.",
                         close_order.id, fill_price, position.id, position.realized_pnl);
            return;
        }

        // Close order canceled or expired
        if (position.state == core::BracketState::Closing) {
            position.state = core::BracketState::EntryFilled;
            position.close_order_id.reset();
            position.updated_at = clock_();
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Position {}", position.id)));
                return;
            }
            logger->warn("Close order {} was {}; position {} stays open and will be re-protected.",
                         close_order.id, core::toString(close_order.status), position.id);
        } else if (!position.is_open) {
            report.errors.push_back(reportError(
                core::makeError(core::ErrorKind::InvariantViolation,
                                fmt::format("Close order {} was {} but position {} is already booked closed",
                                            close_order.id, core::toString(close_order.status), position.id)),
                "Reconcile"));
        }
    }

    std::vector<std::string> BracketOrderManager::protect(core::Position& position, core::Order& entry) {
        std::vector<std::string> errors;
        auto logger = core::logging::getLogger();
        const core::Timestamp now = clock_();

        if (!entry.stop_loss_order_id) {
            auto placed = placeChild(position, entry, core::OrderRole::StopLoss, position.stop_loss_price);
            if (placed) {
                entry.stop_loss_order_id = placed.value();
            } else {
                errors.push_back(reportError(placed.error(), fmt::format("Placing stop-loss for position {}", position.id)));
            }
        }
        if (!entry.take_profit_order_id) {
            auto placed = placeChild(position, entry, core::OrderRole::TakeProfit, position.take_profit_price);
            if (placed) {
                entry.take_profit_order_id = placed.value();
            } else {
                errors.push_back(reportError(placed.error(), fmt::format("Placing take-profit for position {}", position.id)));
            }
        }

        entry.updated_at = now;
        auto entry_saved = store_.updateOrder(entry);
        if (!entry_saved) {
            errors.push_back(reportError(entry_saved.error(), fmt::format("Entry order {}", entry.id)));
        }

        if (entry.stop_loss_order_id && entry.take_profit_order_id) {
            position.state = core::BracketState::Protected;
            correlation_.erase(entry.id);
        } else {
            position.state = core::BracketState::EntryFilled;
            logger->critical("Position {} is UNPROTECTED (stop order: {}, target order: {}); retrying on the next reconcile.",
                             position.id, describeRef(entry.stop_loss_order_id), describeRef(entry.take_profit_order_id));
        }
        position.updated_at = now;
        auto saved = store_.updatePosition(position);
        if (!saved) {
            errors.push_back(reportError(saved.error(), fmt::format("Position {}", position.id)));
        }
        return errors;
    }

    core::Result<long long> BracketOrderManager::placeChild(const core::Position& position,
                                                            const core::Order& entry,
                                                            core::OrderRole role,
                                                            double price)
    {
        auto pair = pairFor(position.pair_id);
        if (!pair) {
            return pair.error();
        }
        const core::Timestamp now = clock_();

        data::OrderRequest request;
        request.pair_symbol = pair.value().symbol;
        request.side = core::opposite(entry.side);
        request.kind = (role == core::OrderRole::StopLoss) ? core::OrderKind::StopLoss : core::OrderKind::Limit;
        request.amount = core::utils::roundTo(position.remaining_amount, pair.value().volume_precision);
        request.price = core::utils::roundTo(price, pair.value().price_precision);

        auto placed = exchange_.placeOrder(request);
        if (!placed) {
            return placed.error();
        }

        core::Order child;
        child.exchange_order_id = placed.value();
        child.pair_id = position.pair_id;
        child.signal_id = entry.signal_id;
        child.role = role;
        child.side = request.side;
        child.kind = request.kind;
        child.amount = request.amount;
        child.price = request.price;
        child.status = core::OrderStatus::Open;
        child.parent_order_id = entry.id;
        child.created_at = now;
        child.updated_at = now;

        auto child_id = store_.insertOrder(child);
        if (!child_id) {
            auto withdrawn = exchange_.cancelOrder(placed.value());
            if (!withdrawn) {
                reportError(core::makeError(core::ErrorKind::InvariantViolation, withdrawn.error().message),
                            fmt::format("Unrecorded {} order {} could not be canceled", core::toString(role), placed.value()));
            }
            return child_id.error();
        }
        core::logging::getLogger()->info("{} order {} [{}] placed for position {}: {} {} @ {}",
                                         core::toString(role), child_id.value(), placed.value(), position.id,
                                         core::toString(request.side), request.amount, *request.price);
        return child_id.value();
    }

    void BracketOrderManager::closeAtPrice(core::Position& position, double price, double extra_fee) {
        const core::Timestamp now = clock_();
        position.total_fees += extra_fee;
        position.current_price = price;
        position.realized_pnl = position.pnlAt(price) - position.total_fees;
        position.unrealized_pnl = 0.0;
        position.remaining_amount = 0.0;
        position.state = core::BracketState::Closed;
        position.is_open = false;
        position.closed_at = now;
        position.updated_at = now;
    }

    core::Status BracketOrderManager::cancelIfLive(std::optional<long long> order_id) {
        if (!order_id) {
            return core::Status::success();
        }
        auto loaded = store_.getOrder(*order_id);
        if (!loaded) {
            return loaded.error();
        }
        core::Order order = loaded.value();
        if (order.isTerminal()) {
            return core::Status::success();
        }
        if (order.exchange_order_id) {
            auto canceled = exchange_.cancelOrder(*order.exchange_order_id);
            if (!canceled) {
                return canceled;
            }
        }
        order.status = core::OrderStatus::Canceled;
        order.updated_at = clock_();
        return store_.updateOrder(order);
    }

    // --- Monitor ---

    MonitorReport BracketOrderManager::monitorPositions() {
        MonitorReport report;
        auto logger = core::logging::getLogger();

        data::PositionFilter filter;
        filter.is_open = true;
        auto positions = store_.queryPositions(filter);
        if (!positions) {
            report.errors.push_back(reportError(positions.error(), "Loading open positions"));
            return report;
        }
        std::vector<core::Position> filled;
        for (const auto& position : positions.value()) {
            if (isFilledState(position.state)) {
                filled.push_back(position);
            }
        }
        if (filled.empty()) {
            return report;
        }

        auto pairs = loadPairs();
        if (!pairs) {
            report.errors.push_back(reportError(pairs.error(), "Loading pairs"));
            return report;
        }
        std::set<std::string> symbol_set;
        for (const auto& position : filled) {
            auto it = pairs.value().find(position.pair_id);
            if (it != pairs.value().end()) {
                symbol_set.insert(it->second.symbol);
            }
        }
        auto tickers = exchange_.getTicker(std::vector<std::string>(symbol_set.begin(), symbol_set.end()));
        if (!tickers) {
            report.errors.push_back(reportError(tickers.error(), "Fetching tickers"));
            return report;
        }

        std::vector<std::pair<long long, double>> trailing_candidates;
        for (const auto& candidate : filled) {
            auto pair_it = pairs.value().find(candidate.pair_id);
            if (pair_it == pairs.value().end()) {
                continue;
            }
            const auto& pair = pair_it->second;
            auto price_it = tickers.value().find(pair.symbol);
            if (price_it == tickers.value().end()) {
                logger->warn("No ticker for {}; position {} not marked.", pair.symbol, candidate.id);
                continue;
            }
            const double price = price_it->second;

            auto lock = locks_.lock(EntityKind::Position, candidate.id);
            auto loaded = store_.getPosition(candidate.id);
            if (!loaded) {
                report.errors.push_back(reportError(loaded.error(), "Marking position"));
                continue;
            }
            core::Position position = loaded.value();
            if (!position.is_open || !isFilledState(position.state)) {
                continue;
            }
            position.current_price = price;
            position.unrealized_pnl = position.pnlAt(price);
            position.max_unrealized_pnl = std::max(position.max_unrealized_pnl, position.unrealized_pnl);
            position.max_unrealized_loss = std::min(position.max_unrealized_loss, position.unrealized_pnl);
            position.updated_at = clock_();
            auto saved = store_.updatePosition(position);
            if (!saved) {
                report.errors.push_back(reportError(saved.error(), fmt::format("Marking position {}", position.id)));
                continue;
            }
            report.positions_monitored++;

            if (position.trailing_stop_distance && position.state == core::BracketState::Protected) {
                const double distance = *position.trailing_stop_distance;
                double stop = (position.side == core::PositionSide::Long) ? price - distance : price + distance;
                stop = core::utils::roundTo(stop, pair.price_precision);
                if (tightensRisk(position.side, position.stop_loss_price, stop)) {
                    trailing_candidates.emplace_back(position.id, stop);
                }
            }
        }

        // Position locks released: adjustStop takes its own
        for (const auto& [position_id, stop] : trailing_candidates) {
            auto adjusted = adjustStop(position_id, stop);
            if (!adjusted) {
                report.errors.push_back(reportError(adjusted.error(), fmt::format("Trailing stop for position {}", position_id)));
            } else if (adjusted.value()) {
                report.stops_adjusted++;
            }
        }
        return report;
    }

    core::Result<bool> BracketOrderManager::adjustStop(long long position_id, double candidate_stop) {
        auto logger = core::logging::getLogger();
        auto lock = locks_.lock(EntityKind::Position, position_id);
        const core::Timestamp now = clock_();

        auto loaded = store_.getPosition(position_id);
        if (!loaded) {
            return loaded.error();
        }
        core::Position position = loaded.value();
        if (!position.is_open || !isFilledState(position.state)) {
            return core::makeError(core::ErrorKind::Validation,
                                   fmt::format("Position {} is {}; its stop cannot move",
                                               position_id, core::toString(position.state)));
        }
        auto pair = pairFor(position.pair_id);
        if (!pair) {
            return pair.error();
        }
        // Compare and record the price the exchange will actually hold
        candidate_stop = core::utils::roundTo(candidate_stop, pair.value().price_precision);
        if (!tightensRisk(position.side, position.stop_loss_price, candidate_stop)) {
            logger->debug("Stop {} rejected for position {}: current stop {} already tighter.",
                          candidate_stop, position_id, position.stop_loss_price);
            return false;
        }

        auto entry_loaded = store_.getOrder(position.entry_order_id);
        if (!entry_loaded) {
            return entry_loaded.error();
        }
        core::Order entry = entry_loaded.value();

        std::optional<core::Order> old_stop;
        if (entry.stop_loss_order_id) {
            auto stop_loaded = store_.getOrder(*entry.stop_loss_order_id);
            if (!stop_loaded) {
                return stop_loaded.error();
            }
            old_stop = stop_loaded.value();
        }

        // A failed cancel leaves everything unchanged
        if (old_stop && !old_stop->isTerminal() && old_stop->exchange_order_id) {
            auto canceled = exchange_.cancelOrder(*old_stop->exchange_order_id);
            if (!canceled) {
                logger->warn("Stop move for position {} aborted: cancel of order {} failed.", position_id, old_stop->id);
                return canceled.error();
            }
        }
        if (old_stop && !old_stop->isTerminal()) {
            old_stop->status = core::OrderStatus::Canceled;
            old_stop->updated_at = now;
            auto saved = store_.updateOrder(*old_stop);
            if (!saved) {
                reportError(saved.error(), fmt::format("Recording cancel of stop order {}", old_stop->id));
            }
        }

        const double old_price = position.stop_loss_price;
        auto placed = placeChild(position, entry, core::OrderRole::StopLoss, candidate_stop);
        if (!placed) {
            // Unprotected on the stop side: the sweep re-protects at the old price
            entry.stop_loss_order_id.reset();
            entry.updated_at = now;
            auto entry_saved = store_.updateOrder(entry);
            if (!entry_saved) {
                reportError(entry_saved.error(), fmt::format("Entry order {}", entry.id));
            }
            position.state = core::BracketState::EntryFilled;
            position.updated_at = now;
            auto position_saved = store_.updatePosition(position);
            if (!position_saved) {
                reportError(position_saved.error(), fmt::format("Position {}", position.id));
            }
            logger->critical("Position {} lost its stop while moving {} -> {}; flagged for re-protection at {}.",
                             position_id, old_price, candidate_stop, old_price);
            return placed.error();
        }

        entry.stop_loss_order_id = placed.value();
        entry.updated_at = now;
        auto entry_saved = store_.updateOrder(entry);
        if (!entry_saved) {
            return entry_saved.error();
        }
        position.stop_loss_price = candidate_stop;
        if (entry.take_profit_order_id) {
            position.state = core::BracketState::Protected;
        }
        position.updated_at = now;
        auto position_saved = store_.updatePosition(position);
        if (!position_saved) {
            return position_saved.error();
        }
        logger->info("Stop for position {} moved {} -> {}.", position_id, old_price, candidate_stop);
        return true;
    }

    // --- Close ---

    core::Status BracketOrderManager::closePosition(long long position_id, const std::string& reason) {
        auto logger = core::logging::getLogger();
        auto lock = locks_.lock(EntityKind::Position, position_id);
        const core::Timestamp now = clock_();

        auto loaded = store_.getPosition(position_id);
        if (!loaded) {
            return loaded.error();
        }
        core::Position position = loaded.value();
        if (!position.is_open) {
            return core::makeError(core::ErrorKind::Validation, fmt::format("Position {} is already closed", position_id));
        }
        if (position.state == core::BracketState::Closing) {
            return core::makeError(core::ErrorKind::Validation,
                                   fmt::format("Position {} already has a close order pending", position_id));
        }

        auto entry_loaded = store_.getOrder(position.entry_order_id);
        if (!entry_loaded) {
            return entry_loaded.error();
        }
        core::Order entry = entry_loaded.value();

        if (!isFilledState(position.state)) {
            // Nothing executed yet: withdraw the entry
            auto withdrawn = cancelIfLive(entry.id);
            if (!withdrawn) {
                return withdrawn;
            }
            auto settled = settleWithdrawnEntry(entry.id);
            if (!settled) {
                return settled.error();
            }
            entry = settled.value();

            if (entry.filled_amount <= 0.0) {
                correlation_.erase(entry.id);
                position.state = core::BracketState::Canceled;
                position.is_open = false;
                position.remaining_amount = 0.0;
                position.closed_at = now;
                position.updated_at = now;
                logger->info("Position {} canceled before fill ({}).", position_id, reason);
                return store_.updatePosition(position);
            }

            // Part of the entry executed before the withdrawal: flatten what was bought or sold
            recordEntryFill(position, entry, now);
            auto saved = store_.updatePosition(position);
            if (!saved) {
                return saved;
            }
            logger->warn("Entry order {} was partially filled ({} of {}) when withdrawn; closing position {} at {}.",
                         entry.id, entry.filled_amount, entry.amount, position_id, position.remaining_amount);
        }

        core::Status children = core::Status::success();
        if (entry.stop_loss_order_id) {
            children = cancelIfLive(entry.stop_loss_order_id);
            if (children) {
                entry.stop_loss_order_id.reset();
            }
        }
        if (children && entry.take_profit_order_id) {
            children = cancelIfLive(entry.take_profit_order_id);
            if (children) {
                entry.take_profit_order_id.reset();
            }
        }
        entry.updated_at = now;
        auto entry_saved = store_.updateOrder(entry);
        if (!entry_saved) {
            return entry_saved;
        }
        if (!children) {
            if (!entry.stop_loss_order_id || !entry.take_profit_order_id) {
                position.state = core::BracketState::EntryFilled;
                position.updated_at = now;
                auto saved = store_.updatePosition(position);
                if (!saved) {
                    reportError(saved.error(), fmt::format("Position {}", position_id));
                }
            }
            return children;
        }

        auto pair = pairFor(position.pair_id);
        if (!pair) {
            return pair.error();
        }

        data::OrderRequest request;
        request.pair_symbol = pair.value().symbol;
        request.side = core::opposite(entry.side);
        request.kind = core::OrderKind::Market;
        request.amount = core::utils::roundTo(position.remaining_amount, pair.value().volume_precision);

        auto placed = exchange_.placeOrder(request);
        if (!placed) {
            position.state = core::BracketState::EntryFilled;
            position.updated_at = now;
            auto saved = store_.updatePosition(position);
            if (!saved) {
                reportError(saved.error(), fmt::format("Position {}", position_id));
            }
            logger->error("Close of position {} failed; it stays open and will be re-protected: {}",
                          position_id, placed.error().describe());
            return placed.error();
        }

        core::Order close_order;
        close_order.exchange_order_id = placed.value();
        close_order.pair_id = position.pair_id;
        close_order.signal_id = entry.signal_id;
        close_order.role = core::OrderRole::Close;
        close_order.side = request.side;
        close_order.kind = core::OrderKind::Market;
        close_order.amount = request.amount;
        close_order.status = core::OrderStatus::Open;
        close_order.parent_order_id = entry.id;
        close_order.created_at = now;
        close_order.updated_at = now;
        auto close_id = store_.insertOrder(close_order);
        if (!close_id) {
            reportError(core::makeError(core::ErrorKind::InvariantViolation, close_id.error().message),
                        fmt::format("Close order {} for position {} is live but unrecorded", placed.value(), position_id));
            return close_id.error();
        }
        position.close_order_id = close_id.value();

        if (config_.close_policy == core::ClosePolicy::Optimistic) {
            const double price = position.current_price.value_or(position.entry_price);
            closeAtPrice(position, price, 0.0);
            logger->info("Position {} closed optimistically @ {} ({}): realized P&L {:.2f}.",
                         position_id, price, reason, position.realized_pnl);
        } else {
            position.state = core::BracketState::Closing;
            position.updated_at = now;
            logger->info("Position {} closing ({}): market order {} placed, awaiting fill.",
                         position_id, reason, close_id.value());
        }
        return store_.updatePosition(position);
    }

    // --- Startup ---

    int BracketOrderManager::rebuildCorrelation() {
        auto logger = core::logging::getLogger();
        correlation_.clear();

        data::OrderFilter filter;
        filter.status = core::OrderStatus::Open;
        filter.role = core::OrderRole::Entry;
        auto orders = store_.queryOrders(filter);
        if (!orders) {
            reportError(orders.error(), "Rebuilding correlation");
            return 0;
        }

        int rebuilt = 0;
        for (const auto& order : orders.value()) {
            if (order.stop_loss_order_id || order.take_profit_order_id) {
                continue;
            }
            auto position = positionForOrder(order);
            if (!position) {
                reportError(position.error(), fmt::format("Rebuilding correlation for entry {}", order.id));
                continue;
            }
            const auto& p = position.value();
            if (!p.is_open || p.state != core::BracketState::EntryPlaced) {
                continue;
            }
            CorrelationEntry entry;
            entry.position_id = p.id;
            entry.signal_id = p.signal_id;
            entry.stop_price = p.stop_loss_price;
            entry.target_price = p.take_profit_price;
            entry.side = p.side;
            entry.amount = p.amount;
            correlation_.put(order.id, entry);
            ++rebuilt;
        }
        logger->info("Rebuilt {} bracket correlation entries from open entry orders.", rebuilt);
        return rebuilt;
    }

} // namespace execution
