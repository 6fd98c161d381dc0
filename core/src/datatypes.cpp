#include "datatypes.hpp"
#include <stdexcept>
#include <utility>
#include <cstddef>

namespace core {

    namespace {

        // Shared lookup for the string <-> enum tables below
        template<typename E, size_t N>
        E parseEnum(const std::pair<E, const char*> (&table)[N], const std::string& str, const char* what) {
            for (const auto& entry : table) {
                if (str == entry.second) return entry.first;
            }
            throw std::invalid_argument(std::string("Unknown ") + what + " string: " + str);
        }

        template<typename E, size_t N>
        std::string formatEnum(const std::pair<E, const char*> (&table)[N], E value) {
            for (const auto& entry : table) {
                if (value == entry.first) return entry.second;
            }
            return "UNKNOWN";
        }

        const std::pair<SignalType, const char*> kSignalTypes[] = {
            {SignalType::StrongSell, "STRONG_SELL"},
            {SignalType::Sell, "SELL"},
            {SignalType::Hold, "HOLD"},
            {SignalType::Buy, "BUY"},
            {SignalType::StrongBuy, "STRONG_BUY"},
        };

        const std::pair<VolumeRegime, const char*> kVolumeRegimes[] = {
            {VolumeRegime::Unknown, "UNKNOWN"},
            {VolumeRegime::Low, "LOW"},
            {VolumeRegime::Medium, "MEDIUM"},
            {VolumeRegime::High, "HIGH"},
        };

        const std::pair<OrderRole, const char*> kOrderRoles[] = {
            {OrderRole::Entry, "entry"},
            {OrderRole::StopLoss, "stop_loss"},
            {OrderRole::TakeProfit, "take_profit"},
            {OrderRole::Close, "close"},
        };

        const std::pair<OrderSide, const char*> kOrderSides[] = {
            {OrderSide::Buy, "buy"},
            {OrderSide::Sell, "sell"},
        };

        // Kraken ordertype values
        const std::pair<OrderKind, const char*> kOrderKinds[] = {
            {OrderKind::Market, "market"},
            {OrderKind::Limit, "limit"},
            {OrderKind::StopLoss, "stop-loss"},
        };

        const std::pair<OrderStatus, const char*> kOrderStatuses[] = {
            {OrderStatus::Pending, "pending"},
            {OrderStatus::Open, "open"},
            {OrderStatus::Closed, "closed"},
            {OrderStatus::Canceled, "canceled"},
            {OrderStatus::Expired, "expired"},
        };

        const std::pair<PositionSide, const char*> kPositionSides[] = {
            {PositionSide::Long, "long"},
            {PositionSide::Short, "short"},
        };

        const std::pair<BracketState, const char*> kBracketStates[] = {
            {BracketState::Signaled, "SIGNALED"},
            {BracketState::EntryPlaced, "ENTRY_PLACED"},
            {BracketState::EntryFilled, "ENTRY_FILLED"},
            {BracketState::Protected, "PROTECTED"},
            {BracketState::Closing, "CLOSING"},
            {BracketState::Closed, "CLOSED"},
            {BracketState::Canceled, "CANCELED"},
        };

    } // end anonymous namespace

    std::string toString(SignalType type) { return formatEnum(kSignalTypes, type); }
    std::string toString(VolumeRegime regime) { return formatEnum(kVolumeRegimes, regime); }
    std::string toString(OrderRole role) { return formatEnum(kOrderRoles, role); }
    std::string toString(OrderSide side) { return formatEnum(kOrderSides, side); }
    std::string toString(OrderKind kind) { return formatEnum(kOrderKinds, kind); }
    std::string toString(OrderStatus status) { return formatEnum(kOrderStatuses, status); }
    std::string toString(PositionSide side) { return formatEnum(kPositionSides, side); }
    std::string toString(BracketState state) { return formatEnum(kBracketStates, state); }

    SignalType signalTypeFromString(const std::string& str) {
        return parseEnum(kSignalTypes, str, "signal type");
    }
    VolumeRegime volumeRegimeFromString(const std::string& str) {
        return parseEnum(kVolumeRegimes, str, "volume regime");
    }
    OrderRole orderRoleFromString(const std::string& str) {
        return parseEnum(kOrderRoles, str, "order role");
    }
    OrderSide orderSideFromString(const std::string& str) {
        return parseEnum(kOrderSides, str, "order side");
    }
    OrderKind orderKindFromString(const std::string& str) {
        return parseEnum(kOrderKinds, str, "order kind");
    }
    OrderStatus orderStatusFromString(const std::string& str) {
        // Kraken reports "pending" before an order rests on the book
        return parseEnum(kOrderStatuses, str, "order status");
    }
    PositionSide positionSideFromString(const std::string& str) {
        return parseEnum(kPositionSides, str, "position side");
    }
    BracketState bracketStateFromString(const std::string& str) {
        return parseEnum(kBracketStates, str, "bracket state");
    }

} // namespace core
