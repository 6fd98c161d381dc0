#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // For nullable fields (exchange ids, indicator values)

namespace core {

    // Using system_clock for time points; all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    template<typename T>
    using TimeSeries = std::vector<T>;

    // --- Market identity ---
    struct TradingPair {
        long long id = 0;
        std::string symbol;          // Exchange pair code, e.g. "XBTUSD"
        std::string base_asset;      // e.g. "XBT"
        std::string quote_asset;     // e.g. "USD"
        std::string display_name;    // e.g. "BTC/USD"
        int price_precision = 2;     // Decimal places accepted for prices
        int volume_precision = 8;    // Decimal places accepted for amounts
        double min_order_size = 0.0;
        bool is_active = true;
    };

    // One OHLCV sample
    struct PriceBar {
        long long pair_id = 0;
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;

        bool operator<(const PriceBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Indicator values stored on the latest bar. Absent means "unavailable", never zero.
    struct IndicatorSnapshot {
        std::optional<double> rsi_14;
        std::optional<double> macd;
        std::optional<double> macd_signal;
        std::optional<double> macd_histogram;
        std::optional<double> bb_upper;
        std::optional<double> bb_middle;
        std::optional<double> bb_lower;
        std::optional<double> sma_20;
        std::optional<double> sma_50;
        std::optional<double> ema_12;
        std::optional<double> ema_26;
    };

    // Ordinal scale, STRONG_SELL < ... < STRONG_BUY
    enum class SignalType {
        StrongSell,
        Sell,
        Hold,
        Buy,
        StrongBuy
    };

    enum class VolumeRegime {
        Unknown,
        Low,
        Medium,
        High
    };

    struct TradingSignal {
        long long id = 0;
        long long pair_id = 0;
        SignalType signal_type = SignalType::Hold;
        double confidence = 0.0;          // [0, 1]
        double entry_price = 0.0;
        double target_price = 0.0;
        double stop_loss_price = 0.0;
        double trend_strength = 0.0;
        double volatility = 0.0;
        VolumeRegime volume_profile = VolumeRegime::Unknown;
        std::optional<double> support_level;
        std::optional<double> resistance_level;
        std::string strategy_type = "SCALP";
        double position_size_pct = 0.0;   // Recommended % of available balance
        int time_horizon_minutes = 60;
        Timestamp created_at;
        Timestamp expires_at;
        bool is_active = true;            // false once consumed

        bool isBullish() const {
            return signal_type == SignalType::Buy || signal_type == SignalType::StrongBuy;
        }
        bool isExpired(Timestamp now) const { return now >= expires_at; }
    };

    enum class OrderRole {
        Entry,
        StopLoss,
        TakeProfit,
        Close
    };

    enum class OrderSide {
        Buy,
        Sell
    };

    enum class OrderKind {
        Market,
        Limit,
        StopLoss
    };

    enum class OrderStatus {
        Pending,
        Open,
        Closed,   // Filled
        Canceled,
        Expired
    };

    struct Order {
        long long id = 0;
        std::optional<std::string> exchange_order_id; // Set once the exchange acknowledges
        long long pair_id = 0;
        std::optional<long long> signal_id;
        OrderRole role = OrderRole::Entry;
        OrderSide side = OrderSide::Buy;
        OrderKind kind = OrderKind::Limit;
        double amount = 0.0;
        std::optional<double> price;
        OrderStatus status = OrderStatus::Pending;
        double filled_amount = 0.0;
        std::optional<double> average_fill_price;
        double fee = 0.0;
        std::optional<long long> parent_order_id;      // Protective/close children only
        std::optional<long long> stop_loss_order_id;   // Entry orders only
        std::optional<long long> take_profit_order_id; // Entry orders only
        Timestamp created_at;
        Timestamp updated_at;
        std::optional<Timestamp> filled_at;

        bool isTerminal() const {
            return status == OrderStatus::Closed || status == OrderStatus::Canceled ||
                   status == OrderStatus::Expired;
        }
    };

    enum class PositionSide {
        Long,
        Short
    };

    // Bracket lifecycle. Closing = close order placed, waiting for the exchange to confirm.
    enum class BracketState {
        Signaled,
        EntryPlaced,
        EntryFilled,
        Protected,
        Closing,
        Closed,
        Canceled
    };

    struct Position {
        long long id = 0;
        long long pair_id = 0;
        long long entry_order_id = 0;
        std::optional<long long> signal_id;
        PositionSide side = PositionSide::Long;
        double amount = 0.0;
        double remaining_amount = 0.0;
        double entry_price = 0.0;
        std::optional<double> current_price;
        double realized_pnl = 0.0;
        double unrealized_pnl = 0.0;
        double total_fees = 0.0;
        double stop_loss_price = 0.0;
        double take_profit_price = 0.0;
        std::optional<double> trailing_stop_distance;
        BracketState state = BracketState::Signaled;
        bool is_open = true;
        std::optional<long long> close_order_id;
        double max_unrealized_pnl = 0.0;  // Best excursion seen
        double max_unrealized_loss = 0.0; // Worst excursion seen (<= 0)
        std::string strategy_type = "SCALP";
        Timestamp opened_at;
        Timestamp updated_at;
        std::optional<Timestamp> closed_at;

        // Side-aware P&L of the remaining amount at a given price, before fees
        double pnlAt(double price) const {
            double diff = (side == PositionSide::Long) ? (price - entry_price) : (entry_price - price);
            return diff * remaining_amount;
        }
    };

    // Singleton account-level aggregate
    struct Portfolio {
        long long id = 1;
        double total_balance = 0.0;
        double available_balance = 0.0;
        double locked_balance = 0.0;
        double total_pnl = 0.0;
        double realized_pnl = 0.0;
        double unrealized_pnl = 0.0;
        double daily_pnl = 0.0;
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;        // Fraction, 0..1
        double average_win = 0.0;
        double average_loss = 0.0;
        double profit_factor = 0.0;
        double current_drawdown = 0.0;
        double max_drawdown = 0.0;
        int open_positions = 0;
        double total_exposure = 0.0;
        double max_position_size_pct = 5.0;
        double max_daily_loss_pct = 2.0;
        bool is_trading_enabled = true;
        Timestamp created_at;
        Timestamp updated_at;
    };

    // --- Enum <-> string helpers (used for persistence and logging) ---
    std::string toString(SignalType type);
    std::string toString(VolumeRegime regime);
    std::string toString(OrderRole role);
    std::string toString(OrderSide side);
    std::string toString(OrderKind kind);
    std::string toString(OrderStatus status);
    std::string toString(PositionSide side);
    std::string toString(BracketState state);

    // Parsers throw std::invalid_argument on unknown input
    SignalType signalTypeFromString(const std::string& str);
    VolumeRegime volumeRegimeFromString(const std::string& str);
    OrderRole orderRoleFromString(const std::string& str);
    OrderSide orderSideFromString(const std::string& str);
    OrderKind orderKindFromString(const std::string& str);
    OrderStatus orderStatusFromString(const std::string& str);
    PositionSide positionSideFromString(const std::string& str);
    BracketState bracketStateFromString(const std::string& str);

    inline OrderSide opposite(OrderSide side) {
        return side == OrderSide::Buy ? OrderSide::Sell : OrderSide::Buy;
    }

    inline OrderSide entrySideFor(PositionSide side) {
        return side == PositionSide::Long ? OrderSide::Buy : OrderSide::Sell;
    }

} // namespace core
