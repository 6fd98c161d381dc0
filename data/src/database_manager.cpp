#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <stdexcept>
#include <chrono>

namespace data
{

    namespace
    {

        struct StatementDeleter
        {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };
        using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        // Binds parameters left to right, starting at index 1
        class Binder
        {
        public:
            explicit Binder(sqlite3_stmt *stmt) : stmt_(stmt) {}

            Binder &add(long long value)
            {
                sqlite3_bind_int64(stmt_, index_++, value);
                return *this;
            }
            Binder &add(int value)
            {
                sqlite3_bind_int(stmt_, index_++, value);
                return *this;
            }
            Binder &add(bool value) { return add(value ? 1 : 0); }
            Binder &add(double value)
            {
                sqlite3_bind_double(stmt_, index_++, value);
                return *this;
            }
            Binder &add(const std::string &value)
            {
                sqlite3_bind_text(stmt_, index_++, value.c_str(), -1, SQLITE_TRANSIENT);
                return *this;
            }
            Binder &add(const char *value) { return add(std::string(value)); }
            Binder &add(core::Timestamp value) { return add(core::utils::timestampToString(value)); }

            template <typename T>
            Binder &add(const std::optional<T> &value)
            {
                if (value)
                {
                    return add(*value);
                }
                sqlite3_bind_null(stmt_, index_++);
                return *this;
            }

        private:
            sqlite3_stmt *stmt_;
            int index_ = 1;
        };

        // Reads columns left to right, starting at index 0
        class RowReader
        {
        public:
            explicit RowReader(sqlite3_stmt *stmt) : stmt_(stmt) {}

            long long int64() { return sqlite3_column_int64(stmt_, index_++); }
            int integer() { return sqlite3_column_int(stmt_, index_++); }
            bool boolean() { return integer() != 0; }
            double real() { return sqlite3_column_double(stmt_, index_++); }
            std::string text()
            {
                const unsigned char *value = sqlite3_column_text(stmt_, index_++);
                return value ? reinterpret_cast<const char *>(value) : "";
            }
            core::Timestamp time() { return core::utils::stringToTimestamp(text()); }

            bool isNull() const { return sqlite3_column_type(stmt_, index_) == SQLITE_NULL; }

            std::optional<long long> optInt64()
            {
                if (isNull()) { ++index_; return std::nullopt; }
                return int64();
            }
            std::optional<double> optReal()
            {
                if (isNull()) { ++index_; return std::nullopt; }
                return real();
            }
            std::optional<std::string> optText()
            {
                if (isNull()) { ++index_; return std::nullopt; }
                return text();
            }
            std::optional<core::Timestamp> optTime()
            {
                if (isNull()) { ++index_; return std::nullopt; }
                return time();
            }

        private:
            sqlite3_stmt *stmt_;
            int index_ = 0;
        };

        const char *kPairColumns =
            "id, symbol, base_asset, quote_asset, display_name, price_precision, volume_precision, "
            "min_order_size, is_active";

        const char *kSignalColumns =
            "id, pair_id, signal_type, confidence, entry_price, target_price, stop_loss_price, "
            "trend_strength, volatility, volume_profile, support_level, resistance_level, strategy_type, "
            "position_size_pct, time_horizon_minutes, created_at, expires_at, is_active";

        const char *kOrderColumns =
            "id, exchange_order_id, pair_id, signal_id, role, side, kind, amount, price, status, "
            "filled_amount, average_fill_price, fee, parent_order_id, stop_loss_order_id, "
            "take_profit_order_id, created_at, updated_at, filled_at";

        const char *kPositionColumns =
            "id, pair_id, entry_order_id, signal_id, side, amount, remaining_amount, entry_price, "
            "current_price, realized_pnl, unrealized_pnl, total_fees, stop_loss_price, take_profit_price, "
            "trailing_stop_distance, state, is_open, close_order_id, max_unrealized_pnl, "
            "max_unrealized_loss, strategy_type, opened_at, updated_at, closed_at";

        const char *kPortfolioColumns =
            "id, total_balance, available_balance, locked_balance, total_pnl, realized_pnl, unrealized_pnl, "
            "daily_pnl, total_trades, winning_trades, losing_trades, win_rate, average_win, average_loss, "
            "profit_factor, current_drawdown, max_drawdown, open_positions, total_exposure, "
            "max_position_size_pct, max_daily_loss_pct, is_trading_enabled, created_at, updated_at";

        const char *kSnapshotColumns =
            "has_indicators, rsi_14, macd, macd_signal, macd_histogram, bb_upper, bb_middle, bb_lower, "
            "sma_20, sma_50, ema_12, ema_26";

        core::TradingPair readPair(RowReader &row)
        {
            core::TradingPair pair;
            pair.id = row.int64();
            pair.symbol = row.text();
            pair.base_asset = row.text();
            pair.quote_asset = row.text();
            pair.display_name = row.text();
            pair.price_precision = row.integer();
            pair.volume_precision = row.integer();
            pair.min_order_size = row.real();
            pair.is_active = row.boolean();
            return pair;
        }

        core::TradingSignal readSignal(RowReader &row)
        {
            core::TradingSignal signal;
            signal.id = row.int64();
            signal.pair_id = row.int64();
            signal.signal_type = core::signalTypeFromString(row.text());
            signal.confidence = row.real();
            signal.entry_price = row.real();
            signal.target_price = row.real();
            signal.stop_loss_price = row.real();
            signal.trend_strength = row.real();
            signal.volatility = row.real();
            signal.volume_profile = core::volumeRegimeFromString(row.text());
            signal.support_level = row.optReal();
            signal.resistance_level = row.optReal();
            signal.strategy_type = row.text();
            signal.position_size_pct = row.real();
            signal.time_horizon_minutes = row.integer();
            signal.created_at = row.time();
            signal.expires_at = row.time();
            signal.is_active = row.boolean();
            return signal;
        }

        core::Order readOrder(RowReader &row)
        {
            core::Order order;
            order.id = row.int64();
            order.exchange_order_id = row.optText();
            order.pair_id = row.int64();
            order.signal_id = row.optInt64();
            order.role = core::orderRoleFromString(row.text());
            order.side = core::orderSideFromString(row.text());
            order.kind = core::orderKindFromString(row.text());
            order.amount = row.real();
            order.price = row.optReal();
            order.status = core::orderStatusFromString(row.text());
            order.filled_amount = row.real();
            order.average_fill_price = row.optReal();
            order.fee = row.real();
            order.parent_order_id = row.optInt64();
            order.stop_loss_order_id = row.optInt64();
            order.take_profit_order_id = row.optInt64();
            order.created_at = row.time();
            order.updated_at = row.time();
            order.filled_at = row.optTime();
            return order;
        }

        core::Position readPosition(RowReader &row)
        {
            core::Position position;
            position.id = row.int64();
            position.pair_id = row.int64();
            position.entry_order_id = row.int64();
            position.signal_id = row.optInt64();
            position.side = core::positionSideFromString(row.text());
            position.amount = row.real();
            position.remaining_amount = row.real();
            position.entry_price = row.real();
            position.current_price = row.optReal();
            position.realized_pnl = row.real();
            position.unrealized_pnl = row.real();
            position.total_fees = row.real();
            position.stop_loss_price = row.real();
            position.take_profit_price = row.real();
            position.trailing_stop_distance = row.optReal();
            position.state = core::bracketStateFromString(row.text());
            position.is_open = row.boolean();
            position.close_order_id = row.optInt64();
            position.max_unrealized_pnl = row.real();
            position.max_unrealized_loss = row.real();
            position.strategy_type = row.text();
            position.opened_at = row.time();
            position.updated_at = row.time();
            position.closed_at = row.optTime();
            return position;
        }

        core::Portfolio readPortfolio(RowReader &row)
        {
            core::Portfolio portfolio;
            portfolio.id = row.int64();
            portfolio.total_balance = row.real();
            portfolio.available_balance = row.real();
            portfolio.locked_balance = row.real();
            portfolio.total_pnl = row.real();
            portfolio.realized_pnl = row.real();
            portfolio.unrealized_pnl = row.real();
            portfolio.daily_pnl = row.real();
            portfolio.total_trades = row.integer();
            portfolio.winning_trades = row.integer();
            portfolio.losing_trades = row.integer();
            portfolio.win_rate = row.real();
            portfolio.average_win = row.real();
            portfolio.average_loss = row.real();
            portfolio.profit_factor = row.real();
            portfolio.current_drawdown = row.real();
            portfolio.max_drawdown = row.real();
            portfolio.open_positions = row.integer();
            portfolio.total_exposure = row.real();
            portfolio.max_position_size_pct = row.real();
            portfolio.max_daily_loss_pct = row.real();
            portfolio.is_trading_enabled = row.boolean();
            portfolio.created_at = row.time();
            portfolio.updated_at = row.time();
            return portfolio;
        }

        std::optional<core::IndicatorSnapshot> readSnapshot(RowReader &row)
        {
            if (!row.boolean())
            {
                return std::nullopt;
            }
            core::IndicatorSnapshot snapshot;
            snapshot.rsi_14 = row.optReal();
            snapshot.macd = row.optReal();
            snapshot.macd_signal = row.optReal();
            snapshot.macd_histogram = row.optReal();
            snapshot.bb_upper = row.optReal();
            snapshot.bb_middle = row.optReal();
            snapshot.bb_lower = row.optReal();
            snapshot.sma_20 = row.optReal();
            snapshot.sma_50 = row.optReal();
            snapshot.ema_12 = row.optReal();
            snapshot.ema_26 = row.optReal();
            return snapshot;
        }

        void bindSignal(Binder &binder, const core::TradingSignal &signal)
        {
            binder.add(signal.pair_id)
                .add(core::toString(signal.signal_type))
                .add(signal.confidence)
                .add(signal.entry_price)
                .add(signal.target_price)
                .add(signal.stop_loss_price)
                .add(signal.trend_strength)
                .add(signal.volatility)
                .add(core::toString(signal.volume_profile))
                .add(signal.support_level)
                .add(signal.resistance_level)
                .add(signal.strategy_type)
                .add(signal.position_size_pct)
                .add(signal.time_horizon_minutes)
                .add(signal.created_at)
                .add(signal.expires_at)
                .add(signal.is_active);
        }

        void bindOrder(Binder &binder, const core::Order &order)
        {
            binder.add(order.exchange_order_id)
                .add(order.pair_id)
                .add(order.signal_id)
                .add(core::toString(order.role))
                .add(core::toString(order.side))
                .add(core::toString(order.kind))
                .add(order.amount)
                .add(order.price)
                .add(core::toString(order.status))
                .add(order.filled_amount)
                .add(order.average_fill_price)
                .add(order.fee)
                .add(order.parent_order_id)
                .add(order.stop_loss_order_id)
                .add(order.take_profit_order_id)
                .add(order.created_at)
                .add(order.updated_at)
                .add(order.filled_at);
        }

        void bindPosition(Binder &binder, const core::Position &position)
        {
            binder.add(position.pair_id)
                .add(position.entry_order_id)
                .add(position.signal_id)
                .add(core::toString(position.side))
                .add(position.amount)
                .add(position.remaining_amount)
                .add(position.entry_price)
                .add(position.current_price)
                .add(position.realized_pnl)
                .add(position.unrealized_pnl)
                .add(position.total_fees)
                .add(position.stop_loss_price)
                .add(position.take_profit_price)
                .add(position.trailing_stop_distance)
                .add(core::toString(position.state))
                .add(position.is_open)
                .add(position.close_order_id)
                .add(position.max_unrealized_pnl)
                .add(position.max_unrealized_loss)
                .add(position.strategy_type)
                .add(position.opened_at)
                .add(position.updated_at)
                .add(position.closed_at);
        }

        void bindPortfolio(Binder &binder, const core::Portfolio &portfolio)
        {
            binder.add(portfolio.total_balance)
                .add(portfolio.available_balance)
                .add(portfolio.locked_balance)
                .add(portfolio.total_pnl)
                .add(portfolio.realized_pnl)
                .add(portfolio.unrealized_pnl)
                .add(portfolio.daily_pnl)
                .add(portfolio.total_trades)
                .add(portfolio.winning_trades)
                .add(portfolio.losing_trades)
                .add(portfolio.win_rate)
                .add(portfolio.average_win)
                .add(portfolio.average_loss)
                .add(portfolio.profit_factor)
                .add(portfolio.current_drawdown)
                .add(portfolio.max_drawdown)
                .add(portfolio.open_positions)
                .add(portfolio.total_exposure)
                .add(portfolio.max_position_size_pct)
                .add(portfolio.max_daily_loss_pct)
                .add(portfolio.is_trading_enabled)
                .add(portfolio.created_at)
                .add(portfolio.updated_at);
        }

        // "?, ?, ..." with n placeholders
        std::string placeholders(int n)
        {
            std::string result;
            for (int i = 0; i < n; ++i)
            {
                result += (i == 0) ? "?" : ", ?";
            }
            return result;
        }

        const char *kSignalUpdateSet =
            "pair_id = ?, signal_type = ?, confidence = ?, entry_price = ?, target_price = ?, "
            "stop_loss_price = ?, trend_strength = ?, volatility = ?, volume_profile = ?, support_level = ?, "
            "resistance_level = ?, strategy_type = ?, position_size_pct = ?, time_horizon_minutes = ?, "
            "created_at = ?, expires_at = ?, is_active = ?";

        const char *kOrderUpdateSet =
            "exchange_order_id = ?, pair_id = ?, signal_id = ?, role = ?, side = ?, kind = ?, amount = ?, "
            "price = ?, status = ?, filled_amount = ?, average_fill_price = ?, fee = ?, parent_order_id = ?, "
            "stop_loss_order_id = ?, take_profit_order_id = ?, created_at = ?, updated_at = ?, filled_at = ?";

        const char *kPositionUpdateSet =
            "pair_id = ?, entry_order_id = ?, signal_id = ?, side = ?, amount = ?, remaining_amount = ?, "
            "entry_price = ?, current_price = ?, realized_pnl = ?, unrealized_pnl = ?, total_fees = ?, "
            "stop_loss_price = ?, take_profit_price = ?, trailing_stop_distance = ?, state = ?, is_open = ?, "
            "close_order_id = ?, max_unrealized_pnl = ?, max_unrealized_loss = ?, strategy_type = ?, "
            "opened_at = ?, updated_at = ?, closed_at = ?";

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        // Serialized mode: the scheduler and the per-pair refresh tasks share this connection
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!connected_)
        {
            return;
        }
        auto logger = core::logging::getLogger();
        logger->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            logger->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->info("Initializing SQLite database schema if needed...");

        const std::string create_pairs_sql = R"(
        CREATE TABLE IF NOT EXISTS trading_pairs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            symbol TEXT NOT NULL UNIQUE,
            base_asset TEXT NOT NULL,
            quote_asset TEXT NOT NULL,
            display_name TEXT,
            price_precision INTEGER NOT NULL DEFAULT 2,
            volume_precision INTEGER NOT NULL DEFAULT 8,
            min_order_size REAL NOT NULL DEFAULT 0,
            is_active INTEGER NOT NULL DEFAULT 1
        );
    )";

        // Indicator columns are NULL until a snapshot is computed for the bar
        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS price_bars (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            pair_id INTEGER NOT NULL REFERENCES trading_pairs(id),
            timestamp TEXT NOT NULL,
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL NOT NULL,
            has_indicators INTEGER NOT NULL DEFAULT 0,
            rsi_14 REAL,
            macd REAL,
            macd_signal REAL,
            macd_histogram REAL,
            bb_upper REAL,
            bb_middle REAL,
            bb_lower REAL,
            sma_20 REAL,
            sma_50 REAL,
            ema_12 REAL,
            ema_26 REAL,
            UNIQUE (pair_id, timestamp)
        );
    )";

        const std::string create_signals_sql = R"(
        CREATE TABLE IF NOT EXISTS trading_signals (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            pair_id INTEGER NOT NULL REFERENCES trading_pairs(id),
            signal_type TEXT NOT NULL,
            confidence REAL NOT NULL,
            entry_price REAL NOT NULL,
            target_price REAL NOT NULL,
            stop_loss_price REAL NOT NULL,
            trend_strength REAL,
            volatility REAL,
            volume_profile TEXT,
            support_level REAL,
            resistance_level REAL,
            strategy_type TEXT,
            position_size_pct REAL,
            time_horizon_minutes INTEGER,
            created_at TEXT NOT NULL,
            expires_at TEXT NOT NULL,
            is_active INTEGER NOT NULL DEFAULT 1
        );
    )";

        const std::string create_orders_sql = R"(
        CREATE TABLE IF NOT EXISTS orders (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            exchange_order_id TEXT UNIQUE,
            pair_id INTEGER NOT NULL REFERENCES trading_pairs(id),
            signal_id INTEGER REFERENCES trading_signals(id),
            role TEXT NOT NULL,
            side TEXT NOT NULL,
            kind TEXT NOT NULL,
            amount REAL NOT NULL,
            price REAL,
            status TEXT NOT NULL,
            filled_amount REAL NOT NULL DEFAULT 0,
            average_fill_price REAL,
            fee REAL NOT NULL DEFAULT 0,
            parent_order_id INTEGER REFERENCES orders(id),
            stop_loss_order_id INTEGER,
            take_profit_order_id INTEGER,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            filled_at TEXT
        );
    )";

        const std::string create_positions_sql = R"(
        CREATE TABLE IF NOT EXISTS positions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            pair_id INTEGER NOT NULL REFERENCES trading_pairs(id),
            entry_order_id INTEGER NOT NULL REFERENCES orders(id),
            signal_id INTEGER REFERENCES trading_signals(id),
            side TEXT NOT NULL,
            amount REAL NOT NULL,
            remaining_amount REAL NOT NULL,
            entry_price REAL NOT NULL,
            current_price REAL,
            realized_pnl REAL NOT NULL DEFAULT 0,
            unrealized_pnl REAL NOT NULL DEFAULT 0,
            total_fees REAL NOT NULL DEFAULT 0,
            stop_loss_price REAL NOT NULL,
            take_profit_price REAL NOT NULL,
            trailing_stop_distance REAL,
            state TEXT NOT NULL,
            is_open INTEGER NOT NULL DEFAULT 1,
            close_order_id INTEGER,
            max_unrealized_pnl REAL NOT NULL DEFAULT 0,
            max_unrealized_loss REAL NOT NULL DEFAULT 0,
            strategy_type TEXT,
            opened_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            closed_at TEXT
        );
    )";

        const std::string create_portfolio_sql = R"(
        CREATE TABLE IF NOT EXISTS portfolio (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            total_balance REAL NOT NULL DEFAULT 0,
            available_balance REAL NOT NULL DEFAULT 0,
            locked_balance REAL NOT NULL DEFAULT 0,
            total_pnl REAL NOT NULL DEFAULT 0,
            realized_pnl REAL NOT NULL DEFAULT 0,
            unrealized_pnl REAL NOT NULL DEFAULT 0,
            daily_pnl REAL NOT NULL DEFAULT 0,
            total_trades INTEGER NOT NULL DEFAULT 0,
            winning_trades INTEGER NOT NULL DEFAULT 0,
            losing_trades INTEGER NOT NULL DEFAULT 0,
            win_rate REAL NOT NULL DEFAULT 0,
            average_win REAL NOT NULL DEFAULT 0,
            average_loss REAL NOT NULL DEFAULT 0,
            profit_factor REAL NOT NULL DEFAULT 0,
            current_drawdown REAL NOT NULL DEFAULT 0,
            max_drawdown REAL NOT NULL DEFAULT 0,
            open_positions INTEGER NOT NULL DEFAULT 0,
            total_exposure REAL NOT NULL DEFAULT 0,
            max_position_size_pct REAL NOT NULL DEFAULT 5.0,
            max_daily_loss_pct REAL NOT NULL DEFAULT 2.0,
            is_trading_enabled INTEGER NOT NULL DEFAULT 1,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
    )";

        const std::string create_indexes_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_bars_pair_time ON price_bars (pair_id, timestamp);
        CREATE INDEX IF NOT EXISTS idx_orders_status ON orders (status, role);
        CREATE INDEX IF NOT EXISTS idx_orders_parent ON orders (parent_order_id);
        CREATE INDEX IF NOT EXISTS idx_positions_open ON positions (is_open, state);
        CREATE INDEX IF NOT EXISTS idx_positions_entry ON positions (entry_order_id);
    )";

        bool success = true;
        success &= executeSQL(create_pairs_sql);
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_signals_sql);
        success &= executeSQL(create_orders_sql);
        success &= executeSQL(create_positions_sql);
        success &= executeSQL(create_portfolio_sql);
        success &= executeSQL(create_indexes_sql);

        if (success)
        {
            logger->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::Error DatabaseManager::storageError(const std::string &context) const
    {
        std::string message = db_ ? fmt::format("{}: {}", context, sqlite3_errmsg(db_))
                                  : fmt::format("{}: not connected", context);
        core::logging::getLogger()->error("SQLite storage error: {}", message);
        return core::makeError(core::ErrorKind::Storage, message);
    }

    // --- Pairs ---

    core::Result<long long> DatabaseManager::upsertPair(const core::TradingPair &pair)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("upsertPair");

        const char *sql = R"(
            INSERT INTO trading_pairs
            (symbol, base_asset, quote_asset, display_name, price_precision, volume_precision, min_order_size, is_active)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(symbol) DO UPDATE SET
                base_asset = excluded.base_asset,
                quote_asset = excluded.quote_asset,
                display_name = excluded.display_name,
                price_precision = excluded.price_precision,
                volume_precision = excluded.volume_precision,
                min_order_size = excluded.min_order_size,
                is_active = excluded.is_active;
        )";
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare pair upsert");
        }
        Statement stmt(raw);
        Binder(stmt.get())
            .add(pair.symbol)
            .add(pair.base_asset)
            .add(pair.quote_asset)
            .add(pair.display_name)
            .add(pair.price_precision)
            .add(pair.volume_precision)
            .add(pair.min_order_size)
            .add(pair.is_active);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError(fmt::format("Failed to upsert pair {}", pair.symbol));
        }

        raw = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT id FROM trading_pairs WHERE symbol = ?;", -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare pair id lookup");
        }
        Statement lookup(raw);
        Binder(lookup.get()).add(pair.symbol);
        if (sqlite3_step(lookup.get()) != SQLITE_ROW)
        {
            return storageError(fmt::format("Pair {} missing after upsert", pair.symbol));
        }
        long long id = sqlite3_column_int64(lookup.get(), 0);
        core::logging::getLogger()->debug("Trading pair {} stored with id {}.", pair.symbol, id);
        return id;
    }

    core::Result<std::vector<core::TradingPair>> DatabaseManager::getPairs(bool active_only)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("getPairs");

        std::string sql = fmt::format("SELECT {} FROM trading_pairs{} ORDER BY id;", kPairColumns,
                                      active_only ? " WHERE is_active = 1" : "");
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare pair query");
        }
        Statement stmt(raw);

        std::vector<core::TradingPair> pairs;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            RowReader row(stmt.get());
            pairs.push_back(readPair(row));
        }
        if (rc != SQLITE_DONE)
        {
            return storageError("Error stepping through pair rows");
        }
        return pairs;
    }

    // --- Bars and snapshots ---

    core::Result<int> DatabaseManager::insertBars(long long pair_id, const core::TimeSeries<core::PriceBar> &bars)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected())
            return storageError("insertBars");
        if (bars.empty())
        {
            return 0;
        }

        const char *sql = R"(
            INSERT OR IGNORE INTO price_bars
            (pair_id, timestamp, open, high, low, close, volume)
            VALUES (?, ?, ?, ?, ?, ?, ?);
        )";
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare bar insert");
        }
        Statement stmt(raw);

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            return storageError("Failed to begin transaction for saving bars");
        }

        int saved_count = 0;
        for (const auto &bar : bars)
        {
            Binder(stmt.get())
                .add(pair_id)
                .add(bar.timestamp)
                .add(bar.open)
                .add(bar.high)
                .add(bar.low)
                .add(bar.close)
                .add(bar.volume);

            if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            {
                core::Error error = storageError("Failed to insert bar");
                stmt.reset();
                executeSQL("ROLLBACK;");
                return error;
            }
            // Ignored duplicates report no change
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
        }
        stmt.reset();

        if (!executeSQL("COMMIT;"))
        {
            core::Error error = storageError("Failed to commit bars");
            executeSQL("ROLLBACK;");
            return error;
        }
        logger->debug("Saved {} new bars (of {}, duplicates ignored) for pair {}.", saved_count, bars.size(), pair_id);
        return saved_count;
    }

    core::Result<core::TimeSeries<core::PriceBar>> DatabaseManager::latestBars(long long pair_id, int count)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("latestBars");

        const char *sql = R"(
            SELECT pair_id, timestamp, open, high, low, close, volume FROM (
                SELECT pair_id, timestamp, open, high, low, close, volume
                FROM price_bars
                WHERE pair_id = ?
                ORDER BY timestamp DESC
                LIMIT ?
            ) ORDER BY timestamp ASC;
        )";
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare bar query");
        }
        Statement stmt(raw);
        Binder(stmt.get()).add(pair_id).add(count);

        core::TimeSeries<core::PriceBar> bars;
        int rc;
        try
        {
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                RowReader row(stmt.get());
                core::PriceBar bar;
                bar.pair_id = row.int64();
                bar.timestamp = row.time();
                bar.open = row.real();
                bar.high = row.real();
                bar.low = row.real();
                bar.close = row.real();
                bar.volume = row.real();
                bars.push_back(bar);
            }
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt bar row: {}", e.what()));
        }
        if (rc != SQLITE_DONE)
        {
            return storageError("Error stepping through bar rows");
        }
        return bars;
    }

    core::Status DatabaseManager::saveSnapshot(long long pair_id, core::Timestamp bar_time,
                                               const core::IndicatorSnapshot &snapshot)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("saveSnapshot");

        const char *sql = R"(
            UPDATE price_bars SET
                has_indicators = 1, rsi_14 = ?, macd = ?, macd_signal = ?, macd_histogram = ?,
                bb_upper = ?, bb_middle = ?, bb_lower = ?, sma_20 = ?, sma_50 = ?, ema_12 = ?, ema_26 = ?
            WHERE pair_id = ? AND timestamp = ?;
        )";
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare snapshot update");
        }
        Statement stmt(raw);
        Binder(stmt.get())
            .add(snapshot.rsi_14)
            .add(snapshot.macd)
            .add(snapshot.macd_signal)
            .add(snapshot.macd_histogram)
            .add(snapshot.bb_upper)
            .add(snapshot.bb_middle)
            .add(snapshot.bb_lower)
            .add(snapshot.sma_20)
            .add(snapshot.sma_50)
            .add(snapshot.ema_12)
            .add(snapshot.ema_26)
            .add(pair_id)
            .add(bar_time);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError("Failed to store indicator snapshot");
        }
        if (sqlite3_changes(db_) == 0)
        {
            return core::makeError(core::ErrorKind::Storage,
                                   fmt::format("No bar at {} for pair {} to attach the snapshot to",
                                               core::utils::timestampToString(bar_time), pair_id));
        }
        return core::Status::success();
    }

    core::Result<std::optional<core::IndicatorSnapshot>> DatabaseManager::latestSnapshot(long long pair_id)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("latestSnapshot");

        std::string sql = fmt::format(
            "SELECT {} FROM price_bars WHERE pair_id = ? ORDER BY timestamp DESC LIMIT 1;", kSnapshotColumns);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare snapshot query");
        }
        Statement stmt(raw);
        Binder(stmt.get()).add(pair_id);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
        {
            return std::optional<core::IndicatorSnapshot>{};
        }
        if (rc != SQLITE_ROW)
        {
            return storageError("Error reading snapshot row");
        }
        RowReader row(stmt.get());
        return readSnapshot(row);
    }

    // --- Signals ---

    core::Result<long long> DatabaseManager::insertSignal(const core::TradingSignal &signal)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("insertSignal");

        std::string columns = std::string(kSignalColumns).substr(4); // without "id, "
        std::string sql = fmt::format("INSERT INTO trading_signals ({}) VALUES ({});", columns, placeholders(17));
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare signal insert");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindSignal(binder, signal);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError("Failed to insert signal");
        }
        return static_cast<long long>(sqlite3_last_insert_rowid(db_));
    }

    core::Status DatabaseManager::updateSignal(const core::TradingSignal &signal)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("updateSignal");

        std::string sql = fmt::format("UPDATE trading_signals SET {} WHERE id = ?;", kSignalUpdateSet);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare signal update");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindSignal(binder, signal);
        binder.add(signal.id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError(fmt::format("Failed to update signal {}", signal.id));
        }
        if (sqlite3_changes(db_) == 0)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Signal {} not found", signal.id));
        }
        return core::Status::success();
    }

    core::Result<core::TradingSignal> DatabaseManager::getSignal(long long id)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("getSignal");

        std::string sql = fmt::format("SELECT {} FROM trading_signals WHERE id = ?;", kSignalColumns);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare signal query");
        }
        Statement stmt(raw);
        Binder(stmt.get()).add(id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Signal {} not found", id));
        }
        try
        {
            RowReader row(stmt.get());
            return readSignal(row);
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt signal {}: {}", id, e.what()));
        }
    }

    // --- Orders ---

    core::Result<long long> DatabaseManager::insertOrder(const core::Order &order)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("insertOrder");

        std::string columns = std::string(kOrderColumns).substr(4);
        std::string sql = fmt::format("INSERT INTO orders ({}) VALUES ({});", columns, placeholders(18));
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare order insert");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindOrder(binder, order);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError("Failed to insert order");
        }
        return static_cast<long long>(sqlite3_last_insert_rowid(db_));
    }

    core::Status DatabaseManager::updateOrder(const core::Order &order)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("updateOrder");

        std::string sql = fmt::format("UPDATE orders SET {} WHERE id = ?;", kOrderUpdateSet);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare order update");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindOrder(binder, order);
        binder.add(order.id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError(fmt::format("Failed to update order {}", order.id));
        }
        if (sqlite3_changes(db_) == 0)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Order {} not found", order.id));
        }
        return core::Status::success();
    }

    core::Result<core::Order> DatabaseManager::getOrder(long long id)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("getOrder");

        std::string sql = fmt::format("SELECT {} FROM orders WHERE id = ?;", kOrderColumns);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare order query");
        }
        Statement stmt(raw);
        Binder(stmt.get()).add(id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Order {} not found", id));
        }
        try
        {
            RowReader row(stmt.get());
            return readOrder(row);
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt order {}: {}", id, e.what()));
        }
    }

    core::Result<std::vector<core::Order>> DatabaseManager::queryOrders(const OrderFilter &filter)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("queryOrders");

        std::string where = "1 = 1";
        if (filter.status) where += " AND status = ?";
        if (filter.role) where += " AND role = ?";
        if (filter.pair_id) where += " AND pair_id = ?";
        if (filter.parent_order_id) where += " AND parent_order_id = ?";
        if (filter.require_exchange_id) where += " AND exchange_order_id IS NOT NULL";

        std::string sql = fmt::format("SELECT {} FROM orders WHERE {} ORDER BY id;", kOrderColumns, where);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare order filter query");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        if (filter.status) binder.add(core::toString(*filter.status));
        if (filter.role) binder.add(core::toString(*filter.role));
        if (filter.pair_id) binder.add(*filter.pair_id);
        if (filter.parent_order_id) binder.add(*filter.parent_order_id);

        std::vector<core::Order> orders;
        int rc;
        try
        {
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                RowReader row(stmt.get());
                orders.push_back(readOrder(row));
            }
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt order row: {}", e.what()));
        }
        if (rc != SQLITE_DONE)
        {
            return storageError("Error stepping through order rows");
        }
        return orders;
    }

    // --- Positions ---

    core::Result<long long> DatabaseManager::insertPosition(const core::Position &position)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("insertPosition");

        std::string columns = std::string(kPositionColumns).substr(4);
        std::string sql = fmt::format("INSERT INTO positions ({}) VALUES ({});", columns, placeholders(23));
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare position insert");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindPosition(binder, position);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError("Failed to insert position");
        }
        return static_cast<long long>(sqlite3_last_insert_rowid(db_));
    }

    core::Status DatabaseManager::updatePosition(const core::Position &position)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("updatePosition");

        std::string sql = fmt::format("UPDATE positions SET {} WHERE id = ?;", kPositionUpdateSet);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare position update");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindPosition(binder, position);
        binder.add(position.id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError(fmt::format("Failed to update position {}", position.id));
        }
        if (sqlite3_changes(db_) == 0)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Position {} not found", position.id));
        }
        return core::Status::success();
    }

    core::Result<core::Position> DatabaseManager::getPosition(long long id)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("getPosition");

        std::string sql = fmt::format("SELECT {} FROM positions WHERE id = ?;", kPositionColumns);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare position query");
        }
        Statement stmt(raw);
        Binder(stmt.get()).add(id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Position {} not found", id));
        }
        try
        {
            RowReader row(stmt.get());
            return readPosition(row);
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt position {}: {}", id, e.what()));
        }
    }

    core::Result<std::vector<core::Position>> DatabaseManager::queryPositions(const PositionFilter &filter)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("queryPositions");

        std::string where = "1 = 1";
        if (filter.is_open) where += " AND is_open = ?";
        if (filter.state) where += " AND state = ?";
        if (filter.pair_id) where += " AND pair_id = ?";
        if (filter.entry_order_id) where += " AND entry_order_id = ?";

        std::string sql = fmt::format("SELECT {} FROM positions WHERE {} ORDER BY id;", kPositionColumns, where);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare position filter query");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        if (filter.is_open) binder.add(*filter.is_open);
        if (filter.state) binder.add(core::toString(*filter.state));
        if (filter.pair_id) binder.add(*filter.pair_id);
        if (filter.entry_order_id) binder.add(*filter.entry_order_id);

        std::vector<core::Position> positions;
        int rc;
        try
        {
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                RowReader row(stmt.get());
                positions.push_back(readPosition(row));
            }
        }
        catch (const std::exception &e)
        {
            return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt position row: {}", e.what()));
        }
        if (rc != SQLITE_DONE)
        {
            return storageError("Error stepping through position rows");
        }
        return positions;
    }

    // --- Portfolio ---

    core::Result<core::Portfolio> DatabaseManager::loadPortfolio()
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("loadPortfolio");

        std::string sql = fmt::format("SELECT {} FROM portfolio WHERE id = 1;", kPortfolioColumns);
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare portfolio query");
        }
        Statement stmt(raw);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            try
            {
                RowReader row(stmt.get());
                return readPortfolio(row);
            }
            catch (const std::exception &e)
            {
                return core::makeError(core::ErrorKind::Storage, fmt::format("Corrupt portfolio row: {}", e.what()));
            }
        }
        if (rc != SQLITE_DONE)
        {
            return storageError("Error reading portfolio row");
        }
        stmt.reset();

        core::Portfolio portfolio;
        portfolio.created_at = std::chrono::system_clock::now();
        portfolio.updated_at = portfolio.created_at;
        core::Status saved = savePortfolio(portfolio);
        if (!saved)
        {
            return saved.error();
        }
        core::logging::getLogger()->info("Created portfolio record with default limits.");
        return portfolio;
    }

    core::Status DatabaseManager::savePortfolio(const core::Portfolio &portfolio)
    {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        if (!isConnected())
            return storageError("savePortfolio");

        std::string columns = std::string(kPortfolioColumns).substr(4);
        std::string sql = fmt::format("INSERT OR REPLACE INTO portfolio (id, {}) VALUES (1, {});",
                                      columns, placeholders(23));
        sqlite3_stmt *raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return storageError("Failed to prepare portfolio save");
        }
        Statement stmt(raw);
        Binder binder(stmt.get());
        bindPortfolio(binder, portfolio);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            return storageError("Failed to save portfolio");
        }
        return core::Status::success();
    }

} // namespace data
