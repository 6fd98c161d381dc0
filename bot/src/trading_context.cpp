#include "trading_context.hpp"
#include "kraken_api_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace bot {

    namespace {

        std::unique_ptr<data::IExchangeClient> makeKrakenClient(const core::ExchangeConfig& config) {
            auto limiter = std::make_shared<data::RateLimiter>(
                std::chrono::milliseconds(config.min_request_interval_ms));
            return std::make_unique<data::KrakenApiClient>(config, std::move(limiter));
        }

    } // end anonymous namespace

    TradingContext::TradingContext(core::BotConfig config)
        : TradingContext(config, makeKrakenClient(config.exchange)) {}

    TradingContext::TradingContext(core::BotConfig config, std::unique_ptr<data::IExchangeClient> exchange)
        : config_(std::move(config)),
          exchange_(std::move(exchange))
    {
        auto logger = core::logging::getLogger();
        if (!exchange_) {
            throw std::invalid_argument("TradingContext requires an exchange client.");
        }

        store_ = std::make_unique<data::DatabaseManager>(config_.database.path);
        if (!store_->connect()) {
            throw core::DatabaseException(fmt::format("Cannot open database '{}'.", config_.database.path));
        }
        if (!store_->initializeSchema()) {
            throw core::DatabaseException(fmt::format("Cannot initialize schema in '{}'.", config_.database.path));
        }

        // Throws ConfigException on invalid strategy values
        generator_ = std::make_unique<strategy_engine::SignalGenerator>(
            strategy_engine::StrategyParameters::fromJson(config_.strategy));

        orders_ = std::make_unique<execution::BracketOrderManager>(*exchange_, *store_, locks_, config_.execution);
        accountant_ = std::make_unique<portfolio::PortfolioAccountant>(*store_, *exchange_, locks_);
        market_data_ = std::make_unique<MarketDataService>(*exchange_, *store_, config_.scheduler);
        scheduler_ = std::make_unique<CycleScheduler>(*market_data_, *generator_, *orders_, *accountant_, *store_,
                                                      config_.scheduler, config_.risk,
                                                      config_.exchange.quote_balance_asset);
        logger->info("Trading context ready ({} configured pairs, database '{}').",
                     config_.pairs.size(), config_.database.path);
    }

    std::vector<core::TradingPair> TradingContext::resolvePairs() {
        auto logger = core::logging::getLogger();
        std::vector<core::TradingPair> pairs = config_.pairs;

        std::vector<std::string> symbols;
        for (const auto& pair : pairs) {
            symbols.push_back(pair.symbol);
        }
        auto metadata = exchange_->getAssetPairs(symbols);
        if (!metadata) {
            logger->warn("Asset pair metadata unavailable, using configured values: {}",
                         metadata.error().describe());
            return pairs;
        }

        for (auto& pair : pairs) {
            auto it = metadata.value().find(pair.symbol);
            if (it == metadata.value().end()) {
                logger->warn("Exchange does not list pair '{}'; using configured values.", pair.symbol);
                continue;
            }
            const data::AssetPairInfo& info = it->second;
            if (pair.base_asset.empty()) pair.base_asset = info.base_asset;
            if (pair.quote_asset.empty()) pair.quote_asset = info.quote_asset;
            if (pair.display_name.empty()) pair.display_name = pair.base_asset + "/" + pair.quote_asset;
            pair.price_precision = info.price_precision;
            pair.volume_precision = info.volume_precision;
            pair.min_order_size = info.min_order_size;
        }
        return pairs;
    }

    void TradingContext::bootstrap() {
        auto logger = core::logging::getLogger();

        for (const auto& pair : resolvePairs()) {
            auto id = store_->upsertPair(pair);
            if (!id) {
                throw core::DatabaseException(fmt::format("Cannot store pair '{}': {}",
                                                          pair.symbol, id.error().describe()));
            }
            logger->info("Pair {} ({}) registered with id {}{}.", pair.symbol, pair.display_name, id.value(),
                         pair.is_active ? "" : " [inactive]");
        }

        int rebuilt = orders_->rebuildCorrelation();
        logger->info("Correlation cache rebuilt with {} pending entr{}.", rebuilt, rebuilt == 1 ? "y" : "ies");

        auto metrics = accountant_->recompute();
        if (!metrics) {
            logger->error("Initial portfolio recompute failed: {}", metrics.error().describe());
        }
        auto balance = accountant_->updateAccountBalance(config_.exchange.quote_balance_asset);
        if (!balance) {
            logger->warn("Initial balance update failed: {}", balance.error().describe());
        }
    }

} // namespace bot
