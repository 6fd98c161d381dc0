#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "datatypes.hpp"
#include "result.hpp"

namespace data {

    struct OrderRequest {
        std::string pair_symbol;
        core::OrderSide side = core::OrderSide::Buy;
        core::OrderKind kind = core::OrderKind::Limit;
        double amount = 0.0;
        std::optional<double> price; // Limit price or stop trigger; absent for market orders
    };

    // Exchange-side view of one order
    struct OrderStatusReport {
        core::OrderStatus status = core::OrderStatus::Pending;
        double filled_amount = 0.0;
        std::optional<double> average_price;
        double fee = 0.0;
    };

    // Trading rules published by the exchange for a pair
    struct AssetPairInfo {
        std::string symbol;       // Alternate name, e.g. "XBTUSD"
        std::string base_asset;
        std::string quote_asset;
        int price_precision = 2;
        int volume_precision = 8;
        double min_order_size = 0.0;
    };

    // Exchange capability consumed by the trading pipeline. Every call may
    // fail with ErrorKind::Transport or ErrorKind::ExchangeRejection.
    class IExchangeClient {
    public:
        virtual ~IExchangeClient() = default;

        // Returns the exchange order id
        virtual core::Result<std::string> placeOrder(const OrderRequest& request) = 0;

        virtual core::Status cancelOrder(const std::string& exchange_order_id) = 0;

        // Keyed by exchange order id. Unknown ids are absent from the map.
        virtual core::Result<std::map<std::string, OrderStatusReport>> queryOrders(
            const std::vector<std::string>& exchange_order_ids) = 0;

        // Last trade price keyed by pair symbol
        virtual core::Result<std::map<std::string, double>> getTicker(const std::vector<std::string>& pair_symbols) = 0;

        // Oldest first
        virtual core::Result<core::TimeSeries<core::PriceBar>> getOHLC(const std::string& pair_symbol,
                                                                      int interval_minutes) = 0;

        // Asset code -> amount
        virtual core::Result<std::map<std::string, double>> getBalances() = 0;

        // Keyed by the requested symbols; symbols unknown to the exchange are absent
        virtual core::Result<std::map<std::string, AssetPairInfo>> getAssetPairs(
            const std::vector<std::string>& pair_symbols) = 0;
    };

} // namespace data
