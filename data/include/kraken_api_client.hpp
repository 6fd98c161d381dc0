#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <optional>
#include <nlohmann/json.hpp>

#include "exchange_client.hpp"
#include "rate_limiter.hpp"
#include "config.hpp"

namespace data {

class KrakenApiClient : public IExchangeClient {
public:
    KrakenApiClient(const core::ExchangeConfig& config, std::shared_ptr<RateLimiter> rate_limiter);

    core::Result<std::string> placeOrder(const OrderRequest& request) override;
    core::Status cancelOrder(const std::string& exchange_order_id) override;
    core::Result<std::map<std::string, OrderStatusReport>> queryOrders(
        const std::vector<std::string>& exchange_order_ids) override;
    core::Result<std::map<std::string, double>> getTicker(const std::vector<std::string>& pair_symbols) override;
    core::Result<core::TimeSeries<core::PriceBar>> getOHLC(const std::string& pair_symbol,
                                                          int interval_minutes) override;
    core::Result<std::map<std::string, double>> getBalances() override;
    core::Result<std::map<std::string, AssetPairInfo>> getAssetPairs(
        const std::vector<std::string>& pair_symbols) override;

    // --- Wire helpers (pure, exposed for tests) ---

    // API-Sign header: base64(HMAC-SHA512(base64decode(secret), path + SHA256(nonce + post_data)))
    static std::string sign(const std::string& url_path,
                            const std::string& nonce,
                            const std::string& post_data,
                            const std::string& secret_base64);

    // Checks the {"error": [...], "result": ...} envelope and returns "result"
    static core::Result<nlohmann::json> parseEnvelope(const std::string& body);

    // One entry of a QueryOrders result
    static OrderStatusReport parseOrderStatus(const nlohmann::json& order);

    // Rows of an OHLC result: [time, open, high, low, close, vwap, volume, count]
    static core::TimeSeries<core::PriceBar> parseOHLCRows(const nlohmann::json& rows);

    // QueryOrders accepts at most this many txids per call
    static constexpr std::size_t kMaxOrderIdsPerQuery = 50;

    // Splits ids into consecutive batches of at most batch_size, order preserved
    static std::vector<std::vector<std::string>> batchOrderIds(const std::vector<std::string>& ids,
                                                               std::size_t batch_size);

    // Fixed 8 decimals with trailing zeros removed, e.g. 37500 -> "37500", 1.25 -> "1.25"
    static std::string formatDecimal(double value);

private:
    using FormParams = std::vector<std::pair<std::string, std::string>>;

    core::Result<nlohmann::json> publicGet(const std::string& method, const FormParams& params);
    core::Result<nlohmann::json> privatePost(const std::string& method, const FormParams& params);

    // Maps a result key (e.g. "XXBTZUSD") back to one of the requested symbols (e.g. "XBTUSD")
    std::optional<std::string> resolveSymbol(const std::string& result_key,
                                             const std::vector<std::string>& requested) const;

    core::ExchangeConfig config_;
    std::shared_ptr<RateLimiter> rate_limiter_;

    mutable std::mutex alias_mutex_;
    std::map<std::string, std::string> symbol_aliases_; // Exchange pair name -> alternate name
};

} // namespace data
