#include "kraken_api_client.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>
#include <spdlog/fmt/fmt.h>

#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

#include <stdexcept>
#include <algorithm>
#include <chrono>

namespace data {

namespace {

    std::string base64Encode(const unsigned char* data, size_t length) {
        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new(BIO_s_mem());
        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        BIO_push(b64, mem);
        BIO_write(b64, data, static_cast<int>(length));
        BIO_flush(b64);

        BUF_MEM* buf;
        BIO_get_mem_ptr(mem, &buf);
        std::string result(buf->data, buf->length);

        BIO_free_all(b64);
        return result;
    }

    std::string base64Decode(const std::string& encoded) {
        std::string decoded(encoded.size(), '\0');
        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        BIO_push(b64, mem);
        int length = BIO_read(b64, decoded.data(), static_cast<int>(decoded.size()));
        BIO_free_all(b64);
        if (length < 0) {
            throw std::invalid_argument("Kraken private key is not valid base64.");
        }
        decoded.resize(static_cast<size_t>(length));
        return decoded;
    }

    // Kraken encodes most numbers as strings
    double toDouble(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stod(value.get<std::string>());
        }
        return value.get<double>();
    }

    std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& params) {
        std::string body;
        for (const auto& [key, value] : params) {
            if (!body.empty()) body += '&';
            body += key;
            body += '=';
            body += cpr::util::urlEncode(value);
        }
        return body;
    }

    std::string joinSymbols(const std::vector<std::string>& symbols) {
        std::string joined;
        for (const auto& symbol : symbols) {
            if (!joined.empty()) joined += ',';
            joined += symbol;
        }
        return joined;
    }

    core::Result<nlohmann::json> checkResponse(const cpr::Response& response, const std::string& method) {
        auto logger = core::logging::getLogger();
        logger->debug("Kraken {} response: status={}, body size={}", method, response.status_code, response.text.length());

        if (response.error) {
            return core::makeError(core::ErrorKind::Transport,
                fmt::format("Kraken {} request failed (CPR error {}): {}", method,
                            static_cast<int>(response.error.code), response.error.message));
        }
        if (response.status_code != 200) {
            return core::makeError(core::ErrorKind::Transport,
                fmt::format("Kraken {} returned HTTP {}: {}", method, response.status_code,
                            response.text.substr(0, 200)));
        }
        return KrakenApiClient::parseEnvelope(response.text);
    }

} // end anonymous namespace

KrakenApiClient::KrakenApiClient(const core::ExchangeConfig& config, std::shared_ptr<RateLimiter> rate_limiter)
    : config_(config),
      rate_limiter_(std::move(rate_limiter))
{
    if (!rate_limiter_) {
        throw std::invalid_argument("KrakenApiClient requires a rate limiter.");
    }
    if (config_.base_url.empty()) {
        throw std::invalid_argument("KrakenApiClient requires a base URL.");
    }
    auto logger = core::logging::getLogger();
    logger->debug("KrakenApiClient created for {}.", config_.base_url);
    if (config_.api_key.empty() || config_.private_key.empty()) {
        logger->warn("KrakenApiClient created without credentials: private endpoints will be rejected.");
    }
}

// --- Wire helpers ---

std::string KrakenApiClient::sign(const std::string& url_path,
                                  const std::string& nonce,
                                  const std::string& post_data,
                                  const std::string& secret_base64)
{
    std::string message = nonce + post_data;
    unsigned char sha256[EVP_MAX_MD_SIZE];
    unsigned int sha256_len = 0;
    EVP_Digest(message.data(), message.size(), sha256, &sha256_len, EVP_sha256(), nullptr);

    std::string hmac_input = url_path;
    hmac_input.append(reinterpret_cast<const char*>(sha256), sha256_len);

    std::string secret = base64Decode(secret_base64);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    HMAC(EVP_sha512(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(hmac_input.data()), hmac_input.size(),
         digest, &digest_len);

    return base64Encode(digest, digest_len);
}

core::Result<nlohmann::json> KrakenApiClient::parseEnvelope(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return core::makeError(core::ErrorKind::Transport,
                               fmt::format("Unparsable Kraken response: {}", e.what()));
    }

    if (response.contains("error") && response["error"].is_array() && !response["error"].empty()) {
        std::string errors;
        for (const auto& err : response["error"]) {
            if (!errors.empty()) errors += "; ";
            errors += err.is_string() ? err.get<std::string>() : err.dump();
        }
        return core::makeError(core::ErrorKind::ExchangeRejection, errors);
    }
    if (!response.contains("result")) {
        return core::makeError(core::ErrorKind::Transport, "Kraken response has no 'result' field.");
    }
    return response["result"];
}

OrderStatusReport KrakenApiClient::parseOrderStatus(const nlohmann::json& order) {
    OrderStatusReport report;
    report.status = core::orderStatusFromString(order.at("status").get<std::string>());
    report.filled_amount = order.contains("vol_exec") ? toDouble(order["vol_exec"]) : 0.0;
    report.fee = order.contains("fee") ? toDouble(order["fee"]) : 0.0;
    if (order.contains("price")) {
        double average = toDouble(order["price"]);
        if (average > 0.0) {
            report.average_price = average;
        }
    }
    return report;
}

core::TimeSeries<core::PriceBar> KrakenApiClient::parseOHLCRows(const nlohmann::json& rows) {
    core::TimeSeries<core::PriceBar> bars;
    if (!rows.is_array()) {
        throw std::invalid_argument("OHLC rows are not an array.");
    }
    bars.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() < 7) {
            core::logging::getLogger()->warn("Skipping malformed OHLC row: {}", row.dump());
            continue;
        }
        core::PriceBar bar;
        bar.timestamp = core::utils::fromUnixSeconds(toDouble(row[0]));
        bar.open = toDouble(row[1]);
        bar.high = toDouble(row[2]);
        bar.low = toDouble(row[3]);
        bar.close = toDouble(row[4]);
        bar.volume = toDouble(row[6]);
        bars.push_back(bar);
    }
    std::sort(bars.begin(), bars.end(),
              [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
    return bars;
}

std::string KrakenApiClient::formatDecimal(double value) {
    std::string text = fmt::format("{:.8f}", value);
    auto dot = text.find('.');
    if (dot != std::string::npos) {
        auto last = text.find_last_not_of('0');
        text.erase(last == dot ? dot : last + 1);
    }
    if (text == "-0") text = "0";
    return text;
}

// --- Transport ---

core::Result<nlohmann::json> KrakenApiClient::publicGet(const std::string& method, const FormParams& params) {
    std::string full_url = fmt::format("{}/{}/public/{}", config_.base_url, config_.api_version, method);
    cpr::Parameters parameters;
    for (const auto& [key, value] : params) {
        parameters.Add({key, value});
    }

    rate_limiter_->acquire();
    core::logging::getLogger()->debug("Requesting Kraken URL: {}", full_url);
    cpr::Response response = cpr::Get(cpr::Url{full_url},
                                      parameters,
                                      cpr::Header{{"Accept", "application/json"}},
                                      cpr::Timeout{std::chrono::milliseconds(config_.request_timeout_ms)});
    return checkResponse(response, method);
}

core::Result<nlohmann::json> KrakenApiClient::privatePost(const std::string& method, const FormParams& params) {
    if (config_.api_key.empty() || config_.private_key.empty()) {
        return core::makeError(core::ErrorKind::Validation,
                               fmt::format("Kraken {} requires API credentials.", method));
    }

    std::string url_path = fmt::format("/{}/private/{}", config_.api_version, method);

    rate_limiter_->acquire();
    // Nonce taken after the rate limiter so concurrent callers still send increasing nonces
    std::string nonce = std::to_string(core::utils::nextNonce());
    FormParams form;
    form.emplace_back("nonce", nonce);
    form.insert(form.end(), params.begin(), params.end());
    std::string post_data = encodeForm(form);

    std::string signature;
    try {
        signature = sign(url_path, nonce, post_data, config_.private_key);
    } catch (const std::invalid_argument& e) {
        return core::makeError(core::ErrorKind::Validation, e.what());
    }

    cpr::Header headers = {
        {"API-Key", config_.api_key},
        {"API-Sign", signature},
        {"Content-Type", "application/x-www-form-urlencoded; charset=utf-8"}
    };

    core::logging::getLogger()->debug("Posting Kraken private method: {}", method);
    cpr::Response response = cpr::Post(cpr::Url{config_.base_url + url_path},
                                       headers,
                                       cpr::Body{post_data},
                                       cpr::Timeout{std::chrono::milliseconds(config_.request_timeout_ms)});
    return checkResponse(response, method);
}

std::optional<std::string> KrakenApiClient::resolveSymbol(const std::string& result_key,
                                                          const std::vector<std::string>& requested) const
{
    if (std::find(requested.begin(), requested.end(), result_key) != requested.end()) {
        return result_key;
    }
    {
        std::lock_guard<std::mutex> lock(alias_mutex_);
        auto it = symbol_aliases_.find(result_key);
        if (it != symbol_aliases_.end() &&
            std::find(requested.begin(), requested.end(), it->second) != requested.end()) {
            return it->second;
        }
    }
    // A single requested pair can only be the one the exchange answered for
    if (requested.size() == 1) {
        return requested.front();
    }
    return std::nullopt;
}

// --- IExchangeClient ---

core::Result<std::string> KrakenApiClient::placeOrder(const OrderRequest& request) {
    if (request.amount <= 0.0) {
        return core::makeError(core::ErrorKind::Validation,
                               fmt::format("Order amount must be positive, got {}", request.amount));
    }
    if (request.kind != core::OrderKind::Market && !request.price) {
        return core::makeError(core::ErrorKind::Validation,
                               fmt::format("{} order requires a price.", core::toString(request.kind)));
    }

    FormParams params = {
        {"pair", request.pair_symbol},
        {"type", core::toString(request.side)},
        {"ordertype", core::toString(request.kind)},
        {"volume", formatDecimal(request.amount)}
    };
    if (request.kind != core::OrderKind::Market) {
        params.emplace_back("price", formatDecimal(*request.price));
    }

    auto result = privatePost("AddOrder", params);
    if (!result) {
        return result.error();
    }
    const auto& body = result.value();
    if (!body.contains("txid") || !body["txid"].is_array() || body["txid"].empty()) {
        return core::makeError(core::ErrorKind::Transport, "AddOrder response carries no txid.");
    }
    std::string txid = body["txid"][0].get<std::string>();
    core::logging::getLogger()->info("Kraken accepted {} {} {} {} -> {}",
                                     core::toString(request.kind), core::toString(request.side),
                                     formatDecimal(request.amount), request.pair_symbol, txid);
    return txid;
}

core::Status KrakenApiClient::cancelOrder(const std::string& exchange_order_id) {
    auto result = privatePost("CancelOrder", {{"txid", exchange_order_id}});
    if (!result) {
        return result.error();
    }
    core::logging::getLogger()->info("Kraken cancel acknowledged for {}", exchange_order_id);
    return core::Status::success();
}

core::Result<std::map<std::string, OrderStatusReport>> KrakenApiClient::queryOrders(
    const std::vector<std::string>& exchange_order_ids)
{
    std::map<std::string, OrderStatusReport> reports;
    if (exchange_order_ids.empty()) {
        return reports;
    }

    for (const auto& batch : batchOrderIds(exchange_order_ids, kMaxOrderIdsPerQuery)) {
        auto result = privatePost("QueryOrders", {{"txid", joinSymbols(batch)}});
        if (!result) {
            return result.error();
        }
        try {
            for (const auto& [txid, order] : result.value().items()) {
                reports[txid] = parseOrderStatus(order);
            }
        } catch (const std::exception& e) {
            return core::makeError(core::ErrorKind::Transport,
                                   fmt::format("Malformed QueryOrders response: {}", e.what()));
        }
    }
    return reports;
}

std::vector<std::vector<std::string>> KrakenApiClient::batchOrderIds(const std::vector<std::string>& ids,
                                                                    std::size_t batch_size)
{
    std::vector<std::vector<std::string>> batches;
    if (batch_size == 0) {
        batch_size = ids.size();
    }
    for (std::size_t start = 0; start < ids.size(); start += batch_size) {
        const std::size_t end = std::min(ids.size(), start + batch_size);
        batches.emplace_back(ids.begin() + start, ids.begin() + end);
    }
    return batches;
}

core::Result<std::map<std::string, double>> KrakenApiClient::getTicker(const std::vector<std::string>& pair_symbols) {
    std::map<std::string, double> prices;
    if (pair_symbols.empty()) {
        return prices;
    }

    auto result = publicGet("Ticker", {{"pair", joinSymbols(pair_symbols)}});
    if (!result) {
        return result.error();
    }
    auto logger = core::logging::getLogger();
    try {
        for (const auto& [key, ticker] : result.value().items()) {
            auto symbol = resolveSymbol(key, pair_symbols);
            if (!symbol) {
                logger->warn("Ticker returned unrecognized pair '{}'; skipped.", key);
                continue;
            }
            prices[*symbol] = toDouble(ticker.at("c").at(0));
        }
    } catch (const std::exception& e) {
        return core::makeError(core::ErrorKind::Transport,
                               fmt::format("Malformed Ticker response: {}", e.what()));
    }
    return prices;
}

core::Result<core::TimeSeries<core::PriceBar>> KrakenApiClient::getOHLC(const std::string& pair_symbol,
                                                                       int interval_minutes)
{
    auto result = publicGet("OHLC", {{"pair", pair_symbol}, {"interval", std::to_string(interval_minutes)}});
    if (!result) {
        return result.error();
    }
    try {
        for (const auto& [key, rows] : result.value().items()) {
            if (key == "last") continue;
            auto bars = parseOHLCRows(rows);
            core::logging::getLogger()->debug("Received {} OHLC bars for {}.", bars.size(), pair_symbol);
            return bars;
        }
    } catch (const std::exception& e) {
        return core::makeError(core::ErrorKind::Transport,
                               fmt::format("Malformed OHLC response for {}: {}", pair_symbol, e.what()));
    }
    return core::makeError(core::ErrorKind::Transport,
                           fmt::format("OHLC response for {} contains no bars.", pair_symbol));
}

core::Result<std::map<std::string, double>> KrakenApiClient::getBalances() {
    auto result = privatePost("Balance", {});
    if (!result) {
        return result.error();
    }
    std::map<std::string, double> balances;
    try {
        for (const auto& [asset, amount] : result.value().items()) {
            balances[asset] = toDouble(amount);
        }
    } catch (const std::exception& e) {
        return core::makeError(core::ErrorKind::Transport,
                               fmt::format("Malformed Balance response: {}", e.what()));
    }
    return balances;
}

core::Result<std::map<std::string, AssetPairInfo>> KrakenApiClient::getAssetPairs(
    const std::vector<std::string>& pair_symbols)
{
    std::map<std::string, AssetPairInfo> pairs;
    if (pair_symbols.empty()) {
        return pairs;
    }

    auto result = publicGet("AssetPairs", {{"pair", joinSymbols(pair_symbols)}});
    if (!result) {
        return result.error();
    }
    try {
        std::lock_guard<std::mutex> lock(alias_mutex_);
        for (const auto& [key, info] : result.value().items()) {
            std::string altname = info.value("altname", key);
            if (std::find(pair_symbols.begin(), pair_symbols.end(), altname) == pair_symbols.end()) {
                continue;
            }
            AssetPairInfo pair;
            pair.symbol = altname;
            pair.base_asset = info.value("base", std::string{});
            pair.quote_asset = info.value("quote", std::string{});
            pair.price_precision = info.value("pair_decimals", pair.price_precision);
            pair.volume_precision = info.value("lot_decimals", pair.volume_precision);
            if (info.contains("ordermin")) {
                pair.min_order_size = toDouble(info["ordermin"]);
            }
            pairs[altname] = pair;
            symbol_aliases_[key] = altname;
        }
    } catch (const std::exception& e) {
        return core::makeError(core::ErrorKind::Transport,
                               fmt::format("Malformed AssetPairs response: {}", e.what()));
    }
    return pairs;
}

} // namespace data
