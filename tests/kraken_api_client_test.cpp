// kraken_api_client_test.cpp - Kraken wire helpers and request validation
//
// No test here reaches the network: private calls are rejected for missing
// credentials and invalid orders before any request is sent.

#include <gtest/gtest.h>

#include "kraken_api_client.hpp"
#include "rate_limiter.hpp"
#include "utils.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::shared_ptr<data::RateLimiter> noLimit() {
    return std::make_shared<data::RateLimiter>(std::chrono::milliseconds(0));
}

core::ExchangeConfig offlineConfig() {
    core::ExchangeConfig config;
    config.base_url = "http://127.0.0.1:9";
    config.request_timeout_ms = 200;
    return config;
}

}  // namespace

// ===========================================================================
// Signing
// ===========================================================================

TEST(KrakenSignTest, MatchesPublishedVector) {
    const std::string secret =
        "kQH5HW/8p1uGOVjbgWA7FunAmGO8lsSUXNsu3eow76sz84Q18fWxnyRzBHCd3pd5nE9qa99HAZtuZuj6F1huXg==";
    const std::string nonce = "1616492376594";
    const std::string post_data =
        "nonce=1616492376594&ordertype=limit&pair=XBTUSD&price=37500&type=buy&volume=1.25";

    std::string signature = data::KrakenApiClient::sign("/0/private/AddOrder", nonce, post_data, secret);
    EXPECT_EQ(signature,
              "4/dpxb3iT4tp/ZCVEwSnEsLxx0bqyhLpdfOpc6fn7OR8+UClSV5n9E6aSS8MPtnRfp32bAb0nmbRn6H8ndwLUQ==");
}

TEST(KrakenSignTest, DependsOnNonce) {
    const std::string secret = "dGVzdC1zZWNyZXQ=";
    auto first = data::KrakenApiClient::sign("/0/private/Balance", "1", "nonce=1", secret);
    auto second = data::KrakenApiClient::sign("/0/private/Balance", "2", "nonce=2", secret);
    EXPECT_NE(first, second);
    EXPECT_EQ(first.size(), 88u); // base64 of a 64-byte digest
}

// ===========================================================================
// Response parsing
// ===========================================================================

TEST(KrakenEnvelopeTest, ReturnsResultOnEmptyErrorList) {
    auto result = data::KrakenApiClient::parseEnvelope(R"({"error": [], "result": {"txid": ["OABC-1"]}})");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value()["txid"][0], "OABC-1");
}

TEST(KrakenEnvelopeTest, ErrorListIsExchangeRejection) {
    auto result = data::KrakenApiClient::parseEnvelope(
        R"({"error": ["EOrder:Insufficient funds", "EGeneral:Invalid arguments"]})");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, core::ErrorKind::ExchangeRejection);
    EXPECT_EQ(result.error().message, "EOrder:Insufficient funds; EGeneral:Invalid arguments");
}

TEST(KrakenEnvelopeTest, GarbageAndMissingResultAreTransportErrors) {
    auto garbage = data::KrakenApiClient::parseEnvelope("<html>502 Bad Gateway</html>");
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error().kind, core::ErrorKind::Transport);

    auto empty = data::KrakenApiClient::parseEnvelope(R"({"error": []})");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().kind, core::ErrorKind::Transport);
}

TEST(KrakenParseTest, OrderStatusReadsStringNumbers) {
    json order = {{"status", "closed"}, {"vol_exec", "1.00000000"}, {"price", "100.5"}, {"fee", "0.16080"}};
    data::OrderStatusReport report = data::KrakenApiClient::parseOrderStatus(order);
    EXPECT_EQ(report.status, core::OrderStatus::Closed);
    EXPECT_DOUBLE_EQ(report.filled_amount, 1.0);
    ASSERT_TRUE(report.average_price.has_value());
    EXPECT_DOUBLE_EQ(*report.average_price, 100.5);
    EXPECT_DOUBLE_EQ(report.fee, 0.1608);
}

TEST(KrakenParseTest, UnfilledOrderHasNoAveragePrice) {
    json order = {{"status", "open"}, {"vol_exec", "0.00000000"}, {"price", "0.00000"}};
    data::OrderStatusReport report = data::KrakenApiClient::parseOrderStatus(order);
    EXPECT_EQ(report.status, core::OrderStatus::Open);
    EXPECT_DOUBLE_EQ(report.filled_amount, 0.0);
    EXPECT_FALSE(report.average_price.has_value());
    EXPECT_DOUBLE_EQ(report.fee, 0.0);
}

TEST(KrakenParseTest, OHLCRowsAreSortedAndMalformedRowsSkipped) {
    json rows = json::array({
        json::array({1709254800, "101.0", "102.0", "100.0", "101.5", "101.2", "7.5", 12}),
        json::array({1709251200, "100.0", "101.0", "99.0", "100.5", "100.2", "12.5", 42}),
        json::array({1709258400, "oops"})
    });
    auto bars = data::KrakenApiClient::parseOHLCRows(rows);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(core::utils::toUnixSeconds(bars[0].timestamp), 1709251200LL);
    EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bars[0].high, 101.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 99.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 100.5);
    EXPECT_DOUBLE_EQ(bars[0].volume, 12.5);
    EXPECT_DOUBLE_EQ(bars[1].close, 101.5);

    EXPECT_THROW(data::KrakenApiClient::parseOHLCRows(json::object()), std::invalid_argument);
}

TEST(KrakenParseTest, FormatDecimalTrimsZeros) {
    EXPECT_EQ(data::KrakenApiClient::formatDecimal(37500.0), "37500");
    EXPECT_EQ(data::KrakenApiClient::formatDecimal(1.25), "1.25");
    EXPECT_EQ(data::KrakenApiClient::formatDecimal(0.00012345), "0.00012345");
    EXPECT_EQ(data::KrakenApiClient::formatDecimal(0.0), "0");
    EXPECT_EQ(data::KrakenApiClient::formatDecimal(-0.000000001), "0");
}

TEST(KrakenParseTest, OrderIdsSplitIntoQueryBatches) {
    std::vector<std::string> ids;
    for (int i = 0; i < 120; ++i) {
        ids.push_back("O" + std::to_string(i));
    }

    auto batches = data::KrakenApiClient::batchOrderIds(ids, data::KrakenApiClient::kMaxOrderIdsPerQuery);
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].size(), 50u);
    EXPECT_EQ(batches[1].size(), 50u);
    EXPECT_EQ(batches[2].size(), 20u);
    EXPECT_EQ(batches[0].front(), "O0");
    EXPECT_EQ(batches[1].front(), "O50");
    EXPECT_EQ(batches[2].back(), "O119");

    std::vector<std::string> exact(ids.begin(), ids.begin() + 50);
    EXPECT_EQ(data::KrakenApiClient::batchOrderIds(exact, 50).size(), 1u);
    EXPECT_EQ(data::KrakenApiClient::batchOrderIds({"A", "B", "C"}, 50).size(), 1u);
    EXPECT_TRUE(data::KrakenApiClient::batchOrderIds({}, 50).empty());
}

// ===========================================================================
// Request validation
// ===========================================================================

TEST(KrakenClientTest, ConstructorRequiresLimiterAndUrl) {
    EXPECT_THROW(data::KrakenApiClient(offlineConfig(), nullptr), std::invalid_argument);

    core::ExchangeConfig no_url = offlineConfig();
    no_url.base_url.clear();
    EXPECT_THROW(data::KrakenApiClient(no_url, noLimit()), std::invalid_argument);
}

TEST(KrakenClientTest, PrivateCallsWithoutCredentialsAreRejected) {
    data::KrakenApiClient client(offlineConfig(), noLimit());

    auto balances = client.getBalances();
    ASSERT_FALSE(balances.ok());
    EXPECT_EQ(balances.error().kind, core::ErrorKind::Validation);

    auto cancel = client.cancelOrder("OABC-1");
    ASSERT_FALSE(cancel.ok());
    EXPECT_EQ(cancel.error().kind, core::ErrorKind::Validation);

    data::OrderRequest request{"XBTUSD", core::OrderSide::Buy, core::OrderKind::Limit, 1.0, 100.0};
    auto placed = client.placeOrder(request);
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.error().kind, core::ErrorKind::Validation);
}

TEST(KrakenClientTest, InvalidOrdersRejectedBeforeSending) {
    core::ExchangeConfig config = offlineConfig();
    config.api_key = "key";
    config.private_key = "dGVzdC1zZWNyZXQ=";
    data::KrakenApiClient client(config, noLimit());

    data::OrderRequest zero{"XBTUSD", core::OrderSide::Buy, core::OrderKind::Market, 0.0, std::nullopt};
    auto zero_result = client.placeOrder(zero);
    ASSERT_FALSE(zero_result.ok());
    EXPECT_EQ(zero_result.error().kind, core::ErrorKind::Validation);

    data::OrderRequest unpriced{"XBTUSD", core::OrderSide::Sell, core::OrderKind::StopLoss, 1.0, std::nullopt};
    auto unpriced_result = client.placeOrder(unpriced);
    ASSERT_FALSE(unpriced_result.ok());
    EXPECT_EQ(unpriced_result.error().kind, core::ErrorKind::Validation);
}

TEST(KrakenClientTest, EmptyQueriesShortCircuit) {
    data::KrakenApiClient client(offlineConfig(), noLimit());

    auto orders = client.queryOrders({});
    ASSERT_TRUE(orders.ok());
    EXPECT_TRUE(orders.value().empty());

    auto tickers = client.getTicker({});
    ASSERT_TRUE(tickers.ok());
    EXPECT_TRUE(tickers.value().empty());

    auto pairs = client.getAssetPairs({});
    ASSERT_TRUE(pairs.ok());
    EXPECT_TRUE(pairs.value().empty());
}
