// indicators_test.cpp - TA-Lib backed indicators, market structure helpers
// and the stored indicator snapshot
//
// Tests for:
//   - minimum windows (below them an indicator is unavailable, never zero)
//   - RSI range, Bollinger band ordering, MACD availability
//   - trend strength, volume regime, support/resistance
//   - the rising-series scenario on the full snapshot

#include <gtest/gtest.h>

#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "volatility_indicator.hpp"
#include "market_structure.hpp"
#include "snapshot.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

using test_support::flatSeries;
using test_support::hoursAfterBase;
using test_support::makeBar;
using test_support::risingSeries;
using test_support::zigZagUptrend;

namespace {

core::TimeSeries<core::PriceBar> countingSeries(int count) {
    core::TimeSeries<core::PriceBar> bars;
    for (int i = 0; i < count; ++i) {
        bars.push_back(makeBar(hoursAfterBase(i), static_cast<double>(i + 1)));
    }
    return bars;
}

}  // namespace

// ===========================================================================
// Moving averages
// ===========================================================================

TEST(SmaIndicatorTest, AveragesTrailingCloses) {
    indicators::SmaIndicator sma(5);
    sma.calculate(countingSeries(10));

    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), 6u);
    EXPECT_DOUBLE_EQ(result.front(), 3.0);
    EXPECT_DOUBLE_EQ(result.back(), 8.0);
    EXPECT_EQ(sma.getName(), "SMA(5)");
}

TEST(SmaIndicatorTest, UnavailableBelowWindow) {
    indicators::SmaIndicator sma(20);
    sma.calculate(countingSeries(19));
    EXPECT_TRUE(sma.getResult().empty());
    EXPECT_FALSE(indicators::latestValue(sma).has_value());

    sma.calculate(countingSeries(20));
    ASSERT_EQ(sma.getResult().size(), 1u);
    EXPECT_DOUBLE_EQ(sma.getResult().front(), 10.5);
}

TEST(SmaIndicatorTest, RejectsNonPositivePeriod) {
    EXPECT_ANY_THROW(indicators::SmaIndicator(0));
}

TEST(EmaIndicatorTest, ConvergesOnFlatSeries) {
    indicators::EmaIndicator ema(12);
    ema.calculate(flatSeries(40, 250.0));
    ASSERT_FALSE(ema.getResult().empty());
    EXPECT_NEAR(ema.getResult().back(), 250.0, 1e-9);
}

// ===========================================================================
// RSI
// ===========================================================================

TEST(RsiIndicatorTest, NeedsPeriodPlusOneBars) {
    indicators::RsiIndicator rsi(14);
    rsi.calculate(risingSeries(14));
    EXPECT_TRUE(rsi.getResult().empty());

    rsi.calculate(risingSeries(15));
    EXPECT_EQ(rsi.getResult().size(), 1u);
}

TEST(RsiIndicatorTest, OnlyGainsReportsHundred) {
    indicators::RsiIndicator rsi(14);
    rsi.calculate(risingSeries(30));
    ASSERT_FALSE(rsi.getResult().empty());
    EXPECT_NEAR(rsi.getResult().back(), 100.0, 1e-9);
}

TEST(RsiIndicatorTest, StaysWithinBounds) {
    indicators::RsiIndicator rsi(14);
    rsi.calculate(zigZagUptrend(80));
    ASSERT_FALSE(rsi.getResult().empty());
    for (double value : rsi.getResult()) {
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 100.0);
    }
}

// ===========================================================================
// Bollinger and MACD
// ===========================================================================

TEST(BollingerIndicatorTest, BandsAreOrdered) {
    indicators::BollingerIndicator bands(20, 2.0);
    bands.calculate(zigZagUptrend(60));

    const auto& upper = bands.getUpperBand();
    const auto& middle = bands.getResult();
    const auto& lower = bands.getLowerBand();
    ASSERT_FALSE(middle.empty());
    ASSERT_EQ(upper.size(), middle.size());
    ASSERT_EQ(lower.size(), middle.size());
    for (size_t i = 0; i < middle.size(); ++i) {
        EXPECT_GE(upper[i], middle[i]);
        EXPECT_GE(middle[i], lower[i]);
    }
}

TEST(BollingerIndicatorTest, UnavailableBelowWindow) {
    indicators::BollingerIndicator bands(20, 2.0);
    bands.calculate(zigZagUptrend(19));
    EXPECT_TRUE(bands.getResult().empty());
    EXPECT_TRUE(bands.getUpperBand().empty());
}

TEST(MacdIndicatorTest, NeedsSlowPlusSignalWindow) {
    indicators::MacdIndicator macd(12, 26, 9);
    EXPECT_EQ(macd.getMinimumSamples(), 35);

    macd.calculate(risingSeries(34));
    EXPECT_TRUE(macd.getResult().empty());
    EXPECT_TRUE(macd.getHistogram().empty());

    macd.calculate(risingSeries(35));
    EXPECT_FALSE(macd.getResult().empty());
    EXPECT_EQ(macd.getSignalLine().size(), macd.getResult().size());
    EXPECT_EQ(macd.getHistogram().size(), macd.getResult().size());
}

TEST(MacdIndicatorTest, HistogramIsLineMinusSignal) {
    indicators::MacdIndicator macd;
    macd.calculate(zigZagUptrend(60));
    ASSERT_FALSE(macd.getHistogram().empty());
    double expected = macd.getResult().back() - macd.getSignalLine().back();
    EXPECT_NEAR(macd.getHistogram().back(), expected, 1e-9);
}

// ===========================================================================
// Volatility and market structure
// ===========================================================================

TEST(VolatilityIndicatorTest, FlatSeriesHasNoVolatility) {
    indicators::VolatilityIndicator volatility(20);
    volatility.calculate(flatSeries(30));
    ASSERT_FALSE(volatility.getResult().empty());
    EXPECT_NEAR(volatility.getResult().back(), 0.0, 1e-12);
}

TEST(VolatilityIndicatorTest, ChoppySeriesIsPositive) {
    indicators::VolatilityIndicator volatility(20);
    volatility.calculate(zigZagUptrend(40));
    ASSERT_FALSE(volatility.getResult().empty());
    EXPECT_GT(volatility.getResult().back(), 0.0);
}

TEST(MarketStructureTest, TrendStrength) {
    EXPECT_DOUBLE_EQ(indicators::trendStrength(risingSeries(10), 20), 0.0);
    EXPECT_NEAR(indicators::trendStrength(flatSeries(30), 20), 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(indicators::trendStrength(risingSeries(30), 20), 1.0);
}

TEST(MarketStructureTest, VolumeRegime) {
    auto bars = flatSeries(20);
    EXPECT_EQ(indicators::volumeRegime(bars, 20), core::VolumeRegime::Medium);

    bars.back().volume = 300.0;
    EXPECT_EQ(indicators::volumeRegime(bars, 20), core::VolumeRegime::High);

    bars.back().volume = 10.0;
    EXPECT_EQ(indicators::volumeRegime(bars, 20), core::VolumeRegime::Low);

    EXPECT_EQ(indicators::volumeRegime(flatSeries(5), 20), core::VolumeRegime::Unknown);
}

TEST(MarketStructureTest, SupportResistanceFromWindowExtremes) {
    auto levels = indicators::supportResistance(flatSeries(25, 100.0), 20);
    ASSERT_TRUE(levels.has_value());
    EXPECT_NEAR(levels->support, 99.9, 1e-9);
    EXPECT_NEAR(levels->resistance, 100.1, 1e-9);

    EXPECT_FALSE(indicators::supportResistance(flatSeries(10), 20).has_value());
}

// ===========================================================================
// Snapshot
// ===========================================================================

TEST(IndicatorSnapshotTest, UnavailableBelowFiftyBars) {
    EXPECT_FALSE(indicators::computeSnapshot(risingSeries(49)).has_value());

    auto snapshot = indicators::computeSnapshot(risingSeries(50));
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_TRUE(snapshot->rsi_14.has_value());
    EXPECT_TRUE(snapshot->macd_histogram.has_value());
    EXPECT_TRUE(snapshot->bb_lower.has_value());
    EXPECT_TRUE(snapshot->sma_50.has_value());
    EXPECT_TRUE(snapshot->ema_26.has_value());
}

TEST(IndicatorSnapshotTest, RisingSeriesScenario) {
    // 60 hourly bars, +1% per bar
    auto snapshot = indicators::computeSnapshot(risingSeries(60));
    ASSERT_TRUE(snapshot.has_value());

    EXPECT_GT(*snapshot->rsi_14, 70.0);
    EXPECT_GT(*snapshot->macd_histogram, 0.0);
    EXPECT_GT(*snapshot->sma_20, *snapshot->sma_50);
    EXPECT_GT(*snapshot->ema_12, *snapshot->ema_26);
    EXPECT_GE(*snapshot->bb_upper, *snapshot->bb_middle);
    EXPECT_GE(*snapshot->bb_middle, *snapshot->bb_lower);
}
