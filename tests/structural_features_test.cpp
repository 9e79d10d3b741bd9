// Tests for swing confirmation, trend classification and RSI divergence

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "trader/strategy_analysis/structural_features.hpp"

#include <stdexcept>
#include <vector>

using namespace ConfluenceScalper::Core;
using TestHelpers::make_bar;
using TestHelpers::utc;

namespace {

std::vector<Bar> make_bars_from_ranges(const std::vector<double>& highs, const std::vector<double>& lows) {
    std::vector<Bar> bars;
    TimePoint start = utc("2024-03-04T08:00:00Z");
    for (size_t bar_index = 0; bar_index < highs.size(); ++bar_index) {
        double mid_price = (highs[bar_index] + lows[bar_index]) / 2.0;
        bars.push_back(make_bar(start + std::chrono::minutes(5 * bar_index), mid_price, highs[bar_index], lows[bar_index], mid_price));
    }
    return bars;
}

Bar make_rsi_bar(double close_price, double rsi) {
    Bar bar = make_bar(utc("2024-03-04T08:00:00Z"), close_price, close_price, close_price, close_price);
    bar.rsi = rsi;
    return bar;
}

} // anonymous namespace

// ===========================================================================
// Swing points
// ===========================================================================

class SwingPointTest : public ::testing::Test {
protected:
    std::vector<double> highs = {10.0, 11.0, 15.0, 11.0, 10.0, 10.5, 10.2};
    std::vector<double> lows = {9.0, 10.0, 14.0, 10.0, 9.0, 9.5, 9.2};
};

TEST_F(SwingPointTest, PivotIsWrittenOnTheConfirmingBar) {
    std::vector<Bar> bars = make_bars_from_ranges(highs, lows);
    detect_swing_points(bars, 2);

    EXPECT_FALSE(bars[2].confirmed_swing_high.has_value());
    ASSERT_TRUE(bars[4].confirmed_swing_high.has_value());
    EXPECT_DOUBLE_EQ(*bars[4].confirmed_swing_high, 15.0);
    ASSERT_TRUE(bars[6].confirmed_swing_low.has_value());
    EXPECT_DOUBLE_EQ(*bars[6].confirmed_swing_low, 9.0);
    EXPECT_FALSE(bars[5].confirmed_swing_high.has_value());
    EXPECT_FALSE(bars[5].confirmed_swing_low.has_value());
}

TEST_F(SwingPointTest, LastLevelsAreForwardFilled) {
    std::vector<Bar> bars = make_bars_from_ranges(highs, lows);
    detect_swing_points(bars, 2);

    for (size_t bar_index = 0; bar_index < 4; ++bar_index) {
        EXPECT_FALSE(bars[bar_index].last_swing_high.has_value()) << "bar " << bar_index;
    }
    for (size_t bar_index = 4; bar_index < bars.size(); ++bar_index) {
        ASSERT_TRUE(bars[bar_index].last_swing_high.has_value());
        EXPECT_DOUBLE_EQ(*bars[bar_index].last_swing_high, 15.0);
    }
    EXPECT_FALSE(bars[5].last_swing_low.has_value());
    ASSERT_TRUE(bars[6].last_swing_low.has_value());
    EXPECT_DOUBLE_EQ(*bars[6].last_swing_low, 9.0);
}

TEST_F(SwingPointTest, TruncatedSeriesCannotSeeUnconfirmedPivot) {
    std::vector<Bar> full_bars = make_bars_from_ranges(highs, lows);
    detect_swing_points(full_bars, 2);

    std::vector<Bar> truncated_bars(full_bars.begin(), full_bars.begin() + 4);
    detect_swing_points(truncated_bars, 2);

    for (size_t bar_index = 0; bar_index < truncated_bars.size(); ++bar_index) {
        EXPECT_EQ(truncated_bars[bar_index].confirmed_swing_high, full_bars[bar_index].confirmed_swing_high);
        EXPECT_EQ(truncated_bars[bar_index].last_swing_high, full_bars[bar_index].last_swing_high);
        EXPECT_EQ(truncated_bars[bar_index].last_swing_low, full_bars[bar_index].last_swing_low);
    }
}

TEST_F(SwingPointTest, WindowBelowOneThrows) {
    std::vector<Bar> bars = make_bars_from_ranges(highs, lows);
    EXPECT_THROW(detect_swing_points(bars, 0), std::invalid_argument);
}

// ===========================================================================
// Trend classification
// ===========================================================================

TEST(TrendClassificationTest, StackedAveragesDecideDirection) {
    Bar bar = make_bar(utc("2024-03-04T08:00:00Z"), 2350.0, 2351.0, 2349.0, 2350.0);
    bar.ema_fast = 2348.0;
    bar.ema_slow = 2345.0;
    bar.ema_trend = 2340.0;
    EXPECT_EQ(classify_trend(bar), TrendDirection::BULLISH);

    bar.ema_fast = 2332.0;
    bar.ema_slow = 2335.0;
    bar.ema_trend = 2340.0;
    bar.close_price = 2330.0;
    EXPECT_EQ(classify_trend(bar), TrendDirection::BEARISH);

    // Stacked bullish but closing below the trend average
    bar.ema_fast = 2348.0;
    bar.ema_slow = 2345.0;
    bar.ema_trend = 2340.0;
    bar.close_price = 2339.0;
    EXPECT_EQ(classify_trend(bar), TrendDirection::NEUTRAL);
}

TEST(TrendClassificationTest, MissingAverageIsNeutral) {
    Bar bar = make_bar(utc("2024-03-04T08:00:00Z"), 2350.0, 2351.0, 2349.0, 2350.0);
    bar.ema_fast = 2348.0;
    bar.ema_slow = 2345.0;
    EXPECT_EQ(classify_trend(bar), TrendDirection::NEUTRAL);

    std::vector<Bar> bars = {bar};
    bars[0].trend_direction = TrendDirection::BULLISH;
    apply_trend_direction(bars);
    EXPECT_EQ(bars[0].trend_direction, TrendDirection::NEUTRAL);
}

// ===========================================================================
// Divergence
// ===========================================================================

TEST(DivergenceTest, LowerLowWithHigherRsiIsBullish) {
    std::vector<Bar> bars = {make_rsi_bar(100.0, 30.0), make_rsi_bar(99.0, 25.0),
                             make_rsi_bar(98.0, 28.0), make_rsi_bar(98.5, 32.0)};
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 4), DivergenceType::BULLISH);
}

TEST(DivergenceTest, HigherHighWithLowerRsiIsBearish) {
    std::vector<Bar> bars = {make_rsi_bar(100.0, 70.0), make_rsi_bar(101.0, 75.0),
                             make_rsi_bar(102.0, 72.0), make_rsi_bar(101.5, 68.0)};
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 4), DivergenceType::BEARISH);
}

TEST(DivergenceTest, OnlyTheLookbackWindowIsScanned) {
    std::vector<Bar> bars = {make_rsi_bar(50.0, 10.0),
                             make_rsi_bar(100.0, 30.0), make_rsi_bar(99.0, 25.0),
                             make_rsi_bar(98.0, 28.0), make_rsi_bar(98.5, 32.0)};
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 4), DivergenceType::BULLISH);
}

TEST(DivergenceTest, DegenerateInputsAreNone) {
    std::vector<Bar> bars = {make_rsi_bar(100.0, 30.0), make_rsi_bar(99.0, 25.0),
                             make_rsi_bar(98.0, 28.0), make_rsi_bar(98.5, 32.0)};
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 1), DivergenceType::NONE);
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 6), DivergenceType::NONE);

    bars[0].rsi.reset();
    bars[1].rsi.reset();
    EXPECT_EQ(detect_divergence(BarSeriesView(bars), 4), DivergenceType::NONE);
}
