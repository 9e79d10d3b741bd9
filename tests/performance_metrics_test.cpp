// Tests for backtest summary statistics

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "trader/backtest/performance_metrics.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace ConfluenceScalper;
using namespace ConfluenceScalper::Backtest;
using Core::ClosedTrade;
using Core::EquityPoint;
using TestHelpers::utc;

namespace {

ClosedTrade make_trade(double pnl, double r_multiple) {
    ClosedTrade trade;
    trade.pnl = pnl;
    trade.r_multiple = r_multiple;
    return trade;
}

std::vector<EquityPoint> make_three_day_curve() {
    return {
        EquityPoint(utc("2024-01-01T12:00:00Z"), 10000.0),
        EquityPoint(utc("2024-01-02T12:00:00Z"), 10200.0),
        EquityPoint(utc("2024-01-03T12:00:00Z"), 10100.0),
    };
}

} // anonymous namespace

TEST(PerformanceSummaryTest, NoTradesKeepsOnlyEquity) {
    std::vector<EquityPoint> curve = make_three_day_curve();
    Core::PerformanceSummary summary = compute_performance_summary({}, curve, 10000.0, 10000.004);

    EXPECT_DOUBLE_EQ(summary.initial_equity, 10000.0);
    EXPECT_DOUBLE_EQ(summary.final_equity, 10000.0);
    EXPECT_EQ(summary.total_trades, 0);
    EXPECT_DOUBLE_EQ(summary.total_return_pct, 0.0);
    EXPECT_DOUBLE_EQ(summary.max_drawdown_pct, 0.0);
    EXPECT_DOUBLE_EQ(summary.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(summary.win_rate_pct, 0.0);
    EXPECT_DOUBLE_EQ(summary.profit_factor, 0.0);
}

TEST(PerformanceSummaryTest, MixedTradesOverThreeDays) {
    std::vector<ClosedTrade> trades = {make_trade(200.0, 2.0), make_trade(-100.0, -1.0)};
    Core::PerformanceSummary summary = compute_performance_summary(trades, make_three_day_curve(), 10000.0, 10100.0);

    EXPECT_EQ(summary.total_trades, 2);
    EXPECT_EQ(summary.winning_trades, 1);
    EXPECT_EQ(summary.losing_trades, 1);
    EXPECT_DOUBLE_EQ(summary.total_return_pct, 1.0);
    EXPECT_DOUBLE_EQ(summary.win_rate_pct, 50.0);
    EXPECT_DOUBLE_EQ(summary.profit_factor, 2.0);
    EXPECT_DOUBLE_EQ(summary.avg_r_multiple, 0.5);
    EXPECT_DOUBLE_EQ(summary.expectancy, 50.0);
    EXPECT_DOUBLE_EQ(summary.final_equity, 10100.0);
    EXPECT_NEAR(summary.max_drawdown_pct, 0.98, 1e-9);
    EXPECT_NEAR(summary.sharpe_ratio, 5.43, 1e-9);
    EXPECT_NEAR(summary.sortino_ratio, 8.25, 1e-9);
    // Two elapsed days compounded to a year
    EXPECT_NEAR(summary.annualized_return_pct, 515.45, 0.011);
}

TEST(PerformanceSummaryTest, ProfitFactorIsInfiniteWithoutLosses) {
    std::vector<ClosedTrade> trades = {make_trade(50.0, 0.5), make_trade(150.0, 1.5)};
    Core::PerformanceSummary summary = compute_performance_summary(trades, make_three_day_curve(), 10000.0, 10200.0);

    EXPECT_TRUE(std::isinf(summary.profit_factor));
    EXPECT_GT(summary.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(summary.win_rate_pct, 100.0);
}

TEST(PerformanceSummaryTest, BreakevenTradeCountsAsLoss) {
    std::vector<ClosedTrade> trades = {make_trade(100.0, 1.0), make_trade(0.0, 0.0)};
    Core::PerformanceSummary summary = compute_performance_summary(trades, make_three_day_curve(), 10000.0, 10100.0);

    EXPECT_EQ(summary.losing_trades, 1);
    // No money was lost, so the ratio is unbounded
    EXPECT_TRUE(std::isinf(summary.profit_factor));
}

TEST(MaxDrawdownTest, MeasuresFromTheRunningPeak) {
    std::vector<EquityPoint> curve = {
        EquityPoint(utc("2024-01-01T10:00:00Z"), 9500.0),
        EquityPoint(utc("2024-01-01T11:00:00Z"), 11000.0),
        EquityPoint(utc("2024-01-01T12:00:00Z"), 9900.0),
        EquityPoint(utc("2024-01-01T13:00:00Z"), 12000.0),
    };
    // 11000 -> 9900 is 10%, deeper than 10000 -> 9500
    EXPECT_NEAR(compute_max_drawdown_pct(curve, 10000.0), 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(compute_max_drawdown_pct({}, 10000.0), 0.0);
}

TEST(DailyReturnsTest, UsesLastEquityOfEachUtcDay) {
    std::vector<EquityPoint> curve = {
        EquityPoint(utc("2024-01-01T10:00:00Z"), 10000.0),
        EquityPoint(utc("2024-01-01T23:55:00Z"), 10100.0),
        EquityPoint(utc("2024-01-02T00:05:00Z"), 9000.0),
        EquityPoint(utc("2024-01-02T20:00:00Z"), 10201.0),
    };
    std::vector<double> daily_returns = compute_daily_returns(curve);
    ASSERT_EQ(daily_returns.size(), 1u);
    EXPECT_NEAR(daily_returns[0], 0.01, 1e-12);
}

TEST(RMultipleTest, PnlOverInitialRisk) {
    ClosedTrade trade;
    trade.entry_price = 2340.0;
    trade.initial_stop_loss = 2338.5;
    trade.units = 10;
    trade.pnl = 30.0;
    EXPECT_NEAR(compute_r_multiple(trade), 2.0, 1e-9);

    trade.initial_stop_loss = 2340.0;
    EXPECT_DOUBLE_EQ(compute_r_multiple(trade), 30.0);
}

TEST(RoundingTest, TwoDecimalsLeavesInfinityAlone) {
    EXPECT_DOUBLE_EQ(round_to_two_decimals(1.23456), 1.23);
    EXPECT_DOUBLE_EQ(round_to_two_decimals(-0.005001), -0.01);
    EXPECT_TRUE(std::isinf(round_to_two_decimals(std::numeric_limits<double>::infinity())));
}
