// Tests for the results table helpers and the text equity curve

#include <gtest/gtest.h>

#include "logging/logs/backtest_logs.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace ConfluenceScalper;
using ConfluenceScalper::Logging::BacktestLogs;
using TestHelpers::utc;

namespace {

std::vector<Core::EquityPoint> make_curve(const std::vector<double>& equities) {
    std::vector<Core::EquityPoint> curve;
    TimeUtils::TimePoint point_time = utc("2024-01-02T00:00:00Z");
    for (double equity : equities) {
        curve.emplace_back(point_time, equity);
        point_time += std::chrono::minutes(5);
    }
    return curve;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

TEST(BacktestLogsFormatTest, CurrencyPercentageAndRatio) {
    EXPECT_EQ(BacktestLogs::format_currency(10189.126), "$10189.13");
    EXPECT_EQ(BacktestLogs::format_currency(-107.25), "$-107.25");
    EXPECT_EQ(BacktestLogs::format_percentage(1.5), "1.50%");
    EXPECT_EQ(BacktestLogs::format_ratio(2.0), "2.00");
    EXPECT_EQ(BacktestLogs::format_ratio(std::numeric_limits<double>::infinity()), "inf");
}

TEST(EquityCurveRenderTest, LayoutHasLabelsAxisAndFooter) {
    std::vector<std::string> plot_lines = BacktestLogs::render_equity_curve(make_curve({10000.0, 10100.0, 9900.0, 10200.0}), 3, 4, 10);

    ASSERT_EQ(plot_lines.size(), 7u);
    EXPECT_EQ(plot_lines[0], "$   10200 ┐");
    for (size_t row_index = 1; row_index <= 4; ++row_index) {
        EXPECT_TRUE(starts_with(plot_lines[row_index], "          │ ")) << plot_lines[row_index];
    }
    EXPECT_TRUE(starts_with(plot_lines[5], "$    9900 └"));
    EXPECT_EQ(plot_lines[6], "          0    3 trades");
}

TEST(EquityCurveRenderTest, PeakAndTroughLandOnOuterRows) {
    std::vector<std::string> plot_lines = BacktestLogs::render_equity_curve(make_curve({9900.0, 10200.0}), 2, 3, 2);

    ASSERT_EQ(plot_lines.size(), 6u);
    // Column 0 is the trough, column 1 the peak
    EXPECT_EQ(plot_lines[1], "          │  █");
    EXPECT_EQ(plot_lines[2], "          │   ");
    EXPECT_EQ(plot_lines[3], "          │ █ ");
}

TEST(EquityCurveRenderTest, FlatCurveSitsOnTheBottomRow) {
    std::vector<std::string> plot_lines = BacktestLogs::render_equity_curve(make_curve({10000.0, 10000.0, 10000.0}), 0, 3, 3);

    ASSERT_EQ(plot_lines.size(), 6u);
    EXPECT_EQ(plot_lines[1], "          │    ");
    EXPECT_EQ(plot_lines[2], "          │    ");
    EXPECT_EQ(plot_lines[3], "          │ ███");
}

TEST(EquityCurveRenderTest, DegenerateInputsRenderNothing) {
    EXPECT_TRUE(BacktestLogs::render_equity_curve({}, 0, 10, 40).empty());
    EXPECT_TRUE(BacktestLogs::render_equity_curve(make_curve({10000.0}), 0, 1, 40).empty());
    EXPECT_TRUE(BacktestLogs::render_equity_curve(make_curve({10000.0}), 0, 10, 0).empty());
}
