// Tests for the JSON results file

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "trader/backtest/results_exporter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using namespace ConfluenceScalper;
using namespace ConfluenceScalper::Backtest;
using TestHelpers::utc;

namespace {

Core::BacktestResults make_results() {
    Core::ClosedTrade trade;
    trade.entry_time = utc("2024-01-02T10:05:00Z");
    trade.exit_time = utc("2024-01-02T10:40:00Z");
    trade.direction = Core::TradeDirection::SHORT;
    trade.entry_price = 2339.875;
    trade.exit_price = 2336.4;
    trade.stop_loss = 2341.8;
    trade.take_profit = 2336.4;
    trade.initial_stop_loss = 2341.8;
    trade.units = 55;
    trade.pnl = 191.125;
    trade.close_reason = Core::CloseReason::TAKE_PROFIT;
    trade.r_multiple = 1.81;
    trade.confluence_score = 4;
    trade.atr = 1.2;
    trade.equity_before = 10000.0;
    trade.reasons = {"Higher timeframe trend bearish", "MACD bearish crossover"};

    Core::BacktestResults results;
    results.trades.push_back(trade);
    results.equity_curve.emplace_back(utc("2024-01-02T10:00:00Z"), 10000.0);
    results.equity_curve.emplace_back(utc("2024-01-02T10:40:00Z"), 10189.13);
    results.summary.total_trades = 1;
    results.summary.winning_trades = 1;
    results.summary.win_rate_pct = 100.0;
    results.summary.profit_factor = std::numeric_limits<double>::infinity();
    results.summary.initial_equity = 10000.0;
    results.summary.final_equity = 10189.13;
    results.summary.total_return_pct = 1.89;
    return results;
}

} // anonymous namespace

TEST(ResultsExporterTest, JsonLayout) {
    json results_json = results_to_json(make_results());

    ASSERT_TRUE(results_json.contains("summary"));
    EXPECT_TRUE(results_json["summary"]["profit_factor"].is_null());
    EXPECT_EQ(results_json["summary"]["total_trades"].get<int>(), 1);

    ASSERT_EQ(results_json["trades"].size(), 1u);
    const json& trade_json = results_json["trades"][0];
    EXPECT_EQ(trade_json["direction"].get<std::string>(), "SHORT");
    EXPECT_EQ(trade_json["close_reason"].get<std::string>(), "take_profit");
    EXPECT_EQ(trade_json["entry_time"].get<std::string>(), "2024-01-02T10:05:00Z");
    EXPECT_EQ(trade_json["reasons"].size(), 2u);

    ASSERT_EQ(results_json["equity_curve"].size(), 2u);
    EXPECT_EQ(results_json["equity_curve"][1]["time"].get<std::string>(), "2024-01-02T10:40:00Z");
    EXPECT_DOUBLE_EQ(results_json["equity_curve"][1]["equity"].get<double>(), 10189.13);
}

TEST(ResultsExporterTest, SavedFileLoadsBack) {
    std::filesystem::path output_path = std::filesystem::path(::testing::TempDir()) / "exporter_nested" / "results" / "run.json";
    std::filesystem::remove_all(output_path.parent_path().parent_path());

    Core::BacktestResults original = make_results();
    save_results(original, output_path.string());
    ASSERT_TRUE(std::filesystem::exists(output_path));

    Core::BacktestResults loaded = load_results(output_path.string());
    ASSERT_EQ(loaded.trades.size(), 1u);
    const Core::ClosedTrade& trade = loaded.trades[0];
    EXPECT_EQ(trade.entry_time, original.trades[0].entry_time);
    EXPECT_EQ(trade.direction, Core::TradeDirection::SHORT);
    EXPECT_EQ(trade.close_reason, Core::CloseReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(trade.entry_price, 2339.875);
    EXPECT_EQ(trade.units, 55);
    EXPECT_EQ(trade.reasons, original.trades[0].reasons);

    ASSERT_EQ(loaded.equity_curve.size(), 2u);
    EXPECT_EQ(loaded.equity_curve[1].time, original.equity_curve[1].time);
    EXPECT_TRUE(std::isinf(loaded.summary.profit_factor));
    EXPECT_DOUBLE_EQ(loaded.summary.final_equity, 10189.13);
}

TEST(ResultsExporterTest, LoadFailuresAreRuntimeErrors) {
    EXPECT_THROW(load_results("/nonexistent/results.json"), std::runtime_error);

    std::filesystem::path broken_path = std::filesystem::path(::testing::TempDir()) / "broken_results.json";
    {
        std::ofstream broken_stream(broken_path);
        broken_stream << "{\"summary\": {\"total_trades\": ";
    }
    EXPECT_THROW(load_results(broken_path.string()), std::runtime_error);

    std::filesystem::path incomplete_path = std::filesystem::path(::testing::TempDir()) / "incomplete_results.json";
    {
        std::ofstream incomplete_stream(incomplete_path);
        incomplete_stream << "{\"trades\": []}";
    }
    EXPECT_THROW(load_results(incomplete_path.string()), std::runtime_error);
}
