// Tests for the CSV trade journal

#include <gtest/gtest.h>

#include "logging/logger/csv_trade_logger.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace ConfluenceScalper;
using ConfluenceScalper::Logging::CSVTradeLogger;
using TestHelpers::utc;

namespace {

const char* const JOURNAL_HEADER = "timestamp_open,timestamp_close,direction,entry,stop_loss,take_profit,exit_price,units,"
                                   "pnl_usd,pnl_pct,rr_achieved,reason_open,reason_close,score,atr,equity_before";

std::vector<std::string> read_lines(const std::string& file_path) {
    std::ifstream file_stream(file_path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file_stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

Core::ClosedTrade make_winning_trade() {
    Core::ClosedTrade trade;
    trade.entry_time = utc("2024-01-02T00:35:00Z");
    trade.exit_time = utc("2024-01-02T00:40:00Z");
    trade.direction = Core::TradeDirection::LONG;
    trade.entry_price = 2340.25;
    trade.stop_loss = 2339.5;
    trade.initial_stop_loss = 2338.5;
    trade.take_profit = 2343.75;
    trade.exit_price = 2343.75;
    trade.units = 10;
    trade.pnl = 35.0;
    trade.close_reason = Core::CloseReason::TAKE_PROFIT;
    trade.r_multiple = 2.0;
    trade.confluence_score = 3;
    trade.atr = 1.2;
    trade.equity_before = 10000.0;
    trade.reasons = {"Trend bullish, aligned", "MACD bullish crossover"};
    return trade;
}

std::string journal_path(const std::string& file_name) {
    std::filesystem::path file_path = std::filesystem::path(::testing::TempDir()) / file_name;
    std::filesystem::remove(file_path);
    return file_path.string();
}

} // anonymous namespace

TEST(CsvTradeLoggerTest, WritesHeaderAndRow) {
    std::string file_path = journal_path("journal_row.csv");
    {
        CSVTradeLogger trade_logger(file_path);
        EXPECT_TRUE(trade_logger.is_valid());
        EXPECT_EQ(trade_logger.get_file_path(), file_path);
        trade_logger.log_closed_trade(make_winning_trade());
    }

    std::vector<std::string> lines = read_lines(file_path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], JOURNAL_HEADER);
    EXPECT_EQ(lines[1], "2024-01-02T00:35:00Z,2024-01-02T00:40:00Z,LONG,2340.25,2338.50,2343.75,2343.75,10,35.00,0.350,2.00,"
                        "\"Trend bullish, aligned; MACD bullish crossover\",take_profit,3,1.200,10000.00");
}

TEST(CsvTradeLoggerTest, HeaderIsWrittenOnlyOnce) {
    std::string file_path = journal_path("journal_append.csv");
    {
        CSVTradeLogger trade_logger(file_path);
        trade_logger.log_closed_trade(make_winning_trade());
    }
    {
        CSVTradeLogger trade_logger(file_path);
        trade_logger.log_closed_trade(make_winning_trade());
    }

    std::vector<std::string> lines = read_lines(file_path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], JOURNAL_HEADER);
    EXPECT_NE(lines[2], JOURNAL_HEADER);
}

TEST(CsvTradeLoggerTest, MovedFromLoggerIsInvalid) {
    std::string file_path = journal_path("journal_move.csv");
    CSVTradeLogger original_logger(file_path);
    CSVTradeLogger moved_logger(std::move(original_logger));

    EXPECT_TRUE(moved_logger.is_valid());
    EXPECT_FALSE(original_logger.is_valid());
    EXPECT_THROW(original_logger.log_closed_trade(make_winning_trade()), std::runtime_error);
}

TEST(CsvTradeLoggerTest, UnwritablePathThrows) {
    EXPECT_THROW(CSVTradeLogger("/nonexistent/directory/trades.csv"), std::runtime_error);
}
