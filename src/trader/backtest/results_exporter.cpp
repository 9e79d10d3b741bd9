#include "results_exporter.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ConfluenceScalper {
namespace Backtest {

namespace {

json trade_to_json(const Core::ClosedTrade& trade) {
    json trade_json;
    trade_json["entry_time"] = TimeUtils::format_iso_utc(trade.entry_time);
    trade_json["exit_time"] = TimeUtils::format_iso_utc(trade.exit_time);
    trade_json["direction"] = Core::trade_direction_to_string(trade.direction);
    trade_json["entry_price"] = trade.entry_price;
    trade_json["exit_price"] = trade.exit_price;
    trade_json["stop_loss"] = trade.stop_loss;
    trade_json["take_profit"] = trade.take_profit;
    trade_json["initial_stop_loss"] = trade.initial_stop_loss;
    trade_json["units"] = trade.units;
    trade_json["pnl"] = trade.pnl;
    trade_json["close_reason"] = Core::close_reason_to_string(trade.close_reason);
    trade_json["r_multiple"] = trade.r_multiple;
    trade_json["confluence_score"] = trade.confluence_score;
    trade_json["atr"] = trade.atr;
    trade_json["equity_before"] = trade.equity_before;
    trade_json["reasons"] = trade.reasons;
    return trade_json;
}

Core::ClosedTrade trade_from_json(const json& trade_json) {
    Core::ClosedTrade trade;
    trade.entry_time = TimeUtils::parse_utc_timestamp(trade_json.at("entry_time").get<std::string>());
    trade.exit_time = TimeUtils::parse_utc_timestamp(trade_json.at("exit_time").get<std::string>());
    trade.direction = Core::parse_trade_direction(trade_json.at("direction").get<std::string>());
    trade.entry_price = trade_json.at("entry_price").get<double>();
    trade.exit_price = trade_json.at("exit_price").get<double>();
    trade.stop_loss = trade_json.at("stop_loss").get<double>();
    trade.take_profit = trade_json.at("take_profit").get<double>();
    trade.initial_stop_loss = trade_json.value("initial_stop_loss", trade.stop_loss);
    trade.units = trade_json.at("units").get<int>();
    trade.pnl = trade_json.at("pnl").get<double>();
    trade.close_reason = Core::parse_close_reason(trade_json.at("close_reason").get<std::string>());
    trade.r_multiple = trade_json.at("r_multiple").get<double>();
    trade.confluence_score = trade_json.value("confluence_score", 0);
    trade.atr = trade_json.value("atr", 0.0);
    trade.equity_before = trade_json.value("equity_before", 0.0);
    trade.reasons = trade_json.value("reasons", std::vector<std::string>());
    return trade;
}

json summary_to_json(const Core::PerformanceSummary& summary) {
    json summary_json;
    summary_json["total_return_pct"] = summary.total_return_pct;
    summary_json["annualized_return_pct"] = summary.annualized_return_pct;
    summary_json["max_drawdown_pct"] = summary.max_drawdown_pct;
    summary_json["sharpe_ratio"] = summary.sharpe_ratio;
    summary_json["sortino_ratio"] = summary.sortino_ratio;
    summary_json["win_rate_pct"] = summary.win_rate_pct;
    if (std::isfinite(summary.profit_factor)) {
        summary_json["profit_factor"] = summary.profit_factor;
    } else {
        summary_json["profit_factor"] = nullptr;
    }
    summary_json["total_trades"] = summary.total_trades;
    summary_json["winning_trades"] = summary.winning_trades;
    summary_json["losing_trades"] = summary.losing_trades;
    summary_json["avg_r_multiple"] = summary.avg_r_multiple;
    summary_json["expectancy"] = summary.expectancy;
    summary_json["initial_equity"] = summary.initial_equity;
    summary_json["final_equity"] = summary.final_equity;
    return summary_json;
}

Core::PerformanceSummary summary_from_json(const json& summary_json) {
    Core::PerformanceSummary summary;
    summary.total_return_pct = summary_json.at("total_return_pct").get<double>();
    summary.annualized_return_pct = summary_json.at("annualized_return_pct").get<double>();
    summary.max_drawdown_pct = summary_json.at("max_drawdown_pct").get<double>();
    summary.sharpe_ratio = summary_json.at("sharpe_ratio").get<double>();
    summary.sortino_ratio = summary_json.at("sortino_ratio").get<double>();
    summary.win_rate_pct = summary_json.at("win_rate_pct").get<double>();
    const json& profit_factor_json = summary_json.at("profit_factor");
    summary.profit_factor = profit_factor_json.is_null() ? std::numeric_limits<double>::infinity()
                                                         : profit_factor_json.get<double>();
    summary.total_trades = summary_json.at("total_trades").get<int>();
    summary.winning_trades = summary_json.at("winning_trades").get<int>();
    summary.losing_trades = summary_json.at("losing_trades").get<int>();
    summary.avg_r_multiple = summary_json.at("avg_r_multiple").get<double>();
    summary.expectancy = summary_json.at("expectancy").get<double>();
    summary.initial_equity = summary_json.at("initial_equity").get<double>();
    summary.final_equity = summary_json.at("final_equity").get<double>();
    return summary;
}

} // anonymous namespace

json results_to_json(const Core::BacktestResults& results) {
    json results_json;
    results_json["summary"] = summary_to_json(results.summary);

    json trades_json = json::array();
    for (const auto& trade : results.trades) {
        trades_json.push_back(trade_to_json(trade));
    }
    results_json["trades"] = trades_json;

    json curve_json = json::array();
    for (const auto& equity_point : results.equity_curve) {
        curve_json.push_back({{"time", TimeUtils::format_iso_utc(equity_point.time)}, {"equity", equity_point.equity}});
    }
    results_json["equity_curve"] = curve_json;
    return results_json;
}

Core::BacktestResults results_from_json(const json& results_json) {
    Core::BacktestResults results;
    results.summary = summary_from_json(results_json.at("summary"));
    for (const auto& trade_json : results_json.at("trades")) {
        results.trades.push_back(trade_from_json(trade_json));
    }
    for (const auto& point_json : results_json.at("equity_curve")) {
        results.equity_curve.emplace_back(TimeUtils::parse_utc_timestamp(point_json.at("time").get<std::string>()),
                                          point_json.at("equity").get<double>());
    }
    return results;
}

void save_results(const Core::BacktestResults& results, const std::string& output_path) {
    std::filesystem::path results_path(output_path);
    if (results_path.has_parent_path()) {
        std::filesystem::create_directories(results_path.parent_path());
    }

    std::ofstream results_file_stream(output_path);
    if (!results_file_stream.is_open()) {
        throw std::runtime_error("Failed to open results file for writing: " + output_path);
    }
    results_file_stream << results_to_json(results).dump(2) << std::endl;
    if (!results_file_stream) {
        throw std::runtime_error("Failed to write results file: " + output_path);
    }
}

Core::BacktestResults load_results(const std::string& input_path) {
    std::ifstream results_file_stream(input_path);
    if (!results_file_stream.is_open()) {
        throw std::runtime_error("Failed to open results file: " + input_path);
    }
    try {
        json results_json = json::parse(results_file_stream);
        return results_from_json(results_json);
    } catch (const json::exception& json_exception_error) {
        throw std::runtime_error("Invalid results JSON in " + input_path + ": " + json_exception_error.what());
    }
}

} // namespace Backtest
} // namespace ConfluenceScalper
