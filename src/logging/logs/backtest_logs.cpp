#include "backtest_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ConfluenceScalper {
namespace Logging {

namespace {
    constexpr const char* EQUITY_CURVE_MARK = "█";

    std::string join_reasons(const std::vector<std::string>& reasons) {
        std::string joined_reasons;
        for (size_t reason_index = 0; reason_index < reasons.size(); ++reason_index) {
            if (reason_index > 0) joined_reasons += " | ";
            joined_reasons += reasons[reason_index];
        }
        return joined_reasons;
    }

    std::string pad_left(const std::string& text, size_t width) {
        return text.size() >= width ? text : std::string(width - text.size(), ' ') + text;
    }
}

std::string BacktestLogs::format_currency(double amount) {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

std::string BacktestLogs::format_percentage(double percentage) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << percentage << "%";
    return oss.str();
}

std::string BacktestLogs::format_ratio(double ratio) {
    if (std::isinf(ratio)) {
        return "inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << ratio;
    return oss.str();
}

void BacktestLogs::log_backtest_start(const Config::SystemConfig& config, size_t bar_count, const std::string& data_source) {
    LOG_BACKTEST_BANNER(config.strategy.symbol);
    TABLE_HEADER_48("BACKTEST", "Walk-forward replay configuration");
    TABLE_ROW_48("Data Source", data_source);
    TABLE_ROW_48("Bars", std::to_string(bar_count));
    TABLE_ROW_48("Timeframes", "M" + std::to_string(config.strategy.base_bar_minutes) + " signal / M" +
                                std::to_string(config.strategy.higher_timeframe_minutes) + " trend");
    TABLE_ROW_48("Warm-up Bars", std::to_string(config.backtest.warmup_bars));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Initial Equity", format_currency(config.backtest.initial_equity));
    TABLE_ROW_48("Spread", format_currency(config.backtest.spread));
    TABLE_ROW_48("Commission", format_currency(config.backtest.commission));
    TABLE_ROW_48("Session (UTC)", std::to_string(config.session.session_start_hour_utc) + ":00 - " +
                                   std::to_string(config.session.session_end_hour_utc) + ":00");
    TABLE_ROW_48("Trailing Stop", config.backtest.apply_trailing_stop ? "ON" : "OFF");
    TABLE_FOOTER_48();
}

void BacktestLogs::log_trade_opened(const Core::OpenPosition& position) {
    std::ostringstream oss;
    oss << "OPEN  " << Core::trade_direction_to_string(position.direction)
        << " " << position.units << " @ " << format_currency(position.entry_price)
        << " | SL: " << format_currency(position.stop_loss)
        << " | TP: " << format_currency(position.take_profit)
        << " | Score " << position.confluence_score
        << " | " << TimeUtils::format_iso_utc(position.entry_time);
    LOG_THREAD_CONTENT(oss.str());
    if (!position.reasons.empty()) {
        LOG_THREAD_SUBCONTENT(join_reasons(position.reasons));
    }
}

void BacktestLogs::log_trade_closed(const Core::ClosedTrade& trade, double equity_after) {
    std::ostringstream oss;
    oss << "CLOSE " << Core::trade_direction_to_string(trade.direction)
        << " @ " << format_currency(trade.exit_price)
        << " (" << Core::close_reason_to_string(trade.close_reason) << ")"
        << " | P/L: " << format_currency(trade.pnl)
        << " | R: " << format_ratio(trade.r_multiple)
        << " | Equity: " << format_currency(equity_after)
        << " | " << TimeUtils::format_iso_utc(trade.exit_time);
    LOG_THREAD_CONTENT(oss.str());
}

void BacktestLogs::log_results_saved(const std::string& results_path) {
    LOG_THREAD_CONTENT("Results saved to " + results_path);
}

void BacktestLogs::log_backtest_error(const std::string& error_message) {
    LOG_THREAD_SECTION_HEADER("BACKTEST FAILED");
    LOG_THREAD_CONTENT(error_message);
    LOG_THREAD_SECTION_FOOTER();
}

void BacktestLogs::log_performance_summary(const Core::PerformanceSummary& summary) {
    TABLE_HEADER_48("RESULTS", "Backtest results summary");
    TABLE_ROW_48("Initial Equity", format_currency(summary.initial_equity));
    TABLE_ROW_48("Final Equity", format_currency(summary.final_equity));
    TABLE_ROW_48("Total Return", format_percentage(summary.total_return_pct));
    TABLE_ROW_48("Annual Return", format_percentage(summary.annualized_return_pct));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Total Trades", std::to_string(summary.total_trades) + " (" + std::to_string(summary.winning_trades) +
                                  "W / " + std::to_string(summary.losing_trades) + "L)");
    TABLE_ROW_48("Win Rate", format_percentage(summary.win_rate_pct));
    TABLE_ROW_48("Profit Factor", format_ratio(summary.profit_factor));
    TABLE_ROW_48("Avg R Achieved", format_ratio(summary.avg_r_multiple));
    TABLE_ROW_48("Expectancy/Trade", format_currency(summary.expectancy));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Max Drawdown", format_percentage(summary.max_drawdown_pct));
    TABLE_ROW_48("Sharpe Ratio", format_ratio(summary.sharpe_ratio));
    TABLE_ROW_48("Sortino Ratio", format_ratio(summary.sortino_ratio));
    TABLE_FOOTER_48();
}

std::vector<std::string> BacktestLogs::render_equity_curve(const std::vector<Core::EquityPoint>& equity_curve,
                                                           int total_trades, int rows, int columns) {
    std::vector<std::string> plot_lines;
    if (equity_curve.empty() || rows < 2 || columns < 1) {
        return plot_lines;
    }

    double min_equity = equity_curve.front().equity;
    double max_equity = equity_curve.front().equity;
    for (const auto& equity_point : equity_curve) {
        min_equity = std::min(min_equity, equity_point.equity);
        max_equity = std::max(max_equity, equity_point.equity);
    }
    double equity_range = max_equity - min_equity;
    if (equity_range == 0.0) {
        equity_range = 1.0;
    }

    size_t sample_step = std::max<size_t>(1, equity_curve.size() / static_cast<size_t>(columns));
    std::vector<std::vector<bool>> marked_cells(static_cast<size_t>(rows), std::vector<bool>(static_cast<size_t>(columns), false));
    for (int column_index = 0; column_index < columns; ++column_index) {
        size_t sample_index = std::min(static_cast<size_t>(column_index) * sample_step, equity_curve.size() - 1);
        double normalised_value = (equity_curve[sample_index].equity - min_equity) / equity_range;
        int row_index = rows - 1 - static_cast<int>(std::lround(normalised_value * (rows - 1)));
        if (row_index >= 0 && row_index < rows) {
            marked_cells[static_cast<size_t>(row_index)][static_cast<size_t>(column_index)] = true;
        }
    }

    std::ostringstream max_label;
    max_label << std::fixed << std::setprecision(0) << max_equity;
    std::ostringstream min_label;
    min_label << std::fixed << std::setprecision(0) << min_equity;

    plot_lines.push_back("$" + pad_left(max_label.str(), 8) + " ┐");
    for (const auto& row_cells : marked_cells) {
        std::string row_line = "          │ ";
        for (bool is_marked : row_cells) {
            row_line += is_marked ? EQUITY_CURVE_MARK : " ";
        }
        plot_lines.push_back(row_line);
    }
    std::string axis_line = "$" + pad_left(min_label.str(), 8) + " └";
    for (int column_index = 0; column_index < columns; ++column_index) {
        axis_line += "─";
    }
    plot_lines.push_back(axis_line);
    plot_lines.push_back("          0" + std::string(static_cast<size_t>(std::max(columns - 6, 1)), ' ') +
                         std::to_string(total_trades) + " trades");
    return plot_lines;
}

void BacktestLogs::log_equity_curve(const std::vector<Core::EquityPoint>& equity_curve, int total_trades, int rows, int columns) {
    LOG_THREAD_SECTION_HEADER("EQUITY CURVE");
    for (const auto& plot_line : render_equity_curve(equity_curve, total_trades, rows, columns)) {
        LOG_THREAD_CONTENT(plot_line);
    }
    LOG_THREAD_SECTION_FOOTER();
}

} // namespace Logging
} // namespace ConfluenceScalper
