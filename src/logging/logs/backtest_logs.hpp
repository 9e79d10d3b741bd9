#ifndef BACKTEST_LOGS_HPP
#define BACKTEST_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace ConfluenceScalper {
namespace Logging {

class BacktestLogs {
public:
    // Replay lifecycle
    static void log_backtest_start(const Config::SystemConfig& config, size_t bar_count, const std::string& data_source);
    static void log_trade_opened(const Core::OpenPosition& position);
    static void log_trade_closed(const Core::ClosedTrade& trade, double equity_after);
    static void log_results_saved(const std::string& results_path);
    static void log_backtest_error(const std::string& error_message);

    // Results reporting
    static void log_performance_summary(const Core::PerformanceSummary& summary);
    static void log_equity_curve(const std::vector<Core::EquityPoint>& equity_curve, int total_trades, int rows, int columns);

    // Curve plot as text lines: max label, one line per row, min label with axis, footer
    static std::vector<std::string> render_equity_curve(const std::vector<Core::EquityPoint>& equity_curve,
                                                        int total_trades, int rows, int columns);

    static std::string format_currency(double amount);
    static std::string format_percentage(double percentage);
    static std::string format_ratio(double ratio);
};

} // namespace Logging
} // namespace ConfluenceScalper

#endif // BACKTEST_LOGS_HPP
