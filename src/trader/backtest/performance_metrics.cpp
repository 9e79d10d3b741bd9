#include "performance_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace ConfluenceScalper {
namespace Backtest {

double round_to_two_decimals(double value) {
    if (!std::isfinite(value)) {
        return value;
    }
    return std::round(value * 100.0) / 100.0;
}

double compute_max_drawdown_pct(const std::vector<Core::EquityPoint>& equity_curve, double initial_equity) {
    double peak_equity = initial_equity;
    double max_drawdown_pct = 0.0;
    for (const auto& equity_point : equity_curve) {
        peak_equity = std::max(peak_equity, equity_point.equity);
        if (peak_equity <= 0.0) {
            continue;
        }
        double drawdown_pct = (peak_equity - equity_point.equity) / peak_equity * 100.0;
        max_drawdown_pct = std::max(max_drawdown_pct, drawdown_pct);
    }
    return max_drawdown_pct;
}

std::vector<double> compute_daily_returns(const std::vector<Core::EquityPoint>& equity_curve) {
    std::map<long long, double> closing_equity_by_day;
    for (const auto& equity_point : equity_curve) {
        closing_equity_by_day[TimeUtils::utc_day_index(equity_point.time)] = equity_point.equity;
    }

    std::vector<double> daily_returns;
    double previous_equity = 0.0;
    bool has_previous = false;
    for (const auto& day_entry : closing_equity_by_day) {
        if (has_previous && previous_equity != 0.0) {
            daily_returns.push_back((day_entry.second - previous_equity) / previous_equity);
        }
        previous_equity = day_entry.second;
        has_previous = true;
    }
    return daily_returns;
}

double compute_r_multiple(const Core::ClosedTrade& trade) {
    double initial_risk = std::abs(trade.entry_price - trade.initial_stop_loss) * trade.units;
    if (!(initial_risk > 0.0)) {
        initial_risk = 1.0;
    }
    return trade.pnl / initial_risk;
}

Core::PerformanceSummary compute_performance_summary(const std::vector<Core::ClosedTrade>& trades,
                                                     const std::vector<Core::EquityPoint>& equity_curve,
                                                     double initial_equity, double final_equity) {
    Core::PerformanceSummary summary;
    summary.initial_equity = initial_equity;
    summary.final_equity = round_to_two_decimals(final_equity);
    if (trades.empty()) {
        return summary;
    }

    double total_return_pct = (final_equity - initial_equity) / initial_equity * 100.0;

    double elapsed_days = 365.0;
    if (!equity_curve.empty()) {
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::seconds>(equity_curve.back().time - equity_curve.front().time).count();
        elapsed_days = static_cast<double>(elapsed_seconds) / TimeUtils::SECONDS_PER_DAY;
    }
    double elapsed_years = std::max(elapsed_days / TimeUtils::DAYS_PER_YEAR, 1.0 / TimeUtils::DAYS_PER_YEAR);
    double equity_ratio = std::max(final_equity / initial_equity, 0.0);
    double annualized_return_pct = (std::pow(equity_ratio, 1.0 / elapsed_years) - 1.0) * 100.0;

    std::vector<double> daily_returns = compute_daily_returns(equity_curve);
    double mean_return = 0.0;
    double return_std_dev = 0.0;
    double downside_deviation = 0.0;
    if (!daily_returns.empty()) {
        for (double daily_return : daily_returns) mean_return += daily_return;
        mean_return /= static_cast<double>(daily_returns.size());

        double squared_deviation_sum = 0.0;
        double squared_downside_sum = 0.0;
        size_t downside_count = 0;
        for (double daily_return : daily_returns) {
            squared_deviation_sum += (daily_return - mean_return) * (daily_return - mean_return);
            if (daily_return < 0.0) {
                squared_downside_sum += daily_return * daily_return;
                ++downside_count;
            }
        }
        return_std_dev = std::sqrt(squared_deviation_sum / static_cast<double>(daily_returns.size()));
        if (downside_count > 0) {
            downside_deviation = std::sqrt(squared_downside_sum / static_cast<double>(downside_count));
        }
    }
    double annualisation_factor = std::sqrt(TRADING_DAYS_PER_YEAR);
    double sharpe_ratio = return_std_dev > 0.0 ? mean_return / return_std_dev * annualisation_factor : 0.0;
    double sortino_ratio = downside_deviation > 0.0 ? mean_return / downside_deviation * annualisation_factor : 0.0;

    double gross_win = 0.0;
    double gross_loss = 0.0;
    double total_pnl = 0.0;
    double total_r_multiple = 0.0;
    int winning_trades = 0;
    for (const auto& trade : trades) {
        total_pnl += trade.pnl;
        total_r_multiple += trade.r_multiple;
        if (trade.pnl > 0.0) {
            gross_win += trade.pnl;
            ++winning_trades;
        } else {
            gross_loss += trade.pnl;
        }
    }
    gross_loss = std::abs(gross_loss);
    double trade_count = static_cast<double>(trades.size());

    summary.total_return_pct = round_to_two_decimals(total_return_pct);
    summary.annualized_return_pct = round_to_two_decimals(annualized_return_pct);
    summary.max_drawdown_pct = round_to_two_decimals(compute_max_drawdown_pct(equity_curve, initial_equity));
    summary.sharpe_ratio = round_to_two_decimals(sharpe_ratio);
    summary.sortino_ratio = round_to_two_decimals(sortino_ratio);
    summary.total_trades = static_cast<int>(trades.size());
    summary.winning_trades = winning_trades;
    summary.losing_trades = summary.total_trades - winning_trades;
    summary.win_rate_pct = round_to_two_decimals(winning_trades / trade_count * 100.0);
    summary.profit_factor = gross_loss > 0.0 ? round_to_two_decimals(gross_win / gross_loss)
                                             : std::numeric_limits<double>::infinity();
    summary.avg_r_multiple = round_to_two_decimals(total_r_multiple / trade_count);
    summary.expectancy = round_to_two_decimals(total_pnl / trade_count);
    return summary;
}

} // namespace Backtest
} // namespace ConfluenceScalper
