#ifndef PERFORMANCE_METRICS_HPP
#define PERFORMANCE_METRICS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <vector>

namespace ConfluenceScalper {
namespace Backtest {

// Trading days per year used to annualise daily Sharpe and Sortino ratios
constexpr double TRADING_DAYS_PER_YEAR = 252.0;

double round_to_two_decimals(double value);

// Largest peak-to-trough decline along the curve as a positive percentage; the peak starts at initial_equity
double compute_max_drawdown_pct(const std::vector<Core::EquityPoint>& equity_curve, double initial_equity);

// Returns between the last equity of consecutive UTC dates present in the curve
std::vector<double> compute_daily_returns(const std::vector<Core::EquityPoint>& equity_curve);

// R-multiple of a closed trade: P/L over the initial risk in currency (1 when that risk is zero)
double compute_r_multiple(const Core::ClosedTrade& trade);

/**
 * Summary statistics rounded to two decimals. With no trades every statistic is zero
 * except the initial and final equity. Profit factor is +infinity when no trade lost.
 */
Core::PerformanceSummary compute_performance_summary(const std::vector<Core::ClosedTrade>& trades,
                                                     const std::vector<Core::EquityPoint>& equity_curve,
                                                     double initial_equity, double final_equity);

} // namespace Backtest
} // namespace ConfluenceScalper

#endif // PERFORMANCE_METRICS_HPP
