#include "risk_logs.hpp"
#include "backtest_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"

namespace ConfluenceScalper {
namespace Logging {

void RiskLogs::log_trade_gate(const Core::TradeGateDecision& decision, const Core::TimePoint& at) {
    if (decision.allowed) {
        LOG_THREAD_CONTENT("RISK GATE: OPEN @ " + TimeUtils::format_iso_utc(at));
        return;
    }
    LOG_THREAD_CONTENT("RISK GATE: BLOCKED @ " + TimeUtils::format_iso_utc(at) + " - " + decision.reason);
}

void RiskLogs::log_daily_reset(const Core::TimePoint& at, const Core::RiskSessionSummary& summary) {
    LOG_THREAD_CONTENT("NEW SESSION " + TimeUtils::utc_date_string(at) + " | Equity: " +
                       BacktestLogs::format_currency(summary.equity));
}

void RiskLogs::log_session_summary(const Core::RiskSessionSummary& summary) {
    TABLE_HEADER_48("RISK SESSION", "Account state at end of replay");
    TABLE_ROW_48("Equity", BacktestLogs::format_currency(summary.equity));
    TABLE_ROW_48("Peak Equity", BacktestLogs::format_currency(summary.peak_equity));
    TABLE_ROW_48("Drawdown", BacktestLogs::format_percentage(summary.drawdown_pct));
    TABLE_ROW_48("Session P/L", BacktestLogs::format_currency(summary.session_pnl));
    TABLE_ROW_48("Trades Today", std::to_string(summary.trades_today));
    TABLE_FOOTER_48();
}

} // namespace Logging
} // namespace ConfluenceScalper
