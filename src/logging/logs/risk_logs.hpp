#ifndef RISK_LOGS_HPP
#define RISK_LOGS_HPP

#include "trader/strategy_analysis/risk_manager.hpp"
#include <string>

namespace ConfluenceScalper {
namespace Logging {

class RiskLogs {
public:
    // Risk gate logging
    static void log_trade_gate(const Core::TradeGateDecision& decision, const Core::TimePoint& at);
    static void log_daily_reset(const Core::TimePoint& at, const Core::RiskSessionSummary& summary);
    static void log_session_summary(const Core::RiskSessionSummary& summary);
};

} // namespace Logging
} // namespace ConfluenceScalper

#endif // RISK_LOGS_HPP
