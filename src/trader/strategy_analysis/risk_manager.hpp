#ifndef RISK_MANAGER_HPP
#define RISK_MANAGER_HPP

#include <optional>
#include <string>
#include "configs/risk_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceScalper {
namespace Core {

/**
 * Mutable per-account session state. Every mutation goes through a named method;
 * the session day marker stays unset until the first timestamp is observed.
 * Not thread-safe: a driver evaluating several instruments must serialise access.
 */
class RiskSessionState {
public:
    explicit RiskSessionState(double starting_equity);

    double get_equity() const { return equity; }
    double get_peak_equity() const { return peak_equity; }
    double get_session_start_equity() const { return session_start_equity; }
    double get_session_pnl() const { return session_pnl; }
    int get_session_trade_count() const { return session_trade_count; }
    const std::optional<long long>& get_session_day() const { return session_day; }
    const std::optional<TimePoint>& get_last_trade_opened_at() const { return last_trade_opened_at; }

    // Throws std::invalid_argument for non-finite or negative equity
    void record_equity(double new_equity);
    void record_trade_opened(const TimePoint& opened_at);
    void record_trade_closed(double realized_pnl);

    // Starts a new session when at falls on a later UTC day. Returns true when a reset happened.
    bool apply_daily_reset(const TimePoint& at);

private:
    double equity;
    double peak_equity;
    double session_start_equity;
    double session_pnl;
    int session_trade_count;
    std::optional<long long> session_day;
    std::optional<TimePoint> last_trade_opened_at;
};

struct TradeGateDecision {
    bool allowed;
    std::string reason;
};

struct RiskSessionSummary {
    double equity;
    double session_pnl;
    int trades_today;
    double peak_equity;
    double drawdown_pct;               // Distance below peak equity, zero or negative
};

class RiskManager {
public:
    RiskManager(const Config::RiskConfig& risk_config, RiskSessionState& session_state);

    void record_equity(double new_equity);

    // Applies the daily reset for at, then checks in order: open positions, daily drawdown,
    // daily USD loss, trades per day, cooldown. The first failing check supplies the reason.
    TradeGateDecision can_open_trade(int open_position_count, const TimePoint& at);

    // Units risking min(equity * max_risk_pct%, max_risk_usd) over the stop distance, at least min_units.
    // 0 when the stop distance is not positive. Throws std::invalid_argument on negative equity.
    int size_position(const Signal& signal) const;

    // One-directional ratchet: unchanged until profit reaches the activation distance, then the
    // most protective of the current stop, breakeven plus offset and the trailing level.
    double trail_stop(TradeDirection direction, double entry_price, double current_price,
                      double atr, double current_stop) const;
    double trail_stop(const BrokerPositionView& position, double current_price, double atr) const;

    void record_trade_opened(const TimePoint& opened_at);
    void record_trade_closed(double realized_pnl);
    bool apply_daily_reset(const TimePoint& at);

    RiskSessionSummary session_summary() const;
    const RiskSessionState& get_session_state() const { return session; }

private:
    const Config::RiskConfig& config;
    RiskSessionState& session;
};

} // namespace Core
} // namespace ConfluenceScalper

#endif // RISK_MANAGER_HPP
