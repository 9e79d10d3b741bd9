#include "risk_manager.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ConfluenceScalper {
    namespace Core {

namespace {

void require_valid_equity(double equity_value, const char* context) {
    if (!std::isfinite(equity_value) || equity_value < 0.0) {
        std::ostringstream error_stream;
        error_stream << "Invalid equity for " << context << ": " << equity_value;
        throw std::invalid_argument(error_stream.str());
    }
}

std::string format_amount(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

} // anonymous namespace

RiskSessionState::RiskSessionState(double starting_equity)
    : equity(starting_equity), peak_equity(starting_equity), session_start_equity(starting_equity),
      session_pnl(0.0), session_trade_count(0) {
    require_valid_equity(starting_equity, "session start");
}

void RiskSessionState::record_equity(double new_equity) {
    require_valid_equity(new_equity, "equity update");
    equity = new_equity;
    peak_equity = std::max(peak_equity, new_equity);
}

void RiskSessionState::record_trade_opened(const TimePoint& opened_at) {
    ++session_trade_count;
    last_trade_opened_at = opened_at;
}

void RiskSessionState::record_trade_closed(double realized_pnl) {
    if (!std::isfinite(realized_pnl)) {
        throw std::invalid_argument("Realized P/L must be finite");
    }
    session_pnl += realized_pnl;
}

bool RiskSessionState::apply_daily_reset(const TimePoint& at) {
    long long observed_day = TimeUtils::utc_day_index(at);
    if (!session_day.has_value()) {
        session_day = observed_day;
        return false;
    }
    if (observed_day <= *session_day) {
        return false;
    }
    session_day = observed_day;
    session_start_equity = equity;
    session_pnl = 0.0;
    session_trade_count = 0;
    return true;
}

RiskManager::RiskManager(const Config::RiskConfig& risk_config, RiskSessionState& session_state)
    : config(risk_config), session(session_state) {}

void RiskManager::record_equity(double new_equity) {
    session.record_equity(new_equity);
}

TradeGateDecision RiskManager::can_open_trade(int open_position_count, const TimePoint& at) {
    session.apply_daily_reset(at);

    if (open_position_count >= config.max_open_positions) {
        return {false, "Max open positions (" + std::to_string(open_position_count) + "/" + std::to_string(config.max_open_positions) + ")"};
    }

    double session_pnl = session.get_session_pnl();
    double session_start_equity = session.get_session_start_equity();
    if (session_start_equity > 0.0) {
        double session_pnl_pct = session_pnl / session_start_equity * 100.0;
        if (session_pnl_pct <= -config.max_daily_drawdown_pct) {
            return {false, "Daily drawdown limit hit (" + format_amount(session_pnl_pct, config.percentage_precision) + "%)"};
        }
    }

    if (session_pnl <= -config.max_daily_loss_usd) {
        return {false, "Daily USD loss limit hit ($" + format_amount(session_pnl, config.currency_precision) + ")"};
    }

    if (session.get_session_trade_count() >= config.max_trades_per_day) {
        return {false, "Max trades/day reached (" + std::to_string(session.get_session_trade_count()) + "/" + std::to_string(config.max_trades_per_day) + ")"};
    }

    const std::optional<TimePoint>& last_trade_opened_at = session.get_last_trade_opened_at();
    if (last_trade_opened_at.has_value()) {
        auto cooldown_duration = std::chrono::minutes(config.cooldown_minutes);
        auto elapsed_duration = at - *last_trade_opened_at;
        if (elapsed_duration < cooldown_duration) {
            auto remaining_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(cooldown_duration - elapsed_duration).count();
            long long remaining_seconds = (remaining_milliseconds + 999) / 1000;
            return {false, "Cooling period: " + std::to_string(remaining_seconds) + "s remaining"};
        }
    }

    return {true, ""};
}

int RiskManager::size_position(const Signal& signal) const {
    double equity = session.get_equity();
    if (equity < 0.0) {
        throw std::invalid_argument("Cannot size a position with negative equity: " + std::to_string(equity));
    }

    double stop_distance = std::abs(signal.entry_price - signal.stop_loss);
    if (!(stop_distance > 0.0)) {
        return 0;
    }

    double risk_amount = std::min(equity * config.max_risk_pct / 100.0, config.max_risk_usd);
    double raw_units = std::floor(risk_amount / stop_distance);
    if (raw_units >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return std::max(static_cast<int>(raw_units), config.min_units);
}

double RiskManager::trail_stop(TradeDirection direction, double entry_price, double current_price,
                               double atr, double current_stop) const {
    bool is_long = direction == TradeDirection::LONG;
    double profit_distance = is_long ? current_price - entry_price : entry_price - current_price;

    if (profit_distance < config.trail_activation_atr_multiple * atr) {
        return current_stop;
    }

    if (is_long) {
        double breakeven_level = entry_price + config.breakeven_offset;
        double trailing_level = current_price - config.trail_distance_atr_multiple * atr;
        return std::max({current_stop, breakeven_level, trailing_level});
    }
    double breakeven_level = entry_price - config.breakeven_offset;
    double trailing_level = current_price + config.trail_distance_atr_multiple * atr;
    return std::min({current_stop, breakeven_level, trailing_level});
}

double RiskManager::trail_stop(const BrokerPositionView& position, double current_price, double atr) const {
    return trail_stop(position.direction, position.entry_price, current_price, atr, position.current_stop);
}

void RiskManager::record_trade_opened(const TimePoint& opened_at) {
    session.apply_daily_reset(opened_at);
    session.record_trade_opened(opened_at);
}

void RiskManager::record_trade_closed(double realized_pnl) {
    session.record_trade_closed(realized_pnl);
}

bool RiskManager::apply_daily_reset(const TimePoint& at) {
    return session.apply_daily_reset(at);
}

RiskSessionSummary RiskManager::session_summary() const {
    RiskSessionSummary summary;
    summary.equity = session.get_equity();
    summary.session_pnl = session.get_session_pnl();
    summary.trades_today = session.get_session_trade_count();
    summary.peak_equity = session.get_peak_equity();
    summary.drawdown_pct = summary.peak_equity > 0.0
        ? (summary.equity - summary.peak_equity) / summary.peak_equity * 100.0
        : 0.0;
    return summary;
}

    } // namespace Core
} // namespace ConfluenceScalper
