#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <stdexcept>
#include "utils/time_utils.hpp"

namespace ConfluenceScalper {
namespace Core {

using TimeUtils::TimePoint;

enum class TrendDirection {
    BEARISH = -1,
    NEUTRAL = 0,
    BULLISH = 1
};

enum class TradeDirection {
    LONG,
    SHORT
};

enum class DivergenceType {
    NONE,
    BULLISH,
    BEARISH
};

enum class CloseReason {
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING_STOP,
    END_OF_DATA
};

inline std::string trend_direction_to_string(TrendDirection trend_direction) {
    switch (trend_direction) {
        case TrendDirection::BULLISH:
            return "bullish";
        case TrendDirection::BEARISH:
            return "bearish";
        case TrendDirection::NEUTRAL:
            return "neutral";
    }
    throw std::runtime_error("Unknown trend direction");
}

inline std::string trade_direction_to_string(TradeDirection trade_direction) {
    return trade_direction == TradeDirection::LONG ? "LONG" : "SHORT";
}

inline TradeDirection parse_trade_direction(const std::string& direction_text) {
    if (direction_text == "LONG" || direction_text == "long") return TradeDirection::LONG;
    if (direction_text == "SHORT" || direction_text == "short") return TradeDirection::SHORT;
    throw std::runtime_error("Invalid trade direction: " + direction_text);
}

inline std::string divergence_type_to_string(DivergenceType divergence_type) {
    switch (divergence_type) {
        case DivergenceType::BULLISH:
            return "bullish";
        case DivergenceType::BEARISH:
            return "bearish";
        case DivergenceType::NONE:
            return "none";
    }
    throw std::runtime_error("Unknown divergence type");
}

inline std::string close_reason_to_string(CloseReason close_reason) {
    switch (close_reason) {
        case CloseReason::STOP_LOSS:
            return "stop_loss";
        case CloseReason::TAKE_PROFIT:
            return "take_profit";
        case CloseReason::TRAILING_STOP:
            return "trailing_stop";
        case CloseReason::END_OF_DATA:
            return "end_of_data";
    }
    throw std::runtime_error("Unknown close reason");
}

inline CloseReason parse_close_reason(const std::string& reason_text) {
    if (reason_text == "stop_loss") return CloseReason::STOP_LOSS;
    if (reason_text == "take_profit") return CloseReason::TAKE_PROFIT;
    if (reason_text == "trailing_stop") return CloseReason::TRAILING_STOP;
    if (reason_text == "end_of_data") return CloseReason::END_OF_DATA;
    throw std::runtime_error("Invalid close reason: " + reason_text);
}

// +1 for long, -1 for short
inline double direction_sign(TradeDirection trade_direction) {
    return trade_direction == TradeDirection::LONG ? 1.0 : -1.0;
}

/**
 * One OHLCV bar plus its derived feature set.
 * Derived fields stay empty until their indicator has enough history; consumers
 * treat an empty field as "not ready".
 */
struct Bar {
    TimePoint timestamp;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    long long volume;

    std::optional<double> ema_fast;
    std::optional<double> ema_slow;
    std::optional<double> ema_trend;
    std::optional<double> rsi;
    std::optional<double> rsi_slope;
    std::optional<double> macd_line;
    std::optional<double> macd_signal;
    std::optional<double> macd_histogram;
    std::optional<double> stoch_k;
    std::optional<double> stoch_d;
    std::optional<double> atr;
    std::optional<double> bollinger_upper;
    std::optional<double> bollinger_middle;
    std::optional<double> bollinger_lower;
    std::optional<double> bollinger_percent_b;

    // Set on the bar that confirms a pivot (window bars after the pivot itself)
    std::optional<double> confirmed_swing_high;
    std::optional<double> confirmed_swing_low;
    // Most recent confirmed levels, forward-filled
    std::optional<double> last_swing_high;
    std::optional<double> last_swing_low;

    TrendDirection trend_direction;

    Bar() : timestamp(), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0), trend_direction(TrendDirection::NEUTRAL) {}

    Bar(TimePoint bar_timestamp, double open_value, double high_value, double low_value, double close_value, long long volume_value)
        : timestamp(bar_timestamp), open_price(open_value), high_price(high_value), low_price(low_value),
          close_price(close_value), volume(volume_value), trend_direction(TrendDirection::NEUTRAL) {}
};

/**
 * Read-only window over a contiguous run of bars. Never owns the bars; the
 * backtest hands prefixes of its series through it so later bars are unreachable.
 */
class BarSeriesView {
public:
    BarSeriesView() : bars_pointer(nullptr), bar_count(0) {}
    BarSeriesView(const Bar* first_bar, size_t count) : bars_pointer(first_bar), bar_count(count) {}
    BarSeriesView(const std::vector<Bar>& bars) : bars_pointer(bars.data()), bar_count(bars.size()) {}

    size_t size() const { return bar_count; }
    bool empty() const { return bar_count == 0; }
    const Bar& operator[](size_t index) const { return bars_pointer[index]; }
    const Bar& back() const { return bars_pointer[bar_count - 1]; }
    const Bar* begin() const { return bars_pointer; }
    const Bar* end() const { return bars_pointer + bar_count; }

    // First count bars of this view
    BarSeriesView prefix(size_t count) const {
        if (count > bar_count) {
            throw std::out_of_range("Prefix of " + std::to_string(count) + " bars exceeds view of " + std::to_string(bar_count));
        }
        return BarSeriesView(bars_pointer, count);
    }

    // Last count bars of this view (all of it when shorter)
    BarSeriesView last(size_t count) const {
        if (count >= bar_count) {
            return *this;
        }
        return BarSeriesView(bars_pointer + (bar_count - count), count);
    }

private:
    const Bar* bars_pointer;
    size_t bar_count;
};

/**
 * Directional trade proposal. Only built when every level invariant holds:
 * stop on the losing side, target on the winning side, risk_reward_ratio at or
 * above the configured minimum and confluence_score at or above required_score.
 */
struct Signal {
    TradeDirection direction;
    double entry_price;
    double stop_loss;
    double take_profit;
    double risk_reward_ratio;
    int confluence_score;
    int required_score;
    bool counter_trend;
    double atr;
    std::vector<std::string> reasons;
    TimePoint timestamp;

    Signal() : direction(TradeDirection::LONG), entry_price(0.0), stop_loss(0.0), take_profit(0.0),
               risk_reward_ratio(0.0), confluence_score(0), required_score(0), counter_trend(false), atr(0.0) {}
};

// Broker-agnostic view of an open position used for stop management
struct BrokerPositionView {
    TradeDirection direction;
    double entry_price;
    double current_stop;

    BrokerPositionView() : direction(TradeDirection::LONG), entry_price(0.0), current_stop(0.0) {}
    BrokerPositionView(TradeDirection position_direction, double position_entry_price, double position_stop)
        : direction(position_direction), entry_price(position_entry_price), current_stop(position_stop) {}
};

struct AccountSummary {
    double balance;
    double equity;

    AccountSummary() : balance(0.0), equity(0.0) {}
};

// Backtest-only open position
struct OpenPosition {
    TimePoint entry_time;
    TimePoint signal_time;
    TradeDirection direction;
    double entry_price;
    double stop_loss;
    double take_profit;
    double initial_stop_loss;
    int units;
    int confluence_score;
    double atr;
    double equity_before;
    std::vector<std::string> reasons;

    OpenPosition() : direction(TradeDirection::LONG), entry_price(0.0), stop_loss(0.0), take_profit(0.0),
                     initial_stop_loss(0.0), units(0), confluence_score(0), atr(0.0), equity_before(0.0) {}
};

struct ClosedTrade {
    TimePoint entry_time;
    TimePoint exit_time;
    TradeDirection direction;
    double entry_price;
    double exit_price;
    double stop_loss;
    double take_profit;
    double initial_stop_loss;
    int units;
    double pnl;
    CloseReason close_reason;
    double r_multiple;
    int confluence_score;
    double atr;
    double equity_before;
    std::vector<std::string> reasons;

    ClosedTrade() : direction(TradeDirection::LONG), entry_price(0.0), exit_price(0.0), stop_loss(0.0),
                    take_profit(0.0), initial_stop_loss(0.0), units(0), pnl(0.0),
                    close_reason(CloseReason::END_OF_DATA), r_multiple(0.0), confluence_score(0), atr(0.0), equity_before(0.0) {}
};

struct EquityPoint {
    TimePoint time;
    double equity;

    EquityPoint() : time(), equity(0.0) {}
    EquityPoint(TimePoint point_time, double point_equity) : time(point_time), equity(point_equity) {}
};

struct PerformanceSummary {
    double total_return_pct;
    double annualized_return_pct;
    double max_drawdown_pct;
    double sharpe_ratio;
    double sortino_ratio;
    double win_rate_pct;
    double profit_factor;              // +infinity when there are no losing trades
    int total_trades;
    int winning_trades;
    int losing_trades;
    double avg_r_multiple;
    double expectancy;
    double initial_equity;
    double final_equity;

    PerformanceSummary() : total_return_pct(0.0), annualized_return_pct(0.0), max_drawdown_pct(0.0),
                           sharpe_ratio(0.0), sortino_ratio(0.0), win_rate_pct(0.0), profit_factor(0.0),
                           total_trades(0), winning_trades(0), losing_trades(0), avg_r_multiple(0.0),
                           expectancy(0.0), initial_equity(0.0), final_equity(0.0) {}
};

struct BacktestResults {
    std::vector<ClosedTrade> trades;
    std::vector<EquityPoint> equity_curve;
    PerformanceSummary summary;
};

} // namespace Core
} // namespace ConfluenceScalper

#endif // DATA_STRUCTURES_HPP
