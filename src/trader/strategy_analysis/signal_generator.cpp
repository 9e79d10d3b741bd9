#include "signal_generator.hpp"
#include "structural_features.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ConfluenceScalper {
namespace Core {

namespace {

// Tolerance for R:R comparisons on rounded prices
constexpr double RISK_REWARD_EPSILON = 1e-9;

std::string format_fixed(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

} // anonymous namespace

SignalGenerator::SignalGenerator(const Config::StrategyConfig& strategy_config) : config(strategy_config) {}

std::optional<Signal> SignalGenerator::evaluate(const std::vector<Bar>& recent, const std::vector<Bar>& higher_timeframe) const {
    return evaluate(BarSeriesView(recent), BarSeriesView(higher_timeframe));
}

std::optional<Signal> SignalGenerator::evaluate(const BarSeriesView& recent, const BarSeriesView& higher_timeframe) const {
    if (recent.size() < static_cast<size_t>(config.min_signal_bars) ||
        higher_timeframe.size() < static_cast<size_t>(config.min_trend_bars)) {
        return std::nullopt;
    }

    const Bar& latest_bar = recent.back();
    if (!latest_bar.atr.has_value()) {
        return std::nullopt;
    }
    double latest_atr = *latest_bar.atr;

    // Volatility gate: skip dead markets and news spikes
    if (latest_atr < config.min_atr || latest_atr > config.max_atr) {
        return std::nullopt;
    }

    DivergenceType divergence = detect_divergence(recent, config.divergence_lookback_bars);
    TrendDirection higher_timeframe_trend = higher_timeframe.back().trend_direction;

    DirectionScore long_score = score_direction(TradeDirection::LONG, recent, higher_timeframe_trend, divergence);
    DirectionScore short_score = score_direction(TradeDirection::SHORT, recent, higher_timeframe_trend, divergence);

    const DirectionScore* chosen_score = nullptr;
    if (long_score.qualifies() && short_score.qualifies()) {
        if (long_score.score > short_score.score) {
            chosen_score = &long_score;
        } else if (short_score.score > long_score.score) {
            chosen_score = &short_score;
        } else if (higher_timeframe_trend == TrendDirection::BULLISH) {
            chosen_score = &long_score;
        } else if (higher_timeframe_trend == TrendDirection::BEARISH) {
            chosen_score = &short_score;
        } else {
            // Equal evidence both ways with no trend to break the tie
            return std::nullopt;
        }
    } else if (long_score.qualifies()) {
        chosen_score = &long_score;
    } else if (short_score.qualifies()) {
        chosen_score = &short_score;
    } else {
        return std::nullopt;
    }

    std::optional<TradeLevels> trade_levels = compute_trade_levels(chosen_score->direction, latest_bar);
    if (!trade_levels.has_value()) {
        return std::nullopt;
    }

    Signal signal;
    signal.direction = chosen_score->direction;
    signal.entry_price = trade_levels->entry_price;
    signal.stop_loss = trade_levels->stop_loss;
    signal.take_profit = trade_levels->take_profit;
    signal.risk_reward_ratio = trade_levels->risk_reward_ratio;
    signal.confluence_score = chosen_score->score;
    signal.required_score = chosen_score->required_score;
    signal.counter_trend = chosen_score->counter_trend;
    signal.atr = round_price(latest_atr);
    signal.reasons = chosen_score->reasons;
    signal.timestamp = latest_bar.timestamp;
    return signal;
}

DirectionScore SignalGenerator::score_direction(TradeDirection direction, const BarSeriesView& recent,
                                                TrendDirection higher_timeframe_trend, DivergenceType divergence) const {
    bool is_long = direction == TradeDirection::LONG;
    bool trend_aligned = (is_long && higher_timeframe_trend == TrendDirection::BULLISH) ||
                         (!is_long && higher_timeframe_trend == TrendDirection::BEARISH);
    bool trend_neutral = higher_timeframe_trend == TrendDirection::NEUTRAL;
    bool divergence_confirms = (is_long && divergence == DivergenceType::BULLISH) ||
                               (!is_long && divergence == DivergenceType::BEARISH);

    DirectionScore direction_score;
    direction_score.direction = direction;
    direction_score.counter_trend = !trend_aligned && !trend_neutral;
    direction_score.required_score = config.min_confluence_score +
                                     (direction_score.counter_trend ? config.counter_trend_score_offset : 0);

    // Counter-trend entries need divergence behind them
    if (direction_score.counter_trend && !divergence_confirms) {
        direction_score.hard_rejected = true;
        direction_score.score = HARD_REJECT_SCORE;
        return direction_score;
    }
    if (recent.empty()) {
        return direction_score;
    }

    const Bar& latest_bar = recent.back();
    std::vector<std::string>& reasons = direction_score.reasons;

    // (i) trend alignment or confirming divergence
    if (trend_aligned) {
        ++direction_score.score;
        reasons.push_back("Higher timeframe trend " + trend_direction_to_string(higher_timeframe_trend));
    } else if (divergence_confirms) {
        ++direction_score.score;
        reasons.push_back("RSI " + divergence_type_to_string(divergence) + " divergence");
    }

    // (ii) momentum zone, pullback or divergence
    if (check_rsi_condition(direction, latest_bar, trend_aligned, trend_neutral, divergence_confirms, reasons)) {
        ++direction_score.score;
    }

    if (recent.size() >= 2) {
        const Bar& previous_bar = recent[recent.size() - 2];
        // (iii) MACD crossover with histogram confirmation
        if (check_macd_crossover(direction, previous_bar, latest_bar, reasons)) {
            ++direction_score.score;
        }
        // (iv) stochastic crossover outside the extreme zone
        if (check_stochastic_crossover(direction, previous_bar, latest_bar, reasons)) {
            ++direction_score.score;
        }
    }

    // (v) band touch at a structural level
    if (check_band_and_structure(direction, latest_bar, reasons)) {
        ++direction_score.score;
    }

    return direction_score;
}

bool SignalGenerator::check_rsi_condition(TradeDirection direction, const Bar& latest_bar, bool trend_aligned,
                                          bool trend_neutral, bool divergence_confirms, std::vector<std::string>& reasons) const {
    if (!latest_bar.rsi.has_value()) {
        return false;
    }
    double rsi = *latest_bar.rsi;
    bool is_long = direction == TradeDirection::LONG;

    if (is_long && rsi < config.rsi_oversold) {
        reasons.push_back("RSI oversold (" + format_fixed(rsi, 1) + ")");
        return true;
    }
    if (!is_long && rsi > config.rsi_overbought) {
        reasons.push_back("RSI overbought (" + format_fixed(rsi, 1) + ")");
        return true;
    }

    if (trend_aligned) {
        if (latest_bar.rsi_slope.has_value()) {
            double rsi_slope = *latest_bar.rsi_slope;
            if (is_long && rsi <= config.rsi_pullback_midline && rsi_slope > 0.0) {
                reasons.push_back("RSI pullback turning up (" + format_fixed(rsi, 1) + ")");
                return true;
            }
            if (!is_long && rsi >= config.rsi_pullback_midline && rsi_slope < 0.0) {
                reasons.push_back("RSI pullback turning down (" + format_fixed(rsi, 1) + ")");
                return true;
            }
        }
        if (divergence_confirms) {
            reasons.push_back(std::string("RSI ") + (is_long ? "bullish" : "bearish") + " divergence");
            return true;
        }
        return false;
    }

    // Counter-trend candidates already spent their divergence on check (i)
    if (trend_neutral && divergence_confirms) {
        reasons.push_back(std::string("RSI ") + (is_long ? "bullish" : "bearish") + " divergence");
        return true;
    }
    return false;
}

bool SignalGenerator::check_macd_crossover(TradeDirection direction, const Bar& previous_bar, const Bar& latest_bar,
                                           std::vector<std::string>& reasons) const {
    if (!latest_bar.macd_line.has_value() || !latest_bar.macd_signal.has_value() || !latest_bar.macd_histogram.has_value() ||
        !previous_bar.macd_line.has_value() || !previous_bar.macd_signal.has_value()) {
        return false;
    }
    double macd_line = *latest_bar.macd_line;
    double macd_signal = *latest_bar.macd_signal;
    double macd_histogram = *latest_bar.macd_histogram;
    double previous_line = *previous_bar.macd_line;
    double previous_signal = *previous_bar.macd_signal;

    if (direction == TradeDirection::LONG) {
        if (previous_line <= previous_signal && macd_line > macd_signal && macd_histogram > 0.0) {
            reasons.push_back("MACD bullish crossover");
            return true;
        }
        return false;
    }
    if (previous_line >= previous_signal && macd_line < macd_signal && macd_histogram < 0.0) {
        reasons.push_back("MACD bearish crossover");
        return true;
    }
    return false;
}

bool SignalGenerator::check_stochastic_crossover(TradeDirection direction, const Bar& previous_bar, const Bar& latest_bar,
                                                 std::vector<std::string>& reasons) const {
    if (!latest_bar.stoch_k.has_value() || !latest_bar.stoch_d.has_value() ||
        !previous_bar.stoch_k.has_value() || !previous_bar.stoch_d.has_value()) {
        return false;
    }
    double percent_k = *latest_bar.stoch_k;
    double percent_d = *latest_bar.stoch_d;
    double previous_k = *previous_bar.stoch_k;
    double previous_d = *previous_bar.stoch_d;

    if (direction == TradeDirection::LONG) {
        if (previous_k <= previous_d && percent_k > percent_d && percent_k < config.stochastic_overbought) {
            reasons.push_back("Stochastic cross up (" + format_fixed(percent_k, 1) + ")");
            return true;
        }
        return false;
    }
    if (previous_k >= previous_d && percent_k < percent_d && percent_k > config.stochastic_oversold) {
        reasons.push_back("Stochastic cross down (" + format_fixed(percent_k, 1) + ")");
        return true;
    }
    return false;
}

bool SignalGenerator::check_band_and_structure(TradeDirection direction, const Bar& latest_bar, std::vector<std::string>& reasons) const {
    if (!latest_bar.bollinger_upper.has_value() || !latest_bar.bollinger_lower.has_value() || !latest_bar.atr.has_value()) {
        return false;
    }
    double close_price = latest_bar.close_price;
    double atr = *latest_bar.atr;
    double band_tolerance = config.band_proximity_atr_multiple * atr;
    double swing_tolerance = config.swing_proximity_atr_multiple * atr;

    if (direction == TradeDirection::LONG) {
        bool near_lower_band = close_price <= *latest_bar.bollinger_lower + band_tolerance;
        bool near_support = latest_bar.last_swing_low.has_value() &&
                            std::abs(close_price - *latest_bar.last_swing_low) < swing_tolerance;
        if (near_lower_band && near_support) {
            reasons.push_back("Price at lower band + support " + format_fixed(*latest_bar.last_swing_low, 2));
            return true;
        }
        return false;
    }
    bool near_upper_band = close_price >= *latest_bar.bollinger_upper - band_tolerance;
    bool near_resistance = latest_bar.last_swing_high.has_value() &&
                           std::abs(close_price - *latest_bar.last_swing_high) < swing_tolerance;
    if (near_upper_band && near_resistance) {
        reasons.push_back("Price at upper band + resistance " + format_fixed(*latest_bar.last_swing_high, 2));
        return true;
    }
    return false;
}

std::optional<TradeLevels> SignalGenerator::compute_trade_levels(TradeDirection direction, const Bar& latest_bar) const {
    if (!latest_bar.atr.has_value() || *latest_bar.atr <= 0.0) {
        return std::nullopt;
    }
    bool is_long = direction == TradeDirection::LONG;
    double atr = *latest_bar.atr;
    double entry_price = latest_bar.close_price;

    double atr_stop = is_long ? entry_price - config.sl_atr_multiple * atr
                              : entry_price + config.sl_atr_multiple * atr;
    double structural_stop = atr_stop;
    if (is_long && latest_bar.last_swing_low.has_value()) {
        structural_stop = *latest_bar.last_swing_low - config.structural_stop_buffer_atr_multiple * atr;
    } else if (!is_long && latest_bar.last_swing_high.has_value()) {
        structural_stop = *latest_bar.last_swing_high + config.structural_stop_buffer_atr_multiple * atr;
    }

    // Tighter of the two, but never inside the noise floor
    double minimum_stop_distance = config.min_stop_distance_atr_multiple * atr;
    double stop_loss = 0.0;
    if (is_long) {
        stop_loss = std::max(atr_stop, structural_stop);
        stop_loss = std::min(stop_loss, entry_price - minimum_stop_distance);
    } else {
        stop_loss = std::min(atr_stop, structural_stop);
        stop_loss = std::max(stop_loss, entry_price + minimum_stop_distance);
    }

    double stop_distance = std::abs(entry_price - stop_loss);
    double take_profit = is_long ? entry_price + stop_distance * config.tp_reward_multiple
                                 : entry_price - stop_distance * config.tp_reward_multiple;

    TradeLevels trade_levels;
    trade_levels.entry_price = round_price(entry_price);
    trade_levels.stop_loss = round_price(stop_loss);
    trade_levels.take_profit = round_price(take_profit);

    // Rounding can collapse a level onto entry
    if (is_long && !(trade_levels.stop_loss < trade_levels.entry_price && trade_levels.take_profit > trade_levels.entry_price)) {
        return std::nullopt;
    }
    if (!is_long && !(trade_levels.stop_loss > trade_levels.entry_price && trade_levels.take_profit < trade_levels.entry_price)) {
        return std::nullopt;
    }

    double risk_amount = std::abs(trade_levels.entry_price - trade_levels.stop_loss);
    double reward_amount = std::abs(trade_levels.take_profit - trade_levels.entry_price);
    double risk_reward_ratio = reward_amount / risk_amount;
    if (risk_reward_ratio + RISK_REWARD_EPSILON < config.min_risk_reward) {
        return std::nullopt;
    }
    trade_levels.risk_reward_ratio = std::round(risk_reward_ratio * 100.0) / 100.0;
    return trade_levels;
}

double SignalGenerator::round_price(double price) const {
    double scale = std::pow(10.0, config.price_precision);
    return std::round(price * scale) / scale;
}

std::string format_signal(const Signal& signal) {
    std::ostringstream signal_stream;
    signal_stream << "[" << trade_direction_to_string(signal.direction) << "] @ " << format_fixed(signal.entry_price, 2)
                  << " | SL: " << format_fixed(signal.stop_loss, 2)
                  << " | TP: " << format_fixed(signal.take_profit, 2)
                  << " | R:R " << format_fixed(signal.risk_reward_ratio, 2)
                  << " | Score " << signal.confluence_score << "/" << signal.required_score
                  << (signal.counter_trend ? " (counter-trend)" : "")
                  << " | ATR " << format_fixed(signal.atr, 2) << " |";
    for (size_t reason_index = 0; reason_index < signal.reasons.size(); ++reason_index) {
        signal_stream << (reason_index == 0 ? " " : ", ") << signal.reasons[reason_index];
    }
    return signal_stream.str();
}

} // namespace Core
} // namespace ConfluenceScalper
