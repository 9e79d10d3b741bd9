#include "backtest_simulator.hpp"
#include "performance_metrics.hpp"
#include "trader/market_data/bar_resampler.hpp"
#include "trader/strategy_analysis/risk_manager.hpp"
#include "trader/strategy_analysis/signal_generator.hpp"
#include "logging/logs/backtest_logs.hpp"
#include "logging/logs/risk_logs.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include <algorithm>
#include <optional>

namespace ConfluenceScalper {
namespace Backtest {

using Core::Bar;
using Core::BarSeriesView;
using Core::ClosedTrade;
using Core::CloseReason;
using Core::OpenPosition;
using Core::TradeDirection;

ExitDecision evaluate_exit(const OpenPosition& position, const Bar& next_bar) {
    ExitDecision decision;
    bool is_long = position.direction == TradeDirection::LONG;
    bool stop_hit = is_long ? next_bar.low_price <= position.stop_loss : next_bar.high_price >= position.stop_loss;
    bool target_hit = is_long ? next_bar.high_price >= position.take_profit : next_bar.low_price <= position.take_profit;

    if (stop_hit) {
        decision.triggered = true;
        decision.exit_price = position.stop_loss;
        decision.reason = position.stop_loss != position.initial_stop_loss ? CloseReason::TRAILING_STOP : CloseReason::STOP_LOSS;
    } else if (target_hit) {
        decision.triggered = true;
        decision.exit_price = position.take_profit;
        decision.reason = CloseReason::TAKE_PROFIT;
    }
    return decision;
}

BacktestSimulator::BacktestSimulator(const Config::SystemConfig& system_config,
                                     const Core::IndicatorProviderInterface& indicator_provider)
    : config(system_config), indicators(indicator_provider) {}

size_t BacktestSimulator::minimum_required_bars() const {
    return static_cast<size_t>(std::max(config.backtest.warmup_bars, 0) + std::max(config.backtest.minimum_bar_buffer, 0));
}

bool BacktestSimulator::is_in_session(const Core::TimePoint& bar_time) const {
    int hour_utc = TimeUtils::utc_hour(bar_time);
    return hour_utc >= config.session.session_start_hour_utc && hour_utc < config.session.session_end_hour_utc;
}

ClosedTrade BacktestSimulator::close_position(const OpenPosition& position, const Core::TimePoint& exit_time,
                                              double exit_price, CloseReason reason) const {
    ClosedTrade trade;
    trade.entry_time = position.entry_time;
    trade.exit_time = exit_time;
    trade.direction = position.direction;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.stop_loss = position.stop_loss;
    trade.take_profit = position.take_profit;
    trade.initial_stop_loss = position.initial_stop_loss;
    trade.units = position.units;
    trade.pnl = (exit_price - position.entry_price) * position.units * Core::direction_sign(position.direction);
    trade.close_reason = reason;
    trade.confluence_score = position.confluence_score;
    trade.atr = position.atr;
    trade.equity_before = position.equity_before;
    trade.reasons = position.reasons;
    trade.r_multiple = compute_r_multiple(trade);
    return trade;
}

Core::BacktestResults BacktestSimulator::run(const std::vector<Bar>& historical_bars) const {
    size_t required_bars = minimum_required_bars();
    if (historical_bars.size() < required_bars) {
        throw InsufficientDataError("Not enough bars for backtest: have " + std::to_string(historical_bars.size()) +
                                    ", need at least " + std::to_string(required_bars));
    }
    for (size_t bar_index = 1; bar_index < historical_bars.size(); ++bar_index) {
        if (historical_bars[bar_index].timestamp <= historical_bars[bar_index - 1].timestamp) {
            throw std::invalid_argument("Bar timestamps must be strictly increasing (bar " + std::to_string(bar_index) + " at " +
                                        TimeUtils::format_iso_utc(historical_bars[bar_index].timestamp) + ")");
        }
    }

    std::vector<Bar> signal_bars = historical_bars;
    indicators.enrich(signal_bars);

    std::vector<MarketData::ResampledBar> trend_buckets =
        MarketData::resample_bars(historical_bars, config.strategy.higher_timeframe_minutes);
    std::vector<Bar> trend_bars = MarketData::extract_bars(trend_buckets);
    indicators.enrich(trend_bars);

    double equity = config.backtest.initial_equity;
    double half_spread = config.backtest.spread / 2.0;
    Core::RiskSessionState session_state(equity);
    Core::RiskManager risk_manager(config.risk, session_state);
    Core::SignalGenerator signal_generator(config.strategy);

    Core::BacktestResults results;
    std::optional<OpenPosition> open_position;
    size_t visible_trend_bars = 0;
    size_t first_decision_index = static_cast<size_t>(std::max(config.backtest.warmup_bars, 0));

    for (size_t bar_index = first_decision_index; bar_index + 1 < signal_bars.size(); ++bar_index) {
        const Bar& current_bar = signal_bars[bar_index];
        const Bar& next_bar = signal_bars[bar_index + 1];
        visible_trend_bars = MarketData::count_closed_buckets(trend_buckets, bar_index, current_bar.timestamp,
                                                              config.strategy.base_bar_minutes, visible_trend_bars);

        if (open_position) {
            if (config.backtest.apply_trailing_stop && current_bar.atr) {
                open_position->stop_loss = risk_manager.trail_stop(open_position->direction, open_position->entry_price,
                                                                   current_bar.close_price, *current_bar.atr,
                                                                   open_position->stop_loss);
            }

            ExitDecision exit_decision = evaluate_exit(*open_position, next_bar);
            if (exit_decision.triggered) {
                ClosedTrade closed_trade = close_position(*open_position, next_bar.timestamp,
                                                          exit_decision.exit_price, exit_decision.reason);
                equity += closed_trade.pnl;
                if (risk_manager.apply_daily_reset(next_bar.timestamp)) {
                    Logging::RiskLogs::log_daily_reset(next_bar.timestamp, risk_manager.session_summary());
                }
                risk_manager.record_equity(std::max(equity, 0.0));
                risk_manager.record_trade_closed(closed_trade.pnl);
                Logging::BacktestLogs::log_trade_closed(closed_trade, equity);
                results.trades.push_back(closed_trade);
                open_position.reset();
            }
        }

        if (!open_position && equity > 0.0 && is_in_session(current_bar.timestamp)) {
            Core::TradeGateDecision gate_decision = risk_manager.can_open_trade(0, current_bar.timestamp);
            if (gate_decision.allowed) {
                std::optional<Core::Signal> signal = signal_generator.evaluate(
                    BarSeriesView(signal_bars.data(), bar_index + 1),
                    BarSeriesView(trend_bars.data(), visible_trend_bars));

                if (signal) {
                    if (config.logging.log_signal_details) {
                        Logging::SignalAnalysisLogs::log_signal_accepted(*signal);
                    }
                    int units = risk_manager.size_position(*signal);
                    if (units > 0) {
                        bool is_long = signal->direction == TradeDirection::LONG;
                        OpenPosition position;
                        position.entry_time = next_bar.timestamp;
                        position.signal_time = current_bar.timestamp;
                        position.direction = signal->direction;
                        position.entry_price = is_long ? next_bar.open_price + half_spread : next_bar.open_price - half_spread;
                        position.stop_loss = signal->stop_loss;
                        position.take_profit = signal->take_profit;
                        position.initial_stop_loss = signal->stop_loss;
                        position.units = units;
                        position.confluence_score = signal->confluence_score;
                        position.atr = signal->atr;
                        position.equity_before = equity;
                        position.reasons = signal->reasons;

                        equity -= config.backtest.commission;
                        risk_manager.record_equity(std::max(equity, 0.0));
                        risk_manager.record_trade_opened(current_bar.timestamp);
                        Logging::BacktestLogs::log_trade_opened(position);
                        open_position = position;
                    }
                }
            } else if (config.logging.log_signal_details) {
                Logging::RiskLogs::log_trade_gate(gate_decision, current_bar.timestamp);
            }
        }

        results.equity_curve.emplace_back(current_bar.timestamp, equity);
    }

    if (open_position) {
        const Bar& last_bar = signal_bars.back();
        ClosedTrade closed_trade = close_position(*open_position, last_bar.timestamp, last_bar.close_price, CloseReason::END_OF_DATA);
        equity += closed_trade.pnl;
        risk_manager.record_equity(std::max(equity, 0.0));
        risk_manager.record_trade_closed(closed_trade.pnl);
        Logging::BacktestLogs::log_trade_closed(closed_trade, equity);
        results.trades.push_back(closed_trade);
        results.equity_curve.emplace_back(last_bar.timestamp, equity);
    }

    results.summary = compute_performance_summary(results.trades, results.equity_curve,
                                                  config.backtest.initial_equity, equity);
    Logging::RiskLogs::log_session_summary(risk_manager.session_summary());
    return results;
}

} // namespace Backtest
} // namespace ConfluenceScalper
