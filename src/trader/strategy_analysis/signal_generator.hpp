#ifndef SIGNAL_GENERATOR_HPP
#define SIGNAL_GENERATOR_HPP

#include <optional>
#include <string>
#include <vector>
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceScalper {
namespace Core {

// Score assigned to a candidate opposing the higher-timeframe trend without divergence
constexpr int HARD_REJECT_SCORE = -1;

struct DirectionScore {
    TradeDirection direction;
    int score;
    int required_score;
    bool counter_trend;
    bool hard_rejected;
    std::vector<std::string> reasons;

    DirectionScore() : direction(TradeDirection::LONG), score(0), required_score(0), counter_trend(false), hard_rejected(false) {}

    bool qualifies() const { return !hard_rejected && score >= required_score; }
};

struct TradeLevels {
    double entry_price;
    double stop_loss;
    double take_profit;
    double risk_reward_ratio;
};

/**
 * Confluence signal generator.
 * Scores both directions on the latest closed bar with five independent checks,
 * picks at most one, and builds rounded entry/stop/target levels. Every
 * rejection path returns std::nullopt; expected conditions never throw.
 */
class SignalGenerator {
public:
    explicit SignalGenerator(const Config::StrategyConfig& strategy_config);

    // recent: signal-timeframe bars up to and including the latest closed bar.
    // higher_timeframe: closed trend-timeframe bars visible at that time.
    std::optional<Signal> evaluate(const BarSeriesView& recent, const BarSeriesView& higher_timeframe) const;
    std::optional<Signal> evaluate(const std::vector<Bar>& recent, const std::vector<Bar>& higher_timeframe) const;

    DirectionScore score_direction(TradeDirection direction, const BarSeriesView& recent,
                                   TrendDirection higher_timeframe_trend, DivergenceType divergence) const;

    // Levels for an entry at the latest close; std::nullopt when they violate the stop side or R:R minimum
    std::optional<TradeLevels> compute_trade_levels(TradeDirection direction, const Bar& latest_bar) const;

private:
    const Config::StrategyConfig& config;

    bool check_rsi_condition(TradeDirection direction, const Bar& latest_bar, bool trend_aligned,
                             bool trend_neutral, bool divergence_confirms, std::vector<std::string>& reasons) const;
    bool check_macd_crossover(TradeDirection direction, const Bar& previous_bar, const Bar& latest_bar,
                              std::vector<std::string>& reasons) const;
    bool check_stochastic_crossover(TradeDirection direction, const Bar& previous_bar, const Bar& latest_bar,
                                    std::vector<std::string>& reasons) const;
    bool check_band_and_structure(TradeDirection direction, const Bar& latest_bar, std::vector<std::string>& reasons) const;

    double round_price(double price) const;
};

// "[LONG] @ 2340.00 | SL: 2338.20 | TP: 2343.60 | R:R 2.00 | Score 4/3 | ATR 1.20 | reasons..."
std::string format_signal(const Signal& signal);

} // namespace Core
} // namespace ConfluenceScalper

#endif // SIGNAL_GENERATOR_HPP
