#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include <optional>

namespace ConfluenceScalper {
namespace Core {

// Every series returned here has the same length as its input and is right-aligned:
// index i only depends on inputs 0..i, and is empty until the indicator has enough history.
using IndicatorSeries = std::vector<std::optional<double>>;

struct MacdSeries {
    IndicatorSeries line;
    IndicatorSeries signal;
    IndicatorSeries histogram;
};

struct StochasticSeries {
    IndicatorSeries percent_k;
    IndicatorSeries percent_d;
};

struct BollingerSeries {
    IndicatorSeries upper;
    IndicatorSeries middle;
    IndicatorSeries lower;
    IndicatorSeries percent_b;
};

// SMA-seeded exponential moving average
IndicatorSeries compute_ema_series(const std::vector<double>& values, int period);

// EMA over a series whose leading values may be empty (e.g. the MACD line)
IndicatorSeries compute_ema_series(const IndicatorSeries& values, int period);

IndicatorSeries compute_sma_series(const IndicatorSeries& values, int period);

// Wilder RSI; first value at index period, 100 when there are no losses
IndicatorSeries compute_rsi_series(const std::vector<double>& closes, int period);

// rsi[i] - rsi[i - bars] where both exist
IndicatorSeries compute_slope_series(const IndicatorSeries& values, int bars);

MacdSeries compute_macd_series(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period);

// %K = 100 * (close - lowest low) / (highest high - lowest low), 50 on a flat range; %D = SMA of %K.
// Both are filled only where %D exists.
StochasticSeries compute_stochastic_series(const std::vector<double>& highs, const std::vector<double>& lows,
                                           const std::vector<double>& closes, int k_period, int d_period);

// True range needs the previous close, so the first ATR appears at index period
IndicatorSeries compute_atr_series(const std::vector<double>& highs, const std::vector<double>& lows,
                                   const std::vector<double>& closes, int period);

// Population standard deviation bands around an SMA
BollingerSeries compute_bollinger_series(const std::vector<double>& closes, int period, double std_dev_multiplier);

} // namespace Core
} // namespace ConfluenceScalper

#endif // INDICATORS_HPP
