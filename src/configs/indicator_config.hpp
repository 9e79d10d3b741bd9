// IndicatorConfig.hpp
#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

namespace ConfluenceScalper {
namespace Config {

struct IndicatorConfig {
    // ========================================================================
    // MOVING AVERAGES
    // ========================================================================

    int ema_fast_period = 21;                        // Fast EMA period (pullback reference)
    int ema_slow_period = 50;                        // Slow EMA period
    int ema_trend_period = 200;                      // Trend EMA period (macro bias)

    // ========================================================================
    // MOMENTUM OSCILLATORS
    // ========================================================================

    int rsi_period = 14;                             // RSI period (Wilder smoothing)
    int rsi_slope_bars = 3;                          // Bars between RSI samples for the slope
    int macd_fast_period = 12;                       // MACD fast EMA period
    int macd_slow_period = 26;                       // MACD slow EMA period
    int macd_signal_period = 9;                      // MACD signal line EMA period
    int stochastic_k_period = 14;                    // Stochastic %K lookback
    int stochastic_d_period = 3;                     // Stochastic %D smoothing (SMA of %K)

    // ========================================================================
    // VOLATILITY AND STRUCTURE
    // ========================================================================

    int atr_period = 14;                             // ATR period (Wilder smoothing)
    int bollinger_period = 20;                       // Bollinger middle band SMA period
    double bollinger_std_dev = 2.0;                  // Bollinger band width in standard deviations
    int swing_window = 5;                            // Bars each side of a swing pivot
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // INDICATOR_CONFIG_HPP
