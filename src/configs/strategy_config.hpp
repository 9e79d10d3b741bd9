// StrategyConfig.hpp
#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <string>

namespace ConfluenceScalper {
namespace Config {

struct StrategyConfig {
    // ========================================================================
    // INSTRUMENT AND TIMEFRAMES
    // ========================================================================

    std::string symbol = "XAU/USD";                  // Instrument traded
    int base_bar_minutes = 5;                        // Signal timeframe bar width in minutes
    int higher_timeframe_minutes = 15;               // Trend timeframe bucket width in minutes
    int min_signal_bars = 100;                       // Minimum signal bars before evaluating
    int min_trend_bars = 50;                         // Minimum higher-timeframe bars before evaluating

    // ========================================================================
    // VOLATILITY GATE
    // ========================================================================

    double min_atr = 0.20;                           // Skip quiet markets below this ATR (USD)
    double max_atr = 5.0;                            // Skip news spikes above this ATR (USD)

    // ========================================================================
    // CONFLUENCE SCORING
    // ========================================================================

    int min_confluence_score = 3;                    // Checks required out of five
    int counter_trend_score_offset = 1;              // Extra checks required against the trend
    double rsi_overbought = 65.0;                    // RSI short zone threshold
    double rsi_oversold = 35.0;                      // RSI long zone threshold
    double rsi_pullback_midline = 50.0;              // RSI midline for trend pullbacks
    double stochastic_overbought = 80.0;             // %K ceiling for long crosses
    double stochastic_oversold = 20.0;               // %K floor for short crosses
    double band_proximity_atr_multiple = 0.3;        // Close within this many ATR of the band
    double swing_proximity_atr_multiple = 0.5;       // Close within this many ATR of the last swing level
    int divergence_lookback_bars = 20;               // Bars scanned for RSI divergence

    // ========================================================================
    // TRADE LEVELS
    // ========================================================================

    double min_risk_reward = 1.8;                    // Minimum reward to risk ratio
    double sl_atr_multiple = 1.5;                    // ATR stop distance multiple
    double tp_reward_multiple = 2.0;                 // Take profit distance as a multiple of stop distance
    double structural_stop_buffer_atr_multiple = 0.2; // Buffer beyond the swing level for structural stops
    double min_stop_distance_atr_multiple = 0.3;     // Floor on stop distance in ATR
    int price_precision = 2;                         // Decimal places for entry/stop/target
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // STRATEGY_CONFIG_HPP
