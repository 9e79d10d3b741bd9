// RiskConfig.hpp
#ifndef RISK_CONFIG_HPP
#define RISK_CONFIG_HPP

namespace ConfluenceScalper {
namespace Config {

struct RiskConfig {
    // Per-trade risk
    double max_risk_pct = 1.0;                       // Max equity percentage risked per trade
    double max_risk_usd = 200.0;                     // Absolute cap on USD risked per trade
    int min_units = 1;                               // Smallest tradable size

    // Account-level gates
    int max_open_positions = 2;                      // Concurrent open positions
    double max_daily_drawdown_pct = 3.0;             // Halt when the session loses this percentage
    double max_daily_loss_usd = 500.0;               // Halt when the session loses this many USD
    int max_trades_per_day = 5;                      // Trades opened per UTC day
    int cooldown_minutes = 15;                       // Minimum gap between trade openings

    // Trailing stop (multiples of ATR)
    double trail_activation_atr_multiple = 1.0;      // Profit needed before trailing starts
    double trail_distance_atr_multiple = 0.8;        // Distance of the trailed stop from price
    double breakeven_offset = 0.05;                  // USD above/below entry once trailing is active

    // Precision configuration for logging and display
    int currency_precision = 2;                      // Decimal places for currency amounts
    int percentage_precision = 2;                    // Decimal places for percentages
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // RISK_CONFIG_HPP
