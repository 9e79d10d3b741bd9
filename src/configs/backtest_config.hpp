// BacktestConfig.hpp
#ifndef BACKTEST_CONFIG_HPP
#define BACKTEST_CONFIG_HPP

#include <string>

namespace ConfluenceScalper {
namespace Config {

struct BacktestConfig {
    // ========================================================================
    // ACCOUNT AND COSTS
    // ========================================================================

    double initial_equity = 10000.0;                 // Starting account equity in USD
    double spread = 0.25;                            // Round-trip spread in USD; half is paid on entry
    double commission = 2.0;                         // USD commission charged per trade on entry

    // ========================================================================
    // REPLAY WINDOW
    // ========================================================================

    int warmup_bars = 250;                           // Bars reserved for indicator warm-up
    int minimum_bar_buffer = 10;                     // Extra bars required beyond warm-up
    bool apply_trailing_stop = false;                // Ratchet stops with the risk manager during replay

    // ========================================================================
    // INPUT AND OUTPUT
    // ========================================================================

    std::string data_file = "";                      // CSV bar file (empty uses synthetic bars)
    int synthetic_bar_count = 5000;                  // Bars produced by the synthetic generator
    unsigned int synthetic_seed = 42;                // Seed for the synthetic generator
    double synthetic_start_price = 2350.0;           // First synthetic close
    std::string synthetic_start_time = "2024-01-01T00:00:00Z"; // First synthetic bar time (UTC)
    std::string results_file = "logs/backtest_results.json"; // JSON results output path
    int equity_curve_rows = 12;                      // ASCII equity curve height
    int equity_curve_columns = 60;                   // ASCII equity curve width
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // BACKTEST_CONFIG_HPP
