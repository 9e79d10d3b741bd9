#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "indicator_config.hpp"
#include "strategy_config.hpp"
#include "risk_config.hpp"
#include "session_config.hpp"
#include "backtest_config.hpp"
#include "logging_config.hpp"

namespace ConfluenceScalper {
namespace Config {

/**
 * Main system configuration.
 * Defaults carry the XAU/USD M5 signal / M15 trend tuning; CSV files override them.
 * Components hold it by const reference once loaded.
 */
struct SystemConfig {
    IndicatorConfig indicators;        // Indicator periods and thresholds
    StrategyConfig strategy;           // Signal generation, scoring and trade levels
    RiskConfig risk;                   // Position sizing, account gates and trailing
    SessionConfig session;             // Trading session window
    BacktestConfig backtest;           // Replay costs, warm-up and output
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // SYSTEM_CONFIG_HPP
