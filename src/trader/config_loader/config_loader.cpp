#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/logging_macros.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>
#include <cmath>

using ConfluenceScalper::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& config_key, const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("Invalid boolean for " + config_key + ": '" + input_value + "'");
    }

    inline int to_int(const std::string& config_key, const std::string& input_value) {
        size_t parsed_characters = 0;
        int parsed_value = 0;
        try {
            parsed_value = std::stoi(input_value, &parsed_characters);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + config_key + ": '" + input_value + "'");
        }
        if (parsed_characters != input_value.size()) {
            throw std::runtime_error("Invalid integer for " + config_key + ": '" + input_value + "'");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& config_key, const std::string& input_value) {
        size_t parsed_characters = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(input_value, &parsed_characters);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for " + config_key + ": '" + input_value + "'");
        }
        if (parsed_characters != input_value.size() || !std::isfinite(parsed_value)) {
            throw std::runtime_error("Invalid number for " + config_key + ": '" + input_value + "'");
        }
        return parsed_value;
    }

    // Returns false when the key is not an indicator.* key
    bool apply_indicator_key(ConfluenceScalper::Config::IndicatorConfig& indicators, const std::string& key, const std::string& value) {
        if (key == "indicator.ema_fast_period") indicators.ema_fast_period = to_int(key, value);
        else if (key == "indicator.ema_slow_period") indicators.ema_slow_period = to_int(key, value);
        else if (key == "indicator.ema_trend_period") indicators.ema_trend_period = to_int(key, value);
        else if (key == "indicator.rsi_period") indicators.rsi_period = to_int(key, value);
        else if (key == "indicator.rsi_slope_bars") indicators.rsi_slope_bars = to_int(key, value);
        else if (key == "indicator.macd_fast_period") indicators.macd_fast_period = to_int(key, value);
        else if (key == "indicator.macd_slow_period") indicators.macd_slow_period = to_int(key, value);
        else if (key == "indicator.macd_signal_period") indicators.macd_signal_period = to_int(key, value);
        else if (key == "indicator.stochastic_k_period") indicators.stochastic_k_period = to_int(key, value);
        else if (key == "indicator.stochastic_d_period") indicators.stochastic_d_period = to_int(key, value);
        else if (key == "indicator.atr_period") indicators.atr_period = to_int(key, value);
        else if (key == "indicator.bollinger_period") indicators.bollinger_period = to_int(key, value);
        else if (key == "indicator.bollinger_std_dev") indicators.bollinger_std_dev = to_double(key, value);
        else if (key == "indicator.swing_window") indicators.swing_window = to_int(key, value);
        else return false;
        return true;
    }

    bool apply_strategy_key(ConfluenceScalper::Config::StrategyConfig& strategy, const std::string& key, const std::string& value) {
        // Instrument and timeframes
        if (key == "strategy.symbol") strategy.symbol = value;
        else if (key == "strategy.base_bar_minutes") strategy.base_bar_minutes = to_int(key, value);
        else if (key == "strategy.higher_timeframe_minutes") strategy.higher_timeframe_minutes = to_int(key, value);
        else if (key == "strategy.min_signal_bars") strategy.min_signal_bars = to_int(key, value);
        else if (key == "strategy.min_trend_bars") strategy.min_trend_bars = to_int(key, value);

        // Volatility gate
        else if (key == "strategy.min_atr") strategy.min_atr = to_double(key, value);
        else if (key == "strategy.max_atr") strategy.max_atr = to_double(key, value);

        // Confluence scoring
        else if (key == "strategy.min_confluence_score") strategy.min_confluence_score = to_int(key, value);
        else if (key == "strategy.counter_trend_score_offset") strategy.counter_trend_score_offset = to_int(key, value);
        else if (key == "strategy.rsi_overbought") strategy.rsi_overbought = to_double(key, value);
        else if (key == "strategy.rsi_oversold") strategy.rsi_oversold = to_double(key, value);
        else if (key == "strategy.rsi_pullback_midline") strategy.rsi_pullback_midline = to_double(key, value);
        else if (key == "strategy.stochastic_overbought") strategy.stochastic_overbought = to_double(key, value);
        else if (key == "strategy.stochastic_oversold") strategy.stochastic_oversold = to_double(key, value);
        else if (key == "strategy.band_proximity_atr_multiple") strategy.band_proximity_atr_multiple = to_double(key, value);
        else if (key == "strategy.swing_proximity_atr_multiple") strategy.swing_proximity_atr_multiple = to_double(key, value);
        else if (key == "strategy.divergence_lookback_bars") strategy.divergence_lookback_bars = to_int(key, value);

        // Trade levels
        else if (key == "strategy.min_risk_reward") strategy.min_risk_reward = to_double(key, value);
        else if (key == "strategy.sl_atr_multiple") strategy.sl_atr_multiple = to_double(key, value);
        else if (key == "strategy.tp_reward_multiple") strategy.tp_reward_multiple = to_double(key, value);
        else if (key == "strategy.structural_stop_buffer_atr_multiple") strategy.structural_stop_buffer_atr_multiple = to_double(key, value);
        else if (key == "strategy.min_stop_distance_atr_multiple") strategy.min_stop_distance_atr_multiple = to_double(key, value);
        else if (key == "strategy.price_precision") strategy.price_precision = to_int(key, value);
        else return false;
        return true;
    }

    bool apply_risk_key(ConfluenceScalper::Config::RiskConfig& risk, const std::string& key, const std::string& value) {
        if (key == "risk.max_risk_pct") risk.max_risk_pct = to_double(key, value);
        else if (key == "risk.max_risk_usd") risk.max_risk_usd = to_double(key, value);
        else if (key == "risk.min_units") risk.min_units = to_int(key, value);
        else if (key == "risk.max_open_positions") risk.max_open_positions = to_int(key, value);
        else if (key == "risk.max_daily_drawdown_pct") risk.max_daily_drawdown_pct = to_double(key, value);
        else if (key == "risk.max_daily_loss_usd") risk.max_daily_loss_usd = to_double(key, value);
        else if (key == "risk.max_trades_per_day") risk.max_trades_per_day = to_int(key, value);
        else if (key == "risk.cooldown_minutes") risk.cooldown_minutes = to_int(key, value);
        else if (key == "risk.trail_activation_atr_multiple") risk.trail_activation_atr_multiple = to_double(key, value);
        else if (key == "risk.trail_distance_atr_multiple") risk.trail_distance_atr_multiple = to_double(key, value);
        else if (key == "risk.breakeven_offset") risk.breakeven_offset = to_double(key, value);
        else if (key == "risk.currency_precision") risk.currency_precision = to_int(key, value);
        else if (key == "risk.percentage_precision") risk.percentage_precision = to_int(key, value);
        else return false;
        return true;
    }

    bool apply_session_key(ConfluenceScalper::Config::SessionConfig& session, const std::string& key, const std::string& value) {
        if (key == "session.start_hour_utc") session.session_start_hour_utc = to_int(key, value);
        else if (key == "session.end_hour_utc") session.session_end_hour_utc = to_int(key, value);
        else return false;
        return true;
    }

    bool apply_backtest_key(ConfluenceScalper::Config::BacktestConfig& backtest, const std::string& key, const std::string& value) {
        if (key == "backtest.initial_equity") backtest.initial_equity = to_double(key, value);
        else if (key == "backtest.spread") backtest.spread = to_double(key, value);
        else if (key == "backtest.commission") backtest.commission = to_double(key, value);
        else if (key == "backtest.warmup_bars") backtest.warmup_bars = to_int(key, value);
        else if (key == "backtest.minimum_bar_buffer") backtest.minimum_bar_buffer = to_int(key, value);
        else if (key == "backtest.apply_trailing_stop") backtest.apply_trailing_stop = to_bool(key, value);
        else if (key == "backtest.data_file") backtest.data_file = value;
        else if (key == "backtest.synthetic_bar_count") backtest.synthetic_bar_count = to_int(key, value);
        else if (key == "backtest.synthetic_seed") backtest.synthetic_seed = static_cast<unsigned int>(to_int(key, value));
        else if (key == "backtest.synthetic_start_price") backtest.synthetic_start_price = to_double(key, value);
        else if (key == "backtest.synthetic_start_time") backtest.synthetic_start_time = value;
        else if (key == "backtest.results_file") backtest.results_file = value;
        else if (key == "backtest.equity_curve_rows") backtest.equity_curve_rows = to_int(key, value);
        else if (key == "backtest.equity_curve_columns") backtest.equity_curve_columns = to_int(key, value);
        else return false;
        return true;
    }

    bool apply_logging_key(ConfluenceScalper::Config::LoggingConfig& logging, const std::string& key, const std::string& value) {
        if (key == "logging.log_directory") logging.log_directory = value;
        else if (key == "logging.log_file") logging.log_file = value;
        else if (key == "logging.trade_journal_file") logging.trade_journal_file = value;
        else if (key == "logging.enable_trade_journal") logging.enable_trade_journal = to_bool(key, value);
        else if (key == "logging.log_signal_details") logging.log_signal_details = to_bool(key, value);
        else if (key == "logging.logging_poll_interval_ms") logging.logging_poll_interval_ms = to_int(key, value);
        else return false;
        return true;
    }
}

bool load_config_from_csv(ConfluenceScalper::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) {
            throw std::runtime_error("Missing value for " + trim(config_key_string) + " at " + csv_path + ":" + std::to_string(line_number));
        }
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            bool key_applied = apply_indicator_key(cfg.indicators, config_key_string, config_value_string)
                || apply_strategy_key(cfg.strategy, config_key_string, config_value_string)
                || apply_risk_key(cfg.risk, config_key_string, config_value_string)
                || apply_session_key(cfg.session, config_key_string, config_value_string)
                || apply_backtest_key(cfg.backtest, config_key_string, config_value_string)
                || apply_logging_key(cfg.logging, config_key_string, config_value_string);

            if (!key_applied) {
                log_message("WARNING: Unknown config key ignored: " + config_key_string + " (" + csv_path + ")", "");
            }
        } catch (const std::exception& line_exception_error) {
            log_message("CRITICAL: Error parsing config line " + std::to_string(line_number) + " of " + csv_path + " - " + std::string(line_exception_error.what()), "");
            throw std::runtime_error(std::string(line_exception_error.what()) + " at " + csv_path + ":" + std::to_string(line_number));
        }
    }
    return true;
}

int load_system_config(ConfluenceScalper::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        "strategy_config.csv",
        "risk_config.csv",
        "backtest_config.csv",
        "logging_config.csv"
    };

    for (const auto& config_file_name : config_files) {
        std::filesystem::path config_path = std::filesystem::path(config_directory) / config_file_name;
        if (!std::filesystem::exists(config_path)) {
            log_message("Config file not found, keeping defaults: " + config_path.string(), "");
            continue;
        }
        try {
            if (!load_config_from_csv(config, config_path.string())) {
                log_message("ERROR: Failed to open config CSV " + config_path.string(), "");
                return 1;
            }
        } catch (const std::exception& config_exception_error) {
            log_message("ERROR: Failed to load config CSV " + config_path.string() + ": " + config_exception_error.what(), "");
            return 1;
        }
    }

    // Validate configuration completeness
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const ConfluenceScalper::Config::SystemConfig& config, std::string& error_message) {
    const auto& indicators = config.indicators;
    const auto& strategy = config.strategy;
    const auto& risk = config.risk;
    const auto& session = config.session;
    const auto& backtest = config.backtest;

    // Indicator periods
    if (indicators.ema_fast_period < 1 || indicators.ema_slow_period < 1 || indicators.ema_trend_period < 1) {
        error_message = "indicator EMA periods must be >= 1";
        return false;
    }
    if (!(indicators.ema_fast_period < indicators.ema_slow_period && indicators.ema_slow_period < indicators.ema_trend_period)) {
        error_message = "indicator EMA periods must satisfy fast < slow < trend";
        return false;
    }
    if (indicators.rsi_period < 1 || indicators.rsi_slope_bars < 1) {
        error_message = "indicator.rsi_period and indicator.rsi_slope_bars must be >= 1";
        return false;
    }
    if (indicators.macd_fast_period < 1 || indicators.macd_fast_period >= indicators.macd_slow_period || indicators.macd_signal_period < 1) {
        error_message = "indicator MACD periods must satisfy 1 <= fast < slow and signal >= 1";
        return false;
    }
    if (indicators.stochastic_k_period < 1 || indicators.stochastic_d_period < 1) {
        error_message = "indicator stochastic periods must be >= 1";
        return false;
    }
    if (indicators.atr_period < 1 || indicators.bollinger_period < 2 || indicators.bollinger_std_dev <= 0.0) {
        error_message = "indicator.atr_period must be >= 1, indicator.bollinger_period >= 2 and indicator.bollinger_std_dev > 0";
        return false;
    }
    if (indicators.swing_window < 1) {
        error_message = "indicator.swing_window must be >= 1";
        return false;
    }

    // Strategy
    if (strategy.symbol.empty()) {
        error_message = "strategy.symbol missing";
        return false;
    }
    if (strategy.base_bar_minutes < 1 || strategy.higher_timeframe_minutes < strategy.base_bar_minutes) {
        error_message = "strategy.base_bar_minutes must be >= 1 and strategy.higher_timeframe_minutes >= base_bar_minutes";
        return false;
    }
    if (strategy.higher_timeframe_minutes % strategy.base_bar_minutes != 0) {
        error_message = "strategy.higher_timeframe_minutes must be a multiple of strategy.base_bar_minutes";
        return false;
    }
    if (strategy.min_signal_bars < 1 || strategy.min_trend_bars < 1) {
        error_message = "strategy.min_signal_bars and strategy.min_trend_bars must be >= 1";
        return false;
    }
    if (strategy.min_atr < 0.0 || strategy.max_atr <= strategy.min_atr) {
        error_message = "strategy ATR gate must satisfy 0 <= min_atr < max_atr";
        return false;
    }
    if (strategy.min_confluence_score < 1 || strategy.min_confluence_score > 5 || strategy.counter_trend_score_offset < 0) {
        error_message = "strategy.min_confluence_score must be within [1, 5] and counter_trend_score_offset >= 0";
        return false;
    }
    if (strategy.rsi_oversold >= strategy.rsi_overbought || strategy.stochastic_oversold >= strategy.stochastic_overbought) {
        error_message = "strategy oscillator zones must satisfy oversold < overbought";
        return false;
    }
    if (strategy.divergence_lookback_bars < 2) {
        error_message = "strategy.divergence_lookback_bars must be >= 2";
        return false;
    }
    if (strategy.min_risk_reward <= 0.0 || strategy.sl_atr_multiple <= 0.0 || strategy.tp_reward_multiple <= 0.0) {
        error_message = "strategy.min_risk_reward, sl_atr_multiple and tp_reward_multiple must be > 0";
        return false;
    }
    if (strategy.min_stop_distance_atr_multiple <= 0.0 || strategy.structural_stop_buffer_atr_multiple < 0.0) {
        error_message = "strategy.min_stop_distance_atr_multiple must be > 0 and structural_stop_buffer_atr_multiple >= 0";
        return false;
    }
    if (strategy.price_precision < 0 || strategy.price_precision > 8) {
        error_message = "strategy.price_precision must be within [0, 8]";
        return false;
    }

    // Risk
    if (risk.max_risk_pct <= 0.0 || risk.max_risk_pct > 100.0 || risk.max_risk_usd <= 0.0) {
        error_message = "risk.max_risk_pct must be within (0, 100] and risk.max_risk_usd > 0";
        return false;
    }
    if (risk.min_units < 1 || risk.max_open_positions < 1 || risk.max_trades_per_day < 1) {
        error_message = "risk.min_units, risk.max_open_positions and risk.max_trades_per_day must be >= 1";
        return false;
    }
    if (risk.max_daily_drawdown_pct <= 0.0 || risk.max_daily_loss_usd <= 0.0 || risk.cooldown_minutes < 0) {
        error_message = "risk daily limits must be > 0 and risk.cooldown_minutes >= 0";
        return false;
    }
    if (risk.trail_activation_atr_multiple < 0.0 || risk.trail_distance_atr_multiple <= 0.0 || risk.breakeven_offset < 0.0) {
        error_message = "risk trailing parameters must be non-negative with a positive trail distance";
        return false;
    }

    // Session
    if (session.session_start_hour_utc < 0 || session.session_end_hour_utc > 24 || session.session_start_hour_utc >= session.session_end_hour_utc) {
        error_message = "session hours must satisfy 0 <= start < end <= 24";
        return false;
    }

    // Backtest
    if (backtest.initial_equity <= 0.0 || backtest.spread < 0.0 || backtest.commission < 0.0) {
        error_message = "backtest.initial_equity must be > 0 and costs >= 0";
        return false;
    }
    if (backtest.warmup_bars < 1 || backtest.minimum_bar_buffer < 1) {
        error_message = "backtest.warmup_bars and backtest.minimum_bar_buffer must be >= 1";
        return false;
    }
    if (backtest.equity_curve_rows < 2 || backtest.equity_curve_columns < 2) {
        error_message = "backtest equity curve dimensions must be >= 2";
        return false;
    }
    if (backtest.synthetic_bar_count < 1) {
        error_message = "backtest.synthetic_bar_count must be >= 1";
        return false;
    }

    if (config.logging.logging_poll_interval_ms < 1) {
        error_message = "logging.logging_poll_interval_ms must be >= 1";
        return false;
    }

    return true;
}
