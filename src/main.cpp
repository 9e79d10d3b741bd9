// main.cpp
#include "configs/system_config.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/market_data/csv_bar_provider.hpp"
#include "trader/market_data/mock_bar_provider.hpp"
#include "trader/strategy_analysis/indicator_provider.hpp"
#include "trader/backtest/backtest_simulator.hpp"
#include "trader/backtest/results_exporter.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "logging/logs/backtest_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include <iostream>
#include <limits>
#include <memory>
#include <thread>

using namespace ConfluenceScalper;
using ConfluenceScalper::Logging::log_message;

// =============================================================================
// COMMAND LINE
// =============================================================================

struct CommandLineOptions {
    std::string config_directory = "config";
    std::string data_file;
    bool use_mock_data = false;
    std::string results_file;
    bool show_help = false;
};

static void print_usage() {
    std::cout << "Usage: confluence_scalper [--config-dir DIR] [--data CSV] [--mock] [--results PATH]\n"
              << "  --config-dir DIR  directory holding the *_config.csv files (default: config)\n"
              << "  --data CSV        bar history to replay (overrides backtest.data_file)\n"
              << "  --mock            replay synthetic bars instead of a CSV file\n"
              << "  --results PATH    JSON results output (overrides backtest.results_file)\n";
}

static CommandLineOptions parse_command_line(int argc, char* argv[]) {
    CommandLineOptions options;
    for (int argument_index = 1; argument_index < argc; ++argument_index) {
        std::string argument = argv[argument_index];
        auto next_value = [&](const std::string& flag) -> std::string {
            if (argument_index + 1 >= argc) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return argv[++argument_index];
        };

        if (argument == "--config-dir") options.config_directory = next_value(argument);
        else if (argument == "--data") options.data_file = next_value(argument);
        else if (argument == "--mock") options.use_mock_data = true;
        else if (argument == "--results") options.results_file = next_value(argument);
        else if (argument == "--help" || argument == "-h") options.show_help = true;
        else throw std::runtime_error("Unknown argument: " + argument);
    }
    return options;
}

// =============================================================================
// LOGGING THREAD OWNERSHIP
// =============================================================================

// Stops the async logger and joins its thread on every exit path so queued lines are written
class LoggingThreadGuard {
public:
    LoggingThreadGuard(std::shared_ptr<Logging::AsyncLogger> logger, const Config::LoggingConfig& logging_config)
        : logger_ptr(logger), logging_thread(Threads::LoggingThread(logger, logging_config)) {}

    ~LoggingThreadGuard() {
        Logging::shutdown_global_logger(*logger_ptr);
        if (logging_thread.joinable()) {
            logging_thread.join();
        }
    }

    LoggingThreadGuard(const LoggingThreadGuard&) = delete;
    LoggingThreadGuard& operator=(const LoggingThreadGuard&) = delete;

private:
    std::shared_ptr<Logging::AsyncLogger> logger_ptr;
    std::thread logging_thread;
};

// =============================================================================
// REPLAY
// =============================================================================

static int run_backtest(Config::SystemConfig& config, const CommandLineOptions& options) {
    if (!options.data_file.empty()) {
        config.backtest.data_file = options.data_file;
    }
    if (!options.results_file.empty()) {
        config.backtest.results_file = options.results_file;
    }

    MarketData::BarProviderPtr bar_provider;
    if (options.use_mock_data || config.backtest.data_file.empty()) {
        bar_provider = std::make_unique<MarketData::MockBarProvider>(config.backtest, config.strategy.base_bar_minutes);
    } else {
        bar_provider = std::make_unique<MarketData::CsvBarProvider>(config.backtest.data_file, config.strategy.base_bar_minutes,
                                                                   config.backtest.initial_equity);
    }

    config.backtest.initial_equity = bar_provider->get_account_summary().equity;
    std::vector<Core::Bar> historical_bars = bar_provider->get_bars(config.strategy.base_bar_minutes,
                                                                    std::numeric_limits<size_t>::max());
    std::string data_source = bar_provider->get_provider_name() +
        (config.backtest.data_file.empty() || options.use_mock_data ? std::string(" (synthetic)") : " " + config.backtest.data_file);
    Logging::BacktestLogs::log_backtest_start(config, historical_bars.size(), data_source);

    Core::TechnicalIndicatorProvider indicator_provider(config.indicators);
    Backtest::BacktestSimulator simulator(config, indicator_provider);
    Core::BacktestResults results = simulator.run(historical_bars);

    Logging::BacktestLogs::log_performance_summary(results.summary);
    Logging::BacktestLogs::log_equity_curve(results.equity_curve, results.summary.total_trades,
                                            config.backtest.equity_curve_rows, config.backtest.equity_curve_columns);

    Backtest::save_results(results, config.backtest.results_file);
    Logging::BacktestLogs::log_results_saved(config.backtest.results_file);

    if (config.logging.enable_trade_journal) {
        std::shared_ptr<Logging::CSVTradeLogger> trade_journal = Logging::initialize_csv_trade_logger(config.logging.trade_journal_file);
        for (const auto& trade : results.trades) {
            trade_journal->log_closed_trade(trade);
        }
        trade_journal->flush();
        LOG_THREAD_CONTENT("Trade journal written to " + trade_journal->get_file_path());
    }
    return 0;
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    Logging::LoggingContext logging_context;
    Logging::set_logging_context(logging_context);

    try {
        CommandLineOptions options = parse_command_line(argc, argv);
        if (options.show_help) {
            print_usage();
            return 0;
        }

        Config::SystemConfig config;
        if (load_system_config(config, options.config_directory) != 0) {
            std::cerr << "Fatal error: configuration could not be loaded from " << options.config_directory << std::endl;
            return 1;
        }

        std::shared_ptr<Logging::AsyncLogger> logger = Logging::initialize_application_foundation(config);
        LoggingThreadGuard logging_thread_guard(logger, config.logging);

        try {
            return run_backtest(config, options);
        } catch (const std::exception& backtest_exception_error) {
            Logging::BacktestLogs::log_backtest_error(backtest_exception_error.what());
            return 1;
        }
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
