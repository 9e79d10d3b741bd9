// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace ConfluenceScalper {
namespace Config {

struct LoggingConfig {
    std::string log_directory = "runtime_logs";      // Parent folder for per-run log folders
    std::string log_file = "confluence_scalper.log"; // Run log file name
    std::string trade_journal_file = "trades.csv";   // Trade journal file name inside the run folder
    bool enable_trade_journal = true;                // Write the CSV trade journal
    bool log_signal_details = false;                 // Log every accepted signal during replay
    int logging_poll_interval_ms = 100;              // Logging thread queue poll interval
};

} // namespace Config
} // namespace ConfluenceScalper

#endif // LOGGING_CONFIG_HPP
