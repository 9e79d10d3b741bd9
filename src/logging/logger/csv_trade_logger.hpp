#ifndef CSV_TRADE_LOGGER_HPP
#define CSV_TRADE_LOGGER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <fstream>
#include <string>
#include <mutex>

namespace ConfluenceScalper {
namespace Logging {

/**
 * CSV trade journal, one row per closed trade.
 * Opens in append mode; the header is written only when the file is empty, so
 * several replays can share one journal.
 */
class CSVTradeLogger {
public:
    // Throws std::runtime_error when the file cannot be opened
    explicit CSVTradeLogger(const std::string& journal_file_path);
    ~CSVTradeLogger();

    CSVTradeLogger() = delete;
    CSVTradeLogger(const CSVTradeLogger&) = delete;
    CSVTradeLogger& operator=(const CSVTradeLogger&) = delete;
    CSVTradeLogger(CSVTradeLogger&& other) noexcept;
    CSVTradeLogger& operator=(CSVTradeLogger&& other) noexcept;

    // Throws std::runtime_error on a moved-from journal
    void log_closed_trade(const Core::ClosedTrade& trade);
    void flush();

    const std::string& get_file_path() const { return file_path; }
    bool is_valid() const { return journal_open && file_stream.is_open(); }

private:
    std::string file_path;
    std::ofstream file_stream;
    std::mutex file_mutex;
    bool journal_open = false;

    void write_header();
    void require_open() const;
};

} // namespace Logging
} // namespace ConfluenceScalper

#endif // CSV_TRADE_LOGGER_HPP
