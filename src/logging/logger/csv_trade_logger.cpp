#include "csv_trade_logger.hpp"
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace ConfluenceScalper {
namespace Logging {

namespace {
    // Reasons are joined with "; " and quoted so commas inside them stay in one field
    std::string quote_reasons(const std::vector<std::string>& reasons) {
        std::string joined_reasons;
        for (size_t reason_index = 0; reason_index < reasons.size(); ++reason_index) {
            if (reason_index > 0) joined_reasons += "; ";
            joined_reasons += reasons[reason_index];
        }
        std::string quoted_field = "\"";
        for (char reason_character : joined_reasons) {
            if (reason_character == '"') quoted_field += '"';
            quoted_field += reason_character;
        }
        quoted_field += "\"";
        return quoted_field;
    }
}

CSVTradeLogger::CSVTradeLogger(const std::string& journal_file_path) : file_path(journal_file_path) {
    file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Failed to open CSV trade journal: " + file_path);
    }

    file_stream.seekp(0, std::ios::end);
    if (file_stream.tellp() == 0) {
        write_header();
    }
    journal_open = true;
}

CSVTradeLogger::~CSVTradeLogger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}

CSVTradeLogger::CSVTradeLogger(CSVTradeLogger&& other) noexcept
    : file_path(std::move(other.file_path)),
      file_stream(std::move(other.file_stream)),
      file_mutex(),
      journal_open(other.journal_open) {
    other.journal_open = false;
}

CSVTradeLogger& CSVTradeLogger::operator=(CSVTradeLogger&& other) noexcept {
    if (this != &other) {
        if (file_stream.is_open()) {
            file_stream.close();
        }

        file_path = std::move(other.file_path);
        file_stream = std::move(other.file_stream);
        journal_open = other.journal_open;
        other.journal_open = false;
    }
    return *this;
}

void CSVTradeLogger::write_header() {
    file_stream << "timestamp_open,timestamp_close,direction,entry,stop_loss,take_profit,exit_price,units,"
                   "pnl_usd,pnl_pct,rr_achieved,reason_open,reason_close,score,atr,equity_before\n";
    file_stream.flush();
}

void CSVTradeLogger::require_open() const {
    if (!is_valid()) {
        throw std::runtime_error("CSV trade journal is not open: " + file_path);
    }
}

void CSVTradeLogger::log_closed_trade(const Core::ClosedTrade& trade) {
    require_open();
    std::lock_guard<std::mutex> journal_lock(file_mutex);

    double pnl_pct = trade.equity_before > 0.0 ? trade.pnl / trade.equity_before * 100.0 : 0.0;

    file_stream << TimeUtils::format_iso_utc(trade.entry_time) << ","
                << TimeUtils::format_iso_utc(trade.exit_time) << ","
                << Core::trade_direction_to_string(trade.direction) << ","
                << std::fixed << std::setprecision(2) << trade.entry_price << ","
                << trade.initial_stop_loss << ","
                << trade.take_profit << ","
                << trade.exit_price << ","
                << trade.units << ","
                << trade.pnl << ","
                << std::setprecision(3) << pnl_pct << ","
                << std::setprecision(2) << trade.r_multiple << ","
                << quote_reasons(trade.reasons) << ","
                << Core::close_reason_to_string(trade.close_reason) << ","
                << trade.confluence_score << ","
                << std::setprecision(3) << trade.atr << ","
                << std::setprecision(2) << trade.equity_before << "\n";

    file_stream.flush();
}

void CSVTradeLogger::flush() {
    std::lock_guard<std::mutex> journal_lock(file_mutex);
    if (file_stream.is_open()) {
        file_stream.flush();
    }
}

} // namespace Logging
} // namespace ConfluenceScalper
