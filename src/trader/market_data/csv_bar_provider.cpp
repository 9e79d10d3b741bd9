#include "csv_bar_provider.hpp"
#include "bar_resampler.hpp"
#include "logging/logger/logging_macros.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

using ConfluenceScalper::Logging::log_message;

namespace ConfluenceScalper {
namespace MarketData {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n\"";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    std::vector<std::string> split_csv_line(const std::string& csv_line) {
        std::vector<std::string> fields;
        std::stringstream line_stream(csv_line);
        std::string field_value;
        while (std::getline(line_stream, field_value, ',')) {
            fields.push_back(trim(field_value));
        }
        return fields;
    }

    double parse_price_field(const std::string& field_value, const std::string& column_name, int line_number) {
        size_t parsed_characters = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(field_value, &parsed_characters);
        } catch (const std::exception&) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " + column_name + " '" + field_value + "'");
        }
        if (parsed_characters != field_value.size() || !std::isfinite(parsed_value) || parsed_value <= 0.0) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid " + column_name + " '" + field_value + "'");
        }
        return parsed_value;
    }

    // Empty volume is 0; anything else must be a whole non-negative integer
    long long parse_volume_field(const std::string& field_value, int line_number) {
        if (field_value.empty()) {
            return 0;
        }
        size_t parsed_characters = 0;
        long long parsed_volume = 0;
        try {
            parsed_volume = std::stoll(field_value, &parsed_characters);
        } catch (const std::exception&) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid volume '" + field_value + "'");
        }
        if (parsed_characters != field_value.size() || parsed_volume < 0) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": invalid volume '" + field_value + "'");
        }
        return parsed_volume;
    }
}

std::vector<Core::Bar> load_bars_from_csv(const std::string& csv_path) {
    std::ifstream csv_file_stream(csv_path);
    if (!csv_file_stream.is_open()) {
        throw std::runtime_error("Failed to open bar CSV: " + csv_path);
    }

    std::string csv_line_string;
    if (!std::getline(csv_file_stream, csv_line_string)) {
        throw std::runtime_error("Bar CSV is empty: " + csv_path);
    }

    std::map<std::string, size_t> column_positions;
    std::vector<std::string> header_fields = split_csv_line(csv_line_string);
    for (size_t column_index = 0; column_index < header_fields.size(); ++column_index) {
        std::string column_name = header_fields[column_index];
        std::transform(column_name.begin(), column_name.end(), column_name.begin(), [](unsigned char header_character) {
            return static_cast<char>(std::tolower(header_character));
        });
        if (column_name == "timestamp" || column_name == "date" || column_name == "datetime") {
            column_name = "time";
        }
        column_positions[column_name] = column_index;
    }
    for (const char* required_column : {"time", "open", "high", "low", "close"}) {
        if (column_positions.find(required_column) == column_positions.end()) {
            throw std::runtime_error("Bar CSV " + csv_path + " is missing the '" + required_column + "' column");
        }
    }
    bool has_volume_column = column_positions.find("volume") != column_positions.end();

    std::vector<std::pair<int, Core::Bar>> parsed_rows;
    int line_number = 1;
    while (std::getline(csv_file_stream, csv_line_string)) {
        ++line_number;
        if (trim(csv_line_string).empty()) continue;

        std::vector<std::string> fields = split_csv_line(csv_line_string);
        if (fields.size() < header_fields.size() - (has_volume_column ? 1 : 0)) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": expected " + std::to_string(header_fields.size()) + " fields");
        }
        auto field_at = [&fields](size_t column_index) -> std::string {
            return column_index < fields.size() ? fields[column_index] : std::string();
        };

        Core::Bar bar;
        try {
            bar.timestamp = TimeUtils::parse_utc_timestamp(field_at(column_positions["time"]));
        } catch (const std::exception& time_exception_error) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": " + time_exception_error.what());
        }
        bar.open_price = parse_price_field(field_at(column_positions["open"]), "open", line_number);
        bar.high_price = parse_price_field(field_at(column_positions["high"]), "high", line_number);
        bar.low_price = parse_price_field(field_at(column_positions["low"]), "low", line_number);
        bar.close_price = parse_price_field(field_at(column_positions["close"]), "close", line_number);
        bar.volume = has_volume_column ? parse_volume_field(field_at(column_positions["volume"]), line_number) : 0;

        if (bar.high_price < bar.low_price) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": high below low");
        }
        parsed_rows.emplace_back(line_number, bar);
    }

    std::stable_sort(parsed_rows.begin(), parsed_rows.end(), [](const auto& left_row, const auto& right_row) {
        return left_row.second.timestamp < right_row.second.timestamp;
    });

    std::vector<Core::Bar> bars;
    bars.reserve(parsed_rows.size());
    for (size_t row_index = 0; row_index < parsed_rows.size(); ++row_index) {
        if (row_index > 0 && parsed_rows[row_index].second.timestamp == parsed_rows[row_index - 1].second.timestamp) {
            throw std::runtime_error("Line " + std::to_string(parsed_rows[row_index].first) + ": duplicate timestamp " +
                                     TimeUtils::format_iso_utc(parsed_rows[row_index].second.timestamp));
        }
        bars.push_back(parsed_rows[row_index].second);
    }
    return bars;
}

CsvBarProvider::CsvBarProvider(const std::string& csv_path, int base_bar_minutes_value, double account_equity_value)
    : source_path(csv_path), base_bar_minutes(base_bar_minutes_value), account_equity(account_equity_value),
      bars(load_bars_from_csv(csv_path)) {
    log_message("Loaded " + std::to_string(bars.size()) + " bars from " + source_path, "");
}

std::vector<Core::Bar> CsvBarProvider::get_bars(int timeframe_minutes, size_t count) const {
    return select_closed_bars(bars, base_bar_minutes, timeframe_minutes, count);
}

Core::AccountSummary CsvBarProvider::get_account_summary() const {
    Core::AccountSummary account_summary;
    account_summary.balance = account_equity;
    account_summary.equity = account_equity;
    return account_summary;
}

std::vector<Core::BrokerPositionView> CsvBarProvider::get_open_positions() const {
    return {};
}

} // namespace MarketData
} // namespace ConfluenceScalper
