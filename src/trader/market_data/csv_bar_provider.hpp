#ifndef CSV_BAR_PROVIDER_HPP
#define CSV_BAR_PROVIDER_HPP

#include "bar_provider_interface.hpp"
#include <string>
#include <vector>

namespace ConfluenceScalper {
namespace MarketData {

/**
 * Reads "time,open,high,low,close[,volume]" history with a header row. Columns are matched
 * by header name; time is ISO-8601 UTC or epoch seconds. Rows are sorted by time.
 * Throws std::runtime_error naming the line for malformed rows, non-positive prices,
 * inverted ranges or duplicate timestamps.
 */
std::vector<Core::Bar> load_bars_from_csv(const std::string& csv_path);

class CsvBarProvider : public BarProviderInterface {
public:
    CsvBarProvider(const std::string& csv_path, int base_bar_minutes, double account_equity);

    std::vector<Core::Bar> get_bars(int timeframe_minutes, size_t count) const override;
    Core::AccountSummary get_account_summary() const override;
    std::vector<Core::BrokerPositionView> get_open_positions() const override;
    std::string get_provider_name() const override { return "CSV"; }

    const std::vector<Core::Bar>& get_all_bars() const { return bars; }

private:
    std::string source_path;
    int base_bar_minutes;
    double account_equity;
    std::vector<Core::Bar> bars;
};

} // namespace MarketData
} // namespace ConfluenceScalper

#endif // CSV_BAR_PROVIDER_HPP
