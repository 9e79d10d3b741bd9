#ifndef RESULTS_EXPORTER_HPP
#define RESULTS_EXPORTER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceScalper {
namespace Backtest {

using json = nlohmann::json;

// {"summary": {...}, "trades": [...], "equity_curve": [...]} with ISO-8601 UTC times.
// A non-finite profit factor is written as null and read back as +infinity.
json results_to_json(const Core::BacktestResults& results);
Core::BacktestResults results_from_json(const json& results_json);

// Creates missing parent directories. Throws std::runtime_error when the file cannot be written.
void save_results(const Core::BacktestResults& results, const std::string& output_path);

// Throws std::runtime_error when the file is missing or not valid results JSON
Core::BacktestResults load_results(const std::string& input_path);

} // namespace Backtest
} // namespace ConfluenceScalper

#endif // RESULTS_EXPORTER_HPP
