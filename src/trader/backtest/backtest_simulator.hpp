#ifndef BACKTEST_SIMULATOR_HPP
#define BACKTEST_SIMULATOR_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicator_provider.hpp"

namespace ConfluenceScalper {
namespace Backtest {

// Raised when the series is shorter than warm-up plus the minimum buffer
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& message) : std::runtime_error(message) {}
};

struct ExitDecision {
    bool triggered;
    double exit_price;
    Core::CloseReason reason;

    ExitDecision() : triggered(false), exit_price(0.0), reason(Core::CloseReason::STOP_LOSS) {}
};

// Stop and target test against the next bar's range. The stop wins when both are touched;
// the exit fills at the level itself. A moved stop reports TRAILING_STOP.
ExitDecision evaluate_exit(const Core::OpenPosition& position, const Core::Bar& next_bar);

/**
 * Walk-forward replay of the signal generator and risk manager over one bar series.
 * Decisions at bar i see bars 0..i and the trend buckets closed by then; fills happen
 * at the open of bar i+1 plus half the spread. One position at a time.
 * Deterministic: the same bars and configuration produce the same results.
 */
class BacktestSimulator {
public:
    BacktestSimulator(const Config::SystemConfig& system_config,
                      const Core::IndicatorProviderInterface& indicator_provider);

    // Throws InsufficientDataError on short input and std::invalid_argument when timestamps
    // are not strictly increasing
    Core::BacktestResults run(const std::vector<Core::Bar>& historical_bars) const;

    size_t minimum_required_bars() const;

private:
    const Config::SystemConfig& config;
    const Core::IndicatorProviderInterface& indicators;

    bool is_in_session(const Core::TimePoint& bar_time) const;
    Core::ClosedTrade close_position(const Core::OpenPosition& position, const Core::TimePoint& exit_time,
                                     double exit_price, Core::CloseReason reason) const;
};

} // namespace Backtest
} // namespace ConfluenceScalper

#endif // BACKTEST_SIMULATOR_HPP
