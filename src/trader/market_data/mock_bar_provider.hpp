#ifndef MOCK_BAR_PROVIDER_HPP
#define MOCK_BAR_PROVIDER_HPP

#include "bar_provider_interface.hpp"
#include "configs/backtest_config.hpp"
#include <vector>

namespace ConfluenceScalper {
namespace MarketData {

struct SyntheticBarSettings {
    size_t bar_count;
    unsigned int seed;
    double start_price;
    Core::TimePoint start_time;
    int bar_minutes;
};

/**
 * Gold-like random walk: alternating trend legs of 120-300 bars drifting 0.25 per bar
 * with +/-1.50 noise and wicks biased against the leg. Same settings, same bars.
 */
std::vector<Core::Bar> generate_synthetic_bars(const SyntheticBarSettings& settings);

// Offline provider backed by synthetic bars; reports a flat account at the configured equity
class MockBarProvider : public BarProviderInterface {
public:
    MockBarProvider(const Config::BacktestConfig& backtest_config, int base_bar_minutes);

    std::vector<Core::Bar> get_bars(int timeframe_minutes, size_t count) const override;
    Core::AccountSummary get_account_summary() const override;
    std::vector<Core::BrokerPositionView> get_open_positions() const override;
    std::string get_provider_name() const override { return "MOCK"; }

    const std::vector<Core::Bar>& get_all_bars() const { return bars; }

private:
    const Config::BacktestConfig& config;
    int base_bar_minutes;
    std::vector<Core::Bar> bars;
};

} // namespace MarketData
} // namespace ConfluenceScalper

#endif // MOCK_BAR_PROVIDER_HPP
