#include "mock_bar_provider.hpp"
#include "bar_resampler.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace ConfluenceScalper {
namespace MarketData {

namespace {

constexpr int MIN_TREND_LEG_BARS = 120;
constexpr int MAX_TREND_LEG_BARS = 300;
constexpr double TREND_DRIFT_PER_BAR = 0.25;
constexpr double NOISE_AMPLITUDE = 1.5;
constexpr double WICK_WITH_TREND = 0.5;
constexpr double WICK_AGAINST_TREND = 1.0;
constexpr long long MIN_VOLUME = 200;
constexpr long long MAX_VOLUME = 1199;

double round_to_cents(double price) {
    return std::round(price * 100.0) / 100.0;
}

} // anonymous namespace

std::vector<Core::Bar> generate_synthetic_bars(const SyntheticBarSettings& settings) {
    std::mt19937 random_engine(settings.seed);
    std::uniform_int_distribution<int> leg_length_distribution(MIN_TREND_LEG_BARS, MAX_TREND_LEG_BARS - 1);
    std::uniform_real_distribution<double> noise_distribution(-NOISE_AMPLITUDE, NOISE_AMPLITUDE);
    std::uniform_real_distribution<double> unit_distribution(0.0, 1.0);
    std::uniform_int_distribution<long long> volume_distribution(MIN_VOLUME, MAX_VOLUME);

    std::vector<Core::Bar> bars;
    bars.reserve(settings.bar_count);

    double price = settings.start_price;
    int trend_direction = 1;
    int bars_in_trend = 0;
    int trend_duration = leg_length_distribution(random_engine);

    for (size_t bar_index = 0; bar_index < settings.bar_count; ++bar_index) {
        ++bars_in_trend;
        if (bars_in_trend >= trend_duration) {
            trend_direction = -trend_direction;
            bars_in_trend = 0;
            trend_duration = leg_length_distribution(random_engine);
        }

        double price_change = trend_direction * TREND_DRIFT_PER_BAR + noise_distribution(random_engine);
        double open_price = price;
        double close_price = std::max(price + price_change, 1.0);
        double wick_up = unit_distribution(random_engine) * (trend_direction == -1 ? WICK_AGAINST_TREND : WICK_WITH_TREND);
        double wick_down = unit_distribution(random_engine) * (trend_direction == 1 ? WICK_AGAINST_TREND : WICK_WITH_TREND);
        double high_price = std::max(open_price, close_price) + wick_up;
        double low_price = std::max(std::min(open_price, close_price) - wick_down, 0.5);

        Core::TimePoint bar_time = settings.start_time + std::chrono::minutes(static_cast<long long>(settings.bar_minutes) * static_cast<long long>(bar_index));
        bars.emplace_back(bar_time, round_to_cents(open_price), round_to_cents(high_price), round_to_cents(low_price),
                          round_to_cents(close_price), volume_distribution(random_engine));
        price = close_price;
    }
    return bars;
}

MockBarProvider::MockBarProvider(const Config::BacktestConfig& backtest_config, int base_bar_minutes_value)
    : config(backtest_config), base_bar_minutes(base_bar_minutes_value) {
    SyntheticBarSettings settings;
    settings.bar_count = static_cast<size_t>(config.synthetic_bar_count);
    settings.seed = config.synthetic_seed;
    settings.start_price = config.synthetic_start_price;
    settings.start_time = TimeUtils::parse_utc_timestamp(config.synthetic_start_time);
    settings.bar_minutes = base_bar_minutes;
    bars = generate_synthetic_bars(settings);
}

std::vector<Core::Bar> MockBarProvider::get_bars(int timeframe_minutes, size_t count) const {
    return select_closed_bars(bars, base_bar_minutes, timeframe_minutes, count);
}

Core::AccountSummary MockBarProvider::get_account_summary() const {
    Core::AccountSummary account_summary;
    account_summary.balance = config.initial_equity;
    account_summary.equity = config.initial_equity;
    return account_summary;
}

std::vector<Core::BrokerPositionView> MockBarProvider::get_open_positions() const {
    return {};
}

} // namespace MarketData
} // namespace ConfluenceScalper
