#include "structural_features.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace ConfluenceScalper {
namespace Core {

void detect_swing_points(std::vector<Bar>& bars, int window) {
    if (window < 1) {
        throw std::invalid_argument("Swing window must be >= 1, got " + std::to_string(window));
    }
    size_t window_size = static_cast<size_t>(window);

    for (auto& bar : bars) {
        bar.confirmed_swing_high.reset();
        bar.confirmed_swing_low.reset();
    }

    for (size_t confirming_index = 2 * window_size; confirming_index < bars.size(); ++confirming_index) {
        size_t pivot_index = confirming_index - window_size;
        size_t window_start = confirming_index - 2 * window_size;

        double window_high = bars[window_start].high_price;
        double window_low = bars[window_start].low_price;
        for (size_t scan_index = window_start + 1; scan_index <= confirming_index; ++scan_index) {
            window_high = std::max(window_high, bars[scan_index].high_price);
            window_low = std::min(window_low, bars[scan_index].low_price);
        }

        if (bars[pivot_index].high_price == window_high) {
            bars[confirming_index].confirmed_swing_high = bars[pivot_index].high_price;
        }
        if (bars[pivot_index].low_price == window_low) {
            bars[confirming_index].confirmed_swing_low = bars[pivot_index].low_price;
        }
    }

    std::optional<double> last_swing_high;
    std::optional<double> last_swing_low;
    for (auto& bar : bars) {
        if (bar.confirmed_swing_high.has_value()) last_swing_high = bar.confirmed_swing_high;
        if (bar.confirmed_swing_low.has_value()) last_swing_low = bar.confirmed_swing_low;
        bar.last_swing_high = last_swing_high;
        bar.last_swing_low = last_swing_low;
    }
}

TrendDirection classify_trend(const Bar& bar) {
    if (!bar.ema_fast.has_value() || !bar.ema_slow.has_value() || !bar.ema_trend.has_value()) {
        return TrendDirection::NEUTRAL;
    }
    double ema_fast = *bar.ema_fast;
    double ema_slow = *bar.ema_slow;
    double ema_trend = *bar.ema_trend;

    if (ema_fast > ema_slow && ema_slow > ema_trend && bar.close_price > ema_trend) {
        return TrendDirection::BULLISH;
    }
    if (ema_fast < ema_slow && ema_slow < ema_trend && bar.close_price < ema_trend) {
        return TrendDirection::BEARISH;
    }
    return TrendDirection::NEUTRAL;
}

void apply_trend_direction(std::vector<Bar>& bars) {
    for (auto& bar : bars) {
        bar.trend_direction = classify_trend(bar);
    }
}

DivergenceType detect_divergence(const BarSeriesView& bars, int lookback) {
    if (lookback < 2 || bars.size() < static_cast<size_t>(lookback)) {
        return DivergenceType::NONE;
    }
    BarSeriesView window = bars.last(static_cast<size_t>(lookback));
    size_t half = static_cast<size_t>(lookback) / 2;

    struct HalfExtremes {
        double close_low;
        double close_high;
        std::optional<double> rsi_low;
        std::optional<double> rsi_high;
    };

    auto extremes_of = [&window](size_t begin_index, size_t end_index) {
        HalfExtremes extremes{window[begin_index].close_price, window[begin_index].close_price, std::nullopt, std::nullopt};
        for (size_t bar_index = begin_index; bar_index < end_index; ++bar_index) {
            const Bar& bar = window[bar_index];
            extremes.close_low = std::min(extremes.close_low, bar.close_price);
            extremes.close_high = std::max(extremes.close_high, bar.close_price);
            if (bar.rsi.has_value()) {
                extremes.rsi_low = extremes.rsi_low.has_value() ? std::min(*extremes.rsi_low, *bar.rsi) : *bar.rsi;
                extremes.rsi_high = extremes.rsi_high.has_value() ? std::max(*extremes.rsi_high, *bar.rsi) : *bar.rsi;
            }
        }
        return extremes;
    };

    HalfExtremes older_half = extremes_of(0, half);
    HalfExtremes newer_half = extremes_of(half, window.size());
    if (!older_half.rsi_low.has_value() || !newer_half.rsi_low.has_value()) {
        return DivergenceType::NONE;
    }

    if (newer_half.close_low < older_half.close_low && *newer_half.rsi_low > *older_half.rsi_low) {
        return DivergenceType::BULLISH;
    }
    if (newer_half.close_high > older_half.close_high && *newer_half.rsi_high < *older_half.rsi_high) {
        return DivergenceType::BEARISH;
    }
    return DivergenceType::NONE;
}

} // namespace Core
} // namespace ConfluenceScalper
