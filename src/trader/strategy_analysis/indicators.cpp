#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ConfluenceScalper {
namespace Core {

namespace {

void require_positive_period(int period, const char* indicator_name) {
    if (period <= 0) {
        throw std::invalid_argument(std::string(indicator_name) + " period must be positive, got " + std::to_string(period));
    }
}

void require_matching_lengths(const std::vector<double>& highs, const std::vector<double>& lows, const std::vector<double>& closes) {
    if (highs.size() != lows.size() || highs.size() != closes.size()) {
        throw std::invalid_argument("Price vector size mismatch - highs:" + std::to_string(highs.size()) +
                                    ", lows:" + std::to_string(lows.size()) + ", closes:" + std::to_string(closes.size()));
    }
}

} // anonymous namespace

IndicatorSeries compute_ema_series(const std::vector<double>& values, int period) {
    IndicatorSeries source_series(values.begin(), values.end());
    return compute_ema_series(source_series, period);
}

IndicatorSeries compute_ema_series(const IndicatorSeries& values, int period) {
    require_positive_period(period, "EMA");
    IndicatorSeries ema_values(values.size());

    size_t first_defined_index = 0;
    while (first_defined_index < values.size() && !values[first_defined_index].has_value()) {
        ++first_defined_index;
    }
    size_t seed_index = first_defined_index + static_cast<size_t>(period) - 1;
    if (seed_index >= values.size()) {
        return ema_values;
    }

    double seed_sum = 0.0;
    for (size_t value_index = first_defined_index; value_index <= seed_index; ++value_index) {
        if (!values[value_index].has_value()) {
            throw std::invalid_argument("EMA input has a gap at index " + std::to_string(value_index));
        }
        seed_sum += *values[value_index];
    }

    double multiplier = 2.0 / (period + 1.0);
    double ema_value = seed_sum / period;
    ema_values[seed_index] = ema_value;
    for (size_t value_index = seed_index + 1; value_index < values.size(); ++value_index) {
        if (!values[value_index].has_value()) {
            throw std::invalid_argument("EMA input has a gap at index " + std::to_string(value_index));
        }
        ema_value = (*values[value_index] * multiplier) + (ema_value * (1.0 - multiplier));
        ema_values[value_index] = ema_value;
    }
    return ema_values;
}

IndicatorSeries compute_sma_series(const IndicatorSeries& values, int period) {
    require_positive_period(period, "SMA");
    IndicatorSeries sma_values(values.size());
    double window_sum = 0.0;
    int defined_in_window = 0;

    for (size_t value_index = 0; value_index < values.size(); ++value_index) {
        if (values[value_index].has_value()) {
            window_sum += *values[value_index];
            ++defined_in_window;
        }
        if (value_index >= static_cast<size_t>(period)) {
            const auto& leaving_value = values[value_index - period];
            if (leaving_value.has_value()) {
                window_sum -= *leaving_value;
                --defined_in_window;
            }
        }
        if (defined_in_window == period) {
            sma_values[value_index] = window_sum / period;
        }
    }
    return sma_values;
}

IndicatorSeries compute_rsi_series(const std::vector<double>& closes, int period) {
    require_positive_period(period, "RSI");
    IndicatorSeries rsi_values(closes.size());
    if (closes.size() <= static_cast<size_t>(period)) {
        return rsi_values;
    }

    double average_gain = 0.0;
    double average_loss = 0.0;
    for (size_t close_index = 1; close_index <= static_cast<size_t>(period); ++close_index) {
        double change = closes[close_index] - closes[close_index - 1];
        if (change > 0) {
            average_gain += change;
        } else {
            average_loss -= change;
        }
    }
    average_gain /= period;
    average_loss /= period;

    auto rsi_from_averages = [](double gain, double loss) {
        if (loss == 0.0) {
            return 100.0;
        }
        double relative_strength = gain / loss;
        return 100.0 - (100.0 / (1.0 + relative_strength));
    };

    rsi_values[period] = rsi_from_averages(average_gain, average_loss);
    for (size_t close_index = static_cast<size_t>(period) + 1; close_index < closes.size(); ++close_index) {
        double change = closes[close_index] - closes[close_index - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        average_gain = (average_gain * (period - 1) + gain) / period;
        average_loss = (average_loss * (period - 1) + loss) / period;
        rsi_values[close_index] = rsi_from_averages(average_gain, average_loss);
    }
    return rsi_values;
}

IndicatorSeries compute_slope_series(const IndicatorSeries& values, int bars) {
    require_positive_period(bars, "Slope");
    IndicatorSeries slope_values(values.size());
    for (size_t value_index = static_cast<size_t>(bars); value_index < values.size(); ++value_index) {
        const auto& current_value = values[value_index];
        const auto& earlier_value = values[value_index - bars];
        if (current_value.has_value() && earlier_value.has_value()) {
            slope_values[value_index] = *current_value - *earlier_value;
        }
    }
    return slope_values;
}

MacdSeries compute_macd_series(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period) {
    if (fast_period >= slow_period) {
        throw std::invalid_argument("MACD fast period must be shorter than slow period");
    }
    IndicatorSeries fast_ema = compute_ema_series(closes, fast_period);
    IndicatorSeries slow_ema = compute_ema_series(closes, slow_period);

    MacdSeries macd;
    macd.line.resize(closes.size());
    macd.histogram.resize(closes.size());
    for (size_t close_index = 0; close_index < closes.size(); ++close_index) {
        if (fast_ema[close_index].has_value() && slow_ema[close_index].has_value()) {
            macd.line[close_index] = *fast_ema[close_index] - *slow_ema[close_index];
        }
    }

    macd.signal = compute_ema_series(macd.line, signal_period);
    for (size_t close_index = 0; close_index < closes.size(); ++close_index) {
        if (macd.line[close_index].has_value() && macd.signal[close_index].has_value()) {
            macd.histogram[close_index] = *macd.line[close_index] - *macd.signal[close_index];
        }
    }
    return macd;
}

StochasticSeries compute_stochastic_series(const std::vector<double>& highs, const std::vector<double>& lows,
                                           const std::vector<double>& closes, int k_period, int d_period) {
    require_positive_period(k_period, "Stochastic %K");
    require_positive_period(d_period, "Stochastic %D");
    require_matching_lengths(highs, lows, closes);

    IndicatorSeries raw_k(closes.size());
    for (size_t bar_index = static_cast<size_t>(k_period) - 1; bar_index < closes.size(); ++bar_index) {
        size_t window_start = bar_index + 1 - k_period;
        double highest_high = *std::max_element(highs.begin() + window_start, highs.begin() + bar_index + 1);
        double lowest_low = *std::min_element(lows.begin() + window_start, lows.begin() + bar_index + 1);
        double price_range = highest_high - lowest_low;
        raw_k[bar_index] = price_range > 0.0 ? 100.0 * (closes[bar_index] - lowest_low) / price_range : 50.0;
    }

    StochasticSeries stochastic;
    stochastic.percent_d = compute_sma_series(raw_k, d_period);
    stochastic.percent_k.resize(closes.size());
    for (size_t bar_index = 0; bar_index < closes.size(); ++bar_index) {
        if (stochastic.percent_d[bar_index].has_value()) {
            stochastic.percent_k[bar_index] = raw_k[bar_index];
        }
    }
    return stochastic;
}

IndicatorSeries compute_atr_series(const std::vector<double>& highs, const std::vector<double>& lows,
                                   const std::vector<double>& closes, int period) {
    require_positive_period(period, "ATR");
    require_matching_lengths(highs, lows, closes);
    IndicatorSeries atr_values(closes.size());
    if (closes.size() <= static_cast<size_t>(period)) {
        return atr_values;
    }

    auto true_range_at = [&](size_t bar_index) {
        return std::max({highs[bar_index] - lows[bar_index],
                         std::abs(highs[bar_index] - closes[bar_index - 1]),
                         std::abs(lows[bar_index] - closes[bar_index - 1])});
    };

    double atr_value = 0.0;
    for (size_t bar_index = 1; bar_index <= static_cast<size_t>(period); ++bar_index) {
        atr_value += true_range_at(bar_index);
    }
    atr_value /= period;
    atr_values[period] = atr_value;

    for (size_t bar_index = static_cast<size_t>(period) + 1; bar_index < closes.size(); ++bar_index) {
        atr_value = (atr_value * (period - 1) + true_range_at(bar_index)) / period;
        atr_values[bar_index] = atr_value;
    }
    return atr_values;
}

BollingerSeries compute_bollinger_series(const std::vector<double>& closes, int period, double std_dev_multiplier) {
    require_positive_period(period, "Bollinger");
    BollingerSeries bands;
    bands.upper.resize(closes.size());
    bands.middle.resize(closes.size());
    bands.lower.resize(closes.size());
    bands.percent_b.resize(closes.size());

    for (size_t close_index = static_cast<size_t>(period) - 1; close_index < closes.size(); ++close_index) {
        size_t window_start = close_index + 1 - period;
        double window_sum = 0.0;
        for (size_t window_index = window_start; window_index <= close_index; ++window_index) {
            window_sum += closes[window_index];
        }
        double window_mean = window_sum / period;

        double squared_deviation_sum = 0.0;
        for (size_t window_index = window_start; window_index <= close_index; ++window_index) {
            double deviation = closes[window_index] - window_mean;
            squared_deviation_sum += deviation * deviation;
        }
        double standard_deviation = std::sqrt(squared_deviation_sum / period);

        double upper_band = window_mean + std_dev_multiplier * standard_deviation;
        double lower_band = window_mean - std_dev_multiplier * standard_deviation;
        double band_width = upper_band - lower_band;

        bands.upper[close_index] = upper_band;
        bands.middle[close_index] = window_mean;
        bands.lower[close_index] = lower_band;
        bands.percent_b[close_index] = band_width > 0.0 ? (closes[close_index] - lower_band) / band_width : 0.5;
    }
    return bands;
}

} // namespace Core
} // namespace ConfluenceScalper
