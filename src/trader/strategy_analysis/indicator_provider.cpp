#include "indicator_provider.hpp"
#include "indicators.hpp"
#include "structural_features.hpp"

namespace ConfluenceScalper {
namespace Core {

TechnicalIndicatorProvider::TechnicalIndicatorProvider(const Config::IndicatorConfig& indicator_config)
    : config(indicator_config) {}

void TechnicalIndicatorProvider::enrich(std::vector<Bar>& bars) const {
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    highs.reserve(bars.size());
    lows.reserve(bars.size());
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        highs.push_back(bar.high_price);
        lows.push_back(bar.low_price);
        closes.push_back(bar.close_price);
    }

    IndicatorSeries ema_fast = compute_ema_series(closes, config.ema_fast_period);
    IndicatorSeries ema_slow = compute_ema_series(closes, config.ema_slow_period);
    IndicatorSeries ema_trend = compute_ema_series(closes, config.ema_trend_period);
    IndicatorSeries rsi = compute_rsi_series(closes, config.rsi_period);
    IndicatorSeries rsi_slope = compute_slope_series(rsi, config.rsi_slope_bars);
    MacdSeries macd = compute_macd_series(closes, config.macd_fast_period, config.macd_slow_period, config.macd_signal_period);
    StochasticSeries stochastic = compute_stochastic_series(highs, lows, closes, config.stochastic_k_period, config.stochastic_d_period);
    IndicatorSeries atr = compute_atr_series(highs, lows, closes, config.atr_period);
    BollingerSeries bollinger = compute_bollinger_series(closes, config.bollinger_period, config.bollinger_std_dev);

    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        Bar& bar = bars[bar_index];
        bar.ema_fast = ema_fast[bar_index];
        bar.ema_slow = ema_slow[bar_index];
        bar.ema_trend = ema_trend[bar_index];
        bar.rsi = rsi[bar_index];
        bar.rsi_slope = rsi_slope[bar_index];
        bar.macd_line = macd.line[bar_index];
        bar.macd_signal = macd.signal[bar_index];
        bar.macd_histogram = macd.histogram[bar_index];
        bar.stoch_k = stochastic.percent_k[bar_index];
        bar.stoch_d = stochastic.percent_d[bar_index];
        bar.atr = atr[bar_index];
        bar.bollinger_upper = bollinger.upper[bar_index];
        bar.bollinger_middle = bollinger.middle[bar_index];
        bar.bollinger_lower = bollinger.lower[bar_index];
        bar.bollinger_percent_b = bollinger.percent_b[bar_index];
    }

    detect_swing_points(bars, config.swing_window);
    apply_trend_direction(bars);
}

} // namespace Core
} // namespace ConfluenceScalper
