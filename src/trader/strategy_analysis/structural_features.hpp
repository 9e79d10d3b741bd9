#ifndef STRUCTURAL_FEATURES_HPP
#define STRUCTURAL_FEATURES_HPP

#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceScalper {
namespace Core {

/**
 * Fractal swing pivots without lookahead.
 * The pivot at bar p is a swing high when its high is the maximum of bars [p - window, p + window]
 * (swing low: minimum low). It is only knowable once bar p + window has closed, so the level is
 * written to confirmed_swing_* on that confirming bar and forward-filled into last_swing_*.
 */
void detect_swing_points(std::vector<Bar>& bars, int window);

// BULLISH when ema_fast > ema_slow > ema_trend and close > ema_trend, BEARISH on the mirror,
// NEUTRAL otherwise or while any average is missing.
TrendDirection classify_trend(const Bar& bar);

void apply_trend_direction(std::vector<Bar>& bars);

/**
 * RSI divergence over the last lookback bars, split into an older and a newer half.
 * Lower close low with a higher RSI low is bullish; otherwise a higher close high with a
 * lower RSI high is bearish. Bars without RSI are skipped; a half with no RSI yields NONE.
 */
DivergenceType detect_divergence(const BarSeriesView& bars, int lookback);

} // namespace Core
} // namespace ConfluenceScalper

#endif // STRUCTURAL_FEATURES_HPP
