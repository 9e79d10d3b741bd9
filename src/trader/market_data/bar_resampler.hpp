#ifndef BAR_RESAMPLER_HPP
#define BAR_RESAMPLER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <vector>

namespace ConfluenceScalper {
namespace MarketData {

// One coarse bucket and the span of source bars it aggregates
struct ResampledBar {
    Core::Bar bar;                     // Timestamp is the bucket start
    size_t first_source_index;
    size_t last_source_index;
    Core::TimePoint bucket_end;
};

/**
 * Groups bars into UTC buckets of bucket_minutes: open of the first bar, highest high,
 * lowest low, close of the last bar and summed volume. Source bars must be time ordered.
 */
std::vector<ResampledBar> resample_bars(const std::vector<Core::Bar>& source_bars, int bucket_minutes);

/**
 * Number of leading buckets that are closed as of the source bar at current_index:
 * every member bar is at or before current_index and the bucket has ended by the time
 * that bar closes. Scanning starts after already_visible buckets.
 */
size_t count_closed_buckets(const std::vector<ResampledBar>& buckets, size_t current_index,
                            const Core::TimePoint& current_bar_time, int base_bar_minutes,
                            size_t already_visible = 0);

// Bars of the resampled buckets, in order
std::vector<Core::Bar> extract_bars(const std::vector<ResampledBar>& buckets);

// Last count closed bars at timeframe_minutes built from base-width bars; throws std::invalid_argument
// when timeframe_minutes is not a positive multiple of base_bar_minutes
std::vector<Core::Bar> select_closed_bars(const std::vector<Core::Bar>& base_bars, int base_bar_minutes,
                                          int timeframe_minutes, size_t count);

} // namespace MarketData
} // namespace ConfluenceScalper

#endif // BAR_RESAMPLER_HPP
