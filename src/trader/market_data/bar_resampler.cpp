#include "bar_resampler.hpp"
#include <algorithm>
#include <stdexcept>

namespace ConfluenceScalper {
namespace MarketData {

std::vector<ResampledBar> resample_bars(const std::vector<Core::Bar>& source_bars, int bucket_minutes) {
    std::vector<ResampledBar> buckets;
    if (source_bars.empty()) {
        return buckets;
    }
    auto bucket_duration = std::chrono::minutes(bucket_minutes);

    for (size_t source_index = 0; source_index < source_bars.size(); ++source_index) {
        const Core::Bar& source_bar = source_bars[source_index];
        Core::TimePoint bucket_start = TimeUtils::floor_to_bucket(source_bar.timestamp, bucket_minutes);

        if (!buckets.empty() && buckets.back().bar.timestamp == bucket_start) {
            ResampledBar& current_bucket = buckets.back();
            current_bucket.bar.high_price = std::max(current_bucket.bar.high_price, source_bar.high_price);
            current_bucket.bar.low_price = std::min(current_bucket.bar.low_price, source_bar.low_price);
            current_bucket.bar.close_price = source_bar.close_price;
            current_bucket.bar.volume += source_bar.volume;
            current_bucket.last_source_index = source_index;
            continue;
        }

        if (!buckets.empty() && bucket_start < buckets.back().bar.timestamp) {
            throw std::invalid_argument("Source bars are not time ordered at " + TimeUtils::format_iso_utc(source_bar.timestamp));
        }

        ResampledBar new_bucket;
        new_bucket.bar = Core::Bar(bucket_start, source_bar.open_price, source_bar.high_price, source_bar.low_price,
                                   source_bar.close_price, source_bar.volume);
        new_bucket.first_source_index = source_index;
        new_bucket.last_source_index = source_index;
        new_bucket.bucket_end = bucket_start + bucket_duration;
        buckets.push_back(new_bucket);
    }
    return buckets;
}

size_t count_closed_buckets(const std::vector<ResampledBar>& buckets, size_t current_index,
                            const Core::TimePoint& current_bar_time, int base_bar_minutes,
                            size_t already_visible) {
    Core::TimePoint current_bar_close = current_bar_time + std::chrono::minutes(base_bar_minutes);
    size_t visible_count = std::min(already_visible, buckets.size());
    while (visible_count < buckets.size()) {
        const ResampledBar& candidate_bucket = buckets[visible_count];
        if (candidate_bucket.last_source_index > current_index || candidate_bucket.bucket_end > current_bar_close) {
            break;
        }
        ++visible_count;
    }
    return visible_count;
}

std::vector<Core::Bar> extract_bars(const std::vector<ResampledBar>& buckets) {
    std::vector<Core::Bar> bucket_bars;
    bucket_bars.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        bucket_bars.push_back(bucket.bar);
    }
    return bucket_bars;
}

std::vector<Core::Bar> select_closed_bars(const std::vector<Core::Bar>& base_bars, int base_bar_minutes,
                                          int timeframe_minutes, size_t count) {
    if (base_bar_minutes <= 0 || timeframe_minutes < base_bar_minutes || timeframe_minutes % base_bar_minutes != 0) {
        throw std::invalid_argument("Timeframe " + std::to_string(timeframe_minutes) + "m is not a multiple of the "
                                    + std::to_string(base_bar_minutes) + "m base bars");
    }

    std::vector<Core::Bar> selected_bars;
    if (timeframe_minutes == base_bar_minutes) {
        selected_bars = base_bars;
    } else if (!base_bars.empty()) {
        std::vector<ResampledBar> buckets = resample_bars(base_bars, timeframe_minutes);
        size_t closed_count = count_closed_buckets(buckets, base_bars.size() - 1, base_bars.back().timestamp, base_bar_minutes);
        buckets.resize(closed_count);
        selected_bars = extract_bars(buckets);
    }

    if (selected_bars.size() > count) {
        selected_bars.erase(selected_bars.begin(), selected_bars.end() - static_cast<std::ptrdiff_t>(count));
    }
    return selected_bars;
}

} // namespace MarketData
} // namespace ConfluenceScalper
