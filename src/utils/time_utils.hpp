#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

namespace TimeUtils {

using TimePoint = std::chrono::system_clock::time_point;

// Time conversion constants
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;
constexpr double DAYS_PER_YEAR = 365.25;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Wall clock (local time) for log line prefixes
std::string get_current_human_readable_time();

// Parses "YYYY-MM-DDTHH:MM:SS[Z]", "YYYY-MM-DD HH:MM:SS" or integer epoch seconds as UTC.
// Throws std::runtime_error when the text matches none of those forms.
TimePoint parse_utc_timestamp(const std::string& timestamp_text);

// Renders a time point as "YYYY-MM-DDTHH:MM:SSZ"
std::string format_iso_utc(const TimePoint& time_point);

long long to_epoch_seconds(const TimePoint& time_point);
TimePoint from_epoch_seconds(long long epoch_seconds);

// Days since 1970-01-01 in UTC; identifies a trading session day
long long utc_day_index(const TimePoint& time_point);
std::string utc_date_string(const TimePoint& time_point);
int utc_hour(const TimePoint& time_point);

// Start of the UTC bucket of the given width that contains time_point
TimePoint floor_to_bucket(const TimePoint& time_point, int bucket_minutes);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
