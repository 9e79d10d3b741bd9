#include "time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

TimePoint parse_utc_timestamp(const std::string& timestamp_text) {
    std::string normalized_text = timestamp_text;
    normalized_text.erase(0, normalized_text.find_first_not_of(" \t\r\n"));
    normalized_text.erase(normalized_text.find_last_not_of(" \t\r\n") + 1);
    if (normalized_text.empty()) {
        throw std::runtime_error("Empty timestamp");
    }

    bool is_epoch_seconds = std::all_of(normalized_text.begin(), normalized_text.end(), [](unsigned char character) {
        return std::isdigit(character) != 0;
    });
    if (is_epoch_seconds) {
        return from_epoch_seconds(std::stoll(normalized_text));
    }

    // Drop trailing Z and any fractional seconds
    if (normalized_text.back() == 'Z') {
        normalized_text.pop_back();
    }
    size_t fraction_position = normalized_text.find('.');
    if (fraction_position != std::string::npos) {
        normalized_text = normalized_text.substr(0, fraction_position);
    }
    std::replace(normalized_text.begin(), normalized_text.end(), ' ', 'T');

    std::tm parsed_time = {};
    std::istringstream parse_stream(normalized_text);
    parse_stream >> std::get_time(&parsed_time, ISO_8601_WITHOUT_Z);
    if (parse_stream.fail()) {
        throw std::runtime_error("Unrecognised timestamp: " + timestamp_text);
    }

    std::time_t epoch_time = timegm(&parsed_time);
    return std::chrono::system_clock::from_time_t(epoch_time);
}

std::string format_iso_utc(const TimePoint& time_point) {
    std::time_t epoch_time = std::chrono::system_clock::to_time_t(time_point);
    struct tm timeinfo;
    gmtime_r(&epoch_time, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

long long to_epoch_seconds(const TimePoint& time_point) {
    return std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
}

TimePoint from_epoch_seconds(long long epoch_seconds) {
    return TimePoint(std::chrono::seconds(epoch_seconds));
}

long long utc_day_index(const TimePoint& time_point) {
    long long epoch_seconds = to_epoch_seconds(time_point);
    long long day_index = epoch_seconds / SECONDS_PER_DAY;
    if (epoch_seconds < 0 && epoch_seconds % SECONDS_PER_DAY != 0) {
        --day_index;
    }
    return day_index;
}

std::string utc_date_string(const TimePoint& time_point) {
    return format_iso_utc(time_point).substr(0, 10);
}

int utc_hour(const TimePoint& time_point) {
    long long seconds_into_day = to_epoch_seconds(time_point) - utc_day_index(time_point) * SECONDS_PER_DAY;
    return static_cast<int>(seconds_into_day / SECONDS_PER_HOUR);
}

TimePoint floor_to_bucket(const TimePoint& time_point, int bucket_minutes) {
    if (bucket_minutes <= 0) {
        throw std::invalid_argument("Bucket width must be positive: " + std::to_string(bucket_minutes));
    }
    long long bucket_seconds = static_cast<long long>(bucket_minutes) * SECONDS_PER_MINUTE;
    long long epoch_seconds = to_epoch_seconds(time_point);
    long long remainder = epoch_seconds % bucket_seconds;
    if (remainder < 0) {
        remainder += bucket_seconds;
    }
    return from_epoch_seconds(epoch_seconds - remainder);
}

} // namespace TimeUtils
