// Tests for UTC timestamp helpers

#include <gtest/gtest.h>

#include "utils/time_utils.hpp"

#include <stdexcept>

TEST(TimeUtilsTest, ParsesIsoSpaceSeparatedAndEpochForms) {
    TimeUtils::TimePoint iso_time = TimeUtils::parse_utc_timestamp("2024-01-02T10:05:00Z");
    EXPECT_EQ(TimeUtils::to_epoch_seconds(iso_time), 1704189900);
    EXPECT_EQ(TimeUtils::parse_utc_timestamp("2024-01-02 10:05:00"), iso_time);
    EXPECT_EQ(TimeUtils::parse_utc_timestamp("2024-01-02T10:05:00.250Z"), iso_time);
    EXPECT_EQ(TimeUtils::parse_utc_timestamp(" 1704189900 "), iso_time);
    EXPECT_EQ(TimeUtils::format_iso_utc(iso_time), "2024-01-02T10:05:00Z");
}

TEST(TimeUtilsTest, RejectsUnparseableText) {
    EXPECT_THROW(TimeUtils::parse_utc_timestamp(""), std::runtime_error);
    EXPECT_THROW(TimeUtils::parse_utc_timestamp("yesterday"), std::runtime_error);
}

TEST(TimeUtilsTest, DayAndHourAreUtc) {
    TimeUtils::TimePoint late_evening = TimeUtils::parse_utc_timestamp("2024-01-01T23:55:00Z");
    TimeUtils::TimePoint next_morning = TimeUtils::parse_utc_timestamp("2024-01-02T00:05:00Z");

    EXPECT_EQ(TimeUtils::utc_day_index(next_morning) - TimeUtils::utc_day_index(late_evening), 1);
    EXPECT_EQ(TimeUtils::utc_hour(late_evening), 23);
    EXPECT_EQ(TimeUtils::utc_hour(next_morning), 0);
    EXPECT_EQ(TimeUtils::utc_date_string(late_evening), "2024-01-01");
    EXPECT_EQ(TimeUtils::utc_day_index(TimeUtils::from_epoch_seconds(-1)), -1);
}

TEST(TimeUtilsTest, FloorsToBucketStart) {
    TimeUtils::TimePoint bar_time = TimeUtils::parse_utc_timestamp("2024-01-02T10:35:00Z");
    EXPECT_EQ(TimeUtils::format_iso_utc(TimeUtils::floor_to_bucket(bar_time, 15)), "2024-01-02T10:30:00Z");
    EXPECT_EQ(TimeUtils::format_iso_utc(TimeUtils::floor_to_bucket(bar_time, 60)), "2024-01-02T10:00:00Z");
    EXPECT_THROW(TimeUtils::floor_to_bucket(bar_time, 0), std::invalid_argument);
}
