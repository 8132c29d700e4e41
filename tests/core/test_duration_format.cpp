#include "progressbar/core/duration_format.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace {

using progressbar::core::formatDuration;

TEST(FormatDuration, Milliseconds) {
    EXPECT_EQ("0 ms", formatDuration(0.0));
    EXPECT_EQ("0 ms", formatDuration(0.0005));
    EXPECT_EQ("250 ms", formatDuration(0.25));
    EXPECT_EQ("999 ms", formatDuration(0.999));
}

TEST(FormatDuration, Seconds) {
    EXPECT_EQ("1.00 seconds", formatDuration(1.0));
    EXPECT_EQ("5.00 seconds", formatDuration(5.0));
    EXPECT_EQ("59.50 seconds", formatDuration(59.5));
}

TEST(FormatDuration, SecondsJustUnderAMinuteNeverRoundUpToSixty) {
    EXPECT_EQ("59.99 seconds", formatDuration(59.999));
    EXPECT_EQ("59.99 seconds", formatDuration(59.996));
    EXPECT_EQ("59.99 seconds", formatDuration(59.994));
}

TEST(FormatDuration, MinutesCarrySecondsSinceLastMinute) {
    EXPECT_EQ("1 minutes 0 seconds", formatDuration(60.0));
    EXPECT_EQ("1 minutes 35 seconds", formatDuration(95.0));
    EXPECT_EQ("59 minutes 59 seconds", formatDuration(3599.9));
}

TEST(FormatDuration, HoursCarryMinutesSinceLastHour) {
    EXPECT_EQ("1 hours 0 minutes", formatDuration(3600.0));
    EXPECT_EQ("1 hours 30 minutes", formatDuration(5430.0));
    EXPECT_EQ("23 hours 59 minutes", formatDuration(86399.0));
}

TEST(FormatDuration, Days) {
    EXPECT_EQ("1.00 days", formatDuration(86400.0));
    EXPECT_EQ("1.04 days", formatDuration(90000.0));
}

TEST(FormatDuration, InvalidInputFormatsAsZero) {
    EXPECT_EQ("0 ms", formatDuration(-4.0));
    EXPECT_EQ("0 ms", formatDuration(std::numeric_limits<double>::quiet_NaN()));
}

} // namespace
