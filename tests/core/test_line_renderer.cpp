#include "progressbar/core/line_renderer.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

using namespace progressbar::core;

TEST(LineRenderer, BarFillIsHalfThePercentageClamped) {
    EXPECT_EQ(0, barFill(0.0));
    EXPECT_EQ(0, barFill(1.9));
    EXPECT_EQ(16, barFill(100.0 / 3.0));
    EXPECT_EQ(49, barFill(99.9));
    EXPECT_EQ(50, barFill(100.0));
    EXPECT_EQ(50, barFill(180.0));
    EXPECT_EQ(0, barFill(-100.0));
}

TEST(LineRenderer, ProgressLine) {
    EXPECT_EQ("\r[=====] 10% (ETA: 2.00s/18.00s) 4.00 MBits/s",
              formatProgressLine(10.0, 2.0, 18.0, 0.5));
    EXPECT_EQ("\r[================] 33% (ETA: 1.50s/3.00s) 5.33 MBits/s",
              formatProgressLine(100.0 / 3.0, 1.5, 3.0, 2.0 / 3.0));
}

TEST(LineRenderer, PercentageIsTruncatedWithoutIntegerOverflow) {
    EXPECT_EQ("\r[" + std::string(50, '=') + "] 300000000000000000000% (ETA: 1.00s/0.00s) 0.00 MBits/s",
              formatProgressLine(3e20, 1.0, 0.0, 0.0));
    EXPECT_EQ("\r[] 0% (ETA: 0.00s/--s) 0.00 MBits/s",
              formatProgressLine(-0.5, 0.0, std::nullopt, 0.0));
    EXPECT_EQ("\r[=================================================] 99% (ETA: 0.00s/0.00s) 0.00 MBits/s",
              formatProgressLine(99.99, 0.0, 0.0, 0.0));
}

TEST(LineRenderer, UnknownRemainingIsDashed) {
    EXPECT_EQ("\r[] 0% (ETA: 0.00s/--s) 0.00 MBits/s",
              formatProgressLine(0.0, 0.0, std::nullopt, 0.0));
}

TEST(LineRenderer, CompletionLineIsFullBarAndBlankLine) {
    EXPECT_EQ("\r[" + std::string(50, '=') + "] 100%\n\n", formatCompletionLine());
}

TEST(LineRenderer, PlaceholderLine) {
    EXPECT_EQ("[" + std::string(40, ' ') + "] 0%", formatPlaceholderLine());
}

TEST(LineRenderer, SummaryLine) {
    EXPECT_EQ("\nExecution time: 5.00 seconds\n", formatSummaryLine("5.00 seconds", false));
    EXPECT_EQ("\n\033[34mExecution time: 5.00 seconds\033[0m\n", formatSummaryLine("5.00 seconds", true));
}

} // namespace
