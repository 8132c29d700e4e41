#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/progress_state.hpp"
#include "fake_clock.hpp"

#include <gtest/gtest.h>

namespace {

using progressbar::core::DivisionFault;
using progressbar::core::ErrorCode;
using progressbar::core::ProgressState;
using progressbar::test_support::FakeClock;

TEST(ProgressState, PercentageIsRatioOfCurrentToTotal) {
    ProgressState state(8);
    state.add(1);
    state.add(2);
    state.add(3);
    EXPECT_EQ(6, state.value());
    EXPECT_DOUBLE_EQ(75.0, state.percentage());

    ProgressState thirds(3);
    thirds.add(1);
    EXPECT_DOUBLE_EQ(1.0 / 3.0 * 100.0, thirds.percentage());
}

TEST(ProgressState, ZeroTotalRaisesDivisionFault) {
    ProgressState state(0);
    state.add(1);
    EXPECT_THROW(state.percentage(), DivisionFault);

    try {
        state.percentage();
        FAIL() << "expected DivisionFault";
    } catch (const DivisionFault& e) {
        EXPECT_EQ(ErrorCode::DIVISION_BY_ZERO, e.code());
        EXPECT_NE(std::string(e.what()).find("current=1"), std::string::npos);
    }
}

TEST(ProgressState, ElapsedIsZeroBeforeStart) {
    FakeClock clock;
    ProgressState state(10);
    EXPECT_FALSE(state.hasStarted());
    EXPECT_DOUBLE_EQ(0.0, state.elapsedSeconds(clock.now));
}

TEST(ProgressState, RemainingUnknownUntilFirstUnit) {
    FakeClock clock;
    ProgressState state(10);
    state.start(clock.now);
    clock.advance(4.0);

    EXPECT_FALSE(state.remainingSeconds(clock.now).has_value());

    state.add(2);
    auto remaining = state.remainingSeconds(clock.now);
    ASSERT_TRUE(remaining.has_value());
    EXPECT_DOUBLE_EQ(16.0, *remaining);
}

TEST(ProgressState, ThroughputIsUnitsPerSecond) {
    FakeClock clock;
    ProgressState state(10);
    state.start(clock.now);
    state.add(2);

    EXPECT_DOUBLE_EQ(0.0, state.throughput(clock.now));

    clock.advance(4.0);
    EXPECT_DOUBLE_EQ(0.5, state.throughput(clock.now));
}

TEST(ProgressState, RenderDueHonoursInterval) {
    FakeClock clock;
    ProgressState state(10, 0.1);

    EXPECT_TRUE(state.renderDue(clock.now));
    state.markRendered(clock.now);

    clock.advance(0.05);
    EXPECT_FALSE(state.renderDue(clock.now));

    clock.advance(0.15);
    EXPECT_TRUE(state.renderDue(clock.now));
}

TEST(ProgressState, LastRenderTimeNeverMovesBackwards) {
    FakeClock clock;
    ProgressState state(10);
    auto early = clock.now;
    clock.advance(1.0);
    auto late = clock.now;

    state.markRendered(late);
    state.markRendered(early);

    ASSERT_TRUE(state.lastRenderTime().has_value());
    EXPECT_EQ(late, *state.lastRenderTime());
}

TEST(ProgressState, NegativeIntervalIsNormalized) {
    ProgressState state(10, -3.0);
    EXPECT_DOUBLE_EQ(0.0, state.renderIntervalSeconds());
}

TEST(ProgressState, ExecutionSecondsSpanStartToFinish) {
    FakeClock clock;
    ProgressState state(10);
    EXPECT_DOUBLE_EQ(0.0, state.executionSeconds());

    state.start(clock.now);
    clock.advance(2.5);
    state.finish(clock.now);

    EXPECT_DOUBLE_EQ(2.5, state.executionSeconds());
}

TEST(ProgressState, ErrorsAccumulate) {
    ProgressState state(0);
    state.recordError();
    state.recordError();
    EXPECT_EQ(2u, state.errorCount());
}

} // namespace
