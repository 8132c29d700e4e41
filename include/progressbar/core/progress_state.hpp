#pragma once

#include "../common/constants.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace progressbar {
namespace core {

using Clock = std::chrono::steady_clock;

/**
 * Counters and timestamps of one progress session.
 *
 * Derived quantities take the current instant explicitly, so they depend only
 * on the stored state and the argument.
 */
class ProgressState {
public:
    explicit ProgressState(int64_t total,
                           double render_interval_seconds = constants::limits::DEFAULT_RENDER_INTERVAL_SECONDS,
                           bool print_summary_on_exit = true);
    
    int64_t total() const { return total_; }
    int64_t value() const { return current_; }
    uint64_t errorCount() const { return error_count_; }
    double renderIntervalSeconds() const { return render_interval_seconds_; }
    bool printSummaryOnExit() const { return print_summary_on_exit_; }
    
    void setValue(int64_t value) { current_ = value; }
    void add(int64_t amount) { current_ += amount; }
    void recordError() { ++error_count_; }
    
    bool hasStarted() const { return start_time_.has_value(); }
    void start(Clock::time_point now);
    void finish(Clock::time_point now);
    std::optional<Clock::time_point> startTime() const { return start_time_; }
    std::optional<Clock::time_point> endTime() const { return end_time_; }
    
    // endTime - startTime; 0 until the session has finished.
    double executionSeconds() const;
    
    bool renderDue(Clock::time_point now) const;
    void markRendered(Clock::time_point now);
    std::optional<Clock::time_point> lastRenderTime() const { return last_render_time_; }
    
    // current / total * 100. Throws DivisionFault when total is zero.
    double percentage() const;
    double elapsedSeconds(Clock::time_point now) const;
    // Empty while no unit has completed.
    std::optional<double> remainingSeconds(Clock::time_point now) const;
    // Units per second.
    double throughput(Clock::time_point now) const;

private:
    const int64_t total_;
    int64_t current_ = 0;
    uint64_t error_count_ = 0;
    
    std::optional<Clock::time_point> start_time_;
    std::optional<Clock::time_point> end_time_;
    std::optional<Clock::time_point> last_render_time_;
    
    double render_interval_seconds_;
    bool print_summary_on_exit_;
};

}}
