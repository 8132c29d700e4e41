#pragma once

#include "progress_state.hpp"
#include "terminal_sink.hpp"
#include "../common/constants.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace progressbar {
namespace core {

using TimeSource = std::function<Clock::time_point()>;

struct ProgressBarOptions {
    bool print_summary_on_exit = true;
    double render_interval_seconds = constants::limits::DEFAULT_RENDER_INTERVAL_SECONDS;
    bool use_colors = true;
};

/**
 * Scoped progress bar for a known number of work units.
 *
 * Typical use:
 *
 *     ProgressBar bar(jobs.size());
 *     {
 *         ProgressScope scope(bar);
 *         for (auto& job : jobs) {
 *             run(job);
 *             bar.increment();
 *         }
 *     }
 *
 * Renders are throttled to one per render interval. While a scope is open the
 * scope exit is the only place the execution-time summary is printed.
 */
class ProgressBar {
public:
    explicit ProgressBar(int64_t total, bool print_on_exit = true,
                         double render_interval = constants::limits::DEFAULT_RENDER_INTERVAL_SECONDS);
    ProgressBar(int64_t total, const ProgressBarOptions& options,
                std::unique_ptr<TerminalSink> sink = nullptr, TimeSource clock = nullptr);
    
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    void open();
    void close();
    bool isOpen() const { return scope_open_; }
    
    void increment(int64_t amount = 1);
    
    // Negative values are stored as 0. Does not render.
    void setValue(int64_t value);
    int64_t value() const { return state_.value(); }
    int64_t total() const { return state_.total(); }
    uint64_t errorCount() const { return state_.errorCount(); }
    
    // Percentage computed by the most recent increment or forced update.
    double progress() const { return progress_; }
    
    // Draws a full bar regardless of the current value.
    void update();
    // Sets the value to the total and draws a full bar. Prints the summary
    // only when no scope is open.
    void complete();
    bool isComplete() const { return completed_; }
    
    double executionSeconds() const { return state_.executionSeconds(); }
    const ProgressState& state() const { return state_; }

private:
    ProgressState state_;
    std::unique_ptr<TerminalSink> sink_;
    TimeSource clock_;
    bool use_colors_;
    
    bool scope_open_ = false;
    bool completed_ = false;
    double progress_ = 0.0;
    
    void renderProgress(Clock::time_point now, double percentage);
    void printSummary(double seconds);
};

// Opens the bar on construction and closes it on every exit path.
class ProgressScope {
public:
    explicit ProgressScope(ProgressBar& bar);
    ~ProgressScope();
    
    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;
    
    ProgressBar& bar() { return bar_; }

private:
    ProgressBar& bar_;
    int uncaught_at_entry_;
};

}}
