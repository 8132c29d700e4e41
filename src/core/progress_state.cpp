#include "progressbar/core/progress_state.hpp"
#include "progressbar/core/error_codes.hpp"
#include <algorithm>
#include <string>

namespace progressbar {
namespace core {

static double secondsBetween(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

ProgressState::ProgressState(int64_t total, double render_interval_seconds, bool print_summary_on_exit)
    : total_(total),
      render_interval_seconds_(std::max(0.0, render_interval_seconds)),
      print_summary_on_exit_(print_summary_on_exit) {}

void ProgressState::start(Clock::time_point now) {
    start_time_ = now;
}

void ProgressState::finish(Clock::time_point now) {
    if (!start_time_) {
        start_time_ = now;
    }
    end_time_ = now;
}

double ProgressState::executionSeconds() const {
    if (!start_time_ || !end_time_) {
        return 0.0;
    }
    return secondsBetween(*start_time_, *end_time_);
}

bool ProgressState::renderDue(Clock::time_point now) const {
    if (!last_render_time_) {
        return true;
    }
    return secondsBetween(*last_render_time_, now) > render_interval_seconds_;
}

void ProgressState::markRendered(Clock::time_point now) {
    if (!last_render_time_ || now > *last_render_time_) {
        last_render_time_ = now;
    }
}

double ProgressState::percentage() const {
    if (total_ == 0) {
        throw DivisionFault(current_);
    }
    return static_cast<double>(current_) / static_cast<double>(total_) * 100.0;
}

double ProgressState::elapsedSeconds(Clock::time_point now) const {
    if (!start_time_) {
        return 0.0;
    }
    return secondsBetween(*start_time_, now);
}

std::optional<double> ProgressState::remainingSeconds(Clock::time_point now) const {
    if (current_ <= 0) {
        return std::nullopt;
    }
    double per_unit = elapsedSeconds(now) / static_cast<double>(current_);
    return per_unit * static_cast<double>(total_ - current_);
}

double ProgressState::throughput(Clock::time_point now) const {
    double elapsed = elapsedSeconds(now);
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(current_) / elapsed;
}

}}
