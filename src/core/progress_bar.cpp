#include "progressbar/core/progress_bar.hpp"
#include "progressbar/core/duration_format.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/line_renderer.hpp"
#include "progressbar/common/logger.hpp"
#include <exception>
#include <iostream>

namespace progressbar {
namespace core {

static ProgressBarOptions makeOptions(bool print_on_exit, double render_interval) {
    ProgressBarOptions options;
    options.print_summary_on_exit = print_on_exit;
    options.render_interval_seconds = render_interval;
    return options;
}

ProgressBar::ProgressBar(int64_t total, bool print_on_exit, double render_interval)
    : ProgressBar(total, makeOptions(print_on_exit, render_interval)) {}

ProgressBar::ProgressBar(int64_t total, const ProgressBarOptions& options,
                         std::unique_ptr<TerminalSink> sink, TimeSource clock)
    : state_(total, options.render_interval_seconds, options.print_summary_on_exit),
      sink_(sink ? std::move(sink) : std::unique_ptr<TerminalSink>(std::make_unique<StreamSink>(std::cout))),
      clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); })),
      use_colors_(options.use_colors) {
    if (total == constants::render::UNKNOWN_TOTAL) {
        sink_->write(formatPlaceholderLine());
        sink_->flush();
    }
}

void ProgressBar::open() {
    if (scope_open_) {
        common::Logger::instance().warn(ErrorCode::SCOPE_ALREADY_OPEN, "ProgressBar", "total={}",
                                        state_.total());
        return;
    }
    
    state_.start(clock_());
    scope_open_ = true;
    common::Logger::instance().debug("[ProgressBar] Scope opened | total={}", state_.total());
}

void ProgressBar::close() {
    if (!scope_open_) {
        common::Logger::instance().warn(ErrorCode::SCOPE_NOT_OPEN, "ProgressBar", "total={}",
                                        state_.total());
        return;
    }
    
    state_.finish(clock_());
    scope_open_ = false;
    
    common::Logger::instance().debug("[ProgressBar] Scope closed | value={} | total={} | errors={} | seconds={:.3f}",
                                    state_.value(), state_.total(), state_.errorCount(),
                                    state_.executionSeconds());
    
    if (state_.printSummaryOnExit()) {
        printSummary(state_.executionSeconds());
    }
}

void ProgressBar::increment(int64_t amount) {
    auto now = clock_();
    if (!state_.hasStarted()) {
        state_.start(now);
    }
    
    state_.add(amount);
    
    double percentage = 0.0;
    try {
        percentage = state_.percentage();
    } catch (const DivisionFault& e) {
        state_.recordError();
        common::Logger::instance().debug(e.code(), "ProgressBar", "render skipped | errors={}",
                                         state_.errorCount());
        return;
    }
    progress_ = percentage;
    
    if (state_.value() == state_.total()) {
        if (!completed_) {
            complete();
        }
        return;
    }
    
    if (state_.renderDue(now)) {
        state_.markRendered(now);
        renderProgress(now, percentage);
    }
}

void ProgressBar::setValue(int64_t value) {
    if (value < 0) {
        common::Logger::instance().debug("[ProgressBar] Negative value normalized | value={}", value);
        value = 0;
    }
    state_.setValue(value);
}

void ProgressBar::update() {
    progress_ = 100.0;
    state_.markRendered(clock_());
    sink_->write(formatCompletionLine());
    sink_->flush();
}

void ProgressBar::complete() {
    state_.setValue(state_.total());
    completed_ = true;
    update();
    
    if (!scope_open_ && state_.printSummaryOnExit()) {
        printSummary(state_.elapsedSeconds(clock_()));
    }
}

void ProgressBar::renderProgress(Clock::time_point now, double percentage) {
    sink_->write(formatProgressLine(percentage,
                                    state_.elapsedSeconds(now),
                                    state_.remainingSeconds(now),
                                    state_.throughput(now)));
    sink_->flush();
}

void ProgressBar::printSummary(double seconds) {
    sink_->write(formatSummaryLine(formatDuration(seconds), use_colors_));
    sink_->flush();
}

ProgressScope::ProgressScope(ProgressBar& bar)
    : bar_(bar),
      uncaught_at_entry_(std::uncaught_exceptions()) {
    bar_.open();
}

ProgressScope::~ProgressScope() {
    if (std::uncaught_exceptions() > uncaught_at_entry_) {
        common::Logger::instance().debug("[ProgressBar] Finalizing during exception | value={} | total={}",
                                        bar_.value(), bar_.total());
    }
    
    try {
        bar_.close();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[ProgressBar] Finalize failed | error={}", e.what());
    }
}

}}
