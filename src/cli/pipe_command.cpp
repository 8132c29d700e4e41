#include "pipe_command.hpp"
#include "progressbar/common/config.hpp"
#include "progressbar/common/logger.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/progress_bar.hpp"
#include "progressbar/format/console_formatter.hpp"
#include "progressbar/format/json_formatter.hpp"
#include "progressbar/format/session_report.hpp"
#include <iostream>
#include <memory>
#include <signal.h>
#include <unistd.h>

namespace progressbar {
namespace cli {

std::atomic<bool> PipeCommand::interrupt_requested_{false};

PipeCommand::PipeCommand() = default;

void PipeCommand::setup(CLI::App* app) {
    app->add_option("jobs", total_, "Number of jobs/iterations (lines expected on stdin)");
    interval_option_ = app->add_option("-i,--interval", interval_, "Minimum seconds between redraws")
                           ->check(CLI::NonNegativeNumber);
    app->add_flag("--no-summary", no_summary_, "Do not print the execution time");
    app->add_option("--color", color_, "Colorize the summary line")
       ->check(CLI::IsMember({"auto", "always", "never"}));
    app->add_option("--report", report_, "Session report written to stderr")
       ->check(CLI::IsMember({"none", "text", "json"}));
}

bool PipeCommand::validateArguments() const {
    return total_ > 0;
}

int PipeCommand::execute() {
    installSignalHandlers();
    return run(std::cin, std::cout, std::cerr);
}

int PipeCommand::run(std::istream& in, std::ostream& out, std::ostream& err) {
    auto& logger = common::Logger::instance();
    err << total_ << std::endl;
    logger.info("[Pipe] Started | total={}", total_);
    
    if (!validateArguments()) {
        logger.error(core::ErrorCode::INVALID_TOTAL, "Pipe", "total={}", total_);
        printHelp(err);
        return 1;
    }
    
    const auto& progress_config = common::Config::instance().global().progress;
    
    core::ProgressBarOptions options;
    options.render_interval_seconds = (interval_option_ && interval_option_->count() > 0)
        ? interval_
        : progress_config.render_interval_seconds;
    options.print_summary_on_exit = progress_config.print_summary && !no_summary_;
    
    common::ColorMode color_mode = progress_config.color;
    if (auto parsed = common::parseColorMode(color_)) {
        color_mode = *parsed;
    }
    options.use_colors = resolveColors(color_mode);
    
    core::ProgressBar bar(total_, options, std::make_unique<core::StreamSink>(out));
    
    uint64_t lines = 0;
    {
        core::ProgressScope scope(bar);
        
        std::string line;
        while (!interruptRequested() && std::getline(in, line)) {
            bar.increment();
            ++lines;
        }
        
        if (interruptRequested()) {
            logger.info("[Pipe] Interrupted | lines={} | total={}", lines, total_);
            bar.complete();
        }
    }
    
    logger.info("[Pipe] Finished | lines={} | total={} | errors={}", lines, total_, bar.errorCount());
    
    emitReport(bar, resolveReportFormat(), err);
    return 0;
}

void PipeCommand::requestInterrupt() {
    interrupt_requested_.store(true, std::memory_order_release);
}

void PipeCommand::clearInterrupt() {
    interrupt_requested_.store(false, std::memory_order_release);
}

bool PipeCommand::interruptRequested() {
    return interrupt_requested_.load(std::memory_order_acquire);
}

bool PipeCommand::resolveColors(common::ColorMode mode) const {
    switch (mode) {
        case common::ColorMode::ALWAYS: return true;
        case common::ColorMode::NEVER: return false;
        case common::ColorMode::AUTO: return isatty(STDOUT_FILENO);
    }
    return false;
}

common::ReportFormat PipeCommand::resolveReportFormat() const {
    if (auto parsed = common::parseReportFormat(report_)) {
        return *parsed;
    }
    return common::Config::instance().global().report.format;
}

void PipeCommand::emitReport(const core::ProgressBar& bar, common::ReportFormat report_format, std::ostream& err) const {
    if (report_format == common::ReportFormat::NONE) {
        return;
    }
    
    auto report = format::buildSessionReport(bar);
    
    if (report_format == common::ReportFormat::JSON) {
        err << format::JsonFormatter::format(report).dump(2) << std::endl;
    } else {
        format::ConsoleFormatter::format(report, err);
        err << std::flush;
    }
}

void PipeCommand::installSignalHandlers() {
    // No SA_RESTART: a pending read must return so the loop sees the flag.
    struct sigaction action {};
    action.sa_handler = &PipeCommand::signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PipeCommand::signalHandler(int) {
    requestInterrupt();
}

}}
