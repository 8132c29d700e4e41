#include "progressbar/format/session_report.hpp"
#include "progressbar/core/duration_format.hpp"

namespace progressbar {
namespace format {

SessionReport buildSessionReport(const core::ProgressBar& bar) {
    SessionReport report;
    report.total = bar.total();
    report.current = bar.value();
    report.errors = bar.errorCount();
    report.progress = bar.progress();
    report.execution_seconds = bar.executionSeconds();
    report.execution_time = core::formatDuration(report.execution_seconds);
    report.completed = bar.isComplete();
    
    if (report.execution_seconds > 0.0) {
        report.throughput = static_cast<double>(report.current) / report.execution_seconds;
    }
    
    return report;
}

}}
