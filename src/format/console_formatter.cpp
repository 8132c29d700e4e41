#include "progressbar/format/console_formatter.hpp"
#include <spdlog/fmt/fmt.h>

namespace progressbar {
namespace format {

std::string ConsoleFormatter::describe(const SessionReport& report) {
    return fmt::format("ProgressBar(total={}, current={}, errors={}, progress={:.1f})",
                       report.total, report.current, report.errors, report.progress);
}

void ConsoleFormatter::format(const SessionReport& report, std::ostream& out) {
    out << describe(report) << "\n";
    out << "  Execution time: " << report.execution_time << "\n";
    out << fmt::format("  Throughput:     {:.2f} units/s", report.throughput) << "\n";
    out << "  Completed:      " << (report.completed ? "yes" : "no") << "\n";
}

}}
