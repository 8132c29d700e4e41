#include "progressbar/core/line_renderer.hpp"
#include "progressbar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace progressbar {
namespace core {

int barFill(double percentage) {
    if (!std::isfinite(percentage)) {
        return 0;
    }
    double cells = std::floor(percentage / 2.0);
    return static_cast<int>(std::clamp(cells, 0.0, static_cast<double>(constants::render::BAR_WIDTH)));
}

std::string formatProgressLine(double percentage, double elapsed_seconds,
                               std::optional<double> remaining_seconds, double throughput) {
    std::string remaining = remaining_seconds ? fmt::format("{:.2f}", *remaining_seconds) : "--";
    // Printed as a double: the integer part may not fit in int64.
    double whole = std::trunc(percentage);
    if (whole == 0.0) {
        whole = 0.0;
    }
    
    return fmt::format("\r[{}] {:.0f}% (ETA: {:.2f}s/{}s) {:.2f} MBits/s",
                       std::string(barFill(percentage), '='),
                       whole,
                       elapsed_seconds,
                       remaining,
                       throughput * constants::render::THROUGHPUT_SCALE);
}

std::string formatCompletionLine() {
    return fmt::format("\r[{}] 100%\n\n", std::string(constants::render::BAR_WIDTH, '='));
}

std::string formatPlaceholderLine() {
    return fmt::format("[{}] 0%", std::string(constants::render::PLACEHOLDER_WIDTH, ' '));
}

std::string formatSummaryLine(const std::string& execution_time, bool use_colors) {
    if (use_colors) {
        return fmt::format("\n{}Execution time: {}{}\n",
                           constants::render::SUMMARY_COLOR, execution_time, constants::render::COLOR_RESET);
    }
    return fmt::format("\nExecution time: {}\n", execution_time);
}

}}
