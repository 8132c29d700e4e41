#pragma once

#include <optional>
#include <string>

namespace progressbar {
namespace core {

// Number of '=' cells for a percentage, clamped to the bar width.
int barFill(double percentage);

std::string formatProgressLine(double percentage, double elapsed_seconds,
                               std::optional<double> remaining_seconds, double throughput);
std::string formatCompletionLine();
std::string formatPlaceholderLine();
std::string formatSummaryLine(const std::string& execution_time, bool use_colors);

}}
