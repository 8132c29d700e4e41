#include "progressbar/core/duration_format.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>

namespace progressbar {
namespace core {

namespace {

struct TimeBand {
    double upper_bound;
    double major_seconds;
    const char* major_label;
    // Compound bands print the remainder in a smaller unit.
    double minor_seconds;
    const char* minor_label;
    int precision;
};

constexpr double INF = std::numeric_limits<double>::infinity();

constexpr std::array<TimeBand, 5> TIME_BANDS = {{
    {1.0, 1e-3, "ms", 0.0, nullptr, 0},
    {60.0, 1.0, "seconds", 0.0, nullptr, 2},
    {3600.0, 60.0, "minutes", 1.0, "seconds", 0},
    {86400.0, 3600.0, "hours", 60.0, "minutes", 0},
    {INF, 86400.0, "days", 0.0, nullptr, 2},
}};

std::string formatSingle(double seconds, const TimeBand& band) {
    double amount = seconds / band.major_seconds;
    if (band.precision == 0) {
        return fmt::format("{} {}", static_cast<int64_t>(amount), band.major_label);
    }
    // Keep the rounded figure below the band limit: 59.999 prints 59.99, not 60.00.
    double step = std::pow(10.0, -band.precision);
    double shown = std::min(amount, band.upper_bound / band.major_seconds - step);
    return fmt::format("{:.{}f} {}", shown, band.precision, band.major_label);
}

std::string formatCompound(double seconds, const TimeBand& band) {
    auto major = static_cast<int64_t>(std::floor(seconds / band.major_seconds));
    auto minor = static_cast<int64_t>(std::floor(std::fmod(seconds, band.major_seconds) / band.minor_seconds));
    return fmt::format("{} {} {} {}", major, band.major_label, minor, band.minor_label);
}

}

std::string formatDuration(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }
    
    for (const auto& band : TIME_BANDS) {
        if (seconds < band.upper_bound) {
            return band.minor_label ? formatCompound(seconds, band) : formatSingle(seconds, band);
        }
    }
    return formatSingle(seconds, TIME_BANDS.back());
}

}}
