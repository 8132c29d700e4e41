#pragma once

#include "../core/progress_bar.hpp"
#include <cstdint>
#include <string>

namespace progressbar {
namespace format {

struct SessionReport {
    int64_t total = 0;
    int64_t current = 0;
    uint64_t errors = 0;
    double progress = 0.0;
    double execution_seconds = 0.0;
    std::string execution_time;
    // Units per second over the whole session.
    double throughput = 0.0;
    bool completed = false;
};

SessionReport buildSessionReport(const core::ProgressBar& bar);

}}
