#pragma once

#include "session_report.hpp"
#include <ostream>
#include <string>

namespace progressbar {
namespace format {

class ConsoleFormatter {
public:
    // ProgressBar(total=4, current=4, errors=0, progress=100.0)
    static std::string describe(const SessionReport& report);
    
    static void format(const SessionReport& report, std::ostream& out);
};

}}
