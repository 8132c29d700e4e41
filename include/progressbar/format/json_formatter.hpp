#pragma once

#include "session_report.hpp"
#include <nlohmann/json.hpp>

namespace progressbar {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const SessionReport& report);
};

}}
