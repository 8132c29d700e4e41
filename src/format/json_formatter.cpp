#include "progressbar/format/json_formatter.hpp"

namespace progressbar {
namespace format {

nlohmann::json JsonFormatter::format(const SessionReport& report) {
    nlohmann::json json;
    
    json["total"] = report.total;
    json["current"] = report.current;
    json["errors"] = report.errors;
    json["progress"] = report.progress;
    json["completed"] = report.completed;
    
    nlohmann::json timing;
    timing["execution_seconds"] = report.execution_seconds;
    timing["execution_time"] = report.execution_time;
    timing["throughput"] = report.throughput;
    json["timing"] = timing;
    
    return json;
}

}}
