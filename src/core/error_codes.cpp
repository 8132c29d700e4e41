#include "progressbar/core/error_codes.hpp"
#include <array>

namespace progressbar {
namespace core {

namespace {

struct ErrorEntry {
    ErrorCode code;
    const char* name;
    const char* message;
};

constexpr std::array<ErrorEntry, 5> ERROR_TABLE = {{
    {ErrorCode::DIVISION_BY_ZERO, "DIVISION_BY_ZERO", "Percentage undefined for a zero total"},
    {ErrorCode::INVALID_TOTAL, "INVALID_TOTAL", "Number of jobs/iterations must be positive"},
    {ErrorCode::SCOPE_ALREADY_OPEN, "SCOPE_ALREADY_OPEN", "Progress scope already open"},
    {ErrorCode::SCOPE_NOT_OPEN, "SCOPE_NOT_OPEN", "Progress scope not open"},
    {ErrorCode::CONFIG_PARSE_FAILED, "CONFIG_PARSE_FAILED", "Configuration file could not be parsed"},
}};

const ErrorEntry* findEntry(ErrorCode code) {
    for (const auto& entry : ERROR_TABLE) {
        if (entry.code == code) {
            return &entry;
        }
    }
    return nullptr;
}

std::string buildMessage(ErrorCode code, const std::string& component, const std::string& detail) {
    std::string message = errorMessage(code);
    if (!component.empty()) {
        message = "[" + component + "] " + message;
    }
    if (!detail.empty()) {
        message += " | " + detail;
    }
    return message;
}

}

const char* errorName(ErrorCode code) {
    const auto* entry = findEntry(code);
    return entry ? entry->name : "UNKNOWN";
}

const char* errorMessage(ErrorCode code) {
    const auto* entry = findEntry(code);
    return entry ? entry->message : "Unknown error";
}

ProgressError::ProgressError(ErrorCode code, const std::string& component, const std::string& detail)
    : std::runtime_error(buildMessage(code, component, detail)),
      code_(code) {}

}}
