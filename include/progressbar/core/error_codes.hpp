#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace progressbar {
namespace core {

enum class ErrorCode {
    DIVISION_BY_ZERO = 100,
    INVALID_TOTAL = 101,
    
    SCOPE_ALREADY_OPEN = 200,
    SCOPE_NOT_OPEN = 201,
    
    CONFIG_PARSE_FAILED = 300
};

const char* errorName(ErrorCode code);
const char* errorMessage(ErrorCode code);

// what() reads "[component] message | detail".
class ProgressError : public std::runtime_error {
public:
    ProgressError(ErrorCode code, const std::string& component, const std::string& detail = "");
    
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Raised by percentage computation when the total is zero.
class DivisionFault : public ProgressError {
public:
    explicit DivisionFault(int64_t current)
        : ProgressError(ErrorCode::DIVISION_BY_ZERO, "ProgressState",
                        "current=" + std::to_string(current)) {}
};

}}
