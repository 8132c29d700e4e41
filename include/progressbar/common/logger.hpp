#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace progressbar {
namespace core {
enum class ErrorCode;
}

namespace common {

class Logger {
public:
    static Logger& instance();
    
    // Logs to stderr, or to a rotating file when logging.log_file is set.
    // Calls made before initialize() are dropped.
    void initialize(LogLevel level, const LoggingConfig& logging);
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(spdlog::level::err, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(spdlog::level::info, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void error(core::ErrorCode code, const char* component, const std::string& format, Args&&... args) {
        logCode(spdlog::level::err, code, component, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(core::ErrorCode code, const char* component, const std::string& format, Args&&... args) {
        logCode(spdlog::level::warn, code, component, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(core::ErrorCode code, const char* component, const std::string& format, Args&&... args) {
        logCode(spdlog::level::debug, code, component, format, std::forward<Args>(args)...);
    }
    
    // "[component] message | code=NAME | <format>"
    static std::string codedFormat(core::ErrorCode code, const char* component, const std::string& format);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    
    template<typename... Args>
    void log(spdlog::level::level_enum level, const std::string& format, Args&&... args) {
        if (logger_) logger_->log(level, fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void logCode(spdlog::level::level_enum level, core::ErrorCode code, const char* component,
                 const std::string& format, Args&&... args) {
        if (logger_ && logger_->should_log(level)) {
            log(level, codedFormat(code, component, format), std::forward<Args>(args)...);
        }
    }
};

}}
