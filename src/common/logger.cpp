#include "progressbar/common/logger.hpp"
#include "progressbar/common/constants.hpp"
#include "progressbar/core/error_codes.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace progressbar {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::warn;
}

// progress.log -> progress.json.log
std::string jsonLogPath(const std::string& log_file) {
    std::filesystem::path path(log_file);
    std::string name = path.stem().string() + ".json" + path.extension().string();
    return path.has_parent_path() ? (path.parent_path() / name).string() : name;
}

// Returns nullptr when the file cannot be used; the caller falls back to stderr.
spdlog::sink_ptr makeFileSink(const LoggingConfig& logging) {
    std::filesystem::path log_dir = std::filesystem::path(logging.log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
        !std::filesystem::create_directories(log_dir, ec)) {
        std::cerr << "[Logger] Cannot create log directory, using stderr | path=" << log_dir.string()
                  << " | error=" << ec.message() << std::endl;
        return nullptr;
    }
    
    std::string path = logging.format == LogFormat::JSON ? jsonLogPath(logging.log_file) : logging.log_file;
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, logging.rotation_size_mb * 1024 * 1024, logging.max_files);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "[Logger] Cannot open log file, using stderr | path=" << path
                  << " | error=" << e.what() << std::endl;
        return nullptr;
    }
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogLevel level, const LoggingConfig& logging) {
    if (logger_) {
        logger_->warn("[Logger] Already initialized");
        return;
    }
    
    spdlog::sink_ptr sink;
    if (!logging.log_file.empty()) {
        sink = makeFileSink(logging);
    }
    bool to_file = sink != nullptr;
    if (!to_file) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    
    auto spdlog_level = toSpdlogLevel(level);
    sink->set_level(spdlog_level);
    
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(to_file && logging.format == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(spdlog_level);
    if (to_file) {
        logger_->flush_on(spdlog::level::info);
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

std::string Logger::codedFormat(core::ErrorCode code, const char* component, const std::string& format) {
    std::string result = fmt::format("[{}] {} | code={}", component, core::errorMessage(code), core::errorName(code));
    if (!format.empty()) {
        result += " | " + format;
    }
    return result;
}

}}
