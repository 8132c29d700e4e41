#include "progressbar/common/config.hpp"
#include "progressbar/common/constants.hpp"
#include "progressbar/common/paths.hpp"
#include "progressbar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace progressbar {
namespace common {

static double findNumber(const toml::value& section, const std::string& key) {
    const auto& value = section.at(key);
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return toml::get<double>(value);
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    if (name == "DEBUG" || name == "debug") return LogLevel::DEBUG;
    if (name == "INFO" || name == "info") return LogLevel::INFO;
    if (name == "WARN" || name == "warn") return LogLevel::WARN;
    if (name == "ERROR" || name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<ColorMode> parseColorMode(const std::string& name) {
    if (name == "auto") return ColorMode::AUTO;
    if (name == "always") return ColorMode::ALWAYS;
    if (name == "never") return ColorMode::NEVER;
    return std::nullopt;
}

std::optional<ReportFormat> parseReportFormat(const std::string& name) {
    if (name == "none") return ReportFormat::NONE;
    if (name == "text") return ReportFormat::TEXT;
    if (name == "json") return ReportFormat::JSON;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::WARN;
    
    config.progress.render_interval_seconds = RENDER_INTERVAL_SECONDS;
    config.progress.print_summary = PRINT_SUMMARY;
    config.progress.color = ColorMode::AUTO;
    
    config.logging.log_file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.report.format = ReportFormat::NONE;
    
    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }
    
    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = createDefaultConfig();
        return false;
    }
    
    current_config_path_ = effective_config_file;
    normalize();
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            const auto& global_section = data.at("global");
            
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                if (auto parsed = parseLogLevel(level)) {
                    global_.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level | value={}", level);
                }
            }
        }
        
        if (data.contains("progress")) {
            const auto& progress_section = data.at("progress");
            
            if (progress_section.contains("render_interval")) {
                global_.progress.render_interval_seconds = findNumber(progress_section, "render_interval");
            }
            if (progress_section.contains("print_summary")) {
                global_.progress.print_summary = toml::find<bool>(progress_section, "print_summary");
            }
            if (progress_section.contains("color")) {
                std::string color = toml::find<std::string>(progress_section, "color");
                if (auto parsed = parseColorMode(color)) {
                    global_.progress.color = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown color mode | value={}", color);
                }
            }
        }
        
        if (data.contains("logging")) {
            const auto& logging_section = data.at("logging");
            
            if (logging_section.contains("file")) {
                global_.logging.log_file = toml::find<std::string>(logging_section, "file");
            }
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
            }
        }
        
        if (data.contains("report")) {
            const auto& report_section = data.at("report");
            
            if (report_section.contains("format")) {
                std::string format_str = toml::find<std::string>(report_section, "format");
                if (auto parsed = parseReportFormat(format_str)) {
                    global_.report.format = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown report format | value={}", format_str);
                }
            }
        }
        
        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

void Config::normalize() {
    if (global_.progress.render_interval_seconds < 0.0) {
        Logger::instance().warn("[Config] Negative render interval, using 0 | value={}",
                               global_.progress.render_interval_seconds);
        global_.progress.render_interval_seconds = 0.0;
    }
    if (global_.logging.max_files == 0) {
        global_.logging.max_files = constants::config_defaults::LOG_MAX_FILES;
    }
}

}}
