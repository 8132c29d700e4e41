#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace progressbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

enum class ColorMode {
    AUTO,
    ALWAYS,
    NEVER
};

enum class ReportFormat {
    NONE,
    TEXT,
    JSON
};

struct ProgressConfig {
    double render_interval_seconds;
    bool print_summary;
    ColorMode color;
};

struct LoggingConfig {
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ReportConfig {
    ReportFormat format;
};

struct GlobalConfig {
    LogLevel log_level;
    ProgressConfig progress;
    LoggingConfig logging;
    ReportConfig report;
};

std::optional<LogLevel> parseLogLevel(const std::string& name);
std::optional<ColorMode> parseColorMode(const std::string& name);
std::optional<ReportFormat> parseReportFormat(const std::string& name);

class Config {
public:
    static Config& instance();
    
    // Loads defaults, then the given file or the best file on the search path.
    // Returns false when a config file exists but cannot be parsed.
    bool load(const std::string& config_file = "");
    std::optional<std::string> findBestConfig() const;
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
    void normalize();
};

}}
