#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace progressbar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "0.1.0";
    
    inline std::string getFullVersion() {
        return std::string("progressbar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "progressbar";
    constexpr const char* APPLICATION_DESCRIPTION = "Terminal progress bar for pipelines";
    constexpr const char* LOGGER_NAME = "progressbar";
    constexpr const char* CONFIG_ENV = "PROGRESSBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "progressbar.toml";
    constexpr const char* SYSTEM_CONFIG_DIR = "/etc/progressbar";
}

namespace render {
    constexpr int BAR_WIDTH = 50;
    constexpr int PLACEHOLDER_WIDTH = 40;
    constexpr int64_t UNKNOWN_TOTAL = -1;
    // Units per second are shown as bits per second for byte-sized units.
    constexpr double THROUGHPUT_SCALE = 8.0;
    constexpr const char* SUMMARY_COLOR = "\033[34m";
    constexpr const char* COLOR_RESET = "\033[0m";
}

namespace limits {
    constexpr double DEFAULT_RENDER_INTERVAL_SECONDS = 0.1;
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr double RENDER_INTERVAL_SECONDS = limits::DEFAULT_RENDER_INTERVAL_SECONDS;
    constexpr bool PRINT_SUMMARY = true;
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
