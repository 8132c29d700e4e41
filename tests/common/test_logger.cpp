#include "progressbar/common/config.hpp"
#include "progressbar/common/logger.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/progress_bar.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {

using progressbar::common::Config;
using progressbar::common::LogFormat;
using progressbar::common::Logger;
using progressbar::common::LoggingConfig;
using progressbar::common::LogLevel;
using progressbar::core::ErrorCode;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    LoggingConfig logging = Config::createDefaultConfig().logging;

    void SetUp() override {
        Logger::instance().shutdown();
        dir = std::filesystem::temp_directory_path() /
              ("progressbar_logger_test_" + std::to_string(getpid()));
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        Logger::instance().shutdown();
        std::filesystem::remove_all(dir);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }
};

TEST_F(LoggerTest, CodedFormatCarriesComponentMessageAndName) {
    EXPECT_EQ("[ProgressBar] Progress scope not open | code=SCOPE_NOT_OPEN | total={}",
              Logger::codedFormat(ErrorCode::SCOPE_NOT_OPEN, "ProgressBar", "total={}"));
    EXPECT_EQ("[Pipe] Number of jobs/iterations must be positive | code=INVALID_TOTAL",
              Logger::codedFormat(ErrorCode::INVALID_TOTAL, "Pipe", ""));
}

TEST_F(LoggerTest, CallsBeforeInitializeAreDropped) {
    Logger::instance().warn("[Test] Dropped | value={}", 1);
    Logger::instance().warn(ErrorCode::SCOPE_NOT_OPEN, "Test", "value={}", 2);
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(LoggerTest, FileSinkCreatesDirectoryAndRecordsCodedWarnings) {
    logging.log_file = (dir / "nested" / "run.log").string();
    Logger::instance().initialize(LogLevel::WARN, logging);

    std::ostringstream out;
    progressbar::core::ProgressBarOptions options;
    progressbar::core::ProgressBar bar(3, options, std::make_unique<progressbar::core::StreamSink>(out));
    bar.open();
    bar.open();
    Logger::instance().info("[Test] Below threshold");
    bar.close();
    Logger::instance().shutdown();

    std::string content = readFile(dir / "nested" / "run.log");
    EXPECT_NE(content.find("[warning] [ProgressBar] Progress scope already open | code=SCOPE_ALREADY_OPEN | total=3"),
              std::string::npos);
    EXPECT_EQ(std::string::npos, content.find("Below threshold"));
}

TEST_F(LoggerTest, JsonFormatWritesSuffixedFile) {
    logging.log_file = (dir / "run.log").string();
    logging.format = LogFormat::JSON;
    Logger::instance().initialize(LogLevel::INFO, logging);
    Logger::instance().info("[Test] Started | total={}", 5);
    Logger::instance().shutdown();

    EXPECT_FALSE(std::filesystem::exists(dir / "run.log"));
    std::string content = readFile(dir / "run.json.log");
    EXPECT_NE(content.find(R"("level":"info","message":"[Test] Started | total=5")"), std::string::npos);
}

} // namespace
