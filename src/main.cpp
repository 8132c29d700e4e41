#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "progressbar/common/config.hpp"
#include "progressbar/common/constants.hpp"
#include "progressbar/common/logger.hpp"
#include "progressbar/core/error_codes.hpp"
#include "cli/pipe_command.hpp"

int main(int argc, char** argv) {
    using namespace progressbar;
    
    try {
        CLI::App app{constants::system::APPLICATION_DESCRIPTION, constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        
        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Log level (ERROR, WARN, INFO, DEBUG)");
        
        auto pipe_cmd = std::make_unique<cli::PipeCommand>();
        pipe_cmd->setup(&app);
        
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e) == 0 ? 0 : 1;
        }
        
        auto& config = common::Config::instance();
        bool config_ok = config.load(config_file);
        
        auto& global = config.global();
        if (auto level = common::parseLogLevel(log_level)) {
            global.log_level = *level;
        }
        
        common::Logger::instance().initialize(global.log_level, global.logging);
        
        if (!config_ok) {
            common::Logger::instance().warn(core::ErrorCode::CONFIG_PARSE_FAILED, "Main", "path={} | using defaults",
                config_file.empty() ? std::string("<search path>") : config_file);
        }
        
        int rc = pipe_cmd->execute();
        common::Logger::instance().shutdown();
        return rc;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
