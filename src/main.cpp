#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "console_progress/common/config.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/logger.hpp"
#include "cli/demo_command.hpp"
#include "cli/pipe_command.hpp"

namespace {

void initialize_logging(const std::string& log_file, console_progress::common::LogLevel level) {
    using namespace console_progress::common;

    if (log_file.empty()) {
        return;
    }

    auto& logger = Logger::instance();
    const auto& logging = Config::instance().global().logging;

    // Log lines on the terminal would tear the progress line apart.
    logger.shutdown();
    logger.initialize(LogMode::FILE_ONLY, log_file, level, logging);
}

}

int main(int argc, char** argv) {
    using namespace console_progress;

    try {
        CLI::App app{"Animated in-place progress bar for the terminal",
                     constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_path;
        std::string log_file;
        std::string log_level;

        app.add_option("-c,--config", config_path, "Configuration file path")
           ->check(CLI::ExistingFile);
        app.add_option("--log-file", log_file, "Write log messages to this file");
        app.add_option("--log-level", log_level, "Log verbosity")
           ->check(CLI::IsMember({"debug", "info", "warn", "error"}, CLI::ignore_case));

        auto demo_cmd = std::make_unique<cli::DemoCommand>();
        auto pipe_cmd = std::make_unique<cli::PipeCommand>();

        demo_cmd->setup(app.add_subcommand("demo", "Run a simulated task with a progress bar"));
        pipe_cmd->setup(app.add_subcommand("pipe", "Draw progress values read from stdin"));

        CLI11_PARSE(app, argc, argv);

        auto level = common::parseLogLevel(log_level).value_or(common::LogLevel::WARN);
        common::Logger::instance().initialize(common::LogMode::CONSOLE_ONLY, "", level,
                                              common::Config::createDefaultConfig().logging);

        auto& config = common::Config::instance();
        if (!config.load(config_path)) {
            std::cerr << "Error: Failed to load configuration: " << config.getConfigPath() << std::endl;
            return 1;
        }

        if (log_level.empty()) {
            level = config.global().log_level;
            common::Logger::instance().setLevel(level);
        }
        if (log_file.empty()) {
            log_file = config.global().log_file;
        }
        initialize_logging(log_file, level);

        int result = 0;
        if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else if (pipe_cmd->wasCalled()) {
            result = pipe_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        common::Logger::instance().shutdown();
        return result;

    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
