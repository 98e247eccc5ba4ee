#include "console_progress/common/config.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/error_codes.hpp"
#include "console_progress/common/logger.hpp"
#include "console_progress/common/text_utils.hpp"
#include "console_progress/progress/animations.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace console_progress {
namespace common {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string level = toLower(name);
    if (level == "debug") return LogLevel::DEBUG;
    if (level == "info") return LogLevel::INFO;
    if (level == "warn" || level == "warning") return LogLevel::WARN;
    if (level == "error") return LogLevel::ERROR;
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

    config.log_file = "";
    config.log_level = LogLevel::WARN;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.display = progress::DisplayConfig();

    config.render.interval_ms = RENDER_INTERVAL_MS;

    return config;
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV_VAR)) {
        if (*env_path) {
            paths.emplace_back(env_path);
        }
    }

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back(std::string(xdg) + "/" + constants::system::CONFIG_DIR_NAME +
                            "/" + constants::system::CONFIG_FILE_NAME);
        }
    }

    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back(std::string(home) + "/.config/" + constants::system::CONFIG_DIR_NAME +
                            "/" + constants::system::CONFIG_FILE_NAME);
        }
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;

    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().debug("[Config] Not found | path={}", effective_config_file);
        return true;
    }

    bool loaded = tryLoadTomlFile(effective_config_file);
    validate();
    return loaded;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                if (auto parsed = parseLogLevel(level)) {
                    global_.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] {} | key=global.log_level | value={}",
                                            RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_INVALID_VALUE),
                                            level);
                }
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (toLower(format_str) == "json") {
                    global_.logging.format = LogFormat::JSON;
                } else {
                    global_.logging.format = LogFormat::TEXT;
                }
            }
        }

        if (data.contains("display")) {
            auto display_section = data.at("display");
            auto& display = global_.display;

            if (display_section.contains("number_of_blocks")) {
                display.number_of_blocks = toml::find<int>(display_section, "number_of_blocks");
            }
            if (display_section.contains("start_bracket")) {
                display.start_bracket = toml::find<std::string>(display_section, "start_bracket");
            }
            if (display_section.contains("end_bracket")) {
                display.end_bracket = toml::find<std::string>(display_section, "end_bracket");
            }
            if (display_section.contains("completed_block")) {
                display.completed_block = toml::find<std::string>(display_section, "completed_block");
            }
            if (display_section.contains("incomplete_block")) {
                display.incomplete_block = toml::find<std::string>(display_section, "incomplete_block");
            }
            if (display_section.contains("animation")) {
                std::string name = toml::find<std::string>(display_section, "animation");
                if (auto sequence = progress::animations::findAnimation(name)) {
                    display.animation_sequence = *sequence;
                } else {
                    Logger::instance().warn("[Config] {} | name={}",
                                            RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_UNKNOWN_ANIMATION),
                                            name);
                }
            }
            if (display_section.contains("animation_sequence")) {
                std::string sequence = toml::find<std::string>(display_section, "animation_sequence");
                if (!sequence.empty()) {
                    display.animation_sequence = sequence;
                }
            }
            if (display_section.contains("show_bar")) {
                display.show_bar = toml::find<bool>(display_section, "show_bar");
            }
            if (display_section.contains("show_percent")) {
                display.show_percent = toml::find<bool>(display_section, "show_percent");
            }
            if (display_section.contains("show_runtime")) {
                display.show_runtime = toml::find<bool>(display_section, "show_runtime");
            }
            if (display_section.contains("show_eta")) {
                display.show_eta = toml::find<bool>(display_section, "show_eta");
            }
            if (display_section.contains("show_animation")) {
                display.show_animation = toml::find<bool>(display_section, "show_animation");
            }
            if (display_section.contains("redraw_whole_bar")) {
                display.redraw_whole_bar = toml::find<bool>(display_section, "redraw_whole_bar");
            }
            if (display_section.contains("foreground_color")) {
                std::string name = toml::find<std::string>(display_section, "foreground_color");
                if (auto color = parseColor(name)) {
                    display.foreground = *color;
                } else {
                    Logger::instance().warn("[Config] {} | name={}",
                                            RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_UNKNOWN_COLOR),
                                            name);
                }
            }
        }

        if (data.contains("render")) {
            auto render_section = data.at("render");

            if (render_section.contains("interval_ms")) {
                global_.render.interval_ms = toml::find<int>(render_section, "interval_ms");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] {} | path={} | error={}",
                                 RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_PARSE_FAILED),
                                 path, e.what());
        return false;
    }
}

void Config::validate() {
    if (global_.display.number_of_blocks < 0) {
        Logger::instance().warn("[Config] {} | key=display.number_of_blocks | value={}",
                                RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_INVALID_VALUE),
                                global_.display.number_of_blocks);
        global_.display.number_of_blocks = constants::display_defaults::NUMBER_OF_BLOCKS;
    }

    if (global_.render.interval_ms <= 0) {
        Logger::instance().warn("[Config] {} | key=render.interval_ms | value={}",
                                RenderErrorCodeHelper::getMessage(RenderErrorCode::CONFIG_INVALID_VALUE),
                                global_.render.interval_ms);
        global_.render.interval_ms = constants::config_defaults::RENDER_INTERVAL_MS;
    }

    if (global_.logging.max_files == 0) {
        global_.logging.max_files = constants::config_defaults::LOG_MAX_FILES;
    }
    if (global_.logging.rotation_size_mb == 0) {
        global_.logging.rotation_size_mb = constants::config_defaults::LOG_ROTATION_SIZE_MB;
    }
}

}}
