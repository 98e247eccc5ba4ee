#pragma once

#include "console_progress/progress/display_config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace console_progress {
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

std::optional<LogLevel> parseLogLevel(const std::string& name);

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct RenderConfig {
    int interval_ms;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    progress::DisplayConfig display;
    RenderConfig render;
};

class Config {
public:
    static Config& instance();

    // Resets to defaults, then overlays the given file (or the best match
    // from the search paths). A missing file is not an error.
    bool load(const std::string& config_file = "");

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    std::string getConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
    void validate();
};

}}
