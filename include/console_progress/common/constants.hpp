#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace console_progress {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("console-progress v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "console-progress";
    constexpr const char* CONFIG_ENV_VAR = "CONSOLE_PROGRESS_CONFIG";
    constexpr const char* CONFIG_DIR_NAME = "console-progress";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr const char* LOGGER_NAME = "console-progress";
}

namespace render {
    constexpr std::chrono::milliseconds DEFAULT_INTERVAL{125};
    constexpr std::chrono::milliseconds CURSOR_QUERY_TIMEOUT{100};

    // Reports below/above these reset the runtime clock.
    constexpr double RESTART_LOW_THRESHOLD = 0.001;
    constexpr double RESTART_HIGH_THRESHOLD = 0.999;

    constexpr size_t PERCENT_WIDTH = 4;

    // 99:59:59
    constexpr int64_t MAX_ETA_SECONDS = 99 * 3600 + 59 * 60 + 59;
    constexpr const char* NBSP = "\xC2\xA0";
}

namespace display_defaults {
    constexpr int NUMBER_OF_BLOCKS = 10;
    constexpr const char* START_BRACKET = "[";
    constexpr const char* END_BRACKET = "]";
    constexpr const char* COMPLETED_BLOCK = "#";
    constexpr const char* INCOMPLETE_BLOCK = "-";
    constexpr bool SHOW_BAR = true;
    constexpr bool SHOW_PERCENT = true;
    constexpr bool SHOW_RUNTIME = false;
    constexpr bool SHOW_ETA = false;
    constexpr bool SHOW_ANIMATION = true;
    constexpr bool REDRAW_WHOLE_BAR = false;
}

namespace config_defaults {
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
    constexpr int RENDER_INTERVAL_MS = 125;

    constexpr double DEMO_DURATION_SECONDS = 5.0;
    constexpr int DEMO_STEPS = 100;
}

}
}
