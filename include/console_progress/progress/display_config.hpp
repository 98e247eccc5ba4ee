#pragma once

#include "console_progress/common/constants.hpp"
#include "console_progress/common/terminal.hpp"
#include <string>

namespace console_progress {
namespace progress {

namespace animations {
    constexpr const char* DEFAULT = "|/-\\";
}

struct DisplayConfig {
    int number_of_blocks = constants::display_defaults::NUMBER_OF_BLOCKS;
    std::string start_bracket = constants::display_defaults::START_BRACKET;
    std::string end_bracket = constants::display_defaults::END_BRACKET;
    std::string completed_block = constants::display_defaults::COMPLETED_BLOCK;
    std::string incomplete_block = constants::display_defaults::INCOMPLETE_BLOCK;
    std::string animation_sequence = animations::DEFAULT;

    bool show_bar = constants::display_defaults::SHOW_BAR;
    bool show_percent = constants::display_defaults::SHOW_PERCENT;
    bool show_runtime = constants::display_defaults::SHOW_RUNTIME;
    bool show_eta = constants::display_defaults::SHOW_ETA;
    bool show_animation = constants::display_defaults::SHOW_ANIMATION;

    // Full-redraw mode repositions to |column| on every tick. The column is
    // absolute and goes stale if the terminal scrolls or the line wraps.
    bool redraw_whole_bar = constants::display_defaults::REDRAW_WHOLE_BAR;
    int column = 0;

    common::Color foreground = common::Color::WHITE;
};

}}
