#include "main_command.hpp"
#include "console_progress/common/config.hpp"
#include "console_progress/common/terminal.hpp"
#include "console_progress/progress/animations.hpp"
#include <iostream>

namespace console_progress {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::addDisplayOptions(CLI::App* subcommand) {
    subcommand->add_option("-b,--blocks", blocks_, "Number of blocks in the bar")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-a,--animation", animation_, "Spinner preset")
              ->check(CLI::IsMember(progress::animations::animationNames(), CLI::ignore_case));
    subcommand->add_option("--color", color_, "Foreground color of the bar")
              ->check(CLI::IsMember(common::colorNames(), CLI::ignore_case));
    subcommand->add_option("--start-bracket", start_bracket_, "Text before the blocks");
    subcommand->add_option("--end-bracket", end_bracket_, "Text after the blocks");
    subcommand->add_option("--interval", interval_ms_, "Milliseconds between redraws")
              ->check(CLI::PositiveNumber);
    subcommand->add_flag("--runtime", show_runtime_, "Show elapsed time");
    subcommand->add_flag("--eta", show_eta_, "Show estimated time left");
    subcommand->add_flag("--no-bar", hide_bar_, "Hide the block bar");
    subcommand->add_flag("--no-percent", hide_percent_, "Hide the percentage");
    subcommand->add_flag("--no-animation", hide_animation_, "Hide the spinner");
    subcommand->add_flag("--redraw", redraw_whole_bar_, "Rewrite the whole line on every tick");
}

bool MainCommand::applyDisplayOptions(progress::DisplayConfig& display,
                                      std::chrono::milliseconds& interval) const {
    interval = std::chrono::milliseconds(common::Config::instance().global().render.interval_ms);
    if (interval_ms_ > 0) {
        interval = std::chrono::milliseconds(interval_ms_);
    }

    if (blocks_ >= 0) {
        display.number_of_blocks = blocks_;
    }

    if (!animation_.empty()) {
        auto sequence = progress::animations::findAnimation(animation_);
        if (!sequence) {
            std::cerr << "Error: Unknown animation '" << animation_ << "'\n";
            return false;
        }
        display.animation_sequence = *sequence;
    }

    if (!color_.empty()) {
        auto color = common::parseColor(color_);
        if (!color) {
            std::cerr << "Error: Unknown color '" << color_ << "'\n";
            return false;
        }
        display.foreground = *color;
    }

    if (!start_bracket_.empty()) display.start_bracket = start_bracket_;
    if (!end_bracket_.empty()) display.end_bracket = end_bracket_;

    if (show_runtime_) display.show_runtime = true;
    if (show_eta_) display.show_eta = true;
    if (hide_bar_) display.show_bar = false;
    if (hide_percent_) display.show_percent = false;
    if (hide_animation_) display.show_animation = false;
    if (redraw_whole_bar_) display.redraw_whole_bar = true;

    return true;
}

}}
