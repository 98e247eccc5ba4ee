#pragma once

#include "console_progress/progress/display_config.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <string>

namespace console_progress {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    bool wasCalled() const { return was_called_; }

protected:
    bool was_called_ = false;

    // Flags shared by every command that draws a bar. They override the
    // [display] and [render] sections of the configuration file.
    void addDisplayOptions(CLI::App* subcommand);
    bool applyDisplayOptions(progress::DisplayConfig& display,
                             std::chrono::milliseconds& interval) const;

private:
    int blocks_ = -1;
    int interval_ms_ = 0;
    std::string animation_;
    std::string color_;
    std::string start_bracket_;
    std::string end_bracket_;
    bool show_runtime_ = false;
    bool show_eta_ = false;
    bool hide_bar_ = false;
    bool hide_percent_ = false;
    bool hide_animation_ = false;
    bool redraw_whole_bar_ = false;
};

}}
