#pragma once

#include "display_config.hpp"
#include "diff_renderer.hpp"
#include "progress_state.hpp"
#include "render_scheduler.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/terminal.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace console_progress {
namespace progress {

// Capability handed to code that only needs to report a fraction complete.
using ProgressCallback = std::function<void(double)>;

// Animated single-line progress indicator. Rendering starts on construction
// when the terminal is interactive; on redirected output nothing is written.
class ProgressBar {
public:
    explicit ProgressBar(std::shared_ptr<common::Terminal> terminal = nullptr,
                         DisplayConfig config = DisplayConfig(),
                         std::chrono::milliseconds interval = constants::render::DEFAULT_INTERVAL);
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void report(double value);

    // The returned callback must not outlive this bar.
    ProgressCallback asCallback();

    // Anchors the render column to the current cursor position.
    ProgressBar& start(bool anchor_inline = true);

    DisplayConfig displayConfig() const;
    void setDisplayConfig(const DisplayConfig& config);
    void configure(const std::function<void(DisplayConfig&)>& edit);

    // Text of the next frame. Advances the spinner by one position.
    std::string renderText(Clock::time_point now = Clock::now());

    // Formats and draws one frame on the calling thread.
    void renderNow();

    void dispose();

    bool isRendering() const;
    RenderScheduler::State schedulerState() const { return scheduler_.state(); }
    ProgressSnapshot snapshot() const { return state_.snapshot(); }
    std::string currentText() const;

private:
    std::shared_ptr<common::Terminal> terminal_;

    mutable std::mutex config_mutex_;
    DisplayConfig config_;

    ProgressState state_;

    mutable std::mutex render_mutex_;
    DiffRenderer renderer_;

    // Declared last so its thread stops before the members above go away.
    RenderScheduler scheduler_;

    std::string buildFrame(const DisplayConfig& config, Clock::time_point now);
};

}}
