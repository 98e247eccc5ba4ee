#include "console_progress/progress/progress_bar.hpp"
#include "console_progress/progress/text_formatter.hpp"
#include "console_progress/common/logger.hpp"
#include <utility>

namespace console_progress {
namespace progress {

ProgressBar::ProgressBar(std::shared_ptr<common::Terminal> terminal,
                         DisplayConfig config,
                         std::chrono::milliseconds interval)
    : terminal_(terminal ? std::move(terminal)
                        : std::shared_ptr<common::Terminal>(std::make_shared<common::ConsoleTerminal>())),
      config_(std::move(config)),
      renderer_(*terminal_),
      scheduler_(interval, [this]() { renderNow(); }) {
    // Redirected output gets no progress bar at all: the scheduler stays
    // idle for the lifetime of this instance.
    if (!terminal_->isInteractive()) {
        common::Logger::instance().debug("[ProgressBar] Output is not a terminal, rendering disabled");
        return;
    }

    config_.column = terminal_->cursorColumn();
    scheduler_.start();
}

ProgressBar::~ProgressBar() {
    dispose();
}

void ProgressBar::report(double value) {
    state_.report(value);
}

ProgressCallback ProgressBar::asCallback() {
    return [this](double value) { report(value); };
}

ProgressBar& ProgressBar::start(bool anchor_inline) {
    if (anchor_inline && terminal_->isInteractive()) {
        int column;
        {
            std::lock_guard<std::mutex> render_lock(render_mutex_);
            column = terminal_->cursorColumn();
        }
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_.column = column;
    }
    return *this;
}

DisplayConfig ProgressBar::displayConfig() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ProgressBar::setDisplayConfig(const DisplayConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

void ProgressBar::configure(const std::function<void(DisplayConfig&)>& edit) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    edit(config_);
}

std::string ProgressBar::renderText(Clock::time_point now) {
    return buildFrame(displayConfig(), now);
}

std::string ProgressBar::buildFrame(const DisplayConfig& config, Clock::time_point now) {
    auto snapshot = state_.snapshot();
    size_t animation_index = state_.advanceAnimation();

    return formatProgressText(snapshot.fraction, now - snapshot.start_time, animation_index, config);
}

void ProgressBar::renderNow() {
    auto config = displayConfig();
    std::string text = buildFrame(config, Clock::now());

    std::lock_guard<std::mutex> lock(render_mutex_);
    renderer_.render(text, config);
}

void ProgressBar::dispose() {
    scheduler_.dispose();
}

bool ProgressBar::isRendering() const {
    return scheduler_.state() == RenderScheduler::State::ACTIVE;
}

std::string ProgressBar::currentText() const {
    std::lock_guard<std::mutex> lock(render_mutex_);
    return renderer_.currentText();
}

}}
