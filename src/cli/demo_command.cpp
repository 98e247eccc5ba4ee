#include "demo_command.hpp"
#include "console_progress/common/config.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/logger.hpp"
#include "console_progress/progress/progress_bar.hpp"
#include <iostream>
#include <thread>

namespace console_progress {
namespace cli {

DemoCommand::DemoCommand()
    : duration_seconds_(constants::config_defaults::DEMO_DURATION_SECONDS),
      steps_(constants::config_defaults::DEMO_STEPS),
      label_("Working... ") {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("-d,--duration", duration_seconds_, "Length of the simulated task in seconds")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-s,--steps", steps_, "Number of progress reports")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-l,--label", label_, "Text printed before the bar");
    addDisplayOptions(subcommand);

    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::validateArguments() const {
    return duration_seconds_ > 0 && steps_ > 0;
}

int DemoCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: --duration and --steps must be positive\n";
        return 1;
    }

    progress::DisplayConfig display = common::Config::instance().global().display;
    std::chrono::milliseconds interval;
    if (!applyDisplayOptions(display, interval)) {
        return 1;
    }

    std::cout << label_ << std::flush;

    progress::ProgressBar bar(nullptr, display, interval);
    bar.start(true);
    bool rendering = bar.isRendering();

    common::Logger::instance().info("[Demo] Started | duration_s={} | steps={} | rendering={}",
                                    duration_seconds_, steps_, rendering);

    auto report = bar.asCallback();
    auto step_delay = std::chrono::duration<double>(duration_seconds_ / steps_);

    std::thread worker([&report, step_delay, this]() {
        for (int i = 0; i <= steps_; ++i) {
            report(static_cast<double>(i) / steps_);
            if (i < steps_) {
                std::this_thread::sleep_for(step_delay);
            }
        }
    });
    worker.join();

    bar.dispose();

    if (rendering) {
        bar.renderNow();
        std::cout << std::endl;
    } else {
        std::cout << "done" << std::endl;
    }

    common::Logger::instance().info("[Demo] Finished | final_text={}", bar.currentText());
    return 0;
}

}}
