#include "pipe_command.hpp"
#include "console_progress/common/config.hpp"
#include "console_progress/common/logger.hpp"
#include "console_progress/progress/progress_bar.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace console_progress {
namespace cli {

PipeCommand::PipeCommand()
    : as_percent_(false) {}

void PipeCommand::setup(CLI::App* subcommand) {
    subcommand->add_flag("-p,--percent", as_percent_, "Input values are percentages (0-100)");
    subcommand->add_option("-l,--label", label_, "Text printed before the bar");
    addDisplayOptions(subcommand);

    subcommand->callback([this]() { was_called_ = true; });
}

std::optional<double> PipeCommand::parseProgressLine(const std::string& line, bool as_percent) {
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    size_t end = line.find_last_not_of(" \t\r");
    std::string token = line.substr(begin, end - begin + 1);

    bool percent = as_percent;
    if (!token.empty() && token.back() == '%') {
        percent = true;
        token.pop_back();
    }
    if (token.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* parse_end = nullptr;
    double value = std::strtod(token.c_str(), &parse_end);
    if (errno != 0 || parse_end != token.c_str() + token.size() || !std::isfinite(value)) {
        return std::nullopt;
    }

    return percent ? value / 100.0 : value;
}

size_t PipeCommand::consume(std::istream& input, const std::function<void(double)>& report) const {
    size_t accepted = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(input, line)) {
        ++line_number;
        auto value = parseProgressLine(line, as_percent_);
        if (!value) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                common::Logger::instance().warn("[Pipe] Skipping unparseable line | line={} | text={}",
                                                line_number, line);
            }
            continue;
        }
        report(*value);
        ++accepted;
    }

    return accepted;
}

int PipeCommand::execute() {
    progress::DisplayConfig display = common::Config::instance().global().display;
    std::chrono::milliseconds interval;
    if (!applyDisplayOptions(display, interval)) {
        return 1;
    }

    if (!label_.empty()) {
        std::cout << label_ << std::flush;
    }

    progress::ProgressBar bar(nullptr, display, interval);
    bar.start(true);
    bool rendering = bar.isRendering();

    size_t accepted = consume(std::cin, bar.asCallback());

    bar.dispose();
    if (rendering) {
        bar.renderNow();
        std::cout << std::endl;
    }

    common::Logger::instance().info("[Pipe] Input closed | values={} | final_fraction={}",
                                    accepted, bar.snapshot().fraction);
    return 0;
}

}}
