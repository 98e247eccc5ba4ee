#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace console_progress {
namespace cli {

class PipeCommand : public MainCommand {
public:
    PipeCommand();

    void setup(CLI::App* subcommand);
    int execute();

    // Parses "0.25", "25%" or, with |as_percent|, "25". Returns nothing for
    // blank or malformed lines.
    static std::optional<double> parseProgressLine(const std::string& line, bool as_percent);

private:
    bool as_percent_;
    std::string label_;

    size_t consume(std::istream& input, const std::function<void(double)>& report) const;
};

}}
