#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace console_progress {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand);
    bool validateArguments() const override;
    int execute();

private:
    double duration_seconds_;
    int steps_;
    std::string label_;
};

}}
