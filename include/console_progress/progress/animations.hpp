#pragma once

#include <string>
#include <vector>
#include <optional>

namespace console_progress {
namespace progress {
namespace animations {

constexpr const char* BRAILLE = "⠋⠙⠹⠸⠼⠴⠦⠧⠇⠏";
constexpr const char* ARROWS = "←↖↑↗→↘↓↙";
constexpr const char* BLOCKS = "▁▂▃▄▅▆▇█▇▆▅▄▃▂";
constexpr const char* DOTS = ".oOo";

std::optional<std::string> findAnimation(const std::string& name);

std::vector<std::string> animationNames();

}}}
