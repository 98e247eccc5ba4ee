#include "console_progress/progress/animations.hpp"
#include "console_progress/progress/display_config.hpp"
#include "console_progress/common/text_utils.hpp"
#include <array>
#include <utility>

namespace console_progress {
namespace progress {
namespace animations {

static const std::array<std::pair<const char*, const char*>, 5> PRESETS = {{
    {"default", DEFAULT},
    {"braille", BRAILLE},
    {"arrows", ARROWS},
    {"blocks", BLOCKS},
    {"dots", DOTS}
}};

std::optional<std::string> findAnimation(const std::string& name) {
    std::string key = common::toLower(name);
    for (const auto& [preset_name, sequence] : PRESETS) {
        if (key == preset_name) {
            return std::string(sequence);
        }
    }
    return std::nullopt;
}

std::vector<std::string> animationNames() {
    std::vector<std::string> names;
    for (const auto& preset : PRESETS) {
        names.emplace_back(preset.first);
    }
    return names;
}

}}}
