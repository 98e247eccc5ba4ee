#include "console_progress/progress/text_formatter.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/text_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace console_progress {
namespace progress {

namespace {

std::string stripLeadingZeroUnits(std::string text) {
    if (text.rfind("0:", 0) == 0) {
        text.erase(0, 2);
    }
    if (text.rfind("00:", 0) == 0) {
        text.erase(0, 3);
    }
    return text;
}

bool inProgress(double fraction) {
    return fraction > 0.0 && fraction < 1.0;
}

}

std::string buildBar(double fraction, const DisplayConfig& config) {
    int blocks = std::max(0, config.number_of_blocks);
    int completed = static_cast<int>(std::floor(fraction * blocks));
    completed = std::max(0, std::min(blocks, completed));

    return config.start_bracket +
           common::repeat(config.completed_block, static_cast<size_t>(completed)) +
           common::repeat(config.incomplete_block, static_cast<size_t>(blocks - completed)) +
           config.end_bracket;
}

std::string formatPercent(double fraction) {
    long percent = std::lround(fraction * 100.0);
    return common::padLeft(fmt::format("{}%", percent),
                           constants::render::PERCENT_WIDTH,
                           constants::render::NBSP);
}

std::string formatRuntime(Clock::duration elapsed) {
    int64_t total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (total_ms < 0) {
        total_ms = 0;
    }

    int64_t hours = total_ms / 3600000;
    int64_t minutes = (total_ms / 60000) % 60;
    int64_t seconds = (total_ms / 1000) % 60;
    int64_t tenths = (total_ms / 100) % 10;

    return stripLeadingZeroUnits(fmt::format("{}:{:02}:{:02}.{}", hours, minutes, seconds, tenths));
}

std::string formatEta(double fraction, Clock::duration elapsed) {
    if (!(fraction > 0.0)) {
        return "";
    }

    double elapsed_seconds = std::chrono::duration<double>(elapsed).count();
    double seconds_per_unit = elapsed_seconds / fraction;
    double remaining = (1.0 - fraction) * seconds_per_unit;

    // Tiny fractions extrapolate to huge or infinite values; saturate at the cap.
    constexpr double max_seconds = static_cast<double>(constants::render::MAX_ETA_SECONDS);
    int64_t total = 0;
    if (remaining > 0.0) {
        total = static_cast<int64_t>(std::min(remaining, max_seconds));
    }
    int64_t hours = total / 3600;
    int64_t minutes = (total / 60) % 60;
    int64_t seconds = total % 60;

    return stripLeadingZeroUnits(fmt::format("{}:{:02}:{:02}", hours, minutes, seconds));
}

std::string animationFrame(const std::string& sequence, size_t animation_index) {
    auto glyphs = common::splitGlyphs(sequence);
    if (glyphs.empty()) {
        return "";
    }
    return glyphs[animation_index % glyphs.size()];
}

std::string formatProgressText(double fraction,
                               Clock::duration elapsed,
                               size_t animation_index,
                               const DisplayConfig& config) {
    const std::string single_space = " ";

    std::string bar = config.show_bar ? buildBar(fraction, config) + single_space : "";
    std::string percent = config.show_percent ? formatPercent(fraction) + single_space : "";

    std::string animation;
    if (config.show_animation && fraction < 1.0) {
        animation = animationFrame(config.animation_sequence, animation_index);
    }

    std::string runtime;
    if (config.show_runtime && inProgress(fraction)) {
        runtime = single_space + formatRuntime(elapsed);
    }

    std::string eta;
    if (config.show_eta && inProgress(fraction)) {
        eta = " (" + formatEta(fraction, elapsed) + " left)";
    }

    return common::trimTrailingSpaces(bar + percent + animation + runtime + eta);
}

}}
