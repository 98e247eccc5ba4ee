#include "console_progress/progress/diff_renderer.hpp"
#include "console_progress/common/text_utils.hpp"
#include <algorithm>

namespace console_progress {
namespace progress {

namespace {

constexpr char BACKSPACE = '\b';

std::string blankOverhang(size_t overhang) {
    return std::string(overhang, ' ') + std::string(overhang, BACKSPACE);
}

}

DiffRenderer::DiffRenderer(common::Terminal& terminal)
    : terminal_(terminal) {}

size_t DiffRenderer::commonPrefixLength(const std::vector<std::string>& current,
                                        const std::vector<std::string>& text) {
    size_t common_length = std::min(current.size(), text.size());
    size_t prefix = 0;
    while (prefix < common_length && current[prefix] == text[prefix]) {
        ++prefix;
    }
    return prefix;
}

std::string DiffRenderer::diffPayload(const std::string& text) const {
    auto current_glyphs = common::splitGlyphs(current_text_);
    auto new_glyphs = common::splitGlyphs(text);
    size_t prefix = commonPrefixLength(current_glyphs, new_glyphs);

    std::string payload(current_glyphs.size() - prefix, BACKSPACE);
    payload += text.substr(common::glyphOffset(text, prefix));

    if (current_glyphs.size() > new_glyphs.size()) {
        payload += blankOverhang(current_glyphs.size() - new_glyphs.size());
    }

    return payload;
}

void DiffRenderer::render(const std::string& text, const DisplayConfig& config) {
    if (config.redraw_whole_bar) {
        size_t current_length = common::glyphCount(current_text_);
        size_t new_length = common::glyphCount(text);

        std::string payload = text;
        if (current_length > new_length) {
            payload += blankOverhang(current_length - new_length);
        }

        writeColored(config, payload, true);
    } else {
        std::string payload = diffPayload(text);
        if (!payload.empty()) {
            writeColored(config, payload, false);
        }
    }

    current_text_ = text;
}

void DiffRenderer::writeColored(const DisplayConfig& config, const std::string& payload, bool reposition) {
    common::Color previous = terminal_.foreground();
    terminal_.setForeground(config.foreground);

    try {
        if (reposition) {
            terminal_.moveToColumn(config.column);
        }
        terminal_.write(payload);
    } catch (...) {
        terminal_.setForeground(previous);
        throw;
    }

    terminal_.setForeground(previous);
}

}}
