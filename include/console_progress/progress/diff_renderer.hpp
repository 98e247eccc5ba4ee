#pragma once

#include "display_config.hpp"
#include "console_progress/common/terminal.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace console_progress {
namespace progress {

// Owns the single line currently on screen and rewrites it in place.
//
// Diff mode backs up over the part of the old text that differs and writes
// only the new suffix. Full-redraw mode moves to the configured column and
// writes the whole line. In both modes a shorter line is blanked past its
// end and the cursor is returned to just after the visible text.
//
// Glyph positions are assumed to map one-to-one onto terminal columns.
class DiffRenderer {
public:
    explicit DiffRenderer(common::Terminal& terminal);

    // Brings the screen from currentText() to |text|. If the terminal write
    // throws, currentText() is left unchanged.
    void render(const std::string& text, const DisplayConfig& config);

    const std::string& currentText() const { return current_text_; }

    // Forgets the displayed line, e.g. after the host moved to a new line.
    void reset() { current_text_.clear(); }

    // Byte sequence render() would emit in diff mode, without writing it.
    std::string diffPayload(const std::string& text) const;

    static size_t commonPrefixLength(const std::vector<std::string>& current,
                                     const std::vector<std::string>& text);

private:
    common::Terminal& terminal_;
    std::string current_text_;

    void writeColored(const DisplayConfig& config, const std::string& payload, bool reposition);
};

}}
