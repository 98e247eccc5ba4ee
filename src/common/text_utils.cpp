#include "console_progress/common/text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace console_progress {
namespace common {

static size_t sequenceLength(const std::string& text, size_t pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if ((c & 0x80) == 0) {
        return 1;
    }

    size_t utf8_len = 0;
    if ((c & 0xE0) == 0xC0) utf8_len = 2;
    else if ((c & 0xF0) == 0xE0) utf8_len = 3;
    else if ((c & 0xF8) == 0xF0) utf8_len = 4;

    if (utf8_len == 0 || pos + utf8_len > text.length()) {
        return 1;
    }

    for (size_t j = 1; j < utf8_len; ++j) {
        if ((static_cast<unsigned char>(text[pos + j]) & 0xC0) != 0x80) {
            return 1;
        }
    }

    return utf8_len;
}

std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> glyphs;
    glyphs.reserve(text.length());

    size_t pos = 0;
    while (pos < text.length()) {
        size_t len = sequenceLength(text, pos);
        glyphs.push_back(text.substr(pos, len));
        pos += len;
    }

    return glyphs;
}

size_t glyphCount(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.length()) {
        pos += sequenceLength(text, pos);
        ++count;
    }
    return count;
}

size_t glyphOffset(const std::string& text, size_t glyph_index) {
    size_t pos = 0;
    for (size_t i = 0; i < glyph_index && pos < text.length(); ++i) {
        pos += sequenceLength(text, pos);
    }
    return pos;
}

std::string repeat(const std::string& unit, size_t count) {
    std::string result;
    result.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += unit;
    }
    return result;
}

std::string padLeft(const std::string& text, size_t width, const std::string& fill) {
    size_t length = glyphCount(text);
    if (length >= width) {
        return text;
    }
    return repeat(fill, width - length) + text;
}

std::string trimTrailingSpaces(const std::string& text) {
    size_t end = text.find_last_not_of(' ');
    if (end == std::string::npos) {
        return "";
    }
    return text.substr(0, end + 1);
}

std::string toLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}}
