#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace console_progress {
namespace common {

// Splits UTF-8 text into glyphs, one code point each. A malformed or
// truncated sequence yields its lead byte as a single glyph.
std::vector<std::string> splitGlyphs(const std::string& text);

size_t glyphCount(const std::string& text);

// Byte offset of the glyph at index |glyph_index|, or text.size() past the end.
size_t glyphOffset(const std::string& text, size_t glyph_index);

std::string repeat(const std::string& unit, size_t count);

std::string padLeft(const std::string& text, size_t width, const std::string& fill);

std::string trimTrailingSpaces(const std::string& text);

std::string toLower(const std::string& text);

}}
