#include <gtest/gtest.h>
#include "console_progress/common/text_utils.hpp"

using namespace console_progress::common;

TEST(TextUtils, split_ascii) {
    auto glyphs = splitGlyphs("ab c");

    ASSERT_EQ(glyphs.size(), 4u);
    EXPECT_EQ(glyphs[2], " ");
}

TEST(TextUtils, split_multibyte) {
    // U+00A0, U+2588, U+1F600
    auto glyphs = splitGlyphs("a\xC2\xA0\xE2\x96\x88\xF0\x9F\x98\x80z");

    ASSERT_EQ(glyphs.size(), 5u);
    EXPECT_EQ(glyphs[1], "\xC2\xA0");
    EXPECT_EQ(glyphs[2], "\xE2\x96\x88");
    EXPECT_EQ(glyphs[3], "\xF0\x9F\x98\x80");
    EXPECT_EQ(glyphs[4], "z");
}

TEST(TextUtils, split_malformed_bytes_one_at_a_time) {
    auto truncated = splitGlyphs("x\xE2\x96");
    ASSERT_EQ(truncated.size(), 3u);
    EXPECT_EQ(truncated[1], "\xE2");

    auto stray = splitGlyphs("\x80" "a");
    ASSERT_EQ(stray.size(), 2u);
    EXPECT_EQ(stray[0], "\x80");
}

TEST(TextUtils, glyph_count_and_offset) {
    std::string text = "[\xE2\x96\x88\xE2\x96\x88-]";

    EXPECT_EQ(glyphCount(text), 5u);
    EXPECT_EQ(glyphCount(""), 0u);
    EXPECT_EQ(glyphOffset(text, 0), 0u);
    EXPECT_EQ(glyphOffset(text, 2), 4u);
    EXPECT_EQ(glyphOffset(text, 3), 7u);
    EXPECT_EQ(glyphOffset(text, 99), text.size());
}

TEST(TextUtils, repeat_units) {
    EXPECT_EQ(repeat("#", 3), "###");
    EXPECT_EQ(repeat("\xC2\xB7", 2), "\xC2\xB7\xC2\xB7");
    EXPECT_EQ(repeat("ab", 0), "");
}

TEST(TextUtils, pad_left_counts_glyphs) {
    EXPECT_EQ(padLeft("7%", 4, "."), "..7%");
    EXPECT_EQ(padLeft("100%", 4, "."), "100%");
    EXPECT_EQ(padLeft("1000%", 4, "."), "1000%");
    EXPECT_EQ(padLeft("\xE2\x96\x88", 2, "-"), "-\xE2\x96\x88");
}

TEST(TextUtils, trim_trailing_spaces_only) {
    EXPECT_EQ(trimTrailingSpaces("abc   "), "abc");
    EXPECT_EQ(trimTrailingSpaces("  abc"), "  abc");
    EXPECT_EQ(trimTrailingSpaces("   "), "");
    EXPECT_EQ(trimTrailingSpaces("50%\xC2\xA0"), "50%\xC2\xA0");
}

TEST(TextUtils, to_lower) {
    EXPECT_EQ(toLower("DarkBlue"), "darkblue");
}
