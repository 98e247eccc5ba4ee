#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "console_progress/common/error_codes.hpp"
#include "console_progress/common/terminal.hpp"
#include <csignal>
#include <fcntl.h>
#include <string>
#include <unistd.h>

using namespace console_progress::common;

class ConsoleTerminalTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
        fcntl(fds[0], F_SETFL, O_NONBLOCK);
    }

    void TearDown() override {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }

    std::string drain() {
        std::string result;
        char buffer[256];
        ssize_t n;
        while ((n = read(fds[0], buffer, sizeof(buffer))) > 0) {
            result.append(buffer, static_cast<size_t>(n));
        }
        return result;
    }
};

TEST_F(ConsoleTerminalTest, pipe_is_not_interactive) {
    ConsoleTerminal terminal(fds[1]);

    EXPECT_FALSE(terminal.isInteractive());
    EXPECT_EQ(terminal.cursorColumn(), 0);
}

TEST_F(ConsoleTerminalTest, write_delivers_bytes) {
    ConsoleTerminal terminal(fds[1]);

    terminal.write("abc\b\xE2\xA0\x8B");

    EXPECT_EQ(drain(), "abc\b\xE2\xA0\x8B");
}

TEST_F(ConsoleTerminalTest, move_to_column_is_one_based_on_the_wire) {
    ConsoleTerminal terminal(fds[1]);

    terminal.moveToColumn(0);
    terminal.moveToColumn(11);
    terminal.moveToColumn(-4);

    EXPECT_EQ(drain(), "\033[1G\033[12G\033[1G");
}

TEST_F(ConsoleTerminalTest, foreground_escape_only_on_change) {
    ConsoleTerminal terminal(fds[1]);
    EXPECT_EQ(terminal.foreground(), Color::DEFAULT);

    terminal.setForeground(Color::DEFAULT);
    terminal.setForeground(Color::GREEN);
    terminal.setForeground(Color::GREEN);
    terminal.setForeground(Color::DEFAULT);

    EXPECT_EQ(drain(), "\033[92m\033[39m");
    EXPECT_EQ(terminal.foreground(), Color::DEFAULT);
}

TEST_F(ConsoleTerminalTest, closed_reader_reports_terminal_closed) {
    ConsoleTerminal terminal(fds[1]);
    close(fds[0]);
    fds[0] = -1;

    auto previous = std::signal(SIGPIPE, SIG_IGN);
    try {
        terminal.write("x");
        ADD_FAILURE() << "write to a closed pipe succeeded";
    } catch (const TerminalError& e) {
        EXPECT_EQ(e.code(), RenderErrorCode::TERMINAL_CLOSED);
        EXPECT_EQ(e.context().component, "Terminal");
        EXPECT_THAT(e.what(), ::testing::HasSubstr("reason="));
    }
    std::signal(SIGPIPE, previous);
}

TEST(ConsoleTerminal, bad_descriptor_reports_write_failure) {
    ConsoleTerminal terminal(-1);

    try {
        terminal.write("x");
        FAIL() << "write to an invalid descriptor succeeded";
    } catch (const TerminalError& e) {
        EXPECT_EQ(e.code(), RenderErrorCode::TERMINAL_WRITE_FAILED);
        EXPECT_EQ(e.context().details.at("fd"), "-1");
        EXPECT_STREQ(e.codeString(), "TERMINAL_WRITE_FAILED");
    }
}

TEST(Color, parse_accepts_common_spellings) {
    EXPECT_EQ(parseColor("DarkBlue"), Color::DARK_BLUE);
    EXPECT_EQ(parseColor("dark_blue"), Color::DARK_BLUE);
    EXPECT_EQ(parseColor("dark-blue"), Color::DARK_BLUE);
    EXPECT_EQ(parseColor("WHITE"), Color::WHITE);
    EXPECT_EQ(parseColor("default"), Color::DEFAULT);
    EXPECT_FALSE(parseColor("chartreuse").has_value());
    EXPECT_FALSE(parseColor("").has_value());
}

TEST(Color, ansi_codes) {
    EXPECT_EQ(ansiForegroundCode(Color::DEFAULT), 39);
    EXPECT_EQ(ansiForegroundCode(Color::BLACK), 30);
    EXPECT_EQ(ansiForegroundCode(Color::DARK_RED), 31);
    EXPECT_EQ(ansiForegroundCode(Color::GRAY), 37);
    EXPECT_EQ(ansiForegroundCode(Color::DARK_GRAY), 90);
    EXPECT_EQ(ansiForegroundCode(Color::WHITE), 97);
}

TEST(Color, names_round_trip) {
    auto names = colorNames();
    EXPECT_EQ(names.size(), 17u);
    for (const auto& name : names) {
        auto color = parseColor(name);
        ASSERT_TRUE(color.has_value()) << name;
        EXPECT_EQ(colorName(*color), name);
    }
}
