#include "console_progress/common/terminal.hpp"
#include "console_progress/common/constants.hpp"
#include "console_progress/common/error_codes.hpp"
#include "console_progress/common/logger.hpp"
#include "console_progress/common/text_utils.hpp"
#include <array>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <termios.h>

namespace console_progress {
namespace common {

namespace {

struct ColorEntry {
    Color color;
    const char* name;
    int ansi_code;
};

constexpr std::array<ColorEntry, 17> COLOR_TABLE = {{
    {Color::DEFAULT, "default", 39},
    {Color::BLACK, "black", 30},
    {Color::DARK_BLUE, "darkblue", 34},
    {Color::DARK_GREEN, "darkgreen", 32},
    {Color::DARK_CYAN, "darkcyan", 36},
    {Color::DARK_RED, "darkred", 31},
    {Color::DARK_MAGENTA, "darkmagenta", 35},
    {Color::DARK_YELLOW, "darkyellow", 33},
    {Color::GRAY, "gray", 37},
    {Color::DARK_GRAY, "darkgray", 90},
    {Color::BLUE, "blue", 94},
    {Color::GREEN, "green", 92},
    {Color::CYAN, "cyan", 96},
    {Color::RED, "red", 91},
    {Color::MAGENTA, "magenta", 95},
    {Color::YELLOW, "yellow", 93},
    {Color::WHITE, "white", 97}
}};

const ColorEntry& lookup(Color color) {
    for (const auto& entry : COLOR_TABLE) {
        if (entry.color == color) {
            return entry;
        }
    }
    return COLOR_TABLE[0];
}

}

std::optional<Color> parseColor(const std::string& name) {
    std::string normalized;
    for (char c : toLower(name)) {
        if (c != '_' && c != '-' && c != ' ') {
            normalized += c;
        }
    }

    for (const auto& entry : COLOR_TABLE) {
        if (normalized == entry.name) {
            return entry.color;
        }
    }
    return std::nullopt;
}

const char* colorName(Color color) {
    return lookup(color).name;
}

std::vector<std::string> colorNames() {
    std::vector<std::string> names;
    for (const auto& entry : COLOR_TABLE) {
        names.emplace_back(entry.name);
    }
    return names;
}

int ansiForegroundCode(Color color) {
    return lookup(color).ansi_code;
}

ConsoleTerminal::ConsoleTerminal(int fd)
    : fd_(fd),
      interactive_(isatty(fd) == 1) {}

bool ConsoleTerminal::isInteractive() const {
    return interactive_;
}

void ConsoleTerminal::write(const std::string& bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ErrorContext ctx;
            ctx.component = "Terminal";
            ctx.details["fd"] = std::to_string(fd_);
            ctx.details["errno"] = std::to_string(err);
            ctx.details["reason"] = std::strerror(err);
            throw TerminalError(err == EPIPE ? RenderErrorCode::TERMINAL_CLOSED
                                             : RenderErrorCode::TERMINAL_WRITE_FAILED,
                                ctx);
        }
        written += static_cast<size_t>(n);
    }
}

int ConsoleTerminal::cursorColumn() {
    auto column = queryCursorColumn();
    return column ? *column : 0;
}

void ConsoleTerminal::moveToColumn(int column) {
    if (column < 0) {
        column = 0;
    }
    write("\033[" + std::to_string(column + 1) + "G");
}

void ConsoleTerminal::setForeground(Color color) {
    if (color == foreground_) {
        return;
    }
    write("\033[" + std::to_string(ansiForegroundCode(color)) + "m");
    foreground_ = color;
}

std::optional<int> ConsoleTerminal::queryCursorColumn() {
    if (!interactive_ || isatty(STDIN_FILENO) != 1) {
        return std::nullopt;
    }

    struct termios original;
    if (tcgetattr(STDIN_FILENO, &original) != 0) {
        Logger::instance().debug("[Terminal] {} | errno={}",
                                 RenderErrorCodeHelper::getMessage(RenderErrorCode::CURSOR_QUERY_FAILED),
                                 errno);
        return std::nullopt;
    }

    struct termios raw = original;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        Logger::instance().debug("[Terminal] {} | errno={}",
                                 RenderErrorCodeHelper::getMessage(RenderErrorCode::CURSOR_QUERY_FAILED),
                                 errno);
        return std::nullopt;
    }

    std::string reply;
    try {
        write("\033[6n");

        auto deadline = std::chrono::steady_clock::now() + constants::render::CURSOR_QUERY_TIMEOUT;
        while (reply.find('R') == std::string::npos) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }

            struct pollfd pfd;
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0 && errno == EINTR) {
                continue;
            }
            if (rc <= 0) {
                break;
            }

            char buffer[32];
            ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
            if (n <= 0) {
                break;
            }
            reply.append(buffer, static_cast<size_t>(n));
        }
    } catch (const TerminalError& e) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original);
        Logger::instance().debug("[Terminal] Cursor query write failed | error={}", e.what());
        return std::nullopt;
    }

    tcsetattr(STDIN_FILENO, TCSANOW, &original);

    auto esc = reply.rfind("\033[");
    int row = 0;
    int col = 0;
    if (esc == std::string::npos ||
        std::sscanf(reply.c_str() + esc, "\033[%d;%dR", &row, &col) != 2 || col < 1) {
        Logger::instance().debug("[Terminal] {} | reply_bytes={}",
                                 RenderErrorCodeHelper::getMessage(RenderErrorCode::CURSOR_QUERY_TIMEOUT),
                                 reply.size());
        return std::nullopt;
    }

    return col - 1;
}

}}
