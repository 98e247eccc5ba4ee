#pragma once

#include <string>
#include <optional>
#include <vector>
#include <unistd.h>

namespace console_progress {
namespace common {

enum class Color {
    DEFAULT,
    BLACK,
    DARK_BLUE,
    DARK_GREEN,
    DARK_CYAN,
    DARK_RED,
    DARK_MAGENTA,
    DARK_YELLOW,
    GRAY,
    DARK_GRAY,
    BLUE,
    GREEN,
    CYAN,
    RED,
    MAGENTA,
    YELLOW,
    WHITE
};

std::optional<Color> parseColor(const std::string& name);
const char* colorName(Color color);
std::vector<std::string> colorNames();

// SGR parameter for a foreground color, e.g. 97 for WHITE, 39 for DEFAULT.
int ansiForegroundCode(Color color);

// The only path through which rendered text reaches the screen.
class Terminal {
public:
    virtual ~Terminal() = default;

    virtual bool isInteractive() const = 0;

    // Throws TerminalError when the bytes cannot be delivered.
    virtual void write(const std::string& bytes) = 0;

    // Zero-based column of the cursor; 0 when it cannot be determined.
    virtual int cursorColumn() = 0;
    virtual void moveToColumn(int column) = 0;

    virtual Color foreground() const = 0;
    virtual void setForeground(Color color) = 0;
};

class ConsoleTerminal : public Terminal {
public:
    explicit ConsoleTerminal(int fd = STDOUT_FILENO);

    bool isInteractive() const override;
    void write(const std::string& bytes) override;
    int cursorColumn() override;
    void moveToColumn(int column) override;
    Color foreground() const override { return foreground_; }
    void setForeground(Color color) override;

private:
    int fd_;
    bool interactive_;
    Color foreground_ = Color::DEFAULT;

    std::optional<int> queryCursorColumn();
};

}}
