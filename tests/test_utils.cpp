#include "test_utils.hpp"
#include "console_progress/common/error_codes.hpp"
#include "console_progress/common/text_utils.hpp"
#include <cctype>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace console_progress::common;

FakeTerminal::FakeTerminal(bool interactive, const std::string& prefix)
    : interactive_(interactive) {
    apply(prefix);
}

void FakeTerminal::write(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failures_left_ > 0) {
        --failures_left_;
        throw TerminalError(RenderErrorCode::TERMINAL_WRITE_FAILED,
                            {"FakeTerminal", {{"bytes", std::to_string(bytes.size())}}});
    }
    ++write_count_;
    emit(bytes);
}

int FakeTerminal::cursorColumn() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

void FakeTerminal::moveToColumn(int column) {
    std::lock_guard<std::mutex> lock(mutex_);
    emit("\033[" + std::to_string(column + 1) + "G");
}

Color FakeTerminal::foreground() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return foreground_;
}

void FakeTerminal::setForeground(Color color) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (color == foreground_) {
        return;
    }
    emit("\033[" + std::to_string(ansiForegroundCode(color)) + "m");
    foreground_ = color;
}

void FakeTerminal::failNextWrites(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_left_ = count;
}

void FakeTerminal::setCursor(int column) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_ = column;
}

std::string FakeTerminal::output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

void FakeTerminal::clearOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    output_.clear();
    write_count_ = 0;
}

size_t FakeTerminal::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

std::string FakeTerminal::visibleLine() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    for (const auto& cell : cells_) {
        line += cell;
    }
    return trimTrailingSpaces(line);
}

int FakeTerminal::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

void FakeTerminal::emit(const std::string& bytes) {
    output_ += bytes;
    apply(bytes);
}

void FakeTerminal::apply(const std::string& bytes) {
    auto glyphs = splitGlyphs(bytes);

    for (size_t i = 0; i < glyphs.size(); ++i) {
        const std::string& glyph = glyphs[i];

        if (glyph == "\b") {
            if (cursor_ > 0) {
                --cursor_;
            }
            continue;
        }

        if (glyph == "\033" && i + 1 < glyphs.size() && glyphs[i + 1] == "[") {
            std::string params;
            size_t j = i + 2;
            while (j < glyphs.size() && glyphs[j].size() == 1 &&
                   !std::isalpha(static_cast<unsigned char>(glyphs[j][0]))) {
                params += glyphs[j];
                ++j;
            }
            if (j < glyphs.size() && glyphs[j] == "G") {
                cursor_ = params.empty() ? 0 : std::stoi(params) - 1;
            }
            i = j;
            continue;
        }

        if (cells_.size() <= static_cast<size_t>(cursor_)) {
            cells_.resize(static_cast<size_t>(cursor_) + 1, " ");
        }
        cells_[static_cast<size_t>(cursor_)] = glyph;
        ++cursor_;
    }
}

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

fs::path make_temp_file(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / (std::to_string(getpid()) + "_" + name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

std::string nbsp(size_t count) {
    return repeat("\xC2\xA0", count);
}
