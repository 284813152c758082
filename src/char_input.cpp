#include "parley/char_input.hpp"

#include <iostream>

#ifdef _WIN32
// Windows implementation
#include <conio.h>
#include <io.h>
#include <stdio.h>

namespace parley {

bool StdinIsTerminal() {
    return _isatty(_fileno(stdin)) != 0;
}

RawModeGuard::RawModeGuard() {
    h_in_ = GetStdHandle(STD_INPUT_HANDLE);
    if (h_in_ == INVALID_HANDLE_VALUE || !GetConsoleMode(h_in_, &original_mode_)) return;
    DWORD new_mode = original_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT);
    if (!SetConsoleMode(h_in_, new_mode)) {
        throw ParleyError(ParleyErrc::Io, "Unable to switch console to raw mode");
    }
    active_ = true;
}

RawModeGuard::~RawModeGuard() {
    if (active_) SetConsoleMode(h_in_, original_mode_);
}

std::optional<int> TerminalCharReader::ReadChar() {
    RawModeGuard guard;
    int ch = _getch();
    if (ch == 0 || ch == 224) { // Special key prefix, drop the scan code
        _getch();
        return ReadChar();
    }
    return ch;
}

} // namespace parley

#else
// Unix (Linux/macOS) implementation
#include <unistd.h>

namespace parley {

bool StdinIsTerminal() {
    return isatty(STDIN_FILENO) != 0;
}

RawModeGuard::RawModeGuard() {
    if (tcgetattr(STDIN_FILENO, &original_termios_) == -1) return;
    struct termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == -1) {
        throw ParleyError(ParleyErrc::Io, "Unable to switch terminal to raw mode");
    }
    active_ = true;
}

RawModeGuard::~RawModeGuard() {
    if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &original_termios_);
}

std::optional<int> TerminalCharReader::ReadChar() {
    // Read through std::cin so characters already buffered by a line read
    // are not skipped.
    RawModeGuard guard;
    int c = std::cin.get();
    if (c == std::char_traits<char>::eof()) {
        if (std::cin.bad()) throw ParleyError(ParleyErrc::Io, "Unable to read from terminal");
        return std::nullopt;
    }
    return c;
}

} // namespace parley

#endif

namespace parley {

std::optional<int> StreamCharReader::ReadChar() {
    int c = in_.get();
    if (c == std::char_traits<char>::eof()) return std::nullopt;
    return c;
}

std::unique_ptr<CharReader> MakePlatformCharReader() {
    // Piped or redirected input shares the line reader's buffer.
    if (!StdinIsTerminal()) return std::make_unique<StreamCharReader>(std::cin);
    return std::make_unique<TerminalCharReader>();
}

} // namespace parley
