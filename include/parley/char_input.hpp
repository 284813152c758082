// Single-character input without echo, one implementation per platform
#pragma once

#include <iosfwd>
#include <memory>
#include <optional>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

#include "parley/parley_types.hpp"

namespace parley {

// Byte values that end a masked line read.
constexpr int kCarriageReturn = 13;
constexpr int kLineFeed = 10;
constexpr int kBackspace = 8;
constexpr int kDelete = 127;

class PARLEY_API CharReader {
public:
    virtual ~CharReader() = default;
    // Read one character without terminal echo. std::nullopt at end of input.
    virtual std::optional<int> ReadChar() = 0;
};

// Reads from an arbitrary stream. Used for piped input and scripted tests.
class PARLEY_API StreamCharReader : public CharReader {
public:
    explicit StreamCharReader(std::istream& in) : in_(in) {}
    std::optional<int> ReadChar() override;

private:
    std::istream& in_;
};

// Puts the console into no-echo, non-canonical mode for its lifetime and
// restores the saved mode on destruction. Does nothing when the handle is
// not a terminal.
class PARLEY_API RawModeGuard {
public:
    RawModeGuard();
    ~RawModeGuard();
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return active_; }

private:
    bool active_ = false;
#ifdef _WIN32
    HANDLE h_in_ = INVALID_HANDLE_VALUE;
    DWORD original_mode_ = 0;
#else
    struct termios original_termios_;
#endif
};

// Reads from the process console. Raw mode is held for exactly one read.
class PARLEY_API TerminalCharReader : public CharReader {
public:
    std::optional<int> ReadChar() override;
};

// Whether standard input is attached to a terminal or console.
PARLEY_API bool StdinIsTerminal();

// The reader for the host platform: a TerminalCharReader on a terminal,
// otherwise a StreamCharReader over std::cin.
PARLEY_API std::unique_ptr<CharReader> MakePlatformCharReader();

} // namespace parley
