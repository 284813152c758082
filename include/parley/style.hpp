// ANSI text styles and the color() decorator
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "parley/parley_types.hpp"

namespace parley {

enum class Style {
    Clear, Reset, Bold, Dark, Underline, Underscore, Blink, Reverse, Concealed,
    Black, Red, Green, Yellow, Blue, Magenta, Cyan, White,
    OnBlack, OnRed, OnGreen, OnYellow, OnBlue, OnMagenta, OnCyan, OnWhite,
};

// Escape sequence for a style, e.g. "\x1B[31m" for Style::Red.
PARLEY_API const char* StyleCode(Style style);

// Resolve a symbolic name ("red", "ON_BLUE", "underline") to a style.
// Matching ignores case; returns std::nullopt for unknown names.
PARLEY_API std::optional<Style> StyleFromName(const std::string& name);

// Wrap text in the given styles followed by a single reset sequence.
PARLEY_API std::string Color(const std::string& text, const std::vector<Style>& styles);

// Same, but each entry is either a raw escape sequence (starting with ESC)
// or a style name. Unknown names throw ParleyError(Lookup).
PARLEY_API std::string Color(const std::string& text, const std::vector<std::string>& styles);

// Remove every CSI escape sequence from text.
PARLEY_API std::string StripStyles(const std::string& text);

} // namespace parley
