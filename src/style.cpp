#include "parley/style.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace parley {

namespace {

struct StyleEntry {
    Style style;
    const char* name;
    const char* code;
};

constexpr std::array<StyleEntry, 25> kStyles = {{
    {Style::Clear,      "clear",      "\x1B[0m"},
    {Style::Reset,      "reset",      "\x1B[0m"},
    {Style::Bold,       "bold",       "\x1B[1m"},
    {Style::Dark,       "dark",       "\x1B[2m"},
    {Style::Underline,  "underline",  "\x1B[4m"},
    {Style::Underscore, "underscore", "\x1B[4m"},
    {Style::Blink,      "blink",      "\x1B[5m"},
    {Style::Reverse,    "reverse",    "\x1B[7m"},
    {Style::Concealed,  "concealed",  "\x1B[8m"},
    {Style::Black,      "black",      "\x1B[30m"},
    {Style::Red,        "red",        "\x1B[31m"},
    {Style::Green,      "green",      "\x1B[32m"},
    {Style::Yellow,     "yellow",     "\x1B[33m"},
    {Style::Blue,       "blue",       "\x1B[34m"},
    {Style::Magenta,    "magenta",    "\x1B[35m"},
    {Style::Cyan,       "cyan",       "\x1B[36m"},
    {Style::White,      "white",      "\x1B[37m"},
    {Style::OnBlack,    "on_black",   "\x1B[40m"},
    {Style::OnRed,      "on_red",     "\x1B[41m"},
    {Style::OnGreen,    "on_green",   "\x1B[42m"},
    {Style::OnYellow,   "on_yellow",  "\x1B[43m"},
    {Style::OnBlue,     "on_blue",    "\x1B[44m"},
    {Style::OnMagenta,  "on_magenta", "\x1B[45m"},
    {Style::OnCyan,     "on_cyan",    "\x1B[46m"},
    {Style::OnWhite,    "on_white",   "\x1B[47m"},
}};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* StyleCode(Style style) {
    for (const auto& entry : kStyles) {
        if (entry.style == style) return entry.code;
    }
    return "";
}

std::optional<Style> StyleFromName(const std::string& name) {
    const std::string key = ToLower(name);
    for (const auto& entry : kStyles) {
        if (key == entry.name) return entry.style;
    }
    return std::nullopt;
}

std::string Color(const std::string& text, const std::vector<Style>& styles) {
    std::string out;
    for (Style s : styles) out += StyleCode(s);
    out += text;
    out += StyleCode(Style::Clear);
    return out;
}

std::string Color(const std::string& text, const std::vector<std::string>& styles) {
    std::string out;
    for (const auto& s : styles) {
        if (!s.empty() && s[0] == '\x1B') {
            out += s;
            continue;
        }
        auto style = StyleFromName(s);
        if (!style) {
            throw ParleyError(ParleyErrc::Lookup, "Unknown style name: " + s);
        }
        out += StyleCode(*style);
    }
    out += text;
    out += StyleCode(Style::Clear);
    return out;
}

std::string StripStyles(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && !(text[j] >= '@' && text[j] <= '~')) ++j;
            i = j;
            continue;
        }
        out += text[i];
    }
    return out;
}

} // namespace parley
