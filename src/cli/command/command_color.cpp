#include <sstream>
#include <vector>

#include "parley/cli/commands.hpp"
#include "parley/template_engine.hpp"

bool handle_color(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    std::vector<std::string> styles;
    std::string token;
    while (iss >> token && token != "--") styles.push_back(token);

    std::string text;
    std::getline(iss, text);
    auto start = text.find_first_not_of(" \t");
    text = start == std::string::npos ? std::string() : text.substr(start);
    if (styles.empty() || text.empty()) {
        session.Say("Usage: color <style...> -- <text>");
        return true;
    }
    session.Say(parley::EscapeTags(session.Color(text, styles)));
    return true;
}

std::string help_color() {
    return "color <style...> -- <text>\n"
           "  Print text in the given styles, e.g. 'color bold red -- warning'.";
}
