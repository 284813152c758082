#include <sstream>

#include "parley/cli/commands.hpp"

bool handle_agree(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    std::string mode;
    iss >> mode;
    parley::CharacterMode character = mode == "c" ? parley::CharacterMode::Char : parley::CharacterMode::Line;

    if (session.Agree("Do you like this demo?  ", character)) {
        session.Say(session.Color("Glad to hear it.", {parley::Style::Green}));
    } else {
        session.Say(session.Color("Sorry to hear that.", {parley::Style::Yellow}));
    }
    return true;
}

std::string help_agree() {
    return "agree [c]\n"
           "  Ask a yes/no question. With 'c' a single keypress answers it.";
}
