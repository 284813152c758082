#include <sstream>

#include "parley/cli/commands.hpp"

bool handle_exit(std::istringstream& /*iss*/, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    return !session.Agree("Really leave the shell?  ");
}

std::string help_exit() {
    return "exit\n"
           "  Leave the shell after confirmation.";
}
