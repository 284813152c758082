#include <sstream>
#include <vector>

#include "parley/cli/commands.hpp"
#include "parley/template_engine.hpp"

bool handle_list(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    std::string mode_name;
    iss >> mode_name;
    auto mode = parley::ListModeFromName(mode_name);
    if (!mode) {
        session.Say("Usage: list <rows|inline|columns_across|columns_down> <items...>");
        return true;
    }
    std::vector<std::string> items;
    std::string item;
    while (iss >> item) items.push_back(item);
    session.Say(parley::EscapeTags(session.List(items, *mode)));
    return true;
}

std::string help_list() {
    return "list <mode> <items...>\n"
           "  Lay out the items in rows, inline, columns_across or columns_down.";
}
