#include <sstream>

#include "parley/cli/commands.hpp"

bool handle_page(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    int count = 0;
    if (!(iss >> count) || count <= 0) count = 40;

    std::string text;
    for (int i = 1; i <= count; ++i) text += "Line " + std::to_string(i) + " of " + std::to_string(count) + "\n";

    // Without a configured page size, page by 10 lines for this command only.
    auto previous = session.page_at();
    if (!previous) session.set_page_at(10);
    try {
        session.Say(text);
    } catch (...) {
        session.set_page_at(previous);
        throw;
    }
    session.set_page_at(previous);
    return true;
}

std::string help_page() {
    return "page [count]\n"
           "  Print numbered lines, pausing after every page.";
}
