#include <sstream>
#include <vector>

#include "parley/cli/commands.hpp"
#include "parley/template_engine.hpp"

bool handle_gather(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    size_t count = 0;
    iss >> count;

    parley::Answer names = session.Ask(
        count ? "Enter " + std::to_string(count) + " names, one per line:"
              : std::string("Enter names, one per line (blank line to finish):"),
        parley::AnswerType::String, [count](parley::Question& q) {
            if (count) q.SetGather(count);
            else q.SetGather(std::string(""));
        });

    std::vector<std::string> items;
    for (const auto& n : names) items.push_back(n.as<std::string>());
    if (items.empty()) {
        session.Say("No names given.");
    } else {
        session.Say("You named " + parley::EscapeTags(session.List(items, parley::ListMode::Inline, std::string(" and "))) + ".");
    }
    return true;
}

std::string help_gather() {
    return "gather [count]\n"
           "  Collect several answers to one question: a fixed number, or until a blank line.";
}
