#include <sstream>

#include "parley/cli/commands.hpp"
#include "parley/template_engine.hpp"

bool handle_pick(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& config) {
    std::string mode_name;
    iss >> mode_name;
    if (mode_name.empty()) mode_name = config.default_list_mode;
    auto mode = parley::ListModeFromName(mode_name);
    if (!mode) {
        session.Say("Unknown list mode: " + parley::EscapeTags(mode_name) + ".");
        return true;
    }

    parley::Answer fruit = session.Choose(
        {"apple", "banana", "cherry", "kiwi", "mango", "papaya"}, [&](parley::Menu& menu) {
            menu.SetHeader("Pick a fruit");
            menu.SetIndex(parley::MenuIndex::Letter);
            menu.SetFlow(*mode);
            if (*mode == parley::ListMode::Inline) menu.SetLayout(parley::MenuLayout::OneLine);
            menu.SetPrompt("Your choice?  ");
        });
    parley::TemplateContext context;
    context.use_color = session.use_color();
    context.Set("fruit", fruit);
    session.Say("You picked <%= color(fruit, bold, green) %>.", context);
    return true;
}

std::string help_pick() {
    return "pick [rows|inline|columns_across|columns_down]\n"
           "  Show a lettered fruit menu in the given layout and report the choice.\n"
           "  Items can be chosen by letter, by name or by an unambiguous prefix.";
}
