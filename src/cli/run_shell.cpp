#include <iostream>
#include <sstream>
#include <string>

#include "parley/cli/commands.hpp"
#include "parley/cli/run_shell.hpp"

namespace {

using Handler = bool (*)(std::istringstream&, parley::Session&, const parley::ParleyConfig&);

parley::MenuAction wrap_handler(Handler handler, const parley::ParleyConfig& config) {
    return [handler, &config](parley::Session& session, const std::string&, const std::string& details) {
        std::istringstream iss(details);
        return parley::Answer(handler(iss, session, config));
    };
}

} // namespace

void run_shell(parley::Session& session, const parley::ParleyConfig& config) {
    parley::Menu menu;
    menu.SetShell(true);
    menu.SetSelectBy(parley::SelectBy::Name);
    menu.SetLayout(std::string("<%= prompt %>"));
    menu.SetPrompt(config.shell_prompt);
    menu.SetAskOnError(parley::AskOnError::Question);

    menu.AddChoice("ask", wrap_handler(handle_ask, config), help_ask());
    menu.AddChoice("agree", wrap_handler(handle_agree, config), help_agree());
    menu.AddChoice("pick", wrap_handler(handle_pick, config), help_pick());
    menu.AddChoice("list", wrap_handler(handle_list, config), help_list());
    menu.AddChoice("color", wrap_handler(handle_color, config), help_color());
    menu.AddChoice("page", wrap_handler(handle_page, config), help_page());
    menu.AddChoice("secret", wrap_handler(handle_secret, config), help_secret());
    menu.AddChoice("gather", wrap_handler(handle_gather, config), help_gather());
    menu.AddChoice("exit", wrap_handler(handle_exit, config), help_exit());
    menu.AddHiddenChoice("quit", wrap_handler(handle_exit, config));

    session.Say("Parley demo shell. Type 'help' for commands.");
    while (true) {
        parley::Answer keep_going;
        try {
            keep_going = session.Choose(menu);
        } catch (const parley::ParleyError& e) {
            if (e.code() == parley::ParleyErrc::EndOfInput) {
                std::cout << "\n";
                return;
            }
            std::cerr << "Error: " << e.what() << std::endl;
            continue;
        }
        // The help item answers null; every command answers whether to continue.
        if (keep_going.IsDefined() && !keep_going.IsNull() && !keep_going.as<bool>()) return;
    }
}
