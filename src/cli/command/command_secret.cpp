#include <sstream>

#include "parley/cli/commands.hpp"

bool handle_secret(std::istringstream& /*iss*/, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    parley::Answer secret = session.Ask("Choose a password:  ", parley::AnswerType::String, [](parley::Question& q) {
        q.SetEcho(std::string("*"));
        q.SetValidate("^.{4,}$");
        q.SetResponse(parley::ResponseKey::NotValid, "Use at least four characters.");
        q.SetAskOnError(parley::AskOnError::Question);
        q.SetConfirm(std::string("Keep the answer to \"<%= question %>\"?  "));
    });
    session.Say("Password stored (" + std::to_string(secret.as<std::string>().size()) + " characters).");
    return true;
}

std::string help_secret() {
    return "secret\n"
           "  Read a masked password and confirm it before accepting.";
}
