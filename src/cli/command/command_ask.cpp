#include <sstream>

#include "parley/cli/commands.hpp"
#include "parley/template_engine.hpp"

bool handle_ask(std::istringstream& iss, parley::Session& session, const parley::ParleyConfig& /*config*/) {
    std::string kind;
    iss >> kind;
    if (kind.empty()) kind = "string";

    parley::Answer answer;
    if (kind == "integer" || kind == "int") {
        answer = session.Ask("Enter an integer between 1 and 100:  ", parley::AnswerType::Integer,
                             [](parley::Question& q) { q.SetIn(1, 100); });
    } else if (kind == "float") {
        answer = session.Ask("Enter a positive number:  ", parley::AnswerType::Float,
                             [](parley::Question& q) { q.SetAbove(0); });
    } else if (kind == "string") {
        answer = session.Ask("What is your name?  ", parley::AnswerType::String, [](parley::Question& q) {
            q.SetValidate("^[A-Za-z][A-Za-z .'-]*$");
            q.SetResponse(parley::ResponseKey::NotValid, "Names start with a letter.");
            q.SetCase(parley::CaseMode::Capitalize);
            q.SetDefault("Anonymous");
        });
    } else {
        session.Say("Unknown answer type: " + parley::EscapeTags(kind) + ". Use string, integer or float.");
        return true;
    }
    session.Say("You answered " + session.Color(parley::EscapeTags(answer.as<std::string>()), {parley::Style::Bold}) + ".");
    return true;
}

std::string help_ask() {
    return "ask [string|integer|float]\n"
           "  Ask for a value of the given type and echo the converted answer.\n"
           "  Integers must lie in 1..100, floats must be above 0.";
}
