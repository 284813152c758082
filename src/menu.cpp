#include "parley/menu.hpp"

#include <algorithm>
#include <cctype>

#include "parley/completion.hpp"
#include "parley/session.hpp"
#include "parley/template_engine.hpp"

namespace parley {

namespace {

constexpr const char* kHelpHelp =
    "This command will display helpful messages about functionality, like this one.  "
    "To see the help for a specific topic enter:\n\thelp [TOPIC]\n"
    "Try asking for help on any of the following:\n\n"
    "<%= list(topics, columns_across) %>";

constexpr const char* kNoHelp = "There's no help for that topic.";

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string TrimAndLower(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Menu::Menu() : Question("", AnswerType::Choice) {}

void Menu::AddChoice(const std::string& name, MenuAction action, std::optional<std::string> help) {
    if (help) help_[name] = *help;
    items_.push_back({name, std::move(action), std::move(help)});
}

void Menu::AddChoices(const std::vector<std::string>& names, MenuAction action) {
    for (const auto& name : names) AddChoice(name, action);
}

void Menu::AddHiddenChoice(const std::string& name, MenuAction action, std::optional<std::string> help) {
    if (help) help_[name] = *help;
    hidden_items_.push_back({name, std::move(action), std::move(help)});
}

void Menu::Finalize() {
    if (!shell_ || help_.empty()) return;
    auto all = AllItems();
    if (std::any_of(all.begin(), all.end(), [](const MenuItem& i) { return i.name == "help"; })) return;

    std::map<std::string, std::string> topics = help_;
    if (topics.find("help") == topics.end()) topics["help"] = kHelpHelp;

    hidden_items_.push_back({"help",
        [topics](Session& session, const std::string&, const std::string& details) -> Answer {
            const std::string topic = TrimAndLower(details);
            TemplateContext context;
            YAML::Node names(YAML::NodeType::Sequence);
            for (const auto& kv : topics) names.push_back(kv.first);
            context.Set("topics", names);
            if (topic.empty()) {
                session.Say(topics.at("help"), context);
            } else {
                auto it = topics.find(topic);
                context.Set("topic", topic);
                session.Say("= <%= topic %>\n\n" + (it == topics.end() ? kNoHelp : it->second), context);
            }
            return Answer();
        },
        std::nullopt});
}

std::vector<MenuItem> Menu::AllItems() const {
    std::vector<MenuItem> all = items_;
    all.insert(all.end(), hidden_items_.begin(), hidden_items_.end());
    return all;
}

std::string Menu::LetterIndex(size_t position) {
    std::string out;
    size_t n = position + 1;
    while (n > 0) {
        --n;
        out.insert(out.begin(), static_cast<char>('a' + n % 26));
        n /= 26;
    }
    return out;
}

std::vector<std::string> Menu::Options() const {
    std::vector<std::string> by_index;
    for (size_t i = 0; i < items_.size(); ++i) {
        by_index.push_back(index_ == MenuIndex::Letter ? LetterIndex(i) : std::to_string(i + 1));
    }
    std::vector<std::string> by_name;
    for (const auto& item : AllItems()) by_name.push_back(item.name);

    switch (select_by_) {
        case SelectBy::Index: return by_index;
        case SelectBy::Name: return by_name;
        case SelectBy::IndexOrName: break;
    }
    by_index.insert(by_index.end(), by_name.begin(), by_name.end());
    return by_index;
}

std::vector<std::string> Menu::DisplayItems() const {
    std::vector<std::string> out;
    for (size_t i = 0; i < items_.size(); ++i) {
        switch (index_) {
            case MenuIndex::Number: out.push_back(std::to_string(i + 1) + index_suffix_ + items_[i].name); break;
            case MenuIndex::Letter: out.push_back(LetterIndex(i) + index_suffix_ + items_[i].name); break;
            case MenuIndex::None: out.push_back(items_[i].name); break;
            case MenuIndex::Custom: out.push_back(index_marker_ + index_suffix_ + items_[i].name); break;
        }
    }
    return out;
}

ConvertOutcome Menu::Convert(const std::string& answer) const {
    const std::vector<std::string> options = Options();
    if (!shell_) {
        CompletionResult r = Complete(options, answer);
        switch (r.status) {
            case CompletionResult::Status::Match: return ConvertOutcome::Ok(Answer(r.value));
            case CompletionResult::Status::NoMatch: return ConvertOutcome::Fail(Recoverable::NoCompletion);
            case CompletionResult::Status::Ambiguous: return ConvertOutcome::Fail(Recoverable::AmbiguousCompletion);
        }
        return ConvertOutcome::Fail(Recoverable::NoCompletion);
    }

    const size_t word_begin = answer.find_first_not_of(" \t\r\n");
    if (word_begin == std::string::npos) return ConvertOutcome::Fail(Recoverable::NoCompletion);
    size_t word_end = answer.find_first_of(" \t\r\n", word_begin);
    if (word_end == std::string::npos) word_end = answer.size();
    const std::string first_word = answer.substr(word_begin, word_end - word_begin);

    CompletionResult r = Complete(options, first_word);
    if (r.status == CompletionResult::Status::NoMatch) return ConvertOutcome::Fail(Recoverable::NoCompletion);
    if (r.status == CompletionResult::Status::Ambiguous) return ConvertOutcome::Fail(Recoverable::AmbiguousCompletion);

    size_t rest = answer.find_first_not_of(" \t\r\n", word_end);
    Answer result(YAML::NodeType::Sequence);
    result.push_back(r.value);
    result.push_back(rest == std::string::npos ? std::string() : answer.substr(rest));
    return ConvertOutcome::Ok(result);
}

Answer Menu::Select(Session& session, const std::string& selection, const std::string& details) const {
    const std::vector<MenuItem> all = AllItems();
    const MenuItem* chosen = nullptr;

    if (AllDigits(selection)) {
        size_t n = std::stoul(selection);
        if (n >= 1 && n <= items_.size()) chosen = &all[n - 1];
    }
    if (!chosen) {
        auto it = std::find_if(all.begin(), all.end(),
                               [&](const MenuItem& i) { return i.name == selection; });
        if (it != all.end()) chosen = &*it;
    }
    if (!chosen && index_ == MenuIndex::Letter) {
        for (size_t i = 0; i < items_.size(); ++i) {
            if (LetterIndex(i) == selection) { chosen = &all[i]; break; }
        }
    }
    if (!chosen) {
        throw ParleyError(ParleyErrc::Lookup, "No menu item matches '" + selection + "'");
    }

    if (chosen->action) {
        Answer result = chosen->action(session, chosen->name, details);
        return nil_on_handled_ ? Answer() : result;
    }
    if (shell_) {
        Answer result(YAML::NodeType::Sequence);
        result.push_back(chosen->name);
        result.push_back(details);
        return result;
    }
    return Answer(chosen->name);
}

std::string Menu::TypeName() const {
    return InspectList(Options());
}

std::string Menu::CompletionCandidates() const {
    return InspectList(Options());
}

std::string Menu::Render() const {
    const std::string listing = "<%= list(menu, flow, list_option) %>";
    switch (layout_) {
        case MenuLayout::List:
            return (header_ ? "<%= header %>:\n" : "") + listing + "<%= prompt %>";
        case MenuLayout::OneLine: {
            size_t last = prompt_.find_last_not_of(" \t\r\n");
            std::string trailing = last == std::string::npos ? prompt_ : prompt_.substr(last + 1);
            return (header_ ? "<%= header %>:  " : "") + std::string("<%= prompt %>(") + listing + ")" + trailing;
        }
        case MenuLayout::MenuOnly:
            return listing + "<%= prompt %>";
        case MenuLayout::Custom:
            return layout_template_;
    }
    return listing + "<%= prompt %>";
}

void Menu::FillTemplate(TemplateContext& context) const {
    Question::FillTemplate(context);
    context.Set("header", header_ ? YAML::Node(*header_) : YAML::Node());
    context.Set("prompt", prompt_);
    YAML::Node menu(YAML::NodeType::Sequence);
    for (const auto& line : DisplayItems()) menu.push_back(line);
    context.Set("menu", menu);
    context.Set("flow", std::string(ListModeName(flow_)));
    context.Set("list_option", list_option_ ? YAML::Node(*list_option_) : YAML::Node());
    YAML::Node options(YAML::NodeType::Sequence);
    for (const auto& o : Options()) options.push_back(o);
    context.Set("options", options);
}

} // namespace parley
