#include "parley/session.hpp"

#include <cctype>
#include <iostream>

#include "parley/answer_pipeline.hpp"
#include "parley/parley_config.hpp"
#include "parley/template_engine.hpp"

namespace parley {

namespace {

constexpr const char* kPagePrompt = "-- press enter/return to continue -- ";

[[noreturn]] void ThrowEndOfInput() {
    throw ParleyError(ParleyErrc::EndOfInput, "Unable to read an answer: input stream closed");
}

} // namespace

Session::Session()
    : in_(&std::cin), out_(&std::cout), reader_(MakePlatformCharReader()) {}

Session::Session(std::istream& in, std::ostream& out,
                 std::optional<size_t> wrap_at, std::optional<size_t> page_at)
    : in_(&in), out_(&out), reader_(std::make_shared<StreamCharReader>(in)),
      wrap_at_(wrap_at), page_at_(page_at) {}

Session::Session(std::istream& in, std::ostream& out, std::shared_ptr<CharReader> reader,
                 std::optional<size_t> wrap_at, std::optional<size_t> page_at)
    : in_(&in), out_(&out), reader_(std::move(reader)), wrap_at_(wrap_at), page_at_(page_at) {
    if (!reader_) reader_ = std::make_shared<StreamCharReader>(in);
}

Session Session::Nested() const {
    Session nested(*in_, *out_, reader_, wrap_at_, page_at_);
    nested.use_color_ = use_color_;
    return nested;
}

void Session::Configure(const ParleyConfig& config) {
    wrap_at_ = config.wrap_at ? std::optional<size_t>(config.wrap_at) : std::nullopt;
    page_at_ = config.page_at ? std::optional<size_t>(config.page_at) : std::nullopt;
    use_color_ = config.use_color;
}

TemplateContext Session::BaseContext() const {
    TemplateContext context;
    context.wrap_at = wrap_at_;
    context.use_color = use_color_;
    return context;
}

// ---------------------------------------------------------------------------
// Asking

Answer Session::Ask(const std::string& question, AnswerType type,
                    const std::function<void(Question&)>& details) {
    Question q(question, type);
    if (details) details(q);
    return Ask(q);
}

Answer Session::Ask(const std::string& question, std::vector<std::string> choices,
                    const std::function<void(Question&)>& details) {
    Question q(question, std::move(choices));
    if (details) details(q);
    return Ask(q);
}

Answer Session::Ask(const std::string& question, Converter converter,
                    const std::function<void(Question&)>& details) {
    Question q(question, std::move(converter));
    if (details) details(q);
    return Ask(q);
}

Answer Session::Ask(const Question& question) {
    if (question.gathers()) return Gather(question);
    AnswerPipeline pipeline(*this, question);
    last_answer_ = pipeline.Run();
    return last_answer_;
}

Answer Session::Gather(const Question& question) {
    Question single = question;
    single.SetGather(size_t{0});
    Answer answers(YAML::NodeType::Sequence);

    auto ask_once = [&]() {
        AnswerPipeline pipeline(*this, single);
        Answer a = pipeline.Run();
        // Only the first round shows the question text.
        single.SetText("");
        return a;
    };

    if (question.gather_count() > 0) {
        for (size_t i = 0; i < question.gather_count(); ++i) answers.push_back(ask_once());
    } else {
        const std::string& terminator = *question.gather_terminator();
        while (true) {
            Answer a = ask_once();
            if (a.IsScalar() && a.as<std::string>() == terminator) break;
            answers.push_back(a);
        }
    }
    last_answer_ = answers;
    return answers;
}

bool Session::Agree(const std::string& question, CharacterMode character) {
    Question q(question, [](const std::string& yn) -> std::optional<Answer> {
        return Answer(!yn.empty() && std::tolower(static_cast<unsigned char>(yn[0])) == 'y');
    });
    q.SetValidate("^(y(es)?|no?)$", true);
    q.SetResponse(ResponseKey::NotValid, "Please enter \"yes\" or \"no\".");
    q.SetAskOnError(AskOnError::Question);
    q.SetCharacter(character);
    return Ask(q).as<bool>();
}

Answer Session::Choose(const std::vector<std::string>& items, const std::function<void(Menu&)>& details) {
    Menu menu;
    menu.AddChoices(items);
    if (details) details(menu);
    return Choose(menu);
}

Answer Session::Choose(Menu& menu) {
    if (menu.items().empty()) {
        throw ParleyError(ParleyErrc::InvalidConfiguration, "A menu needs at least one item");
    }
    menu.Finalize();

    AnswerPipeline pipeline(*this, menu);
    Answer selected = pipeline.Run();
    if (menu.shell()) {
        last_answer_ = menu.Select(*this, selected[0].as<std::string>(), selected[1].as<std::string>());
    } else {
        last_answer_ = menu.Select(*this, selected.as<std::string>());
    }
    return last_answer_;
}

// ---------------------------------------------------------------------------
// Reading

std::string Session::ReadLine() {
    std::string line;
    if (!std::getline(*in_, line)) ThrowEndOfInput();
    return line;
}

std::string Session::ReadResponse(const Question& question) {
    switch (question.character()) {
        case CharacterMode::Line: {
            if (question.echo() == EchoMode::On) return question.Normalize(ReadLine());

            std::string line;
            while (true) {
                std::optional<int> c = reader_->ReadChar();
                if (!c) {
                    if (line.empty()) ThrowEndOfInput();
                    break;
                }
                if (*c == kCarriageReturn || *c == kLineFeed) break;
                if (*c == kBackspace || *c == kDelete) {
                    if (!line.empty()) {
                        line.pop_back();
                        if (question.echo() == EchoMode::Mask) {
                            const size_t n = question.echo_mask().size();
                            *out_ << std::string(n, '\b') << std::string(n, ' ') << std::string(n, '\b');
                            out_->flush();
                        }
                    }
                    continue;
                }
                line += static_cast<char>(*c);
                if (question.echo() == EchoMode::Mask) {
                    *out_ << question.echo_mask();
                    out_->flush();
                }
            }
            *out_ << '\n';
            return question.Normalize(line);
        }
        case CharacterMode::Getc: {
            int c = in_->get();
            if (c == std::char_traits<char>::eof()) ThrowEndOfInput();
            return question.ChangeCase(std::string(1, static_cast<char>(c)));
        }
        case CharacterMode::Char: {
            std::optional<int> c = reader_->ReadChar();
            if (!c) ThrowEndOfInput();
            const std::string response(1, static_cast<char>(*c));
            switch (question.echo()) {
                case EchoMode::On: *out_ << response; break;
                case EchoMode::Mask: *out_ << question.echo_mask(); break;
                case EchoMode::Off: break;
            }
            *out_ << '\n';
            return question.ChangeCase(response);
        }
    }
    return ReadLine();
}

// ---------------------------------------------------------------------------
// Output

void Session::Say(const std::string& statement) {
    Say(statement, BaseContext());
}

void Session::Say(const std::string& statement, const TemplateContext& context) {
    if (statement.empty()) return;

    std::string text = ExpandTemplate(statement, context);
    if (!use_color_) text = StripStyles(text);
    if (wrap_at_) text = Wrap(text, *wrap_at_);
    if (page_at_) text = PagePrint(text);

    if (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        *out_ << text;
        out_->flush();
    } else {
        *out_ << text;
        if (text.empty() || text.back() != '\n') *out_ << '\n';
    }
}

std::string Session::PagePrint(const std::string& text) {
    if (*page_at_ == 0) {
        throw ParleyError(ParleyErrc::InvalidConfiguration, "Page limit must be positive");
    }
    const std::vector<std::string> lines = SplitLines(text);
    const size_t limit = *page_at_;
    size_t pos = 0;
    while (lines.size() - pos > limit) {
        std::string page;
        for (size_t i = pos; i < pos + limit; ++i) page += lines[i];
        pos += limit;
        *out_ << page;
        if (page.back() != '\n') *out_ << '\n';
        *out_ << '\n';

        Session pause = Nested();
        pause.set_page_at(std::nullopt);
        pause.Ask(kPagePrompt);
        *out_ << '\n';
    }
    std::string rest;
    for (size_t i = pos; i < lines.size(); ++i) rest += lines[i];
    return rest;
}

std::string Session::Color(const std::string& text, const std::vector<Style>& styles) const {
    if (!use_color_) return text;
    return parley::Color(text, styles);
}

std::string Session::Color(const std::string& text, const std::vector<std::string>& styles) const {
    if (!use_color_) return text;
    return parley::Color(text, styles);
}

std::string Session::List(const std::vector<std::string>& items, ListMode mode,
                          const std::optional<std::string>& option) const {
    return parley::List(items, mode, option, wrap_at_);
}

} // namespace parley
