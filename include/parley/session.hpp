// Session: a line-oriented conversation over one input and one output stream
#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "parley/char_input.hpp"
#include "parley/menu.hpp"
#include "parley/parley_types.hpp"
#include "parley/question.hpp"
#include "parley/style.hpp"
#include "parley/text_layout.hpp"

namespace parley {

struct ParleyConfig;
class TemplateContext;

class PARLEY_API Session {
public:
    // Standard input/output with the platform character reader.
    Session();
    // Character reads come from `in` through a StreamCharReader.
    Session(std::istream& in, std::ostream& out,
            std::optional<size_t> wrap_at = std::nullopt,
            std::optional<size_t> page_at = std::nullopt);
    Session(std::istream& in, std::ostream& out, std::shared_ptr<CharReader> reader,
            std::optional<size_t> wrap_at = std::nullopt,
            std::optional<size_t> page_at = std::nullopt);

    // Ask a question and return a validated, converted answer. Retries on
    // every recoverable condition; fatal errors propagate.
    Answer Ask(const std::string& question, AnswerType type = AnswerType::String,
               const std::function<void(Question&)>& details = nullptr);
    Answer Ask(const std::string& question, std::vector<std::string> choices,
               const std::function<void(Question&)>& details = nullptr);
    Answer Ask(const std::string& question, Converter converter,
               const std::function<void(Question&)>& details = nullptr);
    Answer Ask(const Question& question);

    // yes/no question, true for "y" or "yes".
    bool Agree(const std::string& question, CharacterMode character = CharacterMode::Line);

    // Build a menu from items, let details refine it, then select.
    Answer Choose(const std::vector<std::string>& items,
                  const std::function<void(Menu&)>& details = nullptr);
    Answer Choose(Menu& menu);

    // Write text after template expansion, wrapping and paging. Text ending
    // in a space or tab stays on the line and is flushed.
    void Say(const std::string& statement);
    void Say(const std::string& statement, const TemplateContext& context);

    std::string Color(const std::string& text, const std::vector<Style>& styles) const;
    std::string Color(const std::string& text, const std::vector<std::string>& styles) const;
    std::string List(const std::vector<std::string>& items, ListMode mode = ListMode::Rows,
                     const std::optional<std::string>& option = std::nullopt) const;

    void Configure(const ParleyConfig& config);

    std::optional<size_t> wrap_at() const { return wrap_at_; }
    void set_wrap_at(std::optional<size_t> limit) { wrap_at_ = limit; }
    std::optional<size_t> page_at() const { return page_at_; }
    void set_page_at(std::optional<size_t> limit) { page_at_ = limit; }
    bool use_color() const { return use_color_; }
    void set_use_color(bool on) { use_color_ = on; }

    // Answer produced by the most recent successful Ask or Choose.
    const Answer& last_answer() const { return last_answer_; }

private:
    friend class AnswerPipeline;

    // A session over the same streams and layout settings, for prompts
    // asked while another prompt is pending.
    Session Nested() const;

    TemplateContext BaseContext() const;
    std::string ReadLine();
    std::string ReadResponse(const Question& question);
    std::string PagePrint(const std::string& text);
    Answer Gather(const Question& question);

    std::istream* in_;
    std::ostream* out_;
    std::shared_ptr<CharReader> reader_;
    std::optional<size_t> wrap_at_;
    std::optional<size_t> page_at_;
    bool use_color_ = true;
    Answer last_answer_;
};

} // namespace parley
