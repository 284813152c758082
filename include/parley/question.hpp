// A single pending prompt: text, answer type, validation and messages
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "parley/parley_types.hpp"

namespace parley {

class TemplateContext;

enum class AnswerType { String, Integer, Float, Choice, Custom };

enum class CaseMode { None, Up, Down, Capitalize };

enum class WhitespaceMode {
    None, Strip, Chomp, Collapse, StripAndCollapse, ChompAndCollapse, Remove,
};

// Line: read a full line. Char: one raw character from the platform
// reader. Getc: one byte straight from the input stream.
enum class CharacterMode { Line, Char, Getc };

enum class EchoMode { On, Off, Mask };

enum class ConfirmMode { None, Simple, Template };

enum class AskOnError { Question, Message, Nothing };

enum class ResponseKey {
    NotValid, NotInRange, InvalidType, NoCompletion, AmbiguousCompletion, AskOnError,
};

// Result of the convert step: either a value or the recoverable condition
// that prevented one.
struct ConvertOutcome {
    Answer value;
    std::optional<Recoverable> error;

    static ConvertOutcome Ok(Answer v) { return {std::move(v), std::nullopt}; }
    static ConvertOutcome Fail(Recoverable e) { return {Answer(), e}; }
    bool ok() const { return !error.has_value(); }
};

// Converts a raw answer. Return std::nullopt to reject the input as the
// wrong type; throw to abort the question.
using Converter = std::function<std::optional<Answer>(const std::string&)>;

class PARLEY_API Question {
public:
    Question(std::string text, AnswerType type = AnswerType::String);
    Question(std::string text, std::vector<std::string> choices);
    Question(std::string text, Converter converter);
    virtual ~Question() = default;

    // --- configuration -------------------------------------------------
    void SetText(std::string text) { text_ = std::move(text); }
    void SetAnswerType(AnswerType type) { type_ = type; }
    void SetChoices(std::vector<std::string> choices);
    void SetConverter(Converter converter);
    void SetTypeName(std::string name) { type_name_ = std::move(name); }

    void SetDefault(std::string value) { default_ = std::move(value); }
    // Regex validation (searched, not anchored). Throws
    // ParleyError(InvalidConfiguration) when a whitelist is already set.
    void SetValidate(const std::string& pattern, bool ignore_case = false);
    // Exact-membership validation. Throws when a regex is already set.
    void SetWhitelist(std::vector<std::string> values);

    void SetAbove(double v) { above_ = v; }
    void SetBelow(double v) { below_ = v; }
    void SetIn(std::vector<std::string> values) { in_set_ = std::move(values); in_interval_.reset(); }
    void SetIn(double low, double high) { in_interval_ = std::make_pair(low, high); in_set_.reset(); }

    void SetCase(CaseMode mode) { case_ = mode; }
    void SetWhitespace(WhitespaceMode mode) { whitespace_ = mode; }
    void SetCharacter(CharacterMode mode) { character_ = mode; }
    void SetEcho(bool on) { echo_ = on ? EchoMode::On : EchoMode::Off; echo_mask_.clear(); }
    void SetEcho(std::string mask) { echo_ = EchoMode::Mask; echo_mask_ = std::move(mask); }

    void SetConfirm(bool on) { confirm_ = on ? ConfirmMode::Simple : ConfirmMode::None; }
    void SetConfirm(std::string template_text) { confirm_ = ConfirmMode::Template; confirm_text_ = std::move(template_text); }

    void SetResponse(ResponseKey key, std::string message) { responses_[key] = std::move(message); }
    void SetAskOnError(AskOnError mode) { ask_on_error_ = mode; }

    // Collect `count` answers to this question.
    void SetGather(size_t count) { gather_count_ = count; gather_terminator_.reset(); }
    // Collect answers until one equals `terminator` (which is dropped).
    void SetGather(std::string terminator) { gather_terminator_ = std::move(terminator); gather_count_ = 0; }

    // --- accessors -----------------------------------------------------
    const std::string& text() const { return text_; }
    AnswerType answer_type() const { return type_; }
    const std::vector<std::string>& choices() const { return choices_; }
    const std::optional<std::string>& default_value() const { return default_; }
    CharacterMode character() const { return character_; }
    EchoMode echo() const { return echo_; }
    const std::string& echo_mask() const { return echo_mask_; }
    ConfirmMode confirm() const { return confirm_; }
    const std::string& confirm_text() const { return confirm_text_; }
    AskOnError ask_on_error() const { return ask_on_error_; }
    size_t gather_count() const { return gather_count_; }
    const std::optional<std::string>& gather_terminator() const { return gather_terminator_; }
    bool gathers() const { return gather_count_ > 0 || gather_terminator_.has_value(); }

    // --- pipeline steps ------------------------------------------------
    std::string RemoveWhitespace(const std::string& raw) const;
    std::string ChangeCase(const std::string& raw) const;
    // Raw input after whitespace and case processing.
    std::string Normalize(const std::string& raw) const { return ChangeCase(RemoveWhitespace(raw)); }
    std::string AnswerOrDefault(const std::string& answer) const;
    bool ValidAnswer(const std::string& answer) const;
    virtual ConvertOutcome Convert(const std::string& answer) const;
    bool InRange(const Answer& answer) const;
    std::string ExpectedRange() const;

    // Message for a condition: the configured one, else the default.
    virtual std::string Response(ResponseKey key) const;

    // Prompt text shown to the user, including the |default| marker.
    virtual std::string Render() const;
    // Values exposed to templates while this question is pending.
    virtual void FillTemplate(TemplateContext& context) const;

protected:
    virtual std::string TypeName() const;
    virtual std::string CompletionCandidates() const;
    std::string ValidationText() const;

    std::string text_;
    AnswerType type_ = AnswerType::String;
    std::vector<std::string> choices_;
    Converter converter_;
    std::string type_name_;

    std::optional<std::string> default_;
    std::optional<std::regex> validate_;
    std::string validate_source_;
    std::optional<std::vector<std::string>> whitelist_;

    std::optional<double> above_;
    std::optional<double> below_;
    std::optional<std::vector<std::string>> in_set_;
    std::optional<std::pair<double, double>> in_interval_;

    CaseMode case_ = CaseMode::None;
    WhitespaceMode whitespace_ = WhitespaceMode::Strip;
    CharacterMode character_ = CharacterMode::Line;
    EchoMode echo_ = EchoMode::On;
    std::string echo_mask_;

    ConfirmMode confirm_ = ConfirmMode::None;
    std::string confirm_text_;

    std::map<ResponseKey, std::string> responses_;
    AskOnError ask_on_error_ = AskOnError::Message;

    size_t gather_count_ = 0;
    std::optional<std::string> gather_terminator_;
};

// Render values the way error messages show them: ["a", "b"].
PARLEY_API std::string InspectList(const std::vector<std::string>& values);

// Strict integer parsing: optional sign, 0x/0b/0o/0 radix prefixes and
// '_' between digits. Surrounding whitespace is allowed.
PARLEY_API std::optional<long long> ParseInteger(const std::string& text);
// Strict decimal float parsing with optional exponent and '_' separators.
PARLEY_API std::optional<double> ParseFloat(const std::string& text);

} // namespace parley
