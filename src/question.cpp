#include "parley/question.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "parley/completion.hpp"
#include "parley/template_engine.hpp"

namespace parley {

namespace {

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string Strip(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (IsSpace(s[b]) || s[b] == '\0')) ++b;
    while (e > b && (IsSpace(s[e - 1]) || s[e - 1] == '\0')) --e;
    return s.substr(b, e - b);
}

std::string Chomp(const std::string& s) {
    if (s.size() >= 2 && s.compare(s.size() - 2, 2, "\r\n") == 0) return s.substr(0, s.size() - 2);
    if (!s.empty() && (s.back() == '\n' || s.back() == '\r')) return s.substr(0, s.size() - 1);
    return s;
}

std::string Collapse(const std::string& s) {
    std::string out;
    bool in_space = false;
    for (char c : s) {
        if (IsSpace(c)) {
            if (!in_space) out += ' ';
            in_space = true;
        } else {
            out += c;
            in_space = false;
        }
    }
    return out;
}

std::string FormatNumber(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

// Drop '_' separators; reject leading, trailing or doubled ones and any
// separator not between two digits.
std::optional<std::string> RemoveSeparators(const std::string& digits) {
    std::string out;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] != '_') {
            out += digits[i];
            continue;
        }
        if (i == 0 || i + 1 == digits.size()) return std::nullopt;
        if (!std::isxdigit(static_cast<unsigned char>(digits[i - 1])) ||
            !std::isxdigit(static_cast<unsigned char>(digits[i + 1]))) {
            return std::nullopt;
        }
    }
    return out;
}

} // namespace

std::string InspectList(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += "\"" + values[i] + "\"";
    }
    return out + "]";
}

std::optional<long long> ParseInteger(const std::string& text) {
    std::string s = Strip(text);
    if (s.empty()) return std::nullopt;

    bool negative = false;
    size_t pos = 0;
    if (s[pos] == '+' || s[pos] == '-') {
        negative = s[pos] == '-';
        ++pos;
    }
    int base = 10;
    if (pos + 1 < s.size() && s[pos] == '0') {
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[pos + 1])));
        if (p == 'x') { base = 16; pos += 2; }
        else if (p == 'b') { base = 2; pos += 2; }
        else if (p == 'o') { base = 8; pos += 2; }
        else if (p == 'd') { base = 10; pos += 2; }
        else if (std::isdigit(static_cast<unsigned char>(p)) || p == '_') { base = 8; pos += 1; }
    }
    auto digits = RemoveSeparators(s.substr(pos));
    if (!digits || digits->empty()) return std::nullopt;
    for (char c : *digits) {
        int d = std::isdigit(static_cast<unsigned char>(c)) ? c - '0'
              : std::isalpha(static_cast<unsigned char>(c)) ? std::tolower(static_cast<unsigned char>(c)) - 'a' + 10
              : 99;
        if (d >= base) return std::nullopt;
    }
    try {
        size_t used = 0;
        long long value = std::stoll((negative ? "-" : "") + *digits, &used, base);
        if (used != digits->size() + (negative ? 1 : 0)) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> ParseFloat(const std::string& text) {
    static const std::regex kFloat(R"(^[+-]?(\d+(_\d+)*)?(\.\d+(_\d+)*)?([eE][+-]?\d+(_\d+)*)?$)");
    std::string s = Strip(text);
    if (s.empty() || !std::regex_match(s, kFloat)) return std::nullopt;
    if (std::none_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    // The mantissa needs a digit; "e5" alone is not a number.
    const char first = s[(s[0] == '+' || s[0] == '-') ? 1 : 0];
    if (!std::isdigit(static_cast<unsigned char>(first)) && first != '.') return std::nullopt;
    if (first == '.' && s.size() > 1 && !std::isdigit(static_cast<unsigned char>(s[s.find('.') + 1]))) {
        return std::nullopt;
    }
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());
    try {
        size_t used = 0;
        double value = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Question::Question(std::string text, AnswerType type) : text_(std::move(text)), type_(type) {}

Question::Question(std::string text, std::vector<std::string> choices)
    : text_(std::move(text)), type_(AnswerType::Choice), choices_(std::move(choices)) {}

Question::Question(std::string text, Converter converter)
    : text_(std::move(text)), type_(AnswerType::Custom), converter_(std::move(converter)) {}

void Question::SetChoices(std::vector<std::string> choices) {
    choices_ = std::move(choices);
    type_ = AnswerType::Choice;
}

void Question::SetConverter(Converter converter) {
    converter_ = std::move(converter);
    type_ = AnswerType::Custom;
}

void Question::SetValidate(const std::string& pattern, bool ignore_case) {
    if (whitelist_) {
        throw ParleyError(ParleyErrc::InvalidConfiguration,
                          "A question takes either a regex or a whitelist validator, not both");
    }
    auto flags = std::regex::ECMAScript;
    if (ignore_case) flags |= std::regex::icase;
    try {
        validate_ = std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw ParleyError(ParleyErrc::InvalidConfiguration,
                          "Invalid validation pattern '" + pattern + "': " + e.what());
    }
    validate_source_ = "/" + pattern + "/" + (ignore_case ? "i" : "");
}

void Question::SetWhitelist(std::vector<std::string> values) {
    if (validate_) {
        throw ParleyError(ParleyErrc::InvalidConfiguration,
                          "A question takes either a regex or a whitelist validator, not both");
    }
    whitelist_ = std::move(values);
}

std::string Question::RemoveWhitespace(const std::string& raw) const {
    switch (whitespace_) {
        case WhitespaceMode::None: return raw;
        case WhitespaceMode::Strip: return Strip(raw);
        case WhitespaceMode::Chomp: return Chomp(raw);
        case WhitespaceMode::Collapse: return Collapse(raw);
        case WhitespaceMode::StripAndCollapse: return Collapse(Strip(raw));
        case WhitespaceMode::ChompAndCollapse: return Collapse(Chomp(raw));
        case WhitespaceMode::Remove: {
            std::string out;
            for (char c : raw) if (!IsSpace(c)) out += c;
            return out;
        }
    }
    return raw;
}

std::string Question::ChangeCase(const std::string& raw) const {
    std::string out = raw;
    switch (case_) {
        case CaseMode::None:
            break;
        case CaseMode::Up:
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            break;
        case CaseMode::Down:
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            break;
        case CaseMode::Capitalize:
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
            break;
    }
    return out;
}

std::string Question::AnswerOrDefault(const std::string& answer) const {
    if (answer.empty() && default_) return *default_;
    return answer;
}

bool Question::ValidAnswer(const std::string& answer) const {
    if (validate_) return std::regex_search(answer, *validate_);
    if (whitelist_) {
        return std::find(whitelist_->begin(), whitelist_->end(), answer) != whitelist_->end();
    }
    return true;
}

ConvertOutcome Question::Convert(const std::string& answer) const {
    switch (type_) {
        case AnswerType::String:
            return ConvertOutcome::Ok(Answer(answer));
        case AnswerType::Integer: {
            auto v = ParseInteger(answer);
            if (!v) return ConvertOutcome::Fail(Recoverable::InvalidType);
            return ConvertOutcome::Ok(Answer(*v));
        }
        case AnswerType::Float: {
            auto v = ParseFloat(answer);
            if (!v) return ConvertOutcome::Fail(Recoverable::InvalidType);
            return ConvertOutcome::Ok(Answer(*v));
        }
        case AnswerType::Choice: {
            CompletionResult r = Complete(choices_, answer);
            switch (r.status) {
                case CompletionResult::Status::Match: return ConvertOutcome::Ok(Answer(r.value));
                case CompletionResult::Status::NoMatch: return ConvertOutcome::Fail(Recoverable::NoCompletion);
                case CompletionResult::Status::Ambiguous: return ConvertOutcome::Fail(Recoverable::AmbiguousCompletion);
            }
            break;
        }
        case AnswerType::Custom: {
            if (!converter_) {
                throw ParleyError(ParleyErrc::InvalidConfiguration, "Custom answer type without a converter");
            }
            auto v = converter_(answer);
            if (!v) return ConvertOutcome::Fail(Recoverable::InvalidType);
            return ConvertOutcome::Ok(*v);
        }
    }
    throw ParleyError(ParleyErrc::Unknown, "Unhandled answer type");
}

bool Question::InRange(const Answer& answer) const {
    if (!above_ && !below_ && !in_set_ && !in_interval_) return true;
    if (!answer.IsScalar()) return false;
    const std::string text = answer.as<std::string>();

    if (above_ || below_ || in_interval_) {
        auto number = ParseFloat(text);
        if (!number) return false;
        if (above_ && !(*number > *above_)) return false;
        if (below_ && !(*number < *below_)) return false;
        if (in_interval_ && (*number < in_interval_->first || *number > in_interval_->second)) return false;
    }
    if (in_set_ && std::find(in_set_->begin(), in_set_->end(), text) == in_set_->end()) return false;
    return true;
}

std::string Question::ExpectedRange() const {
    std::vector<std::string> parts;
    if (above_) parts.push_back("above " + FormatNumber(*above_));
    if (below_) parts.push_back("below " + FormatNumber(*below_));
    if (in_set_) parts.push_back("included in " + InspectList(*in_set_));
    if (in_interval_) {
        parts.push_back("included in " + FormatNumber(in_interval_->first) + ".." +
                        FormatNumber(in_interval_->second));
    }
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += " and ";
        out += parts[i];
    }
    return out;
}

std::string Question::TypeName() const {
    if (!type_name_.empty()) return type_name_;
    switch (type_) {
        case AnswerType::String: return "String";
        case AnswerType::Integer: return "Integer";
        case AnswerType::Float: return "Float";
        case AnswerType::Choice: return InspectList(choices_);
        case AnswerType::Custom: return "answer";
    }
    return "answer";
}

std::string Question::ValidationText() const {
    if (whitelist_) return "one of " + InspectList(*whitelist_);
    return validate_source_;
}

std::string Question::CompletionCandidates() const {
    return InspectList(choices_);
}

std::string Question::Response(ResponseKey key) const {
    auto it = responses_.find(key);
    if (it != responses_.end()) return it->second;
    switch (key) {
        case ResponseKey::NotValid:
            return "Your answer isn't valid (must match " + ValidationText() + ").";
        case ResponseKey::NotInRange:
            return "Your answer isn't within the expected range (" + ExpectedRange() + ").";
        case ResponseKey::InvalidType:
            return "You must enter a valid " + TypeName() + ".";
        case ResponseKey::NoCompletion:
            return "You must choose one of " + CompletionCandidates() + ".";
        case ResponseKey::AmbiguousCompletion:
            return "Ambiguous choice.  Please choose one of " + CompletionCandidates() + ".";
        case ResponseKey::AskOnError:
            return "?  ";
    }
    return "";
}

std::string Question::Render() const {
    if (!default_) return text_;
    const std::string marker = "|" + *default_ + "|";
    if (text_.empty()) return marker + "  ";

    size_t trailing = text_.find_last_not_of(" \t");
    if (trailing != std::string::npos && trailing + 1 < text_.size()) {
        return text_ + marker + text_.substr(trailing + 1);
    }
    if (trailing == std::string::npos) return text_ + marker + text_;
    if (text_.back() == '\n') {
        return text_.substr(0, text_.size() - 1) + "  " + marker + "\n";
    }
    return text_ + "  " + marker;
}

void Question::FillTemplate(TemplateContext& context) const {
    context.Set("question", text_);
    if (default_) context.Set("default", *default_);
    if (!choices_.empty()) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& c : choices_) seq.push_back(c);
        context.Set("choices", seq);
    }
}

} // namespace parley
