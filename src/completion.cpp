#include "parley/completion.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace parley {

namespace {

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string EscapeRegexChar(char c) {
    static const std::string special = "\\^$.|?*+()[]{}-/";
    if (special.find(c) != std::string::npos) return std::string("\\") + c;
    return std::string(1, c);
}

// "h-f" -> "^h\w*\-f\w*"
std::regex AbbreviationPattern(const std::string& key) {
    std::string pattern = "^";
    size_t i = 0;
    while (i < key.size()) {
        if (IsWordChar(key[i])) {
            while (i < key.size() && IsWordChar(key[i])) pattern += key[i++];
            pattern += "\\w*";
        } else {
            pattern += EscapeRegexChar(key[i++]);
        }
    }
    return std::regex(pattern);
}

} // namespace

CompletionResult Complete(const std::vector<std::string>& candidates, const std::string& key) {
    CompletionResult result;
    if (key.empty()) return result;

    const std::regex pattern = AbbreviationPattern(key);
    for (const auto& candidate : candidates) {
        if (!std::regex_search(candidate, pattern)) continue;
        if (std::find(result.candidates.begin(), result.candidates.end(), candidate) ==
            result.candidates.end()) {
            result.candidates.push_back(candidate);
        }
    }
    if (result.candidates.empty()) return result;

    if (std::find(result.candidates.begin(), result.candidates.end(), key) != result.candidates.end()) {
        result.status = CompletionResult::Status::Match;
        result.value = key;
        return result;
    }

    std::vector<std::string> by_length = result.candidates;
    std::stable_sort(by_length.begin(), by_length.end(),
                     [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
    const std::string& shortest = by_length.front();
    for (size_t i = 1; i < by_length.size(); ++i) {
        if (by_length[i].rfind(shortest, 0) != 0) {
            result.status = CompletionResult::Status::Ambiguous;
            return result;
        }
    }
    result.status = CompletionResult::Status::Match;
    result.value = shortest;
    return result;
}

} // namespace parley
