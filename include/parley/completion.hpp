#pragma once

#include <string>
#include <vector>

#include "parley/parley_types.hpp"

namespace parley {

struct CompletionResult {
    enum class Status { Match, NoMatch, Ambiguous };
    Status status = Status::NoMatch;
    std::string value;                    // resolved candidate when status == Match
    std::vector<std::string> candidates;  // every candidate the key abbreviated
};

// Resolve key against candidates by abbreviation. Each word of the key may
// abbreviate the matching word of a candidate ("h-f" completes "help-faq").
// An exact match wins; otherwise the shortest match wins when it prefixes
// every other match; any other multi-match is ambiguous. Identical
// candidates count once.
PARLEY_API CompletionResult Complete(const std::vector<std::string>& candidates,
                                     const std::string& key);

} // namespace parley
