#pragma once

/*
    Locate the span of the document a search text refers to.

    The strategies are tried in the configured order; the first one that finds
    anything decides. Among its candidates the highest confidence wins, and on
    a tie the earliest position, with a warning about the ambiguity.
*/

#include "edit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchy {

struct MatchResult {
    std::optional<MatchCandidate> match;

    // Candidates that shared the winning score.
    int64_t tied_candidates = 0;

    std::vector<MatchStrategy> attempted;
    std::vector<std::string> warnings;
};

MatchResult
find_match(const std::string& content,
           const std::string& search_text,
           const std::vector<MatchStrategy>& strategies,
           double fuzzy_threshold);

}  // namespace patchy
