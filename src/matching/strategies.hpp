#pragma once

/*
    Matching strategies.

    Each strategy is a plain function from a MatchContext to every candidate
    span it can find, in document order. They are looked up by tag through
    `strategy_function`, so the chain can be reordered from configuration and
    every strategy can be exercised on its own.

    Spans are byte ranges of the document. Line based strategies cover whole
    lines; the newline of the last line is part of the span only when the
    search text itself ends with one.
*/

#include "edit/types.hpp"
#include "util/lines.hpp"

#include <string>
#include <vector>

namespace patchy {

// Lines longer than this are compared for equality only when fuzzy matching.
constexpr std::size_t kFuzzyMaxLineLength = 512;

struct MatchContext {
    MatchContext(const std::string& content, const std::string& search_text, double fuzzy_threshold);

    const std::string& content;
    const std::string& search_text;

    std::vector<Line> content_lines;
    std::vector<std::string> search_lines;
    bool search_ends_with_newline = false;

    double fuzzy_threshold = 0.8;
};

using StrategyFunction = std::vector<MatchCandidate> (*)(const MatchContext& context);

StrategyFunction
strategy_function(MatchStrategy strategy);

std::vector<MatchCandidate>
match_exact(const MatchContext& context);

std::vector<MatchCandidate>
match_line_trimmed(const MatchContext& context);

std::vector<MatchCandidate>
match_whitespace_normalized(const MatchContext& context);

std::vector<MatchCandidate>
match_indentation_agnostic(const MatchContext& context);

std::vector<MatchCandidate>
match_fuzzy(const MatchContext& context);

// 1 - (insertions + deletions) / (|a| + |b|), from the Myers edit distance.
double
line_similarity(const std::string& a, const std::string& b);

}  // namespace patchy
