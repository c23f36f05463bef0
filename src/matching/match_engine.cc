#include "match_engine.hpp"

#include "matching/strategies.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

using namespace patchy;

namespace {

constexpr double kScoreEpsilon = 1e-9;

}  // namespace

MatchResult
patchy::find_match(const std::string& content,
                   const std::string& search_text,
                   const std::vector<MatchStrategy>& strategies,
                   double fuzzy_threshold) {
    MatchResult result;

    // Nothing to look for. Only meaningful when there is nothing to look in
    // either: the replacement becomes the whole document.
    if (search_text.empty()) {
        if (content.empty()) {
            result.match = MatchCandidate{0, 0, MatchStrategy::Exact, 1.0};
            result.tied_candidates = 1;
        }
        return result;
    }

    const auto& chain = strategies.empty() ? default_match_strategies() : strategies;
    MatchContext context{content, search_text, fuzzy_threshold};

    for (const auto strategy : chain) {
        result.attempted.push_back(strategy);

        auto match_function = strategy_function(strategy);
        if (!match_function) {
            continue;
        }

        auto candidates = match_function(context);
        LOG_TRACE("strategy {}: {} candidate(s)", repr(strategy), candidates.size());
        if (candidates.empty()) {
            continue;
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const MatchCandidate& a, const MatchCandidate& b) { return a.position < b.position; });

        // Earliest candidate with the best score.
        auto best = candidates.front();
        for (const auto& candidate : candidates) {
            if (candidate.confidence > best.confidence + kScoreEpsilon) {
                best = candidate;
            }
        }

        int64_t ties = std::count_if(candidates.begin(), candidates.end(), [&](const MatchCandidate& c) {
            return std::fabs(c.confidence - best.confidence) <= kScoreEpsilon;
        });

        if (ties > 1) {
            result.warnings.push_back(
                fmt::format("ambiguous match: {} locations matched with strategy {}, using the earliest at line {}",
                            ties, repr(strategy), line_number_at(content, best.position)));
        }

        LOG_DEBUG("matched with {} at line {} (confidence {:.3f})", repr(strategy),
                  line_number_at(content, best.position), best.confidence);

        result.match = best;
        result.tied_candidates = ties;
        return result;
    }

    return result;
}
