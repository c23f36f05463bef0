#include "strategies.hpp"

#include "algorithms/myers_greedy.hpp"
#include "util/hash.hpp"
#include "util/text.hpp"

#include <gsl/span>

#include <cassert>
#include <string>
#include <vector>

using namespace patchy;

namespace {

// Span covering `count` document lines starting at `first`.
MatchCandidate
line_window_candidate(const MatchContext& context,
                      std::size_t first,
                      std::size_t count,
                      MatchStrategy strategy,
                      double confidence) {
    assert(count > 0);
    const Line& head = context.content_lines[first];
    const Line& tail = context.content_lines[first + count - 1];
    std::size_t end = context.search_ends_with_newline ? tail.end_offset() : tail.offset + tail.text.size();
    return {head.offset, end - head.offset, strategy, confidence};
}

struct KeyedLines {
    std::vector<std::string> keys;
    std::vector<uint32_t> hashes;
};

template <typename Transform>
KeyedLines
key_lines(const std::vector<std::string>& lines, Transform transform) {
    KeyedLines result;
    result.keys.reserve(lines.size());
    result.hashes.reserve(lines.size());
    for (const auto& line : lines) {
        result.keys.push_back(transform(line));
        result.hashes.push_back(hash::hash(result.keys.back()));
    }
    return result;
}

template <typename Transform>
KeyedLines
key_lines(gsl::span<const Line> lines, Transform transform) {
    KeyedLines result;
    result.keys.reserve(lines.size());
    result.hashes.reserve(lines.size());
    for (const auto& line : lines) {
        result.keys.push_back(transform(line.text));
        result.hashes.push_back(hash::hash(result.keys.back()));
    }
    return result;
}

bool
keys_equal(const KeyedLines& a, std::size_t a_index, const KeyedLines& b, std::size_t b_index) {
    return a.hashes[a_index] == b.hashes[b_index] && a.keys[a_index] == b.keys[b_index];
}

// Slide a window of the search line count over the document and keep every
// window whose transformed lines equal the transformed search lines.
template <typename Transform>
std::vector<MatchCandidate>
match_transformed_lines(const MatchContext& context, MatchStrategy strategy, Transform transform) {
    std::vector<MatchCandidate> candidates;

    const std::size_t k = context.search_lines.size();
    const std::size_t n = context.content_lines.size();
    if (k == 0 || n < k) {
        return candidates;
    }

    const auto search = key_lines(context.search_lines, transform);
    const auto document = key_lines(gsl::span<const Line>{context.content_lines}, transform);

    for (std::size_t i = 0; i + k <= n; i++) {
        bool matched = true;
        for (std::size_t j = 0; j < k && matched; j++) {
            matched = keys_equal(document, i + j, search, j);
        }
        if (matched) {
            candidates.push_back(line_window_candidate(context, i, k, strategy, 1.0));
        }
    }

    return candidates;
}

bool
is_blank(char c) {
    return c == ' ' || c == '\t';
}

}  // namespace

MatchContext::MatchContext(const std::string& content, const std::string& search_text, double fuzzy_threshold)
    : content(content)
    , search_text(search_text)
    , fuzzy_threshold(fuzzy_threshold) {
    parselines(content, content_lines);
    search_lines = split_lines(search_text, &search_ends_with_newline);
}

patchy::StrategyFunction
patchy::strategy_function(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::Exact:
            return &match_exact;
        case MatchStrategy::LineTrimmed:
            return &match_line_trimmed;
        case MatchStrategy::WhitespaceNormalized:
            return &match_whitespace_normalized;
        case MatchStrategy::IndentationAgnostic:
            return &match_indentation_agnostic;
        case MatchStrategy::Fuzzy:
            return &match_fuzzy;
    }
    return nullptr;
}

std::vector<MatchCandidate>
patchy::match_exact(const MatchContext& context) {
    std::vector<MatchCandidate> candidates;
    if (context.search_text.empty()) {
        return candidates;
    }

    auto pos = context.content.find(context.search_text);
    while (pos != std::string::npos) {
        candidates.push_back({pos, context.search_text.size(), MatchStrategy::Exact, 1.0});
        pos = context.content.find(context.search_text, pos + 1);
    }
    return candidates;
}

std::vector<MatchCandidate>
patchy::match_line_trimmed(const MatchContext& context) {
    return match_transformed_lines(context, MatchStrategy::LineTrimmed,
                                   [](const std::string& line) { return trim(line); });
}

std::vector<MatchCandidate>
patchy::match_whitespace_normalized(const MatchContext& context) {
    std::vector<MatchCandidate> candidates;

    const std::string needle = trim(collapse_whitespace(context.search_text));
    if (needle.empty()) {
        return candidates;
    }

    // Collapse the document the same way, remembering where each character
    // came from.
    const std::string& content = context.content;
    std::string haystack;
    std::vector<std::size_t> origin;
    haystack.reserve(content.size());
    origin.reserve(content.size());
    bool in_whitespace = false;
    for (std::size_t i = 0; i < content.size(); i++) {
        if (is_whitespace(content[i])) {
            if (!in_whitespace) {
                haystack.push_back(' ');
                origin.push_back(i);
            }
            in_whitespace = true;
        } else {
            haystack.push_back(content[i]);
            origin.push_back(i);
            in_whitespace = false;
        }
    }

    const bool widen_start = context.search_ends_with_newline ||
                             (!context.search_text.empty() && is_blank(context.search_text.front()));
    const bool widen_end = context.search_ends_with_newline;

    auto pos = haystack.find(needle);
    while (pos != std::string::npos) {
        std::size_t start = origin[pos];
        std::size_t end = origin[pos + needle.size() - 1] + 1;

        if (widen_start) {
            std::size_t line_start = start;
            while (line_start > 0 && is_blank(content[line_start - 1])) {
                line_start--;
            }
            if (line_start == 0 || content[line_start - 1] == '\n') {
                start = line_start;
            }
        }
        if (widen_end) {
            std::size_t line_end = end;
            while (line_end < content.size() && (is_blank(content[line_end]) || content[line_end] == '\r')) {
                line_end++;
            }
            if (line_end < content.size() && content[line_end] == '\n') {
                end = line_end + 1;
            } else if (line_end == content.size()) {
                end = line_end;
            }
        }

        // A search ending in a newline replaces whole lines only.
        const bool whole_lines = (start == 0 || content[start - 1] == '\n') &&
                                 (end == content.size() || content[end - 1] == '\n');
        if (!context.search_ends_with_newline || whole_lines) {
            candidates.push_back({start, end - start, MatchStrategy::WhitespaceNormalized, 1.0});
        }
        pos = haystack.find(needle, pos + 1);
    }

    return candidates;
}

std::vector<MatchCandidate>
patchy::match_indentation_agnostic(const MatchContext& context) {
    std::vector<MatchCandidate> candidates;

    const std::size_t k = context.search_lines.size();
    const std::size_t n = context.content_lines.size();
    if (k == 0 || n < k) {
        return candidates;
    }

    // Equal left-trimmed lines are necessary for a match; check those first
    // and only dedent the windows that pass.
    auto left_trimmed = [](const std::string& line) { return trim_left(line); };
    const auto search = key_lines(context.search_lines, left_trimmed);
    const auto document = key_lines(gsl::span<const Line>{context.content_lines}, left_trimmed);

    const std::size_t search_indent = common_indentation(context.search_lines);
    std::vector<std::string> search_dedented;
    for (const auto& line : context.search_lines) {
        search_dedented.push_back(remove_indentation(line, search_indent));
    }

    gsl::span<const Line> lines{context.content_lines};
    std::vector<std::string> window;
    for (std::size_t i = 0; i + k <= n; i++) {
        bool candidate = true;
        for (std::size_t j = 0; j < k && candidate; j++) {
            candidate = keys_equal(document, i + j, search, j);
        }
        if (!candidate) {
            continue;
        }

        window.clear();
        for (const auto& line : lines.subspan(i, k)) {
            window.push_back(line.text);
        }
        const std::size_t window_indent = common_indentation(window);

        bool matched = true;
        for (std::size_t j = 0; j < k && matched; j++) {
            if (is_empty(window[j]) && is_empty(context.search_lines[j])) {
                continue;
            }
            matched = remove_indentation(window[j], window_indent) == search_dedented[j];
        }
        if (matched) {
            candidates.push_back(line_window_candidate(context, i, k, MatchStrategy::IndentationAgnostic, 1.0));
        }
    }

    return candidates;
}

std::vector<MatchCandidate>
patchy::match_fuzzy(const MatchContext& context) {
    std::vector<MatchCandidate> candidates;

    const std::size_t k = context.search_lines.size();
    const std::size_t n = context.content_lines.size();
    if (k == 0 || n < k) {
        return candidates;
    }

    auto trimmed = [](const std::string& line) { return trim(line); };
    const auto search = key_lines(context.search_lines, trimmed);
    const auto document = key_lines(gsl::span<const Line>{context.content_lines}, trimmed);

    const double threshold = context.fuzzy_threshold;
    const double window_size = static_cast<double>(k);

    for (std::size_t i = 0; i + k <= n; i++) {
        double total = 0.0;
        bool reachable = true;
        for (std::size_t j = 0; j < k; j++) {
            if (keys_equal(document, i + j, search, j)) {
                total += 1.0;
            } else {
                total += line_similarity(document.keys[i + j], search.keys[j]);
            }

            // Even perfect remaining lines would not lift the window over the
            // threshold.
            double best_possible = (total + static_cast<double>(k - j - 1)) / window_size;
            if (best_possible < threshold) {
                reachable = false;
                break;
            }
        }
        if (!reachable) {
            continue;
        }

        double score = total / window_size;
        if (score >= threshold) {
            candidates.push_back(line_window_candidate(context, i, k, MatchStrategy::Fuzzy, score));
        }
    }

    return candidates;
}

double
patchy::line_similarity(const std::string& a, const std::string& b) {
    if (a == b) {
        return 1.0;
    }
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    if (a.size() > kFuzzyMaxLineLength || b.size() > kFuzzyMaxLineLength) {
        return 0.0;
    }

    DiffInput<const char> input{gsl::span<const char>{a.data(), a.size()},
                                gsl::span<const char>{b.data(), b.size()}};
    MyersGreedy<const char> myers{input};
    auto distance = myers.compute_edit_distance();
    if (distance < 0) {
        return 0.0;
    }

    auto total = static_cast<double>(a.size() + b.size());
    return 1.0 - static_cast<double>(distance) / total;
}
