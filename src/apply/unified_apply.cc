#include "unified_apply.hpp"

#include "apply/outcome.hpp"
#include "util/hash.hpp"
#include "util/lines.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>

using namespace patchy;

namespace {

struct HunkPattern {
    std::vector<std::string> lines;
    std::vector<HunkLineKind> kinds;
    std::vector<uint32_t> trimmed_hashes;
    std::vector<std::string> trimmed;
    int64_t context_lines = 0;
};

HunkPattern
make_pattern(const Hunk& hunk) {
    HunkPattern pattern;
    for (const auto& line : hunk.lines) {
        if (line.kind == HunkLineKind::Add) {
            continue;
        }
        pattern.lines.push_back(line.text);
        pattern.kinds.push_back(line.kind);
        pattern.trimmed.push_back(trim(line.text));
        pattern.trimmed_hashes.push_back(hash::hash(pattern.trimmed.back()));
        pattern.context_lines += line.kind == HunkLineKind::Context ? 1 : 0;
    }
    return pattern;
}

struct DocumentIndex {
    std::vector<std::string> trimmed;
    std::vector<uint32_t> trimmed_hashes;
};

DocumentIndex
make_index(const std::vector<std::string>& document) {
    DocumentIndex index;
    index.trimmed.reserve(document.size());
    index.trimmed_hashes.reserve(document.size());
    for (const auto& line : document) {
        index.trimmed.push_back(trim(line));
        index.trimmed_hashes.push_back(hash::hash(index.trimmed.back()));
    }
    return index;
}

// Number of mismatched context lines when the pattern is placed at `start`,
// or -1 if it can not be placed there with at most `allowed` mismatches.
int64_t
pattern_mismatches(const std::vector<std::string>& document,
                   const DocumentIndex& index,
                   const HunkPattern& pattern,
                   int64_t start,
                   AnchorLevel level,
                   int64_t allowed) {
    const auto k = static_cast<int64_t>(pattern.lines.size());
    if (start < 0 || start + k > static_cast<int64_t>(document.size())) {
        return -1;
    }

    int64_t mismatches = 0;
    for (int64_t j = 0; j < k; j++) {
        const auto d = static_cast<std::size_t>(start + j);
        const auto p = static_cast<std::size_t>(j);
        bool equal = false;
        if (level == AnchorLevel::Exact) {
            equal = document[d] == pattern.lines[p];
        } else {
            equal = index.trimmed_hashes[d] == pattern.trimmed_hashes[p] && index.trimmed[d] == pattern.trimmed[p];
        }
        if (equal) {
            continue;
        }
        // Never remove a line that is not the one the hunk means.
        if (pattern.kinds[p] == HunkLineKind::Remove || ++mismatches > allowed) {
            return -1;
        }
    }
    return mismatches;
}

std::string
describe(const HunkAnchor& anchor) {
    switch (anchor.level) {
        case AnchorLevel::Exact:
            return "";
        case AnchorLevel::IgnoreWhitespace:
            return " ignoring whitespace";
        case AnchorLevel::Fuzz:
            return fmt::format(" with fuzz {}", anchor.mismatched_context);
    }
    return "";
}

MatchStrategy
telemetry_strategy(AnchorLevel level) {
    switch (level) {
        case AnchorLevel::Exact:
            return MatchStrategy::Exact;
        case AnchorLevel::IgnoreWhitespace:
            return MatchStrategy::LineTrimmed;
        case AnchorLevel::Fuzz:
            return MatchStrategy::Fuzzy;
    }
    return MatchStrategy::Exact;
}

}  // namespace

std::optional<HunkAnchor>
patchy::locate_hunk(const std::vector<std::string>& document,
                    const Hunk& hunk,
                    int64_t expected_line,
                    int64_t max_fuzz) {
    const auto pattern = make_pattern(hunk);
    const auto n = static_cast<int64_t>(document.size());
    const auto k = static_cast<int64_t>(pattern.lines.size());

    if (k == 0) {
        return HunkAnchor{std::clamp<int64_t>(expected_line, 0, n), AnchorLevel::Exact, 0};
    }
    if (k > n) {
        return std::nullopt;
    }

    const auto index = make_index(document);
    const int64_t last_start = n - k;
    const int64_t first_guess = std::clamp<int64_t>(expected_line, 0, last_start);

    // At least half of the lines have to agree, and at least one context
    // line.
    const int64_t fuzz_limit = std::min({max_fuzz, pattern.context_lines - 1, k / 2});

    struct Pass {
        AnchorLevel level;
        int64_t allowed;
    };
    std::vector<Pass> passes = {{AnchorLevel::Exact, 0}, {AnchorLevel::IgnoreWhitespace, 0}};
    for (int64_t fuzz = 1; fuzz <= fuzz_limit; fuzz++) {
        passes.push_back({AnchorLevel::Fuzz, fuzz});
    }

    const int64_t max_distance = std::max(first_guess, last_start - first_guess);
    for (const auto& pass : passes) {
        auto try_at = [&](int64_t start) -> std::optional<HunkAnchor> {
            auto mismatches = pattern_mismatches(document, index, pattern, start, pass.level, pass.allowed);
            if (mismatches < 0) {
                return std::nullopt;
            }
            return HunkAnchor{start, pass.level, mismatches};
        };

        if (auto anchor = try_at(first_guess)) {
            return anchor;
        }
        // The earlier line first when both are equally far away.
        for (int64_t distance = 1; distance <= max_distance; distance++) {
            if (auto anchor = try_at(first_guess - distance)) {
                return anchor;
            }
            if (auto anchor = try_at(first_guess + distance)) {
                return anchor;
            }
        }
    }

    return std::nullopt;
}

ApplyOutcome
patchy::apply_unified_hunks(const std::string& content, const std::vector<Hunk>& hunks, const ApplyOptions& options) {
    ApplyOutcome outcome;
    outcome.content = content;
    outcome.blocks_total = static_cast<int64_t>(hunks.size());

    std::vector<std::string> hunk_texts;
    for (const auto& hunk : hunks) {
        hunk_texts.push_back(join_lines(hunk.old_lines(), true));
    }

    bool trailing_newline = false;
    auto document = split_lines(content, &trailing_newline);

    // How much earlier hunks changed the line count, and how far the last
    // anchor was from where its header said it would be.
    int64_t line_delta = 0;
    int64_t drift = 0;

    for (std::size_t i = 0; i < hunks.size(); i++) {
        const auto& hunk = hunks[i];
        const auto unit = static_cast<int64_t>(i);
        const auto old_lines = hunk.old_lines();
        const auto k = static_cast<int64_t>(old_lines.size());

        // A hunk without old lines inserts after the line its header names.
        const int64_t declared = old_lines.empty() ? hunk.original_start : hunk.original_start - 1;
        const int64_t base = std::max<int64_t>(declared, 0) + line_delta;
        const int64_t expected = base + drift;

        auto anchor = locate_hunk(document, hunk, expected, options.max_fuzz);
        if (!anchor) {
            auto reason = fmt::format("could not locate {} context/removed line(s) near line {}", k, expected + 1);
            record_failure(outcome, kHunkNames, unit, reason, hunk_texts[i]);

            if (options.strict) {
                abort_strict(outcome, kHunkNames, content, unit, hunk_texts);
                return outcome;
            }
            continue;
        }

        const int64_t start = anchor->line;
        const bool reaches_end = start + k == static_cast<int64_t>(document.size());
        const bool document_was_empty = document.empty();

        std::vector<std::string> region;
        auto source = static_cast<std::size_t>(start);
        for (const auto& line : hunk.lines) {
            switch (line.kind) {
                case HunkLineKind::Context:
                    region.push_back(document[source++]);
                    break;
                case HunkLineKind::Remove:
                    source++;
                    break;
                case HunkLineKind::Add:
                    region.push_back(line.text);
                    break;
            }
        }

        auto first = document.begin() + start;
        document.erase(first, first + k);
        document.insert(document.begin() + start, region.begin(), region.end());

        if (reaches_end) {
            const HunkLine* last_new = nullptr;
            const HunkLine* last_old = nullptr;
            for (const auto& line : hunk.lines) {
                if (line.kind != HunkLineKind::Remove)
                    last_new = &line;
                if (line.kind != HunkLineKind::Add)
                    last_old = &line;
            }
            if (last_new && last_new->missing_newline) {
                trailing_newline = false;
            } else if ((last_old && last_old->missing_newline) || document_was_empty) {
                trailing_newline = true;
            }
        }

        if (start != base || anchor->level != AnchorLevel::Exact) {
            const int64_t offset = start - base;
            std::string offset_text;
            if (offset != 0) {
                offset_text = fmt::format(" (offset {} line{})", offset, std::abs(offset) == 1 ? "" : "s");
            }
            outcome.warnings.push_back(
                fmt::format("hunk {}: applied at line {}{}{}", unit + 1, start + 1, offset_text, describe(*anchor)));
        }

        if (options.enable_telemetry) {
            double confidence = k == 0 ? 1.0 : static_cast<double>(k - anchor->mismatched_context) / static_cast<double>(k);
            outcome.telemetry.push_back({unit, telemetry_strategy(anchor->level), confidence, start + 1});
        }
        LOG_DEBUG("hunk {} anchored at line {} (expected {})", unit + 1, start + 1, expected + 1);

        line_delta += static_cast<int64_t>(region.size()) - k;
        drift = start - base;
        outcome.blocks_applied++;
    }

    outcome.content = join_lines(document, trailing_newline && !document.empty());
    return outcome;
}
