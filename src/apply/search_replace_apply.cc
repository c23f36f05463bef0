#include "search_replace_apply.hpp"

#include "apply/outcome.hpp"
#include "matching/match_engine.hpp"
#include "util/lines.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

namespace {

std::string
first_indentation(const std::string& text) {
    for (const auto& line : split_lines(text)) {
        if (!is_empty(line)) {
            return leading_whitespace(line);
        }
    }
    return "";
}

bool
ignores_indentation(MatchStrategy strategy) {
    return strategy == MatchStrategy::LineTrimmed || strategy == MatchStrategy::IndentationAgnostic ||
           strategy == MatchStrategy::Fuzzy;
}

std::string
strategy_list(const std::vector<MatchStrategy>& strategies) {
    std::string result;
    for (const auto strategy : strategies) {
        if (!result.empty()) {
            result += ", ";
        }
        result += repr(strategy);
    }
    return result;
}

}  // namespace

std::string
patchy::reindent_replacement(const std::string& replace_text,
                             const std::string& search_text,
                             const std::string& matched_text) {
    const auto search_indent = first_indentation(search_text);
    const auto matched_indent = first_indentation(matched_text);
    if (search_indent == matched_indent) {
        return replace_text;
    }

    // Lines that do not share the first line's indentation are shifted by the
    // same number of columns, never below column 0.
    const auto shift = static_cast<int64_t>(matched_indent.size()) - static_cast<int64_t>(search_indent.size());

    bool trailing_newline = false;
    auto lines = split_lines(replace_text, &trailing_newline);
    for (auto& line : lines) {
        if (is_empty(line)) {
            continue;
        }
        if (line.compare(0, search_indent.size(), search_indent) == 0) {
            line = matched_indent + line.substr(search_indent.size());
        } else if (shift < 0) {
            const auto indent = static_cast<int64_t>(leading_whitespace(line).size());
            line.erase(0, static_cast<std::size_t>(std::min(indent, -shift)));
        } else {
            line.insert(0, static_cast<std::size_t>(shift), matched_indent.front());
        }
    }
    return join_lines(lines, trailing_newline);
}

ApplyOutcome
patchy::apply_search_replace_blocks(const std::string& content,
                                    const std::vector<EditBlock>& blocks,
                                    const ApplyOptions& options) {
    ApplyOutcome outcome;
    outcome.content = content;
    outcome.blocks_total = static_cast<int64_t>(blocks.size());

    std::vector<std::string> search_texts;
    for (const auto& block : blocks) {
        search_texts.push_back(block.search_text);
    }

    std::string current = content;
    for (std::size_t i = 0; i < blocks.size(); i++) {
        const auto& block = blocks[i];
        const auto unit = static_cast<int64_t>(i);
        if (block.search_text == block.replace_text) {
            outcome.warnings.push_back(
                fmt::format("block {}: replacement is identical to the search text", unit + 1));
        }

        auto result = find_match(current, block.search_text, options.matching_strategies, options.fuzzy_threshold);
        for (const auto& warning : result.warnings) {
            outcome.warnings.push_back(fmt::format("block {}: {}", unit + 1, warning));
        }

        if (!result.match) {
            std::string reason;
            if (block.search_text.empty()) {
                reason = "search text is empty and the document is not";
            } else {
                reason = fmt::format("search text not found (tried {})", strategy_list(result.attempted));
            }
            record_failure(outcome, kBlockNames, unit, reason, block.search_text);

            if (options.strict) {
                abort_strict(outcome, kBlockNames, content, unit, search_texts);
                return outcome;
            }
            continue;
        }

        const auto& match = *result.match;
        std::string replacement = block.replace_text;
        if (ignores_indentation(match.strategy)) {
            replacement =
                reindent_replacement(replacement, block.search_text, current.substr(match.position, match.length));
        }

        // A match running to the end of a document without a final newline
        // keeps it that way.
        const bool reaches_end = match.position + match.length == current.size();
        if (reaches_end && match.length > 0 && current.back() != '\n' && !replacement.empty() &&
            replacement.back() == '\n') {
            replacement.pop_back();
        }

        const auto line = line_number_at(current, match.position);
        current.replace(match.position, match.length, replacement);
        outcome.blocks_applied++;

        if (options.enable_telemetry) {
            outcome.telemetry.push_back({unit, match.strategy, match.confidence, line});
        }
        LOG_DEBUG("block {} applied at line {} using {}", unit + 1, line, repr(match.strategy));
    }

    outcome.content = std::move(current);
    return outcome;
}
