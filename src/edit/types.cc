#include "types.hpp"

using namespace patchy;

std::vector<std::string>
Hunk::old_lines() const {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        if (line.kind != HunkLineKind::Add) {
            result.push_back(line.text);
        }
    }
    return result;
}

std::vector<std::string>
Hunk::new_lines() const {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        if (line.kind != HunkLineKind::Remove) {
            result.push_back(line.text);
        }
    }
    return result;
}

std::string
patchy::repr(EditFormat format) {
    switch (format) {
        case EditFormat::SearchReplace:
            return "search-replace";
        case EditFormat::Unified:
            return "unified";
    }
    return "unknown";
}

std::optional<EditFormat>
patchy::edit_format_from_string(const std::string& s) {
    if (s == "search-replace" || s == "sr")
        return EditFormat::SearchReplace;
    else if (s == "unified" || s == "udiff" || s == "u")
        return EditFormat::Unified;
    return std::nullopt;
}

std::string
patchy::repr(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::Exact:
            return "exact";
        case MatchStrategy::LineTrimmed:
            return "line_trimmed";
        case MatchStrategy::WhitespaceNormalized:
            return "whitespace_normalized";
        case MatchStrategy::IndentationAgnostic:
            return "indentation_agnostic";
        case MatchStrategy::Fuzzy:
            return "fuzzy";
    }
    return "unknown";
}

std::optional<MatchStrategy>
patchy::match_strategy_from_string(const std::string& s) {
    if (s == "exact")
        return MatchStrategy::Exact;
    else if (s == "line_trimmed" || s == "trimmed")
        return MatchStrategy::LineTrimmed;
    else if (s == "whitespace_normalized" || s == "normalized")
        return MatchStrategy::WhitespaceNormalized;
    else if (s == "indentation_agnostic" || s == "indent")
        return MatchStrategy::IndentationAgnostic;
    else if (s == "fuzzy")
        return MatchStrategy::Fuzzy;
    return std::nullopt;
}

const std::vector<MatchStrategy>&
patchy::default_match_strategies() {
    static const std::vector<MatchStrategy> strategies = {
        MatchStrategy::Exact,
        MatchStrategy::LineTrimmed,
        MatchStrategy::WhitespaceNormalized,
        MatchStrategy::IndentationAgnostic,
        MatchStrategy::Fuzzy,
    };
    return strategies;
}

std::string
patchy::repr(EditErrorKind kind) {
    switch (kind) {
        case EditErrorKind::None:
            return "none";
        case EditErrorKind::UnknownFormat:
            return "unknown format";
        case EditErrorKind::Parse:
            return "parse error";
    }
    return "unknown";
}
