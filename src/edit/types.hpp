#pragma once

/*
    Data model shared by the parsers, the match engine and the appliers.

    Everything here is created fresh for a single apply call and thrown away
    afterwards; nothing is cached between calls.
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchy {

enum class EditFormat {
    SearchReplace,
    Unified,
};

std::string
repr(EditFormat format);

std::optional<EditFormat>
edit_format_from_string(const std::string& s);

// One search/replace edit unit.
struct EditBlock {
    int64_t index = 0;
    std::string search_text;
    std::string replace_text;
};

enum class HunkLineKind {
    Context,
    Add,
    Remove,
};

struct HunkLine {
    HunkLineKind kind;
    std::string text;

    // Followed by a "\ No newline at end of file" marker.
    bool missing_newline = false;
};

// One contiguous region of change in a unified diff. Line numbers are 1-based
// as written in the "@@ -a,b +c,d @@" header.
struct Hunk {
    int64_t index = 0;
    int64_t original_start = 0;
    int64_t original_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;

    std::vector<HunkLine> lines;

    // Context and removed lines; what the document has to contain.
    std::vector<std::string>
    old_lines() const;

    // Context and added lines; what the document will contain.
    std::vector<std::string>
    new_lines() const;
};

struct UnifiedDiff {
    std::string old_path;
    std::string new_path;
    std::vector<Hunk> hunks;
};

enum class MatchStrategy {
    Exact,
    LineTrimmed,
    WhitespaceNormalized,
    IndentationAgnostic,
    Fuzzy,
};

std::string
repr(MatchStrategy strategy);

std::optional<MatchStrategy>
match_strategy_from_string(const std::string& s);

const std::vector<MatchStrategy>&
default_match_strategies();

struct MatchCandidate {
    std::size_t position = 0;
    std::size_t length = 0;
    MatchStrategy strategy = MatchStrategy::Exact;
    double confidence = 0.0;
};

struct FailedUnit {
    int64_t index = 0;
    std::string reason;
    std::string snippet;
};

// How a unit was matched. Only collected when telemetry is enabled.
struct MatchRecord {
    int64_t index = 0;
    MatchStrategy strategy = MatchStrategy::Exact;
    double confidence = 0.0;
    int64_t line = 0;
};

struct ApplyOptions {
    bool strict = false;
    bool enable_telemetry = false;

    // Tried in order. Empty means the default chain.
    std::vector<MatchStrategy> matching_strategies = default_match_strategies();

    double fuzzy_threshold = 0.8;

    // Context lines a hunk may get wrong and still be anchored.
    int64_t max_fuzz = 2;
};

struct ApplyOutcome {
    std::string content;

    int64_t blocks_total = 0;
    int64_t blocks_applied = 0;
    int64_t blocks_failed = 0;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    std::vector<FailedUnit> failed_units;
    std::vector<MatchRecord> telemetry;

    bool
    all_applied() const {
        return blocks_failed == 0;
    }
};

// clang-format off
enum class EditErrorKind {
    None          = 1 << 0,
    UnknownFormat = 1 << 1,
    Parse         = 1 << 2,
};
// clang-format on

// Structural failure: the edit text can not be turned into edit units at all.
struct EditError {
    EditErrorKind kind = EditErrorKind::None;
    int64_t unit_index = -1;
    std::string message;

    bool
    is_ok() const {
        return kind == EditErrorKind::None;
    }

    void
    set_error(EditErrorKind error_kind, int64_t index, std::string error_message) {
        kind = error_kind;
        unit_index = index;
        message = std::move(error_message);
    }
};

std::string
repr(EditErrorKind kind);

}  // namespace patchy
