#pragma once

/*
    Apply unified diff hunks to a document.

    A hunk is anchored where its context and removed lines are found. The
    search starts at the line the header declares (corrected by what earlier
    hunks did to the line numbering) and moves outwards, one line up and one
    line down at a time, through the whole document. Each pass is tried with
    growing tolerance: exact lines first, then lines compared without
    surrounding whitespace, then with a few context lines allowed to differ.
*/

#include "edit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchy {

enum class AnchorLevel {
    Exact,
    IgnoreWhitespace,
    Fuzz,
};

struct HunkAnchor {
    // 0-based index of the first document line the hunk covers.
    int64_t line = 0;
    AnchorLevel level = AnchorLevel::Exact;
    int64_t mismatched_context = 0;
};

std::optional<HunkAnchor>
locate_hunk(const std::vector<std::string>& document, const Hunk& hunk, int64_t expected_line, int64_t max_fuzz);

ApplyOutcome
apply_unified_hunks(const std::string& content, const std::vector<Hunk>& hunks, const ApplyOptions& options);

}  // namespace patchy
