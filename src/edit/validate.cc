#include "validate.hpp"

#include "edit/format_detect.hpp"
#include "edit/search_replace_parser.hpp"
#include "edit/unified_parser.hpp"
#include "util/lines.hpp"

#include <fmt/format.h>

using namespace patchy;

namespace {

void
check_blocks(const std::vector<EditBlock>& blocks, std::vector<std::string>& warnings) {
    for (const auto& block : blocks) {
        if (block.search_text.empty()) {
            warnings.push_back(
                fmt::format("block {}: search text is empty, it only applies to an empty document", block.index + 1));
        } else if (block.search_text == block.replace_text) {
            warnings.push_back(fmt::format("block {}: replacement is identical to the search text", block.index + 1));
        }
    }
}

void
check_hunks(const std::vector<Hunk>& hunks, std::vector<std::string>& warnings) {
    for (const auto& hunk : hunks) {
        bool changes = false;
        for (const auto& line : hunk.lines) {
            changes |= line.kind != HunkLineKind::Context;
        }
        if (!changes) {
            warnings.push_back(fmt::format("hunk {}: contains no added or removed lines", hunk.index + 1));
        }
    }
}

}  // namespace

bool
patchy::validate_edit(const std::string& edit_text, ValidationReport& report) {
    report = ValidationReport{};

    EditFormat format;
    if (!detect_format(edit_text, format)) {
        report.error.set_error(EditErrorKind::UnknownFormat, -1,
                               "edit text contains neither search/replace blocks nor unified diff hunks");
        return false;
    }
    report.format = format;

    const std::string edits = normalize_line_endings(edit_text);
    switch (format) {
        case EditFormat::SearchReplace: {
            std::vector<EditBlock> blocks;
            if (!parse_search_replace(edits, blocks, report.error)) {
                return false;
            }
            report.unit_count = static_cast<int64_t>(blocks.size());
            check_blocks(blocks, report.warnings);
        } break;
        case EditFormat::Unified: {
            UnifiedDiff diff;
            if (!parse_unified_diff(edits, diff, report.warnings, report.error)) {
                return false;
            }
            report.unit_count = static_cast<int64_t>(diff.hunks.size());
            check_hunks(diff.hunks, report.warnings);
        } break;
    }

    report.valid = true;
    return true;
}
