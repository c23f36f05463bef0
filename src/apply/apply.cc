#include "apply.hpp"

#include "apply/search_replace_apply.hpp"
#include "apply/unified_apply.hpp"
#include "edit/format_detect.hpp"
#include "edit/search_replace_parser.hpp"
#include "edit/unified_parser.hpp"
#include "util/lines.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

namespace {

ApplyOptions
sanitize_options(const ApplyOptions& options, std::vector<std::string>& warnings) {
    ApplyOptions result = options;
    if (result.matching_strategies.empty()) {
        result.matching_strategies = default_match_strategies();
    }
    if (!(result.fuzzy_threshold >= 0.0 && result.fuzzy_threshold <= 1.0)) {
        double clamped = result.fuzzy_threshold > 1.0 ? 1.0 : 0.0;
        warnings.push_back(
            fmt::format("fuzzy threshold {} is outside [0, 1], using {}", result.fuzzy_threshold, clamped));
        result.fuzzy_threshold = clamped;
    }
    if (result.max_fuzz < 0) {
        warnings.push_back(fmt::format("max fuzz {} is negative, using 0", result.max_fuzz));
        result.max_fuzz = 0;
    }
    return result;
}

ApplyOutcome
unapplied_outcome(const std::string& content) {
    ApplyOutcome outcome;
    outcome.content = content;
    return outcome;
}

}  // namespace

bool
patchy::apply_auto(const std::string& content,
                   const std::string& edit_text,
                   const ApplyOptions& options,
                   ApplyOutcome& outcome,
                   EditError& error) {
    EditFormat format;
    if (!detect_format(edit_text, format)) {
        outcome = unapplied_outcome(content);
        error.set_error(EditErrorKind::UnknownFormat, -1,
                        "edit text contains neither search/replace blocks nor unified diff hunks");
        LOG_DEBUG("{}", error.message);
        return false;
    }

    LOG_DEBUG("detected {} edit format", repr(format));
    return apply_with_format(content, edit_text, format, options, outcome, error);
}

bool
patchy::apply_with_format(const std::string& content,
                          const std::string& edit_text,
                          EditFormat format,
                          const ApplyOptions& options,
                          ApplyOutcome& outcome,
                          EditError& error) {
    std::vector<std::string> warnings;
    const ApplyOptions effective = sanitize_options(options, warnings);

    const LineEnding line_ending = detect_line_ending(content);
    const std::string document = normalize_line_endings(content);
    const std::string edits = normalize_line_endings(edit_text);

    ApplyOutcome result;
    switch (format) {
        case EditFormat::SearchReplace: {
            std::vector<EditBlock> blocks;
            if (!parse_search_replace(edits, blocks, error)) {
                outcome = unapplied_outcome(content);
                return false;
            }
            result = apply_search_replace_blocks(document, blocks, effective);
        } break;
        case EditFormat::Unified: {
            UnifiedDiff diff;
            if (!parse_unified_diff(edits, diff, warnings, error)) {
                outcome = unapplied_outcome(content);
                return false;
            }
            result = apply_unified_hunks(document, diff.hunks, effective);
        } break;
    }

    // Untouched documents come back byte for byte, mixed line endings and
    // all.
    if (result.blocks_applied == 0) {
        result.content = content;
    } else {
        result.content = restore_line_endings(result.content, line_ending);
    }

    warnings.insert(warnings.end(), result.warnings.begin(), result.warnings.end());
    result.warnings = std::move(warnings);

    LOG_INFO("{}: {} of {} unit(s) applied, {} failed", repr(format), result.blocks_applied, result.blocks_total,
             result.blocks_failed);

    outcome = std::move(result);
    return true;
}
