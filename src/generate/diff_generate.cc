#include "diff_generate.hpp"

#include "algorithms/myers_greedy.hpp"
#include "edit/search_replace_parser.hpp"
#include "output/unified.hpp"
#include "processing/diff_hunk.hpp"
#include "util/lines.hpp"
#include "util/log.hpp"

#include <gsl/span>

#include <algorithm>

using namespace patchy;

namespace {

std::string
hunk_text(const Hunk& hunk, HunkLineKind skipped) {
    std::string text;
    for (const auto& line : hunk.lines) {
        if (line.kind == skipped) {
            continue;
        }
        text += line.text;
        if (!line.missing_newline) {
            text += '\n';
        }
    }
    return text;
}

std::vector<EditBlock>
blocks_from_hunks(const std::vector<Hunk>& hunks) {
    std::vector<EditBlock> blocks;
    for (const auto& hunk : hunks) {
        EditBlock block;
        block.index = static_cast<int64_t>(blocks.size());
        block.search_text = hunk_text(hunk, HunkLineKind::Add);
        block.replace_text = hunk_text(hunk, HunkLineKind::Remove);
        blocks.push_back(std::move(block));
    }
    return blocks;
}

// Replay the blocks the way the applier would with exact matching: every
// search text has to occur once in the document as it is at that point.
bool
blocks_are_unambiguous(const std::string& original, const std::vector<EditBlock>& blocks) {
    std::string document = original;
    for (const auto& block : blocks) {
        if (block.search_text.empty()) {
            if (!document.empty()) {
                return false;
            }
            document = block.replace_text;
            continue;
        }
        const auto pos = document.find(block.search_text);
        if (pos == std::string::npos || document.find(block.search_text, pos + 1) != std::string::npos) {
            return false;
        }
        document.replace(pos, block.search_text.size(), block.replace_text);
    }
    return true;
}

}  // namespace

std::vector<Hunk>
patchy::diff_lines(const std::string& original, const std::string& modified, int64_t context_lines) {
    std::vector<Line> a_lines;
    std::vector<Line> b_lines;
    parselines(normalize_line_endings(original), a_lines);
    parselines(normalize_line_endings(modified), b_lines);

    DiffInput<const Line> input{gsl::span<const Line>{a_lines}, gsl::span<const Line>{b_lines}};
    MyersGreedy<const Line> myers{input};
    const auto result = myers.compute();

    if (result.status == DiffResultStatus::NoChanges) {
        return {};
    } else if (result.status == DiffResultStatus::Failed) {
        LOG_ERROR("line diff failed ({} and {} lines)", a_lines.size(), b_lines.size());
        return {};
    }

    return compose_hunks(result.edit_sequence, context_lines, input.A, input.B);
}

std::vector<EditBlock>
patchy::search_replace_blocks(const std::string& original, const std::string& modified, int64_t context_lines) {
    const std::string a = normalize_line_endings(original);
    const std::string b = normalize_line_endings(modified);
    const auto line_count = static_cast<int64_t>(split_lines(a).size());

    int64_t context = std::max<int64_t>(context_lines, 0);
    std::vector<EditBlock> blocks = blocks_from_hunks(diff_lines(a, b, context));
    while (!blocks_are_unambiguous(a, blocks) && context < line_count) {
        context += 2;
        LOG_DEBUG("search text is ambiguous, widening context to {} line(s)", context);
        blocks = blocks_from_hunks(diff_lines(a, b, context));
    }
    return blocks;
}

std::string
patchy::create_search_replace_diff(const std::string& original, const std::string& modified, int64_t context_lines) {
    return render_search_replace(search_replace_blocks(original, modified, context_lines));
}

std::string
patchy::create_unified_diff(const std::string& original,
                            const std::string& modified,
                            const std::string& old_name,
                            const std::string& new_name,
                            int64_t context_lines) {
    const auto hunks = diff_lines(original, modified, context_lines);
    if (hunks.empty()) {
        return "";
    }
    return unified_diff_render(hunks, old_name, new_name);
}
