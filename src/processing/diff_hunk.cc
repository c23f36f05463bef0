#include "diff_hunk.hpp"

#include <algorithm>

using namespace patchy;

namespace {

struct HunkRange {
    int64_t start;
    int64_t end;
};

// Take a sequence of edits and filter out all common lines.
// Return a list of all ranges with consecutive delete and insertions.
std::vector<HunkRange>
find_hunk_ranges(const std::vector<Edit>& edit_sequence) {
    std::vector<HunkRange> hunk_ranges;
    hunk_ranges.push_back({-1, -1});
    for (size_t i = 0; i < edit_sequence.size(); i++) {
        HunkRange& curr = hunk_ranges.back();
        const EditType etype = edit_sequence[i].type;
        const bool in_hunk = curr.start != -1;
        if (!in_hunk && etype != EditType::Common) {
            curr.start = static_cast<int64_t>(i);
            curr.end = static_cast<int64_t>(i);
        } else if (in_hunk) {
            if (etype == EditType::Common) {
                hunk_ranges.push_back({-1, -1});
            } else {
                curr.end = static_cast<int64_t>(i);
            }
        }
    }

    if (hunk_ranges.back().start == -1) {
        hunk_ranges.pop_back();
    }

    return hunk_ranges;
}

// Combine adjacent hunk ranges. Take number of context lines into consideration.
std::vector<HunkRange>
extend_hunk_ranges(const std::vector<Edit>& edit_sequence,
                   const std::vector<HunkRange>& hunk_ranges,
                   const int64_t context_size) {
    std::vector<HunkRange> context_ranges = hunk_ranges;
    const auto last_index = static_cast<int64_t>(edit_sequence.size()) - 1;

    for (size_t i = 0; i < context_ranges.size(); i++) {
        const bool last_iteration = i + 1 == context_ranges.size();

        HunkRange* p = i == 0 ? nullptr : &context_ranges[i - 1];
        HunkRange* h = &context_ranges[i];
        HunkRange* n = last_iteration ? nullptr : &context_ranges[i + 1];

        // Combine hunks if their context lines would touch or overlap.
        if (n && n->start - h->end <= context_size * 2 + 1) {
            h->end = n->end;
            context_ranges.erase(context_ranges.begin() + static_cast<std::ptrdiff_t>(i) + 1);
            i -= 1;
            continue;
        }

        // Adjust context lines for current hunk. Handle edge cases for a
        // first hunk at the start, and a final hunk at the end.
        const int64_t p_end = p ? p->end + 1 : 0;
        h->start = std::max(p_end, h->start - context_size);
        h->end = std::min(h->end + context_size, last_index);
    }
    return context_ranges;
}

}  // namespace

std::vector<Hunk>
patchy::compose_hunks(const std::vector<Edit>& edit_sequence,
                      const int64_t context_size,
                      gsl::span<const Line> a,
                      gsl::span<const Line> b) {
    // Start by finding all hunks without taking context size into consideration.
    auto hunk_ranges = find_hunk_ranges(edit_sequence);

    // And then extend the ranges to include context lines. Join adjacent hunk ranges.
    auto hunk_ranges_with_context = extend_hunk_ranges(edit_sequence, hunk_ranges, std::max<int64_t>(context_size, 0));

    // Line counts of A and B consumed after each edit.
    struct InsertionPoint {
        int64_t a_insertion_point = -1;
        int64_t b_insertion_point = -1;
    };
    std::vector<InsertionPoint> insertion_points;
    {
        int64_t a_count = 0, b_count = 0;
        for (const auto& e : edit_sequence) {
            switch (e.type) {
                case EditType::Insert:
                    b_count++;
                    break;
                case EditType::Delete:
                    a_count++;
                    break;
                case EditType::Common:
                    a_count++;
                    b_count++;
                    break;
            }
            insertion_points.push_back({a_count, b_count});
        }
    }

    std::vector<Hunk> hunks;
    for (const auto& hunk_range : hunk_ranges_with_context) {
        const auto range_start = static_cast<size_t>(hunk_range.start);
        const auto range_end = static_cast<size_t>(hunk_range.end);

        // Lines of A and B that come before the hunk.
        const auto& first = edit_sequence[range_start];
        const int64_t a_before =
            insertion_points[range_start].a_insertion_point - (first.type == EditType::Insert ? 0 : 1);
        const int64_t b_before =
            insertion_points[range_start].b_insertion_point - (first.type == EditType::Delete ? 0 : 1);

        Hunk hunk;
        hunk.index = static_cast<int64_t>(hunks.size());
        for (auto i = range_start; i <= range_end; i++) {
            const auto& e = edit_sequence[i];
            switch (e.type) {
                case EditType::Insert: {
                    const Line& line = b[static_cast<size_t>(e.b_index.value)];
                    hunk.lines.push_back({HunkLineKind::Add, line.text, !line.has_newline});
                    hunk.new_count++;
                } break;
                case EditType::Delete: {
                    const Line& line = a[static_cast<size_t>(e.a_index.value)];
                    hunk.lines.push_back({HunkLineKind::Remove, line.text, !line.has_newline});
                    hunk.original_count++;
                } break;
                case EditType::Common: {
                    const Line& line = a[static_cast<size_t>(e.a_index.value)];
                    hunk.lines.push_back({HunkLineKind::Context, line.text, !line.has_newline});
                    hunk.original_count++;
                    hunk.new_count++;
                } break;
            }
        }

        // A side without lines starts at the line before the change.
        hunk.original_start = hunk.original_count == 0 ? a_before : a_before + 1;
        hunk.new_start = hunk.new_count == 0 ? b_before : b_before + 1;

        hunks.push_back(std::move(hunk));
    }

    return hunks;
}
