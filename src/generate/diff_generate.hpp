#pragma once

/*
    Produce edit text from two versions of a document.

    Both return an empty string when the documents are equal. The output is
    meant to be fed back to apply_auto.
*/

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

constexpr int64_t kDefaultContextLines = 3;

// Line diff grouped into hunks with `context_lines` unchanged lines around
// each change.
std::vector<Hunk>
diff_lines(const std::string& original, const std::string& modified, int64_t context_lines);

// One block per hunk. Context is widened until every search text picks out
// exactly the region it was cut from.
std::vector<EditBlock>
search_replace_blocks(const std::string& original,
                      const std::string& modified,
                      int64_t context_lines = kDefaultContextLines);

std::string
create_search_replace_diff(const std::string& original,
                           const std::string& modified,
                           int64_t context_lines = kDefaultContextLines);

std::string
create_unified_diff(const std::string& original,
                    const std::string& modified,
                    const std::string& old_name,
                    const std::string& new_name,
                    int64_t context_lines = kDefaultContextLines);

}  // namespace patchy
