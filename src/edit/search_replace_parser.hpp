#pragma once

/*
    Search/replace edit dialect:

        <<<<<<< SEARCH
        text to find
        =======
        text to put there instead
        >>>>>>> REPLACE

    Any number of blocks, applied in the order they appear. Lines outside of
    blocks (explanations, code fences) are ignored.
*/

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

constexpr char kSearchMarker[] = "<<<<<<< SEARCH";
constexpr char kSeparatorMarker[] = "=======";
constexpr char kReplaceMarker[] = ">>>>>>> REPLACE";

// Either every block is parsed, or `blocks` is left empty and `error` tells
// which block broke the grammar.
bool
parse_search_replace(const std::string& edit_text, std::vector<EditBlock>& blocks, EditError& error);

std::string
render_search_replace(const std::vector<EditBlock>& blocks);

}  // namespace patchy
