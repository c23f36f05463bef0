#pragma once

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

// Apply blocks one after another; each block is matched against the content
// the previous blocks produced.
ApplyOutcome
apply_search_replace_blocks(const std::string& content,
                            const std::vector<EditBlock>& blocks,
                            const ApplyOptions& options);

// When a block matched text indented differently from its search text, shift
// the replacement by the same change of indentation.
std::string
reindent_replacement(const std::string& replace_text, const std::string& search_text, const std::string& matched_text);

}  // namespace patchy
