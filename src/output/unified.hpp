#pragma once

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

// Render hunks as unified diff text, "--- "/"+++ " header included. Hunks
// without lines are skipped.
std::string
unified_diff_render(const std::vector<Hunk>& hunks, const std::string& old_name, const std::string& new_name);

}  // namespace patchy
