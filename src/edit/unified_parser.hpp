#pragma once

/*
    Unified diff dialect.

    Hunk headers are validated against the hunk bodies, but a disagreement is
    only reported as a warning: headers written by hand (or by a model) are
    frequently off by a line or two. The appliers rely on the body lines.
*/

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

// Parse "@@ -a[,b] +c[,d] @@ ...". An omitted count means 1.
bool
parse_hunk_header(const std::string& line, Hunk& hunk);

bool
parse_unified_diff(const std::string& edit_text,
                   UnifiedDiff& diff,
                   std::vector<std::string>& warnings,
                   EditError& error);

}  // namespace patchy
