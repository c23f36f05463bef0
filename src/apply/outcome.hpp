#pragma once

#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

// "block" or "hunk"; used in every message about a unit.
struct UnitNames {
    const char* singular;
    const char* plural;
};

constexpr UnitNames kBlockNames{"block", "blocks"};
constexpr UnitNames kHunkNames{"hunk", "hunks"};

void
record_failure(ApplyOutcome& outcome,
               const UnitNames& names,
               int64_t index,
               const std::string& reason,
               const std::string& unit_text);

// Strict mode: throw away everything applied so far and report every unit as
// failed. `unit_texts` holds the text each unit searched for.
void
abort_strict(ApplyOutcome& outcome,
             const UnitNames& names,
             const std::string& original_content,
             int64_t failed_index,
             const std::vector<std::string>& unit_texts);

}  // namespace patchy
