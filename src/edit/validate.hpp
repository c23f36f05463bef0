#pragma once

/*
    Check edit text without applying it.
*/

#include "edit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchy {

struct ValidationReport {
    bool valid = false;
    std::optional<EditFormat> format;
    int64_t unit_count = 0;
    std::vector<std::string> warnings;
    EditError error;
};

bool
validate_edit(const std::string& edit_text, ValidationReport& report);

}  // namespace patchy
