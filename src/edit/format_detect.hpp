#pragma once

#include "edit/types.hpp"

#include <string>

namespace patchy {

// Classify edit text by its markers. Search/replace markers win over unified
// headers. Returns false when neither dialect is recognized.
bool
detect_format(const std::string& edit_text, EditFormat& format);

}  // namespace patchy
