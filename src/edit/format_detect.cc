#include "format_detect.hpp"

#include "edit/search_replace_parser.hpp"
#include "util/lines.hpp"

using namespace patchy;

namespace {

bool
starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool
has_unified_headers(const std::string& edit_text) {
    for (const auto& line : split_lines(normalize_line_endings(edit_text))) {
        if (starts_with(line, "@@") || starts_with(line, "--- ") || starts_with(line, "+++ ")) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool
patchy::detect_format(const std::string& edit_text, EditFormat& format) {
    if (edit_text.find(kSearchMarker) != std::string::npos &&
        edit_text.find(kReplaceMarker) != std::string::npos) {
        format = EditFormat::SearchReplace;
        return true;
    }

    if (has_unified_headers(edit_text)) {
        format = EditFormat::Unified;
        return true;
    }

    return false;
}
