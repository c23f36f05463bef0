#include "search_replace_parser.hpp"

#include "util/lines.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchy;

namespace {

enum class State {
    Outside,
    InSearch,
    InReplace,
};

std::string
repr(State s) {
    switch (s) {
        case State::Outside:
            return "Outside";
        case State::InSearch:
            return "InSearch";
        case State::InReplace:
            return "InReplace";
    }
    return "?";
}

bool
is_marker(const std::string& line, const char* marker) {
    return trim_right(line) == marker;
}

}  // namespace

bool
patchy::parse_search_replace(const std::string& edit_text, std::vector<EditBlock>& blocks, EditError& error) {
    blocks.clear();

    const auto lines = split_lines(normalize_line_endings(edit_text));

    std::vector<EditBlock> parsed;
    State state = State::Outside;
    EditBlock current;
    int64_t marker_line = 0;

    auto fail = [&](const std::string& message) {
        error.set_error(EditErrorKind::Parse, current.index,
                        fmt::format("block {} (line {}): {}", current.index + 1, marker_line, message));
        return false;
    };

    for (std::size_t i = 0; i < lines.size(); i++) {
        const auto& line = lines[i];
        TRACE("{:4} {:<10} '{}'\n", i + 1, repr(state), escape_whitespace(line));

        switch (state) {
            case State::Outside: {
                if (is_marker(line, kSearchMarker)) {
                    current = EditBlock{};
                    current.index = static_cast<int64_t>(parsed.size());
                    marker_line = static_cast<int64_t>(i) + 1;
                    state = State::InSearch;
                }
            } break;
            case State::InSearch: {
                if (is_marker(line, kSeparatorMarker)) {
                    state = State::InReplace;
                } else if (is_marker(line, kSearchMarker) || is_marker(line, kReplaceMarker)) {
                    return fail(fmt::format("missing '{}' separator", kSeparatorMarker));
                } else {
                    current.search_text += line;
                    current.search_text += '\n';
                }
            } break;
            case State::InReplace: {
                if (is_marker(line, kReplaceMarker)) {
                    parsed.push_back(std::move(current));
                    current = EditBlock{};
                    state = State::Outside;
                } else if (is_marker(line, kSearchMarker) || is_marker(line, kSeparatorMarker)) {
                    return fail(fmt::format("missing '{}' end marker", kReplaceMarker));
                } else {
                    current.replace_text += line;
                    current.replace_text += '\n';
                }
            } break;
        }
    }

    if (state == State::InSearch) {
        return fail(fmt::format("missing '{}' separator", kSeparatorMarker));
    } else if (state == State::InReplace) {
        return fail(fmt::format("missing '{}' end marker", kReplaceMarker));
    }

    if (parsed.empty()) {
        error.set_error(EditErrorKind::Parse, 0, "no search/replace blocks found");
        return false;
    }

    blocks = std::move(parsed);
    return true;
}

std::string
patchy::render_search_replace(const std::vector<EditBlock>& blocks) {
    auto terminated = [](const std::string& text) {
        if (text.empty() || text.back() == '\n') {
            return text;
        }
        return text + "\n";
    };

    std::string result;
    for (const auto& block : blocks) {
        result += fmt::format("{}\n{}{}\n{}{}\n", kSearchMarker, terminated(block.search_text), kSeparatorMarker,
                              terminated(block.replace_text), kReplaceMarker);
    }
    return result;
}
