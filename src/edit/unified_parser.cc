#include "unified_parser.hpp"

#include "util/lines.hpp"
#include "util/text.hpp"

#include <fmt/format.h>

#include <cctype>
#include <limits>
#include <optional>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchy;

namespace {

// Larger line numbers or counts make the header malformed.
constexpr int64_t kMaxHeaderNumber = std::numeric_limits<int32_t>::max();

bool
starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

void
skip_spaces(const std::string& s, std::size_t& pos) {
    while (pos < s.size() && s[pos] == ' ') {
        pos++;
    }
}

bool
parse_number(const std::string& s, std::size_t& pos, int64_t& value) {
    if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
        return false;
    }
    value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        const int64_t digit = s[pos] - '0';
        if (value > (kMaxHeaderNumber - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
        pos++;
    }
    return true;
}

bool
parse_range(const std::string& s, std::size_t& pos, char sign, int64_t& start, int64_t& count) {
    skip_spaces(s, pos);
    if (pos >= s.size() || s[pos] != sign) {
        return false;
    }
    pos++;
    if (!parse_number(s, pos, start)) {
        return false;
    }
    count = 1;
    if (pos < s.size() && s[pos] == ',') {
        pos++;
        if (!parse_number(s, pos, count)) {
            return false;
        }
    }
    return true;
}

// "--- a/path\t2021-01-01 00:00:00" -> "a/path"
std::string
header_path(const std::string& line) {
    auto path = line.substr(4);
    auto tab = path.find('\t');
    if (tab != std::string::npos) {
        path = path.substr(0, tab);
    }
    return trim(path);
}

struct HunkBuilder {
    Hunk hunk;
    int64_t trailing_blank_lines = 0;

    int64_t
    old_count() const {
        int64_t count = 0;
        for (const auto& line : hunk.lines) {
            count += line.kind != HunkLineKind::Add ? 1 : 0;
        }
        return count;
    }

    int64_t
    new_count() const {
        int64_t count = 0;
        for (const auto& line : hunk.lines) {
            count += line.kind != HunkLineKind::Remove ? 1 : 0;
        }
        return count;
    }

    void
    add(HunkLineKind kind, std::string text, bool from_blank_line) {
        hunk.lines.push_back({kind, std::move(text), false});
        trailing_blank_lines = from_blank_line ? trailing_blank_lines + 1 : 0;
    }

    // Blank lines after the body are usually separators, not context. Drop
    // them as long as the body has more lines than the header declares.
    void
    finish(std::vector<std::string>& warnings) {
        while (trailing_blank_lines > 0 &&
               (old_count() > hunk.original_count || new_count() > hunk.new_count)) {
            hunk.lines.pop_back();
            trailing_blank_lines--;
        }

        auto old_lines = old_count();
        auto new_lines = new_count();
        if (old_lines != hunk.original_count) {
            warnings.push_back(fmt::format("hunk {}: header declares {} original line(s), body has {}",
                                           hunk.index + 1, hunk.original_count, old_lines));
        }
        if (new_lines != hunk.new_count) {
            warnings.push_back(fmt::format("hunk {}: header declares {} new line(s), body has {}",
                                           hunk.index + 1, hunk.new_count, new_lines));
        }
    }
};

}  // namespace

bool
patchy::parse_hunk_header(const std::string& line, Hunk& hunk) {
    if (!starts_with(line, "@@")) {
        return false;
    }

    std::size_t pos = 2;
    if (!parse_range(line, pos, '-', hunk.original_start, hunk.original_count)) {
        return false;
    }
    if (!parse_range(line, pos, '+', hunk.new_start, hunk.new_count)) {
        return false;
    }
    skip_spaces(line, pos);
    return line.compare(pos, 2, "@@") == 0;
}

bool
patchy::parse_unified_diff(const std::string& edit_text,
                           UnifiedDiff& diff,
                           std::vector<std::string>& warnings,
                           EditError& error) {
    diff = UnifiedDiff{};

    const auto lines = split_lines(normalize_line_endings(edit_text));

    std::vector<Hunk> hunks;
    std::vector<std::string> parse_warnings;
    std::optional<HunkBuilder> current;
    int64_t file_sections = 0;

    auto finish_hunk = [&]() {
        if (current) {
            current->finish(parse_warnings);
            hunks.push_back(std::move(current->hunk));
            current.reset();
        }
    };

    for (std::size_t i = 0; i < lines.size(); i++) {
        const auto& line = lines[i];
        TRACE("{:4} {} '{}'\n", i + 1, current ? "hunk" : "----", escape_whitespace(line));

        if (starts_with(line, "@@")) {
            finish_hunk();
            HunkBuilder builder;
            builder.hunk.index = static_cast<int64_t>(hunks.size());
            if (!parse_hunk_header(line, builder.hunk)) {
                error.set_error(EditErrorKind::Parse, builder.hunk.index,
                                fmt::format("hunk {} (line {}): malformed hunk header '{}'",
                                            builder.hunk.index + 1, i + 1, line));
                return false;
            }
            current = std::move(builder);
            continue;
        }

        // A removed line starting with "-- " looks like a file header; it is
        // one only when the current hunk has all the lines it declared.
        const bool hunk_complete = !current || (current->old_count() >= current->hunk.original_count &&
                                                current->new_count() >= current->hunk.new_count);
        if (hunk_complete && starts_with(line, "--- ") && i + 1 < lines.size() && starts_with(lines[i + 1], "+++ ")) {
            finish_hunk();
            file_sections++;
            if (file_sections == 1) {
                diff.old_path = header_path(line);
                diff.new_path = header_path(lines[i + 1]);
            }
            i++;
            continue;
        }

        if (!current) {
            continue;
        }

        if (line.empty()) {
            current->add(HunkLineKind::Context, "", true);
            continue;
        }

        switch (line[0]) {
            case ' ':
                current->add(HunkLineKind::Context, line.substr(1), false);
                break;
            case '+':
                current->add(HunkLineKind::Add, line.substr(1), false);
                break;
            case '-':
                current->add(HunkLineKind::Remove, line.substr(1), false);
                break;
            case '\\':
                if (!current->hunk.lines.empty()) {
                    current->hunk.lines.back().missing_newline = true;
                }
                break;
            default:
                finish_hunk();
                break;
        }
    }
    finish_hunk();

    if (hunks.empty()) {
        error.set_error(EditErrorKind::Parse, 0, "no hunks found in unified diff");
        return false;
    }

    if (file_sections > 1) {
        parse_warnings.push_back(
            fmt::format("diff has {} file sections; all hunks are applied to the same document", file_sections));
    }

    diff.hunks = std::move(hunks);
    warnings.insert(warnings.end(), parse_warnings.begin(), parse_warnings.end());
    return true;
}
