#pragma once

/*
    Split document text into lines.

    Every line remembers where it starts in the source text so that line based
    matches can be mapped back to byte offsets. The newline is not part of
    `text`; `has_newline` tells whether one followed.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

struct Line {
    uint32_t line_number;
    uint32_t checksum;

    std::string text;

    std::size_t offset;
    bool has_newline;

    // Number of leading space and tab characters.
    int indentation;

    uint32_t
    hash() const {
        return checksum;
    }

    // Byte offset one past the end of the line, newline included.
    std::size_t
    end_offset() const {
        return offset + text.size() + (has_newline ? 1 : 0);
    }

    bool
    operator<(const Line& other) const {
        return checksum < other.checksum;
    }

    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && has_newline == other.has_newline && text == other.text;
    }
};

enum class LineEnding {
    LF,
    CRLF,
};

bool
parselines(const std::string& input_text, std::vector<Line>& lines);

// Lines without their newline. `trailing_newline` is set when the last line
// was terminated.
std::vector<std::string>
split_lines(const std::string& input_text, bool* trailing_newline = nullptr);

std::string
join_lines(const std::vector<std::string>& lines, bool trailing_newline);

// The most common line ending in `text`; LF on a tie or when there are none.
LineEnding
detect_line_ending(const std::string& text);

// CRLF to LF. Lone CR characters are left alone.
std::string
normalize_line_endings(const std::string& text);

std::string
restore_line_endings(const std::string& text, LineEnding ending);

std::string
repr(LineEnding ending);

}  // namespace patchy
