#include "text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

using namespace patchy;

bool
patchy::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (const auto whitespace : whitespaces) {
        if (whitespace == c) {
            return c != '\0';
        }
    }
    return false;
}

bool
patchy::is_empty(const std::string& s) {
    for (char c : s) {
        if (!patchy::is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::string
patchy::trim_left(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && is_whitespace(s[start])) {
        start++;
    }
    return s.substr(start);
}

std::string
patchy::trim_right(const std::string& s) {
    std::size_t end = s.size();
    while (end > 0 && is_whitespace(s[end - 1])) {
        end--;
    }
    return s.substr(0, end);
}

std::string
patchy::trim(const std::string& s) {
    return trim_right(trim_left(s));
}

std::string
patchy::collapse_whitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    bool in_whitespace = false;
    for (char c : s) {
        if (is_whitespace(c)) {
            if (!in_whitespace) {
                result.push_back(' ');
            }
            in_whitespace = true;
        } else {
            result.push_back(c);
            in_whitespace = false;
        }
    }
    return result;
}

std::string
patchy::leading_whitespace(const std::string& s) {
    std::size_t end = 0;
    while (end < s.size() && (s[end] == ' ' || s[end] == '\t')) {
        end++;
    }
    return s.substr(0, end);
}

std::size_t
patchy::common_indentation(const std::vector<std::string>& lines) {
    std::size_t indent = std::numeric_limits<std::size_t>::max();
    for (const auto& line : lines) {
        if (is_empty(line)) {
            continue;
        }
        indent = std::min(indent, leading_whitespace(line).size());
    }
    return indent == std::numeric_limits<std::size_t>::max() ? 0 : indent;
}

std::string
patchy::remove_indentation(const std::string& line, std::size_t count) {
    std::size_t start = 0;
    while (start < count && start < line.size() && (line[start] == ' ' || line[start] == '\t')) {
        start++;
    }
    return line.substr(start);
}

std::string
patchy::escape_whitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    return result;
}

std::string
patchy::make_snippet(const std::string& s, std::size_t max_length) {
    if (s.size() <= max_length) {
        return s;
    }

    // Step back to the start of a code point.
    std::size_t end = max_length;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
        end--;
    }
    return fmt::format("{}...", s.substr(0, end));
}

int64_t
patchy::line_number_at(const std::string& text, std::size_t offset) {
    offset = std::min(offset, text.size());
    return 1 + std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n');
}
