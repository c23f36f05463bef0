#pragma once

/*
    Whitespace helpers shared by the matching strategies and the appliers.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

bool
is_whitespace(char c);

// Only whitespace, or nothing at all.
bool
is_empty(const std::string& s);

std::string
trim_left(const std::string& s);

std::string
trim_right(const std::string& s);

std::string
trim(const std::string& s);

// Replace every run of whitespace with a single space.
std::string
collapse_whitespace(const std::string& s);

// The leading spaces and tabs of `s`.
std::string
leading_whitespace(const std::string& s);

// Smallest indentation among the non-empty lines. Zero when all are empty.
std::size_t
common_indentation(const std::vector<std::string>& lines);

// Drop up to `count` leading whitespace characters.
std::string
remove_indentation(const std::string& line, std::size_t count);

// Show control characters; used for diagnostics and debug logging.
std::string
escape_whitespace(const std::string& s);

// A bounded excerpt of `s` for error reports. Never cuts a UTF-8 sequence.
std::string
make_snippet(const std::string& s, std::size_t max_length = 120);

// 1-based line number of a byte offset.
int64_t
line_number_at(const std::string& text, std::size_t offset);

}  // namespace patchy
