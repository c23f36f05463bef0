#include "lines.hpp"

#include "util/hash.hpp"

#include <string>
#include <vector>

namespace internal {

struct LineParserState {
    explicit LineParserState(const std::string& source)
        : source(source) {
    }

    const std::string& source;
    std::size_t pos = 0;

    int indentation = 0;
    bool has_newline = false;

    bool
    done() const {
        return pos >= source.size();
    }
};

bool
getline(LineParserState& s, std::string& line) {
    line.clear();
    if (s.done()) {
        return false;
    }

    s.indentation = 0;
    s.has_newline = false;
    bool count_whitespace = true;

    while (!s.done()) {
        char c = s.source[s.pos++];
        if (c == '\n') {
            s.has_newline = true;
            break;
        }

        if (count_whitespace && (c == ' ' || c == '\t')) {
            s.indentation++;
        } else {
            count_whitespace = false;
        }

        line.push_back(c);
    }

    return true;
}

}  // namespace internal

bool
patchy::parselines(const std::string& input_text, std::vector<Line>& lines) {
    lines.clear();

    internal::LineParserState state{input_text};
    std::string line;
    uint32_t line_number = 1;
    std::size_t offset = 0;
    while (internal::getline(state, line)) {
        uint32_t checksum = hash::hash(line);
        auto length = line.size();
        lines.push_back({line_number, checksum, std::move(line), offset, state.has_newline, state.indentation});
        offset += length + (state.has_newline ? 1 : 0);
        line_number++;
    }

    return true;
}

std::vector<std::string>
patchy::split_lines(const std::string& input_text, bool* trailing_newline) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < input_text.size()) {
        auto end = input_text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(input_text.substr(start));
            break;
        }
        lines.push_back(input_text.substr(start, end - start));
        start = end + 1;
    }

    if (trailing_newline) {
        *trailing_newline = !input_text.empty() && input_text.back() == '\n';
    }
    return lines;
}

std::string
patchy::join_lines(const std::vector<std::string>& lines, bool trailing_newline) {
    std::string result;
    for (std::size_t i = 0; i < lines.size(); i++) {
        result += lines[i];
        if (i + 1 < lines.size() || trailing_newline) {
            result += '\n';
        }
    }
    return result;
}

patchy::LineEnding
patchy::detect_line_ending(const std::string& text) {
    int64_t crlf_count = 0;
    int64_t lf_count = 0;
    for (std::size_t i = 0; i < text.size(); i++) {
        if (text[i] != '\n') {
            continue;
        }
        if (i > 0 && text[i - 1] == '\r') {
            crlf_count++;
        } else {
            lf_count++;
        }
    }
    return crlf_count > lf_count ? LineEnding::CRLF : LineEnding::LF;
}

std::string
patchy::normalize_line_endings(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        result.push_back(text[i]);
    }
    return result;
}

std::string
patchy::restore_line_endings(const std::string& text, LineEnding ending) {
    if (ending == LineEnding::LF) {
        return text;
    }

    std::string result;
    result.reserve(text.size() + text.size() / 16);
    for (char c : text) {
        if (c == '\n') {
            result.push_back('\r');
        }
        result.push_back(c);
    }
    return result;
}

std::string
patchy::repr(LineEnding ending) {
    switch (ending) {
        case LineEnding::LF:
            return "LF";
        case LineEnding::CRLF:
            return "CRLF";
    }
    return "unknown";
}
