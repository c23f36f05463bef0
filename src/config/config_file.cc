#include "config_file.hpp"

#include "util/text.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

using namespace patchy;

namespace {

std::pair<std::string, std::string>
split_path(std::string_view dotted_path) {
    auto dot = dotted_path.rfind('.');
    if (dot == std::string_view::npos) {
        return {"", std::string(dotted_path)};
    }
    return {std::string(dotted_path.substr(0, dot)), std::string(dotted_path.substr(dot + 1))};
}

// Everything from the first '#' that is not inside a quoted string.
std::string
strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == '\\') {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

bool
is_key_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool
is_key(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!is_key_char(c) && c != '.') {
            return false;
        }
    }
    return true;
}

// Parse a quoted string starting at `pos`; on success `pos` is left after the
// closing quote.
bool
parse_string(const std::string& s, std::size_t& pos, std::string& out, std::string& error) {
    const char quote = s[pos++];
    out.clear();
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == quote) {
            return true;
        }
        if (c == '\\' && pos < s.size()) {
            char e = s[pos++];
            switch (e) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += e;
                    break;
            }
            continue;
        }
        out += c;
    }
    error = "unterminated string";
    return false;
}

bool
parse_number(const std::string& s, ConfigValue& value) {
    if (s.empty()) {
        return false;
    }
    const char* begin = s.c_str();
    char* end = nullptr;

    const bool looks_float = s.find_first_of(".eE") != std::string::npos;
    errno = 0;
    if (looks_float) {
        double d = std::strtod(begin, &end);
        if (errno != 0 || end != begin + s.size()) {
            return false;
        }
        value.v = d;
    } else {
        long long i = std::strtoll(begin, &end, 10);
        if (errno != 0 || end != begin + s.size()) {
            return false;
        }
        value.v = static_cast<ConfigValue::Int>(i);
    }
    return true;
}

bool
parse_array(const std::string& s, ConfigValue& value, std::string& error) {
    ConfigValue::Array items;
    std::size_t pos = 1;
    bool expect_item = true;
    while (pos < s.size()) {
        char c = s[pos];
        if (is_whitespace(c)) {
            pos++;
        } else if (c == ']') {
            if (pos + 1 != s.size()) {
                error = "unexpected characters after array";
                return false;
            }
            value.v = std::move(items);
            return true;
        } else if ((c == '\'' || c == '"') && expect_item) {
            std::string item;
            if (!parse_string(s, pos, item, error)) {
                return false;
            }
            items.push_back(std::move(item));
            expect_item = false;
        } else if (c == ',' && !expect_item) {
            expect_item = true;
            pos++;
        } else {
            error = fmt::format("unexpected '{}' in array, only quoted strings are supported", c);
            return false;
        }
    }
    error = "unterminated array";
    return false;
}

bool
parse_value(const std::string& text, ConfigValue& value, std::string& error) {
    if (text.empty()) {
        error = "missing value";
        return false;
    }
    if (text == "true" || text == "false") {
        value.v = text == "true";
        return true;
    }
    if (text[0] == '\'' || text[0] == '"') {
        std::size_t pos = 0;
        std::string s;
        if (!parse_string(text, pos, s, error)) {
            return false;
        }
        if (pos != text.size()) {
            error = "unexpected characters after string";
            return false;
        }
        value.v = std::move(s);
        return true;
    }
    if (text[0] == '[') {
        return parse_array(text, value, error);
    }
    if (parse_number(text, value)) {
        return true;
    }
    error = fmt::format("invalid value '{}'", text);
    return false;
}

std::string
quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\'':
                out += "\\'";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out + "'";
}

}  // namespace

std::string
patchy::repr(const ConfigValue& value) {
    if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    } else if (value.is_float()) {
        auto s = fmt::format("{}", value.as_float());
        if (s.find_first_of(".eE") == std::string::npos) {
            s += ".0";
        }
        return s;
    } else if (value.is_string()) {
        return quote(value.as_string());
    }

    std::string out = "[";
    const auto& items = value.as_array();
    for (std::size_t i = 0; i < items.size(); i++) {
        out += i == 0 ? "" : ", ";
        out += quote(items[i]);
    }
    return out + "]";
}

std::optional<std::reference_wrapper<const ConfigValue>>
ConfigFile::lookup_value_by_path(std::string_view dotted_path) const {
    const auto [section_name, key] = split_path(dotted_path);
    for (const auto& s : sections) {
        if (s.name != section_name) {
            continue;
        }
        for (const auto& entry : s.entries) {
            if (entry.key == key) {
                return std::cref(entry.value);
            }
        }
    }
    return std::nullopt;
}

ConfigSection&
ConfigFile::section(const std::string& name) {
    for (auto& s : sections) {
        if (s.name == name) {
            return s;
        }
    }
    sections.push_back({name, {}, {}});
    return sections.back();
}

void
ConfigFile::set_value_at(std::string_view dotted_path, ConfigValue value) {
    const auto [section_name, key] = split_path(dotted_path);
    auto& s = section(section_name);
    for (auto& entry : s.entries) {
        if (entry.key == key) {
            entry.value = std::move(value);
            return;
        }
    }
    s.entries.push_back({key, std::move(value)});
}

bool
patchy::cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigFile& config) {
    config = ConfigFile{};
    result = ConfigParseResult{};

    std::string current_section;
    std::size_t line_number = 0;
    std::size_t start = 0;

    auto fail = [&](const std::string& message) {
        result.set_error(ConfigErrorKind::Parsing, fmt::format("line {}: {}", line_number, message));
        return false;
    };

    while (start <= input_data.size()) {
        auto end = input_data.find('\n', start);
        if (end == std::string::npos) {
            end = input_data.size();
        }
        line_number++;
        const std::string line = trim(strip_comment(input_data.substr(start, end - start)));
        start = end + 1;

        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return fail("expected ']' after section name");
            }
            current_section = trim(line.substr(1, line.size() - 2));
            if (!is_key(current_section)) {
                return fail(fmt::format("invalid section name '{}'", current_section));
            }
            config.section(current_section);
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            return fail(fmt::format("expected 'key = value', got '{}'", line));
        }
        const std::string key = trim(line.substr(0, eq));
        if (!is_key(key) || key.find('.') != std::string::npos) {
            return fail(fmt::format("invalid key '{}'", key));
        }

        ConfigValue value;
        std::string error;
        if (!parse_value(trim(line.substr(eq + 1)), value, error)) {
            return fail(fmt::format("{} for key '{}'", error, key));
        }

        const std::string path = current_section.empty() ? key : current_section + "." + key;
        if (config.lookup_value_by_path(path)) {
            return fail(fmt::format("duplicate key '{}'", path));
        }
        config.set_value_at(path, std::move(value));
    }

    return true;
}

bool
patchy::cfg_load_file(const std::string& file_path, ConfigParseResult& result, ConfigFile& config) {
    FILE* f = fopen(file_path.c_str(), "rb");
    if (!f) {
        result.set_error(ConfigErrorKind::File, fmt::format("could not open '{}': {}", file_path, strerror(errno)));
        return false;
    }

    std::string contents;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) {
        contents.append(buffer, n);
    }
    const bool read_error = ferror(f) != 0;
    fclose(f);

    if (read_error) {
        result.set_error(ConfigErrorKind::File, fmt::format("could not read '{}'", file_path));
        return false;
    }

    return cfg_parse(contents, result, config);
}

std::string
patchy::cfg_serialize(const ConfigFile& config) {
    std::string out;
    for (const auto& s : config.sections) {
        if (!out.empty()) {
            out += "\n";
        }
        for (const auto& comment : s.comments) {
            out += comment;
            if (comment.empty() || comment.back() != '\n') {
                out += '\n';
            }
        }
        if (!s.name.empty()) {
            out += fmt::format("[{}]\n", s.name);
        }
        for (const auto& entry : s.entries) {
            out += fmt::format("{} = {}\n", entry.key, repr(entry.value));
        }
    }
    return out;
}
