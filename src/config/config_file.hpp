#pragma once

/*
    Configuration file format.

    INI with typed values:

        # comment
        [section]
        key = true
        other_key = 0.8
        name = 'text'
        list = ['a', 'b']

    Values are bools, integers, floats, quoted strings and arrays of strings.
    A value is addressed by its dotted path, "section.key". Keys before the
    first section header have no section and are addressed by the key alone.
*/

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace patchy {

struct ConfigValue {
    using Bool = bool;
    using Int = int64_t;
    using Float = double;
    using String = std::string;
    using Array = std::vector<std::string>;

    std::variant<Bool, Int, Float, String, Array> v;

    // clang-format off
    bool is_bool() const { return std::holds_alternative<Bool>(v); }
    bool is_int() const { return std::holds_alternative<Int>(v); }
    bool is_float() const { return std::holds_alternative<Float>(v); }
    bool is_string() const { return std::holds_alternative<String>(v); }
    bool is_array() const { return std::holds_alternative<Array>(v); }

    const Bool& as_bool() const { return std::get<Bool>(v); }
    const Int& as_int() const { return std::get<Int>(v); }
    const Float& as_float() const { return std::get<Float>(v); }
    const String& as_string() const { return std::get<String>(v); }
    const Array& as_array() const { return std::get<Array>(v); }
    // clang-format on
};

std::string
repr(const ConfigValue& value);

struct ConfigEntry {
    std::string key;
    ConfigValue value;
};

struct ConfigSection {
    std::string name;
    std::vector<ConfigEntry> entries;

    // Written above the section header when serialized.
    std::vector<std::string> comments;
};

struct ConfigFile {
    std::vector<ConfigSection> sections;

    // Find a value using e.g. "matching.fuzzy_threshold"
    std::optional<std::reference_wrapper<const ConfigValue>>
    lookup_value_by_path(std::string_view dotted_path) const;

    // Replaces an existing value; the section is created if needed.
    void
    set_value_at(std::string_view dotted_path, ConfigValue value);

    ConfigSection&
    section(const std::string& name);
};

// clang-format off
enum class ConfigErrorKind {
    None    = 1 << 0,
    File    = 1 << 1,
    Parsing = 1 << 2,
};
// clang-format on

struct ConfigParseResult {
    ConfigErrorKind kind = ConfigErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ConfigErrorKind::None;
    }

    void
    set_error(ConfigErrorKind error_kind, std::string error_message) {
        kind = error_kind;
        error = std::move(error_message);
    }
};

bool
cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigFile& config);

bool
cfg_load_file(const std::string& file_path, ConfigParseResult& result, ConfigFile& config);

std::string
cfg_serialize(const ConfigFile& config);

}  // namespace patchy
