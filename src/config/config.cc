#include "config.hpp"

#include "util/log.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace patchy;

static std::string config_doc_general = R"foo(# Configuration for `patchy`
#
# Default options. These can be overridden with command-line arguments.
#
#   general.format            'auto', 'search-replace' or 'unified'
#   general.strict            apply all edits or none of them
#   general.telemetry         report which strategy matched each edit
#   general.context_lines     context lines when generating edits
#   matching.strategies       tried in order; any of 'exact', 'line_trimmed',
#                             'whitespace_normalized', 'indentation_agnostic',
#                             'fuzzy'
#   matching.fuzzy_threshold  minimum similarity for a fuzzy match, 0 to 1
#   matching.max_fuzz         context lines a diff hunk may get wrong
#   output.color              color the report when writing to a terminal
#   output.log_level          'error', 'warning', 'info', 'debug' or 'trace'
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    Float,
    String,
    StringArray,
};

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

static void
config_save(const std::string& config_root, const std::string& config_path, const ConfigFile& config) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        LOG_WARNING("could not create '{}': {}", config_root, ec.message());
        return;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        LOG_WARNING("failed to open '{}' for writing: {}", config_path, strerror(errno));
        return;
    }

    std::string serialized = cfg_serialize(config);
    if (fwrite(serialized.c_str(), 1, serialized.size(), f) != serialized.size()) {
        LOG_WARNING("failed to write '{}'", config_path);
    }
    fclose(f);
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static int64_t
config_sync(ConfigFile& config, const OptionVector& options) {
    int64_t added = 0;
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored = config.lookup_value_by_path(path); stored) {
            // Yes. So we take the value and write it into our settings struct.
            const ConfigValue& value = stored->get();
            bool type_ok = true;
            switch (type) {
                case ConfigVariableType::Bool: {
                    if ((type_ok = value.is_bool()))
                        *static_cast<bool*>(ptr) = value.as_bool();
                } break;
                case ConfigVariableType::Int: {
                    if ((type_ok = value.is_int()))
                        *static_cast<int64_t*>(ptr) = value.as_int();
                } break;
                case ConfigVariableType::Float: {
                    if (value.is_float())
                        *static_cast<double*>(ptr) = value.as_float();
                    else if ((type_ok = value.is_int()))
                        *static_cast<double*>(ptr) = static_cast<double>(value.as_int());
                } break;
                case ConfigVariableType::String: {
                    if ((type_ok = value.is_string()))
                        *static_cast<std::string*>(ptr) = value.as_string();
                } break;
                case ConfigVariableType::StringArray: {
                    if ((type_ok = value.is_array()))
                        *static_cast<std::vector<std::string>*>(ptr) = value.as_array();
                } break;
            }
            if (!type_ok) {
                LOG_WARNING("config: ignoring '{}' = {}, unexpected type", path, repr(value));
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            ConfigValue value;
            switch (type) {
                case ConfigVariableType::Bool:
                    value.v = *static_cast<bool*>(ptr);
                    break;
                case ConfigVariableType::Int:
                    value.v = *static_cast<int64_t*>(ptr);
                    break;
                case ConfigVariableType::Float:
                    value.v = *static_cast<double*>(ptr);
                    break;
                case ConfigVariableType::String:
                    value.v = *static_cast<std::string*>(ptr);
                    break;
                case ConfigVariableType::StringArray:
                    value.v = *static_cast<std::vector<std::string>*>(ptr);
                    break;
            }
            config.set_value_at(path, std::move(value));
            added++;
        }
    }
    return added;
}

int64_t
patchy::config_sync_options(ConfigFile& config, ProgramOptions& program_options) {
    // clang-format off
    const OptionVector options = {
        { "general.format",           ConfigVariableType::String,      &program_options.format },
        { "general.strict",           ConfigVariableType::Bool,        &program_options.strict },
        { "general.telemetry",        ConfigVariableType::Bool,        &program_options.telemetry },
        { "general.context_lines",    ConfigVariableType::Int,         &program_options.context_lines },
        { "matching.strategies",      ConfigVariableType::StringArray, &program_options.strategies },
        { "matching.fuzzy_threshold", ConfigVariableType::Float,       &program_options.fuzzy_threshold },
        { "matching.max_fuzz",        ConfigVariableType::Int,         &program_options.max_fuzz },
        { "output.color",             ConfigVariableType::Bool,        &program_options.color },
        { "output.log_level",         ConfigVariableType::String,      &program_options.log_level },
    };
    // clang-format on

    return config_sync(config, options);
}

void
patchy::config_apply_options(ProgramOptions& program_options, const std::string& config_root) {
    const std::string config_file_name = "patchy.conf";
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ConfigParseResult parse_result;
    ConfigFile config;
    if (!cfg_load_file(config_path, parse_result, config)) {
        if (parse_result.kind == ConfigErrorKind::File) {
            LOG_INFO("could not find default config, creating file: {}", config_path);
            flush_config_to_disk = true;
        } else {
            LOG_ERROR("{}\n\twhile parsing: {}", parse_result.error, config_path);
            config = ConfigFile{};
        }
    }

    config_sync_options(config, program_options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config.section("general").comments.push_back(config_doc_general);
        config_save(config_root, config_path, config);
    }
}

bool
patchy::config_make_apply_options(const ProgramOptions& program_options,
                                  ApplyOptions& apply_options,
                                  std::string& error) {
    apply_options = ApplyOptions{};
    apply_options.strict = program_options.strict;
    apply_options.enable_telemetry = program_options.telemetry;
    apply_options.fuzzy_threshold = program_options.fuzzy_threshold;
    apply_options.max_fuzz = program_options.max_fuzz;

    apply_options.matching_strategies.clear();
    for (const auto& name : program_options.strategies) {
        auto strategy = match_strategy_from_string(name);
        if (!strategy) {
            error = fmt::format("unknown matching strategy '{}'", name);
            return false;
        }
        apply_options.matching_strategies.push_back(*strategy);
    }
    return true;
}
