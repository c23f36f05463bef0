#pragma once

#include "config/config_file.hpp"
#include "edit/types.hpp"

#include <string>
#include <vector>

namespace patchy {

struct ProgramOptions {
    bool help = false;
    bool version = false;
    bool check = false;
    bool in_place = false;
    bool unified_output = false;

    // Settings below can be given defaults in the configuration file.
    bool strict = false;
    bool telemetry = false;
    bool color = true;
    std::string format = "auto";
    std::vector<std::string> strategies = {"exact", "line_trimmed", "whitespace_normalized", "indentation_agnostic",
                                           "fuzzy"};
    double fuzzy_threshold = 0.8;
    int64_t max_fuzz = 2;
    int64_t context_lines = 3;
    std::string log_level = "warning";

    // -v and -q on the command line.
    int64_t verbosity = 0;

    std::string document_file;
    std::string edit_file;
    std::string modified_file;
    std::string output_file;
};

std::string
config_get_directory();

// Read defaults from `patchy.conf` in `config_root`. The file is created with
// every default written out if it does not exist.
void
config_apply_options(ProgramOptions& program_options, const std::string& config_root = config_get_directory());

// Copy the values `config` has into `program_options` and add the ones it is
// missing to `config`. Returns the number of values added.
int64_t
config_sync_options(ConfigFile& config, ProgramOptions& program_options);

bool
config_make_apply_options(const ProgramOptions& program_options, ApplyOptions& apply_options, std::string& error);

}  // namespace patchy
