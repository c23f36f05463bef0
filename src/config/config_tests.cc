#include "config.hpp"

#include <doctest.h>

#include <filesystem>
#include <fstream>

using namespace patchy;

namespace fs = std::filesystem;

TEST_CASE("config_sync_options") {
    ConfigFile config;
    ConfigParseResult result;
    REQUIRE(cfg_parse("[general]\nstrict = true\n[matching]\nfuzzy_threshold = 1\nmax_fuzz = 'two'\n", result,
                      config));

    ProgramOptions options;
    const auto added = config_sync_options(config, options);
    CHECK(options.strict);
    CHECK(options.fuzzy_threshold == doctest::Approx(1.0));
    CHECK(options.max_fuzz == 2);

    // Everything that was not in the file is added with its default.
    CHECK(added == 6);
    auto strategies = config.lookup_value_by_path("matching.strategies");
    REQUIRE(strategies);
    CHECK(strategies->get().as_array().size() == 5);
    CHECK(config.lookup_value_by_path("output.log_level")->get().as_string() == "warning");
}

TEST_CASE("config_apply_options") {
    const auto root = fs::temp_directory_path() / "patchy-config-tests";
    fs::remove_all(root);

    SUBCASE("creates_default_file") {
        ProgramOptions options;
        config_apply_options(options, root.string());

        const auto path = root / "patchy.conf";
        REQUIRE(fs::exists(path));

        ConfigFile config;
        ConfigParseResult result;
        REQUIRE(cfg_load_file(path.string(), result, config));
        CHECK(config.lookup_value_by_path("general.format")->get().as_string() == "auto");
        CHECK(config.lookup_value_by_path("matching.max_fuzz")->get().as_int() == 2);
    }

    SUBCASE("reads_existing_file") {
        fs::create_directories(root);
        std::ofstream(root / "patchy.conf") << "[matching]\nstrategies = ['exact']\n[general]\ntelemetry = true\n";

        ProgramOptions options;
        config_apply_options(options, root.string());
        CHECK(options.telemetry);
        CHECK(options.strategies == std::vector<std::string>{"exact"});
    }

    SUBCASE("broken_file_keeps_defaults") {
        fs::create_directories(root);
        std::ofstream(root / "patchy.conf") << "[general]\nstrict = \n";

        ProgramOptions options;
        config_apply_options(options, root.string());
        CHECK_FALSE(options.strict);
        CHECK(options.format == "auto");
    }

    fs::remove_all(root);
}

TEST_CASE("config_make_apply_options") {
    ProgramOptions program_options;
    program_options.strict = true;
    program_options.strategies = {"exact", "indent"};
    program_options.fuzzy_threshold = 0.9;

    ApplyOptions apply_options;
    std::string error;
    REQUIRE(config_make_apply_options(program_options, apply_options, error));
    CHECK(apply_options.strict);
    CHECK(apply_options.fuzzy_threshold == doctest::Approx(0.9));
    CHECK(apply_options.matching_strategies ==
          std::vector<MatchStrategy>{MatchStrategy::Exact, MatchStrategy::IndentationAgnostic});

    program_options.strategies = {"exact", "psychic"};
    CHECK_FALSE(config_make_apply_options(program_options, apply_options, error));
    CHECK(error.find("psychic") != std::string::npos);
}
