#include "format_detect.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("detect_format") {
    EditFormat format;

    SUBCASE("search_replace") {
        const std::string edit = "Some explanation.\n<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE\n";
        REQUIRE(detect_format(edit, format));
        CHECK(format == EditFormat::SearchReplace);
    }

    SUBCASE("unified") {
        REQUIRE(detect_format("--- a/x\n+++ b/x\n@@ -1 +1 @@\n-a\n+b\n", format));
        CHECK(format == EditFormat::Unified);

        REQUIRE(detect_format("@@ -1 +1 @@\n-a\n+b\n", format));
        CHECK(format == EditFormat::Unified);
    }

    SUBCASE("search_replace_wins_over_diff_lines") {
        // A block that replaces diff text still is a search/replace edit.
        const std::string edit = "<<<<<<< SEARCH\n@@ -1 +1 @@\n=======\n--- a\n>>>>>>> REPLACE\n";
        REQUIRE(detect_format(edit, format));
        CHECK(format == EditFormat::SearchReplace);
    }

    SUBCASE("unknown") {
        CHECK_FALSE(detect_format("just some prose\n", format));
        CHECK_FALSE(detect_format("", format));
        CHECK_FALSE(detect_format("<<<<<<< SEARCH\nno end marker\n", format));
    }
}
