#include "validate.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("validate_edit") {
    ValidationReport report;

    SUBCASE("valid_blocks") {
        REQUIRE(validate_edit("<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE\n"
                              "<<<<<<< SEARCH\nc\n=======\nc\n>>>>>>> REPLACE\n",
                              report));
        CHECK(report.valid);
        REQUIRE(report.format);
        CHECK(*report.format == EditFormat::SearchReplace);
        CHECK(report.unit_count == 2);
        REQUIRE(report.warnings.size() == 1);
        CHECK(report.warnings[0].find("block 2") != std::string::npos);
    }

    SUBCASE("valid_diff") {
        REQUIRE(validate_edit("@@ -1 +1 @@\n-a\n+b\n", report));
        CHECK(*report.format == EditFormat::Unified);
        CHECK(report.unit_count == 1);
        CHECK(report.warnings.empty());
    }

    SUBCASE("context_only_hunk") {
        REQUIRE(validate_edit("@@ -1 +1 @@\n a\n", report));
        REQUIRE(report.warnings.size() == 1);
        CHECK(report.warnings[0].find("no added or removed") != std::string::npos);
    }

    SUBCASE("parse_error") {
        CHECK_FALSE(validate_edit("<<<<<<< SEARCH\na\n>>>>>>> REPLACE\n", report));
        CHECK_FALSE(report.valid);
        CHECK(report.error.kind == EditErrorKind::Parse);
    }

    SUBCASE("unknown_format") {
        CHECK_FALSE(validate_edit("hello\n", report));
        CHECK_FALSE(report.format);
        CHECK(report.error.kind == EditErrorKind::UnknownFormat);
    }
}
