#include "unified_apply.hpp"

#include "edit/unified_parser.hpp"

#include <doctest.h>

using namespace patchy;

namespace {

std::vector<Hunk>
hunks_of(const std::string& diff_text) {
    UnifiedDiff diff;
    std::vector<std::string> warnings;
    EditError error;
    REQUIRE(parse_unified_diff(diff_text, diff, warnings, error));
    return diff.hunks;
}

}  // namespace

TEST_CASE("apply_unified_hunks") {
    ApplyOptions options;

    SUBCASE("declared_position") {
        auto hunks = hunks_of("@@ -1,3 +1,3 @@\n function add(a, b) {\n-  return a - b;\n+  return a + b;\n }\n");
        auto outcome = apply_unified_hunks("function add(a, b) {\n  return a - b;\n}\n", hunks, options);
        CHECK(outcome.content == "function add(a, b) {\n  return a + b;\n}\n");
        CHECK(outcome.blocks_applied == 1);
        CHECK(outcome.warnings.empty());
    }

    SUBCASE("drifted_by_inserted_line") {
        auto hunks = hunks_of("@@ -2,3 +2,3 @@\n line2\n-target\n+changed\n line4\n");
        auto outcome = apply_unified_hunks("line1\n\nline2\ntarget\nline4\n", hunks, options);
        CHECK(outcome.content == "line1\n\nline2\nchanged\nline4\n");
        CHECK(outcome.blocks_applied == 1);
        REQUIRE(outcome.warnings.size() == 1);
        CHECK(outcome.warnings[0] == "hunk 1: applied at line 3 (offset 1 line)");
    }

    SUBCASE("header_far_off") {
        auto hunks = hunks_of("@@ -50,2 +50,2 @@\n b\n-c\n+C\n");
        auto outcome = apply_unified_hunks("a\nb\nc\nd\n", hunks, options);
        CHECK(outcome.content == "a\nb\nC\nd\n");
    }

    SUBCASE("later_hunks_follow_earlier_line_changes") {
        std::string content;
        for (int i = 1; i <= 10; i++) {
            content += std::to_string(i) + "\n";
        }
        auto hunks = hunks_of("@@ -2 +2,3 @@\n-2\n+2a\n+2b\n+2c\n@@ -8 +10 @@\n-8\n+eight\n");
        auto outcome = apply_unified_hunks(content, hunks, options);
        CHECK(outcome.content == "1\n2a\n2b\n2c\n3\n4\n5\n6\n7\neight\n9\n10\n");
        CHECK(outcome.warnings.empty());
    }

    SUBCASE("pure_insertion") {
        auto hunks = hunks_of("@@ -1,0 +2 @@\n+inserted\n");
        auto outcome = apply_unified_hunks("a\nb\n", hunks, options);
        CHECK(outcome.content == "a\ninserted\nb\n");
    }

    SUBCASE("empty_document") {
        auto hunks = hunks_of("@@ -0,0 +1,2 @@\n+x\n+y\n");
        auto outcome = apply_unified_hunks("", hunks, options);
        CHECK(outcome.content == "x\ny\n");
    }

    SUBCASE("whitespace_differences") {
        auto hunks = hunks_of("@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n");
        options.enable_telemetry = true;
        auto outcome = apply_unified_hunks("a  \nb\n\tc\n", hunks, options);
        CHECK(outcome.content == "a  \nB\n\tc\n");
        REQUIRE(outcome.warnings.size() == 1);
        CHECK(outcome.warnings[0].find("ignoring whitespace") != std::string::npos);
        REQUIRE(outcome.telemetry.size() == 1);
        CHECK(outcome.telemetry[0].strategy == MatchStrategy::LineTrimmed);
    }

    const std::string fuzzed_hunk = "@@ -1,5 +1,5 @@\n a\n b\n-c\n+C\n d\n e\n";

    SUBCASE("fuzz_tolerates_context") {
        options.enable_telemetry = true;
        auto outcome = apply_unified_hunks("a\nB!\nc\nd\ne\n", hunks_of(fuzzed_hunk), options);
        CHECK(outcome.content == "a\nB!\nC\nd\ne\n");
        REQUIRE(outcome.warnings.size() == 1);
        CHECK(outcome.warnings[0] == "hunk 1: applied at line 1 with fuzz 1");
        REQUIRE(outcome.telemetry.size() == 1);
        CHECK(outcome.telemetry[0].strategy == MatchStrategy::Fuzzy);
        CHECK(outcome.telemetry[0].confidence == doctest::Approx(0.8));
    }

    SUBCASE("fuzz_disabled") {
        options.max_fuzz = 0;
        auto outcome = apply_unified_hunks("a\nB!\nc\nd\ne\n", hunks_of(fuzzed_hunk), options);
        CHECK(outcome.content == "a\nB!\nc\nd\ne\n");
        CHECK(outcome.blocks_failed == 1);
    }

    SUBCASE("removed_lines_must_match") {
        auto outcome = apply_unified_hunks("a\nb\nX\nd\ne\n", hunks_of(fuzzed_hunk), options);
        CHECK(outcome.blocks_failed == 1);
        CHECK(outcome.content == "a\nb\nX\nd\ne\n");
        REQUIRE(outcome.failed_units.size() == 1);
        CHECK(outcome.failed_units[0].reason.find("could not locate") != std::string::npos);
    }

    SUBCASE("missing_newline") {
        auto hunks = hunks_of("@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+c\n");
        CHECK(apply_unified_hunks("a\nb", hunks, options).content == "a\nc\n");

        hunks = hunks_of("@@ -1,2 +1,2 @@\n a\n-b\n+c\n\\ No newline at end of file\n");
        CHECK(apply_unified_hunks("a\nb\n", hunks, options).content == "a\nc");
    }

    SUBCASE("strict") {
        auto hunks = hunks_of("@@ -1 +1 @@\n-a\n+A\n@@ -3 +3 @@\n-zzz\n+Z\n");
        options.strict = true;
        auto outcome = apply_unified_hunks("a\nb\nc\n", hunks, options);
        CHECK(outcome.content == "a\nb\nc\n");
        CHECK(outcome.blocks_applied == 0);
        CHECK(outcome.blocks_failed == 2);
        REQUIRE(outcome.failed_units.size() == 2);
        CHECK(outcome.failed_units[0].reason == "not applied: strict mode aborted at hunk 2");

        options.strict = false;
        outcome = apply_unified_hunks("a\nb\nc\n", hunks, options);
        CHECK(outcome.content == "A\nb\nc\n");
        CHECK(outcome.blocks_applied == 1);
        CHECK(outcome.blocks_failed == 1);
    }
}

TEST_CASE("locate_hunk") {
    const std::vector<std::string> document = {"x", "a", "b", "x", "a", "b"};
    Hunk hunk;
    hunk.lines = {{HunkLineKind::Context, "a", false}, {HunkLineKind::Remove, "b", false}};

    SUBCASE("nearest_to_expected") {
        auto anchor = locate_hunk(document, hunk, 4, 2);
        REQUIRE(anchor);
        CHECK(anchor->line == 4);

        anchor = locate_hunk(document, hunk, 0, 2);
        REQUIRE(anchor);
        CHECK(anchor->line == 1);
    }

    SUBCASE("earlier_line_on_equal_distance") {
        const std::vector<std::string> symmetric = {"a", "b", "x", "y", "a", "b"};
        auto anchor = locate_hunk(symmetric, hunk, 2, 2);
        REQUIRE(anchor);
        CHECK(anchor->line == 0);
        CHECK(anchor->level == AnchorLevel::Exact);
    }

    SUBCASE("not_found") {
        const std::vector<std::string> other = {"p", "q"};
        CHECK_FALSE(locate_hunk(other, hunk, 0, 2));
    }
}
