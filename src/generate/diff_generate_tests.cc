#include "diff_generate.hpp"

#include "apply/apply.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

namespace {

std::string
apply_generated(const std::string& original, const std::string& edit) {
    ApplyOptions options;
    options.matching_strategies = {MatchStrategy::Exact};
    ApplyOutcome outcome;
    EditError error;
    REQUIRE(apply_auto(original, edit, options, outcome, error));
    CHECK(outcome.blocks_failed == 0);
    return outcome.content;
}

std::string
numbered_lines(int count) {
    std::string text;
    for (int i = 1; i <= count; i++) {
        text += "line " + std::to_string(i) + "\n";
    }
    return text;
}

}  // namespace

TEST_CASE("create_unified_diff") {
    SUBCASE("single_change") {
        auto diff = create_unified_diff("a\nb\nc\n", "a\nB\nc\n", "old", "new");
        CHECK(diff == "--- old\n+++ new\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n");
    }

    SUBCASE("no_changes") {
        CHECK(create_unified_diff("a\n", "a\n", "old", "new").empty());
    }

    SUBCASE("context_lines") {
        auto diff = create_unified_diff(numbered_lines(10), "line 1\nline 2\nline 3\nline 4\nfive\nline 6\nline 7\nline 8\nline 9\nline 10\n",
                                        "old", "new", 1);
        CHECK(diff == "--- old\n+++ new\n@@ -4,3 +4,3 @@\n line 4\n-line 5\n+five\n line 6\n");
    }

    SUBCASE("newline_at_end_of_file") {
        auto diff = create_unified_diff("a\nb", "a\nc", "old", "new");
        CHECK(diff == "--- old\n+++ new\n@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+c\n"
                      "\\ No newline at end of file\n");
        CHECK(apply_generated("a\nb", diff) == "a\nc");

        diff = create_unified_diff("a", "a\n", "old", "new");
        CHECK(apply_generated("a", diff) == "a\n");
    }

    SUBCASE("round_trip") {
        const std::string original = numbered_lines(20);
        std::string modified = original;
        modified.replace(modified.find("line 3\n"), 7, "line three\n");
        modified.replace(modified.find("line 16\n"), 0, "extra\n");
        modified.erase(modified.find("line 19\n"), 8);

        auto diff = create_unified_diff(original, modified, "a", "b");
        CHECK(apply_generated(original, diff) == modified);
    }

    SUBCASE("from_and_to_empty") {
        auto diff = create_unified_diff("", "x\ny\n", "a", "b");
        CHECK(diff == "--- a\n+++ b\n@@ -0,0 +1,2 @@\n+x\n+y\n");
        CHECK(apply_generated("", diff) == "x\ny\n");

        diff = create_unified_diff("x\ny\n", "", "a", "b");
        CHECK(diff == "--- a\n+++ b\n@@ -1,2 +0,0 @@\n-x\n-y\n");
    }
}

TEST_CASE("create_search_replace_diff") {
    SUBCASE("single_change") {
        auto edit = create_search_replace_diff("a\nb\nc\n", "a\nB\nc\n");
        CHECK(edit == "<<<<<<< SEARCH\na\nb\nc\n=======\na\nB\nc\n>>>>>>> REPLACE\n");
    }

    SUBCASE("no_changes") {
        CHECK(create_search_replace_diff("a\n", "a\n").empty());
    }

    SUBCASE("context_grows_until_unique") {
        auto blocks = search_replace_blocks("x\nx\n", "x\ny\n", 0);
        REQUIRE(blocks.size() == 1);
        CHECK(blocks[0].search_text == "x\nx\n");
        CHECK(blocks[0].replace_text == "x\ny\n");
    }

    SUBCASE("round_trip") {
        const std::string original = "{\n}\n" + numbered_lines(12) + "{\n}\n";
        std::string modified = original;
        modified.replace(modified.find("line 6\n"), 7, "line six\n");
        modified += "tail\n";

        for (int64_t context : {0, 1, 3}) {
            auto edit = create_search_replace_diff(original, modified, context);
            CHECK(apply_generated(original, edit) == modified);
        }
    }

    SUBCASE("into_empty_document") {
        auto edit = create_search_replace_diff("", "hello\n");
        CHECK(apply_generated("", edit) == "hello\n");
    }
}
