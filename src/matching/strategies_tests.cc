#include "strategies.hpp"

#include <doctest.h>

using namespace patchy;

namespace {

std::vector<MatchCandidate>
run(MatchStrategy strategy, const std::string& content, const std::string& search, double threshold = 0.8) {
    MatchContext context{content, search, threshold};
    return strategy_function(strategy)(context);
}

std::string
span(const std::string& content, const MatchCandidate& candidate) {
    return content.substr(candidate.position, candidate.length);
}

}  // namespace

TEST_CASE("match_exact") {
    const std::string content = "x = 1;\ny = 2;\nx = 1;\n";
    auto candidates = run(MatchStrategy::Exact, content, "x = 1;\n");
    REQUIRE(candidates.size() == 2);
    CHECK(candidates[0].position == 0);
    CHECK(candidates[1].position == 14);
    CHECK(candidates[0].confidence == 1.0);

    CHECK(run(MatchStrategy::Exact, content, "z = 3;\n").empty());
}

TEST_CASE("match_line_trimmed") {
    const std::string content = "begin\n    foo();   \n  bar();\nend\n";

    SUBCASE("whole_lines") {
        auto candidates = run(MatchStrategy::LineTrimmed, content, "foo();\nbar();\n");
        REQUIRE(candidates.size() == 1);
        CHECK(candidates[0].strategy == MatchStrategy::LineTrimmed);
        CHECK(span(content, candidates[0]) == "    foo();   \n  bar();\n");
    }

    SUBCASE("no_trailing_newline_in_search") {
        auto candidates = run(MatchStrategy::LineTrimmed, content, "bar();");
        REQUIRE(candidates.size() == 1);
        CHECK(span(content, candidates[0]) == "  bar();");
    }

    SUBCASE("lines_must_be_contiguous") {
        CHECK(run(MatchStrategy::LineTrimmed, content, "begin\nbar();\n").empty());
    }
}

TEST_CASE("match_whitespace_normalized") {
    const std::string content = "int   x =  1;\nint y = 2;\n";

    auto candidates = run(MatchStrategy::WhitespaceNormalized, content, "int x = 1;\n");
    REQUIRE(candidates.size() == 1);
    CHECK(span(content, candidates[0]) == "int   x =  1;\n");

    // Runs of whitespace across lines collapse too.
    candidates = run(MatchStrategy::WhitespaceNormalized, content, "1; int");
    REQUIRE(candidates.size() == 1);
    CHECK(span(content, candidates[0]) == "1;\nint");

    // A search ending in a newline only matches whole lines.
    CHECK(run(MatchStrategy::WhitespaceNormalized, "x = 1; y = 2\n", "x = 1;\n").empty());
    CHECK(run(MatchStrategy::WhitespaceNormalized, "y = 2; x = 1;\n", "x = 1;\n").empty());
    CHECK(run(MatchStrategy::WhitespaceNormalized, "y = 2;\n  x =  1;  \n", "x = 1;\n").size() == 1);
}

TEST_CASE("match_indentation_agnostic") {
    const std::string content = "class A:\n    def f(self):\n        return 1\n";

    SUBCASE("shifted_block") {
        auto candidates = run(MatchStrategy::IndentationAgnostic, content, "def f(self):\n    return 1\n");
        REQUIRE(candidates.size() == 1);
        CHECK(span(content, candidates[0]) == "    def f(self):\n        return 1\n");
    }

    SUBCASE("relative_structure_must_agree") {
        CHECK(run(MatchStrategy::IndentationAgnostic, content, "def f(self):\nreturn 1\n").empty());
    }
}

TEST_CASE("match_fuzzy") {
    SUBCASE("near_miss") {
        const std::string content = "alpha beta\ngamma delta\nepsilon\n";
        auto candidates = run(MatchStrategy::Fuzzy, content, "alpha beta\ngamma delts\nepsilon\n");
        REQUIRE(candidates.size() == 1);
        CHECK(candidates[0].position == 0);
        CHECK(candidates[0].length == content.size());
        CHECK(candidates[0].confidence < 1.0);
        CHECK(candidates[0].confidence > 0.9);
    }

    SUBCASE("threshold") {
        const std::string content = "completely different\n";
        CHECK(run(MatchStrategy::Fuzzy, content, "nothing alike here\n").empty());
        CHECK_FALSE(run(MatchStrategy::Fuzzy, content, "nothing alike here\n", 0.0).empty());
    }

    SUBCASE("window_is_search_sized") {
        const std::string content = "a1\nb2\nc3\nd4\n";
        auto candidates = run(MatchStrategy::Fuzzy, content, "b2\nc3\n", 0.9);
        REQUIRE(candidates.size() == 1);
        CHECK(span(content, candidates[0]) == "b2\nc3\n");
    }
}

TEST_CASE("line_similarity") {
    CHECK(line_similarity("abc", "abc") == doctest::Approx(1.0));
    CHECK(line_similarity("abc", "abd") == doctest::Approx(1.0 - 2.0 / 6.0));
    CHECK(line_similarity("", "abc") == doctest::Approx(0.0));
    CHECK(line_similarity("abc", "xyz") == doctest::Approx(0.0));
}
