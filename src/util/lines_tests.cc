#include "lines.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("parselines") {
    SUBCASE("offsets_and_newlines") {
        std::vector<Line> lines;
        REQUIRE(parselines("ab\n  cd\nef", lines));
        REQUIRE(lines.size() == 3);

        CHECK(lines[0].text == "ab");
        CHECK(lines[0].offset == 0);
        CHECK(lines[0].has_newline);
        CHECK(lines[0].end_offset() == 3);

        CHECK(lines[1].text == "  cd");
        CHECK(lines[1].offset == 3);
        CHECK(lines[1].indentation == 2);
        CHECK(lines[1].line_number == 2);

        CHECK(lines[2].text == "ef");
        CHECK_FALSE(lines[2].has_newline);
        CHECK(lines[2].end_offset() == 10);
    }

    SUBCASE("empty_input") {
        std::vector<Line> lines;
        REQUIRE(parselines("", lines));
        CHECK(lines.empty());
    }

    SUBCASE("equality_includes_newline") {
        std::vector<Line> a, b;
        parselines("x\n", a);
        parselines("x", b);
        CHECK_FALSE(a[0] == b[0]);
    }
}

TEST_CASE("split_and_join") {
    bool trailing = false;
    auto lines = split_lines("a\n\nb\n", &trailing);
    REQUIRE(lines.size() == 3);
    CHECK(lines[1].empty());
    CHECK(trailing);
    CHECK(join_lines(lines, trailing) == "a\n\nb\n");

    lines = split_lines("a\nb", &trailing);
    CHECK_FALSE(trailing);
    CHECK(join_lines(lines, trailing) == "a\nb");

    CHECK(split_lines("").empty());
}

TEST_CASE("line_endings") {
    SUBCASE("detect") {
        CHECK(detect_line_ending("a\r\nb\r\nc\n") == LineEnding::CRLF);
        CHECK(detect_line_ending("a\nb\r\nc\n") == LineEnding::LF);
        CHECK(detect_line_ending("no newline") == LineEnding::LF);
    }

    SUBCASE("normalize_keeps_lone_cr") {
        CHECK(normalize_line_endings("a\r\nb\rc\r\n") == "a\nb\rc\n");
    }

    SUBCASE("restore") {
        CHECK(restore_line_endings("a\nb\n", LineEnding::CRLF) == "a\r\nb\r\n");
        CHECK(restore_line_endings("a\nb\n", LineEnding::LF) == "a\nb\n");
    }
}
