#include "search_replace_parser.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("parse_search_replace") {
    std::vector<EditBlock> blocks;
    EditError error;

    SUBCASE("two_blocks_with_prose") {
        const std::string edit = R"foo(Fix the operator:
<<<<<<< SEARCH
  return a - b;
=======
  return a + b;
>>>>>>> REPLACE

and rename:
<<<<<<< SEARCH
function add(a, b) {
=======
function sum(a, b) {
>>>>>>> REPLACE
)foo";
        REQUIRE(parse_search_replace(edit, blocks, error));
        CHECK(error.is_ok());
        REQUIRE(blocks.size() == 2);
        CHECK(blocks[0].index == 0);
        CHECK(blocks[0].search_text == "  return a - b;\n");
        CHECK(blocks[0].replace_text == "  return a + b;\n");
        CHECK(blocks[1].index == 1);
        CHECK(blocks[1].search_text == "function add(a, b) {\n");
    }

    SUBCASE("empty_sections") {
        REQUIRE(parse_search_replace("<<<<<<< SEARCH\n=======\nnew\n>>>>>>> REPLACE\n", blocks, error));
        REQUIRE(blocks.size() == 1);
        CHECK(blocks[0].search_text.empty());
        CHECK(blocks[0].replace_text == "new\n");
    }

    SUBCASE("crlf_edit_text") {
        REQUIRE(parse_search_replace("<<<<<<< SEARCH\r\na\r\n=======\r\nb\r\n>>>>>>> REPLACE\r\n", blocks, error));
        CHECK(blocks[0].search_text == "a\n");
        CHECK(blocks[0].replace_text == "b\n");
    }

    SUBCASE("missing_separator") {
        const std::string edit = "<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE\n<<<<<<< SEARCH\nc\n>>>>>>> REPLACE\n";
        CHECK_FALSE(parse_search_replace(edit, blocks, error));
        CHECK(blocks.empty());
        CHECK(error.kind == EditErrorKind::Parse);
        CHECK(error.unit_index == 1);
        CHECK(error.message.find("=======") != std::string::npos);
    }

    SUBCASE("missing_end_marker") {
        CHECK_FALSE(parse_search_replace("<<<<<<< SEARCH\na\n=======\nb\n", blocks, error));
        CHECK(error.kind == EditErrorKind::Parse);
        CHECK(error.unit_index == 0);
        CHECK(error.message.find(">>>>>>> REPLACE") != std::string::npos);
    }

    SUBCASE("no_blocks") {
        CHECK_FALSE(parse_search_replace("nothing here\n", blocks, error));
        CHECK(error.kind == EditErrorKind::Parse);
    }
}

TEST_CASE("render_search_replace") {
    std::vector<EditBlock> blocks = {{0, "a\n", "b\n"}, {1, "c", ""}};
    const auto text = render_search_replace(blocks);
    CHECK(text == "<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE\n"
                  "<<<<<<< SEARCH\nc\n=======\n>>>>>>> REPLACE\n");

    std::vector<EditBlock> parsed;
    EditError error;
    REQUIRE(parse_search_replace(text, parsed, error));
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0].search_text == "a\n");
    CHECK(parsed[1].replace_text.empty());
}
