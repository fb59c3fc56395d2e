#include <annodoc/parser/state.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using annodoc::parser::ParseContext;
using annodoc::parser::ParserState;
using annodoc::parser::Section;

TEST_CASE("ParserState starts at line one") {
    ParserState state(std::vector<std::string>{"a", "b"});
    REQUIRE(state.position() == 1);
    REQUIRE(state.line_count() == 2);
    REQUIRE_FALSE(state.at_end());
    REQUIRE(state.current() == "a");
    REQUIRE_FALSE(state.context().in_code_block);
}

TEST_CASE("ParserState advance returns a new state") {
    ParserState state(std::vector<std::string>{"a", "b", "c"});
    auto next = state.advance();
    REQUIRE(state.position() == 1);
    REQUIRE(next.position() == 2);
    REQUIRE(next.current() == "b");
    REQUIRE(&next.lines() == &state.lines());
}

TEST_CASE("ParserState advance clamps at end of input") {
    ParserState state(std::vector<std::string>{"a", "b"});
    auto end = state.advance(10);
    REQUIRE(end.position() == 3);
    REQUIRE(end.at_end());
    REQUIRE(end.advance().position() == 3);

    ParserState empty;
    REQUIRE(empty.at_end());
    REQUIRE(empty.position() == 1);
    REQUIRE(empty.advance().position() == 1);
}

TEST_CASE("ParserState peek looks ahead without moving") {
    ParserState state(std::vector<std::string>{"a", "b"});
    REQUIRE(state.peek(0).value() == "a");
    REQUIRE(state.peek(1).value() == "b");
    REQUIRE(state.peek(2).is_nothing());
    REQUIRE(state.position() == 1);
}

TEST_CASE("ParserState with_context leaves the original untouched") {
    ParserState state(std::vector<std::string>{"---```lua"});
    auto coding = state.with_context(
        ParseContext{.in_code_block = true, .code_block_lang = "lua", .section = Section::Example});
    REQUIRE(coding.context().in_code_block);
    REQUIRE(coding.context().code_block_lang == "lua");
    REQUIRE_FALSE(state.context().in_code_block);
    REQUIRE_FALSE(coding == state);
    REQUIRE(coding.with_context(ParseContext{}) == state);
}

TEST_CASE("ParserState equality compares line contents") {
    ParserState first(std::vector<std::string>{"x", "y"});
    ParserState second(std::vector<std::string>{"x", "y"});
    ParserState other(std::vector<std::string>{"x", "z"});
    REQUIRE(first == second);
    REQUIRE_FALSE(first == other);
    REQUIRE_FALSE(first == first.advance());
}
