#include <annodoc/parser/combinators.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

using namespace annodoc::parser;

auto make_state(std::vector<std::string> lines) -> ParserState {
    return ParserState(std::move(lines));
}

auto starts_with(std::string prefix) {
    return [prefix = std::move(prefix)](std::string_view line) { return line.starts_with(prefix); };
}

}  // namespace

TEST_CASE("satisfy consumes one matching line") {
    auto state = make_state({"alpha", "beta"});
    auto result = satisfy(starts_with("al"))(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == "alpha");
    REQUIRE(result->state.position() == 2);
}

TEST_CASE("satisfy fails without consuming") {
    auto state = make_state({"alpha"});
    REQUIRE(satisfy(starts_with("be"))(state).is_nothing());
    REQUIRE(state.position() == 1);

    auto end = state.advance();
    REQUIRE(satisfy([](std::string_view) { return true; })(end).is_nothing());
}

TEST_CASE("match tests a prefix after leading whitespace") {
    auto state = make_state({"   ---@param x number", "-- plain"});
    auto rich = match("---");
    auto result = rich(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == "   ---@param x number");
    REQUIRE(rich(result->state).is_nothing());
    REQUIRE(match("--")(result->state).is_just());
}

TEST_CASE("map transforms the value and keeps the state") {
    auto state = make_state({"42", "rest"});
    auto number = map([](const std::string& line) { return std::stoi(line); },
                      satisfy([](std::string_view) { return true; }));
    auto result = number(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == 42);
    REQUIRE(result->state.position() == 2);

    REQUIRE(number(state.advance(2)).is_nothing());
}

TEST_CASE("bind sequences two parsers") {
    auto state = make_state({"repeat", "repeat", "end"});
    auto same_again = bind([](std::string first) { return match(std::move(first)); },
                           satisfy([](std::string_view) { return true; }));
    auto result = same_again(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == "repeat");
    REQUIRE(result->state.position() == 3);

    REQUIRE(same_again(state.advance()).is_nothing());
}

TEST_CASE("bind short-circuits when the first parser fails") {
    auto state = make_state({"x"});
    bool called = false;
    auto parser = bind(
        [&called](std::string) {
            called = true;
            return pure(1);
        },
        match("y"));
    REQUIRE(parser(state).is_nothing());
    REQUIRE_FALSE(called);
}

TEST_CASE("choice returns the first success on the same state") {
    auto state = make_state({"--- doc"});
    auto tagged = [](std::string tag, std::string prefix) -> ParserFn<std::string> {
        return map([tag](const std::string&) { return tag; }, match(std::move(prefix)));
    };
    auto parser = choice<std::string>({tagged("rich", "---"), tagged("plain", "--")});
    auto result = parser(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == "rich");

    auto reversed = choice<std::string>({tagged("plain", "--"), tagged("rich", "---")});
    REQUIRE(reversed(state)->value == "plain");

    auto none = choice<std::string>({tagged("a", "a"), tagged("b", "b")});
    REQUIRE(none(state).is_nothing());
}

TEST_CASE("many collects until the first failure") {
    auto state = make_state({"-- a", "-- b", "code", "-- c"});
    auto comments = many(match("--"));
    auto result = comments(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == std::vector<std::string>{"-- a", "-- b"});
    REQUIRE(result->state.position() == 3);

    auto none = comments(state.advance(2));
    REQUIRE(none.is_just());
    REQUIRE(none->value.empty());
    REQUIRE(none->state.position() == 3);
}

TEST_CASE("many stops on a parser that does not consume") {
    auto state = make_state({"x"});
    auto result = many(pure(7))(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == std::vector<int>{7});
    REQUIRE(result->state == state);
}

TEST_CASE("optional turns failure into Nothing") {
    auto state = make_state({"body"});
    auto result = optional(match("--"))(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value.is_nothing());
    REQUIRE(result->state == state);

    auto present = optional(match("bo"))(state);
    REQUIRE(present.is_just());
    REQUIRE(present->value.is_just());
    REQUIRE(present->value.value() == "body");
    REQUIRE(present->state.position() == 2);
}

TEST_CASE("pure and fail do not consume") {
    auto state = make_state({"line"});
    auto ok = pure(std::string("value"))(state);
    REQUIRE(ok.is_just());
    REQUIRE(ok->state == state);
    REQUIRE(fail<int>()(state).is_nothing());
}

TEST_CASE("seek finds a match within the window") {
    auto state = make_state({"a", "b", "c", "target", "d"});
    auto target = match("target");
    auto found = seek(target, 4)(state);
    REQUIRE(found.is_just());
    REQUIRE(found->value == "target");
    REQUIRE(found->state.position() == 5);

    REQUIRE(seek(target, 3)(state).is_nothing());
    REQUIRE(seek(target, 0)(state).is_nothing());
    REQUIRE(seek(target, 100)(state.advance(4)).is_nothing());
}

TEST_CASE("failed parsers leave the caller's state intact") {
    auto state = make_state({"-- a", "-- b", "x"}).advance();
    const auto before = state;
    auto always = [](std::string_view) { return true; };
    auto never = [](std::string_view) { return false; };

    REQUIRE(satisfy(never)(state).is_nothing());
    REQUIRE(match("zz")(state).is_nothing());
    REQUIRE(map([](std::string s) { return s.size(); }, satisfy(never))(state).is_nothing());
    REQUIRE(bind([](std::string) { return fail<int>(); }, satisfy(always))(state).is_nothing());
    REQUIRE(choice<std::string>({satisfy(never), match("x")})(state).is_nothing());
    REQUIRE(seek(satisfy(never), 5)(state).is_nothing());
    REQUIRE(state == before);
}
