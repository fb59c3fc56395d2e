#include <annodoc/parser/signature.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using annodoc::parser::FunctionSignature;
using annodoc::parser::ParserState;
using annodoc::parser::extract_signature;
using annodoc::parser::function_definition;

namespace {

auto require_signature(std::string_view line) -> FunctionSignature {
    auto signature = extract_signature(line);
    REQUIRE(signature.is_just());
    return signature.value();
}

}  // namespace

TEST_CASE("Signature extractor reads direct declarations") {
    auto sig = require_signature("function double(x)");
    REQUIRE(sig.name == "double");
    REQUIRE(sig.params == std::vector<std::string>{"x"});

    auto qualified = require_signature("function Array.map(f, xs)");
    REQUIRE(qualified.name == "Array.map");
    REQUIRE(qualified.params == std::vector<std::string>{"f", "xs"});

    auto local = require_signature("  local function helper( a ,b,  c )  ");
    REQUIRE(local.name == "helper");
    REQUIRE(local.params == std::vector<std::string>{"a", "b", "c"});

    auto method = require_signature("function Stack:push(value)");
    REQUIRE(method.name == "Stack:push");
    REQUIRE(method.params == std::vector<std::string>{"value"});
}

TEST_CASE("Signature extractor reads assigned anonymous functions") {
    auto sig = require_signature("utils.increment = function(x)");
    REQUIRE(sig.name == "utils.increment");
    REQUIRE(sig.params == std::vector<std::string>{"x"});

    auto local = require_signature("local compose = function (f, g) return f end");
    REQUIRE(local.name == "compose");
    REQUIRE(local.params == std::vector<std::string>{"f", "g"});
}

TEST_CASE("Signature extractor handles empty and variadic parameter lists") {
    REQUIRE(require_signature("function M.new()").params.empty());
    REQUIRE(require_signature("function M.log(fmt, ...)").params ==
            std::vector<std::string>{"fmt", "..."});
    REQUIRE(require_signature("function M.f(a,,b)").params == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Signature extractor rejects control flow and comments") {
    REQUIRE(extract_signature("if ready then function go() end end").is_nothing());
    REQUIRE(extract_signature("return function(x) return x end").is_nothing());
    REQUIRE(extract_signature("for i = 1, 3 do local f = function(x) end end").is_nothing());
    REQUIRE(extract_signature("-- function commented(x)").is_nothing());
    REQUIRE(extract_signature("local x = 1 -- see function other(y)").is_nothing());
}

TEST_CASE("Signature extractor ignores lookalikes") {
    REQUIRE(extract_signature("local functional = require('Functools')").is_nothing());
    REQUIRE(extract_signature("M.function(x)").is_nothing());
    REQUIRE(extract_signature("callback(function(x) return x end)").is_nothing());
    REQUIRE(extract_signature("x == function(y)").is_nothing());
    REQUIRE(extract_signature("local t = { function() end }").is_nothing());
}

TEST_CASE("Signature extractor tolerates malformed input") {
    REQUIRE(extract_signature("").is_nothing());
    REQUIRE(extract_signature("function").is_nothing());
    REQUIRE(extract_signature("function broken(x").is_nothing());
    REQUIRE(extract_signature("function 9lives(x)").is_nothing());
    REQUIRE(extract_signature("function a..b(x)").is_nothing());
    REQUIRE(extract_signature("function .a(x)").is_nothing());
    REQUIRE(extract_signature(std::string(4096, '(')).is_nothing());
}

TEST_CASE("function_definition consumes exactly the definition line") {
    auto parser = function_definition();
    ParserState state(std::vector<std::string>{"function f(a)", "local x = 1"});
    auto result = parser(state);
    REQUIRE(result.is_just());
    REQUIRE(result->value == FunctionSignature{.name = "f", .params = {"a"}});
    REQUIRE(result->state.position() == 2);

    REQUIRE(parser(result->state).is_nothing());
}
