#include <annodoc/core/record.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using annodoc::FunctionRecord;
using annodoc::ParamDoc;

namespace {

auto sample_record() -> FunctionRecord {
    return FunctionRecord{
        .name = "double",
        .params = {ParamDoc{.name = "x", .type = "number", .description = "the input",
                            .optional = false}},
        .returns = {.type = "number", .description = "doubled value"},
        .generics = {},
        .description = "Doubles a number",
        .examples = {{.lang = "lua", .code = "double(2)\ndouble(3)"}},
        .line = 3,
    };
}

}  // namespace

TEST_CASE("signature_of renders names and return type") {
    REQUIRE(signature_of(sample_record()) == "double(x) -> number");

    FunctionRecord record{.name = "greet"};
    record.params.push_back(ParamDoc{.name = "name", .type = "string"});
    record.params.push_back(ParamDoc{.name = "opts", .type = "table?", .optional = true});
    REQUIRE(signature_of(record) == "greet(name, opts?) -> any");
}

TEST_CASE("describe lists every part of a record") {
    const std::string expected =
        "double(x) -> number  [line 3]\n"
        "  Doubles a number\n"
        "  param x: number - the input\n"
        "  returns number - doubled value\n"
        "  example (lua):\n"
        "    double(2)\n"
        "    double(3)\n";
    REQUIRE(describe(sample_record()) == expected);
}

TEST_CASE("describe omits empty sections") {
    FunctionRecord record{.name = "M.new", .line = 12};
    record.generics.push_back({.name = "T"});
    REQUIRE(describe(record) ==
            "M.new() -> any  [line 12]\n"
            "  generic T: any\n"
            "  returns any\n");
}
