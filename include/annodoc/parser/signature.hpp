#pragma once

#include <annodoc/core/functional.hpp>
#include <annodoc/parser/state.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace annodoc::parser {

/// Name and raw parameter names of a function definition line.
struct FunctionSignature {
    /// Qualified name as written, e.g. `Array.map` or `M:insert`.
    std::string name;
    std::vector<std::string> params;

    auto operator==(const FunctionSignature&) const -> bool = default;
};

/// Recognize a function definition on a single line.
///
/// Accepts `function <name>(<params>)` anywhere on the line and
/// `<name> = function(<params>)` (optionally prefixed by `local`). Lines where
/// a control-flow keyword or a comment marker precedes the `function` keyword
/// are rejected. This is pattern matching, not a grammar: anything it does
/// not understand is Nothing.
[[nodiscard]] auto extract_signature(std::string_view line) -> Maybe<FunctionSignature>;

/// Parser consuming one function definition line.
[[nodiscard]] auto function_definition() -> ParserFn<FunctionSignature>;

}  // namespace annodoc::parser
