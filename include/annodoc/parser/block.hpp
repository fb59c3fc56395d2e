#pragma once

#include <annodoc/core/record.hpp>
#include <annodoc/parser/annotation.hpp>
#include <annodoc/parser/state.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace annodoc::parser {

/// Everything one contiguous run of comment lines says about a function.
struct DocumentationBlock {
    std::vector<std::string> description;
    std::vector<ParamDoc> params;
    ReturnDoc returns;
    std::vector<GenericDoc> generics;
    std::vector<Example> examples;
    /// 1-based line span of the comment run.
    std::size_t first_line = 0;
    std::size_t last_line = 0;
    /// Fenced blocks still open when the run ended; their text was dropped.
    std::size_t unterminated_examples = 0;

    /// First `@param` entry with this name, if any.
    [[nodiscard]] auto find_param(std::string_view name) const -> const ParamDoc*;

    auto operator==(const DocumentationBlock&) const -> bool = default;
};

/// Parser for one documentation block.
///
/// Fails without consuming when the current line is not a comment (the
/// assembler stays Outside). Otherwise it accumulates comment lines through
/// the grammar until a non-comment, non-blank line. Blank lines are absorbed
/// only when another comment line follows them, so the returned state sits
/// right after the last comment line, with a fresh context.
[[nodiscard]] auto documentation_block(Grammar grammar, std::string default_return_type)
    -> ParserFn<DocumentationBlock>;

}  // namespace annodoc::parser
