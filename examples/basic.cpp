#include <annodoc/annodoc.hpp>

#include <fmt/core.h>

namespace {

constexpr const char* kSource = R"(local Stack = {}

---Push a value on top of the stack
---@param value any # Value to store
---@return integer # New depth
function Stack:push(value)
    self[#self + 1] = value
    return #self
end

---Peek at the top value without removing it
---@param default? any # Returned when the stack is empty
Stack.peek = function(self, default)
    return self[#self] or default
end
)";

}  // namespace

auto main() -> int {
    // Drive a combinator by hand: count the leading comment run
    fmt::print("=== Combinators ===\n");

    annodoc::parser::Grammar grammar;
    annodoc::parser::ParserState state(annodoc::text::split_lines(kSource));
    auto comments = annodoc::parser::many(grammar.comment_line());
    auto at_doc = state.advance(2);
    auto run = comments(at_doc);
    fmt::print("comment lines from line {}: {}\n", at_doc.position(),
               run.map([](const auto& parsed) { return parsed.value.size(); }).from_maybe(0));

    // Full extraction
    fmt::print("\n=== Extraction ===\n");

    auto extractor = annodoc::Extractor::create(annodoc::ExtractOptions{});
    if (!extractor) {
        fmt::print(stderr, "{}\n", extractor.error().format());
        return 1;
    }
    auto result = extractor->run_source(kSource);
    for (const auto& record : result.functions) {
        fmt::print("{}", annodoc::describe(record));
    }
    fmt::print("{} functions from {} blocks\n", result.stats.functions, result.stats.blocks);

    return 0;
}
