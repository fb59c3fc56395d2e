#pragma once

#include <annodoc/core/functional.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace annodoc::parser {

enum class Section : std::uint8_t {
    Description,
    Example,
};

/// Per-block scanning context carried by the parser state.
struct ParseContext {
    bool in_code_block = false;
    std::string code_block_lang;
    /// Where text lines go: the description, or the open code example.
    Section section = Section::Description;

    auto operator==(const ParseContext&) const -> bool = default;
};

/// Immutable cursor over a shared sequence of lines.
///
/// `position` is 1-based and always within [1, line_count() + 1]; the value
/// one past the last line means end of input. Every operation that moves the
/// cursor or changes the context returns a new state.
class ParserState {
   public:
    ParserState();
    explicit ParserState(std::vector<std::string> lines);
    ParserState(std::shared_ptr<const std::vector<std::string>> lines, std::size_t position,
                ParseContext context = {});

    [[nodiscard]] auto position() const noexcept -> std::size_t { return position_; }
    [[nodiscard]] auto context() const noexcept -> const ParseContext& { return context_; }
    [[nodiscard]] auto line_count() const noexcept -> std::size_t { return lines_->size(); }
    [[nodiscard]] auto lines() const noexcept -> const std::vector<std::string>& {
        return *lines_;
    }

    [[nodiscard]] auto at_end() const noexcept -> bool { return position_ > lines_->size(); }

    /// Current line. Only valid when not at end.
    [[nodiscard]] auto current() const -> std::string_view { return (*lines_)[position_ - 1]; }

    /// Line `offset` lines past the cursor, or Nothing past the end.
    [[nodiscard]] auto peek(std::size_t offset) const -> Maybe<std::string_view>;

    /// Cursor moved forward by `steps`, clamped to end of input.
    [[nodiscard]] auto advance(std::size_t steps = 1) const -> ParserState;

    [[nodiscard]] auto with_context(ParseContext context) const -> ParserState;

    /// Equal cursor and context over equal line contents.
    [[nodiscard]] auto operator==(const ParserState& other) const -> bool;

   private:
    std::shared_ptr<const std::vector<std::string>> lines_;
    std::size_t position_ = 1;
    ParseContext context_;
};

/// A successful parse: the produced value and the state after it.
template <typename T>
struct Parsed {
    using value_type = T;

    T value;
    ParserState state;
};

/// Either a success carrying value and next state, or Nothing. A failure has
/// no state of its own, so it can never report partial consumption.
template <typename T>
using ParseResult = Maybe<Parsed<T>>;

template <typename T>
[[nodiscard]] auto success(T value, ParserState state) -> ParseResult<T> {
    return ParseResult<T>::just(Parsed<T>{.value = std::move(value), .state = std::move(state)});
}

template <typename T>
[[nodiscard]] auto failure() -> ParseResult<T> {
    return nothing;
}

/// Type-erased parser.
template <typename T>
using ParserFn = std::function<ParseResult<T>(const ParserState&)>;

}  // namespace annodoc::parser
