#pragma once

#include <annodoc/parser/state.hpp>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace annodoc::parser {

// ─── Parser concept ───────────────────────────────────────────────────────────
//  A parser is any callable taking a ParserState and returning ParseResult<T>.
//  Parsers never consume input on failure: a failure carries no state, so the
//  caller always resumes from the state it passed in.

template <typename P>
using parser_result_t = std::invoke_result_t<const P&, const ParserState&>;

template <typename P>
using parser_value_t = typename parser_result_t<P>::value_type::value_type;

template <typename P>
concept Parser = std::invocable<const P&, const ParserState&> &&
                 std::same_as<parser_result_t<P>, ParseResult<parser_value_t<P>>>;

// ─── Primitives ───────────────────────────────────────────────────────────────

/// Succeed with `value` without consuming input.
template <typename T>
[[nodiscard]] auto pure(T value) {
    return [value = std::move(value)](const ParserState& state) -> ParseResult<T> {
        return success(value, state);
    };
}

/// Always fail.
template <typename T>
[[nodiscard]] auto fail() {
    return [](const ParserState&) -> ParseResult<T> { return failure<T>(); };
}

/// Consume the current line when `predicate` accepts it.
template <typename Pred>
    requires std::predicate<const Pred&, std::string_view>
[[nodiscard]] auto satisfy(Pred predicate) {
    return [predicate = std::move(predicate)](const ParserState& state) -> ParseResult<std::string> {
        if (state.at_end()) {
            return failure<std::string>();
        }
        const std::string_view line = state.current();
        if (!predicate(line)) {
            return failure<std::string>();
        }
        return success(std::string(line), state.advance());
    };
}

/// Consume the current line when, after leading whitespace, it starts with
/// `pattern`.
[[nodiscard]] inline auto match(std::string pattern) {
    return satisfy([pattern = std::move(pattern)](std::string_view line) {
        std::size_t i = 0;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
            ++i;
        }
        return line.substr(i).starts_with(pattern);
    });
}

// ─── Combinators ──────────────────────────────────────────────────────────────

/// Transform the value of a successful parse; the state is left as produced.
template <typename F, Parser P>
[[nodiscard]] auto map(F transform, P parser) {
    using T = parser_value_t<P>;
    using U = std::decay_t<std::invoke_result_t<const F&, T&&>>;
    return [transform = std::move(transform),
            parser = std::move(parser)](const ParserState& state) -> ParseResult<U> {
        return parser(state).map([&](Parsed<T>&& parsed) {
            return Parsed<U>{.value = transform(std::move(parsed.value)),
                             .state = std::move(parsed.state)};
        });
    };
}

/// Monadic sequencing: run `parser`, feed its value to `next` to obtain the
/// second parser and run that on the remaining input.
template <typename F, Parser P>
[[nodiscard]] auto bind(F next, P parser) {
    using T = parser_value_t<P>;
    using Q = std::decay_t<std::invoke_result_t<const F&, T&&>>;
    using U = parser_value_t<Q>;
    return [next = std::move(next),
            parser = std::move(parser)](const ParserState& state) -> ParseResult<U> {
        return parser(state).bind(
            [&](Parsed<T>&& parsed) { return next(std::move(parsed.value))(parsed.state); });
    };
}

/// First success among `parsers`, each tried on the same starting state.
template <typename T>
[[nodiscard]] auto choice(std::vector<ParserFn<T>> parsers) {
    return [parsers = std::move(parsers)](const ParserState& state) -> ParseResult<T> {
        for (const auto& parser : parsers) {
            auto result = parser(state);
            if (result) {
                return result;
            }
        }
        return failure<T>();
    };
}

template <typename T>
[[nodiscard]] auto choice(std::initializer_list<ParserFn<T>> parsers) {
    return choice<T>(std::vector<ParserFn<T>>(parsers));
}

/// Zero or more repetitions; always succeeds.
template <Parser P>
[[nodiscard]] auto many(P parser) {
    using T = parser_value_t<P>;
    return [parser = std::move(parser)](const ParserState& state) -> ParseResult<std::vector<T>> {
        std::vector<T> values;
        ParserState current = state;
        while (true) {
            auto result = parser(current);
            if (!result) {
                break;
            }
            auto parsed = std::move(result).value();
            // A parser that succeeds without consuming would loop forever.
            const bool consumed = parsed.state.position() != current.position();
            values.push_back(std::move(parsed.value));
            current = std::move(parsed.state);
            if (!consumed) {
                break;
            }
        }
        return success(std::move(values), std::move(current));
    };
}

/// Succeed with Nothing and the original state when `parser` fails.
template <Parser P>
[[nodiscard]] auto optional(P parser) {
    using T = parser_value_t<P>;
    return [parser = std::move(parser)](const ParserState& state) -> ParseResult<Maybe<T>> {
        auto result = parser(state);
        if (!result) {
            return success(Maybe<T>(nothing), state);
        }
        auto parsed = std::move(result).value();
        return success(just(std::move(parsed.value)), std::move(parsed.state));
    };
}

/// Try `parser` on the current line and on each following line, at most
/// `window` lines in total. The skipped lines are consumed on success.
template <Parser P>
[[nodiscard]] auto seek(P parser, std::size_t window) {
    using T = parser_value_t<P>;
    return [parser = std::move(parser), window](const ParserState& state) -> ParseResult<T> {
        ParserState probe = state;
        for (std::size_t i = 0; i < window && !probe.at_end(); ++i) {
            auto result = parser(probe);
            if (result) {
                return result;
            }
            probe = probe.advance();
        }
        return failure<T>();
    };
}

}  // namespace annodoc::parser
