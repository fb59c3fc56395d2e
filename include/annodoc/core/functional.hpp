#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace annodoc {

// ─── Composition ──────────────────────────────────────────────────────────────

/// Right-to-left composition: `compose(f, g)(x) == f(g(x))`.
template <typename F, typename G>
[[nodiscard]] auto compose(F f, G g) {
    return [f = std::move(f), g = std::move(g)](auto&&... args) {
        return std::invoke(f, std::invoke(g, std::forward<decltype(args)>(args)...));
    };
}

template <typename F, typename G, typename... Rest>
    requires(sizeof...(Rest) > 0)
[[nodiscard]] auto compose(F f, G g, Rest... rest) {
    return compose(std::move(f), compose(std::move(g), std::move(rest)...));
}

/// Left-to-right composition: `pipe(f, g)(x) == g(f(x))`.
template <typename F>
[[nodiscard]] auto pipe(F f) {
    return f;
}

template <typename F, typename G, typename... Rest>
[[nodiscard]] auto pipe(F f, G g, Rest... rest) {
    return pipe(compose(std::move(g), std::move(f)), std::move(rest)...);
}

// ─── Currying ─────────────────────────────────────────────────────────────────

/// Convert a binary function into a chain of unary calls: `curry2(f)(a)(b)`.
template <typename F>
[[nodiscard]] auto curry2(F f) {
    return [f = std::move(f)](auto a) {
        return [f, a = std::move(a)](auto b) { return std::invoke(f, a, std::move(b)); };
    };
}

/// Convert a ternary function into a chain of unary calls: `curry3(f)(a)(b)(c)`.
template <typename F>
[[nodiscard]] auto curry3(F f) {
    return [f = std::move(f)](auto a) {
        return [f, a = std::move(a)](auto b) {
            return [f, a, b = std::move(b)](auto c) {
                return std::invoke(f, a, b, std::move(c));
            };
        };
    };
}

// ─── Memoization ──────────────────────────────────────────────────────────────

/// Cache the results of a unary function keyed by argument value.
///
/// The cache is owned by the returned callable and shared between its copies.
/// Entries are never evicted; drop the callable to drop the cache. Not
/// synchronized: keep a memoized function local to one thread.
template <typename Key, typename F>
    requires std::invocable<const F&, const Key&>
[[nodiscard]] auto memoize(F f) {
    using Result = std::decay_t<std::invoke_result_t<const F&, const Key&>>;
    auto cache = std::make_shared<std::unordered_map<Key, Result>>();
    return [f = std::move(f), cache](const Key& key) -> const Result& {
        if (auto it = cache->find(key); it != cache->end()) {
            return it->second;
        }
        return cache->emplace(key, std::invoke(f, key)).first->second;
    };
}

// ─── Maybe ────────────────────────────────────────────────────────────────────

/// Tag for the empty Maybe.
struct Nothing {
    auto operator==(const Nothing&) const -> bool = default;
};

inline constexpr Nothing nothing{};

template <typename T>
class Maybe;

template <typename T>
struct is_maybe : std::false_type {};

template <typename T>
struct is_maybe<Maybe<T>> : std::true_type {};

/// Optional value with exactly two states: Just(value) and Nothing.
///
/// `bind` short-circuits on Nothing, `map` is a no-op on Nothing and
/// `from_maybe` substitutes a default. Nothing in this API throws for absence.
template <typename T>
class Maybe {
   public:
    using value_type = T;

    Maybe() = default;
    Maybe(Nothing) noexcept {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] static auto just(T value) -> Maybe {
        Maybe result;
        result.value_.emplace(std::move(value));
        return result;
    }

    [[nodiscard]] auto is_just() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] auto is_nothing() const noexcept -> bool { return !value_.has_value(); }
    explicit operator bool() const noexcept { return value_.has_value(); }

    /// Unchecked access; only valid on Just.
    [[nodiscard]] auto value() const& noexcept -> const T& { return *value_; }
    [[nodiscard]] auto value() & noexcept -> T& { return *value_; }
    [[nodiscard]] auto value() && noexcept -> T&& { return std::move(*value_); }

    [[nodiscard]] auto operator*() const& noexcept -> const T& { return *value_; }
    [[nodiscard]] auto operator*() && noexcept -> T&& { return std::move(*value_); }
    [[nodiscard]] auto operator->() const noexcept -> const T* { return &*value_; }

    /// Chain a computation that itself returns a Maybe.
    template <typename F>
        requires is_maybe<std::invoke_result_t<F, const T&>>::value
    [[nodiscard]] auto bind(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (!value_) {
            return nothing;
        }
        return std::invoke(std::forward<F>(f), *value_);
    }

    template <typename F>
        requires is_maybe<std::invoke_result_t<F, T&&>>::value
    [[nodiscard]] auto bind(F&& f) && -> std::invoke_result_t<F, T&&> {
        if (!value_) {
            return nothing;
        }
        return std::invoke(std::forward<F>(f), std::move(*value_));
    }

    /// Apply `f` to the held value, if any.
    template <typename F>
    [[nodiscard]] auto map(F&& f) const& -> Maybe<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!value_) {
            return nothing;
        }
        return Maybe<U>::just(std::invoke(std::forward<F>(f), *value_));
    }

    template <typename F>
    [[nodiscard]] auto map(F&& f) && -> Maybe<std::decay_t<std::invoke_result_t<F, T&&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&&>>;
        if (!value_) {
            return nothing;
        }
        return Maybe<U>::just(std::invoke(std::forward<F>(f), std::move(*value_)));
    }

    /// Unwrap, or return `fallback` on Nothing.
    [[nodiscard]] auto from_maybe(T fallback) const& -> T {
        return value_ ? *value_ : std::move(fallback);
    }

    [[nodiscard]] auto from_maybe(T fallback) && -> T {
        return value_ ? std::move(*value_) : std::move(fallback);
    }

    [[nodiscard]] auto operator==(const Maybe& other) const -> bool
        requires std::equality_comparable<T>
    {
        return value_ == other.value_;
    }

   private:
    std::optional<T> value_;
};

/// Construct a Just, deducing the value type.
template <typename T>
[[nodiscard]] auto just(T&& value) -> Maybe<std::decay_t<T>> {
    return Maybe<std::decay_t<T>>::just(std::forward<T>(value));
}

}  // namespace annodoc
