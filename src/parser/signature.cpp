#include <annodoc/parser/combinators.hpp>
#include <annodoc/parser/signature.hpp>

#include <annodoc/core/text.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace annodoc::parser {

namespace {

constexpr std::string_view kFunction = "function";

constexpr std::array<std::string_view, 10> kControlKeywords = {
    "if", "then", "else", "elseif", "while", "for", "do", "repeat", "until", "return",
};

auto is_separator(char ch) -> bool {
    return ch == '.' || ch == ':';
}

/// Position of `word` as a whole word, or npos.
auto find_keyword(std::string_view line, std::string_view word) -> std::size_t {
    std::size_t pos = line.find(word);
    while (pos != std::string_view::npos) {
        const bool start_ok =
            pos == 0 || (!text::is_ident_char(line[pos - 1]) && !is_separator(line[pos - 1]));
        const std::size_t end = pos + word.size();
        const bool end_ok = end == line.size() || !text::is_ident_char(line[end]);
        if (start_ok && end_ok) {
            return pos;
        }
        pos = line.find(word, pos + 1);
    }
    return std::string_view::npos;
}

/// True when the text before the `function` keyword makes the match suspect.
auto rejected_prefix(std::string_view prefix) -> bool {
    if (prefix.find("--") != std::string_view::npos) {
        return true;
    }
    std::size_t i = 0;
    while (i < prefix.size()) {
        if (!text::is_ident_char(prefix[i])) {
            ++i;
            continue;
        }
        const bool after_separator = i > 0 && is_separator(prefix[i - 1]);
        const auto word = text::take_identifier(prefix.substr(i));
        if (!after_separator && std::ranges::find(kControlKeywords, word) != kControlKeywords.end()) {
            return true;
        }
        i += word.size();
    }
    return false;
}

/// Leading qualified name (`a.b:c`), or empty when the text does not start
/// with a well-formed one.
auto take_qualified_name(std::string_view text) -> std::string_view {
    std::size_t n = 0;
    while (n < text.size() && (text::is_ident_char(text[n]) || is_separator(text[n]))) {
        ++n;
    }
    const std::string_view name = text.substr(0, n);
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0 ||
        is_separator(name.front()) || is_separator(name.back())) {
        return {};
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        if (is_separator(name[i]) && is_separator(name[i - 1])) {
            return {};
        }
    }
    return name;
}

/// Parameter names from text starting at `(`; Nothing when unclosed.
auto parse_params(std::string_view text) -> Maybe<std::vector<std::string>> {
    if (!text.starts_with('(')) {
        return nothing;
    }
    const auto close = text.find(')');
    if (close == std::string_view::npos) {
        return nothing;
    }
    std::string_view inner = text.substr(1, close - 1);
    std::vector<std::string> params;
    std::size_t start = 0;
    while (start <= inner.size()) {
        auto end = inner.find(',', start);
        if (end == std::string_view::npos) {
            end = inner.size();
        }
        const auto param = text::trim(inner.substr(start, end - start));
        if (!param.empty()) {
            params.emplace_back(param);
        }
        start = end + 1;
    }
    return just(std::move(params));
}

/// Name of `[local] <name> =` preceding an anonymous definition.
auto assigned_name(std::string_view prefix) -> std::string_view {
    prefix = text::trim(prefix);
    if (!prefix.ends_with('=')) {
        return {};
    }
    prefix = text::trim(prefix.substr(0, prefix.size() - 1));
    if (prefix.starts_with("local") && prefix.size() > 5 && text::is_space(prefix[5])) {
        prefix = text::trim_left(prefix.substr(5));
    }
    const auto name = take_qualified_name(prefix);
    return name.size() == prefix.size() ? name : std::string_view{};
}

}  // namespace

auto extract_signature(std::string_view line) -> Maybe<FunctionSignature> {
    const auto keyword = find_keyword(line, kFunction);
    if (keyword == std::string_view::npos) {
        return nothing;
    }
    const auto prefix = line.substr(0, keyword);
    if (rejected_prefix(prefix)) {
        return nothing;
    }
    std::string_view rest = line.substr(keyword + kFunction.size());

    // function <name>(...)
    if (!rest.empty() && text::is_space(rest.front())) {
        const auto after = text::trim_left(rest);
        const auto name = take_qualified_name(after);
        if (!name.empty()) {
            return parse_params(text::trim_left(after.substr(name.size())))
                .map([name](std::vector<std::string> params) {
                    return FunctionSignature{.name = std::string(name), .params = std::move(params)};
                });
        }
    }

    // <name> = function(...)
    const auto name = assigned_name(prefix);
    if (name.empty()) {
        return nothing;
    }
    return parse_params(text::trim_left(rest)).map([name](std::vector<std::string> params) {
        return FunctionSignature{.name = std::string(name), .params = std::move(params)};
    });
}

auto function_definition() -> ParserFn<FunctionSignature> {
    // Shared by the shape test and the extractor so each line is scanned once.
    auto scan = memoize<std::string>(
        [](const std::string& line) { return extract_signature(line); });
    return map([scan](const std::string& line) { return *scan(line); },
               satisfy([scan](std::string_view line) {
                   return scan(std::string(line)).is_just();
               }));
}

}  // namespace annodoc::parser
