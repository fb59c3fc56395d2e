#include <annodoc/parser/annotation.hpp>
#include <annodoc/parser/combinators.hpp>

#include <annodoc/core/record.hpp>
#include <annodoc/core/text.hpp>

#include <algorithm>
#include <utility>

namespace annodoc::parser {

namespace {

constexpr std::string_view kFence = "```";

/// `text` minus a leading `directive` that must be followed by whitespace.
auto after_directive(std::string_view text, std::string_view directive)
    -> Maybe<std::string_view> {
    if (!text.starts_with(directive) || text.size() == directive.size() ||
        !text::is_space(text[directive.size()])) {
        return nothing;
    }
    return just(text::trim_left(text.substr(directive.size())));
}

auto strip_marker(const GrammarOptions& options, std::string_view line)
    -> Maybe<std::string_view> {
    line = text::trim_left(line);
    if (line.starts_with(options.rich_marker)) {
        return just(line.substr(options.rich_marker.size()));
    }
    if (line.starts_with(options.plain_marker)) {
        return just(line.substr(options.plain_marker.size()));
    }
    return nothing;
}

auto comment_body(const GrammarOptions& options, std::string_view line) -> std::string {
    return std::string(text::trim(strip_marker(options, line).from_maybe({})));
}

auto code_body(const GrammarOptions& options, std::string_view line) -> std::string {
    std::string_view body = strip_marker(options, line).from_maybe({});
    if (!body.empty() && body.front() == ' ') {
        body.remove_prefix(1);
    }
    return std::string(text::trim_right(body));
}

auto reserved(const GrammarOptions& options, std::string_view text) -> bool {
    std::string_view word = text::first_word(text);
    if (word.ends_with(':')) {
        word.remove_suffix(1);
    }
    return std::ranges::find(options.reserved_headers, word) != options.reserved_headers.end();
}

auto has_nil_member(std::string_view type) -> bool {
    std::size_t start = 0;
    while (start <= type.size()) {
        auto end = type.find('|', start);
        if (end == std::string_view::npos) {
            end = type.size();
        }
        if (text::trim(type.substr(start, end - start)) == "nil") {
            return true;
        }
        start = end + 1;
    }
    return false;
}

using Options = std::shared_ptr<const GrammarOptions>;

/// `map(extract, satisfy(shape))` where both the shape test and the extractor
/// come from one recognizer over the comment text.
template <typename Scan>
auto rule(Options options, Scan scan) -> ParserFn<Maybe<AnnotationToken>> {
    auto shape = [options, scan](std::string_view line) {
        return strip_marker(*options, line).is_just() &&
               scan(comment_body(*options, line)).is_just();
    };
    auto extract = [options, scan](std::string line) -> Maybe<AnnotationToken> {
        return scan(comment_body(*options, line)).map([](auto token) {
            return AnnotationToken(std::move(token));
        });
    };
    return map(std::move(extract), satisfy(std::move(shape)));
}

auto prose_rules(const Options& options, const ParserFn<std::string>& comment_line)
    -> ParserFn<Maybe<AnnotationToken>> {
    const auto description = [options](std::string_view text) -> Maybe<DescriptionText> {
        if (text.empty() || reserved(*options, text)) {
            return nothing;
        }
        return just(DescriptionText{.text = std::string(text)});
    };
    const auto fence_start = [options](std::string_view text) {
        return scan_fence_start(text, options->default_code_lang);
    };
    const auto dropped = [](const std::string&) -> Maybe<AnnotationToken> { return nothing; };

    return choice<Maybe<AnnotationToken>>({
        rule(options, &scan_generic),
        rule(options, &scan_param),
        rule(options, &scan_return),
        rule(options, fence_start),
        rule(options, &scan_fence_end),
        rule(options, description),
        map(dropped, comment_line),
    });
}

auto code_rules(const Options& options, const ParserFn<std::string>& comment_line)
    -> ParserFn<Maybe<AnnotationToken>> {
    const auto code_line = [options](const std::string& line) -> Maybe<AnnotationToken> {
        return just(AnnotationToken(DescriptionText{.text = code_body(*options, line)}));
    };
    return choice<Maybe<AnnotationToken>>({
        rule(options, &scan_fence_end),
        map(code_line, comment_line),
    });
}

}  // namespace

auto scan_generic(std::string_view text) -> Maybe<GenericAnnotation> {
    return after_directive(text, "@generic").bind([](std::string_view rest) {
        const auto name = text::take_identifier(rest);
        if (name.empty()) {
            return Maybe<GenericAnnotation>(nothing);
        }
        return just(GenericAnnotation{.name = std::string(name)});
    });
}

auto scan_param(std::string_view text) -> Maybe<ParamAnnotation> {
    return after_directive(text, "@param").bind([](std::string_view rest) {
        std::string_view name = rest.starts_with("...") ? rest.substr(0, 3)
                                                        : text::take_identifier(rest);
        if (name.empty()) {
            return Maybe<ParamAnnotation>(nothing);
        }
        rest.remove_prefix(name.size());
        const bool optional_name = rest.starts_with('?');
        if (optional_name) {
            rest.remove_prefix(1);
        }
        if (rest.empty() || !text::is_space(rest.front())) {
            return Maybe<ParamAnnotation>(nothing);
        }
        rest = text::trim(rest);
        if (rest.empty()) {
            return Maybe<ParamAnnotation>(nothing);
        }

        std::string_view type = rest;
        std::string_view description;
        if (auto hash = rest.find('#'); hash != std::string_view::npos) {
            type = text::trim(rest.substr(0, hash));
            description = text::trim(rest.substr(hash + 1));
        }
        if (type.empty()) {
            type = kUnknownType;
        }
        return just(ParamAnnotation{
            .name = std::string(name),
            .type = std::string(type),
            .description = std::string(description),
            .optional = optional_name || type.find('?') != std::string_view::npos ||
                        has_nil_member(type),
        });
    });
}

auto scan_return(std::string_view text) -> Maybe<ReturnAnnotation> {
    return after_directive(text, "@return").bind([](std::string_view rest) {
        const auto type = text::first_word(rest);
        if (type.empty()) {
            return Maybe<ReturnAnnotation>(nothing);
        }
        std::string_view description = text::trim(rest.substr(type.size()));
        if (description.starts_with('#')) {
            description = text::trim(description.substr(1));
        }
        return just(ReturnAnnotation{.type = std::string(type),
                                     .description = std::string(description)});
    });
}

auto scan_fence_start(std::string_view text, std::string_view default_lang)
    -> Maybe<CodeBlockStart> {
    if (!text.starts_with(kFence)) {
        return nothing;
    }
    const auto lang = text::first_word(text.substr(kFence.size()));
    if (lang.starts_with('`')) {
        return nothing;
    }
    return just(CodeBlockStart{.lang = std::string(lang.empty() ? default_lang : lang)});
}

auto scan_fence_end(std::string_view text) -> Maybe<CodeBlockEnd> {
    if (text::trim(text) != kFence) {
        return nothing;
    }
    return just(CodeBlockEnd{});
}

Grammar::Grammar(GrammarOptions options)
    : options_(std::make_shared<const GrammarOptions>(std::move(options))) {
    comment_line_ = choice<std::string>({
        match(options_->rich_marker),
        match(options_->plain_marker),
    });
    auto prose = prose_rules(options_, comment_line_);
    auto code = code_rules(options_, comment_line_);
    annotation_ = [prose = std::move(prose),
                   code = std::move(code)](const ParserState& state) {
        return state.context().in_code_block ? code(state) : prose(state);
    };
}

auto Grammar::is_comment(std::string_view line) const -> bool {
    return strip_marker(*options_, line).is_just();
}

auto Grammar::comment_text(std::string_view line) const -> std::string {
    return comment_body(*options_, line);
}

auto Grammar::code_text(std::string_view line) const -> std::string {
    return code_body(*options_, line);
}

auto Grammar::is_reserved_header(std::string_view text) const -> bool {
    return reserved(*options_, text);
}

}  // namespace annodoc::parser
