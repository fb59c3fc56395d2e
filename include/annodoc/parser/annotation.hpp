#pragma once

#include <annodoc/core/functional.hpp>
#include <annodoc/parser/state.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace annodoc::parser {

// ─── Annotation tokens ────────────────────────────────────────────────────────

struct GenericAnnotation {
    std::string name;
    auto operator==(const GenericAnnotation&) const -> bool = default;
};

struct ParamAnnotation {
    std::string name;
    std::string type;
    std::string description;
    bool optional = false;
    auto operator==(const ParamAnnotation&) const -> bool = default;
};

struct ReturnAnnotation {
    std::string type;
    std::string description;
    auto operator==(const ReturnAnnotation&) const -> bool = default;
};

struct CodeBlockStart {
    std::string lang;
    auto operator==(const CodeBlockStart&) const -> bool = default;
};

struct CodeBlockEnd {
    auto operator==(const CodeBlockEnd&) const -> bool = default;
};

/// Prose line, or a line of code while inside a fenced block.
struct DescriptionText {
    std::string text;
    auto operator==(const DescriptionText&) const -> bool = default;
};

using AnnotationToken = std::variant<GenericAnnotation, ParamAnnotation, ReturnAnnotation,
                                     CodeBlockStart, CodeBlockEnd, DescriptionText>;

// ─── Grammar ──────────────────────────────────────────────────────────────────

struct GrammarOptions {
    /// Marker of documentation comments.
    std::string rich_marker = "---";
    /// Marker of ordinary comments; also scanned.
    std::string plain_marker = "--";
    /// Language of fenced blocks opened without a tag.
    std::string default_code_lang = "lua";
    /// Section headers dropped from the description (matched on first word).
    std::vector<std::string> reserved_headers = {"Behaviour", "Performance"};
};

/// Line-level recognizers. Each takes comment text (marker already removed
/// and trimmed) and yields a token only when the line has that exact shape.
[[nodiscard]] auto scan_generic(std::string_view text) -> Maybe<GenericAnnotation>;
[[nodiscard]] auto scan_param(std::string_view text) -> Maybe<ParamAnnotation>;
[[nodiscard]] auto scan_return(std::string_view text) -> Maybe<ReturnAnnotation>;
[[nodiscard]] auto scan_fence_start(std::string_view text, std::string_view default_lang)
    -> Maybe<CodeBlockStart>;
[[nodiscard]] auto scan_fence_end(std::string_view text) -> Maybe<CodeBlockEnd>;

/// The annotation grammar over raw source lines.
///
/// Outside a fenced block the rules are tried in this order, first match
/// wins: generic, param, return, fence start, fence end, description. Inside
/// a fenced block (per the state's context) only the closing fence and code
/// text are recognized. Comment lines that match no rule, such as reserved
/// section headers and empty lines, are consumed and yield Nothing.
class Grammar {
   public:
    explicit Grammar(GrammarOptions options = {});

    [[nodiscard]] auto options() const noexcept -> const GrammarOptions& { return *options_; }

    [[nodiscard]] auto is_comment(std::string_view line) const -> bool;

    /// Comment body with the marker stripped and surrounding space trimmed.
    [[nodiscard]] auto comment_text(std::string_view line) const -> std::string;

    /// Comment body for code: marker and one separating space stripped,
    /// indentation kept, trailing space trimmed.
    [[nodiscard]] auto code_text(std::string_view line) const -> std::string;

    [[nodiscard]] auto is_reserved_header(std::string_view text) const -> bool;

    /// Consumes one comment line, yielding the raw line.
    [[nodiscard]] auto comment_line() const -> const ParserFn<std::string>& {
        return comment_line_;
    }

    /// Consumes one comment line, yielding its token if it carries one.
    [[nodiscard]] auto annotation() const -> const ParserFn<Maybe<AnnotationToken>>& {
        return annotation_;
    }

   private:
    std::shared_ptr<const GrammarOptions> options_;
    ParserFn<std::string> comment_line_;
    ParserFn<Maybe<AnnotationToken>> annotation_;
};

}  // namespace annodoc::parser
