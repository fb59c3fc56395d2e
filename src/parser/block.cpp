#include <annodoc/parser/block.hpp>

#include <annodoc/core/text.hpp>

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace annodoc::parser {

namespace {

/// Folds annotation tokens into a block. Fence state lives in the parser
/// context; only the pending code lines are buffered here.
class BlockBuilder {
   public:
    explicit BlockBuilder(std::string default_return_type) {
        block_.returns = ReturnDoc{.type = std::move(default_return_type), .description = {}};
    }

    auto apply(AnnotationToken token, const ParserState& state) -> ParserState {
        return std::visit(
            [&](auto&& tok) -> ParserState {
                using T = std::decay_t<decltype(tok)>;
                if constexpr (std::is_same_v<T, GenericAnnotation>) {
                    block_.generics.push_back(
                        GenericDoc{.name = std::move(tok.name), .type = kUnknownType});
                    return state;
                } else if constexpr (std::is_same_v<T, ParamAnnotation>) {
                    block_.params.push_back(ParamDoc{.name = std::move(tok.name),
                                                     .type = std::move(tok.type),
                                                     .description = std::move(tok.description),
                                                     .optional = tok.optional});
                    return state;
                } else if constexpr (std::is_same_v<T, ReturnAnnotation>) {
                    block_.returns = ReturnDoc{.type = std::move(tok.type),
                                               .description = std::move(tok.description)};
                    return state;
                } else if constexpr (std::is_same_v<T, CodeBlockStart>) {
                    code_.clear();
                    return state.with_context(ParseContext{.in_code_block = true,
                                                           .code_block_lang = std::move(tok.lang),
                                                           .section = Section::Example});
                } else if constexpr (std::is_same_v<T, CodeBlockEnd>) {
                    if (!state.context().in_code_block) {
                        return state;
                    }
                    block_.examples.push_back(Example{.lang = state.context().code_block_lang,
                                                      .code = text::join(code_, "\n")});
                    code_.clear();
                    return state.with_context(ParseContext{});
                } else {
                    if (state.context().section == Section::Example) {
                        code_.push_back(std::move(tok.text));
                    } else {
                        block_.description.push_back(std::move(tok.text));
                    }
                    return state;
                }
            },
            std::move(token));
    }

    auto finish(const ParserState& state) -> DocumentationBlock {
        if (state.context().in_code_block) {
            block_.unterminated_examples += 1;
        }
        return std::move(block_);
    }

    auto block() -> DocumentationBlock& { return block_; }

   private:
    DocumentationBlock block_;
    std::vector<std::string> code_;
};

/// Offset of the next non-blank line, or Nothing when only blank lines
/// remain.
auto next_non_blank(const ParserState& state) -> Maybe<std::size_t> {
    for (std::size_t offset = 0;; ++offset) {
        auto line = state.peek(offset);
        if (line.is_nothing()) {
            return nothing;
        }
        if (!text::is_blank(*line)) {
            return just(offset);
        }
    }
}

}  // namespace

auto DocumentationBlock::find_param(std::string_view name) const -> const ParamDoc* {
    auto it = std::ranges::find_if(params, [name](const ParamDoc& p) { return p.name == name; });
    return it == params.end() ? nullptr : &*it;
}

auto documentation_block(Grammar grammar, std::string default_return_type)
    -> ParserFn<DocumentationBlock> {
    return [grammar = std::move(grammar), default_return_type = std::move(default_return_type)](
               const ParserState& start) -> ParseResult<DocumentationBlock> {
        if (start.at_end() || !grammar.is_comment(start.current())) {
            return failure<DocumentationBlock>();
        }

        BlockBuilder builder(default_return_type);
        builder.block().first_line = start.position();
        ParserState state = start.with_context(ParseContext{});

        while (!state.at_end()) {
            if (text::is_blank(state.current())) {
                auto offset = next_non_blank(state);
                if (offset.is_nothing() || !grammar.is_comment(*state.peek(*offset))) {
                    break;
                }
                state = state.advance(*offset);
                continue;
            }
            auto result = grammar.annotation()(state);
            if (result.is_nothing()) {
                break;
            }
            auto parsed = std::move(result).value();
            builder.block().last_line = state.position();
            state = std::move(parsed.state);
            if (parsed.value.is_just()) {
                state = builder.apply(std::move(parsed.value).value(), state);
            }
        }

        auto block = builder.finish(state);
        return success(std::move(block), state.with_context(ParseContext{}));
    };
}

}  // namespace annodoc::parser
