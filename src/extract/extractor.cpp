#include <annodoc/extract/extractor.hpp>

#include <annodoc/core/text.hpp>
#include <annodoc/parser/combinators.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace annodoc {

namespace {

auto validate(const ExtractOptions& options) -> std::expected<void, ConfigError> {
    if (options.lookahead < 0) {
        return std::unexpected(ConfigError{
            .message = fmt::format("lookahead must not be negative (got {})", options.lookahead)});
    }
    if (options.grammar.rich_marker.empty() || options.grammar.plain_marker.empty()) {
        return std::unexpected(ConfigError{.message = "comment markers must not be empty"});
    }
    if (options.grammar.default_code_lang.empty()) {
        return std::unexpected(ConfigError{.message = "default code language must not be empty"});
    }
    if (options.default_return_type.empty()) {
        return std::unexpected(ConfigError{.message = "default return type must not be empty"});
    }
    return {};
}

auto count_unmatched(const parser::DocumentationBlock& block,
                     const parser::FunctionSignature& signature) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(block.params, [&](const ParamDoc& p) {
        return std::ranges::find(signature.params, p.name) == signature.params.end();
    }));
}

}  // namespace

auto ConfigError::format() const -> std::string {
    return fmt::format("invalid configuration: {}", message);
}

auto Extractor::create(ExtractOptions options) -> std::expected<Extractor, ConfigError> {
    if (auto valid = validate(options); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return Extractor(std::move(options));
}

Extractor::Extractor(ExtractOptions options)
    : options_(std::move(options)),
      grammar_(options_.grammar),
      block_(parser::documentation_block(grammar_, options_.default_return_type)) {}

auto Extractor::is_private(std::string_view name) const -> bool {
    const std::string_view prefix = options_.private_prefix;
    if (prefix.empty()) {
        return false;
    }
    std::size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find_first_of(".:", start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        if (name.substr(start, end - start).starts_with(prefix)) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

auto Extractor::merge(const parser::DocumentationBlock& block,
                      const parser::FunctionSignature& signature) -> FunctionRecord {
    FunctionRecord record{
        .name = signature.name,
        .params = {},
        .returns = block.returns,
        .generics = block.generics,
        .description = text::join(block.description, " "),
        .examples = block.examples,
    };
    record.params.reserve(signature.params.size());
    for (const auto& name : signature.params) {
        if (const auto* doc = block.find_param(name); doc != nullptr) {
            record.params.push_back(*doc);
        } else {
            record.params.push_back(ParamDoc{
                .name = name, .type = kUnknownType, .description = {}, .optional = false});
        }
    }
    return record;
}

auto Extractor::run(std::vector<std::string> lines) const -> ExtractResult {
    ExtractResult result;
    auto& stats = result.stats;
    stats.lines = lines.size();

    const auto definition =
        parser::seek(parser::function_definition(), static_cast<std::size_t>(options_.lookahead));

    parser::ParserState state(std::move(lines));
    while (!state.at_end()) {
        auto block = block_(state);
        if (block.is_nothing()) {
            state = state.advance();
            continue;
        }
        auto [doc, after_block] = std::move(block).value();
        state = std::move(after_block);
        stats.blocks += 1;
        stats.unterminated_examples += doc.unterminated_examples;
        if (doc.unterminated_examples > 0) {
            spdlog::debug("lines {}-{}: dropped unterminated code example", doc.first_line,
                          doc.last_line);
        }

        auto found = definition(state);
        if (found.is_nothing()) {
            stats.orphan_blocks += 1;
            spdlog::debug("lines {}-{}: no function definition within {} lines", doc.first_line,
                          doc.last_line, options_.lookahead);
            continue;
        }
        auto [signature, after_definition] = std::move(found).value();
        auto record = merge(doc, signature);
        record.line = after_definition.position() - 1;
        stats.unmatched_params += count_unmatched(doc, signature);
        state = std::move(after_definition);

        if (is_private(record.name)) {
            stats.private_functions += 1;
            spdlog::debug("line {}: skipping private function {}", record.line, record.name);
            continue;
        }
        stats.functions += 1;
        result.functions.push_back(std::move(record));
    }
    return result;
}

auto Extractor::extract(std::vector<std::string> lines) const -> std::vector<FunctionRecord> {
    return run(std::move(lines)).functions;
}

auto Extractor::run_source(std::string_view source) const -> ExtractResult {
    return run(text::split_lines(source));
}

}  // namespace annodoc
