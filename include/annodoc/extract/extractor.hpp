#pragma once

#include <annodoc/core/record.hpp>
#include <annodoc/parser/annotation.hpp>
#include <annodoc/parser/block.hpp>
#include <annodoc/parser/signature.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace annodoc {

/// Engine configuration. Validated once by Extractor::create.
struct ExtractOptions {
    /// Name segments starting with this prefix mark library-private members.
    std::string private_prefix = "__";
    /// Lines searched after a block for its function definition.
    int lookahead = 10;
    /// Return type of functions without `@return`.
    std::string default_return_type = kUnknownType;
    parser::GrammarOptions grammar;
};

struct ConfigError {
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Per-input counters of the decisions the engine made silently.
struct ExtractStats {
    std::size_t lines = 0;
    std::size_t blocks = 0;
    std::size_t functions = 0;
    /// Blocks with no function definition inside the lookahead window.
    std::size_t orphan_blocks = 0;
    std::size_t unterminated_examples = 0;
    std::size_t private_functions = 0;
    /// `@param` entries naming no parameter of the definition.
    std::size_t unmatched_params = 0;

    auto operator==(const ExtractStats&) const -> bool = default;
};

struct ExtractResult {
    std::vector<FunctionRecord> functions;
    ExtractStats stats;
};

/// Turns the lines of one source file into documented function records.
///
/// Extraction never fails: malformed or orphaned comment blocks degrade to
/// fewer or plainer records. All working state is local to a call, so one
/// Extractor can serve several threads.
class Extractor {
   public:
    [[nodiscard]] static auto create(ExtractOptions options = {})
        -> std::expected<Extractor, ConfigError>;

    [[nodiscard]] auto options() const noexcept -> const ExtractOptions& { return options_; }

    /// Records for `lines`, in source order, private functions removed.
    [[nodiscard]] auto extract(std::vector<std::string> lines) const
        -> std::vector<FunctionRecord>;

    /// Like extract(), also reporting what was dropped along the way.
    [[nodiscard]] auto run(std::vector<std::string> lines) const -> ExtractResult;

    /// Split `source` into lines and run().
    [[nodiscard]] auto run_source(std::string_view source) const -> ExtractResult;

    [[nodiscard]] auto is_private(std::string_view name) const -> bool;

    /// Combine a block with the definition it documents.
    [[nodiscard]] static auto merge(const parser::DocumentationBlock& block,
                                    const parser::FunctionSignature& signature)
        -> FunctionRecord;

   private:
    explicit Extractor(ExtractOptions options);

    ExtractOptions options_;
    parser::Grammar grammar_;
    parser::ParserFn<parser::DocumentationBlock> block_;
};

}  // namespace annodoc
