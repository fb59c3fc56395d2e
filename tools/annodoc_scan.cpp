#include <annodoc/core/record.hpp>
#include <annodoc/extract/extractor.hpp>
#include <annodoc/io/source_reader.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"annodoc_scan: list documented functions found in source files"};
    app.set_version_flag("--version", "annodoc_scan 0.1.0");

    std::vector<std::string> inputs;
    annodoc::ExtractOptions options;
    bool verbose = false;
    bool stats = false;

    app.add_option("inputs", inputs, "Source files to scan")->required();
    app.add_option("--private-prefix", options.private_prefix,
                   "Name segment prefix marking private functions")
        ->capture_default_str();
    app.add_option("--lookahead", options.lookahead,
                   "Lines searched after a comment block for its function")
        ->capture_default_str();
    app.add_option("--default-return", options.default_return_type,
                   "Return type of functions without @return")
        ->capture_default_str();
    app.add_option("--code-lang", options.grammar.default_code_lang,
                   "Language of code fences without a tag")
        ->capture_default_str();
    app.add_flag("--stats", stats, "Print per-file extraction counters");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto extractor = annodoc::Extractor::create(options);
    if (!extractor) {
        spdlog::error("{}", extractor.error().format());
        return 2;
    }

    int status = 0;
    for (const auto& path : inputs) {
        auto lines = annodoc::io::read_source_lines(path);
        if (!lines) {
            spdlog::error("{}", lines.error());
            status = 1;
            continue;
        }
        spdlog::debug("scanning {} ({} lines)", path, lines->size());

        auto result = extractor->run(std::move(*lines));
        fmt::print("== {} ({} functions)\n", path, result.functions.size());
        for (const auto& record : result.functions) {
            fmt::print("{}", annodoc::describe(record));
        }
        if (stats) {
            const auto& s = result.stats;
            fmt::print(
                "-- blocks: {}, functions: {}, orphan blocks: {}, private: {}, "
                "unterminated examples: {}, unmatched params: {}\n",
                s.blocks, s.functions, s.orphan_blocks, s.private_functions,
                s.unterminated_examples, s.unmatched_params);
        }
    }
    return status;
}
