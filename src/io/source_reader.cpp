#include <annodoc/io/source_reader.hpp>

#include <annodoc/core/text.hpp>

#include <fstream>
#include <iterator>
#include <utility>

namespace annodoc::io {

auto read_source(std::string_view path) -> std::expected<std::string, std::string> {
    std::ifstream input{std::string(path), std::ios::binary};
    if (!input) {
        return std::unexpected("failed to open source: " + std::string(path));
    }
    std::string source((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return std::unexpected("failed to read source: " + std::string(path));
    }
    return source;
}

auto read_source_lines(std::string_view path)
    -> std::expected<std::vector<std::string>, std::string> {
    auto source = read_source(path);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    return text::split_lines(*source);
}

}  // namespace annodoc::io
