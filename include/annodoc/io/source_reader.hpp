#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace annodoc::io {

/// Read a whole source file into memory.
[[nodiscard]] auto read_source(std::string_view path) -> std::expected<std::string, std::string>;

/// Read a source file and split it into lines.
[[nodiscard]] auto read_source_lines(std::string_view path)
    -> std::expected<std::vector<std::string>, std::string>;

}  // namespace annodoc::io
