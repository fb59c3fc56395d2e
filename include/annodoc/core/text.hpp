#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace annodoc::text {

/// Split a source buffer into lines. Accepts `\n` and `\r\n` endings; a
/// trailing newline does not produce an extra empty line.
[[nodiscard]] auto split_lines(std::string_view source) -> std::vector<std::string>;

[[nodiscard]] auto trim(std::string_view text) -> std::string_view;
[[nodiscard]] auto trim_left(std::string_view text) -> std::string_view;
[[nodiscard]] auto trim_right(std::string_view text) -> std::string_view;

/// True when the text is empty or whitespace only.
[[nodiscard]] auto is_blank(std::string_view text) -> bool;

[[nodiscard]] auto is_space(char ch) -> bool;
[[nodiscard]] auto is_ident_char(char ch) -> bool;

/// Leading run of identifier characters.
[[nodiscard]] auto take_identifier(std::string_view text) -> std::string_view;

/// First whitespace-delimited word.
[[nodiscard]] auto first_word(std::string_view text) -> std::string_view;

[[nodiscard]] auto join(const std::vector<std::string>& parts, std::string_view separator)
    -> std::string;

}  // namespace annodoc::text
