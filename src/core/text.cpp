#include <annodoc/core/text.hpp>

#include <cctype>

namespace annodoc::text {

auto split_lines(std::string_view source) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        std::string_view line = source.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

auto is_space(char ch) -> bool {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

auto is_ident_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto trim_left(std::string_view text) -> std::string_view {
    std::size_t i = 0;
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    return text.substr(i);
}

auto trim_right(std::string_view text) -> std::string_view {
    std::size_t n = text.size();
    while (n > 0 && is_space(text[n - 1])) {
        --n;
    }
    return text.substr(0, n);
}

auto trim(std::string_view text) -> std::string_view {
    return trim_right(trim_left(text));
}

auto is_blank(std::string_view text) -> bool {
    return trim_left(text).empty();
}

auto take_identifier(std::string_view text) -> std::string_view {
    std::size_t n = 0;
    while (n < text.size() && is_ident_char(text[n])) {
        ++n;
    }
    return text.substr(0, n);
}

auto first_word(std::string_view text) -> std::string_view {
    text = trim_left(text);
    std::size_t n = 0;
    while (n < text.size() && !is_space(text[n])) {
        ++n;
    }
    return text.substr(0, n);
}

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(parts[i]);
    }
    return out;
}

}  // namespace annodoc::text
