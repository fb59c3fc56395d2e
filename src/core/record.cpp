#include <annodoc/core/record.hpp>

#include <fmt/format.h>

#include <iterator>

namespace annodoc {

auto signature_of(const FunctionRecord& record) -> std::string {
    std::string out = record.name;
    out.push_back('(');
    for (std::size_t i = 0; i < record.params.size(); ++i) {
        const auto& param = record.params[i];
        if (i > 0) {
            out.append(", ");
        }
        out.append(param.name);
        if (param.optional) {
            out.push_back('?');
        }
    }
    out.push_back(')');
    fmt::format_to(std::back_inserter(out), " -> {}", record.returns.type);
    return out;
}

auto describe(const FunctionRecord& record) -> std::string {
    std::string out = fmt::format("{}  [line {}]\n", signature_of(record), record.line);
    auto it = std::back_inserter(out);
    if (!record.description.empty()) {
        fmt::format_to(it, "  {}\n", record.description);
    }
    for (const auto& generic : record.generics) {
        fmt::format_to(it, "  generic {}: {}\n", generic.name, generic.type);
    }
    for (const auto& param : record.params) {
        fmt::format_to(it, "  param {}: {}{}{}\n", param.name, param.type,
                       param.optional ? " (optional)" : "",
                       param.description.empty() ? "" : " - " + param.description);
    }
    fmt::format_to(it, "  returns {}{}\n", record.returns.type,
                   record.returns.description.empty() ? ""
                                                      : " - " + record.returns.description);
    for (const auto& example : record.examples) {
        fmt::format_to(it, "  example ({}):\n", example.lang);
        std::size_t start = 0;
        while (start <= example.code.size()) {
            auto end = example.code.find('\n', start);
            if (end == std::string::npos) {
                end = example.code.size();
            }
            fmt::format_to(it, "    {}\n", example.code.substr(start, end - start));
            start = end + 1;
        }
    }
    return out;
}

}  // namespace annodoc
