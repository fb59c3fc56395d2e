#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace annodoc {

/// Type used for anything the annotations leave unspecified.
inline constexpr const char* kUnknownType = "any";

struct ParamDoc {
    std::string name;
    std::string type = kUnknownType;
    std::string description;
    bool optional = false;

    auto operator==(const ParamDoc&) const -> bool = default;
};

struct ReturnDoc {
    std::string type = kUnknownType;
    std::string description;

    auto operator==(const ReturnDoc&) const -> bool = default;
};

struct GenericDoc {
    std::string name;
    std::string type = kUnknownType;

    auto operator==(const GenericDoc&) const -> bool = default;
};

/// A fenced code sample taken from a comment block.
struct Example {
    std::string lang;
    std::string code;

    auto operator==(const Example&) const -> bool = default;
};

/// One documented function, the final output unit of an extraction.
struct FunctionRecord {
    std::string name;
    /// One entry per parameter of the definition, in declaration order.
    std::vector<ParamDoc> params;
    ReturnDoc returns;
    std::vector<GenericDoc> generics;
    std::string description;
    std::vector<Example> examples;
    /// 1-based line of the function definition.
    std::size_t line = 0;

    auto operator==(const FunctionRecord&) const -> bool = default;
};

/// Plain-text multi-line summary of a record, for logs and the scan tool.
[[nodiscard]] auto describe(const FunctionRecord& record) -> std::string;

/// `name(a, b?) -> type`
[[nodiscard]] auto signature_of(const FunctionRecord& record) -> std::string;

}  // namespace annodoc
