#pragma once

#include <fmt/format.h>

#include <optional>
#include <string_view>

namespace ojcases {

/// Role of a file within a test case
enum class ExtensionTag { In, Out };

constexpr std::string_view to_string(ExtensionTag tag) {
    return tag == ExtensionTag::In ? "in" : "out";
}

constexpr std::optional<ExtensionTag> parse_extension_tag(std::string_view str) {
    if (str == "in") {
        return ExtensionTag::In;
    }
    if (str == "out") {
        return ExtensionTag::Out;
    }
    return std::nullopt;
}

} // namespace ojcases

template <>
struct fmt::formatter<::ojcases::ExtensionTag> : fmt::formatter<std::string_view>
{
    auto format(::ojcases::ExtensionTag from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::ojcases::to_string(from), ctx);
    }
};
