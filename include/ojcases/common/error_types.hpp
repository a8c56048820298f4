#pragma once

#include <ojcases/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace ojcases {

// NOLINTNEXTLINE
enum class ErrorKind {
    MalformedFormat,      ///< Format string ends in a lone '%'
    UndefinedPlaceholder, ///< A placeholder has no entry in the placeholder table
    InvalidPattern,       ///< A placeholder's regex fragment does not compile
    UnrecognizedFile,     ///< A candidate path does not conform to the active format
    DuplicateCase,        ///< Two candidates resolved to the same (name, ext) pair
    DanglingOutput,       ///< An output file has no input file under the same name
    NoCasesFound,         ///< A scan produced zero test cases
    GlobFailure,          ///< glob(3) failed for a reason other than "no match"
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MalformedFormat:
        return "MalformedFormat";
    case ErrorKind::UndefinedPlaceholder:
        return "UndefinedPlaceholder";
    case ErrorKind::InvalidPattern:
        return "InvalidPattern";
    case ErrorKind::UnrecognizedFile:
        return "UnrecognizedFile";
    case ErrorKind::DuplicateCase:
        return "DuplicateCase";
    case ErrorKind::DanglingOutput:
        return "DanglingOutput";
    case ErrorKind::NoCasesFound:
        return "NoCasesFound";
    case ErrorKind::GlobFailure:
        return "GlobFailure";
    }
    return "<unknown>";
}

/// An error kind together with the offending input (path, placeholder or format string)
struct Error
{
    ErrorKind kind;
    std::string detail;

    bool operator==(const Error& rhs) const = default;

    bool operator==(ErrorKind rhs) const { return kind == rhs; }
};

inline Error make_error(ErrorKind kind, std::string detail = "") {
    return Error{.kind = kind, .detail = std::move(detail)};
}

template <typename T = void>
using Result = Expected<T, Error>;

} // namespace ojcases

template <>
struct fmt::formatter<::ojcases::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::ojcases::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::ojcases::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::ojcases::Error> : fmt::formatter<std::string>
{
    auto format(const ::ojcases::Error& from, fmt::format_context& ctx) const {
        if (from.detail.empty()) {
            return fmt::formatter<std::string>::format(fmt::format("{}", from.kind), ctx);
        }
        return fmt::formatter<std::string>::format(fmt::format("{}: {}", from.kind, from.detail), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::ojcases::ErrorKind;                                                                           \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident.value());                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
