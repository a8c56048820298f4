#pragma once

#include <ojcases/common/error_types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ojcases {

/// Placeholder identifier -> substitution text (render) or regex fragment (match)
using PlaceholderTable = std::map<char, std::string>;

/// Placeholder identifier -> text captured for it
using PercentFields = std::map<char, std::string>;

/// Rewrites one literal character of a format string for the target pattern language
using LiteralEscaper = std::function<std::string(char)>;

std::string escape_glob_char(char chr);
std::string escape_regex_char(char chr);

/// Escape every character of ``str`` so glob(3) matches it literally
std::string escape_glob(std::string_view str);

/// Escape every character of ``str`` so an ECMAScript regex matches it literally
std::string escape_regex(std::string_view str);

/// Number of capturing groups opened in an ECMAScript regex fragment
std::size_t count_capture_groups(std::string_view fragment);

/// Replace every placeholder in ``format`` with its value in ``table``.
///
/// `%%` renders as `%`. If ``table`` has an entry for `%` it must be `%` itself.
/// Fails with ErrorKind::UndefinedPlaceholder when a placeholder has no entry,
/// and ErrorKind::MalformedFormat on a trailing lone `%`.
Result<std::string> percent_format(std::string_view format, const PlaceholderTable& table);

/// As above, but every literal character (including the `%` of `%%`) goes through
/// ``escape_literal``. Table values are inserted unescaped.
Result<std::string> percent_format(std::string_view format, const PlaceholderTable& table,
                                   const LiteralEscaper& escape_literal);

enum class MatchMode {
    Prefix, ///< The pattern must match starting at the first character of the subject
    Whole,  ///< The pattern must match the subject in its entirety
};

/// A format string compiled into an extraction pattern.
///
/// The first occurrence of each placeholder becomes a capture group around its table
/// fragment; every later occurrence of the same placeholder must repeat the exact text
/// captured the first time.
class PercentPattern
{
public:
    static Result<PercentPattern> compile(std::string_view format, const PlaceholderTable& table,
                                          std::string_view literal_prefix = "", MatchMode mode = MatchMode::Prefix);

    /// Returns std::nullopt if ``subject`` does not conform
    std::optional<PercentFields> match(std::string_view subject) const;

    /// The ECMAScript source the pattern was compiled from
    const std::string& source() const { return source_; }

    MatchMode mode() const { return mode_; }

private:
    PercentPattern(std::string source, std::regex regex, std::vector<std::pair<char, std::size_t>> groups,
                   MatchMode mode);

    std::string source_;
    std::regex regex_;
    /// placeholder identifier -> index of the capture group holding its first occurrence
    std::vector<std::pair<char, std::size_t>> groups_;
    MatchMode mode_;
};

/// Compile ``format`` with ``table`` and match ``subject`` from its start.
///
/// The outer Result carries format/table errors; an empty optional means no match.
Result<std::optional<PercentFields>> percent_parse(std::string_view subject, std::string_view format,
                                                   const PlaceholderTable& table);

} // namespace ojcases
