#include <ojcases/format/percent_format.hpp>

#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_tokens.hpp>
#include <ojcases/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/find.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ojcases {

namespace {

constexpr std::string_view GLOB_SPECIAL_CHARS = "*?[]\\";
constexpr std::string_view REGEX_SPECIAL_CHARS = "\\^$.|?*+()[]{}";

std::string escape_if_in(char chr, std::string_view special) {
    if (special.find(chr) != std::string_view::npos) {
        return {'\\', chr};
    }
    return {chr};
}

std::string escape_all(std::string_view str, std::string (*escape_char)(char)) {
    std::string result;
    result.reserve(str.size());

    for (char chr : str) {
        result += escape_char(chr);
    }

    return result;
}

std::string identity_escape(char chr) {
    return {chr};
}

} // namespace

std::string escape_glob_char(char chr) {
    return escape_if_in(chr, GLOB_SPECIAL_CHARS);
}

std::string escape_regex_char(char chr) {
    return escape_if_in(chr, REGEX_SPECIAL_CHARS);
}

std::string escape_glob(std::string_view str) {
    return escape_all(str, escape_glob_char);
}

std::string escape_regex(std::string_view str) {
    return escape_all(str, escape_regex_char);
}

std::size_t count_capture_groups(std::string_view fragment) {
    std::size_t count = 0;
    bool in_class = false;

    for (std::size_t i = 0; i < fragment.size(); ++i) {
        const char chr = fragment[i];

        if (chr == '\\') {
            ++i; // the escaped character can't open or close anything
            continue;
        }

        if (in_class) {
            in_class = chr != ']';
            continue;
        }

        if (chr == '[') {
            in_class = true;
        } else if (chr == '(' && (i + 1 == fragment.size() || fragment[i + 1] != '?')) {
            ++count;
        }
    }

    return count;
}

Result<std::string> percent_format(std::string_view format, const PlaceholderTable& table) {
    return percent_format(format, table, identity_escape);
}

Result<std::string> percent_format(std::string_view format, const PlaceholderTable& table,
                                   const LiteralEscaper& escape_literal) {
    ASSERT(!table.contains('%') || table.at('%') == "%", "the '%' placeholder may only map to itself");

    const PercentTokenView tokens = TRY(tokenize_percent(format));

    std::string result;

    for (const PercentToken token : tokens) {
        if (!token.is_placeholder() || token.is_escaped_percent()) {
            result += escape_literal(token.value);
            continue;
        }

        auto entry = table.find(token.value);
        if (entry == table.end()) {
            return make_error(ErrorKind::UndefinedPlaceholder, token.text());
        }

        result += entry->second;
    }

    return result;
}

PercentPattern::PercentPattern(std::string source, std::regex regex,
                               std::vector<std::pair<char, std::size_t>> groups, MatchMode mode)
    : source_{std::move(source)}
    , regex_{std::move(regex)}
    , groups_{std::move(groups)}
    , mode_{mode} {}

Result<PercentPattern> PercentPattern::compile(std::string_view format, const PlaceholderTable& table,
                                               std::string_view literal_prefix, MatchMode mode) {
    ASSERT(!table.contains('%') || table.at('%') == "%", "the '%' placeholder may only map to itself");

    const PercentTokenView tokens = TRY(tokenize_percent(format));

    std::string source = escape_regex(literal_prefix);
    std::vector<std::pair<char, std::size_t>> groups;
    std::size_t next_group = 1;

    for (const PercentToken token : tokens) {
        if (!token.is_placeholder() || token.is_escaped_percent()) {
            source += escape_regex_char(token.value);
            continue;
        }

        // Wrapped in a non-capturing group so a literal digit after it can't extend the number
        if (auto seen = ranges::find(groups, token.value, &std::pair<char, std::size_t>::first);
            seen != groups.end()) {
            source += fmt::format("(?:\\{})", seen->second);
            continue;
        }

        auto entry = table.find(token.value);
        if (entry == table.end()) {
            return make_error(ErrorKind::UndefinedPlaceholder, token.text());
        }

        groups.emplace_back(token.value, next_group);
        source += fmt::format("({})", entry->second);
        next_group += 1 + count_capture_groups(entry->second);
    }

    LOG_DEBUG("Compiled format {:?} to regex: {:?}", format, source);

    try {
        std::regex regex{source, std::regex::ECMAScript};
        return PercentPattern{std::move(source), std::move(regex), std::move(groups), mode};
    } catch (const std::regex_error& err) {
        return make_error(ErrorKind::InvalidPattern, fmt::format("{:?} ({})", source, err.what()));
    }
}

std::optional<PercentFields> PercentPattern::match(std::string_view subject) const {
    std::match_results<std::string_view::const_iterator> match;

    const bool matched =
        mode_ == MatchMode::Whole
            ? std::regex_match(subject.begin(), subject.end(), match, regex_)
            : std::regex_search(subject.begin(), subject.end(), match, regex_, std::regex_constants::match_continuous);

    if (!matched) {
        LOG_TRACE("{:?} does not match {:?}", subject, source_);
        return std::nullopt;
    }

    PercentFields fields;
    for (const auto& [name, index] : groups_) {
        fields.emplace(name, match[index].str());
    }

    return fields;
}

Result<std::optional<PercentFields>> percent_parse(std::string_view subject, std::string_view format,
                                                   const PlaceholderTable& table) {
    const PercentPattern pattern = TRY(PercentPattern::compile(format, table));

    return pattern.match(subject);
}

} // namespace ojcases
