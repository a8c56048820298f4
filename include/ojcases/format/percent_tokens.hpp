#pragma once

#include <ojcases/common/error_types.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace ojcases {

/// One unit of a printf-style format string: a literal character, or a `%` followed by
/// exactly one identifier character. `%%` is a placeholder whose identifier is `%`.
struct PercentToken
{
    enum class Kind { Literal, Placeholder };

    Kind kind;
    char value;

    constexpr bool is_placeholder() const { return kind == Kind::Placeholder; }

    /// `%%`, which always stands for a literal percent sign
    constexpr bool is_escaped_percent() const { return is_placeholder() && value == '%'; }

    /// The characters this token was scanned from
    std::string text() const;

    constexpr bool operator==(const PercentToken& rhs) const = default;
};

/// Lazy forward range over the tokens of an already validated format string.
///
/// Does not own the string. Iterating twice yields the same tokens.
class PercentTokenView
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = PercentToken;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = PercentToken;

        Iterator() = default;

        Iterator(std::string_view str, std::size_t pos)
            : str_{str}
            , pos_{pos} {}

        PercentToken operator*() const;

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& rhs) const { return pos_ == rhs.pos_; }

    private:
        std::size_t width() const { return str_[pos_] == '%' ? 2 : 1; }

        std::string_view str_;
        std::size_t pos_ = 0;
    };

    PercentTokenView() = default;

    Iterator begin() const { return {format_, 0}; }
    Iterator end() const { return {format_, format_.size()}; }

    std::string_view format() const { return format_; }

private:
    friend Result<PercentTokenView> tokenize_percent(std::string_view format);

    explicit PercentTokenView(std::string_view format)
        : format_{format} {}

    std::string_view format_;
};

/// Split ``format`` into literal characters and `%x` placeholders.
///
/// The string is checked once up front; a lone `%` as the final character yields
/// ErrorKind::MalformedFormat rather than being dropped or passed through.
Result<PercentTokenView> tokenize_percent(std::string_view format);

} // namespace ojcases

template <>
struct fmt::formatter<::ojcases::PercentToken> : fmt::formatter<std::string>
{
    auto format(const ::ojcases::PercentToken& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.text(), ctx);
    }
};
