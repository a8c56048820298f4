#include "catch2_custom.hpp"

#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_tokens.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <string_view>
#include <vector>

using ojcases::ErrorKind;
using ojcases::PercentToken;
using ojcases::tokenize_percent;

namespace {

std::vector<std::string> token_texts(std::string_view format) {
    auto tokens = tokenize_percent(format);
    REQUIRE(tokens);

    return *tokens | ranges::views::transform([](PercentToken token) { return token.text(); }) |
           ranges::to<std::vector>();
}

} // namespace

TEST_CASE("Literal characters are one token each") {
    REQUIRE(token_texts("abc") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(token_texts("").empty());
}

TEST_CASE("Placeholders consume two characters") {
    REQUIRE(token_texts("test_%s/in.txt") ==
            std::vector<std::string>{"t", "e", "s", "t", "_", "%s", "/", "i", "n", ".", "t", "x", "t"});
    REQUIRE(token_texts("%s.%e") == std::vector<std::string>{"%s", ".", "%e"});
    REQUIRE(token_texts("%a%a") == std::vector<std::string>{"%a", "%a"});
}

TEST_CASE("Escaped percent signs") {
    REQUIRE(token_texts("100%%") == std::vector<std::string>{"1", "0", "0", "%%"});
    REQUIRE(token_texts("%%%s") == std::vector<std::string>{"%%", "%s"});

    auto tokens = tokenize_percent("%%");
    REQUIRE(tokens);

    const PercentToken token = *tokens->begin();
    REQUIRE(token.is_placeholder());
    REQUIRE(token.is_escaped_percent());
    REQUIRE(token.value == '%');
}

TEST_CASE("Token kinds and values") {
    auto tokens = tokenize_percent("x%y");
    REQUIRE(tokens);

    auto iter = tokens->begin();
    REQUIRE(*iter == PercentToken{.kind = PercentToken::Kind::Literal, .value = 'x'});
    ++iter;
    REQUIRE(*iter == PercentToken{.kind = PercentToken::Kind::Placeholder, .value = 'y'});
    REQUIRE(!(*iter).is_escaped_percent());
    ++iter;
    REQUIRE(iter == tokens->end());
}

TEST_CASE("Trailing lone percent is rejected") {
    for (std::string_view format : {"%", "abc%", "%s.%e%", "%%%"}) {
        auto tokens = tokenize_percent(format);
        REQUIRE_FALSE(tokens);
        REQUIRE(tokens.error().kind == ErrorKind::MalformedFormat);
        REQUIRE(tokens.error().detail == format);
    }

    // An even run of '%' at the end is just escaped percents
    REQUIRE(tokenize_percent("abc%%"));
}

TEST_CASE("Token view can be iterated more than once") {
    auto tokens = tokenize_percent("a%bc");
    REQUIRE(tokens);

    const auto first = *tokens | ranges::to<std::vector>();
    const auto second = *tokens | ranges::to<std::vector>();

    REQUIRE(first.size() == 3);
    REQUIRE(first == second);
}
