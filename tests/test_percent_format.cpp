#include "catch2_custom.hpp"

#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_format.hpp>

#include <optional>
#include <string>
#include <string_view>

using ojcases::ErrorKind;
using ojcases::MatchMode;
using ojcases::PercentFields;
using ojcases::PercentPattern;
using ojcases::PlaceholderTable;
using ojcases::percent_format;
using ojcases::percent_parse;

TEST_CASE("Format without placeholders is unchanged") {
    for (std::string_view format : {"", "plain", "test/sample-1.in", "a.b*c?[d]"}) {
        auto res = percent_format(format, {});
        REQUIRE(res);
        REQUIRE(*res == format);
    }
}

TEST_CASE("Placeholders are substituted") {
    auto res = percent_format("foo %a%a bar %b", {{'a', "AA"}, {'b', "12345"}});
    REQUIRE(res);
    REQUIRE(*res == "foo AAAA bar 12345");

    auto path = percent_format("test_%s/%e.txt", {{'s', "sample-1"}, {'e', "in"}});
    REQUIRE(path);
    REQUIRE(*path == "test_sample-1/in.txt");
}

TEST_CASE("Escaped percent renders as a single percent") {
    auto res = percent_format("%%%s.%e", {{'s', "a"}, {'e', "out"}});
    REQUIRE(res);
    REQUIRE(*res == "%a.out");

    // An explicit identity entry for '%' is allowed
    auto with_entry = percent_format("100%%", {{'%', "%"}});
    REQUIRE(with_entry);
    REQUIRE(*with_entry == "100%");
}

TEST_CASE("Percent entry mapping to anything else is a programming error") {
    REQUIRE_THROWS(percent_format("100%%", {{'%', "percent"}}));
    REQUIRE_THROWS(PercentPattern::compile("100%%", {{'%', "percent"}}));
    REQUIRE_THROWS(percent_parse("100%", "100%%", {{'%', ".*"}}));

    // The identity entry is accepted when matching too
    auto parsed = percent_parse("100%", "100%%", {{'%', "%"}});
    REQUIRE(parsed);
    REQUIRE(parsed->has_value());
}

TEST_CASE("Undefined placeholder") {
    auto res = percent_format("%s.%x", {{'s', "a"}});
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == ErrorKind::UndefinedPlaceholder);
    REQUIRE(res.error().detail == "%x");
}

TEST_CASE("Malformed format is reported by the renderer") {
    auto res = percent_format("%s%", {{'s', "a"}});
    REQUIRE_FALSE(res);
    REQUIRE(res.error() == ErrorKind::MalformedFormat);
}

TEST_CASE("Literal escaping for glob and regex") {
    const PlaceholderTable table{{'s', "*"}, {'e', "*"}};

    auto glob = percent_format("[x]%s*.%e?", table, ojcases::escape_glob_char);
    REQUIRE(glob);
    REQUIRE(*glob == "\\[x\\]*\\*.*\\?");

    REQUIRE(ojcases::escape_glob("dir\\name") == "dir\\\\name");
    REQUIRE(ojcases::escape_regex("a.b+(c)") == "a\\.b\\+\\(c\\)");
    REQUIRE(ojcases::escape_regex("/home/user") == "/home/user");
}

TEST_CASE("Counting capture groups in fragments") {
    REQUIRE(ojcases::count_capture_groups(R"(\d+)") == 0);
    REQUIRE(ojcases::count_capture_groups(R"((\d\d\d)+)") == 1);
    REQUIRE(ojcases::count_capture_groups(R"((?:a)(b(c)))") == 2);
    REQUIRE(ojcases::count_capture_groups(R"(\(x\))") == 0);
    REQUIRE(ojcases::count_capture_groups(R"([(]x[)])") == 0);
    REQUIRE(ojcases::count_capture_groups(R"((?=a)(a))") == 1);
}

TEST_CASE("Parse with literal fragments") {
    auto res = percent_parse("foo AAAA bar 12345", "foo %a%a bar %b", {{'a', "AA"}, {'b', "12345"}});
    REQUIRE(res);
    REQUIRE(res->has_value());
    REQUIRE(**res == PercentFields{{'a', "AA"}, {'b', "12345"}});
}

TEST_CASE("Parse with regex fragments") {
    auto res = percent_parse("123456789", "%x%y%z", {{'x', R"(\d+)"}, {'y', R"(\d)"}, {'z', R"((\d\d\d)+)"}});
    REQUIRE(res);
    REQUIRE(res->has_value());
    REQUIRE(**res == PercentFields{{'x', "12345"}, {'y', "6"}, {'z', "789"}});
}

TEST_CASE("Repeated placeholders must match identical text") {
    auto mismatch = percent_parse("AB", "%a%a", {{'a', "."}});
    REQUIRE(mismatch);
    REQUIRE_FALSE(mismatch->has_value());

    auto same = percent_parse("AA", "%a%a", {{'a', "."}});
    REQUIRE(same);
    REQUIRE(same->has_value());
    REQUIRE((*same)->at('a') == "A");
}

TEST_CASE("Back-references survive groups inside earlier fragments") {
    // 'b' is group 3 here, after 'a' (1) and the group inside 'a' (2)
    const PlaceholderTable table{{'a', R"((\d)+)"}, {'b', "[xy]"}};

    auto res = percent_parse("12x-12x", "%a%b-%a%b", table);
    REQUIRE(res);
    REQUIRE(res->has_value());
    REQUIRE(**res == PercentFields{{'a', "12"}, {'b', "x"}});

    auto mismatch = percent_parse("12x-12y", "%a%b-%a%b", table);
    REQUIRE(mismatch);
    REQUIRE_FALSE(mismatch->has_value());
}

TEST_CASE("Back-reference followed by a literal digit") {
    auto res = percent_parse("a1a1", "%x1%x1", {{'x', "[a-z]"}});
    REQUIRE(res);
    REQUIRE(res->has_value());
    REQUIRE((*res)->at('x') == "a");
}

TEST_CASE("Literal text in the format is not a regex") {
    auto res = percent_parse("a.b", "%s.b", {{'s', "a"}});
    REQUIRE(res);
    REQUIRE(res->has_value());

    auto no_match = percent_parse("aXb", "%s.b", {{'s', "a"}});
    REQUIRE(no_match);
    REQUIRE_FALSE(no_match->has_value());

    auto percent = percent_parse("50%", "%n%%", {{'n', R"(\d+)"}});
    REQUIRE(percent);
    REQUIRE(percent->has_value());
    REQUIRE((*percent)->at('n') == "50");
}

TEST_CASE("Prefix and whole matching") {
    const PlaceholderTable table{{'s', "[a-z]+"}};

    auto prefix = PercentPattern::compile("%s.in", table);
    REQUIRE(prefix);
    REQUIRE(prefix->mode() == MatchMode::Prefix);
    REQUIRE(prefix->match("abc.in.bak").has_value());
    REQUIRE_FALSE(prefix->match("x/abc.in").has_value());

    auto whole = PercentPattern::compile("%s.in", table, "", MatchMode::Whole);
    REQUIRE(whole);
    REQUIRE_FALSE(whole->match("abc.in.bak").has_value());
    REQUIRE(whole->match("abc.in").has_value());
}

TEST_CASE("Literal prefix is matched verbatim") {
    auto pattern = PercentPattern::compile("%s", {{'s', ".+"}}, "/tmp/a+b/", MatchMode::Whole);
    REQUIRE(pattern);

    auto fields = pattern->match("/tmp/a+b/case");
    REQUIRE(fields);
    REQUIRE(fields->at('s') == "case");

    REQUIRE_FALSE(pattern->match("/tmp/aab/case").has_value());
}

TEST_CASE("Pattern errors") {
    auto undefined = PercentPattern::compile("%s.%e", {{'s', ".+"}});
    REQUIRE_FALSE(undefined);
    REQUIRE(undefined.error().kind == ErrorKind::UndefinedPlaceholder);
    REQUIRE(undefined.error().detail == "%e");

    auto malformed = PercentPattern::compile("%s%", {{'s', ".+"}});
    REQUIRE_FALSE(malformed);
    REQUIRE(malformed.error().kind == ErrorKind::MalformedFormat);

    auto invalid = PercentPattern::compile("%s", {{'s', "(unclosed"}});
    REQUIRE_FALSE(invalid);
    REQUIRE(invalid.error().kind == ErrorKind::InvalidPattern);

    auto parse_invalid = percent_parse("x", "%s", {{'s', "[z-a]"}});
    REQUIRE_FALSE(parse_invalid);
    REQUIRE(parse_invalid.error().kind == ErrorKind::InvalidPattern);
}
