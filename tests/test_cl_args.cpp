#include "catch2_custom.hpp"

#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <array>
#include <span>
#include <string>

using ojcases::CommandLineArgs;
using ojcases::ProgramOptions;

namespace {

template <std::size_t N>
auto parse(std::array<const char*, N> args) {
    CommandLineArgs cl_args{std::span<const char*>{args}};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Defaults with no arguments") {
    auto res = parse(std::array{"ojcases"});
    REQUIRE(res);

    const ProgramOptions& opts = res.value();
    REQUIRE(opts.directory.string() == "test");
    REQUIRE(opts.format == "%s.%e");
    REQUIRE(opts.ignore_backup);
    REQUIRE_FALSE(opts.path_of.has_value());
    REQUIRE_FALSE(opts.verbosity.has_value());
    REQUIRE(opts.colorize_option == ProgramOptions::ColorizeOpt::Auto);
}

TEST_CASE("Directory, format and backup options") {
    auto res = parse(std::array{"/usr/bin/ojcases", "-d", "cases", "--format", "test_%s/%e.txt", "--no-ignore-backup"});
    REQUIRE(res);

    REQUIRE(res->directory.string() == "cases");
    REQUIRE(res->format == "test_%s/%e.txt");
    REQUIRE_FALSE(res->ignore_backup);
}

TEST_CASE("Case name for --path-of") {
    auto res = parse(std::array{"ojcases", "--path-of", "sample-3"});
    REQUIRE(res);
    REQUIRE(res->path_of == std::string{"sample-3"});

    REQUIRE_FALSE(parse(std::array{"ojcases", "--path-of", ""}));
}

TEST_CASE("Color option") {
    using enum ProgramOptions::ColorizeOpt;

    REQUIRE(parse(std::array{"ojcases", "-c", "never"})->colorize_option == Never);
    REQUIRE(parse(std::array{"ojcases", "--color", "always"})->colorize_option == Always);
    REQUIRE_FALSE(parse(std::array{"ojcases", "--color", "sometimes"}));
}

TEST_CASE("Verbosity is counted from -v and -q") {
    using enum ProgramOptions::VerbosityLevel;

    REQUIRE(parse(std::array{"ojcases", "-v"})->verbosity == Debug);
    REQUIRE(parse(std::array{"ojcases", "-v", "-v"})->verbosity == Trace);
    REQUIRE(parse(std::array{"ojcases", "-q"})->verbosity == Warning);
    REQUIRE(parse(std::array{"ojcases", "-q", "-q"})->verbosity == Error);

    REQUIRE_FALSE(parse(std::array{"ojcases", "-v", "-v", "-v"}));
    REQUIRE_FALSE(parse(std::array{"ojcases", "-v", "-q"}));
}

TEST_CASE("Format ending in a lone percent is rejected") {
    auto res = parse(std::array{"ojcases", "-f", "%s.%"});
    REQUIRE_FALSE(res);
    REQUIRE(res.error().find("unescaped '%'") != std::string::npos);

    REQUIRE(parse(std::array{"ojcases", "-f", "%s.%%"}));
}
