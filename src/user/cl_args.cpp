#include "user/cl_args.hpp"

#include "user/program_options.hpp"

#include <ojcases/common/expected.hpp>
#include <ojcases/format/percent_tokens.hpp>
#include <ojcases/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace ojcases {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), OJCASES_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("ojcases v{}\nList the test cases stored in a directory, pairing input "
                                            "and output files by the name encoded in their paths.",
                                            OJCASES_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", OJCASES_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-d", "--directory")
        .default_value(std::string{"test"})
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.directory = opt;
        })
        .help("Directory holding the test case files");

    arg_parser_.add_argument("-f", "--format")
        .default_value(std::string{DEFAULT_CASE_FORMAT})
        .metavar("FORMAT")
        .nargs(1)
        .action([this] (const std::string& opt) {
                // Catch a trailing lone '%' here, rather than after globbing
                if (auto tokens = tokenize_percent(opt); !tokens) {
                    throw std::invalid_argument(fmt::format("Format {:?} ends in an unescaped '%'. Use \"%%\" "
                                                            "for a literal percent sign.", opt));
                }
                opts_buffer_.format = opt;
        })
        .help("Path of each case file relative to DIR.\n"
              "%s is the case name, %e is \"in\" or \"out\", %% is a literal '%'");

    arg_parser_.add_argument("--no-ignore-backup")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.ignore_backup = false;
        })
        .help("Do not skip editor backups (foo~, #foo#) and hidden files");

    arg_parser_.add_argument("--path-of")
        .metavar("NAME")
        .nargs(1)
        .action([this] (const std::string& opt) {
                if (opt.empty()) {
                    throw std::invalid_argument("Case name for --path-of must not be empty");
                }
                opts_buffer_.path_of = opt;
        })
        .help("Print the input and output paths of case NAME according to FORMAT, then exit");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    auto& verbose_quiet_mutex = arg_parser_.add_mutually_exclusive_group();

    using VerbosityUnderlyingT = std::underlying_type_t<ProgramOptions::VerbosityLevel>;

    {
    // Block to reduce scope of `using enum`

    using enum ProgramOptions::VerbosityLevel;

    constexpr auto MAX_VERBOSITY_INCREASE = static_cast<VerbosityUnderlyingT>(Trace)
                                          - static_cast<VerbosityUnderlyingT>(DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_DECREASE = static_cast<VerbosityUnderlyingT>(DEFAULT_VERBOSITY_LEVEL)
                                          - static_cast<VerbosityUnderlyingT>(Error);

    verbose_quiet_mutex.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                if (++verbose_count_ > MAX_VERBOSITY_INCREASE) {
                    throw std::invalid_argument("Verbosity specification exceeds max level");
                }
            })
        .append()
        .help(fmt::format("Log with more detail (up to {}x)", MAX_VERBOSITY_INCREASE));

    verbose_quiet_mutex.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                if (++quiet_count_ > MAX_VERBOSITY_DECREASE) {
                    throw std::invalid_argument("Verbosity \"quietness\" specification is lower than min level");
                }
            })
        .append()
        .help(fmt::format("Log with less detail (up to {}x)", MAX_VERBOSITY_DECREASE));

    }

    // clang-format on
}

void CommandLineArgs::resolve_verbosity() {
    if (verbose_count_ == 0 && quiet_count_ == 0) {
        return;
    }

    using VerbosityUnderlyingT = std::underlying_type_t<ProgramOptions::VerbosityLevel>;

    const auto level = static_cast<VerbosityUnderlyingT>(DEFAULT_VERBOSITY_LEVEL) + verbose_count_ - quiet_count_;
    opts_buffer_.verbosity = static_cast<ProgramOptions::VerbosityLevel>(level);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    resolve_verbosity();

    return opts_buffer_;
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace ojcases
