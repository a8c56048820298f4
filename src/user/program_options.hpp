#pragma once

#include <ojcases/cases/path_format.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace ojcases {

struct ProgramOptions
{
    /// Log level chosen with -v / -q. Unset keeps the default (or LOG_LEVEL, if given)
    enum class VerbosityLevel { Error, Warning, Info, Debug, Trace };
    std::optional<VerbosityLevel> verbosity;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    std::filesystem::path directory = "test";
    std::string format{DEFAULT_CASE_FORMAT};

    bool ignore_backup = true;

    /// Print the paths case NAME would be stored at, and exit without scanning
    std::optional<std::string> path_of;
};

} // namespace ojcases
