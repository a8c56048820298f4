#include "app/cases_app.hpp"
#include "output/stdout_sink.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <ojcases/logging.hpp>
#include <ojcases/report/reporter.hpp>

#include <cstddef>
#include <span>

namespace {

spdlog::level::level_enum to_spdlog_level(ojcases::ProgramOptions::VerbosityLevel verbosity) {
    using enum ojcases::ProgramOptions::VerbosityLevel;

    switch (verbosity) {
    case Error:
        return spdlog::level::err;
    case Warning:
        return spdlog::level::warn;
    case Info:
        return spdlog::level::info;
    case Debug:
        return spdlog::level::debug;
    case Trace:
        return spdlog::level::trace;
    }

    return spdlog::level::info;
}

} // namespace

int main(int argc, const char* argv[]) {
    ojcases::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const ojcases::ProgramOptions options = ojcases::parse_args_or_exit(args);

    if (options.verbosity) {
        spdlog::set_level(to_spdlog_level(*options.verbosity));
    }

    ojcases::StdoutSink output_sink;
    ojcases::SpdlogReporter reporter;

    ojcases::CasesApp app{options, output_sink, reporter};

    return app.run();
}
