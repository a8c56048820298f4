#include "app/cases_app.hpp"

#include "output/case_list_serializer.hpp"
#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/cases/path_format.hpp>
#include <ojcases/cases/relationship.hpp>
#include <ojcases/logging.hpp>
#include <ojcases/report/reporter.hpp>

#include <cstdlib>
#include <utility>

namespace ojcases {

CasesApp::CasesApp(ProgramOptions opts, Sink& sink, Reporter& reporter)
    : App{std::move(opts)}
    , sink_{sink}
    , reporter_{reporter} {}

int CasesApp::run_impl() {
    LOG_DEBUG("Directory: {:?}, format: {:?}, ignore backups: {}", OPTS.directory.string(), OPTS.format,
              OPTS.ignore_backup);

    if (OPTS.path_of) {
        return print_case_paths();
    }

    return list_cases();
}

int CasesApp::print_case_paths() {
    const auto input = path_from_format(OPTS.directory, OPTS.format, *OPTS.path_of, ExtensionTag::In);
    const auto output = path_from_format(OPTS.directory, OPTS.format, *OPTS.path_of, ExtensionTag::Out);

    if (!input || !output) {
        report_fmt(reporter_, LogLevel::Error, "cannot compose paths from format {:?}: {}", OPTS.format,
                   input ? output.error() : input.error());
        return EXIT_FAILURE;
    }

    CaseListSerializer serializer{sink_, OPTS.colorize_option};
    serializer.on_case_paths(*OPTS.path_of, *input, *output);
    serializer.finalize();

    return EXIT_SUCCESS;
}

int CasesApp::list_cases() {
    const CollectOptions options{.ignore_backup = OPTS.ignore_backup};

    auto cases = collect_test_cases(OPTS.directory, OPTS.format, options, reporter_);
    if (!cases) {
        // Already reported by the scan itself
        LOG_DEBUG("Scan failed: {}", cases.error());
        return EXIT_FAILURE;
    }

    CaseListSerializer serializer{sink_, OPTS.colorize_option};
    serializer.on_cases(*cases);
    serializer.finalize();

    return EXIT_SUCCESS;
}

} // namespace ojcases
