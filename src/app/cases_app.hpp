#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/sink.hpp"

#include <ojcases/report/reporter.hpp>

namespace ojcases {

/// Lists the test cases of OPTS.directory, or with --path-of, where one case's files belong
class CasesApp final : public App
{
public:
    /// Output goes to ``sink``, scan diagnostics to ``reporter``
    CasesApp(ProgramOptions opts, Sink& sink, Reporter& reporter);

private:
    int run_impl() override;

    int print_case_paths();
    int list_cases();

    Sink& sink_;
    Reporter& reporter_;
};

} // namespace ojcases
