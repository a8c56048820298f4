#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <optional>
#include <utility>

namespace ojcases {

class App
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(-1);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace ojcases
