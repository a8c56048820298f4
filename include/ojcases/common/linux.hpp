#pragma once

#include <ojcases/common/expected.hpp>
#include <ojcases/logging.hpp>

#include <cerrno>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

#include <glob.h>

namespace ojcases::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// expands a shell wildcard pattern. See glob(3)
/// no matches is an empty result, not a failure; results are sorted
/// returns success/failure; logs failure at debug level
inline Expected<std::vector<std::string>> glob(const std::string& pattern) {
    glob_t buf{};

    int res = ::glob(pattern.c_str(), 0, nullptr, &buf);

    if (res == GLOB_NOMATCH) {
        ::globfree(&buf);
        return std::vector<std::string>{};
    }

    if (res != 0) {
        auto err = make_error_code(res == GLOB_NOSPACE ? ENOMEM : EIO);
        ::globfree(&buf);

        LOG_DEBUG("glob failed for {:?}: '{}'", pattern, err.message());
        return err;
    }

    std::vector<std::string> paths;
    paths.reserve(buf.gl_pathc);
    for (std::size_t i = 0; i < buf.gl_pathc; ++i) {
        paths.emplace_back(buf.gl_pathv[i]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    ::globfree(&buf);

    return paths;
}

} // namespace ojcases::linux
