#pragma once

#include <ojcases/cases/extension_tag.hpp>      // IWYU pragma: export
#include <ojcases/cases/file_filter.hpp>        // IWYU pragma: export
#include <ojcases/cases/path_format.hpp>        // IWYU pragma: export
#include <ojcases/cases/relationship.hpp>       // IWYU pragma: export
#include <ojcases/common/error_types.hpp>       // IWYU pragma: export
#include <ojcases/common/expected.hpp>          // IWYU pragma: export
#include <ojcases/format/percent_format.hpp>    // IWYU pragma: export
#include <ojcases/format/percent_tokens.hpp>    // IWYU pragma: export
#include <ojcases/report/reporter.hpp>          // IWYU pragma: export
