#pragma once

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/common/error_types.hpp>
#include <ojcases/report/reporter.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ojcases {

/// The files making up one test case. Always has an ExtensionTag::In entry once built.
using TestCaseFiles = std::map<ExtensionTag, std::filesystem::path>;

/// Test case name -> its files, ordered by name
using TestCaseMap = std::map<std::string, TestCaseFiles>;

/**
 * @brief Group case files found under ``directory`` into test cases by the name they encode
 *
 * Every path is resolved and matched against ``format`` (`%s` = name, `%e` = `in` or `out`),
 * relative to the resolved ``directory``. The paths stored in the result are the ones passed in.
 *
 * Fails on the first problem found, reporting it at error level first:
 *   - ErrorKind::UnrecognizedFile - a path does not conform to ``format``
 *   - ErrorKind::DuplicateCase    - two paths claim the same name and extension
 *   - ErrorKind::DanglingOutput   - a case has an output file but no input file
 *   - ErrorKind::NoCasesFound     - ``paths`` produced no cases at all
 * plus any error from compiling ``format``.
 *
 * On success, the number of cases is reported at info level.
 */
Result<TestCaseMap> construct_relationship_of_files(const std::vector<std::filesystem::path>& paths,
                                                    const std::filesystem::path& directory, std::string_view format,
                                                    Reporter& reporter);

struct CollectOptions
{
    /// Drop editor backups and dotfiles before grouping
    bool ignore_backup = true;
};

/// Glob ``directory`` for files matching ``format``, then group them into test cases
Result<TestCaseMap> collect_test_cases(const std::filesystem::path& directory, std::string_view format,
                                       const CollectOptions& options, Reporter& reporter);

} // namespace ojcases
