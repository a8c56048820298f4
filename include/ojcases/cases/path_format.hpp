#pragma once

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_format.hpp>
#include <ojcases/report/reporter.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ojcases {

/// Placeholder naming a test case
inline constexpr char NAME_PLACEHOLDER = 's';
/// Placeholder standing for an ExtensionTag
inline constexpr char EXT_PLACEHOLDER = 'e';

inline constexpr std::string_view DEFAULT_CASE_FORMAT = "%s.%e";

/// What a single case file's path says about it
struct CaseFileMatch
{
    std::string name;
    ExtensionTag ext;
};

/// Absolute form of ``path`` with symlinks resolved as far as the path exists.
/// Falls back to the absolute, lexically normalized path if the filesystem can't be queried.
std::filesystem::path resolve_path(const std::filesystem::path& path);

/// List every file under ``directory`` that could be a case file for ``format``.
///
/// Both placeholders are widened to `*`; everything else in the format and the directory
/// is matched literally. Each hit is reported at debug level.
Result<std::vector<std::filesystem::path>> glob_with_format(const std::filesystem::path& directory,
                                                            std::string_view format, Reporter& reporter);

/// Compile the pattern that extracts `{name, ext}` from resolved paths under ``directory``
Result<PercentPattern> make_case_matcher(const std::filesystem::path& directory, std::string_view format);

/// Returns std::nullopt if ``path`` is not a case file under the matcher's directory
std::optional<CaseFileMatch> match_with_format(const PercentPattern& matcher, const std::filesystem::path& path);

/// Compose the path of the ``ext`` file of case ``name``
Result<std::filesystem::path> path_from_format(const std::filesystem::path& directory, std::string_view format,
                                               std::string_view name, ExtensionTag ext);

} // namespace ojcases
