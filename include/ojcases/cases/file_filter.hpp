#pragma once

#include <ojcases/report/reporter.hpp>

#include <filesystem>
#include <vector>

namespace ojcases {

/// True for editor leftovers and dotfiles, judged on the file's stem:
/// `foo~`, `#foo#` and `.foo` all qualify.
bool is_backup_or_hidden_file(const std::filesystem::path& path);

/// Remove backup and hidden files from ``paths``, reporting each one dropped as a warning
std::vector<std::filesystem::path> drop_backup_or_hidden_files(const std::vector<std::filesystem::path>& paths,
                                                               Reporter& reporter);

} // namespace ojcases
