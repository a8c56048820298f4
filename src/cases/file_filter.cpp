#include <ojcases/cases/file_filter.hpp>

#include <ojcases/report/reporter.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace ojcases {

bool is_backup_or_hidden_file(const std::filesystem::path& path) {
    const std::string basename = path.stem().string();

    return basename.ends_with('~') || (basename.starts_with('#') && basename.ends_with('#')) ||
           basename.starts_with('.');
}

std::vector<std::filesystem::path> drop_backup_or_hidden_files(const std::vector<std::filesystem::path>& paths,
                                                               Reporter& reporter) {
    std::vector<std::filesystem::path> result;

    for (const auto& path : paths) {
        if (is_backup_or_hidden_file(path)) {
            report_fmt(reporter, LogLevel::Warning, "ignore a backup file: {}", path.string());
            continue;
        }
        result.push_back(path);
    }

    return result;
}

} // namespace ojcases
