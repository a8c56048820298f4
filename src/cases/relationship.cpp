#include <ojcases/cases/relationship.hpp>

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/cases/file_filter.hpp>
#include <ojcases/cases/path_format.hpp>
#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_format.hpp>
#include <ojcases/report/reporter.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ojcases {

namespace fs = std::filesystem;

Result<TestCaseMap> construct_relationship_of_files(const std::vector<fs::path>& paths, const fs::path& directory,
                                                    std::string_view format, Reporter& reporter) {
    auto compiled = make_case_matcher(directory, format);
    if (!compiled) {
        report_fmt(reporter, LogLevel::Error, "invalid format {:?}: {}", format, compiled.error());
        return compiled.error();
    }
    const PercentPattern& matcher = compiled.value();

    TestCaseMap tests;

    for (const auto& path : paths) {
        auto match = match_with_format(matcher, path);
        if (!match) {
            report_fmt(reporter, LogLevel::Error, "unrecognizable file found: {}", path.string());
            return make_error(ErrorKind::UnrecognizedFile, path.string());
        }

        auto [iter, inserted] = tests[match->name].try_emplace(match->ext, path);
        if (!inserted) {
            report_fmt(reporter, LogLevel::Error, "{} file of case {:?} found twice: {} and {}", match->ext,
                       match->name, iter->second.string(), path.string());
            return make_error(ErrorKind::DuplicateCase, path.string());
        }
    }

    for (const auto& [name, files] : tests) {
        if (!files.contains(ExtensionTag::In)) {
            const fs::path& output = files.at(ExtensionTag::Out);
            report_fmt(reporter, LogLevel::Error, "dangling output case: {}", output.string());
            return make_error(ErrorKind::DanglingOutput, output.string());
        }
    }

    if (tests.empty()) {
        reporter.report(LogLevel::Error, "no cases found");
        return make_error(ErrorKind::NoCasesFound);
    }

    report_fmt(reporter, LogLevel::Info, "{} cases found", tests.size());

    return tests;
}

Result<TestCaseMap> collect_test_cases(const fs::path& directory, std::string_view format,
                                       const CollectOptions& options, Reporter& reporter) {
    std::vector<fs::path> paths = TRY(glob_with_format(directory, format, reporter));

    if (options.ignore_backup) {
        paths = drop_backup_or_hidden_files(paths, reporter);
    }

    return construct_relationship_of_files(paths, directory, format, reporter);
}

} // namespace ojcases
