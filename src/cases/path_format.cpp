#include <ojcases/cases/path_format.hpp>

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/common/error_types.hpp>
#include <ojcases/common/linux.hpp>
#include <ojcases/format/percent_format.hpp>
#include <ojcases/logging.hpp>
#include <ojcases/report/reporter.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ojcases {

namespace fs = std::filesystem;

namespace {

/// ``directory`` as a string ending in exactly one separator
std::string with_trailing_separator(const fs::path& directory) {
    std::string str = directory.string();
    if (str.empty() || str.back() != '/') {
        str += '/';
    }
    return str;
}

} // namespace

fs::path resolve_path(const fs::path& path) {
    std::error_code err;

    fs::path resolved = fs::weakly_canonical(path, err);
    if (!err) {
        return resolved;
    }

    LOG_DEBUG("Could not canonicalize {:?} ({}); using its lexical form", path.string(), err.message());

    resolved = fs::absolute(path, err);
    if (err) {
        return path.lexically_normal();
    }
    return resolved.lexically_normal();
}

Result<std::vector<fs::path>> glob_with_format(const fs::path& directory, std::string_view format,
                                               Reporter& reporter) {
    const PlaceholderTable table{{NAME_PLACEHOLDER, "*"}, {EXT_PLACEHOLDER, "*"}};

    auto file_pattern = percent_format(format, table, escape_glob_char);
    if (!file_pattern) {
        report_fmt(reporter, LogLevel::Error, "invalid format {:?}: {}", format, file_pattern.error());
        return file_pattern.error();
    }

    const std::string pattern = escape_glob(with_trailing_separator(directory)) + file_pattern.value();

    auto globbed = linux::glob(pattern);
    if (!globbed) {
        report_fmt(reporter, LogLevel::Error, "failed to glob {}: {}", pattern, globbed.error().message());
        return make_error(ErrorKind::GlobFailure, fmt::format("{:?}: {}", pattern, globbed.error().message()));
    }

    auto paths = globbed.value() | ranges::views::transform([](const std::string& str) { return fs::path{str}; }) |
                 ranges::to<std::vector>();

    for (const auto& path : paths) {
        report_fmt(reporter, LogLevel::Debug, "testcase globbed: {}", path.string());
    }

    return paths;
}

Result<PercentPattern> make_case_matcher(const fs::path& directory, std::string_view format) {
    const PlaceholderTable table{{NAME_PLACEHOLDER, ".+"}, {EXT_PLACEHOLDER, "in|out"}};

    return PercentPattern::compile(format, table, with_trailing_separator(resolve_path(directory)),
                                   MatchMode::Whole);
}

std::optional<CaseFileMatch> match_with_format(const PercentPattern& matcher, const fs::path& path) {
    auto fields = matcher.match(resolve_path(path).string());
    if (!fields) {
        return std::nullopt;
    }

    // A format without both placeholders can match, but never names a case file
    auto name = fields->find(NAME_PLACEHOLDER);
    auto ext = fields->find(EXT_PLACEHOLDER);
    if (name == fields->end() || ext == fields->end()) {
        return std::nullopt;
    }

    auto tag = parse_extension_tag(ext->second);
    if (!tag) {
        return std::nullopt;
    }

    return CaseFileMatch{.name = name->second, .ext = *tag};
}

Result<fs::path> path_from_format(const fs::path& directory, std::string_view format, std::string_view name,
                                  ExtensionTag ext) {
    const PlaceholderTable table{{NAME_PLACEHOLDER, std::string{name}}, {EXT_PLACEHOLDER, std::string{to_string(ext)}}};

    const std::string file_name = TRY(percent_format(format, table));

    return directory / file_name;
}

} // namespace ojcases
