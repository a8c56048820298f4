#include "output/case_list_serializer.hpp"

#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/cases/relationship.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <unistd.h>

namespace ojcases {

CaseListSerializer::CaseListSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option)
    : sink_{sink}
    , do_colorize_{process_colorize_opt(colorize_option)} {}

void CaseListSerializer::on_cases(const TestCaseMap& cases) {
    std::string out;

    for (const auto& [name, files] : cases) {
        out += fmt::format("{}\n", style_str(name, NAME_STYLE));

        for (auto tag : {ExtensionTag::In, ExtensionTag::Out}) {
            if (auto file = files.find(tag); file != files.end()) {
                out += file_line(tag, file->second);
            } else {
                out += fmt::format("  {:<4} {}\n", fmt::format("{}:", tag),
                                   style_str(std::string_view{"(none)"}, MISSING_STYLE));
            }
        }
    }

    std::size_t num_with_output = 0;
    for (const auto& [name, files] : cases) {
        num_with_output += files.contains(ExtensionTag::Out) ? 1 : 0;
    }

    out += fmt::format("{}\n", std::string(LINE_DIVIDER_DEFAULT_WIDTH, '-'));
    out += style_str(fmt::format("{} {} ({} with expected output)", cases.size(), pluralize("case", cases.size()),
                                 num_with_output),
                     SUMMARY_STYLE);
    out += '\n';

    sink_.write(out);
}

void CaseListSerializer::on_case_paths(std::string_view name, const std::filesystem::path& input,
                                       const std::filesystem::path& output) {
    std::string out = fmt::format("{}\n", style_str(name, NAME_STYLE));
    out += file_line(ExtensionTag::In, input);
    out += file_line(ExtensionTag::Out, output);

    sink_.write(out);
}

void CaseListSerializer::finalize() {
    sink_.flush();
}

bool CaseListSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    switch (colorize_option) {
    case Always:
        return true;
    case Never:
        return false;
    case Auto:
        break;
    }

    return ::isatty(STDOUT_FILENO) == 1;
}

std::string CaseListSerializer::file_line(ExtensionTag tag, const std::filesystem::path& path) const {
    return fmt::format("  {:<4} {}\n", fmt::format("{}:", tag), style_str(path.string(), PATH_STYLE));
}

std::string CaseListSerializer::pluralize(std::string_view root, std::size_t count) {
    if (count == 1) {
        return std::string{root};
    }
    return fmt::format("{}s", root);
}

} // namespace ojcases
