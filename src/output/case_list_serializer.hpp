#pragma once

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

namespace ojcases {

/// Writes discovered test cases to a Sink as human-readable text
class CaseListSerializer
{
public:
    CaseListSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option);

    /// One block per case, followed by a summary line
    void on_cases(const TestCaseMap& cases);

    /// Where the files of case ``name`` live, or would be created
    void on_case_paths(std::string_view name, const std::filesystem::path& input, const std::filesystem::path& output);

    void finalize();

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    std::string file_line(ExtensionTag tag, const std::filesystem::path& path) const;

    /// Plural if and only if `count != 1`
    static std::string pluralize(std::string_view root, std::size_t count);

    static constexpr auto NAME_STYLE = fmt::emphasis::bold;
    static constexpr auto PATH_STYLE = fmt::fg(fmt::color::aqua);
    static constexpr auto MISSING_STYLE = fmt::fg(fmt::color::gray);
    static constexpr auto SUMMARY_STYLE = fmt::fg(fmt::color::lime_green);

    static constexpr std::size_t LINE_DIVIDER_DEFAULT_WIDTH = 64;

    Sink& sink_;
    bool do_colorize_;
};

template <typename T>
std::string CaseListSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }
    return fmt::format("{}", fmt::styled(arg, style));
}

} // namespace ojcases
