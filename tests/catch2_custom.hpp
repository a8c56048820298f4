#pragma once

#include <ojcases/cases/extension_tag.hpp>
#include <ojcases/common/error_types.hpp>
#include <ojcases/format/percent_tokens.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <string_view>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// String formatting without being able to see non-graphical chars is VERY annoying
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_all.hpp>         // IWYU pragma: export
#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

template <typename T>
// inverse of Catch2's conditions as to not cause ambiguity
    requires(fmt::is_formattable<T>::value && !is_range<T>::value && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch
