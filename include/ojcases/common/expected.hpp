#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace ojcases {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::in_place_type<T>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<T, E>)
        : data_{std::in_place_type<E>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const {
        if constexpr (std::is_void_v<T>) {
            return std::holds_alternative<std::monostate>(data_);
        } else {
            return std::holds_alternative<T>(data_);
        }
    }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<U>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<U>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<T>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value(), "error() called on an Expected holding a value");
        return std::get<E>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<E>(data_);
    }

    /// Apply ``func`` to the contained value, or forward the error unchanged
    template <typename Func>
    constexpr Expected<std::invoke_result_t<Func, const T&>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return std::invoke(func, value());
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        if (!has_value()) {
            return false;
        }

        return value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<StorageT, E> data_;
};

} // namespace ojcases

template <typename T, typename E>
struct fmt::formatter<::ojcases::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::ojcases::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::ojcases::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::same_as<T, void>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
