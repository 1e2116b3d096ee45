#pragma once

#include "utils.hpp"

#include <array>
#include <format>
#include <type_traits>

namespace pivot {
    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals

    // every scoped enum in the pivot namespace that has a to_string overload is formattable
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept named_enum = std::is_scoped_enum_v<U> && requires(U value) {
        { to_string(value) } -> std::convertible_to<std::string_view>;
    };
}  // namespace pivot

namespace std {
    template <pivot::named_enum T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(to_string(val), ctx);
        }
    };
}  // namespace std
