#pragma once

#include <string_view>

namespace pivot::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = PIVOT_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = PIVOT_PLATFORM_MACOS != 0;
    inline constexpr bool is_x86_64 = PIVOT_ARCH_X86_64 != 0;
    inline constexpr bool is_arm64 = PIVOT_ARCH_ARM64 != 0;

    constexpr std::string_view host_triple() {
        if constexpr (is_macos && is_arm64) {
            return "arm64-apple-darwin"sv;
        }
        else if constexpr (is_macos) {
            return "x86_64-apple-darwin"sv;
        }
        else if constexpr (is_arm64) {
            return "aarch64-unknown-linux-gnu"sv;
        }
        return "x86_64-unknown-linux-gnu"sv;
    }

    namespace tool {
        inline constexpr auto cxx = "c++"sv;
        inline constexpr auto go = "go"sv;
        inline constexpr auto rustc = "rustc"sv;
        inline constexpr auto shell = "/bin/sh"sv;
    }  // namespace tool

}  // namespace pivot::internal::platform
