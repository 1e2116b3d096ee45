#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pivot {

    using namespace std::string_view_literals;

    /*
     * Pivot Pipeline Config Options
     *
     * Storage and output
     * - cache_dir: Root of the build cache, baselines and regression inputs.
     * - output: Default CLI output shape ("table" or "json").
     * - quiet/verbose: Coarse output verbosity knobs for CLI logs.
     *
     * Synthesis
     * - profile: Optimization profile id (builtin name) or path to a profile json.
     * - jobs: Compile worker concurrency; 0 selects the host CPU count.
     * - compile_timeout_ms: Max wall-time budget per compiler invocation.
     * - toolchain_version: Toolchain version string folded into cache keys; probed when empty.
     * - target_triple: Target triple folded into cache keys; host triple when empty.
     * - compilers: Per-target compiler executable overrides (target id -> path).
     *
     * Interpreters (legacy runners and fallback shims)
     * - python_path / node_path / ruby_path: Interpreter executables per source language.
     *
     * Parity validation
     * - test_cases: Pseudo-random inputs generated on top of the boundary set.
     * - tolerance: Max relative error for a numeric comparison to pass.
     * - confidence_threshold: Minimum aggregate confidence (percent) to certify.
     * - seed: Deterministic seed for generated inputs.
     * - input_min / input_max: Range for generated numeric arguments.
     * - run_timeout_ms: Per-call budget for legacy and vessel invocations.
     * - validate_jobs: Test-case execution concurrency.
     *
     * Benchmarking
     * - iterations: Measured iteration count.
     * - warmup: Warmup iterations discarded before measuring.
     * - regression_threshold_pct: Mean slowdown vs baseline (percent) flagged as a regression.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class source_language : uint8_t { python, javascript, ruby };
    enum class vessel_status : uint8_t { compiled, cached, interpreted_fallback, error };
    enum class output_mode : uint8_t { table, json };

    // builtin target identifiers, also the keys of the builtin code generators
    namespace targets {
        inline constexpr auto compiled_concurrent = "compiled-concurrent"sv;
        inline constexpr auto compiled_native = "compiled-native"sv;
        inline constexpr auto memory_safe_native = "memory-safe-native"sv;
    }  // namespace targets

    inline constexpr std::string_view to_string(source_language language) {
        switch (language) {
            case source_language::python:
                return "python"sv;
            case source_language::javascript:
                return "javascript"sv;
            case source_language::ruby:
                return "ruby"sv;
        }
        return "python"sv;
    }

    inline constexpr bool try_parse_source_language(std::string_view text, source_language& out) {
        if (utils::str_case_eq(text, "python"sv) || utils::str_case_eq(text, "py"sv)) {
            out = source_language::python;
            return true;
        }
        if (utils::str_case_eq(text, "javascript"sv) || utils::str_case_eq(text, "js"sv)) {
            out = source_language::javascript;
            return true;
        }
        if (utils::str_case_eq(text, "ruby"sv) || utils::str_case_eq(text, "rb"sv)) {
            out = source_language::ruby;
            return true;
        }
        return false;
    }

    inline std::optional<source_language> detect_source_language(const std::filesystem::path& path) {
        auto ext = path.extension().string();
        if (ext == ".py"sv) {
            return source_language::python;
        }
        if (ext == ".js"sv || ext == ".mjs"sv || ext == ".cjs"sv) {
            return source_language::javascript;
        }
        if (ext == ".rb"sv) {
            return source_language::ruby;
        }
        return std::nullopt;
    }

    inline constexpr std::string_view to_string(vessel_status status) {
        switch (status) {
            case vessel_status::compiled:
                return "Compiled"sv;
            case vessel_status::cached:
                return "Cached"sv;
            case vessel_status::interpreted_fallback:
                return "InterpretedFallback"sv;
            case vessel_status::error:
                return "Error"sv;
        }
        return "Error"sv;
    }

    inline constexpr bool try_parse_vessel_status(std::string_view text, vessel_status& out) {
        if (text == "Compiled"sv) {
            out = vessel_status::compiled;
            return true;
        }
        if (text == "Cached"sv) {
            out = vessel_status::cached;
            return true;
        }
        if (text == "InterpretedFallback"sv) {
            out = vessel_status::interpreted_fallback;
            return true;
        }
        if (text == "Error"sv) {
            out = vessel_status::error;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool is_builtin_target(std::string_view target) {
        return target == targets::compiled_concurrent || target == targets::compiled_native ||
               target == targets::memory_safe_native;
    }

    struct optimization_profile {
        std::string id{"balanced"};
        int opt_level{2};
        bool simd{false};
        bool lto{false};
        bool unsafe_math{false};
        bool allow_fallback{true};
        // extra compiler flags per target id, whitespace separated
        std::map<std::string, std::string> target_flags{};
    };

    inline optimization_profile conservative_profile() {
        return optimization_profile{.id = "conservative", .opt_level = 1, .allow_fallback = true};
    }

    inline optimization_profile balanced_profile() {
        return optimization_profile{.id = "balanced", .opt_level = 2, .allow_fallback = true};
    }

    inline optimization_profile aggressive_profile() {
        return optimization_profile{
                .id = "aggressive",
                .opt_level = 3,
                .simd = true,
                .lto = true,
                .unsafe_math = true,
                .allow_fallback = false};
    }

    inline std::optional<optimization_profile> builtin_profile(std::string_view id) {
        if (utils::str_case_eq(id, "conservative"sv)) {
            return conservative_profile();
        }
        if (utils::str_case_eq(id, "balanced"sv)) {
            return balanced_profile();
        }
        if (utils::str_case_eq(id, "aggressive"sv)) {
            return aggressive_profile();
        }
        return std::nullopt;
    }

    struct pipeline_config {
        std::filesystem::path cache_dir{".pivot"};
        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};

        std::string profile{"balanced"};
        unsigned jobs{0U};
        int compile_timeout_ms{120'000};
        std::string toolchain_version{};
        std::string target_triple{};
        std::map<std::string, std::string> compilers{};

        std::filesystem::path python_path{"python3"};
        std::filesystem::path node_path{"node"};
        std::filesystem::path ruby_path{"ruby"};

        int test_cases{100};
        double tolerance{1e-3};
        double confidence_threshold{99.9};
        std::uint64_t seed{0x5eed'1234ULL};
        double input_min{-1'000.0};
        double input_max{1'000.0};
        int run_timeout_ms{10'000};
        unsigned validate_jobs{1U};

        int iterations{100};
        int warmup{10};
        double regression_threshold_pct{10.0};

        bool print_config{false};
    };

    // 0 means one worker per host cpu
    inline unsigned resolve_jobs(unsigned requested) {
        if (requested != 0U) {
            return requested;
        }
        auto hw = std::thread::hardware_concurrency();
        return hw == 0U ? 4U : hw;
    }

}  // namespace pivot
