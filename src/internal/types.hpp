#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pivot::internal {

    // On-disk shapes. Enums are stored as their to_string() spelling and converted with the
    // try_parse_* helpers at the boundary.

    struct parameter_record {
        std::string name{};
        std::string type_hint{};
    };

    struct function_record {
        std::string name{};
        std::string key{};
        uint64_t start_line{};
        uint64_t line_count{};
        int complexity{1};
        bool has_loops{false};
        bool has_recursion{false};
        bool has_io{false};
        bool math_heavy{false};
        bool crypto{false};
        std::vector<parameter_record> parameters{};
        std::optional<std::string> return_hint{};
        std::string target{};
        std::string justification{};
    };

    struct blueprint_record {
        int schema_version{1};
        std::string status{"ok"};
        std::string source_language{};
        std::string source_path{};
        std::vector<function_record> functions{};
    };

    struct vessel_entry_record {
        std::string function_name{};
        std::string function_key{};
        std::string target{};
        std::string source_path{};
        std::string binary_path{};
        std::string status{};
        std::string content_hash{};
        double compile_ms{};
        uint64_t binary_size{};
        std::string diagnostics{};
    };

    struct manifest_record {
        int schema_version{1};
        std::string status{"ok"};
        std::string profile_id{};
        std::string source_language{};
        std::string source_path{};
        std::string toolchain_version{};
        std::string target_triple{};
        std::vector<vessel_entry_record> vessels{};
        uint64_t cache_hits{};
        uint64_t cache_misses{};
        uint64_t cache_repairs{};
    };

    struct performance_record {
        double legacy_ms{};
        double vessel_ms{};
        double speedup{};
    };

    struct error_statistics_record {
        double mean_error{};
        double median_error{};
        double stddev{};
        double max_error{};
        double similarity_statistic{};
        double similarity_p_value{1.0};
    };

    struct certificate_record {
        int schema_version{1};
        std::string function{};
        bool certified{false};
        double confidence{};
        uint64_t test_count{};
        uint64_t passed{};
        uint64_t failed{};
        uint64_t timed_out{};
        uint64_t seed{};
        performance_record performance{};
        error_statistics_record statistics{};
    };

    struct baseline_comparison_record {
        std::string name{};
        double mean{};
        double delta_percent{};
        bool regression_detected{false};
    };

    struct benchmark_report_record {
        int schema_version{1};
        std::string function{};
        uint64_t iterations{};
        uint64_t warmup{};
        uint64_t discarded{};
        double mean{};
        double median{};
        double min{};
        double max{};
        double stddev{};
        double p95{};
        double p99{};
        std::vector<double> durations{};
        std::optional<baseline_comparison_record> baseline{};
    };

    struct profile_record {
        std::string id{};
        int opt_level{2};
        bool simd{false};
        bool lto{false};
        bool unsafe_math{false};
        bool allow_fallback{true};
        std::map<std::string, std::string> target_flags{};
    };

    struct baseline_record {
        int schema_version{1};
        std::string name{};
        std::string function{};
        int64_t created_ms{};
        std::vector<double> durations{};
        double mean{};
        double median{};
        double p95{};
        double p99{};
    };

    struct stored_value_record {
        std::string kind{};
        std::string text{};
    };

    struct regression_file_record {
        int schema_version{1};
        std::string function{};
        std::vector<std::vector<stored_value_record>> inputs{};
    };

    struct cache_entry_record {
        int schema_version{1};
        std::string hash{};
        std::string binary_path{};
        uint64_t binary_size{};
        int64_t created_ms{};
        std::string source_digest{};
        std::string profile_id{};
        std::string toolchain_version{};
        std::string target_triple{};
    };

    struct persisted_config {
        int schema_version{1};
        std::string cache_dir{};
        std::string output{};
        std::string profile{};
        uint32_t jobs{};
        int compile_timeout_ms{};
        std::string toolchain_version{};
        std::string target_triple{};
        std::map<std::string, std::string> compilers{};
        std::string python_path{};
        std::string node_path{};
        std::string ruby_path{};
        int test_cases{};
        double tolerance{};
        double confidence_threshold{};
        uint64_t seed{};
        double input_min{};
        double input_max{};
        int run_timeout_ms{};
        uint32_t validate_jobs{};
        int iterations{};
        int warmup{};
        double regression_threshold_pct{};
    };

}  // namespace pivot::internal

namespace glz {

    template <>
    struct meta<pivot::internal::parameter_record> {
        using T = pivot::internal::parameter_record;
        static constexpr auto value = object("name", &T::name, "typeHint", &T::type_hint);
    };

    template <>
    struct meta<pivot::internal::function_record> {
        using T = pivot::internal::function_record;
        static constexpr auto value = object(
                "name",
                &T::name,
                "key",
                &T::key,
                "startLine",
                &T::start_line,
                "lineCount",
                &T::line_count,
                "complexity",
                &T::complexity,
                "hasLoops",
                &T::has_loops,
                "hasRecursion",
                &T::has_recursion,
                "hasIo",
                &T::has_io,
                "mathHeavy",
                &T::math_heavy,
                "crypto",
                &T::crypto,
                "parameters",
                &T::parameters,
                "returnHint",
                &T::return_hint,
                "target",
                &T::target,
                "justification",
                &T::justification);
    };

    template <>
    struct meta<pivot::internal::blueprint_record> {
        using T = pivot::internal::blueprint_record;
        static constexpr auto value = object(
                "schemaVersion",
                &T::schema_version,
                "status",
                &T::status,
                "sourceLanguage",
                &T::source_language,
                "sourcePath",
                &T::source_path,
                "functions",
                &T::functions);
    };

    template <>
    struct meta<pivot::internal::vessel_entry_record> {
        using T = pivot::internal::vessel_entry_record;
        static constexpr auto value = object(
                "functionName",
                &T::function_name,
                "functionKey",
                &T::function_key,
                "target",
                &T::target,
                "sourcePath",
                &T::source_path,
                "binaryPath",
                &T::binary_path,
                "status",
                &T::status,
                "contentHash",
                &T::content_hash,
                "compileMs",
                &T::compile_ms,
                "binarySize",
                &T::binary_size,
                "diagnostics",
                &T::diagnostics);
    };

    template <>
    struct meta<pivot::internal::manifest_record> {
        using T = pivot::internal::manifest_record;
        static constexpr auto value = object(
                "schemaVersion",
                &T::schema_version,
                "status",
                &T::status,
                "profileId",
                &T::profile_id,
                "sourceLanguage",
                &T::source_language,
                "sourcePath",
                &T::source_path,
                "toolchainVersion",
                &T::toolchain_version,
                "targetTriple",
                &T::target_triple,
                "vessels",
                &T::vessels,
                "cacheHits",
                &T::cache_hits,
                "cacheMisses",
                &T::cache_misses,
                "cacheRepairs",
                &T::cache_repairs);
    };

    template <>
    struct meta<pivot::internal::performance_record> {
        using T = pivot::internal::performance_record;
        static constexpr auto value =
                object("legacyMs", &T::legacy_ms, "vesselMs", &T::vessel_ms, "speedup", &T::speedup);
    };

    template <>
    struct meta<pivot::internal::error_statistics_record> {
        using T = pivot::internal::error_statistics_record;
        static constexpr auto value = object(
                "meanError",
                &T::mean_error,
                "medianError",
                &T::median_error,
                "stddev",
                &T::stddev,
                "maxError",
                &T::max_error,
                "similarityStatistic",
                &T::similarity_statistic,
                "similarityPValue",
                &T::similarity_p_value);
    };

    template <>
    struct meta<pivot::internal::certificate_record> {
        using T = pivot::internal::certificate_record;
        static constexpr auto value = object(
                "schemaVersion",
                &T::schema_version,
                "function",
                &T::function,
                "certified",
                &T::certified,
                "confidence",
                &T::confidence,
                "testCount",
                &T::test_count,
                "passed",
                &T::passed,
                "failed",
                &T::failed,
                "timedOut",
                &T::timed_out,
                "seed",
                &T::seed,
                "performance",
                &T::performance,
                "statistics",
                &T::statistics);
    };

    template <>
    struct meta<pivot::internal::baseline_comparison_record> {
        using T = pivot::internal::baseline_comparison_record;
        static constexpr auto value = object(
                "name",
                &T::name,
                "mean",
                &T::mean,
                "deltaPercent",
                &T::delta_percent,
                "regressionDetected",
                &T::regression_detected);
    };

    template <>
    struct meta<pivot::internal::benchmark_report_record> {
        using T = pivot::internal::benchmark_report_record;
        static constexpr auto value = object(
                "schemaVersion",
                &T::schema_version,
                "function",
                &T::function,
                "iterations",
                &T::iterations,
                "warmup",
                &T::warmup,
                "discarded",
                &T::discarded,
                "mean",
                &T::mean,
                "median",
                &T::median,
                "min",
                &T::min,
                "max",
                &T::max,
                "stddev",
                &T::stddev,
                "p95",
                &T::p95,
                "p99",
                &T::p99,
                "durations",
                &T::durations,
                "baseline",
                &T::baseline);
    };

    template <>
    struct meta<pivot::internal::profile_record> {
        using T = pivot::internal::profile_record;
        static constexpr auto value = object(
                "id",
                &T::id,
                "optLevel",
                &T::opt_level,
                "simd",
                &T::simd,
                "lto",
                &T::lto,
                "unsafeMath",
                &T::unsafe_math,
                "allowFallback",
                &T::allow_fallback,
                "targetFlags",
                &T::target_flags);
    };

    template <>
    struct meta<pivot::internal::baseline_record> {
        using T = pivot::internal::baseline_record;
        static constexpr auto value = object(
                "schema_version",
                &T::schema_version,
                "name",
                &T::name,
                "function",
                &T::function,
                "created_ms",
                &T::created_ms,
                "durations",
                &T::durations,
                "mean",
                &T::mean,
                "median",
                &T::median,
                "p95",
                &T::p95,
                "p99",
                &T::p99);
    };

    template <>
    struct meta<pivot::internal::stored_value_record> {
        using T = pivot::internal::stored_value_record;
        static constexpr auto value = object("kind", &T::kind, "text", &T::text);
    };

    template <>
    struct meta<pivot::internal::regression_file_record> {
        using T = pivot::internal::regression_file_record;
        static constexpr auto value =
                object("schema_version", &T::schema_version, "function", &T::function, "inputs", &T::inputs);
    };

    template <>
    struct meta<pivot::internal::cache_entry_record> {
        using T = pivot::internal::cache_entry_record;
        static constexpr auto value = object(
                "schema_version",
                &T::schema_version,
                "hash",
                &T::hash,
                "binary_path",
                &T::binary_path,
                "binary_size",
                &T::binary_size,
                "created_ms",
                &T::created_ms,
                "source_digest",
                &T::source_digest,
                "profile_id",
                &T::profile_id,
                "toolchain_version",
                &T::toolchain_version,
                "target_triple",
                &T::target_triple);
    };

    template <>
    struct meta<pivot::internal::persisted_config> {
        using T = pivot::internal::persisted_config;
        static constexpr auto value = object(
                "schema_version",
                &T::schema_version,
                "cache_dir",
                &T::cache_dir,
                "output",
                &T::output,
                "profile",
                &T::profile,
                "jobs",
                &T::jobs,
                "compile_timeout_ms",
                &T::compile_timeout_ms,
                "toolchain_version",
                &T::toolchain_version,
                "target_triple",
                &T::target_triple,
                "compilers",
                &T::compilers,
                "python_path",
                &T::python_path,
                "node_path",
                &T::node_path,
                "ruby_path",
                &T::ruby_path,
                "test_cases",
                &T::test_cases,
                "tolerance",
                &T::tolerance,
                "confidence_threshold",
                &T::confidence_threshold,
                "seed",
                &T::seed,
                "input_min",
                &T::input_min,
                "input_max",
                &T::input_max,
                "run_timeout_ms",
                &T::run_timeout_ms,
                "validate_jobs",
                &T::validate_jobs,
                "iterations",
                &T::iterations,
                "warmup",
                &T::warmup,
                "regression_threshold_pct",
                &T::regression_threshold_pct);
    };

}  // namespace glz
