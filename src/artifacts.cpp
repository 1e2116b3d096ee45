#include "pivot/artifacts.hpp"

#include "pivot/format.hpp"
#include "pivot/utils.hpp"

#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include <set>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        static constexpr auto status_ok = "ok"sv;
        static constexpr auto status_partial = "partial"sv;

        // parse and I/O failures at the boundary surface as artifact_error
        template <typename Fn>
        static auto guarded(const std::string& origin, Fn&& fn) -> decltype(fn()) {
            try {
                return fn();
            } catch (const artifact_error&) {
                throw;
            } catch (const std::runtime_error& e) {
                throw artifact_error("{}: {}"_format(origin, e.what()));
            }
        }

        static void require(bool condition, const std::string& origin, std::string_view what) {
            if (!condition) {
                throw artifact_error("{}: {}"_format(origin, what));
            }
        }

        static void require_schema(int schema_version, const std::string& origin) {
            require(schema_version >= 1 && schema_version <= internal::supported_schema_version,
                    origin,
                    "unsupported schemaVersion {} (supported: {})"_format(
                            schema_version, internal::supported_schema_version));
        }

        static source_language parse_language(const std::string& text, const std::string& origin) {
            source_language language{};
            require(try_parse_source_language(text, language), origin, "unknown sourceLanguage '{}'"_format(text));
            return language;
        }

        static internal::function_record to_record(const function_spec& spec) {
            internal::function_record record{
                    .name = spec.name,
                    .key = std::string{function_key(spec)},
                    .start_line = spec.start_line,
                    .line_count = spec.line_count,
                    .complexity = spec.complexity,
                    .has_loops = spec.has_loops,
                    .has_recursion = spec.has_recursion,
                    .has_io = spec.has_io,
                    .math_heavy = spec.math_heavy,
                    .crypto = spec.crypto,
                    .return_hint = spec.return_hint,
                    .target = spec.target,
                    .justification = spec.justification};
            for (const auto& param : spec.parameters) {
                record.parameters.push_back({.name = param.name, .type_hint = param.type_hint});
            }
            return record;
        }

        static function_spec from_record(const internal::function_record& record, const std::string& origin) {
            auto where = "{} function '{}'"_format(origin, record.name);
            require(!record.name.empty(), origin, "function without a name");
            require(record.complexity >= 1, where, "complexity must be >= 1");
            require(record.start_line >= 1U, where, "startLine must be >= 1");
            require(record.line_count >= 1U, where, "lineCount must be >= 1");
            require(!record.target.empty(), where, "missing target");

            function_spec spec{
                    .name = record.name,
                    .key = record.key,
                    .start_line = static_cast<size_t>(record.start_line),
                    .line_count = static_cast<size_t>(record.line_count),
                    .complexity = record.complexity,
                    .has_loops = record.has_loops,
                    .has_recursion = record.has_recursion,
                    .has_io = record.has_io,
                    .math_heavy = record.math_heavy,
                    .crypto = record.crypto,
                    .return_hint = record.return_hint,
                    .target = record.target,
                    .justification = record.justification};
            for (const auto& param : record.parameters) {
                require(!param.name.empty(), where, "parameter without a name");
                spec.parameters.push_back({.name = param.name, .type_hint = param.type_hint});
            }
            return spec;
        }

        static internal::blueprint_record to_record(const blueprint& value) {
            internal::blueprint_record record{
                    .schema_version = internal::supported_schema_version,
                    .status = std::string{status_ok},
                    .source_language = std::string{to_string(value.language)},
                    .source_path = value.source_path.string()};
            for (const auto& spec : value.functions) {
                record.functions.push_back(to_record(spec));
            }
            return record;
        }

        static internal::manifest_record to_record(const synthesis_result& result) {
            internal::manifest_record record{
                    .schema_version = internal::supported_schema_version,
                    .status = std::string{status_ok},
                    .profile_id = result.profile_id,
                    .source_language = std::string{to_string(result.language)},
                    .source_path = result.source_path.string(),
                    .toolchain_version = result.toolchain_version,
                    .target_triple = result.target_triple,
                    .cache_hits = result.cache_hits,
                    .cache_misses = result.cache_misses,
                    .cache_repairs = result.cache_repairs};
            for (const auto& vessel : result.vessels) {
                if (vessel.status == vessel_status::error) {
                    record.status = std::string{status_partial};
                }
                record.vessels.push_back(
                        {.function_name = vessel.function_name,
                         .function_key = vessel.function_key.empty() ? vessel.function_name : vessel.function_key,
                         .target = vessel.target,
                         .source_path = vessel.source_path.string(),
                         .binary_path = vessel.binary_path.string(),
                         .status = std::string{to_string(vessel.status)},
                         .content_hash = vessel.content_hash,
                         .compile_ms = vessel.compile_ms,
                         .binary_size = vessel.binary_size,
                         .diagnostics = vessel.diagnostics});
            }
            return record;
        }

        static synthesis_result from_record(const internal::manifest_record& record, const std::string& origin) {
            require_schema(record.schema_version, origin);
            require(record.status == status_ok || record.status == status_partial,
                    origin,
                    "unknown status '{}'"_format(record.status));
            require(!record.profile_id.empty(), origin, "missing profileId");

            synthesis_result result{
                    .profile_id = record.profile_id,
                    .language = parse_language(record.source_language, origin),
                    .source_path = record.source_path,
                    .toolchain_version = record.toolchain_version,
                    .target_triple = record.target_triple,
                    .cache_hits = record.cache_hits,
                    .cache_misses = record.cache_misses,
                    .cache_repairs = record.cache_repairs};
            for (const auto& entry : record.vessels) {
                auto where = "{} vessel '{}'"_format(origin, entry.function_name);
                require(!entry.function_name.empty(), origin, "vessel without a functionName");

                vessel_record vessel{
                        .function_name = entry.function_name,
                        .function_key = entry.function_key.empty() ? entry.function_name : entry.function_key,
                        .target = entry.target,
                        .source_path = entry.source_path,
                        .binary_path = entry.binary_path,
                        .content_hash = entry.content_hash,
                        .compile_ms = entry.compile_ms,
                        .binary_size = entry.binary_size,
                        .diagnostics = entry.diagnostics};
                require(try_parse_vessel_status(entry.status, vessel.status),
                        where,
                        "unknown status '{}'"_format(entry.status));
                if (vessel.status == vessel_status::cached || vessel.status == vessel_status::compiled) {
                    require(!vessel.content_hash.empty(), where, "{} vessel without a contentHash"_format(entry.status));
                    require(!entry.binary_path.empty(), where, "{} vessel without a binaryPath"_format(entry.status));
                }
                result.vessels.push_back(std::move(vessel));
            }
            return result;
        }

        static internal::certificate_record to_record(const parity_certificate& cert) {
            return internal::certificate_record{
                    .schema_version = internal::supported_schema_version,
                    .function = cert.function,
                    .certified = cert.certified,
                    .confidence = cert.confidence,
                    .test_count = cert.test_count,
                    .passed = cert.passed,
                    .failed = cert.failed,
                    .timed_out = cert.timed_out,
                    .seed = cert.seed,
                    .performance = {.legacy_ms = cert.legacy_ms, .vessel_ms = cert.vessel_ms, .speedup = cert.speedup},
                    .statistics = {
                            .mean_error = cert.mean_error,
                            .median_error = cert.median_error,
                            .stddev = cert.stddev,
                            .max_error = cert.max_error,
                            .similarity_statistic = cert.similarity_statistic,
                            .similarity_p_value = cert.similarity_p_value}};
        }

        static parity_certificate from_record(const internal::certificate_record& record, const std::string& origin) {
            require_schema(record.schema_version, origin);
            require(!record.function.empty(), origin, "missing function");
            require(record.passed + record.failed == record.test_count,
                    origin,
                    "passed ({}) + failed ({}) != testCount ({})"_format(
                            record.passed, record.failed, record.test_count));
            require(record.confidence >= 0.0 && record.confidence <= 100.0,
                    origin,
                    "confidence {} outside [0, 100]"_format(record.confidence));
            require(!record.certified || record.failed == 0U, origin, "certified with failed comparisons");

            return parity_certificate{
                    .function = record.function,
                    .certified = record.certified,
                    .confidence = record.confidence,
                    .test_count = record.test_count,
                    .passed = record.passed,
                    .failed = record.failed,
                    .timed_out = record.timed_out,
                    .mean_error = record.statistics.mean_error,
                    .median_error = record.statistics.median_error,
                    .stddev = record.statistics.stddev,
                    .max_error = record.statistics.max_error,
                    .similarity_statistic = record.statistics.similarity_statistic,
                    .similarity_p_value = record.statistics.similarity_p_value,
                    .legacy_ms = record.performance.legacy_ms,
                    .vessel_ms = record.performance.vessel_ms,
                    .speedup = record.performance.speedup,
                    .seed = record.seed};
        }

        static internal::benchmark_report_record to_record(const benchmark_sample& sample) {
            internal::benchmark_report_record record{
                    .schema_version = internal::supported_schema_version,
                    .function = sample.function,
                    .iterations = sample.iterations,
                    .warmup = sample.warmup,
                    .discarded = sample.discarded,
                    .mean = sample.mean,
                    .median = sample.median,
                    .min = sample.min,
                    .max = sample.max,
                    .stddev = sample.stddev,
                    .p95 = sample.p95,
                    .p99 = sample.p99,
                    .durations = sample.durations};
            if (sample.baseline) {
                record.baseline = internal::baseline_comparison_record{
                        .name = sample.baseline->name,
                        .mean = sample.baseline->mean,
                        .delta_percent = sample.baseline->delta_percent,
                        .regression_detected = sample.baseline->regression_detected};
            }
            return record;
        }

        static benchmark_sample from_record(const internal::benchmark_report_record& record, const std::string& origin) {
            require_schema(record.schema_version, origin);
            require(record.durations.size() <= record.iterations,
                    origin,
                    "{} durations for {} iterations"_format(record.durations.size(), record.iterations));
            if (!record.durations.empty()) {
                require(record.min <= record.median && record.median <= record.p95 && record.p95 <= record.p99 &&
                                record.p99 <= record.max,
                        origin,
                        "statistics out of order (min <= median <= p95 <= p99 <= max)");
            }

            benchmark_sample sample{
                    .function = record.function,
                    .iterations = record.iterations,
                    .warmup = record.warmup,
                    .discarded = record.discarded,
                    .durations = record.durations,
                    .mean = record.mean,
                    .median = record.median,
                    .min = record.min,
                    .max = record.max,
                    .stddev = record.stddev,
                    .p95 = record.p95,
                    .p99 = record.p99};
            if (record.baseline) {
                sample.baseline = baseline_comparison{
                        .name = record.baseline->name,
                        .mean = record.baseline->mean,
                        .delta_percent = record.baseline->delta_percent,
                        .regression_detected = record.baseline->regression_detected};
            }
            return sample;
        }

        static internal::profile_record to_record(const optimization_profile& profile) {
            return internal::profile_record{
                    .id = profile.id,
                    .opt_level = profile.opt_level,
                    .simd = profile.simd,
                    .lto = profile.lto,
                    .unsafe_math = profile.unsafe_math,
                    .allow_fallback = profile.allow_fallback,
                    .target_flags = profile.target_flags};
        }

        static optimization_profile from_record(const internal::profile_record& record, const std::string& origin) {
            require(!record.id.empty(), origin, "profile without an id");
            require(record.opt_level >= 0 && record.opt_level <= 3,
                    origin,
                    "optLevel {} outside [0, 3]"_format(record.opt_level));
            return optimization_profile{
                    .id = record.id,
                    .opt_level = record.opt_level,
                    .simd = record.simd,
                    .lto = record.lto,
                    .unsafe_math = record.unsafe_math,
                    .allow_fallback = record.allow_fallback,
                    .target_flags = record.target_flags};
        }

        static internal::persisted_config to_persisted(const pipeline_config& cfg) {
            return internal::persisted_config{
                    .schema_version = internal::supported_schema_version,
                    .cache_dir = cfg.cache_dir.string(),
                    .output = std::string{to_string(cfg.output)},
                    .profile = cfg.profile,
                    .jobs = cfg.jobs,
                    .compile_timeout_ms = cfg.compile_timeout_ms,
                    .toolchain_version = cfg.toolchain_version,
                    .target_triple = cfg.target_triple,
                    .compilers = cfg.compilers,
                    .python_path = cfg.python_path.string(),
                    .node_path = cfg.node_path.string(),
                    .ruby_path = cfg.ruby_path.string(),
                    .test_cases = cfg.test_cases,
                    .tolerance = cfg.tolerance,
                    .confidence_threshold = cfg.confidence_threshold,
                    .seed = cfg.seed,
                    .input_min = cfg.input_min,
                    .input_max = cfg.input_max,
                    .run_timeout_ms = cfg.run_timeout_ms,
                    .validate_jobs = cfg.validate_jobs,
                    .iterations = cfg.iterations,
                    .warmup = cfg.warmup,
                    .regression_threshold_pct = cfg.regression_threshold_pct};
        }

        static void apply_persisted(const internal::persisted_config& persisted, pipeline_config& cfg, const std::string& origin) {
            require_schema(persisted.schema_version, origin);
            require(try_parse_output_mode(persisted.output, cfg.output),
                    origin,
                    "unknown output mode '{}'"_format(persisted.output));
            require(persisted.compile_timeout_ms > 0, origin, "compile_timeout_ms must be > 0");
            require(persisted.run_timeout_ms > 0, origin, "run_timeout_ms must be > 0");
            require(persisted.test_cases >= 0, origin, "test_cases must be >= 0");
            require(persisted.tolerance >= 0.0, origin, "tolerance must be >= 0");
            require(persisted.input_min <= persisted.input_max, origin, "input_min must be <= input_max");
            require(persisted.iterations >= 1, origin, "iterations must be >= 1");
            require(persisted.warmup >= 0, origin, "warmup must be >= 0");

            cfg.cache_dir = persisted.cache_dir;
            cfg.profile = persisted.profile;
            cfg.jobs = persisted.jobs;
            cfg.compile_timeout_ms = persisted.compile_timeout_ms;
            cfg.toolchain_version = persisted.toolchain_version;
            cfg.target_triple = persisted.target_triple;
            cfg.compilers = persisted.compilers;
            cfg.python_path = persisted.python_path;
            cfg.node_path = persisted.node_path;
            cfg.ruby_path = persisted.ruby_path;
            cfg.test_cases = persisted.test_cases;
            cfg.tolerance = persisted.tolerance;
            cfg.confidence_threshold = persisted.confidence_threshold;
            cfg.seed = persisted.seed;
            cfg.input_min = persisted.input_min;
            cfg.input_max = persisted.input_max;
            cfg.run_timeout_ms = persisted.run_timeout_ms;
            cfg.validate_jobs = persisted.validate_jobs;
            cfg.iterations = persisted.iterations;
            cfg.warmup = persisted.warmup;
            cfg.regression_threshold_pct = persisted.regression_threshold_pct;
        }

        template <typename Record>
        static Record parse_record(const std::string& json, const std::string& origin) {
            return guarded(origin, [&] { return internal::parse_json<Record>(json, origin); });
        }

        static std::string read_artifact(const fs::path& path) {
            return guarded(path.string(), [&] { return internal::read_text_file(path); });
        }

        template <typename Record>
        static void write_artifact(const Record& record, const fs::path& path) {
            if (path.has_parent_path()) {
                std::error_code ec{};
                fs::create_directories(path.parent_path(), ec);
                if (ec) {
                    throw std::runtime_error(
                            "failed to create {}: {}"_format(path.parent_path().string(), ec.message()));
                }
            }
            internal::write_json_file(record, path);
        }

    }  // namespace detail

    std::string blueprint_to_json(const blueprint& value) {
        return internal::to_json(detail::to_record(value));
    }

    blueprint blueprint_from_json(const std::string& json, const std::string& origin) {
        auto record = detail::parse_record<internal::blueprint_record>(json, origin);
        detail::require_schema(record.schema_version, origin);
        detail::require(record.status == detail::status_ok, origin, "unknown status '{}'"_format(record.status));

        blueprint value{
                .language = detail::parse_language(record.source_language, origin), .source_path = record.source_path};
        for (const auto& function : record.functions) {
            value.functions.push_back(detail::from_record(function, origin));
        }
        assign_function_keys(value.functions);
        std::set<std::string_view> keys{};
        for (const auto& spec : value.functions) {
            detail::require(keys.insert(spec.key).second, origin, "duplicate function key '{}'"_format(spec.key));
        }
        return value;
    }

    void write_blueprint(const blueprint& value, const fs::path& path) {
        detail::write_artifact(detail::to_record(value), path);
    }

    blueprint read_blueprint(const fs::path& path) {
        return blueprint_from_json(detail::read_artifact(path), path.string());
    }

    std::string manifest_to_json(const synthesis_result& value) {
        return internal::to_json(detail::to_record(value));
    }

    synthesis_result manifest_from_json(const std::string& json, const std::string& origin) {
        return detail::from_record(detail::parse_record<internal::manifest_record>(json, origin), origin);
    }

    void write_manifest(const synthesis_result& value, const fs::path& path) {
        detail::write_artifact(detail::to_record(value), path);
    }

    synthesis_result read_manifest(const fs::path& path) {
        return manifest_from_json(detail::read_artifact(path), path.string());
    }

    std::string certificate_to_json(const parity_certificate& value) {
        return internal::to_json(detail::to_record(value));
    }

    parity_certificate certificate_from_json(const std::string& json, const std::string& origin) {
        return detail::from_record(detail::parse_record<internal::certificate_record>(json, origin), origin);
    }

    void write_certificate(const parity_certificate& value, const fs::path& path) {
        detail::write_artifact(detail::to_record(value), path);
    }

    parity_certificate read_certificate(const fs::path& path) {
        return certificate_from_json(detail::read_artifact(path), path.string());
    }

    std::string report_to_json(const benchmark_sample& value) {
        return internal::to_json(detail::to_record(value));
    }

    benchmark_sample report_from_json(const std::string& json, const std::string& origin) {
        return detail::from_record(detail::parse_record<internal::benchmark_report_record>(json, origin), origin);
    }

    void write_report(const benchmark_sample& value, const fs::path& path) {
        detail::write_artifact(detail::to_record(value), path);
    }

    benchmark_sample read_report(const fs::path& path) {
        return report_from_json(detail::read_artifact(path), path.string());
    }

    std::string profile_to_json(const optimization_profile& value) {
        return internal::to_json(detail::to_record(value));
    }

    optimization_profile profile_from_json(const std::string& json, const std::string& origin) {
        return detail::from_record(detail::parse_record<internal::profile_record>(json, origin), origin);
    }

    optimization_profile read_profile(const fs::path& path) {
        return profile_from_json(detail::read_artifact(path), path.string());
    }

    void write_profile(const optimization_profile& value, const fs::path& path) {
        detail::write_artifact(detail::to_record(value), path);
    }

    optimization_profile load_profile(std::string_view id_or_path) {
        if (auto builtin = builtin_profile(id_or_path)) {
            return *builtin;
        }
        fs::path path{id_or_path};
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec)) {
            throw artifact_error(
                    "unknown profile '{}': not a builtin (conservative, balanced, aggressive) or a profile file"_format(
                            id_or_path));
        }
        return read_profile(path);
    }

    std::string config_to_json(const pipeline_config& config) {
        return internal::to_json(detail::to_persisted(config));
    }

    pipeline_config load_config(const fs::path& path, const pipeline_config& defaults) {
        auto origin = path.string();
        auto json = detail::read_artifact(path);
        auto persisted = detail::to_persisted(defaults);
        detail::guarded(origin, [&] { internal::parse_json_into(persisted, json, origin); });

        auto cfg = defaults;
        detail::apply_persisted(persisted, cfg, origin);
        debug_log("loaded config from ", origin);
        return cfg;
    }

    void save_config(const pipeline_config& config, const fs::path& path) {
        detail::write_artifact(detail::to_persisted(config), path);
    }

}  // namespace pivot
