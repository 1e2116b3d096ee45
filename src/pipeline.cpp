#include "pivot/pipeline.hpp"

#include "pivot/format.hpp"
#include "pivot/utils.hpp"

#include "internal/json_io.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        // by key first; a plain function name is accepted while it is unambiguous
        static const vessel_record& find_vessel(const synthesis_result& manifest, std::string_view function) {
            if (auto it = std::ranges::find(manifest.vessels, function, vessel_key); it != manifest.vessels.end()) {
                return *it;
            }
            std::vector<std::string> matches{};
            for (const auto& vessel : manifest.vessels) {
                if (vessel.function_name == function) {
                    matches.emplace_back(vessel_key(vessel));
                }
            }
            if (matches.empty()) {
                throw std::invalid_argument("no vessel for function '{}' in manifest"_format(function));
            }
            if (matches.size() > 1U) {
                throw std::invalid_argument(
                        "function name '{}' is ambiguous; use one of: {}"_format(
                                function, utils::join_with_separator(matches, ", "sv)));
            }
            return *std::ranges::find(manifest.vessels, matches.front(), vessel_key);
        }

        static const vessel_record& runnable_vessel(const synthesis_result& manifest, std::string_view function) {
            const auto& vessel = find_vessel(manifest, function);
            if (vessel.status == vessel_status::error || vessel.binary_path.empty()) {
                throw std::runtime_error(
                        "vessel for '{}' has no runnable binary ({}): {}"_format(
                                function, to_string(vessel.status), vessel.diagnostics));
            }
            return vessel;
        }

    }  // namespace detail

    blueprint analyze_file(const fs::path& source, std::optional<source_language> language) {
        if (!language) {
            language = detect_source_language(source);
        }
        if (!language) {
            throw parse_error(
                    0U, "cannot detect source language of {} (expected .py, .js or .rb)"_format(source.string()));
        }

        auto text = internal::read_text_file(source);
        std::error_code ec{};
        auto absolute = fs::absolute(source, ec);

        blueprint plan{.language = *language, .source_path = ec ? source : absolute};
        plan.functions = analyze(text, *language);
        return plan;
    }

    synthesis_request make_synthesis_request(const pipeline_config& cfg, fs::path output_dir) {
        return synthesis_request{
                .output_dir = std::move(output_dir),
                .jobs = cfg.jobs,
                .compile_timeout = std::chrono::milliseconds{cfg.compile_timeout_ms},
                .toolchain_version = cfg.toolchain_version,
                .target_triple = cfg.target_triple,
                .compilers = cfg.compilers};
    }

    synthesis_result synthesize_blueprint(
            const blueprint& plan, const optimization_profile& profile, synthesis_request request, build_cache& cache) {
        request.language = plan.language;
        request.source_path = plan.source_path;
        return synthesize(plan.functions, profile, request, cache);
    }

    parity_options make_parity_options(const pipeline_config& cfg) {
        return parity_options{
                .test_cases = cfg.test_cases,
                .tolerance = cfg.tolerance,
                .confidence_threshold = cfg.confidence_threshold,
                .seed = cfg.seed,
                .input_min = cfg.input_min,
                .input_max = cfg.input_max,
                .timeout = std::chrono::milliseconds{cfg.run_timeout_ms},
                .jobs = cfg.validate_jobs};
    }

    fs::path interpreter_for(const pipeline_config& cfg, source_language language) {
        switch (language) {
            case source_language::python:
                return cfg.python_path;
            case source_language::javascript:
                return cfg.node_path;
            case source_language::ruby:
                return cfg.ruby_path;
        }
        return {};
    }

    parity_certificate validate_vessel(
            const blueprint& plan,
            const synthesis_result& manifest,
            std::string_view function,
            const parity_options& options,
            const fs::path& interpreter) {
        const auto& vessel = detail::runnable_vessel(manifest, function);
        const auto* spec = lookup_function(plan.functions, vessel_key(vessel));
        if (spec == nullptr) {
            throw std::invalid_argument("no function '{}' in blueprint for {}"_format(function, plan.source_path.string()));
        }

        process_runner legacy{interpreter_command(plan.language, plan.source_path, spec->name, interpreter)};
        process_runner native{std::vector<std::string>{vessel.binary_path.string()}};
        return validate(legacy, native, *spec, options);
    }

    benchmark_options make_benchmark_options(const pipeline_config& cfg) {
        return benchmark_options{
                .iterations = cfg.iterations,
                .warmup = cfg.warmup,
                .timeout = std::chrono::milliseconds{cfg.run_timeout_ms},
                .regression_threshold_pct = cfg.regression_threshold_pct};
    }

    benchmark_sample benchmark_vessel(
            const synthesis_result& manifest,
            std::string_view function,
            const benchmark_request& request,
            const baseline_store& baselines) {
        const auto& vessel = detail::runnable_vessel(manifest, function);
        process_runner native{std::vector<std::string>{vessel.binary_path.string()}};

        auto key = std::string{vessel_key(vessel)};
        auto name = request.baseline_name.empty() ? key : request.baseline_name;
        std::optional<baseline> against{};
        if (!request.baseline_name.empty()) {
            against = baselines.load(name);
            if (!against) {
                debug_log("no baseline named '", name, "' yet");
            }
        }

        auto sample = benchmark(native, request.input, request.options, against ? &*against : nullptr);
        sample.function = key;

        if (request.save_baseline) {
            if (sample.durations.empty()) {
                debug_log("not saving baseline '", name, "': no iteration succeeded");
            }
            else {
                baselines.save(make_baseline(name, sample));
            }
        }
        return sample;
    }

}  // namespace pivot
