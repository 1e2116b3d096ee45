#pragma once

#include "analyzer.hpp"
#include "artifacts.hpp"
#include "benchmark.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "interpreter.hpp"
#include "parity.hpp"
#include "synthesizer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pivot {

    namespace fs = std::filesystem;

    /*
     * Stage entry points. Each consumes the previous stage's artifact (in memory; the
     * artifacts.hpp readers load them from disk) and produces the next one.
     */

    // language detected from the extension when not given; throws parse_error
    blueprint analyze_file(const fs::path& source, std::optional<source_language> language = std::nullopt);

    // request fields derived from the config: jobs, timeouts, toolchain, compilers, interpreter
    synthesis_request make_synthesis_request(const pipeline_config& cfg, fs::path output_dir);

    // language and source path come from the blueprint, overriding the request
    synthesis_result synthesize_blueprint(
            const blueprint& plan,
            const optimization_profile& profile,
            synthesis_request request,
            build_cache& cache);

    parity_options make_parity_options(const pipeline_config& cfg);

    fs::path interpreter_for(const pipeline_config& cfg, source_language language);

    // legacy: the blueprint's source under `interpreter`; vessel: the manifest binary.
    // `function` is a function key, or a plain name that matches one function only.
    // Throws std::invalid_argument when the function is missing from either artifact or the
    // name is ambiguous, and std::runtime_error when its vessel has no runnable binary.
    parity_certificate validate_vessel(
            const blueprint& plan,
            const synthesis_result& manifest,
            std::string_view function,
            const parity_options& options,
            const fs::path& interpreter = {});

    struct benchmark_request {
        benchmark_options options{};
        test_input input{};
        // compared against when it exists
        std::string baseline_name{};
        // store this run as baseline_name (function key when empty); skipped when no iteration succeeded
        bool save_baseline{false};
    };

    benchmark_options make_benchmark_options(const pipeline_config& cfg);

    benchmark_sample benchmark_vessel(
            const synthesis_result& manifest,
            std::string_view function,
            const benchmark_request& request,
            const baseline_store& baselines);

}  // namespace pivot
