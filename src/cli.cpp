#include "pivot/cli.hpp"

#include "pivot/artifacts.hpp"
#include "pivot/format.hpp"
#include "pivot/pipeline.hpp"
#include "pivot/utils.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace pivot::literals;

namespace pivot::cli {

    namespace detail {

        namespace fs = std::filesystem;

        // flag-bound values; applied over the config only when given on the command line
        struct option_values {
            std::string config{};
            std::string cache_dir{};
            std::string output{};
            std::string profile{};
            unsigned jobs{};
            int compile_timeout_ms{};
            std::string toolchain_version{};
            std::string target_triple{};
            std::vector<std::string> compilers{};
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
            unsigned validate_jobs{};
            int iterations{};
            int warmup{};
            double regression_threshold_pct{};
        };

        static void print_config(const pipeline_config& cfg, std::ostream& os) {
            os << "cache_dir=" << cfg.cache_dir.string() << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "profile=" << cfg.profile << '\n';
            os << "jobs=" << cfg.jobs << " (resolved " << resolve_jobs(cfg.jobs) << ")\n";
            os << "compile_timeout_ms=" << cfg.compile_timeout_ms << '\n';
            os << "toolchain_version=" << (cfg.toolchain_version.empty() ? "<probe>"sv : cfg.toolchain_version) << '\n';
            os << "target_triple=" << (cfg.target_triple.empty() ? "<host>"sv : cfg.target_triple) << '\n';
            for (const auto& [target, compiler] : cfg.compilers) {
                os << "compiler." << target << '=' << compiler << '\n';
            }
            os << "python=" << cfg.python_path.string() << '\n';
            os << "node=" << cfg.node_path.string() << '\n';
            os << "ruby=" << cfg.ruby_path.string() << '\n';
            os << "test_cases=" << cfg.test_cases << '\n';
            os << "tolerance=" << cfg.tolerance << '\n';
            os << "confidence_threshold=" << cfg.confidence_threshold << '\n';
            os << "seed=" << cfg.seed << '\n';
            os << "input_range=[" << cfg.input_min << ", " << cfg.input_max << "]\n";
            os << "run_timeout_ms=" << cfg.run_timeout_ms << '\n';
            os << "validate_jobs=" << cfg.validate_jobs << '\n';
            os << "iterations=" << cfg.iterations << '\n';
            os << "warmup=" << cfg.warmup << '\n';
            os << "regression_threshold_pct=" << cfg.regression_threshold_pct << '\n';
        }

        static bool apply_compiler_overrides(
                pipeline_config& cfg, const std::vector<std::string>& assignments, std::ostream& err) {
            for (const auto& assignment : assignments) {
                auto eq = assignment.find('=');
                if (eq == std::string::npos) {
                    err << "invalid --compiler value: " << assignment << " (expected <target>=<path>)\n";
                    return false;
                }
                auto target = utils::trim_view(std::string_view{assignment}.substr(0, eq));
                auto path = utils::trim_view(std::string_view{assignment}.substr(eq + 1U));
                if (target.empty() || path.empty()) {
                    err << "invalid --compiler value: " << assignment << " (target and path must be non-empty)\n";
                    return false;
                }
                cfg.compilers[std::string{target}] = std::string{path};
            }
            return true;
        }

        static void print_text(std::ostream& os, std::string_view text) {
            os << text;
            if (!text.ends_with('\n')) {
                os << '\n';
            }
        }

        static void render_blueprint_table(const blueprint& plan, bool verbose, std::ostream& os) {
            os << "{} ({}): {} function(s)\n"_format(
                    plan.source_path.string(), to_string(plan.language), plan.functions.size());
            os << "  {:<28} {:>6} {:>6} {:>10}  {}\n"_format("function", "line", "lines", "complexity", "target");
            for (const auto& spec : plan.functions) {
                os << "  {:<28} {:>6} {:>6} {:>10}  {}\n"_format(
                        function_key(spec), spec.start_line, spec.line_count, spec.complexity, spec.target);
                if (verbose) {
                    os << "      {}\n"_format(spec.justification);
                }
            }
        }

        static void render_manifest_table(const synthesis_result& result, bool verbose, std::ostream& os) {
            os << "profile {} | {} | {}\n"_format(result.profile_id, result.target_triple, result.toolchain_version);
            os << "  {:<28} {:<20} {:<20} {:>10}  {}\n"_format("function", "target", "status", "compile_ms", "binary");
            for (const auto& vessel : result.vessels) {
                os << "  {:<28} {:<20} {:<20} {:>10.1f}  {}\n"_format(
                        vessel_key(vessel),
                        vessel.target,
                        to_string(vessel.status),
                        vessel.compile_ms,
                        vessel.binary_path.string());
                if (!vessel.diagnostics.empty() && (verbose || vessel.status == vessel_status::error)) {
                    print_text(os, vessel.diagnostics);
                }
            }
            os << "cache: {} hit(s), {} miss(es), {} repair(s)\n"_format(
                    result.cache_hits, result.cache_misses, result.cache_repairs);
        }

        static void render_certificate_table(const parity_certificate& cert, bool verbose, std::ostream& os) {
            os << "{}: {} (confidence {:.3f}%, {}/{} passed, {} timed out)\n"_format(
                    cert.function,
                    cert.certified ? "certified"sv : "NOT certified"sv,
                    cert.confidence,
                    cert.passed,
                    cert.test_count,
                    cert.timed_out);
            os << "  speedup {:.2f}x ({:.1f} ms legacy, {:.1f} ms vessel)\n"_format(
                    cert.speedup, cert.legacy_ms, cert.vessel_ms);
            if (verbose) {
                os << "  relative error mean {:.3e} median {:.3e} stddev {:.3e} max {:.3e}\n"_format(
                        cert.mean_error, cert.median_error, cert.stddev, cert.max_error);
                os << "  ks D {:.4f} p {:.4f} seed {}\n"_format(
                        cert.similarity_statistic, cert.similarity_p_value, cert.seed);
            }
        }

        static void render_report_table(const benchmark_sample& sample, bool verbose, std::ostream& os) {
            os << "{}: {} iteration(s), {} warmup, {} discarded\n"_format(
                    sample.function, sample.iterations, sample.warmup, sample.discarded);
            os << "  mean {:.3f} ms | median {:.3f} | min {:.3f} | max {:.3f} | stddev {:.3f}\n"_format(
                    sample.mean, sample.median, sample.min, sample.max, sample.stddev);
            os << "  p95 {:.3f} ms | p99 {:.3f} ms\n"_format(sample.p95, sample.p99);
            if (sample.baseline) {
                os << "  baseline '{}' mean {:.3f} ms, delta {:+.1f}%{}\n"_format(
                        sample.baseline->name,
                        sample.baseline->mean,
                        sample.baseline->delta_percent,
                        sample.baseline->regression_detected ? " REGRESSION"sv : ""sv);
            }
            if (verbose) {
                for (size_t i = 0U; i < sample.durations.size(); ++i) {
                    os << "  #{} {:.3f} ms\n"_format(i, sample.durations[i]);
                }
            }
        }

        static fs::path default_blueprint_path(const fs::path& source) {
            return fs::path{"{}.blueprint.json"_format(source.stem().string())};
        }

        static std::optional<source_language> language_flag(const command_request& request) {
            if (request.language.empty()) {
                return std::nullopt;
            }
            source_language parsed{};
            if (!try_parse_source_language(request.language, parsed)) {
                throw std::invalid_argument(
                        "invalid --language value: {} (expected python|javascript|ruby)"_format(request.language));
            }
            return parsed;
        }

        // runnable vessels, in manifest order; failed builds are reported and skipped
        static std::vector<std::string> built_functions(
                const pipeline_config& cfg, const synthesis_result& manifest, std::ostream& err) {
            std::vector<std::string> functions{};
            for (const auto& vessel : manifest.vessels) {
                if (vessel.status != vessel_status::error) {
                    functions.emplace_back(vessel_key(vessel));
                }
                else if (!cfg.quiet) {
                    err << "skipping " << vessel_key(vessel) << ": vessel failed to build\n";
                }
            }
            return functions;
        }

        static int run_analyze(const pipeline_config& cfg, const command_request& request, std::ostream& out) {
            auto plan = analyze_file(request.source, language_flag(request));
            auto path = request.output.empty() ? default_blueprint_path(request.source) : request.output;
            write_blueprint(plan, path);

            if (cfg.output == output_mode::json) {
                print_text(out, blueprint_to_json(plan));
                return 0;
            }
            render_blueprint_table(plan, cfg.verbose, out);
            if (!cfg.quiet) {
                out << "wrote " << path.string() << '\n';
            }
            return 0;
        }

        static int run_synthesize(const pipeline_config& cfg, const command_request& request, std::ostream& out) {
            auto plan = read_blueprint(request.blueprint);
            auto profile = load_profile(cfg.profile);
            build_cache cache{cfg.cache_dir};

            auto synth = make_synthesis_request(cfg, request.vessel_dir);
            synth.interpreter = interpreter_for(cfg, plan.language);
            auto result = synthesize_blueprint(plan, profile, std::move(synth), cache);

            auto path = request.output.empty() ? fs::path{"manifest.json"} : request.output;
            write_manifest(result, path);

            if (cfg.output == output_mode::json) {
                print_text(out, manifest_to_json(result));
            }
            else {
                render_manifest_table(result, cfg.verbose, out);
                if (!cfg.quiet) {
                    out << "wrote " << path.string() << '\n';
                }
            }

            auto failed = std::ranges::any_of(
                    result.vessels, [](const vessel_record& v) { return v.status == vessel_status::error; });
            return failed ? 1 : 0;
        }

        static int run_validate(
                const pipeline_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
            auto plan = read_blueprint(request.blueprint);
            auto manifest = read_manifest(request.manifest);

            auto functions = request.functions.empty() ? built_functions(cfg, manifest, err) : request.functions;

            regression_store regressions{cfg.cache_dir};
            auto options = make_parity_options(cfg);
            options.regressions = &regressions;
            auto interpreter = interpreter_for(cfg, plan.language);
            auto dir = request.output.empty() ? fs::path{"certificates"} : request.output;

            bool all_certified = true;
            for (const auto& function : functions) {
                auto cert = validate_vessel(plan, manifest, function, options, interpreter);
                auto path = dir / "{}.certificate.json"_format(function);
                write_certificate(cert, path);
                all_certified = all_certified && cert.certified;

                if (cfg.output == output_mode::json) {
                    print_text(out, certificate_to_json(cert));
                    continue;
                }
                render_certificate_table(cert, cfg.verbose, out);
                if (!cfg.quiet) {
                    out << "wrote " << path.string() << '\n';
                }
            }
            return all_certified ? 0 : 1;
        }

        static int run_benchmark(const pipeline_config& cfg, const command_request& request, std::ostream& out) {
            if (request.functions.size() != 1U) {
                throw std::invalid_argument("benchmark needs exactly one --function");
            }
            const auto& function = request.functions.front();
            auto manifest = read_manifest(request.manifest);

            benchmark_request bench{
                    .options = make_benchmark_options(cfg),
                    .baseline_name = request.baseline,
                    .save_baseline = request.save_baseline};
            for (const auto& arg : request.args) {
                bench.input.push_back(parse_output(arg));
            }

            baseline_store baselines{cfg.cache_dir};
            auto sample = benchmark_vessel(manifest, function, bench, baselines);
            auto path = request.output.empty() ? fs::path{"{}.benchmark.json"_format(function)} : request.output;
            write_report(sample, path);

            if (cfg.output == output_mode::json) {
                print_text(out, report_to_json(sample));
                return 0;
            }
            render_report_table(sample, cfg.verbose, out);
            if (!cfg.quiet) {
                out << "wrote " << path.string() << '\n';
            }
            return 0;
        }

        // analyze -> synthesize -> validate every built vessel -> benchmark the certified ones,
        // writing each artifact under the output directory
        static int run_evolve(
                const pipeline_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
            auto dir = request.output.empty() ? fs::path{"pivot-out"} : request.output;
            auto json = cfg.output == output_mode::json;
            auto wrote = [&](const fs::path& path) {
                if (!json && !cfg.quiet) {
                    out << "wrote " << path.string() << '\n';
                }
            };

            auto plan = analyze_file(request.source, language_flag(request));
            auto blueprint_path = dir / default_blueprint_path(request.source);
            write_blueprint(plan, blueprint_path);
            if (json) {
                print_text(out, blueprint_to_json(plan));
            }
            else {
                render_blueprint_table(plan, cfg.verbose, out);
            }
            wrote(blueprint_path);

            auto profile = load_profile(cfg.profile);
            build_cache cache{cfg.cache_dir};
            auto synth = make_synthesis_request(cfg, dir / request.vessel_dir);
            synth.interpreter = interpreter_for(cfg, plan.language);
            auto manifest = synthesize_blueprint(plan, profile, std::move(synth), cache);
            auto manifest_path = dir / "manifest.json";
            write_manifest(manifest, manifest_path);
            if (json) {
                print_text(out, manifest_to_json(manifest));
            }
            else {
                render_manifest_table(manifest, cfg.verbose, out);
            }
            wrote(manifest_path);

            regression_store regressions{cfg.cache_dir};
            auto parity = make_parity_options(cfg);
            parity.regressions = &regressions;
            auto interpreter = interpreter_for(cfg, plan.language);
            baseline_store baselines{cfg.cache_dir};

            auto failures = std::ranges::count(manifest.vessels, vessel_status::error, &vessel_record::status);
            for (const auto& function : built_functions(cfg, manifest, err)) {
                auto cert = validate_vessel(plan, manifest, function, parity, interpreter);
                auto cert_path = dir / "certificates" / "{}.certificate.json"_format(function);
                write_certificate(cert, cert_path);
                if (json) {
                    print_text(out, certificate_to_json(cert));
                }
                else {
                    render_certificate_table(cert, cfg.verbose, out);
                }
                wrote(cert_path);

                if (!cert.certified) {
                    ++failures;
                    continue;
                }

                benchmark_request bench{.options = make_benchmark_options(cfg)};
                const auto* spec = lookup_function(plan.functions, function);
                if (!request.args.empty()) {
                    for (const auto& arg : request.args) {
                        bench.input.push_back(parse_output(arg));
                    }
                }
                else if (spec != nullptr) {
                    // the seeded random row after the boundary values
                    auto inputs = generate_inputs(*spec, parity);
                    bench.input = inputs.back();
                }
                auto sample = benchmark_vessel(manifest, function, bench, baselines);
                auto report_path = dir / "benchmarks" / "{}.benchmark.json"_format(function);
                write_report(sample, report_path);
                if (json) {
                    print_text(out, report_to_json(sample));
                }
                else {
                    render_report_table(sample, cfg.verbose, out);
                }
                wrote(report_path);
            }
            return failures == 0 ? 0 : 1;
        }

        static int run_cache_gc(const pipeline_config& cfg, const command_request& request, std::ostream& out) {
            build_cache cache{cfg.cache_dir};
            auto removed = cache.collect_garbage(std::chrono::hours{request.max_age_hours});
            out << "removed {} cache entr{} older than {} h\n"_format(
                    removed, removed == 1U ? "y"sv : "ies"sv, request.max_age_hours);
            return 0;
        }

        static int run_cache_list(const pipeline_config& cfg, std::ostream& out) {
            build_cache cache{cfg.cache_dir};
            auto entries = cache.entries();
            std::ranges::sort(entries, {}, &cache_entry::created_ms);
            for (const auto& entry : entries) {
                out << "{}  {:>10}  {:<12}  {}\n"_format(
                        entry.hash, entry.binary_size, entry.profile_id, entry.binary_path.string());
            }
            if (!cfg.quiet) {
                out << entries.size() << " entr" << (entries.size() == 1U ? "y"sv : "ies"sv) << '\n';
            }
            return 0;
        }

    }  // namespace detail

    std::optional<int> parse_cli(
            int argc,
            const char* const* argv,
            pipeline_config& cfg,
            command_request& request,
            std::ostream& out,
            std::ostream& err) {
        CLI::App app{"pivot: analyze, synthesize, validate and benchmark native vessels for hot functions"};
        app.fallthrough();
        app.require_subcommand(0, 1);

        bool show_version = false;
        detail::option_values values{
                .cache_dir = cfg.cache_dir.string(),
                .output = std::string{to_string(cfg.output)},
                .profile = cfg.profile,
                .jobs = cfg.jobs,
                .compile_timeout_ms = cfg.compile_timeout_ms,
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

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", values.config, "Persisted config (pivot.json) applied before flags");
        app.add_option("--cache-dir", values.cache_dir, "Build cache, baselines and regression inputs");
        app.add_option("--output", values.output, "Output mode: table|json");
        app.add_option("--profile", values.profile, "Profile: conservative|balanced|aggressive or a profile json");
        app.add_option("-j,--jobs", values.jobs, "Compile workers (0: one per cpu)");
        app.add_option("--compile-timeout-ms", values.compile_timeout_ms, "Per-compile time budget");
        app.add_option("--toolchain-version", values.toolchain_version, "Toolchain version folded into cache keys");
        app.add_option("--target-triple", values.target_triple, "Target triple folded into cache keys");
        app.add_option("--compiler", values.compilers, "Compiler override <target>=<path> (repeatable)");
        app.add_option("--python", values.python_path, "python interpreter");
        app.add_option("--node", values.node_path, "node interpreter");
        app.add_option("--ruby", values.ruby_path, "ruby interpreter");
        app.add_option("--test-cases", values.test_cases, "Random parity inputs on top of the boundary set");
        app.add_option("--tolerance", values.tolerance, "Max relative error per comparison");
        app.add_option("--confidence", values.confidence_threshold, "Confidence (percent) required to certify");
        app.add_option("--seed", values.seed, "Seed for generated inputs");
        app.add_option("--input-min", values.input_min, "Lower bound for generated numbers");
        app.add_option("--input-max", values.input_max, "Upper bound for generated numbers");
        app.add_option("--run-timeout-ms", values.run_timeout_ms, "Per-call budget for legacy and vessel runs");
        app.add_option("--validate-jobs", values.validate_jobs, "Parallel parity test cases");
        app.add_option("--iterations", values.iterations, "Measured benchmark iterations");
        app.add_option("--warmup", values.warmup, "Discarded warmup iterations");
        app.add_option("--regression-threshold", values.regression_threshold_pct, "Slowdown (percent) flagged");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        auto* analyze_cmd = app.add_subcommand("analyze", "Score functions of a legacy source and write a blueprint");
        analyze_cmd->add_option("source", request.source, "Python, JavaScript or Ruby source")->required();
        analyze_cmd->add_option("--language", request.language, "python|javascript|ruby (default: by extension)");
        analyze_cmd->add_option("-o,--out", request.output, "Blueprint path (default: <stem>.blueprint.json)");

        auto* synthesize_cmd = app.add_subcommand("synthesize", "Generate and compile vessels for a blueprint");
        synthesize_cmd->add_option("blueprint", request.blueprint, "Blueprint json")->required();
        synthesize_cmd->add_option("-o,--out", request.output, "Manifest path (default: manifest.json)");
        synthesize_cmd->add_option("--vessel-dir", request.vessel_dir, "Generated sources and fallback shims");

        auto* validate_cmd = app.add_subcommand("validate", "Certify vessels against the legacy functions");
        validate_cmd->add_option("blueprint", request.blueprint, "Blueprint json")->required();
        validate_cmd->add_option("manifest", request.manifest, "Manifest json")->required();
        validate_cmd->add_option("-f,--function", request.functions, "Function to validate (default: all built)");
        validate_cmd->add_option("-o,--out", request.output, "Certificate directory (default: certificates)");

        auto* benchmark_cmd = app.add_subcommand("benchmark", "Time a vessel and compare with a baseline");
        benchmark_cmd->add_option("manifest", request.manifest, "Manifest json")->required();
        benchmark_cmd->add_option("-f,--function", request.functions, "Function to benchmark")->required();
        benchmark_cmd->add_option("-a,--arg", request.args, "Argument (repeatable, in order)");
        benchmark_cmd->add_option("--baseline", request.baseline, "Baseline name to compare against");
        benchmark_cmd->add_flag("--save-baseline", request.save_baseline, "Store this run as the baseline");
        benchmark_cmd->add_option("-o,--out", request.output, "Report path (default: <function>.benchmark.json)");

        auto* evolve_cmd = app.add_subcommand("evolve", "Analyze, synthesize, validate and benchmark in one run");
        evolve_cmd->add_option("source", request.source, "Python, JavaScript or Ruby source")->required();
        evolve_cmd->add_option("--language", request.language, "python|javascript|ruby (default: by extension)");
        evolve_cmd->add_option("-o,--out", request.output, "Artifact directory (default: pivot-out)");
        evolve_cmd->add_option("--vessel-dir", request.vessel_dir, "Vessel directory, relative to --out");
        evolve_cmd->add_option("-a,--arg", request.args, "Benchmark argument (default: a generated input)");

        auto* cache_cmd = app.add_subcommand("cache", "Inspect or prune the build cache");
        cache_cmd->require_subcommand(1);
        auto* gc_cmd = cache_cmd->add_subcommand("gc", "Remove entries older than --max-age-hours");
        gc_cmd->add_option("--max-age-hours", request.max_age_hours, "Age threshold in hours");
        auto* list_cmd = cache_cmd->add_subcommand("list", "List cache entries");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e, out, err)};
        }

        if (cfg.quiet && cfg.verbose) {
            err << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        auto given = [&](const char* name) { return app.get_option(name)->count() > 0U; };

        if (given("--config")) {
            try {
                auto quiet = cfg.quiet;
                auto verbose = cfg.verbose;
                auto print = cfg.print_config;
                cfg = load_config(values.config, cfg);
                cfg.quiet = quiet;
                cfg.verbose = verbose;
                cfg.print_config = print;
            } catch (const artifact_error& e) {
                err << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (given("--output") && !try_parse_output_mode(values.output, cfg.output)) {
            err << "invalid --output value: " << values.output << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (given("--compiler") && !detail::apply_compiler_overrides(cfg, values.compilers, err)) {
            return std::optional<int>{2};
        }
        if (given("--cache-dir")) {
            cfg.cache_dir = values.cache_dir;
        }
        if (given("--profile")) {
            cfg.profile = values.profile;
        }
        if (given("--jobs")) {
            cfg.jobs = values.jobs;
        }
        if (given("--compile-timeout-ms")) {
            cfg.compile_timeout_ms = values.compile_timeout_ms;
        }
        if (given("--toolchain-version")) {
            cfg.toolchain_version = values.toolchain_version;
        }
        if (given("--target-triple")) {
            cfg.target_triple = values.target_triple;
        }
        if (given("--python")) {
            cfg.python_path = values.python_path;
        }
        if (given("--node")) {
            cfg.node_path = values.node_path;
        }
        if (given("--ruby")) {
            cfg.ruby_path = values.ruby_path;
        }
        if (given("--test-cases")) {
            cfg.test_cases = values.test_cases;
        }
        if (given("--tolerance")) {
            cfg.tolerance = values.tolerance;
        }
        if (given("--confidence")) {
            cfg.confidence_threshold = values.confidence_threshold;
        }
        if (given("--seed")) {
            cfg.seed = values.seed;
        }
        if (given("--input-min")) {
            cfg.input_min = values.input_min;
        }
        if (given("--input-max")) {
            cfg.input_max = values.input_max;
        }
        if (given("--run-timeout-ms")) {
            cfg.run_timeout_ms = values.run_timeout_ms;
        }
        if (given("--validate-jobs")) {
            cfg.validate_jobs = values.validate_jobs;
        }
        if (given("--iterations")) {
            cfg.iterations = values.iterations;
        }
        if (given("--warmup")) {
            cfg.warmup = values.warmup;
        }
        if (given("--regression-threshold")) {
            cfg.regression_threshold_pct = values.regression_threshold_pct;
        }

        if (cfg.compile_timeout_ms <= 0 || cfg.run_timeout_ms <= 0) {
            err << "timeouts must be positive\n";
            return std::optional<int>{2};
        }
        if (cfg.input_min > cfg.input_max) {
            err << "--input-min must not exceed --input-max\n";
            return std::optional<int>{2};
        }
        if (cfg.iterations < 1 || cfg.warmup < 0 || cfg.test_cases < 0) {
            err << "--iterations must be >= 1, --warmup and --test-cases >= 0\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            out << "pivot 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, out);
            return std::optional<int>{0};
        }

        if (analyze_cmd->parsed()) {
            request.kind = command_kind::analyze;
        }
        else if (synthesize_cmd->parsed()) {
            request.kind = command_kind::synthesize;
        }
        else if (validate_cmd->parsed()) {
            request.kind = command_kind::validate;
        }
        else if (benchmark_cmd->parsed()) {
            request.kind = command_kind::benchmark;
        }
        else if (evolve_cmd->parsed()) {
            request.kind = command_kind::evolve;
        }
        else if (gc_cmd->parsed()) {
            request.kind = command_kind::cache_gc;
        }
        else if (list_cmd->parsed()) {
            request.kind = command_kind::cache_list;
        }
        else {
            err << app.help();
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

    std::optional<int> parse_cli(int argc, char** argv, pipeline_config& cfg, command_request& request) {
        return parse_cli(argc, argv, cfg, request, std::cout, std::cerr);
    }

    int run_command(const pipeline_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
        try {
            switch (request.kind) {
                case command_kind::analyze:
                    return detail::run_analyze(cfg, request, out);
                case command_kind::synthesize:
                    return detail::run_synthesize(cfg, request, out);
                case command_kind::validate:
                    return detail::run_validate(cfg, request, out, err);
                case command_kind::benchmark:
                    return detail::run_benchmark(cfg, request, out);
                case command_kind::evolve:
                    return detail::run_evolve(cfg, request, out, err);
                case command_kind::cache_gc:
                    return detail::run_cache_gc(cfg, request, out);
                case command_kind::cache_list:
                    return detail::run_cache_list(cfg, out);
                case command_kind::none:
                    break;
            }
        } catch (const parse_error& e) {
            err << "parse error: " << e.what() << '\n';
            return 3;
        } catch (const artifact_error& e) {
            err << "artifact error: " << e.what() << '\n';
            return 3;
        } catch (const toolchain_error& e) {
            err << "toolchain error: " << e.what() << '\n';
            return 4;
        } catch (const std::exception& e) {
            err << "error: " << e.what() << '\n';
            return 1;
        }
        err << "no command given\n";
        return 2;
    }

}  // namespace pivot::cli
