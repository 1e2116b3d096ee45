#include "pivot/synthesizer.hpp"

#include "pivot/format.hpp"
#include "pivot/interpreter.hpp"
#include "pivot/utils.hpp"

#include "internal/json_io.hpp"
#include "internal/platform.hpp"
#include "internal/process.hpp"
#include "internal/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <system_error>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        static constexpr auto version_probe_timeout = std::chrono::milliseconds{10'000};
        static constexpr size_t diagnostics_tail_bytes = 4096U;

        struct target_toolchain {
            std::unique_ptr<code_generator> generator{};
            std::string compiler{};
            std::string version{};
            // why the compiler cannot be used; its vessels fail without aborting the batch
            std::string unusable{};
        };

        struct build_context {
            build_cache& cache;
            const optimization_profile& profile;
            const synthesis_request& request;
            std::string target_triple{};
            std::atomic<uint64_t> hits{0U};
            std::atomic<uint64_t> misses{0U};
            std::atomic<uint64_t> repairs{0U};
        };

        // removes the directory on scope exit
        struct scoped_dir {
            fs::path path{};

            ~scoped_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
                if (ec) {
                    debug_log("failed to remove staging dir ", path.string(), ": ", ec.message());
                }
            }
        };

        static std::string file_stem_for(std::string_view name) {
            std::string out{};
            for (auto c : name) {
                out.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' ? c : '_');
            }
            return out.empty() ? std::string{"function"} : out;
        }

        static std::string tail(std::string_view text, size_t max_bytes) {
            text = utils::trim_view(text);
            if (text.size() <= max_bytes) {
                return std::string{text};
            }
            return "...{}"_format(text.substr(text.size() - max_bytes));
        }

        static std::string compiler_for(const synthesis_request& request, const code_generator& generator) {
            if (auto it = request.compilers.find(std::string{generator.target()}); it != request.compilers.end() &&
                                                                                  !it->second.empty()) {
                return it->second;
            }
            return std::string{generator.default_compiler()};
        }

        static target_toolchain prepare_toolchain(
                std::unique_ptr<code_generator> generator, const synthesis_request& request) {
            target_toolchain toolchain{};
            toolchain.compiler = compiler_for(request, *generator);

            auto probe = internal::run_process({toolchain.compiler, "--version"}, version_probe_timeout);
            if (probe.spawn_failed) {
                toolchain.unusable = "no usable compiler for target '{}': failed to execute '{}'"_format(
                        generator->target(), toolchain.compiler);
                debug_log(toolchain.unusable);
                toolchain.generator = std::move(generator);
                return toolchain;
            }

            if (!request.toolchain_version.empty()) {
                toolchain.version = request.toolchain_version;
            }
            else {
                auto line = internal::first_line(probe.stdout_text);
                if (line.empty()) {
                    line = internal::first_line(probe.stderr_text);
                }
                toolchain.version = line.empty() ? toolchain.compiler : line;
            }
            debug_log("toolchain for ", generator->target(), ": ", toolchain.compiler, " (", toolchain.version, ")");

            toolchain.generator = std::move(generator);
            return toolchain;
        }

        static void finish_failed(
                vessel_record& vessel, const function_spec& spec, std::string diagnostics, build_context& ctx) {
            vessel.diagnostics = std::move(diagnostics);
            vessel.status = vessel_status::error;
            if (!ctx.profile.allow_fallback) {
                return;
            }
            if (ctx.request.source_path.empty()) {
                vessel.diagnostics.append("\nno legacy source available for an interpreter fallback");
                return;
            }

            auto shim_path = ctx.request.output_dir / "{}.fallback.sh"_format(file_stem_for(function_key(spec)));
            auto command =
                    interpreter_command(ctx.request.language, ctx.request.source_path, spec.name, ctx.request.interpreter);
            internal::publish_text_file(shim_path, interpreter_shim(command));
            internal::make_executable(shim_path.string());

            std::error_code ec{};
            vessel.binary_path = shim_path;
            vessel.binary_size = fs::file_size(shim_path, ec);
            vessel.status = vessel_status::interpreted_fallback;
        }

        static vessel_record build_vessel(
                const function_spec& spec, const target_toolchain* toolchain, build_context& ctx) {
            vessel_record vessel{
                    .function_name = spec.name, .function_key = std::string{function_key(spec)}, .target = spec.target};

            if (toolchain == nullptr) {
                ctx.misses.fetch_add(1U, std::memory_order_relaxed);
                finish_failed(vessel, spec, "no code generator registered for target '{}'"_format(spec.target), ctx);
                return vessel;
            }
            if (!toolchain->unusable.empty()) {
                ctx.misses.fetch_add(1U, std::memory_order_relaxed);
                finish_failed(vessel, spec, toolchain->unusable, ctx);
                return vessel;
            }
            const auto& generator = *toolchain->generator;

            std::string source{};
            try {
                source = render_source(generator, spec, ctx.profile, ctx.request.translate);
            } catch (const std::invalid_argument& e) {
                ctx.misses.fetch_add(1U, std::memory_order_relaxed);
                finish_failed(vessel, spec, "failed to render {} source: {}"_format(generator.dialect(), e.what()), ctx);
                return vessel;
            }

            cache_key key{
                    .rendered_source = source,
                    .profile_id = ctx.profile.id,
                    .toolchain_version = toolchain->version,
                    .target_triple = ctx.target_triple};
            vessel.content_hash = content_hash(key);
            vessel.source_path =
                    ctx.request.output_dir / "{}{}"_format(file_stem_for(vessel.function_key), generator.file_extension());
            internal::publish_text_file(vessel.source_path, source);

            auto guard = ctx.cache.lock(vessel.content_hash);

            bool corrupt = false;
            if (auto entry = ctx.cache.lookup(vessel.content_hash)) {
                if (ctx.cache.verify(*entry)) {
                    ctx.hits.fetch_add(1U, std::memory_order_relaxed);
                    vessel.status = vessel_status::cached;
                    vessel.binary_path = entry->binary_path;
                    vessel.binary_size = entry->binary_size;
                    return vessel;
                }
                corrupt = true;
                debug_log("cache entry ", vessel.content_hash, " is corrupt; recompiling");
            }
            ctx.misses.fetch_add(1U, std::memory_order_relaxed);

            scoped_dir staging{ctx.cache.make_staging_dir()};
            auto output = staging.path / file_stem_for(vessel.function_key);
            auto command = generator.compile_command(toolchain->compiler, vessel.source_path, output, ctx.profile);
            auto result = internal::run_process(command, ctx.request.compile_timeout);
            vessel.compile_ms = std::chrono::duration<double, std::milli>(result.elapsed).count();

            std::string failure{};
            std::error_code ec{};
            if (result.timed_out) {
                failure = "compiler timed out after {} ms"_format(ctx.request.compile_timeout.count());
            }
            else if (result.spawn_failed) {
                failure = "failed to execute compiler '{}'"_format(toolchain->compiler);
            }
            else if (result.exit_code != 0) {
                failure = "compiler exited with status {}: {}"_format(
                        result.exit_code, tail(result.stderr_text, diagnostics_tail_bytes));
            }
            else if (!fs::is_regular_file(output, ec)) {
                failure = "compiler produced no output at {}"_format(output.string());
            }

            if (corrupt) {
                ctx.cache.repair(vessel.content_hash);
                ctx.repairs.fetch_add(1U, std::memory_order_relaxed);
            }

            if (!failure.empty()) {
                debug_log("compile failed for ", vessel.function_key, ": ", failure);
                finish_failed(vessel, spec, std::move(failure), ctx);
                return vessel;
            }

            auto entry = ctx.cache.insert(vessel.content_hash, key, output);
            vessel.status = vessel_status::compiled;
            vessel.binary_path = entry.binary_path;
            vessel.binary_size = entry.binary_size;
            return vessel;
        }

        static const generator_registry& builtin_generators() {
            static const generator_registry registry = [] {
                generator_registry r{};
                register_builtin_generators(r);
                return r;
            }();
            return registry;
        }

    }  // namespace detail

    std::string_view vessel_key(const vessel_record& vessel) {
        return vessel.function_key.empty() ? std::string_view{vessel.function_name}
                                           : std::string_view{vessel.function_key};
    }

    synthesizer::synthesizer(build_cache& cache, const generator_registry& generators)
            : cache_{cache}, generators_{generators} {}

    synthesis_result synthesizer::synthesize(
            const std::vector<function_spec>& functions,
            const optimization_profile& profile,
            const synthesis_request& request) const {
        synthesis_result result{};
        result.profile_id = profile.id;
        result.language = request.language;
        result.source_path = request.source_path;
        result.target_triple = request.target_triple.empty() ? std::string{internal::platform::host_triple()}
                                                             : request.target_triple;

        std::map<std::string, detail::target_toolchain, std::less<>> toolchains{};
        for (const auto& spec : functions) {
            if (toolchains.contains(spec.target)) {
                continue;
            }
            auto generator = generators_.create(spec.target);
            if (!generator) {
                continue;
            }
            toolchains.emplace(spec.target, detail::prepare_toolchain(std::move(generator), request));
        }
        if (!toolchains.empty() && std::ranges::all_of(toolchains, [](const auto& entry) {
                return !entry.second.unusable.empty();
            })) {
            throw toolchain_error(toolchains.begin()->second.unusable);
        }

        if (!request.toolchain_version.empty()) {
            result.toolchain_version = request.toolchain_version;
        }
        else {
            std::vector<std::string> versions{};
            for (const auto& [target, toolchain] : toolchains) {
                if (!toolchain.unusable.empty()) {
                    continue;
                }
                versions.push_back("{}: {}"_format(target, toolchain.version));
            }
            result.toolchain_version = utils::join_with_separator(versions, "; "sv);
        }

        std::error_code ec{};
        fs::create_directories(request.output_dir, ec);
        if (ec) {
            throw std::runtime_error(
                    "failed to create output directory {}: {}"_format(request.output_dir.string(), ec.message()));
        }

        detail::build_context ctx{
                .cache = cache_, .profile = profile, .request = request, .target_triple = result.target_triple};

        result.vessels.resize(functions.size());
        internal::parallel_for(functions.size(), resolve_jobs(request.jobs), [&](size_t i) {
            const auto& spec = functions[i];
            auto it = toolchains.find(spec.target);
            result.vessels[i] = detail::build_vessel(spec, it == toolchains.end() ? nullptr : &it->second, ctx);
        });

        result.cache_hits = ctx.hits.load();
        result.cache_misses = ctx.misses.load();
        result.cache_repairs = ctx.repairs.load();
        debug_log("synthesized ",
                  result.vessels.size(),
                  " vessel(s): ",
                  result.cache_hits,
                  " hit(s), ",
                  result.cache_misses,
                  " miss(es), ",
                  result.cache_repairs,
                  " repair(s)");
        return result;
    }

    synthesis_result synthesize(
            const std::vector<function_spec>& functions,
            const optimization_profile& profile,
            const synthesis_request& request,
            build_cache& cache) {
        return synthesizer{cache, detail::builtin_generators()}.synthesize(functions, profile, request);
    }

}  // namespace pivot
