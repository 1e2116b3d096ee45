#pragma once

#include "analyzer.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "registry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    namespace fs = std::filesystem;

    // no compiler for a requested target can be executed at all
    class toolchain_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct vessel_record {
        std::string function_name{};
        // function_spec::key of the function this vessel was built from
        std::string function_key{};
        std::string target{};
        fs::path source_path{};
        fs::path binary_path{};
        vessel_status status{vessel_status::error};
        std::string content_hash{};
        double compile_ms{};
        uint64_t binary_size{};
        // compiler stderr tail; empty on success
        std::string diagnostics{};
    };

    // function_key, or the function name for manifests written without keys
    std::string_view vessel_key(const vessel_record& vessel);

    using placeholder_map = std::map<std::string, std::string, std::less<>>;

    // Substitutes {{name}} placeholders. Throws std::invalid_argument on an unknown name or
    // an unterminated "{{".
    std::string render_template(std::string_view text, const placeholder_map& values);

    // Per-target source rendering and compile command. The generated program takes the
    // function arguments as argv and prints the result on stdout.
    class code_generator {
      public:
        virtual ~code_generator() = default;

        virtual std::string_view target() const = 0;
        // language name handed to body translators, e.g. "c++"
        virtual std::string_view dialect() const = 0;
        virtual std::string_view file_extension() const = 0;
        virtual std::string_view default_compiler() const = 0;
        virtual std::string_view source_template() const = 0;

        // maps a free-form source type hint; unknown hints map to the target's real type
        virtual std::string map_type(std::string_view hint) const = 0;

        // {{arguments}}: the parameter list of the generated function
        virtual std::string declare_parameters(const function_spec& spec) const = 0;
        // {{call_arguments}}: argv decoding expressions for the call in main
        virtual std::string decode_arguments(const function_spec& spec) const = 0;

        // body used when no translator is supplied; compiles, fails at run time
        virtual std::string untranslated_body(const function_spec& spec) const = 0;

        virtual std::vector<std::string> compiler_flags(const optimization_profile& profile) const = 0;

        virtual std::vector<std::string> compile_command(
                const std::string& compiler,
                const fs::path& source,
                const fs::path& output,
                const optimization_profile& profile) const = 0;
    };

    using generator_registry = named_registry<code_generator>;

    void register_builtin_generators(generator_registry& registry);

    // (spec, dialect) -> function body in the target language. Parameters are in scope as
    // p_<name>, with non-identifier characters replaced by '_'.
    using body_translator = std::function<std::string(const function_spec&, std::string_view)>;

    // pivot_<name> with non-identifier characters replaced by '_'; a recursive body calls this
    std::string emitted_function_name(const function_spec& spec);

    std::string render_source(
            const code_generator& generator,
            const function_spec& spec,
            const optimization_profile& profile,
            const body_translator& translate = {});

    struct synthesis_request {
        source_language language{source_language::python};
        // legacy source wrapped by interpreter fallback shims
        fs::path source_path{};
        // generated sources and fallback shims land here
        fs::path output_dir{"vessels"};
        unsigned jobs{0U};
        std::chrono::milliseconds compile_timeout{120'000};
        std::string toolchain_version{};
        std::string target_triple{};
        // target id -> compiler executable
        std::map<std::string, std::string> compilers{};
        // interpreter used by fallback shims; empty selects the language default
        fs::path interpreter{};
        body_translator translate{};
    };

    struct synthesis_result {
        std::string profile_id{};
        source_language language{source_language::python};
        fs::path source_path{};
        std::string toolchain_version{};
        std::string target_triple{};
        std::vector<vessel_record> vessels{};
        uint64_t cache_hits{};
        uint64_t cache_misses{};
        uint64_t cache_repairs{};
    };

    /*
     * Renders, hashes and compiles each function through the build cache. Vessel order
     * matches the input order. A failing vessel never fails the batch, and a target whose
     * compiler cannot be spawned only fails its own vessels. Throws toolchain_error when no
     * requested target has a usable compiler, and on an I/O failure on the output directory.
     */
    class synthesizer {
      public:
        synthesizer(build_cache& cache, const generator_registry& generators);

        synthesis_result synthesize(
                const std::vector<function_spec>& functions,
                const optimization_profile& profile,
                const synthesis_request& request) const;

      private:
        build_cache& cache_;
        const generator_registry& generators_;
    };

    // builtin generators only
    synthesis_result synthesize(
            const std::vector<function_spec>& functions,
            const optimization_profile& profile,
            const synthesis_request& request,
            build_cache& cache);

}  // namespace pivot
