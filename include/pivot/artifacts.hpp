#pragma once

#include "analyzer.hpp"
#include "benchmark.hpp"
#include "config.hpp"
#include "parity.hpp"
#include "synthesizer.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    namespace fs = std::filesystem;

    // malformed or invalid JSON artifact at a stage boundary
    class artifact_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Analyzer output for one source file.
    struct blueprint {
        source_language language{source_language::python};
        fs::path source_path{};
        std::vector<function_spec> functions{};
    };

    /*
     * Stage artifacts. The *_json functions are the in-memory form of the matching
     * read_/write_ pair; every reader validates before returning and throws artifact_error
     * (with `origin` in the message) on any violation:
     *
     *   blueprint    known source language, complexity >= 1, line span >= 1, a target per function
     *   manifest     known vessel statuses, Cached/Compiled vessels carry a content hash
     *   certificate  passed + failed == test count, confidence within [0, 100]
     *   report       ordered statistics, no more durations than iterations
     */
    std::string blueprint_to_json(const blueprint& value);
    blueprint blueprint_from_json(const std::string& json, const std::string& origin = "<blueprint>");
    void write_blueprint(const blueprint& value, const fs::path& path);
    blueprint read_blueprint(const fs::path& path);

    std::string manifest_to_json(const synthesis_result& value);
    synthesis_result manifest_from_json(const std::string& json, const std::string& origin = "<manifest>");
    void write_manifest(const synthesis_result& value, const fs::path& path);
    synthesis_result read_manifest(const fs::path& path);

    std::string certificate_to_json(const parity_certificate& value);
    parity_certificate certificate_from_json(const std::string& json, const std::string& origin = "<certificate>");
    void write_certificate(const parity_certificate& value, const fs::path& path);
    parity_certificate read_certificate(const fs::path& path);

    std::string report_to_json(const benchmark_sample& value);
    benchmark_sample report_from_json(const std::string& json, const std::string& origin = "<report>");
    void write_report(const benchmark_sample& value, const fs::path& path);
    benchmark_sample read_report(const fs::path& path);

    std::string profile_to_json(const optimization_profile& value);
    optimization_profile profile_from_json(const std::string& json, const std::string& origin = "<profile>");
    optimization_profile read_profile(const fs::path& path);
    void write_profile(const optimization_profile& value, const fs::path& path);

    // builtin profile id, or else a path to a profile json
    optimization_profile load_profile(std::string_view id_or_path);

    // Persisted pipeline_config (pivot.json). Keys absent from the file keep the values
    // of `defaults`; CLI-only flags (quiet, verbose, print_config) are never persisted.
    std::string config_to_json(const pipeline_config& config);
    pipeline_config load_config(const fs::path& path, const pipeline_config& defaults = {});
    void save_config(const pipeline_config& config, const fs::path& path);

}  // namespace pivot
