#pragma once

#include "parity.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    namespace fs = std::filesystem;

    struct benchmark_options {
        int iterations{100};
        int warmup{5};
        std::chrono::milliseconds timeout{10'000};
        double regression_threshold_pct{10.0};
    };

    // A named, persisted sample that later runs compare against.
    struct baseline {
        std::string name{};
        std::string function{};
        int64_t created_ms{};
        std::vector<double> durations{};
        double mean{};
        double median{};
        double p95{};
        double p99{};
    };

    struct baseline_comparison {
        std::string name{};
        double mean{};
        double delta_percent{};
        bool regression_detected{false};
    };

    struct benchmark_sample {
        std::string function{};
        uint64_t iterations{};
        uint64_t warmup{};
        uint64_t discarded{};
        std::vector<double> durations{};
        double mean{};
        double median{};
        double min{};
        double max{};
        double stddev{};
        double p95{};
        double p99{};
        std::optional<baseline_comparison> baseline{};
    };

    // fills every statistic from durations (milliseconds, in run order)
    benchmark_sample summarize(std::vector<double> durations);

    // delta = (mean - baseline.mean) / baseline.mean * 100; advisory only. A sample with no
    // successful iteration is always a regression.
    baseline_comparison compare_to_baseline(const benchmark_sample& sample, const baseline& base, double threshold_pct);

    baseline make_baseline(std::string name, const benchmark_sample& sample);

    // Warmup runs are discarded; timed-out or failed iterations are dropped and counted.
    benchmark_sample benchmark(
            const runner& target,
            const test_input& input,
            const benchmark_options& options,
            const baseline* against = nullptr);

    // Named baselines stored as <cache_dir>/baselines/<name>.json.
    class baseline_store {
      public:
        explicit baseline_store(fs::path cache_dir);

        void save(const baseline& base) const;
        std::optional<baseline> load(std::string_view name) const;
        bool exists(std::string_view name) const;

        const fs::path& dir() const { return dir_; }

      private:
        fs::path dir_;

        fs::path path_for(std::string_view name) const;
    };

}  // namespace pivot
