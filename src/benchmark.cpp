#include "pivot/benchmark.hpp"

#include "pivot/format.hpp"
#include "pivot/stats.hpp"
#include "pivot/utils.hpp"

#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        static bool is_valid_baseline_name(std::string_view name) {
            return !name.empty() && name.front() != '.' && std::ranges::all_of(name, [](char c) {
                       return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' || c == '.';
                   });
        }

        static baseline from_record(internal::baseline_record record) {
            return baseline{
                    .name = std::move(record.name),
                    .function = std::move(record.function),
                    .created_ms = record.created_ms,
                    .durations = std::move(record.durations),
                    .mean = record.mean,
                    .median = record.median,
                    .p95 = record.p95,
                    .p99 = record.p99};
        }

    }  // namespace detail

    benchmark_sample summarize(std::vector<double> durations) {
        benchmark_sample sample{};
        sample.iterations = durations.size();
        sample.mean = stats::mean(durations);
        sample.median = stats::median(durations);
        sample.stddev = stats::stddev(durations);
        sample.p95 = stats::percentile(durations, 95.0);
        sample.p99 = stats::percentile(durations, 99.0);
        if (!durations.empty()) {
            auto [lo, hi] = std::ranges::minmax(durations);
            sample.min = lo;
            sample.max = hi;
        }
        sample.durations = std::move(durations);
        return sample;
    }

    baseline_comparison compare_to_baseline(const benchmark_sample& sample, const baseline& base, double threshold_pct) {
        baseline_comparison comparison{.name = base.name, .mean = base.mean};
        // a run where nothing completed cannot be faster than anything
        if (sample.durations.empty()) {
            comparison.regression_detected = true;
            return comparison;
        }
        if (base.mean > 0.0) {
            comparison.delta_percent = (sample.mean - base.mean) / base.mean * 100.0;
        }
        comparison.regression_detected = comparison.delta_percent > threshold_pct;
        return comparison;
    }

    baseline make_baseline(std::string name, const benchmark_sample& sample) {
        return baseline{
                .name = std::move(name),
                .function = sample.function,
                .created_ms = internal::now_epoch_ms(),
                .durations = sample.durations,
                .mean = sample.mean,
                .median = sample.median,
                .p95 = sample.p95,
                .p99 = sample.p99};
    }

    benchmark_sample benchmark(
            const runner& target, const test_input& input, const benchmark_options& options, const baseline* against) {
        if (options.iterations < 1) {
            throw std::invalid_argument("benchmark needs at least one iteration, got {}"_format(options.iterations));
        }

        for (int i = 0; i < options.warmup; ++i) {
            auto outcome = target.run(input, options.timeout);
            if (outcome.status != run_status::ok) {
                debug_log("warmup iteration ", i, " ", to_string(outcome.status), ": ", outcome.message);
            }
        }

        std::vector<double> durations{};
        durations.reserve(static_cast<size_t>(options.iterations));
        uint64_t discarded = 0U;
        for (int i = 0; i < options.iterations; ++i) {
            auto outcome = target.run(input, options.timeout);
            if (outcome.status != run_status::ok) {
                ++discarded;
                continue;
            }
            durations.push_back(std::chrono::duration<double, std::milli>(outcome.elapsed).count());
        }

        auto sample = summarize(std::move(durations));
        sample.iterations = static_cast<uint64_t>(options.iterations);
        sample.warmup = static_cast<uint64_t>(std::max(options.warmup, 0));
        sample.discarded = discarded;
        if (against != nullptr) {
            sample.baseline = compare_to_baseline(sample, *against, options.regression_threshold_pct);
        }
        return sample;
    }

    baseline_store::baseline_store(fs::path cache_dir) : dir_{std::move(cache_dir) / "baselines"} {}

    fs::path baseline_store::path_for(std::string_view name) const {
        if (!detail::is_valid_baseline_name(name)) {
            throw std::invalid_argument("invalid baseline name: '{}'"_format(name));
        }
        return dir_ / "{}.json"_format(name);
    }

    void baseline_store::save(const baseline& base) const {
        auto path = path_for(base.name);
        if (base.durations.empty()) {
            throw std::invalid_argument("baseline '{}' has no successful iterations"_format(base.name));
        }
        std::error_code ec{};
        fs::create_directories(dir_, ec);
        if (ec) {
            throw std::runtime_error("failed to create {}: {}"_format(dir_.string(), ec.message()));
        }

        internal::baseline_record record{
                .schema_version = internal::supported_schema_version,
                .name = base.name,
                .function = base.function,
                .created_ms = base.created_ms,
                .durations = base.durations,
                .mean = base.mean,
                .median = base.median,
                .p95 = base.p95,
                .p99 = base.p99};
        internal::write_json_file(record, path);
        debug_log("saved baseline '", base.name, "' (mean ", base.mean, " ms)");
    }

    std::optional<baseline> baseline_store::load(std::string_view name) const {
        auto path = path_for(name);
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        auto record = internal::read_json_file<internal::baseline_record>(path);
        internal::validate_supported_schema_version(record.schema_version, path.string());
        return detail::from_record(std::move(record));
    }

    bool baseline_store::exists(std::string_view name) const {
        std::error_code ec{};
        return fs::is_regular_file(path_for(name), ec);
    }

}  // namespace pivot
