#pragma once

#include "analyzer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pivot {

    namespace fs = std::filesystem;

    using test_value = std::variant<int64_t, double, std::string, bool>;
    using test_input = std::vector<test_value>;

    value_kind kind_of(const test_value& value);

    // argv spelling handed to runners; reals round-trip exactly
    std::string format_value(const test_value& value);

    // stdout of a runner: integer, real, true/false, or the trimmed text
    test_value parse_output(std::string_view text);

    bool is_numeric(const test_value& value);
    double as_double(const test_value& value);

    enum class run_status : uint8_t { ok, timeout, error };

    std::string_view to_string(run_status status);

    struct run_outcome {
        run_status status{run_status::error};
        test_value value{};
        std::chrono::nanoseconds elapsed{};
        std::string message{};
    };

    // One implementation under test. run() never throws for failures of the callee.
    class runner {
      public:
        virtual ~runner() = default;
        virtual run_outcome run(const test_input& input, std::chrono::milliseconds timeout) const = 0;
    };

    // In-process callable. The timeout is checked against elapsed time once the call returns.
    class function_runner final : public runner {
      public:
        using callable = std::function<test_value(const test_input&)>;

        explicit function_runner(callable fn);

        run_outcome run(const test_input& input, std::chrono::milliseconds timeout) const override;

      private:
        callable fn_;
    };

    // External command with the formatted arguments appended; killed on timeout.
    class process_runner final : public runner {
      public:
        explicit process_runner(std::vector<std::string> command);

        run_outcome run(const test_input& input, std::chrono::milliseconds timeout) const override;

      private:
        std::vector<std::string> command_;
    };

    // Failed inputs per function, persisted under <root>/regressions/<function>.json.
    class regression_store {
      public:
        explicit regression_store(fs::path root);

        std::vector<test_input> load(std::string_view function) const;

        // appends inputs not already stored; returns how many were added
        size_t record(std::string_view function, const std::vector<test_input>& inputs) const;

      private:
        fs::path dir_;

        fs::path path_for(std::string_view function) const;
    };

    struct parity_options {
        int test_cases{100};
        double tolerance{1e-3};
        double confidence_threshold{99.9};
        uint64_t seed{0x5eed'1234ULL};
        double input_min{-1'000.0};
        double input_max{1'000.0};
        std::chrono::milliseconds timeout{10'000};
        unsigned jobs{1U};
        const regression_store* regressions{nullptr};
    };

    // boundary set, then test_cases seeded random inputs, then stored regressions
    std::vector<test_input> generate_inputs(
            const function_spec& spec, const parity_options& options, const std::vector<test_input>& regressions = {});

    struct comparison_record {
        test_input input{};
        run_outcome legacy{};
        run_outcome vessel{};
        bool passed{false};
        double absolute_error{};
        double relative_error{};
    };

    // relative error |a-b| / max(|a|, |b|); 0 when both are 0, NaN pairs and equal infinities
    double relative_error(double a, double b);

    comparison_record compare_outputs(test_input input, run_outcome legacy, run_outcome vessel, double tolerance);

    struct parity_certificate {
        std::string function{};
        bool certified{false};
        double confidence{};
        uint64_t test_count{};
        uint64_t passed{};
        uint64_t failed{};
        uint64_t timed_out{};
        double mean_error{};
        double median_error{};
        double stddev{};
        double max_error{};
        double similarity_statistic{};
        double similarity_p_value{1.0};
        double legacy_ms{};
        double vessel_ms{};
        double speedup{};
        uint64_t seed{};
    };

    // similarity = min(1, p / 0.05); confidence = 100 * P(failure rate < 0.1) * similarity
    double parity_confidence(uint64_t passed, uint64_t failed, double similarity_p_value);

    // aggregates comparisons into a certificate; pure
    parity_certificate build_certificate(
            std::string_view function, const std::vector<comparison_record>& records, const parity_options& options);

    parity_certificate validate(
            const runner& legacy, const runner& vessel, const function_spec& spec, const parity_options& options);

}  // namespace pivot
