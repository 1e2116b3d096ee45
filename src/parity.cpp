#include "pivot/parity.hpp"

#include "pivot/format.hpp"
#include "pivot/stats.hpp"
#include "pivot/utils.hpp"

#include "internal/json_io.hpp"
#include "internal/process.hpp"
#include "internal/types.hpp"
#include "internal/worker_pool.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <system_error>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        static constexpr double similarity_alpha = 0.05;
        static constexpr size_t max_random_text_length = 8U;

        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        static std::vector<test_value> boundary_values(value_kind kind) {
            constexpr auto i32_min = static_cast<int64_t>(std::numeric_limits<int32_t>::min());
            constexpr auto i32_max = static_cast<int64_t>(std::numeric_limits<int32_t>::max());
            switch (kind) {
                case value_kind::integer:
                    return {int64_t{0}, int64_t{1}, int64_t{-1}, i32_min, i32_max};
                case value_kind::real:
                    return {0.0,
                            1.0,
                            -1.0,
                            static_cast<double>(i32_min),
                            static_cast<double>(i32_max),
                            std::numeric_limits<double>::lowest(),
                            std::numeric_limits<double>::max()};
                case value_kind::text:
                    return {std::string{}, std::string{"a"}};
                case value_kind::boolean:
                    return {false, true};
            }
            return {0.0};
        }

        static test_value random_value(value_kind kind, std::mt19937_64& rng, const parity_options& options) {
            switch (kind) {
                case value_kind::integer: {
                    auto lo = static_cast<int64_t>(std::ceil(options.input_min));
                    auto hi = std::max(lo, static_cast<int64_t>(std::floor(options.input_max)));
                    return std::uniform_int_distribution<int64_t>{lo, hi}(rng);
                }
                case value_kind::real: {
                    auto hi = std::max(options.input_min, options.input_max);
                    return std::uniform_real_distribution<double>{options.input_min, hi}(rng);
                }
                case value_kind::text: {
                    auto length = std::uniform_int_distribution<size_t>{0U, max_random_text_length}(rng);
                    std::uniform_int_distribution<int> letter{'a', 'z'};
                    std::string text(length, 'a');
                    for (auto& c : text) {
                        c = static_cast<char>(letter(rng));
                    }
                    return text;
                }
                case value_kind::boolean:
                    return (rng() & 1U) != 0U;
            }
            return 0.0;
        }

        static std::string file_stem_for(std::string_view function) {
            std::string out{};
            for (auto c : function) {
                out.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' || c == '.' ? c : '_');
            }
            return out.empty() ? std::string{"function"} : out;
        }

        static internal::stored_value_record encode(const test_value& value) {
            return {.kind = std::string{to_string(kind_of(value))}, .text = format_value(value)};
        }

        static test_value decode(const internal::stored_value_record& record, const std::string& origin) {
            value_kind kind{};
            if (!try_parse_value_kind(record.kind, kind)) {
                throw std::runtime_error("unknown value kind '{}' in {}"_format(record.kind, origin));
            }
            switch (kind) {
                case value_kind::integer:
                    if (auto v = utils::parse_arithmetic<int64_t>(record.text)) {
                        return *v;
                    }
                    break;
                case value_kind::real:
                    if (auto v = utils::parse_arithmetic<double>(record.text)) {
                        return *v;
                    }
                    break;
                case value_kind::text:
                    return record.text;
                case value_kind::boolean:
                    if (record.text == "true"sv || record.text == "false"sv) {
                        return record.text == "true"sv;
                    }
                    break;
            }
            throw std::runtime_error("malformed {} value '{}' in {}"_format(record.kind, record.text, origin));
        }

        static bool both_ok(const comparison_record& record) {
            return record.legacy.status == run_status::ok && record.vessel.status == run_status::ok;
        }

        static double to_ms(std::chrono::nanoseconds elapsed) {
            return std::chrono::duration<double, std::milli>(elapsed).count();
        }

    }  // namespace detail

    value_kind kind_of(const test_value& value) {
        return std::visit(
                detail::overloaded{
                        [](int64_t) { return value_kind::integer; },
                        [](double) { return value_kind::real; },
                        [](const std::string&) { return value_kind::text; },
                        [](bool) { return value_kind::boolean; }},
                value);
    }

    std::string format_value(const test_value& value) {
        return std::visit(
                detail::overloaded{
                        [](int64_t v) { return std::to_string(v); },
                        [](double v) {
                            auto text = "{}"_format(v);
                            if (std::isfinite(v) && text.find_first_of(".e"sv) == std::string::npos) {
                                text.append(".0");
                            }
                            return text;
                        },
                        [](const std::string& v) { return v; },
                        [](bool v) { return std::string{v ? "true" : "false"}; }},
                value);
    }

    test_value parse_output(std::string_view text) {
        auto trimmed = utils::trim_view(text);
        // last non-empty line; earlier lines are the callee's own chatter
        if (auto nl = trimmed.rfind('\n'); nl != std::string_view::npos) {
            trimmed = utils::trim_view(trimmed.substr(nl + 1U));
        }
        if (trimmed == "true"sv || trimmed == "True"sv) {
            return true;
        }
        if (trimmed == "false"sv || trimmed == "False"sv) {
            return false;
        }
        // from_chars rejects an explicit sign; Go prints +Inf
        auto number = trimmed;
        if (number.size() > 1U && number.front() == '+' && number[1] != '-' && number[1] != '+') {
            number.remove_prefix(1U);
        }
        if (auto v = utils::parse_arithmetic<int64_t>(number)) {
            return *v;
        }
        if (auto v = utils::parse_arithmetic<double>(number)) {
            return *v;
        }
        return std::string{trimmed};
    }

    bool is_numeric(const test_value& value) {
        return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    }

    double as_double(const test_value& value) {
        if (auto* i = std::get_if<int64_t>(&value)) {
            return static_cast<double>(*i);
        }
        if (auto* d = std::get_if<double>(&value)) {
            return *d;
        }
        throw std::invalid_argument("value is not numeric");
    }

    std::string_view to_string(run_status status) {
        switch (status) {
            case run_status::ok:
                return "ok"sv;
            case run_status::timeout:
                return "timeout"sv;
            case run_status::error:
                return "error"sv;
        }
        return "error"sv;
    }

    function_runner::function_runner(callable fn) : fn_{std::move(fn)} {
        if (!fn_) {
            throw std::invalid_argument("function_runner requires a callable");
        }
    }

    run_outcome function_runner::run(const test_input& input, std::chrono::milliseconds timeout) const {
        run_outcome outcome{};
        auto started = std::chrono::steady_clock::now();
        try {
            outcome.value = fn_(input);
            outcome.status = run_status::ok;
        } catch (const std::exception& e) {
            outcome.status = run_status::error;
            outcome.message = e.what();
        }
        outcome.elapsed = std::chrono::steady_clock::now() - started;
        if (outcome.status == run_status::ok && outcome.elapsed > timeout) {
            outcome.status = run_status::timeout;
            outcome.message = "exceeded {} ms"_format(timeout.count());
        }
        return outcome;
    }

    process_runner::process_runner(std::vector<std::string> command) : command_{std::move(command)} {
        if (command_.empty()) {
            throw std::invalid_argument("process_runner requires a command");
        }
    }

    run_outcome process_runner::run(const test_input& input, std::chrono::milliseconds timeout) const {
        auto args = command_;
        for (const auto& value : input) {
            args.push_back(format_value(value));
        }

        auto result = internal::run_process(args, timeout);
        run_outcome outcome{};
        outcome.elapsed = result.elapsed;
        if (result.timed_out) {
            outcome.status = run_status::timeout;
            outcome.message = "killed after {} ms"_format(timeout.count());
        }
        else if (!result.ok()) {
            outcome.status = run_status::error;
            outcome.message = "exit {}: {}"_format(result.exit_code, internal::first_line(result.stderr_text));
        }
        else {
            outcome.status = run_status::ok;
            outcome.value = parse_output(result.stdout_text);
        }
        return outcome;
    }

    regression_store::regression_store(fs::path root) : dir_{std::move(root) / "regressions"} {}

    fs::path regression_store::path_for(std::string_view function) const {
        return dir_ / "{}.json"_format(detail::file_stem_for(function));
    }

    std::vector<test_input> regression_store::load(std::string_view function) const {
        auto path = path_for(function);
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return {};
        }
        auto record = internal::read_json_file<internal::regression_file_record>(path);
        internal::validate_supported_schema_version(record.schema_version, path.string());

        std::vector<test_input> inputs{};
        inputs.reserve(record.inputs.size());
        for (const auto& stored : record.inputs) {
            test_input input{};
            input.reserve(stored.size());
            for (const auto& value : stored) {
                input.push_back(detail::decode(value, path.string()));
            }
            inputs.push_back(std::move(input));
        }
        return inputs;
    }

    size_t regression_store::record(std::string_view function, const std::vector<test_input>& inputs) const {
        auto existing = load(function);
        size_t added = 0U;
        for (const auto& input : inputs) {
            if (std::ranges::find(existing, input) == existing.end()) {
                existing.push_back(input);
                ++added;
            }
        }
        if (added == 0U) {
            return 0U;
        }

        std::error_code ec{};
        fs::create_directories(dir_, ec);
        if (ec) {
            throw std::runtime_error("failed to create {}: {}"_format(dir_.string(), ec.message()));
        }

        internal::regression_file_record record{.function = std::string{function}};
        for (const auto& input : existing) {
            std::vector<internal::stored_value_record> stored{};
            for (const auto& value : input) {
                stored.push_back(detail::encode(value));
            }
            record.inputs.push_back(std::move(stored));
        }
        internal::write_json_file(record, path_for(function));
        debug_log("recorded ", added, " regression input(s) for ", function);
        return added;
    }

    std::vector<test_input> generate_inputs(
            const function_spec& spec, const parity_options& options, const std::vector<test_input>& regressions) {
        std::vector<value_kind> kinds{};
        kinds.reserve(spec.parameters.size());
        for (const auto& param : spec.parameters) {
            kinds.push_back(kind_for_hint(param.type_hint));
        }

        std::vector<test_input> inputs{};

        // boundary rows walk every parameter's boundary list in lockstep
        size_t rows = 1U;
        for (auto kind : kinds) {
            rows = std::max(rows, detail::boundary_values(kind).size());
        }
        for (size_t row = 0U; row < rows; ++row) {
            test_input input{};
            for (auto kind : kinds) {
                auto values = detail::boundary_values(kind);
                input.push_back(values[row % values.size()]);
            }
            inputs.push_back(std::move(input));
            if (kinds.empty()) {
                break;
            }
        }

        std::mt19937_64 rng{options.seed};
        for (int i = 0; i < options.test_cases; ++i) {
            test_input input{};
            for (auto kind : kinds) {
                input.push_back(detail::random_value(kind, rng, options));
            }
            inputs.push_back(std::move(input));
        }

        for (const auto& input : regressions) {
            if (input.size() == kinds.size()) {
                inputs.push_back(input);
            }
        }
        return inputs;
    }

    double relative_error(double a, double b) {
        if (std::isnan(a) && std::isnan(b)) {
            return 0.0;
        }
        if (a == b) {
            return 0.0;
        }
        if (!std::isfinite(a) || !std::isfinite(b)) {
            return std::numeric_limits<double>::infinity();
        }
        return std::abs(a - b) / std::max(std::abs(a), std::abs(b));
    }

    comparison_record compare_outputs(test_input input, run_outcome legacy, run_outcome vessel, double tolerance) {
        comparison_record record{.input = std::move(input), .legacy = std::move(legacy), .vessel = std::move(vessel)};
        if (!detail::both_ok(record)) {
            return record;
        }

        if (is_numeric(record.legacy.value) && is_numeric(record.vessel.value)) {
            auto a = as_double(record.legacy.value);
            auto b = as_double(record.vessel.value);
            record.relative_error = relative_error(a, b);
            record.absolute_error = record.relative_error == 0.0 ? 0.0 : std::abs(a - b);
            record.passed = record.relative_error <= tolerance;
            return record;
        }

        record.passed = record.legacy.value == record.vessel.value;
        return record;
    }

    double parity_confidence(uint64_t passed, uint64_t failed, double similarity_p_value) {
        auto posterior = stats::pass_posterior(passed, failed);
        auto similarity = std::min(1.0, std::max(0.0, similarity_p_value) / detail::similarity_alpha);
        return 100.0 * posterior * similarity;
    }

    parity_certificate build_certificate(
            std::string_view function, const std::vector<comparison_record>& records, const parity_options& options) {
        parity_certificate cert{};
        cert.function = std::string{function};
        cert.seed = options.seed;
        cert.test_count = records.size();

        std::vector<double> errors{};
        std::vector<double> legacy_values{};
        std::vector<double> vessel_values{};
        double legacy_ms = 0.0;
        double vessel_ms = 0.0;

        for (const auto& record : records) {
            if (record.passed) {
                ++cert.passed;
            }
            else {
                ++cert.failed;
            }
            if (record.legacy.status == run_status::timeout || record.vessel.status == run_status::timeout) {
                ++cert.timed_out;
            }
            if (!detail::both_ok(record)) {
                continue;
            }

            legacy_ms += detail::to_ms(record.legacy.elapsed);
            vessel_ms += detail::to_ms(record.vessel.elapsed);

            if (!is_numeric(record.legacy.value) || !is_numeric(record.vessel.value)) {
                continue;
            }
            if (std::isfinite(record.relative_error)) {
                errors.push_back(record.relative_error);
            }
            auto a = as_double(record.legacy.value);
            auto b = as_double(record.vessel.value);
            if (std::isfinite(a) && std::isfinite(b)) {
                legacy_values.push_back(a);
                vessel_values.push_back(b);
            }
        }

        cert.mean_error = stats::mean(errors);
        cert.median_error = stats::median(errors);
        cert.stddev = stats::stddev(errors);
        cert.max_error = errors.empty() ? 0.0 : std::ranges::max(errors);

        cert.similarity_statistic = stats::ks_statistic(legacy_values, vessel_values);
        cert.similarity_p_value =
                stats::ks_pvalue(cert.similarity_statistic, legacy_values.size(), vessel_values.size());

        cert.legacy_ms = legacy_ms;
        cert.vessel_ms = vessel_ms;
        cert.speedup = vessel_ms > 0.0 ? legacy_ms / vessel_ms : 0.0;

        cert.confidence = parity_confidence(cert.passed, cert.failed, cert.similarity_p_value);
        cert.certified = cert.test_count > 0U && cert.failed == 0U && cert.confidence >= options.confidence_threshold;
        return cert;
    }

    parity_certificate validate(
            const runner& legacy, const runner& vessel, const function_spec& spec, const parity_options& options) {
        std::vector<test_input> stored{};
        if (options.regressions != nullptr) {
            stored = options.regressions->load(function_key(spec));
        }
        auto inputs = generate_inputs(spec, options, stored);

        std::vector<comparison_record> records(inputs.size());
        internal::parallel_for(inputs.size(), std::max(options.jobs, 1U), [&](size_t i) {
            auto legacy_outcome = legacy.run(inputs[i], options.timeout);
            auto vessel_outcome = vessel.run(inputs[i], options.timeout);
            records[i] = compare_outputs(inputs[i], std::move(legacy_outcome), std::move(vessel_outcome), options.tolerance);
        });

        auto cert = build_certificate(std::string{function_key(spec)}, records, options);

        if (options.regressions != nullptr) {
            std::vector<test_input> failed_inputs{};
            for (const auto& record : records) {
                if (!record.passed) {
                    failed_inputs.push_back(record.input);
                }
            }
            options.regressions->record(function_key(spec), failed_inputs);
        }

        debug_log("parity for ",
                  function_key(spec),
                  ": ",
                  cert.passed,
                  "/",
                  cert.test_count,
                  " passed, confidence ",
                  cert.confidence,
                  cert.certified ? " (certified)" : " (not certified)");
        return cert;
    }

}  // namespace pivot
