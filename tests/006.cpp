#include "utils.hpp"

#include <cmath>
#include <limits>

namespace pivot::test {
    using namespace std::string_view_literals;

    namespace detail {
        static function_spec scale_spec() {
            function_spec spec{};
            spec.name = "scale";
            spec.parameters = {parameter_spec{.name = "x", .type_hint = "float"}};
            spec.return_hint = "float";
            spec.target = std::string{targets::compiled_native};
            return spec;
        }

        static run_outcome ok_outcome(test_value value, std::chrono::nanoseconds elapsed = {}) {
            return run_outcome{.status = run_status::ok, .value = std::move(value), .elapsed = elapsed};
        }

        static test_value doubled(const test_input& input) {
            return as_double(input.at(0)) * 2.0;
        }
    }  // namespace detail

    TEST_CASE("006: value formatting and output parsing", "[006][parity][values]") {
        CHECK(format_value(int64_t{-42}) == "-42");
        CHECK(format_value(2.0) == "2.0");
        CHECK(format_value(2.5) == "2.5");
        CHECK(format_value(1e20) == "1e+20");
        CHECK(format_value(std::string{"abc"}) == "abc");
        CHECK(format_value(true) == "true");

        CHECK(parse_output("42\n"sv) == test_value{int64_t{42}});
        CHECK(parse_output("  -3.25 \n"sv) == test_value{-3.25});
        CHECK(parse_output("True\n"sv) == test_value{true});
        CHECK(parse_output("false"sv) == test_value{false});
        CHECK(parse_output("hello world\n"sv) == test_value{std::string{"hello world"}});
        CHECK(parse_output("debug: starting\n\n7\n\n"sv) == test_value{int64_t{7}});

        auto inf = parse_output("inf"sv);
        REQUIRE(std::holds_alternative<double>(inf));
        CHECK(std::isinf(std::get<double>(inf)));

        auto go_inf = parse_output("+Inf\n"sv);
        REQUIRE(std::holds_alternative<double>(go_inf));
        CHECK(std::isinf(std::get<double>(go_inf)));
        CHECK(std::get<double>(go_inf) > 0.0);
        CHECK(parse_output("+1.5"sv) == test_value{1.5});
        CHECK(parse_output("+7"sv) == test_value{int64_t{7}});
        CHECK(parse_output("+-7"sv) == test_value{std::string{"+-7"}});
        CHECK(parse_output("+"sv) == test_value{std::string{"+"}});

        CHECK(kind_of(test_value{int64_t{1}}) == value_kind::integer);
        CHECK(kind_of(test_value{std::string{}}) == value_kind::text);
        CHECK(is_numeric(test_value{1.5}));
        CHECK_FALSE(is_numeric(test_value{false}));
        CHECK(as_double(test_value{int64_t{3}}) == 3.0);
        CHECK_THROWS_AS(as_double(test_value{std::string{"3"}}), std::invalid_argument);
        CHECK(to_string(run_status::timeout) == "timeout"sv);
    }

    TEST_CASE("006: relative error edge cases", "[006][parity][error]") {
        constexpr auto inf = std::numeric_limits<double>::infinity();
        constexpr auto nan = std::numeric_limits<double>::quiet_NaN();

        CHECK(relative_error(1.0, 1.0) == 0.0);
        CHECK(relative_error(0.0, 0.0) == 0.0);
        CHECK(relative_error(nan, nan) == 0.0);
        CHECK(relative_error(inf, inf) == 0.0);
        CHECK(std::isinf(relative_error(inf, 1.0)));
        CHECK(std::isinf(relative_error(nan, 1.0)));
        CHECK(std::isinf(relative_error(inf, -inf)));
        CHECK(relative_error(2.0, 1.0) == Catch::Approx(0.5));
        CHECK(relative_error(1.0, 2.0) == Catch::Approx(0.5));
        CHECK(relative_error(-1.0, 1.0) == Catch::Approx(2.0));
        CHECK(relative_error(0.0, 1e-9) == Catch::Approx(1.0));
    }

    TEST_CASE("006: output comparison", "[006][parity][compare]") {
        auto within = compare_outputs({1000.0}, detail::ok_outcome(1000.0), detail::ok_outcome(999.5), 1e-3);
        CHECK(within.passed);
        CHECK(within.relative_error == Catch::Approx(0.0005));
        CHECK(within.absolute_error == Catch::Approx(0.5));

        auto outside = compare_outputs({1.0}, detail::ok_outcome(1.0), detail::ok_outcome(0.95), 1e-3);
        CHECK_FALSE(outside.passed);
        CHECK(outside.relative_error == Catch::Approx(0.05));

        auto mixed = compare_outputs({}, detail::ok_outcome(int64_t{4}), detail::ok_outcome(4.0), 0.0);
        CHECK(mixed.passed);

        auto text = compare_outputs({}, detail::ok_outcome(std::string{"ab"}), detail::ok_outcome(std::string{"ab"}), 0.0);
        CHECK(text.passed);

        auto kinds = compare_outputs({}, detail::ok_outcome(true), detail::ok_outcome(int64_t{1}), 1.0);
        CHECK_FALSE(kinds.passed);

        constexpr auto inf = std::numeric_limits<double>::infinity();
        auto overflow = compare_outputs({1e308}, detail::ok_outcome(inf), detail::ok_outcome(parse_output("+Inf\n"sv)), 1e-9);
        CHECK(overflow.passed);

        run_outcome crashed{.status = run_status::error, .message = "exit 1: boom"};
        auto failed = compare_outputs({1.0}, detail::ok_outcome(2.0), crashed, 1.0);
        CHECK_FALSE(failed.passed);
        CHECK(failed.vessel.message == "exit 1: boom");
    }

    TEST_CASE("006: function runner reports errors and timeouts", "[006][parity][runner]") {
        CHECK_THROWS_AS(function_runner{function_runner::callable{}}, std::invalid_argument);

        function_runner ok{detail::doubled};
        auto outcome = ok.run({2.5}, std::chrono::milliseconds{1'000});
        CHECK(outcome.status == run_status::ok);
        CHECK(outcome.value == test_value{5.0});

        function_runner throwing{[](const test_input&) -> test_value { throw std::runtime_error("boom"); }};
        auto error = throwing.run({}, std::chrono::milliseconds{1'000});
        CHECK(error.status == run_status::error);
        CHECK(error.message == "boom");

        function_runner slow{[](const test_input&) -> test_value {
            std::this_thread::sleep_for(std::chrono::milliseconds{30});
            return int64_t{1};
        }};
        auto late = slow.run({}, std::chrono::milliseconds{5});
        CHECK(late.status == run_status::timeout);
        CHECK(late.message == "exceeded 5 ms");
    }

    TEST_CASE("006: generated inputs start at the boundaries", "[006][parity][inputs]") {
        function_spec spec{};
        spec.name = "pick";
        spec.parameters = {parameter_spec{.name = "n", .type_hint = "int"}, parameter_spec{.name = "s", .type_hint = "str"}};

        parity_options options{};
        options.test_cases = 10;
        options.seed = 7U;
        options.input_min = -10.0;
        options.input_max = 10.0;

        std::vector<test_input> stored{
                {int64_t{99}, std::string{"zz"}},
                {int64_t{1}},
        };
        auto inputs = generate_inputs(spec, options, stored);
        REQUIRE(inputs.size() == 5U + 10U + 1U);

        CHECK(inputs[0] == test_input{int64_t{0}, std::string{}});
        CHECK(inputs[1] == test_input{int64_t{1}, std::string{"a"}});
        CHECK(inputs[2] == test_input{int64_t{-1}, std::string{}});
        CHECK(inputs[3][0] == test_value{int64_t{std::numeric_limits<int32_t>::min()}});
        CHECK(inputs[4][0] == test_value{int64_t{std::numeric_limits<int32_t>::max()}});

        for (size_t i = 5U; i < 15U; ++i) {
            REQUIRE(inputs[i].size() == 2U);
            auto n = std::get<int64_t>(inputs[i][0]);
            CHECK(n >= -10);
            CHECK(n <= 10);
            const auto& s = std::get<std::string>(inputs[i][1]);
            CHECK(s.size() <= 8U);
            CHECK(std::ranges::all_of(s, [](char c) { return c >= 'a' && c <= 'z'; }));
        }
        CHECK(inputs.back() == stored.front());
    }

    TEST_CASE("006: generated inputs are deterministic per seed", "[006][parity][inputs]") {
        auto spec = detail::scale_spec();
        parity_options options{};
        options.test_cases = 20;
        options.seed = 1234U;

        auto first = generate_inputs(spec, options);
        auto again = generate_inputs(spec, options);
        CHECK(first == again);
        REQUIRE(first.size() == 7U + 20U);
        CHECK(first[5][0] == test_value{std::numeric_limits<double>::lowest()});
        for (size_t i = 7U; i < first.size(); ++i) {
            auto x = std::get<double>(first[i][0]);
            CHECK(x >= options.input_min);
            CHECK(x <= options.input_max);
        }

        options.seed = 4321U;
        CHECK(generate_inputs(spec, options) != first);

        function_spec nullary{};
        nullary.name = "now";
        options.test_cases = 3;
        auto empty_rows = generate_inputs(nullary, options);
        CHECK(empty_rows.size() == 4U);
        CHECK(std::ranges::all_of(empty_rows, [](const test_input& input) { return input.empty(); }));
    }

    TEST_CASE("006: confidence grows with evidence", "[006][parity][confidence]") {
        CHECK(parity_confidence(0U, 0U, 1.0) == Catch::Approx(10.0));
        CHECK(parity_confidence(100U, 0U, 1.0) == Catch::Approx(100.0 * (1.0 - std::pow(0.9, 101.0))));

        double previous = 0.0;
        for (uint64_t passed : {1U, 10U, 50U, 100U, 500U}) {
            auto confidence = parity_confidence(passed, 0U, 1.0);
            CHECK(confidence > previous);
            CHECK(confidence <= 100.0);
            previous = confidence;
        }

        CHECK(parity_confidence(100U, 1U, 1.0) < parity_confidence(100U, 0U, 1.0));
        CHECK(parity_confidence(100U, 0U, 0.01) == Catch::Approx(parity_confidence(100U, 0U, 1.0) * 0.2));
        CHECK(parity_confidence(100U, 0U, 0.05) == Catch::Approx(parity_confidence(100U, 0U, 1.0)));
    }

    TEST_CASE("006: all-passing run certifies with the measured speedup", "[006][parity][certificate]") {
        parity_options options{};
        options.seed = 99U;

        std::vector<comparison_record> records{};
        for (int i = 0; i < 100; ++i) {
            auto value = 1.5 * i;
            records.push_back(compare_outputs(
                    {static_cast<double>(i)},
                    detail::ok_outcome(value, std::chrono::microseconds{28'430}),
                    detail::ok_outcome(value, std::chrono::microseconds{8'120}),
                    options.tolerance));
        }

        auto cert = build_certificate("calculate", records, options);
        CHECK(cert.function == "calculate");
        CHECK(cert.test_count == 100U);
        CHECK(cert.passed == 100U);
        CHECK(cert.failed == 0U);
        CHECK(cert.certified);
        CHECK(cert.confidence >= 99.9);
        CHECK(cert.similarity_statistic == 0.0);
        CHECK(cert.similarity_p_value == 1.0);
        CHECK(cert.legacy_ms == Catch::Approx(2843.0));
        CHECK(cert.vessel_ms == Catch::Approx(812.0));
        CHECK(cert.speedup == Catch::Approx(3.5).margin(0.01));
        CHECK(cert.max_error == 0.0);
        CHECK(cert.seed == 99U);
    }

    TEST_CASE("006: a single mismatch blocks certification", "[006][parity][certificate]") {
        parity_options options{};
        std::vector<comparison_record> records{};
        for (int i = 0; i < 100; ++i) {
            auto value = static_cast<double>(i + 1);
            auto vessel = i == 42 ? value * 0.95 : value;
            records.push_back(
                    compare_outputs({value}, detail::ok_outcome(value), detail::ok_outcome(vessel), options.tolerance));
        }

        auto cert = build_certificate("calculate", records, options);
        CHECK(cert.failed == 1U);
        CHECK(cert.passed == 99U);
        CHECK_FALSE(cert.certified);
        CHECK(cert.max_error == Catch::Approx(0.05));
        CHECK(cert.mean_error == Catch::Approx(0.05 / 100.0));
        CHECK(cert.confidence < 100.0);

        auto empty = build_certificate("calculate", {}, options);
        CHECK(empty.test_count == 0U);
        CHECK_FALSE(empty.certified);
        CHECK(empty.speedup == 0.0);
    }

    TEST_CASE("006: regression store keeps distinct failing inputs", "[006][parity][regressions]") {
        detail::temp_dir tmp{"pivot_006_regressions"};
        regression_store store{tmp.path};
        CHECK(store.load("calculate").empty());

        std::vector<test_input> inputs{
                {int64_t{3}, 2.5, std::string{"abc"}, true},
                {std::numeric_limits<double>::lowest()},
        };
        CHECK(store.record("calculate", inputs) == 2U);
        CHECK(fs::exists(tmp.path / "regressions" / "calculate.json"));
        CHECK(store.record("calculate", inputs) == 0U);
        CHECK(store.record("calculate", {{1.0}, inputs[0]}) == 1U);

        auto loaded = store.load("calculate");
        REQUIRE(loaded.size() == 3U);
        CHECK(loaded[0] == inputs[0]);
        CHECK(loaded[1] == inputs[1]);
        CHECK(loaded[2] == test_input{1.0});

        CHECK(store.record("other", {}) == 0U);
        CHECK_FALSE(fs::exists(tmp.path / "regressions" / "other.json"));
    }

    TEST_CASE("006: validate end to end with in-process runners", "[006][parity][validate]") {
        detail::temp_dir tmp{"pivot_006_validate"};
        regression_store store{tmp.path};
        auto spec = detail::scale_spec();

        parity_options options{};
        options.test_cases = 100;
        options.seed = 5U;
        options.jobs = 4U;
        options.regressions = &store;

        function_runner legacy{detail::doubled};

        SECTION("matching implementations certify") {
            function_runner vessel{detail::doubled};
            auto cert = validate(legacy, vessel, spec, options);
            CHECK(cert.test_count == 107U);
            CHECK(cert.failed == 0U);
            CHECK(cert.certified);
            CHECK(cert.confidence >= 99.9);
            CHECK(store.load("scale").empty());
        }

        SECTION("divergent implementations record regressions") {
            function_runner vessel{[](const test_input& input) -> test_value {
                auto x = as_double(input.at(0));
                return x > 500.0 ? x * 2.1 : x * 2.0;
            }};
            auto cert = validate(legacy, vessel, spec, options);
            CHECK_FALSE(cert.certified);
            REQUIRE(cert.failed >= 1U);
            CHECK(cert.passed + cert.failed == cert.test_count);

            auto recorded = store.load("scale");
            CHECK(recorded.size() == cert.failed);

            auto rerun = validate(legacy, vessel, spec, options);
            CHECK(rerun.test_count == cert.test_count + recorded.size());
            CHECK(rerun.failed == cert.failed * 2U);
            CHECK(store.load("scale").size() == recorded.size());
        }

        SECTION("a hung input fails without stalling the others") {
            options.timeout = std::chrono::milliseconds{20};
            function_runner vessel{[](const test_input& input) -> test_value {
                auto x = as_double(input.at(0));
                if (x == 1.0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds{100});
                }
                return x * 2.0;
            }};
            auto cert = validate(legacy, vessel, spec, options);
            CHECK_FALSE(cert.certified);
            CHECK(cert.timed_out == 1U);
            CHECK(cert.failed == 1U);
            CHECK(cert.passed == cert.test_count - 1U);

            auto recorded = store.load("scale");
            REQUIRE(recorded.size() == 1U);
            CHECK(recorded.front() == test_input{1.0});
        }

        SECTION("same-named functions keep separate certificates and regressions") {
            spec.name = "__init__";
            spec.key = "__init__.L12";
            function_runner vessel{[](const test_input& input) -> test_value { return as_double(input.at(0)) * 3.0; }};
            auto cert = validate(legacy, vessel, spec, options);
            CHECK(cert.function == "__init__.L12");
            CHECK_FALSE(store.load("__init__.L12").empty());
            CHECK(store.load("__init__").empty());
            CHECK(fs::exists(tmp.path / "regressions" / "__init__.L12.json"));
        }
    }

}  // namespace pivot::test
