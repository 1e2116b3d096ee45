#include "utils.hpp"

namespace pivot::test {
    using namespace std::string_view_literals;
    using namespace pivot::literals;

    TEST_CASE("001: source language parsing and detection", "[001][config]") {
        source_language language = source_language::python;

        REQUIRE(try_parse_source_language("JavaScript"sv, language));
        CHECK(language == source_language::javascript);
        REQUIRE(try_parse_source_language("rb"sv, language));
        CHECK(language == source_language::ruby);
        REQUIRE(try_parse_source_language("PY"sv, language));
        CHECK(language == source_language::python);
        CHECK_FALSE(try_parse_source_language("perl"sv, language));

        CHECK(detect_source_language("hot/loops.py") == source_language::python);
        CHECK(detect_source_language("compute.mjs") == source_language::javascript);
        CHECK(detect_source_language("lib/process.rb") == source_language::ruby);
        CHECK_FALSE(detect_source_language("main.cpp"));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(vessel_status::compiled) == "Compiled"sv);
        CHECK(to_string(vessel_status::cached) == "Cached"sv);
        CHECK(to_string(vessel_status::interpreted_fallback) == "InterpretedFallback"sv);
        CHECK(to_string(vessel_status::error) == "Error"sv);

        vessel_status status = vessel_status::error;
        REQUIRE(try_parse_vessel_status("InterpretedFallback"sv, status));
        CHECK(status == vessel_status::interpreted_fallback);
        CHECK_FALSE(try_parse_vessel_status("cached"sv, status));

        output_mode mode = output_mode::table;
        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));

        CHECK("{}"_format(vessel_status::cached) == "Cached");
        CHECK("{}"_format(source_language::ruby) == "ruby");
    }

    TEST_CASE("001: value kinds follow type hints", "[001][config]") {
        CHECK(kind_for_hint("int"sv) == value_kind::integer);
        CHECK(kind_for_hint(" Integer "sv) == value_kind::integer);
        CHECK(kind_for_hint("float"sv) == value_kind::real);
        CHECK(kind_for_hint("str"sv) == value_kind::text);
        CHECK(kind_for_hint("String"sv) == value_kind::text);
        CHECK(kind_for_hint("bool"sv) == value_kind::boolean);
        CHECK(kind_for_hint(""sv) == value_kind::real);
        CHECK(kind_for_hint("List[int]"sv) == value_kind::real);

        value_kind kind{};
        REQUIRE(try_parse_value_kind(to_string(value_kind::text), kind));
        CHECK(kind == value_kind::text);
        CHECK_FALSE(try_parse_value_kind("complex"sv, kind));
    }

    TEST_CASE("001: builtin optimization profiles", "[001][config][profile]") {
        auto conservative = builtin_profile("conservative"sv);
        REQUIRE(conservative);
        CHECK(conservative->opt_level == 1);
        CHECK(conservative->allow_fallback);
        CHECK_FALSE(conservative->simd);

        auto aggressive = builtin_profile("AGGRESSIVE"sv);
        REQUIRE(aggressive);
        CHECK(aggressive->opt_level == 3);
        CHECK(aggressive->simd);
        CHECK(aggressive->lto);
        CHECK(aggressive->unsafe_math);
        CHECK_FALSE(aggressive->allow_fallback);

        CHECK(load_profile("balanced"sv).id == "balanced");
        CHECK_FALSE(builtin_profile("ludicrous"sv));
        CHECK_THROWS_AS(load_profile("ludicrous"), artifact_error);
    }

    TEST_CASE("001: custom profiles load from json files", "[001][config][profile]") {
        detail::temp_dir tmp{"pivot_001_profile"};
        auto path = tmp.path / "fast.json";
        detail::write_text_file(
                path,
                R"({"id":"fast-math","optLevel":3,"simd":true,"unsafeMath":true,"allowFallback":false,)"
                R"("targetFlags":{"compiled-native":"-fno-plt"}})");

        auto profile = load_profile(path.string());
        CHECK(profile.id == "fast-math");
        CHECK(profile.opt_level == 3);
        CHECK(profile.simd);
        CHECK_FALSE(profile.lto);
        CHECK(profile.unsafe_math);
        CHECK_FALSE(profile.allow_fallback);
        REQUIRE(profile.target_flags.contains("compiled-native"));
        CHECK(profile.target_flags.at("compiled-native") == "-fno-plt");

        detail::write_text_file(tmp.path / "bad.json", R"({"id":"bad","optLevel":7})");
        CHECK_THROWS_AS(load_profile((tmp.path / "bad.json").string()), artifact_error);
    }

    TEST_CASE("001: persisted config keeps unspecified defaults", "[001][config][persist]") {
        detail::temp_dir tmp{"pivot_001_config"};
        auto path = tmp.path / "pivot.json";
        detail::write_text_file(path, R"({"schema_version":1,"test_cases":5,"seed":77,"compilers":{"x":"/bin/x"}})");

        pipeline_config defaults{};
        defaults.cache_dir = "/var/cache/pivot";
        auto cfg = load_config(path, defaults);
        CHECK(cfg.test_cases == 5);
        CHECK(cfg.seed == 77U);
        CHECK(cfg.cache_dir == "/var/cache/pivot");
        CHECK(cfg.tolerance == Catch::Approx(1e-3));
        CHECK(cfg.iterations == 100);
        REQUIRE(cfg.compilers.contains("x"));

        cfg.output = output_mode::json;
        cfg.warmup = 3;
        save_config(cfg, tmp.path / "saved.json");
        auto reloaded = load_config(tmp.path / "saved.json");
        CHECK(reloaded.output == output_mode::json);
        CHECK(reloaded.warmup == 3);
        CHECK(reloaded.seed == 77U);
        CHECK(reloaded.cache_dir == "/var/cache/pivot");
    }

    TEST_CASE("001: persisted config rejects invalid values", "[001][config][persist]") {
        detail::temp_dir tmp{"pivot_001_config_bad"};

        detail::write_text_file(tmp.path / "mode.json", R"({"schema_version":1,"output":"yaml"})");
        CHECK_THROWS_AS(load_config(tmp.path / "mode.json"), artifact_error);

        detail::write_text_file(tmp.path / "version.json", R"({"schema_version":9})");
        CHECK_THROWS_AS(load_config(tmp.path / "version.json"), artifact_error);

        detail::write_text_file(tmp.path / "range.json", R"({"schema_version":1,"input_min":5,"input_max":1})");
        CHECK_THROWS_AS(load_config(tmp.path / "range.json"), artifact_error);

        detail::write_text_file(tmp.path / "broken.json", R"({"schema_version":)");
        CHECK_THROWS_AS(load_config(tmp.path / "broken.json"), artifact_error);

        CHECK_THROWS_AS(load_config(tmp.path / "missing.json"), artifact_error);
    }

    TEST_CASE("001: job resolution", "[001][config]") {
        CHECK(resolve_jobs(3U) == 3U);
        CHECK(resolve_jobs(0U) >= 1U);
    }

}  // namespace pivot::test
