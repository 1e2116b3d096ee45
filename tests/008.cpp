#include "utils.hpp"

namespace pivot::test {
    using namespace std::string_view_literals;

    namespace detail {
        static std::string blueprint_json(std::string_view function_fields, std::string_view language = "python") {
            return R"({"schemaVersion":1,"status":"ok","sourceLanguage":")" + std::string{language} +
                   R"(","sourcePath":"/src/hot.py","functions":[{)" + std::string{function_fields} + "}]}";
        }

        static synthesis_result sample_manifest() {
            synthesis_result result{};
            result.profile_id = "balanced";
            result.language = source_language::ruby;
            result.source_path = "/src/lib.rb";
            result.toolchain_version = "compiled-native: clang 18";
            result.target_triple = "x86_64-unknown-linux-gnu";
            result.cache_hits = 1U;
            result.cache_misses = 1U;
            result.vessels.push_back(vessel_record{
                    .function_name = "fib",
                    .target = "compiled-native",
                    .source_path = "/out/fib.cpp",
                    .binary_path = "/cache/objects/0123456789abcdef/fib",
                    .status = vessel_status::cached,
                    .content_hash = "0123456789abcdef",
                    .binary_size = 4096U});
            result.vessels.push_back(vessel_record{
                    .function_name = "each_total",
                    .target = "compiled-native",
                    .status = vessel_status::error,
                    .content_hash = "fedcba9876543210",
                    .compile_ms = 12.5,
                    .diagnostics = "compiler exited with status 1"});
            return result;
        }

        static parity_certificate sample_certificate() {
            return parity_certificate{
                    .function = "calculate",
                    .certified = true,
                    .confidence = 99.99,
                    .test_count = 107U,
                    .passed = 107U,
                    .failed = 0U,
                    .mean_error = 1e-7,
                    .max_error = 4e-6,
                    .similarity_p_value = 1.0,
                    .legacy_ms = 2843.0,
                    .vessel_ms = 812.0,
                    .speedup = 2843.0 / 812.0,
                    .seed = 42U};
        }
    }  // namespace detail

    TEST_CASE("008: blueprints read with defaults for optional fields", "[008][artifacts][blueprint]") {
        auto value = blueprint_from_json(detail::blueprint_json(
                R"("name":"calculate","startLine":3,"lineCount":2,"complexity":1,)"
                R"("parameters":[{"name":"x","typeHint":"float"}],"target":"compiled-native")"));
        CHECK(value.language == source_language::python);
        CHECK(value.source_path == "/src/hot.py");
        REQUIRE(value.functions.size() == 1U);
        const auto& fn = value.functions[0];
        CHECK(fn.name == "calculate");
        CHECK(fn.key == "calculate");
        CHECK(fn.start_line == 3U);
        CHECK(fn.line_count == 2U);
        CHECK_FALSE(fn.has_loops);
        CHECK_FALSE(fn.return_hint);
        REQUIRE(fn.parameters.size() == 1U);
        CHECK(fn.parameters[0].type_hint == "float");
        CHECK(fn.target == "compiled-native");
    }

    TEST_CASE("008: blueprint files survive a write and read", "[008][artifacts][blueprint]") {
        detail::temp_dir tmp{"pivot_008_blueprint"};
        auto specs = analyze("def area(w: float, h: float) -> float:\n    return w * h\n"sv, source_language::python);
        blueprint value{.language = source_language::python, .source_path = tmp.path / "shapes.py", .functions = specs};

        auto path = tmp.path / "nested" / "shapes.blueprint.json";
        write_blueprint(value, path);
        auto text = detail::read_text_file(path);
        CHECK(text.find(R"("sourceLanguage":"python")") != std::string::npos);
        CHECK(text.find(R"("returnHint":"float")") != std::string::npos);
        CHECK(text.find(R"("key":"area")") != std::string::npos);

        auto loaded = read_blueprint(path);
        REQUIRE(loaded.functions.size() == 1U);
        CHECK(loaded.functions[0].name == "area");
        CHECK(loaded.functions[0].math_heavy == specs[0].math_heavy);
        CHECK(loaded.functions[0].justification == specs[0].justification);
        REQUIRE(loaded.functions[0].return_hint);
        CHECK(*loaded.functions[0].return_hint == "float");
    }

    TEST_CASE("008: invalid blueprints are rejected", "[008][artifacts][blueprint]") {
        auto valid_fields = R"("name":"f","startLine":1,"lineCount":1,"complexity":1,"target":"compiled-native")"sv;
        CHECK_NOTHROW(blueprint_from_json(detail::blueprint_json(valid_fields)));

        CHECK_THROWS_AS(blueprint_from_json(detail::blueprint_json(valid_fields, "perl")), artifact_error);
        CHECK_THROWS_AS(
                blueprint_from_json(detail::blueprint_json(
                        R"("name":"f","startLine":1,"lineCount":1,"complexity":0,"target":"compiled-native")")),
                artifact_error);
        CHECK_THROWS_AS(
                blueprint_from_json(detail::blueprint_json(
                        R"("name":"f","startLine":0,"lineCount":1,"complexity":1,"target":"compiled-native")")),
                artifact_error);
        CHECK_THROWS_AS(
                blueprint_from_json(detail::blueprint_json(R"("name":"f","startLine":1,"lineCount":1,"complexity":1)")),
                artifact_error);
        CHECK_THROWS_AS(
                blueprint_from_json(R"({"schemaVersion":2,"sourceLanguage":"python","functions":[]})"), artifact_error);
        CHECK_THROWS_AS(blueprint_from_json(R"({"schemaVersion":1,"functions":[)"), artifact_error);
        CHECK_THROWS_AS(
                blueprint_from_json(detail::blueprint_json(
                        R"("name":"f","key":"f.L1","startLine":1,"lineCount":1,"complexity":1,"target":"compiled-native"},)"
                        R"({"name":"g","key":"f.L1","startLine":4,"lineCount":1,"complexity":1,"target":"compiled-native")")),
                artifact_error);

        try {
            blueprint_from_json(detail::blueprint_json(valid_fields, "perl"), "hot.blueprint.json");
            FAIL("expected an artifact_error");
        } catch (const artifact_error& e) {
            CHECK(std::string_view{e.what()}.starts_with("hot.blueprint.json: "));
        }
    }

    TEST_CASE("008: manifests mark partial batches", "[008][artifacts][manifest]") {
        auto manifest = detail::sample_manifest();
        auto json = manifest_to_json(manifest);
        CHECK(json.find(R"("status":"partial")") != std::string::npos);
        CHECK(json.find(R"("status":"Cached")") != std::string::npos);
        CHECK(json.find(R"("status":"Error")") != std::string::npos);

        auto loaded = manifest_from_json(json);
        CHECK(loaded.profile_id == "balanced");
        CHECK(loaded.language == source_language::ruby);
        CHECK(loaded.toolchain_version == "compiled-native: clang 18");
        CHECK(loaded.cache_hits == 1U);
        REQUIRE(loaded.vessels.size() == 2U);
        CHECK(loaded.vessels[0].status == vessel_status::cached);
        CHECK(loaded.vessels[0].binary_size == 4096U);
        CHECK(loaded.vessels[1].status == vessel_status::error);
        CHECK(loaded.vessels[1].diagnostics == "compiler exited with status 1");
        CHECK(loaded.vessels[1].binary_path.empty());

        manifest.vessels.pop_back();
        CHECK(manifest_to_json(manifest).find(R"("status":"ok")") != std::string::npos);
    }

    TEST_CASE("008: invalid manifests are rejected", "[008][artifacts][manifest]") {
        auto with_vessel = [](std::string_view vessel) {
            return R"({"schemaVersion":1,"status":"ok","profileId":"balanced","sourceLanguage":"python","vessels":[{)" +
                   std::string{vessel} + "}]}";
        };
        CHECK_NOTHROW(manifest_from_json(with_vessel(R"("functionName":"f","status":"Error")")));
        CHECK(manifest_from_json(with_vessel(R"("functionName":"f","status":"Error")")).vessels[0].function_key == "f");
        CHECK_THROWS_AS(manifest_from_json(with_vessel(R"("functionName":"f","status":"Done")")), artifact_error);
        CHECK_THROWS_AS(
                manifest_from_json(with_vessel(R"("functionName":"f","status":"Cached","binaryPath":"/bin/f")")),
                artifact_error);
        CHECK_THROWS_AS(
                manifest_from_json(with_vessel(R"("functionName":"f","status":"Compiled","contentHash":"0123456789abcdef")")),
                artifact_error);
        CHECK_THROWS_AS(manifest_from_json(with_vessel(R"("status":"Error")")), artifact_error);
        CHECK_THROWS_AS(
                manifest_from_json(R"({"schemaVersion":1,"status":"done","profileId":"x","sourceLanguage":"python"})"),
                artifact_error);
        CHECK_THROWS_AS(
                manifest_from_json(R"({"schemaVersion":1,"status":"ok","sourceLanguage":"python"})"), artifact_error);
    }

    TEST_CASE("008: certificates round trip and enforce their counts", "[008][artifacts][certificate]") {
        detail::temp_dir tmp{"pivot_008_certificate"};
        auto cert = detail::sample_certificate();
        auto path = tmp.path / "certificates" / "calculate.certificate.json";
        write_certificate(cert, path);

        auto text = detail::read_text_file(path);
        CHECK(text.find(R"("testCount":107)") != std::string::npos);
        CHECK(text.find(R"("performance":{)") != std::string::npos);

        auto loaded = read_certificate(path);
        CHECK(loaded.function == "calculate");
        CHECK(loaded.certified);
        CHECK(loaded.confidence == Catch::Approx(99.99));
        CHECK(loaded.test_count == 107U);
        CHECK(loaded.speedup == Catch::Approx(3.5).margin(0.01));
        CHECK(loaded.similarity_p_value == 1.0);
        CHECK(loaded.seed == 42U);

        auto mismatched = cert;
        mismatched.passed = 100U;
        CHECK_THROWS_AS(certificate_from_json(certificate_to_json(mismatched)), artifact_error);

        auto overconfident = cert;
        overconfident.confidence = 120.0;
        CHECK_THROWS_AS(certificate_from_json(certificate_to_json(overconfident)), artifact_error);

        auto contradictory = cert;
        contradictory.passed = 106U;
        contradictory.failed = 1U;
        CHECK_THROWS_AS(certificate_from_json(certificate_to_json(contradictory)), artifact_error);

        contradictory.certified = false;
        CHECK_NOTHROW(certificate_from_json(certificate_to_json(contradictory)));

        CHECK_THROWS_AS(read_certificate(tmp.path / "missing.json"), artifact_error);
    }

    TEST_CASE("008: benchmark reports round trip with their baseline", "[008][artifacts][report]") {
        auto sample = summarize({10.0, 12.0, 11.0, 13.0});
        sample.function = "calculate";
        sample.iterations = 5U;
        sample.warmup = 2U;
        sample.discarded = 1U;
        sample.baseline = baseline_comparison{.name = "nightly", .mean = 9.0, .delta_percent = 27.7, .regression_detected = true};

        auto loaded = report_from_json(report_to_json(sample));
        CHECK(loaded.function == "calculate");
        CHECK(loaded.iterations == 5U);
        CHECK(loaded.discarded == 1U);
        CHECK(loaded.durations == sample.durations);
        CHECK(loaded.p99 == sample.p99);
        REQUIRE(loaded.baseline);
        CHECK(loaded.baseline->name == "nightly");
        CHECK(loaded.baseline->regression_detected);

        sample.baseline.reset();
        CHECK(report_to_json(sample).find("\"baseline\"") == std::string::npos);
        CHECK_FALSE(report_from_json(report_to_json(sample)).baseline);

        auto overfull = sample;
        overfull.iterations = 2U;
        CHECK_THROWS_AS(report_from_json(report_to_json(overfull)), artifact_error);

        auto unordered = sample;
        unordered.p95 = unordered.max + 1.0;
        CHECK_THROWS_AS(report_from_json(report_to_json(unordered)), artifact_error);
    }

    TEST_CASE("008: profiles round trip and validate", "[008][artifacts][profile]") {
        detail::temp_dir tmp{"pivot_008_profile"};
        auto profile = aggressive_profile();
        profile.id = "aggressive-plus";
        profile.target_flags["memory-safe-native"] = "-C panic=abort";
        write_profile(profile, tmp.path / "profile.json");

        auto loaded = read_profile(tmp.path / "profile.json");
        CHECK(loaded.id == "aggressive-plus");
        CHECK(loaded.opt_level == 3);
        CHECK(loaded.lto);
        CHECK_FALSE(loaded.allow_fallback);
        CHECK(loaded.target_flags == profile.target_flags);
        CHECK(load_profile((tmp.path / "profile.json").string()).id == "aggressive-plus");

        CHECK_THROWS_AS(profile_from_json(R"({"id":"x","optLevel":4})"), artifact_error);
        CHECK_THROWS_AS(profile_from_json(R"({"optLevel":1})"), artifact_error);
        CHECK(profile_to_json(balanced_profile()).find(R"("optLevel":2)") != std::string::npos);
    }

}  // namespace pivot::test
