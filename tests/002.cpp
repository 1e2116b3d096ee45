#include "utils.hpp"

#include "pivot/cli.hpp"

#include <sstream>
#include <vector>

namespace pivot::test {
    using namespace std::string_view_literals;
    using namespace pivot::literals;

    namespace detail {
        struct cli_run {
            std::optional<int> result{};
            pipeline_config cfg{};
            cli::command_request request{};
            std::string out{};
            std::string err{};
        };

        static cli_run parse(const std::vector<std::string>& args) {
            std::vector<const char*> argv{};
            argv.reserve(args.size());
            for (const auto& arg : args) {
                argv.push_back(arg.c_str());
            }

            cli_run run{};
            std::ostringstream out{};
            std::ostringstream err{};
            run.result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), run.cfg, run.request, out, err);
            run.out = out.str();
            run.err = err.str();
            return run;
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts global options and a subcommand", "[002][cli]") {
        auto run = detail::parse(
                {"pivot",
                 "--cache-dir",
                 "/tmp/pivot_tests",
                 "--output",
                 "json",
                 "-j",
                 "4",
                 "--seed",
                 "42",
                 "--tolerance",
                 "0.01",
                 "--compiler",
                 "compiled-native=/opt/llvm/bin/clang++",
                 "--toolchain-version",
                 "clang 18",
                 "analyze",
                 "hot.py",
                 "-o",
                 "hot.blueprint.json"});

        CHECK_FALSE(run.result);
        CHECK(run.cfg.cache_dir == "/tmp/pivot_tests");
        CHECK(run.cfg.output == output_mode::json);
        CHECK(run.cfg.jobs == 4U);
        CHECK(run.cfg.seed == 42U);
        CHECK(run.cfg.tolerance == Catch::Approx(0.01));
        CHECK(run.cfg.toolchain_version == "clang 18");
        REQUIRE(run.cfg.compilers.contains("compiled-native"));
        CHECK(run.cfg.compilers.at("compiled-native") == "/opt/llvm/bin/clang++");

        CHECK(run.request.kind == cli::command_kind::analyze);
        CHECK(run.request.source == "hot.py");
        CHECK(run.request.output == "hot.blueprint.json");
    }

    TEST_CASE("002: parse_cli reads subcommand options", "[002][cli]") {
        auto bench = detail::parse(
                {"pivot",
                 "benchmark",
                 "manifest.json",
                 "-f",
                 "calculate",
                 "-a",
                 "10",
                 "-a",
                 "2.5",
                 "--baseline",
                 "nightly",
                 "--save-baseline"});
        CHECK_FALSE(bench.result);
        CHECK(bench.request.kind == cli::command_kind::benchmark);
        CHECK(bench.request.manifest == "manifest.json");
        CHECK(bench.request.functions == std::vector<std::string>{"calculate"});
        CHECK(bench.request.args == std::vector<std::string>{"10", "2.5"});
        CHECK(bench.request.baseline == "nightly");
        CHECK(bench.request.save_baseline);

        auto validate = detail::parse({"pivot", "validate", "bp.json", "manifest.json", "-f", "a", "-f", "b"});
        CHECK_FALSE(validate.result);
        CHECK(validate.request.kind == cli::command_kind::validate);
        CHECK(validate.request.blueprint == "bp.json");
        CHECK(validate.request.functions.size() == 2U);

        auto gc = detail::parse({"pivot", "cache", "gc", "--max-age-hours", "6"});
        CHECK_FALSE(gc.result);
        CHECK(gc.request.kind == cli::command_kind::cache_gc);
        CHECK(gc.request.max_age_hours == 6);

        auto list = detail::parse({"pivot", "cache", "list"});
        CHECK_FALSE(list.result);
        CHECK(list.request.kind == cli::command_kind::cache_list);

        auto evolve = detail::parse({"pivot", "evolve", "hot.js", "--language", "javascript", "-o", "out", "-a", "3"});
        CHECK_FALSE(evolve.result);
        CHECK(evolve.request.kind == cli::command_kind::evolve);
        CHECK(evolve.request.source == "hot.js");
        CHECK(evolve.request.language == "javascript");
        CHECK(evolve.request.output == "out");
        CHECK(evolve.request.args == std::vector<std::string>{"3"});

        auto no_source = detail::parse({"pivot", "evolve"});
        REQUIRE(no_source.result);
        CHECK(*no_source.result != 0);
    }

    TEST_CASE("002: parse_cli rejects invalid combinations", "[002][cli]") {
        auto quiet_verbose = detail::parse({"pivot", "--quiet", "--verbose", "analyze", "x.py"});
        REQUIRE(quiet_verbose.result);
        CHECK(*quiet_verbose.result == 2);

        auto bad_output = detail::parse({"pivot", "--output", "yaml", "analyze", "x.py"});
        REQUIRE(bad_output.result);
        CHECK(*bad_output.result == 2);
        CHECK(bad_output.err.find("--output") != std::string::npos);

        auto bad_compiler = detail::parse({"pivot", "--compiler", "clang++", "analyze", "x.py"});
        REQUIRE(bad_compiler.result);
        CHECK(*bad_compiler.result == 2);

        auto bad_range = detail::parse({"pivot", "--input-min", "10", "--input-max", "1", "analyze", "x.py"});
        REQUIRE(bad_range.result);
        CHECK(*bad_range.result == 2);

        auto no_command = detail::parse({"pivot"});
        REQUIRE(no_command.result);
        CHECK(*no_command.result == 2);

        auto missing_source = detail::parse({"pivot", "analyze"});
        REQUIRE(missing_source.result);
        CHECK(*missing_source.result != 0);
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        auto version = detail::parse({"pivot", "--version"});
        REQUIRE(version.result);
        CHECK(*version.result == 0);
        CHECK(version.out.starts_with("pivot "));

        auto print = detail::parse({"pivot", "--seed", "9", "--print-config"});
        REQUIRE(print.result);
        CHECK(*print.result == 0);
        CHECK(print.out.find("seed=9\n") != std::string::npos);
        CHECK(print.out.find("cache_dir=") != std::string::npos);
    }

    TEST_CASE("002: flags override the config file", "[002][cli][config]") {
        detail::temp_dir tmp{"pivot_002_config"};
        auto path = tmp.path / "pivot.json";
        detail::write_text_file(path, R"({"schema_version":1,"test_cases":7,"seed":11,"iterations":3})");

        auto run = detail::parse({"pivot", "--config", path.string(), "--test-cases", "9", "cache", "list"});
        CHECK_FALSE(run.result);
        CHECK(run.cfg.test_cases == 9);
        CHECK(run.cfg.seed == 11U);
        CHECK(run.cfg.iterations == 3);

        detail::write_text_file(tmp.path / "bad.json", R"({"schema_version":1,"output":"xml"})");
        auto bad = detail::parse({"pivot", "--config", (tmp.path / "bad.json").string(), "cache", "list"});
        REQUIRE(bad.result);
        CHECK(*bad.result == 2);
    }

    TEST_CASE("002: analyze command writes a blueprint", "[002][cli][analyze]") {
        detail::temp_dir tmp{"pivot_002_analyze"};
        auto source = tmp.path / "hot.py";
        detail::write_text_file(source, "def scale(x: float) -> float:\n    return x * 2.5\n");
        auto blueprint_path = tmp.path / "out" / "hot.blueprint.json";

        auto run = detail::parse(
                {"pivot", "--output", "json", "analyze", source.string(), "-o", blueprint_path.string()});
        REQUIRE_FALSE(run.result);

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run_command(run.cfg, run.request, out, err) == 0);
        CHECK(out.str().find("\"scale\"") != std::string::npos);

        auto plan = read_blueprint(blueprint_path);
        CHECK(plan.language == source_language::python);
        REQUIRE(plan.functions.size() == 1U);
        CHECK(plan.functions[0].name == "scale");
        CHECK(plan.functions[0].target == targets::compiled_native);
    }

    TEST_CASE("002: analyze command reports parse errors", "[002][cli][analyze]") {
        detail::temp_dir tmp{"pivot_002_parse_error"};
        auto source = tmp.path / "broken.py";
        detail::write_text_file(source, "def broken(a:\n    return a\n");

        auto run = detail::parse({"pivot", "analyze", source.string(), "-o", (tmp.path / "bp.json").string()});
        REQUIRE_FALSE(run.result);

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run_command(run.cfg, run.request, out, err) == 3);
        CHECK(err.str().find("parse error") != std::string::npos);
        CHECK_FALSE(fs::exists(tmp.path / "bp.json"));
    }

    TEST_CASE("002: evolve runs every stage and writes every artifact", "[002][cli][evolve]") {
        detail::temp_dir tmp{"pivot_002_evolve"};
        auto source = tmp.path / "answer.py";
        detail::write_text_file(source, "def answer():\n    return 42\n");

        auto python = tmp.path / "fake-python";
        detail::write_executable_script(python, "#!/bin/sh\necho 42\n");
        auto compiler = tmp.path / "fake-cc";
        detail::write_executable_script(
                compiler,
                "#!/bin/sh\n"
                "out=\"\"\n"
                "while [ $# -gt 0 ]; do\n"
                "  if [ \"$1\" = \"-o\" ]; then\n"
                "    out=\"$2\"\n"
                "  fi\n"
                "  shift\n"
                "done\n"
                "[ -z \"$out\" ] && exit 0\n"
                "printf '#!/bin/sh\\necho 42\\n' > \"$out\"\n"
                "chmod +x \"$out\"\n");

        auto out_dir = tmp.path / "out";
        auto run = detail::parse(
                {"pivot",
                 "--quiet",
                 "--cache-dir",
                 (tmp.path / "cache").string(),
                 "--compiler",
                 "compiled-native={}"_format(compiler.string()),
                 "--toolchain-version",
                 "fakecc 1.0",
                 "--python",
                 python.string(),
                 "--test-cases",
                 "3",
                 "--confidence",
                 "40",
                 "--iterations",
                 "2",
                 "--warmup",
                 "0",
                 "evolve",
                 source.string(),
                 "-o",
                 out_dir.string()});
        REQUIRE_FALSE(run.result);

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run_command(run.cfg, run.request, out, err) == 0);
        CHECK(err.str().empty());

        auto plan = read_blueprint(out_dir / "answer.blueprint.json");
        REQUIRE(plan.functions.size() == 1U);

        auto manifest = read_manifest(out_dir / "manifest.json");
        REQUIRE(manifest.vessels.size() == 1U);
        CHECK(manifest.vessels[0].status == vessel_status::compiled);
        CHECK(manifest.vessels[0].source_path == out_dir / "vessels" / "answer.cpp");

        auto cert = read_certificate(out_dir / "certificates" / "answer.certificate.json");
        CHECK(cert.certified);
        CHECK(cert.failed == 0U);

        auto report = read_report(out_dir / "benchmarks" / "answer.benchmark.json");
        CHECK(report.function == "answer");
        CHECK(report.iterations == 2U);
        CHECK(report.durations.size() == 2U);
    }

    TEST_CASE("002: evolve skips benchmarks for uncertified vessels", "[002][cli][evolve]") {
        detail::temp_dir tmp{"pivot_002_evolve_uncertified"};
        auto source = tmp.path / "answer.py";
        detail::write_text_file(source, "def answer():\n    return 42\n");
        auto python = tmp.path / "fake-python";
        detail::write_executable_script(python, "#!/bin/sh\necho 42\n");
        auto compiler = tmp.path / "fake-cc";
        detail::write_executable_script(
                compiler,
                "#!/bin/sh\n"
                "out=\"\"\n"
                "while [ $# -gt 0 ]; do\n"
                "  if [ \"$1\" = \"-o\" ]; then\n"
                "    out=\"$2\"\n"
                "  fi\n"
                "  shift\n"
                "done\n"
                "[ -z \"$out\" ] && exit 0\n"
                "printf '#!/bin/sh\\necho 41\\n' > \"$out\"\n"
                "chmod +x \"$out\"\n");

        auto out_dir = tmp.path / "out";
        auto run = detail::parse(
                {"pivot",
                 "--quiet",
                 "--cache-dir",
                 (tmp.path / "cache").string(),
                 "--compiler",
                 "compiled-native={}"_format(compiler.string()),
                 "--toolchain-version",
                 "fakecc 1.0",
                 "--python",
                 python.string(),
                 "--test-cases",
                 "3",
                 "evolve",
                 source.string(),
                 "-o",
                 out_dir.string()});
        REQUIRE_FALSE(run.result);

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run_command(run.cfg, run.request, out, err) == 1);
        CHECK_FALSE(read_certificate(out_dir / "certificates" / "answer.certificate.json").certified);
        CHECK_FALSE(fs::exists(out_dir / "benchmarks"));
    }

}  // namespace pivot::test
