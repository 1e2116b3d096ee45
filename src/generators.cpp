#include "pivot/synthesizer.hpp"

#include "pivot/format.hpp"
#include "pivot/utils.hpp"

#include "internal/platform.hpp"

#include <cctype>
#include <memory>
#include <string>
#include <vector>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        namespace arg_tokens {
            inline constexpr auto cxx_std = "-std=c++20"sv;
            inline constexpr auto opt_prefix = "-O"sv;
            inline constexpr auto march_native = "-march=native"sv;
            inline constexpr auto lto = "-flto"sv;
            inline constexpr auto fast_math = "-ffast-math"sv;
            inline constexpr auto output_path = "-o"sv;

            inline constexpr auto go_build = "build"sv;
            inline constexpr auto go_trimpath = "-trimpath"sv;
            inline constexpr auto go_no_opt = "-gcflags=all=-N -l"sv;
            inline constexpr auto go_strip = "-ldflags=-s -w"sv;

            inline constexpr auto rust_codegen = "-C"sv;
            inline constexpr auto rust_opt_prefix = "opt-level="sv;
            inline constexpr auto rust_target_cpu = "target-cpu=native"sv;
            inline constexpr auto rust_lto = "lto"sv;
            inline constexpr auto rust_edition = "--edition=2021"sv;
        }  // namespace arg_tokens

        // target identifiers: [A-Za-z0-9_], never starting with a digit
        static std::string sanitize_identifier(std::string_view name) {
            std::string out{};
            out.reserve(name.size() + 1U);
            for (auto c : name) {
                out.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 ? c : '_');
            }
            if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front())) != 0) {
                out.insert(out.begin(), '_');
            }
            return out;
        }

        static std::string parameter_name(const parameter_spec& param, size_t index) {
            if (param.name.empty()) {
                return "arg{}"_format(index);
            }
            return "p_{}"_format(sanitize_identifier(param.name));
        }

        static void append_profile_flags(
                std::vector<std::string>& args, const optimization_profile& profile, std::string_view target) {
            if (auto it = profile.target_flags.find(std::string{target}); it != profile.target_flags.end()) {
                for (auto& flag : utils::split_whitespace(it->second)) {
                    args.push_back(std::move(flag));
                }
            }
        }

        class cxx_generator final : public code_generator {
          public:
            std::string_view target() const override { return targets::compiled_native; }
            std::string_view dialect() const override { return "c++"sv; }
            std::string_view file_extension() const override { return ".cpp"sv; }
            std::string_view default_compiler() const override { return internal::platform::tool::cxx; }

            std::string_view source_template() const override {
                return R"cpp(// generated by pivot: {{source_name}}
// flags: {{compiler_flags}}
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

static {{return_type}} {{function_name}}({{arguments}}) {
{{body}}
}

int main(int argc, char** argv) {
    if (argc != {{arity}} + 1) {
        std::cerr << "usage: " << argv[0] << " <{{arity}} arguments>\n";
        return 2;
    }
    try {
        auto result = {{function_name}}({{call_arguments}});
        std::cout << std::setprecision(17) << std::boolalpha << result << '\n';
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
    return 0;
}
)cpp"sv;
            }

            std::string map_type(std::string_view hint) const override {
                switch (kind_for_hint(hint)) {
                    case value_kind::integer:
                        return "std::int64_t";
                    case value_kind::text:
                        return "std::string";
                    case value_kind::boolean:
                        return "bool";
                    case value_kind::real:
                        break;
                }
                return "double";
            }

            std::string declare_parameters(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    const auto& param = spec.parameters[i];
                    parts.push_back("{} {}"_format(map_type(param.type_hint), parameter_name(param, i)));
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string decode_arguments(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    auto argv_index = i + 1U;
                    switch (kind_for_hint(spec.parameters[i].type_hint)) {
                        case value_kind::integer:
                            parts.push_back("static_cast<std::int64_t>(std::stoll(argv[{}]))"_format(argv_index));
                            break;
                        case value_kind::text:
                            parts.push_back("std::string{{argv[{}]}}"_format(argv_index));
                            break;
                        case value_kind::boolean:
                            parts.push_back("(std::string{{argv[{}]}} == \"true\")"_format(argv_index));
                            break;
                        case value_kind::real:
                            parts.push_back("std::stod(argv[{}])"_format(argv_index));
                            break;
                    }
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string untranslated_body(const function_spec& spec) const override {
                return "    throw std::runtime_error(\"{}: body not translated for c++\");"_format(
                        sanitize_identifier(spec.name));
            }

            std::vector<std::string> compiler_flags(const optimization_profile& profile) const override {
                std::vector<std::string> args{};
                args.emplace_back(arg_tokens::cxx_std);
                args.emplace_back("{}{}"_format(arg_tokens::opt_prefix, profile.opt_level));
                if (profile.simd) {
                    args.emplace_back(arg_tokens::march_native);
                }
                if (profile.lto) {
                    args.emplace_back(arg_tokens::lto);
                }
                if (profile.unsafe_math) {
                    args.emplace_back(arg_tokens::fast_math);
                }
                append_profile_flags(args, profile, target());
                return args;
            }

            std::vector<std::string> compile_command(
                    const std::string& compiler,
                    const fs::path& source,
                    const fs::path& output,
                    const optimization_profile& profile) const override {
                std::vector<std::string> args{compiler};
                for (auto& flag : compiler_flags(profile)) {
                    args.push_back(std::move(flag));
                }
                args.emplace_back(arg_tokens::output_path);
                args.push_back(output.string());
                args.push_back(source.string());
                return args;
            }
        };

        class go_generator final : public code_generator {
          public:
            std::string_view target() const override { return targets::compiled_concurrent; }
            std::string_view dialect() const override { return "go"sv; }
            std::string_view file_extension() const override { return ".go"sv; }
            std::string_view default_compiler() const override { return internal::platform::tool::go; }

            std::string_view source_template() const override {
                return R"go(// generated by pivot: {{source_name}}
// flags: {{compiler_flags}}
package main

import (
	"fmt"
	"os"
	"strconv"
)

func argInt(i int) int64 {
	v, err := strconv.ParseInt(os.Args[i], 10, 64)
	if err != nil {
		fmt.Fprintln(os.Stderr, err)
		os.Exit(2)
	}
	return v
}

func argFloat(i int) float64 {
	v, err := strconv.ParseFloat(os.Args[i], 64)
	if err != nil {
		fmt.Fprintln(os.Stderr, err)
		os.Exit(2)
	}
	return v
}

func argBool(i int) bool { return os.Args[i] == "true" }

func argString(i int) string { return os.Args[i] }

func {{function_name}}({{arguments}}) {{return_type}} {
{{body}}
}

func main() {
	if len(os.Args) != {{arity}}+1 {
		fmt.Fprintf(os.Stderr, "usage: %s <{{arity}} arguments>\n", os.Args[0])
		os.Exit(2)
	}
	fmt.Println({{function_name}}({{call_arguments}}))
}
)go"sv;
            }

            std::string map_type(std::string_view hint) const override {
                switch (kind_for_hint(hint)) {
                    case value_kind::integer:
                        return "int64";
                    case value_kind::text:
                        return "string";
                    case value_kind::boolean:
                        return "bool";
                    case value_kind::real:
                        break;
                }
                return "float64";
            }

            std::string declare_parameters(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    const auto& param = spec.parameters[i];
                    parts.push_back("{} {}"_format(parameter_name(param, i), map_type(param.type_hint)));
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string decode_arguments(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    auto argv_index = i + 1U;
                    switch (kind_for_hint(spec.parameters[i].type_hint)) {
                        case value_kind::integer:
                            parts.push_back("argInt({})"_format(argv_index));
                            break;
                        case value_kind::text:
                            parts.push_back("argString({})"_format(argv_index));
                            break;
                        case value_kind::boolean:
                            parts.push_back("argBool({})"_format(argv_index));
                            break;
                        case value_kind::real:
                            parts.push_back("argFloat({})"_format(argv_index));
                            break;
                    }
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string untranslated_body(const function_spec& spec) const override {
                return "\tpanic(\"{}: body not translated for go\")"_format(sanitize_identifier(spec.name));
            }

            std::vector<std::string> compiler_flags(const optimization_profile& profile) const override {
                std::vector<std::string> args{};
                args.emplace_back(arg_tokens::go_trimpath);
                if (profile.opt_level == 0) {
                    args.emplace_back(arg_tokens::go_no_opt);
                }
                if (profile.lto) {
                    args.emplace_back(arg_tokens::go_strip);
                }
                append_profile_flags(args, profile, target());
                return args;
            }

            std::vector<std::string> compile_command(
                    const std::string& compiler,
                    const fs::path& source,
                    const fs::path& output,
                    const optimization_profile& profile) const override {
                std::vector<std::string> args{compiler};
                args.emplace_back(arg_tokens::go_build);
                for (auto& flag : compiler_flags(profile)) {
                    args.push_back(std::move(flag));
                }
                args.emplace_back(arg_tokens::output_path);
                args.push_back(output.string());
                args.push_back(source.string());
                return args;
            }
        };

        class rust_generator final : public code_generator {
          public:
            std::string_view target() const override { return targets::memory_safe_native; }
            std::string_view dialect() const override { return "rust"sv; }
            std::string_view file_extension() const override { return ".rs"sv; }
            std::string_view default_compiler() const override { return internal::platform::tool::rustc; }

            std::string_view source_template() const override {
                return R"rs(// generated by pivot: {{source_name}}
// flags: {{compiler_flags}}
#![allow(unused, non_snake_case)]

fn arg<T: std::str::FromStr>(args: &[String], i: usize) -> T {
    match args[i].parse::<T>() {
        Ok(v) => v,
        Err(_) => {
            eprintln!("invalid argument {}: {}", i, args[i]);
            std::process::exit(2);
        }
    }
}

fn {{function_name}}({{arguments}}) -> {{return_type}} {
{{body}}
}

fn main() {
    let args: Vec<String> = std::env::args().collect();
    if args.len() != {{arity}} + 1 {
        eprintln!("usage: {} <{{arity}} arguments>", args[0]);
        std::process::exit(2);
    }
    println!("{}", {{function_name}}({{call_arguments}}));
}
)rs"sv;
            }

            std::string map_type(std::string_view hint) const override {
                switch (kind_for_hint(hint)) {
                    case value_kind::integer:
                        return "i64";
                    case value_kind::text:
                        return "String";
                    case value_kind::boolean:
                        return "bool";
                    case value_kind::real:
                        break;
                }
                return "f64";
            }

            std::string declare_parameters(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    const auto& param = spec.parameters[i];
                    parts.push_back("{}: {}"_format(parameter_name(param, i), map_type(param.type_hint)));
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string decode_arguments(const function_spec& spec) const override {
                std::vector<std::string> parts{};
                for (size_t i = 0U; i < spec.parameters.size(); ++i) {
                    parts.push_back("arg::<{}>(&args, {})"_format(map_type(spec.parameters[i].type_hint), i + 1U));
                }
                return utils::join_with_separator(parts, ", "sv);
            }

            std::string untranslated_body(const function_spec& spec) const override {
                return "    panic!(\"{}: body not translated for rust\")"_format(sanitize_identifier(spec.name));
            }

            std::vector<std::string> compiler_flags(const optimization_profile& profile) const override {
                std::vector<std::string> args{};
                args.emplace_back(arg_tokens::rust_edition);
                args.emplace_back(arg_tokens::rust_codegen);
                args.emplace_back("{}{}"_format(arg_tokens::rust_opt_prefix, profile.opt_level));
                if (profile.simd) {
                    args.emplace_back(arg_tokens::rust_codegen);
                    args.emplace_back(arg_tokens::rust_target_cpu);
                }
                if (profile.lto) {
                    args.emplace_back(arg_tokens::rust_codegen);
                    args.emplace_back(arg_tokens::rust_lto);
                }
                append_profile_flags(args, profile, target());
                return args;
            }

            std::vector<std::string> compile_command(
                    const std::string& compiler,
                    const fs::path& source,
                    const fs::path& output,
                    const optimization_profile& profile) const override {
                std::vector<std::string> args{compiler};
                for (auto& flag : compiler_flags(profile)) {
                    args.push_back(std::move(flag));
                }
                args.emplace_back(arg_tokens::output_path);
                args.push_back(output.string());
                args.push_back(source.string());
                return args;
            }
        };

    }  // namespace detail

    std::string render_template(std::string_view text, const placeholder_map& values) {
        std::string out{};
        out.reserve(text.size());
        size_t pos = 0U;
        for (;;) {
            auto open = text.find("{{"sv, pos);
            if (open == std::string_view::npos) {
                out.append(text.substr(pos));
                return out;
            }
            out.append(text.substr(pos, open - pos));

            auto close = text.find("}}"sv, open + 2U);
            if (close == std::string_view::npos) {
                throw std::invalid_argument("unterminated template placeholder at offset {}"_format(open));
            }
            auto name = utils::trim_view(text.substr(open + 2U, close - open - 2U));
            auto it = values.find(name);
            if (it == values.end()) {
                throw std::invalid_argument("unknown template placeholder '{}'"_format(name));
            }
            out.append(it->second);
            pos = close + 2U;
        }
    }

    std::string emitted_function_name(const function_spec& spec) {
        return "pivot_{}"_format(detail::sanitize_identifier(spec.name));
    }

    std::string render_source(
            const code_generator& generator,
            const function_spec& spec,
            const optimization_profile& profile,
            const body_translator& translate) {
        auto body = translate ? translate(spec, generator.dialect()) : generator.untranslated_body(spec);
        placeholder_map values{
                {"function_name", emitted_function_name(spec)},
                {"source_name", spec.name},
                {"arguments", generator.declare_parameters(spec)},
                {"call_arguments", generator.decode_arguments(spec)},
                {"return_type", generator.map_type(spec.return_hint.value_or(std::string{}))},
                {"body", std::move(body)},
                {"compiler_flags", utils::join_with_separator(generator.compiler_flags(profile), " "sv)},
                {"arity", std::to_string(spec.parameters.size())}};
        return render_template(generator.source_template(), values);
    }

    void register_builtin_generators(generator_registry& registry) {
        registry.add(std::string{targets::compiled_native}, [] { return std::make_unique<detail::cxx_generator>(); });
        registry.add(std::string{targets::compiled_concurrent}, [] { return std::make_unique<detail::go_generator>(); });
        registry.add(std::string{targets::memory_safe_native}, [] { return std::make_unique<detail::rust_generator>(); });
    }

}  // namespace pivot
