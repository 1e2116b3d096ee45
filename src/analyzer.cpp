#include "pivot/analyzer.hpp"

#include "pivot/format.hpp"
#include "pivot/utils.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        static constexpr auto math_names = std::array{
                "sqrt"sv, "pow"sv,  "sin"sv,  "cos"sv,   "tan"sv,  "atan"sv,  "atan2"sv, "exp"sv, "log"sv,
                "log2"sv, "log10"sv, "hypot"sv, "floor"sv, "ceil"sv, "fabs"sv, "cbrt"sv,  "abs"sv};

        // receivers whose member access marks a numeric kernel
        static constexpr auto math_modules = std::array{"math"sv, "Math"sv, "numpy"sv, "np"sv, "cmath"sv};

        static constexpr auto crypto_fragments = std::array{
                "sha1"sv,    "sha256"sv,  "sha512"sv, "md5"sv,   "hashlib"sv, "hmac"sv, "encrypt"sv,
                "decrypt"sv, "cipher"sv, "nonce"sv,  "crypto"sv, "digest"sv};

        static constexpr auto crypto_words = std::array{"aes"sv, "rsa"sv};

        static constexpr auto arithmetic_ops = std::array{"+"sv, "-"sv, "*"sv, "/"sv, "%"sv, "**"sv, "//"sv};

        static constexpr double math_density_threshold = 0.25;

        static bool contains(const std::vector<std::string_view>& haystack, std::string_view needle) {
            return std::ranges::find(haystack, needle) != haystack.end();
        }

        template <size_t N>
        static bool contains(const std::array<std::string_view, N>& haystack, std::string_view needle) {
            return std::ranges::find(haystack, needle) != haystack.end();
        }

        static bool is_crypto_word(std::string_view word) {
            std::string lower{word};
            std::ranges::transform(lower, lower.begin(), utils::char_tolower);
            if (contains(crypto_words, lower)) {
                return true;
            }
            return std::ranges::any_of(
                    crypto_fragments, [&](std::string_view fragment) { return lower.find(fragment) != std::string::npos; });
        }

        static bool is_member_access(const std::vector<source_token>& body, size_t i) {
            if (i == 0U) {
                return false;
            }
            const auto& prev = body[i - 1U];
            return prev.kind == token_kind::op && (prev.text == "."sv || prev.text == "?."sv || prev.text == "&."sv);
        }

        // `self.name` / `this.name` where the receiver is the method's own
        static bool is_receiver_call(
                const std::vector<source_token>& body, size_t i, const std::optional<std::string>& receiver) {
            if (!receiver || i < 2U) {
                return false;
            }
            const auto& owner = body[i - 2U];
            return owner.kind == token_kind::identifier && owner.text == *receiver && body[i - 1U].text == "."sv;
        }

        static bool next_is(const std::vector<source_token>& body, size_t i, std::string_view text) {
            return i + 1U < body.size() && body[i + 1U].kind == token_kind::op && body[i + 1U].text == text;
        }

        static const frontend_registry& builtin_frontends() {
            static const frontend_registry registry = [] {
                frontend_registry r{};
                register_builtin_frontends(r);
                return r;
            }();
            return registry;
        }

    }  // namespace detail

    std::string_view to_string(value_kind kind) {
        switch (kind) {
            case value_kind::integer:
                return "int"sv;
            case value_kind::real:
                return "real"sv;
            case value_kind::text:
                return "str"sv;
            case value_kind::boolean:
                return "bool"sv;
        }
        return "real"sv;
    }

    bool try_parse_value_kind(std::string_view text, value_kind& out) {
        for (auto kind : {value_kind::integer, value_kind::real, value_kind::text, value_kind::boolean}) {
            if (text == to_string(kind)) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    value_kind kind_for_hint(std::string_view hint) {
        auto trimmed = utils::trim_view(hint);
        if (utils::str_case_eq(trimmed, "int"sv) || utils::str_case_eq(trimmed, "integer"sv) ||
            utils::str_case_eq(trimmed, "i64"sv) || utils::str_case_eq(trimmed, "long"sv)) {
            return value_kind::integer;
        }
        if (utils::str_case_eq(trimmed, "str"sv) || utils::str_case_eq(trimmed, "string"sv)) {
            return value_kind::text;
        }
        if (utils::str_case_eq(trimmed, "bool"sv) || utils::str_case_eq(trimmed, "boolean"sv)) {
            return value_kind::boolean;
        }
        return value_kind::real;
    }

    target_recommendation recommend_target(const function_spec& spec) {
        if (spec.has_loops && !spec.has_io && spec.complexity >= concurrent_complexity_threshold) {
            return {std::string{targets::compiled_concurrent},
                    "loop-heavy body (complexity {}) with no I/O; work can be split across cores"_format(
                            spec.complexity)};
        }
        if (spec.math_heavy && !spec.has_io) {
            return {std::string{targets::compiled_native}, "arithmetic-dominated body with no I/O; native codegen"};
        }
        if (spec.crypto) {
            return {std::string{targets::memory_safe_native}, "handles cryptographic material; memory-safe target"};
        }
        return {std::string{targets::compiled_native}, "general-purpose default"};
    }

    function_spec score_function(const function_descriptor& descriptor, const construct_table& constructs) {
        function_spec spec{};
        spec.name = descriptor.name;
        spec.start_line = descriptor.start_line;
        spec.line_count = descriptor.end_line >= descriptor.start_line ? descriptor.end_line - descriptor.start_line + 1U : 1U;
        spec.parameters = descriptor.parameters;
        spec.return_hint = descriptor.return_hint;

        const auto& body = descriptor.body;
        size_t significant = 0U;
        size_t arithmetic = 0U;

        for (size_t i = 0U; i < body.size(); ++i) {
            const auto& token = body[i];
            if (token.kind == token_kind::newline) {
                continue;
            }
            ++significant;

            if (token.kind == token_kind::op) {
                if (detail::contains(constructs.branch_ops, token.text)) {
                    ++spec.complexity;
                }
                if (token.text == "**"sv) {
                    spec.math_heavy = true;
                }
                if (detail::contains(detail::arithmetic_ops, token.text)) {
                    ++arithmetic;
                }
                continue;
            }
            if (token.kind != token_kind::identifier) {
                continue;
            }

            std::string_view word{token.text};
            auto member = detail::is_member_access(body, i);

            if (member) {
                if (detail::contains(constructs.iterator_methods, word)) {
                    spec.has_loops = true;
                    ++spec.complexity;
                }
            }
            else if (detail::contains(constructs.loops, word)) {
                spec.has_loops = true;
                ++spec.complexity;
            }
            else if (detail::contains(constructs.branches, word) || detail::contains(constructs.handlers, word)) {
                ++spec.complexity;
            }

            if (word == descriptor.name && (!member || detail::is_receiver_call(body, i, descriptor.receiver))) {
                if (!constructs.call_requires_parens || detail::next_is(body, i, "("sv)) {
                    spec.has_recursion = true;
                }
            }

            if (detail::contains(constructs.io_names, word)) {
                spec.has_io = true;
            }
            if (detail::contains(detail::math_names, word) ||
                (detail::contains(detail::math_modules, word) && detail::next_is(body, i, "."sv))) {
                spec.math_heavy = true;
            }
            if (detail::is_crypto_word(word)) {
                spec.crypto = true;
            }
        }

        if (significant > 0U &&
            static_cast<double>(arithmetic) / static_cast<double>(significant) >= detail::math_density_threshold) {
            spec.math_heavy = true;
        }

        auto recommendation = recommend_target(spec);
        spec.target = std::move(recommendation.target);
        spec.justification = std::move(recommendation.justification);
        return spec;
    }

    std::vector<function_spec> analyze(
            std::string_view source, std::string_view language_tag, const frontend_registry& frontends) {
        auto frontend = frontends.create(language_tag);
        if (!frontend) {
            source_language language{};
            if (try_parse_source_language(language_tag, language)) {
                frontend = frontends.create(to_string(language));
            }
        }
        if (!frontend) {
            throw parse_error(0U, "unsupported source language: '{}'"_format(language_tag));
        }

        auto descriptors = frontend->scan(source);
        std::vector<function_spec> specs{};
        specs.reserve(descriptors.size());
        for (const auto& descriptor : descriptors) {
            specs.push_back(score_function(descriptor, frontend->constructs()));
        }
        assign_function_keys(specs);
        debug_log("analyzed ", specs.size(), " function(s) as ", to_string(frontend->language()));
        return specs;
    }

    void assign_function_keys(std::vector<function_spec>& specs) {
        std::map<std::string_view, size_t> occurrences{};
        for (const auto& spec : specs) {
            ++occurrences[spec.name];
        }
        for (auto& spec : specs) {
            if (!spec.key.empty()) {
                continue;
            }
            spec.key = occurrences[spec.name] > 1U ? "{}.L{}"_format(spec.name, spec.start_line) : spec.name;
        }
    }

    std::string_view function_key(const function_spec& spec) {
        return spec.key.empty() ? std::string_view{spec.name} : std::string_view{spec.key};
    }

    const function_spec* lookup_function(const std::vector<function_spec>& specs, std::string_view key) {
        if (auto it = std::ranges::find(specs, key, function_key); it != specs.end()) {
            return &*it;
        }
        if (std::ranges::count(specs, key, &function_spec::name) == 1) {
            return &*std::ranges::find(specs, key, &function_spec::name);
        }
        return nullptr;
    }

    std::vector<function_spec> analyze(std::string_view source, source_language language) {
        return analyze(source, to_string(language), detail::builtin_frontends());
    }

}  // namespace pivot
