#pragma once

#include "config.hpp"
#include "registry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    class parse_error : public std::runtime_error {
      public:
        parse_error(size_t line, const std::string& message);

        // 1-based; 0 when the failure is not tied to a line
        size_t line() const noexcept { return line_; }

      private:
        size_t line_{};
    };

    struct parameter_spec {
        std::string name{};
        std::string type_hint{};
    };

    enum class value_kind : uint8_t { integer, real, text, boolean };

    std::string_view to_string(value_kind kind);
    bool try_parse_value_kind(std::string_view text, value_kind& out);

    // argument domain implied by a type hint (python annotations or free-form text); unknown
    // and empty hints are real
    value_kind kind_for_hint(std::string_view hint);

    struct function_spec {
        std::string name{};
        // unique within the source file; see assign_function_keys
        std::string key{};
        size_t start_line{};
        size_t line_count{};
        int complexity{1};
        bool has_loops{false};
        bool has_recursion{false};
        bool has_io{false};
        bool math_heavy{false};
        bool crypto{false};
        std::vector<parameter_spec> parameters{};
        std::optional<std::string> return_hint{};
        std::string target{};
        std::string justification{};
    };

    enum class token_kind : uint8_t { identifier, number, string, op, newline };

    struct source_token {
        token_kind kind{token_kind::op};
        std::string text{};
        size_t line{};
        size_t column{};
    };

    // what a frontend hands to the analyzer for each syntactic function definition
    struct function_descriptor {
        std::string name{};
        size_t start_line{};
        size_t end_line{};
        std::vector<parameter_spec> parameters{};
        std::optional<std::string> return_hint{};
        // `self`, `cls` or `this` for methods; a call through it counts as recursion
        std::optional<std::string> receiver{};
        std::vector<source_token> body{};
    };

    // per-language keyword classes used for scoring a body
    struct construct_table {
        std::vector<std::string_view> branches{};
        std::vector<std::string_view> loops{};
        std::vector<std::string_view> handlers{};
        // loop constructs spelled as a method call on a receiver, e.g. `xs.each`
        std::vector<std::string_view> iterator_methods{};
        std::vector<std::string_view> io_names{};
        // op tokens that count as a branch (the js ternary)
        std::vector<std::string_view> branch_ops{};
        bool call_requires_parens{true};
    };

    class source_frontend {
      public:
        virtual ~source_frontend() = default;

        virtual source_language language() const = 0;
        virtual const construct_table& constructs() const = 0;

        // throws parse_error; never returns a partial list
        virtual std::vector<function_descriptor> scan(std::string_view source) const = 0;
    };

    using frontend_registry = named_registry<source_frontend>;

    void register_builtin_frontends(frontend_registry& registry);

    struct target_recommendation {
        std::string target{};
        std::string justification{};
    };

    /*
     * Target rules, first match wins:
     *   1. has_loops && !has_io && complexity >= 8  -> compiled-concurrent
     *   2. math_heavy && !has_io                    -> compiled-native
     *   3. crypto                                   -> memory-safe-native
     *   4. otherwise                                -> compiled-native
     * The order is part of the cache key contract: a reordering changes rendered sources.
     */
    inline constexpr int concurrent_complexity_threshold = 8;

    target_recommendation recommend_target(const function_spec& spec);

    function_spec score_function(const function_descriptor& descriptor, const construct_table& constructs);

    // Fills empty keys with the name, or `name.L<start_line>` when the name occurs more than
    // once in `specs` (methods of different classes, redefinitions).
    void assign_function_keys(std::vector<function_spec>& specs);

    // the key, or the name for records built without one
    std::string_view function_key(const function_spec& spec);

    // by key, or by plain name when that name is unique; nullptr when nothing matches
    const function_spec* lookup_function(const std::vector<function_spec>& specs, std::string_view key);

    std::vector<function_spec> analyze(std::string_view source, source_language language);

    std::vector<function_spec> analyze(
            std::string_view source, std::string_view language_tag, const frontend_registry& frontends);

    // shared tokenizer; `language` selects comment, string and identifier rules
    std::vector<source_token> tokenize(std::string_view source, source_language language);

}  // namespace pivot
