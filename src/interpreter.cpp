#include "pivot/interpreter.hpp"

#include "pivot/format.hpp"

#include <string>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        // argv after the inline program: <source> <function> <args...>
        static constexpr std::string_view python_driver = R"py(import ast, runpy, sys
ns = runpy.run_path(sys.argv[1], run_name="__pivot__")
fn = ns[sys.argv[2]]
def arg(text):
    if text in ("true", "false"):
        return text == "true"
    try:
        return ast.literal_eval(text)
    except (ValueError, SyntaxError):
        return text
result = fn(*[arg(a) for a in sys.argv[3:]])
if isinstance(result, bool):
    print("true" if result else "false")
elif isinstance(result, float):
    print(repr(result))
else:
    print(result)
)py";

        static constexpr std::string_view javascript_driver = R"js(const vm = require('vm');
const fs = require('fs');
const [source, name, ...rest] = process.argv.slice(1);
const sandbox = { require, console, module: { exports: {} }, process: { env: process.env, argv: [] } };
sandbox.exports = sandbox.module.exports;
vm.createContext(sandbox);
vm.runInContext(fs.readFileSync(source, 'utf8'), sandbox, { filename: source });
const fn = sandbox.module.exports[name] || vm.runInContext(name, sandbox);
const arg = (text) => { try { return JSON.parse(text); } catch (e) { return text; } };
const result = fn(...rest.map(arg));
process.stdout.write(String(result) + '\n');
)js";

        static constexpr std::string_view ruby_driver = R"rb(source, name, *rest = ARGV
ARGV.clear
load source
def __pivot_arg(text)
  Integer(text, 10)
rescue ArgumentError
  begin
    Float(text)
  rescue ArgumentError
    { "true" => true, "false" => false }.fetch(text, text)
  end
end
puts send(name.to_sym, *rest.map { |a| __pivot_arg(a) })
)rb";

    }  // namespace detail

    std::string_view default_interpreter(source_language language) {
        switch (language) {
            case source_language::python:
                return "python3"sv;
            case source_language::javascript:
                return "node"sv;
            case source_language::ruby:
                return "ruby"sv;
        }
        return "python3"sv;
    }

    std::vector<std::string> interpreter_command(
            source_language language,
            const std::filesystem::path& source,
            std::string_view function,
            const std::filesystem::path& interpreter) {
        std::vector<std::string> args{};
        args.reserve(5U);
        args.push_back(interpreter.empty() ? std::string{default_interpreter(language)} : interpreter.string());

        switch (language) {
            case source_language::python:
                args.emplace_back("-c");
                args.emplace_back(detail::python_driver);
                break;
            case source_language::javascript:
                args.emplace_back("-e");
                args.emplace_back(detail::javascript_driver);
                break;
            case source_language::ruby:
                args.emplace_back("-e");
                args.emplace_back(detail::ruby_driver);
                break;
        }

        args.push_back(std::filesystem::absolute(source).string());
        args.emplace_back(function);
        return args;
    }

    std::string shell_quote(std::string_view arg) {
        std::string out{"'"};
        for (auto c : arg) {
            if (c == '\'') {
                out.append("'\\''");
            }
            else {
                out.push_back(c);
            }
        }
        out.push_back('\'');
        return out;
    }

    std::string interpreter_shim(const std::vector<std::string>& command) {
        std::string script{"#!/bin/sh\nexec"};
        for (const auto& arg : command) {
            script.push_back(' ');
            script.append(shell_quote(arg));
        }
        script.append(" \"$@\"\n");
        return script;
    }

}  // namespace pivot
