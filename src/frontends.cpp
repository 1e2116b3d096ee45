#include "pivot/analyzer.hpp"

#include "pivot/format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace pivot::literals;

namespace pivot {

    namespace detail {

        using namespace std::string_view_literals;

        // longest match first
        static constexpr auto multi_char_ops = std::array{
                "**="sv, "//="sv, "==="sv, "!=="sv, "..."sv, "<=>"sv, "**"sv, "//"sv, "->"sv, "=>"sv, "=="sv,
                "!="sv,  "<="sv,  ">="sv,  "&&"sv,  "||"sv,  "::"sv,  "+="sv, "-="sv, "*="sv, "/="sv, "%="sv,
                "<<"sv,  ">>"sv,  "?."sv,  "??"sv,  ".."sv,  "|="sv,  "&="sv, "^="sv};

        // identifiers after which a javascript `/` starts a regular expression
        static constexpr auto regex_keywords = std::array{
                "return"sv, "typeof"sv, "case"sv,   "do"sv,         "else"sv,  "in"sv,    "of"sv,
                "new"sv,    "delete"sv, "void"sv,   "instanceof"sv, "throw"sv, "yield"sv, "await"sv};

        struct open_bracket {
            char symbol{};
            size_t line{};
        };

        static constexpr char closing_for(char open) {
            switch (open) {
                case '(':
                    return ')';
                case '[':
                    return ']';
                default:
                    return '}';
            }
        }

        static bool is_ident_start(char c, source_language language) {
            auto u = static_cast<unsigned char>(c);
            if (std::isalpha(u) != 0 || c == '_') {
                return true;
            }
            if (language == source_language::javascript && c == '$') {
                return true;
            }
            return language == source_language::ruby && (c == '@' || c == '$');
        }

        static bool is_ident_char(char c, source_language language) {
            auto u = static_cast<unsigned char>(c);
            return std::isalnum(u) != 0 || c == '_' || (language == source_language::javascript && c == '$');
        }

        static bool is_python_string_prefix(std::string_view ident) {
            if (ident.size() > 2U) {
                return false;
            }
            return std::ranges::all_of(ident, [](char c) {
                auto lower = utils::char_tolower(c);
                return lower == 'r' || lower == 'b' || lower == 'f' || lower == 'u';
            });
        }

        class lexer {
          public:
            lexer(std::string_view source, source_language language) : src_{source}, language_{language} {}

            std::vector<source_token> run() {
                while (pos_ < src_.size()) {
                    auto c = src_[pos_];

                    if (c == '\n') {
                        on_newline();
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
                        advance();
                        continue;
                    }
                    if (c == '\\' && language_ == source_language::python) {
                        // explicit line joining
                        advance();
                        if (pos_ < src_.size() && src_[pos_] == '\r') {
                            advance();
                        }
                        if (pos_ < src_.size() && src_[pos_] == '\n') {
                            advance_line();
                        }
                        continue;
                    }
                    if (at_line_comment()) {
                        skip_to_eol();
                        continue;
                    }
                    if (language_ == source_language::javascript && starts_with("/*"sv)) {
                        skip_block_comment();
                        continue;
                    }
                    if (language_ == source_language::javascript && c == '/' && regex_allowed()) {
                        lex_regex();
                        continue;
                    }
                    if (language_ == source_language::ruby && column_ == 0U && starts_with("=begin"sv)) {
                        skip_ruby_doc_block();
                        continue;
                    }
                    if (language_ == source_language::ruby && column_ == 0U && starts_with("__END__"sv)) {
                        break;
                    }
                    if (is_quote(c)) {
                        lex_string(pos_);
                        continue;
                    }
                    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
                        lex_number();
                        continue;
                    }
                    if (is_ident_start(c, language_)) {
                        lex_identifier();
                        continue;
                    }
                    lex_operator();
                }

                if (!brackets_.empty()) {
                    const auto& open = brackets_.back();
                    throw parse_error(open.line, "unclosed '{}'"_format(open.symbol));
                }
                push(token_kind::newline, "\n"sv, line_, column_);
                return std::move(tokens_);
            }

          private:
            std::string_view src_;
            source_language language_;
            size_t pos_{0U};
            size_t line_{1U};
            size_t column_{0U};
            std::vector<open_bracket> brackets_{};
            std::vector<source_token> tokens_{};

            bool starts_with(std::string_view text) const { return src_.substr(pos_).starts_with(text); }

            void advance() {
                if (src_[pos_] == '\t') {
                    column_ = (column_ / 8U + 1U) * 8U;
                }
                else {
                    ++column_;
                }
                ++pos_;
            }

            void advance_line() {
                ++pos_;
                ++line_;
                column_ = 0U;
            }

            void push(token_kind kind, std::string_view text, size_t line, size_t column) {
                tokens_.push_back(source_token{.kind = kind, .text = std::string{text}, .line = line, .column = column});
            }

            void on_newline() {
                if (brackets_.empty() && !tokens_.empty() && tokens_.back().kind != token_kind::newline) {
                    push(token_kind::newline, "\n"sv, line_, column_);
                }
                advance_line();
            }

            bool at_line_comment() const {
                if (language_ == source_language::javascript) {
                    return starts_with("//"sv);
                }
                return src_[pos_] == '#';
            }

            void skip_to_eol() {
                while (pos_ < src_.size() && src_[pos_] != '\n') {
                    advance();
                }
            }

            void skip_block_comment() {
                auto start_line = line_;
                pos_ += 2U;
                column_ += 2U;
                while (pos_ < src_.size()) {
                    if (starts_with("*/"sv)) {
                        pos_ += 2U;
                        column_ += 2U;
                        return;
                    }
                    if (src_[pos_] == '\n') {
                        advance_line();
                    }
                    else {
                        advance();
                    }
                }
                throw parse_error(start_line, "unterminated block comment");
            }

            void skip_ruby_doc_block() {
                auto start_line = line_;
                while (pos_ < src_.size()) {
                    skip_to_eol();
                    if (pos_ >= src_.size()) {
                        break;
                    }
                    advance_line();
                    if (starts_with("=end"sv)) {
                        skip_to_eol();
                        return;
                    }
                }
                throw parse_error(start_line, "unterminated =begin block");
            }

            bool is_quote(char c) const {
                if (c == '\'' || c == '"') {
                    return true;
                }
                return c == '`' && language_ != source_language::python;
            }

            bool string_may_span_lines(char quote, bool triple) const {
                if (triple) {
                    return true;
                }
                switch (language_) {
                    case source_language::python:
                        return false;
                    case source_language::javascript:
                        return quote == '`';
                    case source_language::ruby:
                        return true;
                }
                return false;
            }

            // token_start lets a python prefix (r, b, f...) be folded into the literal
            void lex_string(size_t token_start) {
                auto start_line = line_;
                auto start_column = column_ - (pos_ - token_start);
                auto quote = src_[pos_];
                auto triple = language_ == source_language::python && src_.substr(pos_, 3U) == std::string(3U, quote);
                auto quote_len = triple ? 3U : 1U;
                for (size_t i = 0U; i < quote_len; ++i) {
                    advance();
                }

                for (;;) {
                    if (pos_ >= src_.size()) {
                        throw parse_error(start_line, "unterminated string literal");
                    }
                    auto c = src_[pos_];
                    if (c == '\\') {
                        advance();
                        if (pos_ < src_.size()) {
                            if (src_[pos_] == '\n') {
                                advance_line();
                            }
                            else {
                                advance();
                            }
                        }
                        continue;
                    }
                    if (c == '\n') {
                        if (!string_may_span_lines(quote, triple)) {
                            throw parse_error(start_line, "unterminated string literal");
                        }
                        advance_line();
                        continue;
                    }
                    if (c == quote) {
                        if (!triple) {
                            advance();
                            break;
                        }
                        if (src_.substr(pos_, 3U) == std::string(3U, quote)) {
                            advance();
                            advance();
                            advance();
                            break;
                        }
                    }
                    advance();
                }

                push(token_kind::string, src_.substr(token_start, pos_ - token_start), start_line, start_column);
            }

            // a `/` is division after a value and a regex anywhere an operand is expected
            bool regex_allowed() const {
                if (tokens_.empty()) {
                    return true;
                }
                const auto& last = tokens_.back();
                switch (last.kind) {
                    case token_kind::newline:
                        return true;
                    case token_kind::number:
                    case token_kind::string:
                        return false;
                    case token_kind::identifier:
                        return std::ranges::find(regex_keywords, std::string_view{last.text}) != regex_keywords.end();
                    case token_kind::op:
                        break;
                }
                if (last.text == ")"sv || last.text == "]"sv) {
                    return false;
                }
                // postfix ++ / -- lex as two adjacent single-character ops
                if ((last.text == "+"sv || last.text == "-"sv) && tokens_.size() >= 2U) {
                    const auto& before = tokens_[tokens_.size() - 2U];
                    if (before.kind == token_kind::op && before.text == last.text && before.line == last.line &&
                        before.column + 1U == last.column) {
                        return false;
                    }
                }
                return true;
            }

            // /body/flags, kept whole as a string token so its brackets and quotes stay inert
            void lex_regex() {
                auto start = pos_;
                auto start_column = column_;
                advance();
                bool in_class = false;
                for (;;) {
                    if (pos_ >= src_.size() || src_[pos_] == '\n') {
                        throw parse_error(line_, "unterminated regular expression literal");
                    }
                    auto c = src_[pos_];
                    if (c == '\\') {
                        advance();
                        if (pos_ < src_.size() && src_[pos_] != '\n') {
                            advance();
                        }
                        continue;
                    }
                    advance();
                    if (c == '[') {
                        in_class = true;
                    }
                    else if (c == ']') {
                        in_class = false;
                    }
                    else if (c == '/' && !in_class) {
                        break;
                    }
                }
                while (pos_ < src_.size() && is_ident_char(src_[pos_], language_)) {
                    advance();
                }
                push(token_kind::string, src_.substr(start, pos_ - start), line_, start_column);
            }

            void lex_number() {
                auto start = pos_;
                auto start_column = column_;
                while (pos_ < src_.size()) {
                    auto c = src_[pos_];
                    if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_') {
                        advance();
                        continue;
                    }
                    if (c == '.' && pos_ + 1U < src_.size() &&
                        std::isdigit(static_cast<unsigned char>(src_[pos_ + 1U])) != 0) {
                        advance();
                        continue;
                    }
                    if ((c == '+' || c == '-') && (src_[pos_ - 1U] == 'e' || src_[pos_ - 1U] == 'E') &&
                        std::isdigit(static_cast<unsigned char>(src_[start])) != 0 && !src_.substr(start).starts_with("0x"sv)) {
                        advance();
                        continue;
                    }
                    break;
                }
                push(token_kind::number, src_.substr(start, pos_ - start), line_, start_column);
            }

            void lex_identifier() {
                auto start = pos_;
                auto start_column = column_;
                advance();
                while (pos_ < src_.size() && is_ident_char(src_[pos_], language_)) {
                    advance();
                }
                if (language_ == source_language::ruby && pos_ < src_.size() && (src_[pos_] == '?' || src_[pos_] == '!')) {
                    auto next = pos_ + 1U < src_.size() ? src_[pos_ + 1U] : '\0';
                    if (next != '=' && next != ':') {
                        advance();
                    }
                }

                auto text = src_.substr(start, pos_ - start);
                if (language_ == source_language::python && pos_ < src_.size() && is_quote(src_[pos_]) &&
                    is_python_string_prefix(text)) {
                    lex_string(start);
                    return;
                }
                push(token_kind::identifier, text, line_, start_column);
            }

            void lex_operator() {
                auto start_column = column_;
                for (auto op : multi_char_ops) {
                    if (starts_with(op)) {
                        if (op == "//"sv && language_ != source_language::python) {
                            continue;
                        }
                        for (size_t i = 0U; i < op.size(); ++i) {
                            advance();
                        }
                        push(token_kind::op, op, line_, start_column);
                        return;
                    }
                }

                auto c = src_[pos_];
                if (c == '(' || c == '[' || c == '{') {
                    brackets_.push_back(open_bracket{.symbol = c, .line = line_});
                }
                else if (c == ')' || c == ']' || c == '}') {
                    if (brackets_.empty()) {
                        throw parse_error(line_, "unmatched '{}'"_format(c));
                    }
                    auto open = brackets_.back();
                    if (closing_for(open.symbol) != c) {
                        throw parse_error(
                                line_, "'{}' does not match '{}' opened at line {}"_format(c, open.symbol, open.line));
                    }
                    brackets_.pop_back();
                }
                advance();
                push(token_kind::op, src_.substr(pos_ - 1U, 1U), line_, start_column);
            }
        };

        static bool is_op(const source_token& token, std::string_view text) {
            return token.kind == token_kind::op && token.text == text;
        }

        static bool is_word(const source_token& token, std::string_view text) {
            return token.kind == token_kind::identifier && token.text == text;
        }

        // index of the bracket closing tokens[open_index]; brackets were validated by the lexer
        static size_t matching_close(const std::vector<source_token>& tokens, size_t open_index) {
            int depth = 0;
            for (size_t i = open_index; i < tokens.size(); ++i) {
                const auto& t = tokens[i];
                if (t.kind != token_kind::op || t.text.size() != 1U) {
                    continue;
                }
                auto c = t.text.front();
                if (c == '(' || c == '[' || c == '{') {
                    ++depth;
                }
                else if (c == ')' || c == ']' || c == '}') {
                    if (--depth == 0) {
                        return i;
                    }
                }
            }
            throw parse_error(tokens[open_index].line, "unbalanced '{}'"_format(tokens[open_index].text));
        }

        static std::string join_tokens(std::span<const source_token> tokens) {
            std::string out{};
            for (const auto& t : tokens) {
                if (t.kind == token_kind::newline) {
                    continue;
                }
                out.append(t.text);
                if (t.text == ","sv) {
                    out.push_back(' ');
                }
            }
            return out;
        }

        // splits [first, last) on commas at bracket depth zero
        static std::vector<std::span<const source_token>> split_top_level(
                const std::vector<source_token>& tokens, size_t first, size_t last) {
            std::vector<std::span<const source_token>> parts{};
            int depth = 0;
            auto part_start = first;
            for (auto i = first; i < last; ++i) {
                const auto& t = tokens[i];
                if (t.kind == token_kind::op && t.text.size() == 1U) {
                    auto c = t.text.front();
                    if (c == '(' || c == '[' || c == '{') {
                        ++depth;
                    }
                    else if (c == ')' || c == ']' || c == '}') {
                        --depth;
                    }
                    else if (c == ',' && depth == 0) {
                        parts.emplace_back(tokens.data() + part_start, i - part_start);
                        part_start = i + 1U;
                    }
                }
            }
            if (part_start < last) {
                parts.emplace_back(tokens.data() + part_start, last - part_start);
            }
            return parts;
        }

        static std::vector<parameter_spec> parse_parameters(
                const std::vector<source_token>& tokens, size_t first, size_t last, bool typed) {
            std::vector<parameter_spec> params{};
            for (auto part : split_top_level(tokens, first, last)) {
                auto it = std::ranges::find_if(part, [](const source_token& t) { return t.kind == token_kind::identifier; });
                if (it == part.end()) {
                    // bare `*` or `/` separators and destructuring patterns
                    if (!part.empty() && (is_op(part.front(), "{"sv) || is_op(part.front(), "["sv))) {
                        params.push_back(parameter_spec{.name = "arg{}"_format(params.size())});
                    }
                    continue;
                }
                if (it != part.begin() && (is_op(*(it - 1), "{"sv) || is_op(*(it - 1), "["sv))) {
                    params.push_back(parameter_spec{.name = "arg{}"_format(params.size())});
                    continue;
                }

                parameter_spec param{.name = it->text};
                if (typed) {
                    auto colon = std::ranges::find_if(it, part.end(), [](const source_token& t) { return is_op(t, ":"sv); });
                    if (colon != part.end()) {
                        auto hint_end = std::ranges::find_if(colon + 1, part.end(), [](const source_token& t) {
                            return is_op(t, "="sv);
                        });
                        param.type_hint = join_tokens(std::span<const source_token>{colon + 1, hint_end});
                    }
                }
                params.push_back(std::move(param));
            }
            return params;
        }

        struct logical_line {
            size_t first_token{};
            size_t last_token{};  // exclusive, excludes the newline
            size_t indent{};
            size_t first_line{};
            size_t last_line{};
        };

        class python_frontend final : public source_frontend {
          public:
            source_language language() const override { return source_language::python; }

            const construct_table& constructs() const override {
                static const construct_table table{
                        .branches = {"if"sv, "elif"sv},
                        .loops = {"for"sv, "while"sv},
                        .handlers = {"except"sv},
                        .iterator_methods = {},
                        .io_names = {"print"sv,
                                     "open"sv,
                                     "input"sv,
                                     "readline"sv,
                                     "readlines"sv,
                                     "socket"sv,
                                     "requests"sv,
                                     "urlopen"sv,
                                     "stdout"sv,
                                     "stdin"sv,
                                     "subprocess"sv},
                        .branch_ops = {},
                        .call_requires_parens = true};
                return table;
            }

            std::vector<function_descriptor> scan(std::string_view source) const override {
                auto tokens = tokenize(source, source_language::python);
                auto lines = split_logical_lines(tokens);
                check_indentation(tokens, lines);

                std::vector<function_descriptor> out{};
                for (size_t i = 0U; i < lines.size(); ++i) {
                    const auto& line = lines[i];
                    auto def_index = line.first_token;
                    if (is_word(tokens[def_index], "async"sv) && def_index + 1U < line.last_token) {
                        ++def_index;
                    }
                    if (!is_word(tokens[def_index], "def"sv)) {
                        continue;
                    }
                    out.push_back(read_def(tokens, lines, i, def_index));
                }
                return out;
            }

          private:
            static std::vector<logical_line> split_logical_lines(const std::vector<source_token>& tokens) {
                std::vector<logical_line> lines{};
                size_t start = 0U;
                for (size_t i = 0U; i < tokens.size(); ++i) {
                    if (tokens[i].kind != token_kind::newline) {
                        continue;
                    }
                    if (i > start) {
                        lines.push_back(logical_line{
                                .first_token = start,
                                .last_token = i,
                                .indent = tokens[start].column,
                                .first_line = tokens[start].line,
                                .last_line = tokens[i - 1U].line});
                    }
                    start = i + 1U;
                }
                return lines;
            }

            static void check_indentation(const std::vector<source_token>& tokens, const std::vector<logical_line>& lines) {
                std::vector<size_t> levels{0U};
                bool expect_indent = false;
                for (const auto& line : lines) {
                    if (line.indent > levels.back()) {
                        if (!expect_indent) {
                            throw parse_error(line.first_line, "unexpected indent");
                        }
                        levels.push_back(line.indent);
                    }
                    else if (line.indent < levels.back()) {
                        while (line.indent < levels.back()) {
                            levels.pop_back();
                        }
                        if (line.indent != levels.back()) {
                            throw parse_error(line.first_line, "unindent does not match any outer indentation level");
                        }
                    }
                    expect_indent = is_op(tokens[line.last_token - 1U], ":"sv);
                }
            }

            static function_descriptor read_def(
                    const std::vector<source_token>& tokens,
                    const std::vector<logical_line>& lines,
                    size_t line_index,
                    size_t def_index) {
                const auto& line = lines[line_index];
                auto name_index = def_index + 1U;
                if (name_index >= line.last_token || tokens[name_index].kind != token_kind::identifier) {
                    throw parse_error(line.first_line, "expected function name after 'def'");
                }
                auto open = name_index + 1U;
                if (open >= line.last_token || !is_op(tokens[open], "("sv)) {
                    throw parse_error(line.first_line, "expected '(' after function name");
                }
                auto close = matching_close(tokens, open);

                function_descriptor fn{};
                fn.name = tokens[name_index].text;
                fn.start_line = line.first_line;
                fn.parameters = parse_parameters(tokens, open + 1U, close, true);
                if (!fn.parameters.empty() && (fn.parameters.front().name == "self"sv || fn.parameters.front().name == "cls"sv)) {
                    fn.receiver = fn.parameters.front().name;
                }
                std::erase_if(fn.parameters, [](const parameter_spec& p) { return p.name == "self"sv || p.name == "cls"sv; });

                auto colon = close + 1U;
                if (colon < line.last_token && is_op(tokens[colon], "->"sv)) {
                    auto hint_start = colon + 1U;
                    while (colon < line.last_token && !is_op(tokens[colon], ":"sv)) {
                        if (is_op(tokens[colon], "["sv) || is_op(tokens[colon], "("sv)) {
                            colon = matching_close(tokens, colon);
                        }
                        ++colon;
                    }
                    fn.return_hint = join_tokens(std::span<const source_token>{tokens.data() + hint_start, colon - hint_start});
                }
                if (colon >= line.last_token || !is_op(tokens[colon], ":"sv)) {
                    throw parse_error(line.first_line, "expected ':' after function signature");
                }

                if (colon + 1U < line.last_token) {
                    fn.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(colon + 1U),
                                   tokens.begin() + static_cast<std::ptrdiff_t>(line.last_token));
                    fn.end_line = line.last_line;
                    return fn;
                }

                auto body_end = line_index + 1U;
                while (body_end < lines.size() && lines[body_end].indent > line.indent) {
                    ++body_end;
                }
                if (body_end == line_index + 1U) {
                    throw parse_error(line.first_line, "expected an indented block after function definition");
                }

                auto first = lines[line_index + 1U].first_token;
                auto last = lines[body_end - 1U].last_token + 1U;  // keep the trailing newline
                fn.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(first),
                               tokens.begin() + static_cast<std::ptrdiff_t>(last));
                fn.end_line = lines[body_end - 1U].last_line;
                return fn;
            }
        };

        class javascript_frontend final : public source_frontend {
          public:
            source_language language() const override { return source_language::javascript; }

            const construct_table& constructs() const override {
                static const construct_table table{
                        .branches = {"if"sv, "case"sv},
                        .loops = {"for"sv, "while"sv},
                        .handlers = {"catch"sv},
                        .iterator_methods = {},
                        .io_names = {"console"sv,
                                     "fetch"sv,
                                     "readFileSync"sv,
                                     "writeFileSync"sv,
                                     "readFile"sv,
                                     "writeFile"sv,
                                     "document"sv,
                                     "XMLHttpRequest"sv,
                                     "prompt"sv,
                                     "alert"sv},
                        .branch_ops = {"?"sv},
                        .call_requires_parens = true};
                return table;
            }

            std::vector<function_descriptor> scan(std::string_view source) const override {
                auto tokens = tokenize(source, source_language::javascript);
                std::vector<function_descriptor> out{};

                for (size_t i = 0U; i < tokens.size(); ++i) {
                    if (is_word(tokens[i], "function"sv)) {
                        // anonymous function expressions are picked up through their binding
                        if (i > 0U && is_op(tokens[i - 1U], "="sv)) {
                            continue;
                        }
                        if (i > 1U && is_word(tokens[i - 1U], "async"sv) && is_op(tokens[i - 2U], "="sv)) {
                            continue;
                        }
                        auto name_index = i + 1U;
                        if (name_index < tokens.size() && is_op(tokens[name_index], "*"sv)) {
                            ++name_index;
                        }
                        if (name_index >= tokens.size() || tokens[name_index].kind != token_kind::identifier) {
                            continue;
                        }
                        out.push_back(read_function(tokens, tokens[name_index].text, tokens[i].line, name_index + 1U));
                        continue;
                    }

                    if (is_word(tokens[i], "const"sv) || is_word(tokens[i], "let"sv) || is_word(tokens[i], "var"sv)) {
                        if (auto fn = read_binding(tokens, i)) {
                            out.push_back(std::move(*fn));
                        }
                        continue;
                    }

                    if (is_word(tokens[i], "class"sv) && (i == 0U || !is_op(tokens[i - 1U], "."sv))) {
                        read_class_methods(tokens, i, out);
                    }
                }
                return out;
            }

          private:
            static bool is_method_modifier(const source_token& token) {
                return is_word(token, "static"sv) || is_word(token, "async"sv) || is_word(token, "get"sv) ||
                       is_word(token, "set"sv) || is_op(token, "*"sv) || is_op(token, "#"sv);
            }

            // `class Name [extends Base] { ... }`: each `name(...) {...}` member becomes a
            // function whose receiver is `this`; fields and computed members are skipped
            static void read_class_methods(
                    const std::vector<source_token>& tokens, size_t class_index, std::vector<function_descriptor>& out) {
                auto brace = class_index + 1U;
                while (brace < tokens.size() && !is_op(tokens[brace], "{"sv)) {
                    if (is_op(tokens[brace], "("sv) || is_op(tokens[brace], "["sv)) {
                        brace = matching_close(tokens, brace);
                    }
                    else if (is_op(tokens[brace], ";"sv) || is_op(tokens[brace], ")"sv)) {
                        return;
                    }
                    ++brace;
                }
                if (brace >= tokens.size()) {
                    return;
                }
                auto end = matching_close(tokens, brace);

                auto j = brace + 1U;
                while (j < end) {
                    while (j + 1U < end && is_method_modifier(tokens[j]) && !is_op(tokens[j + 1U], "("sv) &&
                           !is_op(tokens[j + 1U], "="sv)) {
                        ++j;
                    }
                    const auto& t = tokens[j];
                    if (t.kind == token_kind::identifier && !is_word(t, "function"sv) && j + 1U < end &&
                        is_op(tokens[j + 1U], "("sv)) {
                        auto close = matching_close(tokens, j + 1U);
                        // a call inside a field initializer has no body
                        if (close + 1U < end && is_op(tokens[close + 1U], "{"sv)) {
                            auto fn = read_function(tokens, t.text, t.line, j + 1U);
                            fn.receiver = "this";
                            out.push_back(std::move(fn));
                            j = matching_close(tokens, close + 1U) + 1U;
                            continue;
                        }
                    }
                    if (is_op(t, "("sv) || is_op(t, "["sv) || is_op(t, "{"sv)) {
                        j = matching_close(tokens, j);
                    }
                    ++j;
                }
            }

            static function_descriptor read_function(
                    const std::vector<source_token>& tokens, const std::string& name, size_t start_line, size_t open) {
                if (open >= tokens.size() || !is_op(tokens[open], "("sv)) {
                    throw parse_error(start_line, "expected '(' after function name '{}'"_format(name));
                }
                auto close = matching_close(tokens, open);
                auto brace = close + 1U;
                if (brace >= tokens.size() || !is_op(tokens[brace], "{"sv)) {
                    throw parse_error(start_line, "expected function body for '{}'"_format(name));
                }
                auto end = matching_close(tokens, brace);

                function_descriptor fn{};
                fn.name = name;
                fn.start_line = start_line;
                fn.end_line = tokens[end].line;
                fn.parameters = parse_parameters(tokens, open + 1U, close, false);
                fn.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(brace + 1U),
                               tokens.begin() + static_cast<std::ptrdiff_t>(end));
                return fn;
            }

            // const name = function (...) {...} | const name = (...) => ... | const name = x => ...
            static std::optional<function_descriptor> read_binding(const std::vector<source_token>& tokens, size_t i) {
                auto name_index = i + 1U;
                auto eq = i + 2U;
                if (eq >= tokens.size() || tokens[name_index].kind != token_kind::identifier || !is_op(tokens[eq], "="sv)) {
                    return std::nullopt;
                }
                const auto& name = tokens[name_index].text;
                auto start_line = tokens[i].line;
                auto k = eq + 1U;
                if (k < tokens.size() && is_word(tokens[k], "async"sv)) {
                    ++k;
                }
                if (k >= tokens.size()) {
                    return std::nullopt;
                }

                if (is_word(tokens[k], "function"sv)) {
                    auto open = k + 1U;
                    if (open < tokens.size() && is_op(tokens[open], "*"sv)) {
                        ++open;
                    }
                    if (open < tokens.size() && tokens[open].kind == token_kind::identifier) {
                        ++open;
                    }
                    return read_function(tokens, name, start_line, open);
                }

                size_t params_first = 0U;
                size_t params_last = 0U;
                size_t arrow = 0U;
                if (is_op(tokens[k], "("sv)) {
                    auto close = matching_close(tokens, k);
                    arrow = close + 1U;
                    params_first = k + 1U;
                    params_last = close;
                }
                else if (tokens[k].kind == token_kind::identifier) {
                    arrow = k + 1U;
                    params_first = k;
                    params_last = k + 1U;
                }
                else {
                    return std::nullopt;
                }
                if (arrow >= tokens.size() || !is_op(tokens[arrow], "=>"sv)) {
                    return std::nullopt;
                }

                function_descriptor fn{};
                fn.name = name;
                fn.start_line = start_line;
                fn.parameters = parse_parameters(tokens, params_first, params_last, false);

                auto body_start = arrow + 1U;
                if (body_start >= tokens.size() || tokens[body_start].kind == token_kind::newline) {
                    throw parse_error(start_line, "expected arrow function body for '{}'"_format(name));
                }
                if (is_op(tokens[body_start], "{"sv)) {
                    auto end = matching_close(tokens, body_start);
                    fn.end_line = tokens[end].line;
                    fn.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(body_start + 1U),
                                   tokens.begin() + static_cast<std::ptrdiff_t>(end));
                    return fn;
                }

                // expression body runs to the end of the statement
                auto end = body_start;
                while (end < tokens.size() && tokens[end].kind != token_kind::newline && !is_op(tokens[end], ";"sv)) {
                    if (is_op(tokens[end], "("sv) || is_op(tokens[end], "["sv) || is_op(tokens[end], "{"sv)) {
                        end = matching_close(tokens, end);
                    }
                    ++end;
                }
                fn.end_line = tokens[end - 1U].line;
                fn.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(body_start),
                               tokens.begin() + static_cast<std::ptrdiff_t>(end));
                return fn;
            }
        };

        class ruby_frontend final : public source_frontend {
          public:
            source_language language() const override { return source_language::ruby; }

            const construct_table& constructs() const override {
                static const construct_table table{
                        .branches = {"if"sv, "elsif"sv, "unless"sv, "when"sv},
                        .loops = {"while"sv, "until"sv, "for"sv, "loop"sv},
                        .handlers = {"rescue"sv},
                        .iterator_methods = {"each"sv,
                                             "each_with_index"sv,
                                             "times"sv,
                                             "upto"sv,
                                             "downto"sv,
                                             "step"sv,
                                             "map"sv,
                                             "each_slice"sv},
                        .io_names = {"puts"sv,
                                     "print"sv,
                                     "gets"sv,
                                     "File"sv,
                                     "IO"sv,
                                     "open"sv,
                                     "STDOUT"sv,
                                     "STDIN"sv,
                                     "$stdout"sv,
                                     "$stdin"sv,
                                     "Net"sv},
                        .branch_ops = {},
                        .call_requires_parens = false};
                return table;
            }

            std::vector<function_descriptor> scan(std::string_view source) const override {
                auto tokens = tokenize(source, source_language::ruby);

                struct frame {
                    std::string keyword{};
                    size_t line{};
                    std::optional<function_descriptor> def{};
                    size_t body_start{};
                };

                std::vector<frame> stack{};
                std::vector<function_descriptor> out{};
                bool loop_awaits_do = false;

                for (size_t i = 0U; i < tokens.size(); ++i) {
                    const auto& t = tokens[i];
                    if (t.kind == token_kind::newline || is_op(t, ";"sv)) {
                        loop_awaits_do = false;
                        continue;
                    }
                    if (t.kind != token_kind::identifier) {
                        continue;
                    }
                    // `x.end`, `obj.class` and symbol keys are not keywords
                    if (i > 0U && (is_op(tokens[i - 1U], "."sv) || is_op(tokens[i - 1U], "::"sv) ||
                                   is_op(tokens[i - 1U], ":"sv))) {
                        continue;
                    }

                    if (t.text == "end"sv) {
                        if (stack.empty()) {
                            throw parse_error(t.line, "unexpected 'end'");
                        }
                        auto top = std::move(stack.back());
                        stack.pop_back();
                        if (top.def) {
                            top.def->end_line = t.line;
                            top.def->body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(top.body_start),
                                                 tokens.begin() + static_cast<std::ptrdiff_t>(i));
                            out.push_back(std::move(*top.def));
                        }
                        continue;
                    }

                    if (t.text == "do"sv) {
                        if (loop_awaits_do) {
                            loop_awaits_do = false;
                            continue;
                        }
                        stack.push_back(frame{.keyword = "do", .line = t.line});
                        continue;
                    }

                    if (!at_statement_start(tokens, i)) {
                        continue;
                    }

                    if (t.text == "def"sv) {
                        auto [descriptor, body_start, endless] = read_def(tokens, i);
                        if (endless) {
                            out.push_back(std::move(descriptor));
                            i = body_start;
                            continue;
                        }
                        stack.push_back(frame{
                                .keyword = "def", .line = t.line, .def = std::move(descriptor), .body_start = body_start});
                        i = body_start - 1U;
                        continue;
                    }

                    static constexpr auto openers = std::array{
                            "class"sv, "module"sv, "if"sv, "unless"sv, "while"sv, "until"sv, "case"sv, "begin"sv, "for"sv};
                    if (std::ranges::find(openers, std::string_view{t.text}) != openers.end()) {
                        stack.push_back(frame{.keyword = t.text, .line = t.line});
                        loop_awaits_do = t.text == "while"sv || t.text == "until"sv || t.text == "for"sv;
                    }
                }

                if (!stack.empty()) {
                    const auto& open = stack.back();
                    throw parse_error(open.line, "missing 'end' for '{}'"_format(open.keyword));
                }

                std::ranges::stable_sort(out, {}, &function_descriptor::start_line);
                return out;
            }

          private:
            static bool at_statement_start(const std::vector<source_token>& tokens, size_t i) {
                if (i == 0U) {
                    return true;
                }
                const auto& prev = tokens[i - 1U];
                return prev.kind == token_kind::newline || is_op(prev, ";"sv) || is_op(prev, "="sv) ||
                       is_op(prev, "||="sv) || is_op(prev, "("sv);
            }

            struct def_header {
                function_descriptor descriptor{};
                size_t body_start{};
                bool endless{false};
            };

            static def_header read_def(const std::vector<source_token>& tokens, size_t def_index) {
                auto line = tokens[def_index].line;
                auto k = def_index + 1U;
                if (k + 1U < tokens.size() && tokens[k].kind == token_kind::identifier && is_op(tokens[k + 1U], "."sv)) {
                    k += 2U;
                }
                if (k >= tokens.size() || tokens[k].kind != token_kind::identifier) {
                    throw parse_error(line, "expected method name after 'def'");
                }

                def_header header{};
                header.descriptor.name = tokens[k].text;
                header.descriptor.start_line = line;

                auto after_name = k + 1U;
                size_t params_end = after_name;
                if (after_name < tokens.size() && is_op(tokens[after_name], "("sv)) {
                    auto close = matching_close(tokens, after_name);
                    header.descriptor.parameters = parse_parameters(tokens, after_name + 1U, close, false);
                    params_end = close + 1U;
                }
                else {
                    auto end = after_name;
                    while (end < tokens.size() && tokens[end].kind != token_kind::newline && !is_op(tokens[end], ";"sv)) {
                        ++end;
                    }
                    header.descriptor.parameters = parse_parameters(tokens, after_name, end, false);
                    params_end = end;
                }

                if (params_end < tokens.size() && is_op(tokens[params_end], "="sv)) {
                    // endless method: def name(args) = expr
                    auto end = params_end + 1U;
                    while (end < tokens.size() && tokens[end].kind != token_kind::newline) {
                        ++end;
                    }
                    if (end == params_end + 1U) {
                        throw parse_error(line, "expected expression after '=' in endless method '{}'"_format(
                                                        header.descriptor.name));
                    }
                    header.descriptor.body.assign(tokens.begin() + static_cast<std::ptrdiff_t>(params_end + 1U),
                                                  tokens.begin() + static_cast<std::ptrdiff_t>(end));
                    header.descriptor.end_line = tokens[end - 1U].line;
                    header.body_start = end;
                    header.endless = true;
                    return header;
                }

                header.body_start = params_end;
                return header;
            }
        };

    }  // namespace detail

    parse_error::parse_error(size_t line, const std::string& message)
            : std::runtime_error{line == 0U ? message : "line {}: {}"_format(line, message)}, line_{line} {}

    std::vector<source_token> tokenize(std::string_view source, source_language language) {
        return detail::lexer{source, language}.run();
    }

    void register_builtin_frontends(frontend_registry& registry) {
        registry.add(std::string{to_string(source_language::python)},
                     [] { return std::make_unique<detail::python_frontend>(); });
        registry.add(std::string{to_string(source_language::javascript)},
                     [] { return std::make_unique<detail::javascript_frontend>(); });
        registry.add(std::string{to_string(source_language::ruby)},
                     [] { return std::make_unique<detail::ruby_frontend>(); });
    }

}  // namespace pivot
