#include "errgotrace/syntax.hpp"

#include "errgotrace/format.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace errgotrace::literals;

namespace errgotrace::syntax {
    namespace detail {

        static std::string describe(const token& tok) {
            switch (tok.kind) {
                case token_kind::eof:
                    return "EOF";
                case token_kind::semicolon:
                    return tok.implicit ? "newline" : "';'";
                default:
                    return "'{}'"_format(tok.text);
            }
        }

        // Parses the top level of a Go file. Function bodies and the bodies of
        // var/const/type declarations are only checked for bracket balance.
        class parser {
          public:
            explicit parser(std::string_view source) : source_{source} {
                for (auto& tok : tokenize(source)) {
                    if (!tok.is_comment()) {
                        toks_.push_back(tok);
                    }
                }
                match_brackets();
            }

            source_file run() {
                source_file file{};
                size_t i = 0U;
                if (!at(i).is_keyword("package"sv)) {
                    fail(at(i), "expected 'package', found {}"_format(describe(at(i))));
                }
                ++i;
                file.package_name = expect_identifier(i, "package name");
                auto clause_end = at(i + 1U).kind == token_kind::semicolon && !at(i + 1U).implicit
                                          ? at(i + 1U).end()
                                          : file.package_name.span.end;
                auto line_end = source_.find('\n', clause_end);
                file.package_line_end = line_end == std::string_view::npos ? source_.size() : line_end + 1U;
                i = expect_terminator(i + 1U);

                while (at(i).kind == token_kind::semicolon) {
                    ++i;
                }
                while (at(i).is_keyword("import"sv)) {
                    i = parse_import_decl(i, file.imports);
                    while (at(i).kind == token_kind::semicolon) {
                        ++i;
                    }
                }

                while (at(i).kind != token_kind::eof) {
                    const auto& tok = at(i);
                    if (tok.kind == token_kind::semicolon) {
                        ++i;
                    }
                    else if (tok.is_keyword("func"sv)) {
                        i = parse_func_decl(i, file.functions);
                    }
                    else if (tok.is_keyword("var"sv) || tok.is_keyword("const"sv) || tok.is_keyword("type"sv)) {
                        i = skip_decl(i);
                    }
                    else if (tok.is_keyword("import"sv)) {
                        fail(tok, "imports must appear before other declarations");
                    }
                    else {
                        fail(tok, "non-declaration statement outside function body");
                    }
                }
                return file;
            }

          private:
            std::string_view source_;
            std::vector<token> toks_{};
            std::vector<size_t> match_{};

            [[noreturn]] static void fail(const token& tok, const std::string& message) {
                throw parse_error{tok.line, tok.column, message};
            }

            const token& at(size_t i) const { return i < toks_.size() ? toks_[i] : toks_.back(); }

            void match_brackets() {
                match_.assign(toks_.size(), 0U);
                std::vector<size_t> open{};
                for (size_t i = 0U; i < toks_.size(); ++i) {
                    const auto& tok = toks_[i];
                    if (tok.opens_bracket()) {
                        open.push_back(i);
                        continue;
                    }
                    if (!tok.closes_bracket()) {
                        continue;
                    }
                    if (open.empty()) {
                        fail(tok, "unexpected {}"_format(describe(tok)));
                    }
                    auto opener = open.back();
                    auto pair = std::string{toks_[opener].text} + std::string{tok.text};
                    if (pair != "()" && pair != "[]" && pair != "{}") {
                        fail(tok, "unexpected {}, expected closing for '{}'"_format(describe(tok), toks_[opener].text));
                    }
                    open.pop_back();
                    match_[opener] = i;
                    match_[i] = opener;
                }
                if (!open.empty()) {
                    fail(toks_[open.back()], "unclosed '{}'"_format(toks_[open.back()].text));
                }
            }

            identifier expect_identifier(size_t i, std::string_view what) const {
                const auto& tok = at(i);
                if (tok.kind != token_kind::identifier) {
                    fail(tok, "expected {}, found {}"_format(what, describe(tok)));
                }
                return identifier{std::string{tok.text}, text_span{tok.offset, tok.end()}};
            }

            size_t expect_terminator(size_t i) const {
                const auto& tok = at(i);
                if (tok.kind == token_kind::semicolon) {
                    return i + 1U;
                }
                if (tok.kind == token_kind::eof) {
                    return i;
                }
                fail(tok, "expected ';', found {}"_format(describe(tok)));
            }

            void expect_op(size_t i, std::string_view spelling) const {
                if (!at(i).is_op(spelling)) {
                    fail(at(i), "expected '{}', found {}"_format(spelling, describe(at(i))));
                }
            }

            text_span span_of(size_t first, size_t last_exclusive) const {
                return text_span{toks_[first].offset, toks_[last_exclusive - 1U].end()};
            }

            size_t parse_import_decl(size_t i, std::vector<import_spec>& imports) const {
                ++i;
                if (at(i).is_op("("sv)) {
                    auto close = match_[i];
                    size_t j = i + 1U;
                    while (j < close) {
                        if (at(j).kind == token_kind::semicolon) {
                            ++j;
                            continue;
                        }
                        j = parse_import_spec(j, imports);
                        if (j < close) {
                            if (at(j).kind != token_kind::semicolon) {
                                fail(at(j), "expected ';', found {}"_format(describe(at(j))));
                            }
                            ++j;
                        }
                    }
                    return expect_terminator(close + 1U);
                }
                return expect_terminator(parse_import_spec(i, imports));
            }

            size_t parse_import_spec(size_t i, std::vector<import_spec>& imports) const {
                import_spec spec{};
                auto first = i;
                if (at(i).kind == token_kind::identifier || at(i).is_op("."sv)) {
                    spec.alias = identifier{std::string{at(i).text}, text_span{at(i).offset, at(i).end()}};
                    ++i;
                }
                const auto& path = at(i);
                if (path.kind != token_kind::string && path.kind != token_kind::raw_string) {
                    fail(path, "expected import path, found {}"_format(describe(path)));
                }
                spec.path = std::string{path.text.substr(1U, path.text.size() - 2U)};
                spec.span = span_of(first, i + 1U);
                imports.push_back(std::move(spec));
                return i + 1U;
            }

            size_t skip_decl(size_t i) const {
                ++i;
                while (at(i).kind != token_kind::semicolon && at(i).kind != token_kind::eof) {
                    i = at(i).opens_bracket() ? match_[i] + 1U : i + 1U;
                }
                return expect_terminator(i);
            }

            size_t parse_func_decl(size_t i, std::vector<func_decl>& functions) const {
                func_decl decl{};
                auto first = i;
                ++i;

                if (at(i).is_op("("sv)) {
                    decl.receiver = parse_field_list(i);
                    if (decl.receiver->fields.size() != 1U || decl.receiver->slot_count() != 1U) {
                        fail(at(i), "method has multiple receivers");
                    }
                    i = match_[i] + 1U;
                }

                decl.name = expect_identifier(i, "function name");
                ++i;

                if (at(i).is_op("["sv)) {
                    decl.type_params = parse_type_params(i);
                    i = match_[i] + 1U;
                }

                expect_op(i, "("sv);
                decl.params = parse_field_list(i);
                i = match_[i] + 1U;

                if (at(i).is_op("("sv)) {
                    decl.results = parse_field_list(i);
                    i = match_[i] + 1U;
                }
                else if (starts_type(i)) {
                    auto end = parse_type(i, toks_.size());
                    if (!end) {
                        fail(at(i), "invalid result type");
                    }
                    field result{};
                    result.type = span_of(i, *end);
                    decl.results = field_list{.span = result.type, .fields = {result}};
                    i = *end;
                }

                if (at(i).is_op("{"sv)) {
                    auto close = match_[i];
                    decl.body = text_span{at(i).offset, at(close).end()};
                    i = close + 1U;
                }

                decl.span = span_of(first, i);
                functions.push_back(std::move(decl));
                return expect_terminator(i);
            }

            bool starts_type(size_t i) const {
                const auto& tok = at(i);
                return tok.kind == token_kind::identifier || tok.is_op("*"sv) || tok.is_op("("sv) ||
                       tok.is_op("["sv) || tok.is_op("<-"sv) || tok.is_keyword("map"sv) || tok.is_keyword("chan"sv) ||
                       tok.is_keyword("func"sv) || tok.is_keyword("struct"sv) || tok.is_keyword("interface"sv);
            }

            // Index one past the closing bracket paired with the opener at `i`,
            // if that bracket lies before `end`.
            std::optional<size_t> past_match(size_t i, size_t end) const {
                if (i >= end || !at(i).opens_bracket() || match_[i] >= end) {
                    return std::nullopt;
                }
                return match_[i] + 1U;
            }

            // Returns the index one past the type starting at `i`, bounded by `end`.
            std::optional<size_t> parse_type(size_t i, size_t end) const {
                if (i >= end) {
                    return std::nullopt;
                }
                const auto& tok = at(i);
                if (tok.kind == token_kind::identifier) {
                    ++i;
                    if (i + 1U < end && at(i).is_op("."sv) && at(i + 1U).kind == token_kind::identifier) {
                        i += 2U;
                    }
                    if (i < end && at(i).is_op("["sv)) {
                        return past_match(i, end);
                    }
                    return i;
                }
                if (tok.is_op("*"sv)) {
                    return parse_type(i + 1U, end);
                }
                if (tok.is_op("("sv)) {
                    auto after = past_match(i, end);
                    if (!after) {
                        return std::nullopt;
                    }
                    auto inner = parse_type(i + 1U, *after - 1U);
                    if (!inner || *inner != *after - 1U) {
                        return std::nullopt;
                    }
                    return after;
                }
                if (tok.is_op("["sv)) {
                    auto after = past_match(i, end);
                    return after ? parse_type(*after, end) : std::nullopt;
                }
                if (tok.is_keyword("map"sv)) {
                    auto after = past_match(i + 1U, end);
                    if (!after || !at(i + 1U).is_op("["sv)) {
                        return std::nullopt;
                    }
                    return parse_type(*after, end);
                }
                if (tok.is_keyword("chan"sv)) {
                    ++i;
                    if (i < end && at(i).is_op("<-"sv)) {
                        ++i;
                    }
                    return parse_type(i, end);
                }
                if (tok.is_op("<-"sv)) {
                    if (i + 1U >= end || !at(i + 1U).is_keyword("chan"sv)) {
                        return std::nullopt;
                    }
                    return parse_type(i + 2U, end);
                }
                if (tok.is_keyword("func"sv)) {
                    if (!at(i + 1U).is_op("("sv)) {
                        return std::nullopt;
                    }
                    auto after = past_match(i + 1U, end);
                    if (!after) {
                        return std::nullopt;
                    }
                    if (*after < end && starts_type(*after)) {
                        if (at(*after).is_op("("sv)) {
                            return past_match(*after, end);
                        }
                        return parse_type(*after, end);
                    }
                    return after;
                }
                if (tok.is_keyword("struct"sv) || tok.is_keyword("interface"sv)) {
                    if (!at(i + 1U).is_op("{"sv)) {
                        return std::nullopt;
                    }
                    return past_match(i + 1U, end);
                }
                return std::nullopt;
            }

            std::optional<size_t> parse_param_type(size_t i, size_t end) const {
                if (i < end && at(i).is_op("..."sv)) {
                    return parse_type(i + 1U, end);
                }
                return parse_type(i, end);
            }

            struct entry {
                size_t begin{};
                size_t end{};
            };

            // Splits the contents of the bracket pair opened at `open` on top-level commas.
            std::vector<entry> split_entries(size_t open) const {
                auto close = match_[open];
                std::vector<entry> entries{};
                size_t begin = open + 1U;
                size_t j = begin;
                while (j < close) {
                    const auto& tok = at(j);
                    if (tok.kind == token_kind::semicolon) {
                        fail(tok, "unexpected {} in parameter list"_format(describe(tok)));
                    }
                    if (tok.opens_bracket()) {
                        j = match_[j] + 1U;
                        continue;
                    }
                    if (tok.is_op(","sv)) {
                        if (j == begin) {
                            fail(tok, "unexpected ','");
                        }
                        entries.push_back(entry{begin, j});
                        begin = j + 1U;
                    }
                    ++j;
                }
                if (begin < close) {
                    entries.push_back(entry{begin, close});
                }
                return entries;
            }

            field_list parse_field_list(size_t open) const {
                field_list list{};
                list.span = span_of(open, match_[open] + 1U);
                auto entries = split_entries(open);

                struct classified {
                    entry range{};
                    bool named{false};
                };
                std::vector<classified> parts{};
                bool any_named = false;
                for (const auto& e : entries) {
                    bool named = at(e.begin).kind == token_kind::identifier && e.end - e.begin >= 2U &&
                                 !at(e.begin + 1U).is_op("."sv) && parse_param_type(e.begin + 1U, e.end) == e.end;
                    if (!named && parse_param_type(e.begin, e.end) != e.end) {
                        fail(at(e.begin), "invalid parameter declaration");
                    }
                    any_named = any_named || named;
                    parts.push_back(classified{e, named});
                }

                std::vector<identifier> pending{};
                for (const auto& part : parts) {
                    const auto& e = part.range;
                    if (!any_named) {
                        field f{};
                        f.type = span_of(e.begin, e.end);
                        f.variadic = at(e.begin).is_op("..."sv);
                        list.fields.push_back(std::move(f));
                        continue;
                    }
                    if (!part.named) {
                        if (e.end - e.begin != 1U) {
                            fail(at(e.begin), "mixed named and unnamed parameters");
                        }
                        pending.push_back(identifier{std::string{at(e.begin).text}, span_of(e.begin, e.end)});
                        continue;
                    }
                    field f{};
                    f.names = std::move(pending);
                    pending.clear();
                    f.names.push_back(identifier{std::string{at(e.begin).text}, span_of(e.begin, e.begin + 1U)});
                    f.type = span_of(e.begin + 1U, e.end);
                    f.variadic = at(e.begin + 1U).is_op("..."sv);
                    list.fields.push_back(std::move(f));
                }
                if (!pending.empty()) {
                    fail(at(match_[open]), "mixed named and unnamed parameters");
                }
                return list;
            }

            field_list parse_type_params(size_t open) const {
                field_list list{};
                list.span = span_of(open, match_[open] + 1U);
                std::vector<identifier> pending{};
                for (const auto& e : split_entries(open)) {
                    if (at(e.begin).kind != token_kind::identifier) {
                        fail(at(e.begin), "expected type parameter name, found {}"_format(describe(at(e.begin))));
                    }
                    pending.push_back(identifier{std::string{at(e.begin).text}, span_of(e.begin, e.begin + 1U)});
                    if (e.end - e.begin == 1U) {
                        continue;
                    }
                    field f{};
                    f.names = std::move(pending);
                    pending.clear();
                    f.type = span_of(e.begin + 1U, e.end);
                    list.fields.push_back(std::move(f));
                }
                if (!pending.empty()) {
                    fail(at(match_[open]), "missing type constraint");
                }
                if (list.fields.empty()) {
                    fail(at(open), "empty type parameter list");
                }
                return list;
            }
        };

    }  // namespace detail

    source_file parse_source(std::string_view source) {
        return detail::parser{source}.run();
    }

}  // namespace errgotrace::syntax
