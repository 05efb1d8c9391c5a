#pragma once

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace errgotrace::syntax {

    using namespace std::string_view_literals;

    enum class token_kind : uint8_t {
        identifier,
        keyword,
        number,
        rune,
        string,
        raw_string,
        line_comment,
        block_comment,
        op,
        semicolon,
        eof,
    };

    inline constexpr std::string_view to_string(token_kind kind) {
        switch (kind) {
            case token_kind::identifier:
                return "identifier"sv;
            case token_kind::keyword:
                return "keyword"sv;
            case token_kind::number:
                return "number"sv;
            case token_kind::rune:
                return "rune"sv;
            case token_kind::string:
                return "string"sv;
            case token_kind::raw_string:
                return "raw_string"sv;
            case token_kind::line_comment:
                return "line_comment"sv;
            case token_kind::block_comment:
                return "block_comment"sv;
            case token_kind::op:
                return "op"sv;
            case token_kind::semicolon:
                return "semicolon"sv;
            case token_kind::eof:
                return "eof"sv;
        }
        return "eof"sv;
    }

    // `text` views the tokenized buffer, which must outlive the token.
    // Semicolons inserted at a newline have empty text and `implicit` set.
    struct token {
        token_kind kind{token_kind::eof};
        std::string_view text{};
        size_t offset{};
        size_t line{1U};
        size_t column{1U};
        bool implicit{false};

        size_t end() const noexcept { return offset + text.size(); }
        bool is_comment() const noexcept {
            return kind == token_kind::line_comment || kind == token_kind::block_comment;
        }
        bool is_op(std::string_view spelling) const noexcept { return kind == token_kind::op && text == spelling; }
        bool is_keyword(std::string_view spelling) const noexcept {
            return kind == token_kind::keyword && text == spelling;
        }
        bool opens_bracket() const noexcept { return is_op("("sv) || is_op("["sv) || is_op("{"sv); }
        bool closes_bracket() const noexcept { return is_op(")"sv) || is_op("]"sv) || is_op("}"sv); }
    };

    // Tokenizes Go source, comments included, ending with an eof token.
    // Throws parse_error on lexical errors.
    std::vector<token> tokenize(std::string_view source);

    struct text_span {
        size_t begin{};
        size_t end{};

        bool empty() const noexcept { return begin == end; }
        std::string_view slice(std::string_view source) const { return source.substr(begin, end - begin); }
    };

    struct identifier {
        std::string name{};
        text_span span{};
    };

    // One entry of a parameter, result, receiver or type parameter list.
    // For type parameter lists `type` spans the constraint.
    struct field {
        std::vector<identifier> names{};
        text_span type{};
        bool variadic{false};
    };

    struct field_list {
        text_span span{};
        std::vector<field> fields{};

        size_t slot_count() const noexcept {
            size_t count = 0U;
            for (const auto& f : fields) {
                count += f.names.empty() ? 1U : f.names.size();
            }
            return count;
        }
    };

    struct import_spec {
        std::optional<identifier> alias{};
        std::string path{};
        text_span span{};
    };

    struct func_decl {
        identifier name{};
        std::optional<field_list> receiver{};
        std::optional<field_list> type_params{};
        field_list params{};
        std::optional<field_list> results{};
        // From the opening brace through the matching closing brace.
        std::optional<text_span> body{};
        text_span span{};
    };

    struct source_file {
        identifier package_name{};
        // Offset of the first byte after the line holding the package clause.
        size_t package_line_end{};
        std::vector<import_spec> imports{};
        std::vector<func_decl> functions{};
    };

    source_file parse_source(std::string_view source);

    // Re-prints source into canonical layout; idempotent. Throws parse_error.
    std::string format_source(std::string_view source);

    // Go export rule restricted to ASCII: first character is an upper-case letter.
    constexpr bool is_exported(std::string_view name) noexcept {
        return !name.empty() && name.front() >= 'A' && name.front() <= 'Z';
    }

}  // namespace errgotrace::syntax
