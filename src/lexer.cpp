#include "errgotrace/syntax.hpp"

#include "errgotrace/format.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

using namespace errgotrace::literals;

namespace errgotrace::syntax {
    namespace detail {

        static constexpr std::array keywords{
                "break"sv,  "case"sv,        "chan"sv,   "const"sv,  "continue"sv,  "default"sv,
                "defer"sv,  "else"sv,        "fallthrough"sv,        "for"sv,       "func"sv,
                "go"sv,     "goto"sv,        "if"sv,     "import"sv, "interface"sv, "map"sv,
                "package"sv, "range"sv,      "return"sv, "select"sv, "struct"sv,    "switch"sv,
                "type"sv,   "var"sv};

        // Longest spellings first so a prefix never shadows a longer operator.
        static constexpr std::array operators{
                "<<="sv, ">>="sv, "&^="sv, "..."sv, "&&"sv, "||"sv, "<-"sv, "++"sv, "--"sv, "=="sv, "!="sv,
                "<="sv,  ">="sv,  ":="sv,  "+="sv,  "-="sv, "*="sv, "/="sv, "%="sv, "&="sv, "|="sv, "^="sv,
                "<<"sv,  ">>"sv,  "&^"sv,  "+"sv,   "-"sv,  "*"sv,  "/"sv,  "%"sv,  "&"sv,  "|"sv,  "^"sv,
                "<"sv,   ">"sv,   "="sv,   "!"sv,   "("sv,  ")"sv,  "["sv,  "]"sv,  "{"sv,  "}"sv,  ","sv,
                ":"sv,   "."sv,   "~"sv};

        static constexpr bool is_letter(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return (lower >= 'a' && lower <= 'z') || c == '_' || static_cast<unsigned char>(c) >= 0x80U;
        }

        static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        static constexpr bool is_keyword(std::string_view word) noexcept {
            return std::ranges::find(keywords, word) != keywords.end();
        }

        class scanner {
          public:
            explicit scanner(std::string_view source) : source_{source} {
                // A leading byte order mark is not part of the program text.
                if (source_.starts_with("\xEF\xBB\xBF"sv)) {
                    pos_ = 3U;
                    line_start_ = 3U;
                }
            }

            std::vector<token> run() {
                while (pos_ < source_.size()) {
                    auto c = source_[pos_];
                    if (c == '\n') {
                        terminate_line(pos_);
                        ++pos_;
                        ++line_;
                        line_start_ = pos_;
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r') {
                        ++pos_;
                        continue;
                    }
                    scan_token();
                }
                terminate_line(source_.size());
                push(token_kind::eof, source_.size(), source_.size());
                return std::move(tokens_);
            }

          private:
            std::string_view source_;
            size_t pos_{};
            size_t line_{1U};
            size_t line_start_{};
            std::vector<token> tokens_{};
            bool semicolon_pending_{false};

            [[noreturn]] void fail(size_t offset, const std::string& message) const {
                throw parse_error{line_, offset - line_start_ + 1U, message};
            }

            void push(token_kind kind, size_t begin, size_t end, size_t line, size_t column) {
                tokens_.push_back(token{
                        .kind = kind,
                        .text = source_.substr(begin, end - begin),
                        .offset = begin,
                        .line = line,
                        .column = column});
            }

            void push(token_kind kind, size_t begin, size_t end) {
                push(kind, begin, end, line_, begin - line_start_ + 1U);
            }

            void push_significant(token_kind kind, size_t begin, size_t end, size_t line, size_t column) {
                push(kind, begin, end, line, column);
                auto& tok = tokens_.back();
                semicolon_pending_ = kind == token_kind::identifier || kind == token_kind::number ||
                                     kind == token_kind::rune || kind == token_kind::string ||
                                     kind == token_kind::raw_string || tok.is_keyword("break"sv) ||
                                     tok.is_keyword("continue"sv) || tok.is_keyword("fallthrough"sv) ||
                                     tok.is_keyword("return"sv) || tok.is_op("++"sv) || tok.is_op("--"sv) ||
                                     tok.is_op(")"sv) || tok.is_op("]"sv) || tok.is_op("}"sv);
            }

            void push_significant(token_kind kind, size_t begin, size_t end) {
                push_significant(kind, begin, end, line_, begin - line_start_ + 1U);
            }

            void terminate_line(size_t offset) {
                if (!semicolon_pending_) {
                    return;
                }
                semicolon_pending_ = false;
                tokens_.push_back(token{
                        .kind = token_kind::semicolon,
                        .text = source_.substr(offset, 0U),
                        .offset = offset,
                        .line = line_,
                        .column = offset - line_start_ + 1U,
                        .implicit = true});
            }

            void scan_token() {
                auto begin = pos_;
                auto c = source_[pos_];
                auto next = pos_ + 1U < source_.size() ? source_[pos_ + 1U] : '\0';

                if (is_letter(c)) {
                    while (pos_ < source_.size() && (is_letter(source_[pos_]) || is_digit(source_[pos_]))) {
                        ++pos_;
                    }
                    auto word = source_.substr(begin, pos_ - begin);
                    push_significant(is_keyword(word) ? token_kind::keyword : token_kind::identifier, begin, pos_);
                    return;
                }
                if (is_digit(c) || (c == '.' && is_digit(next))) {
                    scan_number();
                    push_significant(token_kind::number, begin, pos_);
                    return;
                }
                if (c == '/' && next == '/') {
                    auto line_end = source_.find('\n', pos_);
                    pos_ = line_end == std::string_view::npos ? source_.size() : line_end;
                    push(token_kind::line_comment, begin, pos_);
                    return;
                }
                if (c == '/' && next == '*') {
                    scan_block_comment();
                    return;
                }
                if (c == '"') {
                    scan_quoted('"', "string literal not terminated");
                    push_significant(token_kind::string, begin, pos_);
                    return;
                }
                if (c == '\'') {
                    scan_quoted('\'', "rune literal not terminated");
                    push_significant(token_kind::rune, begin, pos_);
                    return;
                }
                if (c == '`') {
                    scan_raw_string();
                    return;
                }
                if (c == ';') {
                    ++pos_;
                    push(token_kind::semicolon, begin, pos_);
                    semicolon_pending_ = false;
                    return;
                }
                for (auto spelling : operators) {
                    if (source_.substr(pos_).starts_with(spelling)) {
                        pos_ += spelling.size();
                        push_significant(token_kind::op, begin, pos_);
                        return;
                    }
                }
                fail(begin, "invalid character '{}'"_format(std::string_view{&source_[begin], 1U}));
            }

            void scan_number() {
                bool hex = source_[pos_] == '0' && pos_ + 1U < source_.size() &&
                           (source_[pos_ + 1U] == 'x' || source_[pos_ + 1U] == 'X');
                while (pos_ < source_.size()) {
                    auto c = source_[pos_];
                    if (is_digit(c) || is_letter(c) || c == '.') {
                        ++pos_;
                        continue;
                    }
                    if ((c == '+' || c == '-') && pos_ > 0U) {
                        auto prev = source_[pos_ - 1U];
                        bool exponent = hex ? (prev == 'p' || prev == 'P') : (prev == 'e' || prev == 'E');
                        if (exponent) {
                            ++pos_;
                            continue;
                        }
                    }
                    break;
                }
            }

            void scan_quoted(char quote, const char* unterminated) {
                auto begin = pos_;
                ++pos_;
                while (true) {
                    if (pos_ >= source_.size() || source_[pos_] == '\n') {
                        fail(begin, unterminated);
                    }
                    auto c = source_[pos_];
                    if (c == '\\') {
                        // An escape never continues the literal onto the next line.
                        if (pos_ + 1U >= source_.size() || source_[pos_ + 1U] == '\n') {
                            fail(begin, unterminated);
                        }
                        pos_ += 2U;
                        continue;
                    }
                    ++pos_;
                    if (c == quote) {
                        return;
                    }
                }
            }

            void scan_raw_string() {
                auto begin = pos_;
                auto line = line_;
                auto column = begin - line_start_ + 1U;
                auto close = source_.find('`', pos_ + 1U);
                if (close == std::string_view::npos) {
                    fail(begin, "raw string literal not terminated");
                }
                advance_lines(begin, close + 1U);
                push_significant(token_kind::raw_string, begin, pos_, line, column);
            }

            void scan_block_comment() {
                auto begin = pos_;
                auto line = line_;
                auto column = begin - line_start_ + 1U;
                auto close = source_.find("*/"sv, pos_ + 2U);
                if (close == std::string_view::npos) {
                    fail(begin, "comment not terminated");
                }
                auto end = close + 2U;
                // A comment spanning lines acts like a newline.
                if (source_.substr(begin, end - begin).find('\n') != std::string_view::npos) {
                    terminate_line(begin);
                }
                advance_lines(begin, end);
                push(token_kind::block_comment, begin, end, line, column);
            }

            void advance_lines(size_t begin, size_t end) {
                for (size_t i = begin; i < end; ++i) {
                    if (source_[i] == '\n') {
                        ++line_;
                        line_start_ = i + 1U;
                    }
                }
                pos_ = end;
            }
        };

    }  // namespace detail

    std::vector<token> tokenize(std::string_view source) {
        return detail::scanner{source}.run();
    }

}  // namespace errgotrace::syntax
