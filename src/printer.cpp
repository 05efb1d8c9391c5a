#include "errgotrace/syntax.hpp"

#include "errgotrace/utils.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace errgotrace::syntax {
    namespace detail {

        static std::string normalize_line_endings(std::string_view source) {
            std::string out{};
            out.reserve(source.size());
            for (size_t i = 0U; i < source.size(); ++i) {
                if (source[i] == '\r' && i + 1U < source.size() && source[i + 1U] == '\n') {
                    continue;
                }
                out.push_back(source[i]);
            }
            return out;
        }

        static size_t token_index_at(const std::vector<token>& tokens, size_t offset) {
            auto it = std::ranges::lower_bound(tokens, offset, {}, &token::offset);
            while (it != tokens.end() && it->kind == token_kind::semicolon && it->implicit) {
                ++it;
            }
            return static_cast<size_t>(it - tokens.begin());
        }

        static std::optional<size_t> previous_explicit(const std::vector<token>& tokens, size_t index) {
            while (index > 0U) {
                --index;
                if (!(tokens[index].kind == token_kind::semicolon && tokens[index].implicit)) {
                    return index;
                }
            }
            return std::nullopt;
        }

        static std::optional<size_t> next_explicit(const std::vector<token>& tokens, size_t index) {
            for (++index; index < tokens.size(); ++index) {
                if (!(tokens[index].kind == token_kind::semicolon && tokens[index].implicit)) {
                    return index;
                }
            }
            return std::nullopt;
        }

        // Offset just past an explicit ';' ending the package clause when more
        // code follows on the same line.
        static std::optional<size_t> package_break_offset(const std::vector<token>& tokens) {
            auto keyword = std::ranges::find_if(tokens, [](const token& tok) { return tok.is_keyword("package"sv); });
            if (keyword == tokens.end()) {
                return std::nullopt;
            }
            auto terminator = std::find_if(keyword + 1, tokens.end(), [](const token& tok) {
                return tok.kind == token_kind::semicolon || tok.kind == token_kind::eof;
            });
            if (terminator == tokens.end() || terminator->kind != token_kind::semicolon || terminator->implicit) {
                return std::nullopt;
            }
            auto next = terminator + 1;
            if (next == tokens.end() || next->kind == token_kind::eof || next->line != terminator->line ||
                next->kind == token_kind::line_comment) {
                return std::nullopt;
            }
            return terminator->end();
        }

        // Offsets where a line break must be introduced so that the package clause
        // ends its line and every top-level function body opens at the end of a
        // line and closes at the start of one.
        static std::vector<size_t> body_break_offsets(std::string_view text) {
            auto file = parse_source(text);
            auto tokens = tokenize(text);
            std::vector<size_t> breaks{};

            if (auto offset = package_break_offset(tokens)) {
                breaks.push_back(*offset);
            }

            for (const auto& decl : file.functions) {
                if (!decl.body) {
                    continue;
                }
                auto open = token_index_at(tokens, decl.body->begin);
                auto close = token_index_at(tokens, decl.body->end - 1U);

                if (auto next = next_explicit(tokens, open);
                    next && tokens[*next].kind != token_kind::eof && tokens[*next].line == tokens[open].line) {
                    breaks.push_back(tokens[open].end());
                }
                if (auto prev = previous_explicit(tokens, close);
                    prev && *prev != open && tokens[*prev].line == tokens[close].line) {
                    breaks.push_back(tokens[close].offset);
                }
            }
            return breaks;
        }

        static std::string apply_breaks(std::string_view text, const std::vector<size_t>& breaks) {
            std::string out{};
            out.reserve(text.size() + breaks.size());
            size_t cursor = 0U;
            for (auto offset : breaks) {
                out.append(utils::trim_trailing_horizontal(text.substr(cursor, offset - cursor)));
                out.push_back('\n');
                cursor = offset;
                while (cursor < text.size() && utils::is_horizontal_space(text[cursor])) {
                    ++cursor;
                }
            }
            out.append(text.substr(cursor));
            return out;
        }

        struct line_info {
            size_t begin{};
            size_t end{};
            bool starts_inside{false};
            bool ends_inside{false};
            std::optional<size_t> first_token{};
            std::optional<size_t> last_token{};
        };

        static std::vector<line_info> describe_lines(std::string_view text, const std::vector<token>& tokens) {
            std::vector<line_info> lines{};
            size_t cursor = 0U;
            while (cursor <= text.size()) {
                auto line_end = text.find('\n', cursor);
                if (line_end == std::string_view::npos) {
                    if (cursor < text.size()) {
                        lines.push_back(line_info{.begin = cursor, .end = text.size()});
                    }
                    break;
                }
                lines.push_back(line_info{.begin = cursor, .end = line_end});
                cursor = line_end + 1U;
            }

            for (size_t i = 0U; i < tokens.size(); ++i) {
                const auto& tok = tokens[i];
                if (tok.kind == token_kind::eof || (tok.kind == token_kind::semicolon && tok.implicit)) {
                    continue;
                }
                auto index = tok.line - 1U;
                if (index >= lines.size()) {
                    continue;
                }
                auto& line = lines[index];
                if (!line.first_token) {
                    line.first_token = i;
                }
                line.last_token = i;

                auto spanned = static_cast<size_t>(std::ranges::count(tok.text, '\n'));
                for (size_t k = 0U; k < spanned && index + k + 1U < lines.size(); ++k) {
                    lines[index + k].ends_inside = true;
                    lines[index + k + 1U].starts_inside = true;
                }
            }
            return lines;
        }

        struct open_bracket {
            size_t indent{};
            bool brace{false};
        };

        static std::string layout(std::string_view text) {
            auto tokens = tokenize(text);
            auto lines = describe_lines(text, tokens);

            size_t package_line = 0U;
            for (size_t i = 0U; i + 1U < tokens.size(); ++i) {
                if (tokens[i].is_keyword("package"sv)) {
                    package_line = tokens[i + 1U].line;
                    break;
                }
            }

            std::vector<open_bracket> stack{};
            std::vector<std::string> out{};
            bool pending_blank = false;
            bool force_blank = false;
            bool previous_opens_block = false;
            size_t next_token = 0U;

            for (size_t index = 0U; index < lines.size(); ++index) {
                const auto& line = lines[index];
                auto raw = text.substr(line.begin, line.end - line.begin);

                size_t indent = stack.empty() ? 0U : stack.back().indent + 1U;
                if (!line.starts_inside && line.first_token) {
                    const auto& first = tokens[*line.first_token];
                    if (first.closes_bracket() && !stack.empty()) {
                        indent = stack.back().indent;
                    }
                    else if ((first.is_keyword("case"sv) || first.is_keyword("default"sv)) && !stack.empty() &&
                             stack.back().brace && indent > 0U) {
                        --indent;
                    }
                }

                for (; next_token < tokens.size() && tokens[next_token].line <= index + 1U; ++next_token) {
                    const auto& tok = tokens[next_token];
                    if (tok.opens_bracket()) {
                        stack.push_back(open_bracket{.indent = indent, .brace = tok.is_op("{"sv)});
                    }
                    else if (tok.closes_bracket() && !stack.empty()) {
                        stack.pop_back();
                    }
                }

                std::string rendered{};
                if (line.starts_inside) {
                    rendered = line.ends_inside ? std::string{raw} : std::string{utils::trim_trailing_horizontal(raw)};
                }
                else {
                    auto content = utils::trim_leading_horizontal(raw);
                    if (!line.ends_inside) {
                        content = utils::trim_trailing_horizontal(content);
                    }
                    if (content.empty()) {
                        pending_blank = true;
                        continue;
                    }
                    rendered = std::string(indent, '\t');
                    rendered.append(content);
                }

                bool closes_block = !line.starts_inside && line.first_token && tokens[*line.first_token].is_op("}"sv);
                if (!out.empty() && (force_blank || (pending_blank && !previous_opens_block && !closes_block))) {
                    out.emplace_back();
                }
                pending_blank = false;
                force_blank = index + 1U == package_line;
                previous_opens_block = line.last_token && tokens[*line.last_token].is_op("{"sv);
                out.push_back(std::move(rendered));
            }

            std::string result{};
            for (const auto& l : out) {
                result.append(l);
                result.push_back('\n');
            }
            return result;
        }

    }  // namespace detail

    std::string format_source(std::string_view source) {
        auto text = detail::normalize_line_endings(source);
        auto breaks = detail::body_break_offsets(text);
        if (!breaks.empty()) {
            std::ranges::sort(breaks);
            text = detail::apply_breaks(text, breaks);
        }
        return detail::layout(text);
    }

}  // namespace errgotrace::syntax
