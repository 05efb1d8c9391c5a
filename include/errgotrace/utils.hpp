#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace errgotrace {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_horizontal_space(char c) noexcept { return c == ' ' || c == '\t'; }

        constexpr bool is_ascii_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
        }

        constexpr std::string_view trim_ascii(std::string_view value) noexcept {
            while (!value.empty() && is_ascii_space(value.front())) {
                value.remove_prefix(1U);
            }
            while (!value.empty() && is_ascii_space(value.back())) {
                value.remove_suffix(1U);
            }
            return value;
        }

        constexpr std::string_view trim_trailing_horizontal(std::string_view value) noexcept {
            while (!value.empty() && is_horizontal_space(value.back())) {
                value.remove_suffix(1U);
            }
            return value;
        }

        constexpr std::string_view trim_leading_horizontal(std::string_view value) noexcept {
            while (!value.empty() && is_horizontal_space(value.front())) {
                value.remove_prefix(1U);
            }
            return value;
        }

        // Splits on '\n'; a trailing newline does not produce an empty final element.
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto line_end = text.find('\n', cursor);
                if (line_end == std::string_view::npos) {
                    lines.push_back(text.substr(cursor));
                    break;
                }
                lines.push_back(text.substr(cursor, line_end - cursor));
                cursor = line_end + 1U;
            }
            return lines;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace errgotrace
