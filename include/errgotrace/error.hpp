#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace errgotrace {

    using namespace std::string_view_literals;

    enum class failure_kind : uint8_t {
        io,
        parse,
        already_processed,
        format,
        marker,
    };

    inline constexpr std::string_view to_string(failure_kind kind) {
        switch (kind) {
            case failure_kind::io:
                return "io"sv;
            case failure_kind::parse:
                return "parse"sv;
            case failure_kind::already_processed:
                return "already_processed"sv;
            case failure_kind::format:
                return "format"sv;
            case failure_kind::marker:
                return "marker"sv;
        }
        return "io"sv;
    }

    // Invalid inclusion/exclusion pattern; fatal before any file is touched.
    class config_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Lexical or syntactic failure, positioned in the text that was being read.
    class parse_error : public std::runtime_error {
      public:
        parse_error(size_t line, size_t column, const std::string& message)
                : std::runtime_error{std::to_string(line) + ":" + std::to_string(column) + ": " + message},
                  line_{line},
                  column_{column} {}

        size_t line() const noexcept { return line_; }
        size_t column() const noexcept { return column_; }

      private:
        size_t line_{};
        size_t column_{};
    };

    // Failure attributed to one input file. Recovered at the file boundary.
    class source_error : public std::runtime_error {
      public:
        source_error(failure_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        failure_kind kind() const noexcept { return kind_; }

      private:
        failure_kind kind_{failure_kind::io};
    };

}  // namespace errgotrace
