#pragma once

#include "codegen.hpp"
#include "utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace errgotrace {

    using namespace std::string_view_literals;

    /*
     * errgotrace Run Options
     *
     * Inputs and mode
     * - files: Go source files to process, in order.
     * - write_files: Rewrite files in place instead of printing to stdout.
     * - reverse: Strip previously injected code instead of injecting it.
     * - list: Report eligible functions without transforming anything.
     *
     * Function selection
     * - filter: Unanchored regex a qualified name must match.
     * - exclude: Unanchored regex rejecting a qualified name; empty excludes nothing.
     * - exported_only: Only instrument exported functions.
     *
     * Code generation
     * - import_path: Package imported under the instrumentation alias.
     *
     * Output
     * - output: Report shape for --list ("table" or "json").
     * - verbose: Per-file progress lines on stderr.
     * - print_config: Print resolved config and exit.
     */

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct run_config {
        std::vector<std::filesystem::path> files{};
        bool write_files{false};
        bool reverse{false};
        bool list{false};

        std::string filter{"."};
        std::string exclude{};
        bool exported_only{false};

        std::string import_path{default_import_path};

        output_mode output{output_mode::table};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace errgotrace
