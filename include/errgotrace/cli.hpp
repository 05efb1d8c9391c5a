#pragma once

#include "config.hpp"
#include "signature.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace errgotrace::cli {

    // Returns an exit status when the process should stop after parsing.
    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg);

    // Processes every configured file; returns the process exit status.
    int run(const run_config& cfg, std::ostream& out, std::ostream& err);
    int run(const run_config& cfg);

    // Throws source_error of kind `io`.
    std::string read_source_file(const std::filesystem::path& path);

    // Writes `text` to a sibling temporary file and renames it over `path`,
    // keeping the permissions of an existing file. A symbolic link is followed so
    // the link survives and its target is replaced. Throws source_error of kind `io`.
    void write_source_file(const std::filesystem::path& path, std::string_view text);

    struct listed_function {
        std::string name{};
        std::string qualified_name{};
        std::string receiver{};
        size_t results{};
    };

    struct listed_file {
        std::string file{};
        std::vector<listed_function> functions{};
    };

    listed_file make_listing(const std::filesystem::path& path, const std::vector<function_signature>& signatures);

    void render_listing(const std::vector<listed_file>& listing, output_mode mode, std::ostream& os);

}  // namespace errgotrace::cli
