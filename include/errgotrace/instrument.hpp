#pragma once

#include "codegen.hpp"
#include "signature.hpp"
#include "syntax.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace errgotrace {

    struct instrument_options {
        std::string import_path{default_import_path};
        function_filter filter{};
    };

    // Canonical text of `source`; lexical or syntax errors are rethrown as
    // source_error of kind `parse`.
    std::string canonicalize(std::string_view source);

    // True if the file already imports the instrumentation package under its alias.
    bool is_processed(const syntax::source_file& file);

    // Forward transformation of one file. Throws source_error.
    std::string annotate_source(std::string_view source, const instrument_options& options);

    // Eligible signatures of one file, in source order. Throws source_error,
    // including `already_processed` for a file that is already instrumented.
    std::vector<function_signature> collect_signatures(std::string_view source, const function_filter& filter);

    // Removes every marker block, and at most one blank line after each.
    // Throws source_error of kind `marker` on a block without an end marker.
    std::string reverse_source(std::string_view source);

}  // namespace errgotrace
