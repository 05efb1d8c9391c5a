#pragma once

#include "signature.hpp"

#include <string>
#include <string_view>

namespace errgotrace {

    inline constexpr std::string_view begin_marker{"/* BEGIN_ERRGOTRACE */"};
    inline constexpr std::string_view end_marker{"/* END_ERRGOTRACE */"};
    inline constexpr std::string_view import_alias{"__errgotrace"};
    inline constexpr std::string_view default_import_path{"github.com/gellweiler/errgotrace/log"};

    // Go interpreted string literal holding `value`.
    std::string quote_go_string(std::string_view value);

    // Inserted at the start of the line following the package clause.
    std::string render_import_block(std::string_view import_path);

    // Appended at the end of the file.
    std::string render_setup_block();

    // Inserted right after the opening brace of the function body. Splits the
    // function into a wrapper that inspects the results and an implementation
    // that keeps the original body.
    std::string render_function_block(const function_signature& sig);

}  // namespace errgotrace
