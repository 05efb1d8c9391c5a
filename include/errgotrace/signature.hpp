#pragma once

#include "syntax.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
    class RE2;
}

namespace errgotrace {

    struct parameter {
        std::string name{};
        // Verbatim, including the leading `...` of a variadic parameter.
        std::string type_text{};
        bool variadic{false};
    };

    struct function_signature {
        std::string qualified_name{};
        std::string name{};
        std::string working_name{};
        std::string receiver_type{};
        std::string receiver_text{};
        std::string receiver_name{};
        std::string synthetic_prefix{};
        std::string type_params_text{};
        std::vector<std::string> type_param_names{};
        std::vector<parameter> params{};
        size_t result_count{};
        std::string results_text{};
        size_t insert_offset{};

        std::string implementation_name() const { return "__" + working_name; }
    };

    /*
     * Selects the functions to instrument by qualified name.
     *
     * - include: unanchored pattern a qualified name must match ("." by default).
     * - exclude: unanchored pattern that rejects a qualified name; takes precedence
     *   over include. Empty means nothing is excluded.
     * - exported_only: additionally require an exported function identifier.
     */
    class function_filter {
      public:
        function_filter();
        function_filter(std::string_view include, std::string_view exclude, bool exported_only);
        ~function_filter();

        function_filter(function_filter&&) noexcept;
        function_filter& operator=(function_filter&&) noexcept;

        bool accepts(std::string_view qualified_name, std::string_view identifier) const;

      private:
        std::unique_ptr<re2::RE2> include_;
        std::unique_ptr<re2::RE2> exclude_;
        bool exported_only_{false};
    };

    // Identifier-safe rendering of a receiver type, e.g. `*List[K, V]` -> `List_oK_V_c`.
    std::string synthetic_receiver_prefix(std::string_view receiver_type);

    std::string qualified_function_name(
            std::string_view package, const syntax::func_decl& decl, std::string_view source);

    // Returns the signature of an eligible declaration, std::nullopt otherwise.
    std::optional<function_signature> extract_signature(
            const syntax::func_decl& decl,
            std::string_view package,
            std::string_view source,
            const function_filter& filter);

    std::vector<function_signature> extract_signatures(
            const syntax::source_file& file, std::string_view source, const function_filter& filter);

}  // namespace errgotrace
