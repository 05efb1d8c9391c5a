#include "errgotrace/codegen.hpp"

#include "errgotrace/format.hpp"
#include "errgotrace/utils.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace errgotrace::literals;

namespace errgotrace {
    namespace detail {

        static std::string result_names(size_t count) {
            std::vector<std::string> names{};
            names.reserve(count);
            for (size_t i = 0U; i < count; ++i) {
                names.push_back("__result{}"_format(i));
            }
            return utils::join_with_separator(names, ", "sv);
        }

        static std::string call_arguments(const function_signature& sig) {
            std::vector<std::string> args{};
            args.reserve(sig.params.size());
            for (const auto& p : sig.params) {
                args.push_back(p.variadic ? p.name + "..." : p.name);
            }
            return utils::join_with_separator(args, ", "sv);
        }

        static std::string implementation_params(const function_signature& sig) {
            std::vector<std::string> params{};
            params.reserve(sig.params.size());
            for (const auto& p : sig.params) {
                params.push_back("{} {}"_format(p.name, p.type_text));
            }
            return utils::join_with_separator(params, ", "sv);
        }

        static std::string call_target(const function_signature& sig) {
            std::string target{};
            if (!sig.receiver_name.empty()) {
                target = sig.receiver_name + ".";
            }
            target += sig.implementation_name();
            if (!sig.type_param_names.empty()) {
                target += "[{}]"_format(utils::join_with_separator(sig.type_param_names, ", "sv));
            }
            return target;
        }

    }  // namespace detail

    std::string quote_go_string(std::string_view value) {
        std::string quoted{"\""};
        quoted.reserve(value.size() + 2U);
        for (auto c : value) {
            switch (c) {
                case '"':
                    quoted += "\\\"";
                    break;
                case '\\':
                    quoted += "\\\\";
                    break;
                case '\n':
                    quoted += "\\n";
                    break;
                case '\t':
                    quoted += "\\t";
                    break;
                default:
                    quoted += c;
            }
        }
        quoted += '"';
        return quoted;
    }

    std::string render_import_block(std::string_view import_path) {
        return "\n{}\nimport {} {}\n{}\n"_format(begin_marker, import_alias, quote_go_string(import_path), end_marker);
    }

    std::string render_setup_block() {
        return "\n{}\nvar _ = {}.Setup()\n{}\n"_format(begin_marker, import_alias, end_marker);
    }

    std::string render_function_block(const function_signature& sig) {
        auto results = detail::result_names(sig.result_count);

        std::string block{"\n"};
        block += "\t{}\n"_format(begin_marker);
        block += "\t{} := {}({})\n"_format(results, detail::call_target(sig), detail::call_arguments(sig));
        block += "\t{}.InspectReturnValues({}, {})\n"_format(import_alias, quote_go_string(sig.qualified_name), results);
        block += "\treturn {}\n"_format(results);
        block += "}\n\nfunc ";
        if (!sig.receiver_name.empty()) {
            block += sig.receiver_text;
            block += ' ';
        }
        block += sig.implementation_name();
        block += sig.type_params_text;
        block += "({}) {} {{\n"_format(detail::implementation_params(sig), sig.results_text);
        block += "\t{}\n"_format(end_marker);
        return block;
    }

}  // namespace errgotrace
