#include "errgotrace/signature.hpp"

#include "errgotrace/format.hpp"
#include "errgotrace/utils.hpp"

#include <re2/re2.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace errgotrace::literals;

namespace errgotrace {
    namespace detail {

        static std::unique_ptr<re2::RE2> compile_pattern(std::string_view pattern, std::string_view what) {
            re2::RE2::Options options{};
            options.set_log_errors(false);
            auto compiled = std::make_unique<re2::RE2>(re2::StringPiece{pattern.data(), pattern.size()}, options);
            if (!compiled->ok()) {
                throw config_error{"error in {} regex ({})"_format(what, compiled->error())};
            }
            return compiled;
        }

    }  // namespace detail

    function_filter::function_filter() : function_filter{"."sv, ""sv, false} {}

    function_filter::function_filter(std::string_view include, std::string_view exclude, bool exported_only)
            : include_{detail::compile_pattern(include, "filter"sv)}, exported_only_{exported_only} {
        if (!exclude.empty()) {
            exclude_ = detail::compile_pattern(exclude, "exclude"sv);
        }
    }

    function_filter::~function_filter() = default;
    function_filter::function_filter(function_filter&&) noexcept = default;
    function_filter& function_filter::operator=(function_filter&&) noexcept = default;

    bool function_filter::accepts(std::string_view qualified_name, std::string_view identifier) const {
        re2::StringPiece subject{qualified_name.data(), qualified_name.size()};
        if (!re2::RE2::PartialMatch(subject, *include_)) {
            return false;
        }
        if (exclude_ && re2::RE2::PartialMatch(subject, *exclude_)) {
            return false;
        }
        return !exported_only_ || syntax::is_exported(identifier);
    }

    std::string synthetic_receiver_prefix(std::string_view receiver_type) {
        std::string prefix{};
        prefix.reserve(receiver_type.size() + 4U);
        for (auto c : receiver_type) {
            switch (c) {
                case '*':
                case '(':
                case ')':
                case ' ':
                case '\t':
                case '\n':
                    break;
                case '[':
                    prefix += "_o";
                    break;
                case ']':
                    prefix += "_c";
                    break;
                case ',':
                    prefix += '_';
                    break;
                default:
                    prefix += c;
            }
        }
        return prefix;
    }

    std::string qualified_function_name(
            std::string_view package, const syntax::func_decl& decl, std::string_view source) {
        std::string name{package};
        if (decl.receiver && !decl.receiver->fields.empty()) {
            name += '.';
            name += decl.receiver->fields.front().type.slice(source);
        }
        name += '.';
        name += decl.name.name;
        return name;
    }

    std::optional<function_signature> extract_signature(
            const syntax::func_decl& decl,
            std::string_view package,
            std::string_view source,
            const function_filter& filter) {
        if (!decl.body) {
            return std::nullopt;
        }
        if (!decl.results || decl.results->slot_count() == 0U) {
            return std::nullopt;
        }

        function_signature sig{};
        sig.qualified_name = qualified_function_name(package, decl, source);
        if (!filter.accepts(sig.qualified_name, decl.name.name)) {
            return std::nullopt;
        }

        sig.name = decl.name.name;
        sig.working_name = decl.name.name;

        if (decl.receiver) {
            const auto& recv = decl.receiver->fields.front();
            sig.receiver_type = std::string{recv.type.slice(source)};
            if (!recv.names.empty() && recv.names.front().name != "_") {
                sig.receiver_text = std::string{decl.receiver->span.slice(source)};
                sig.receiver_name = recv.names.front().name;
            }
            else {
                if (sig.receiver_type.find('[') != std::string::npos) {
                    debug_log("skipping ", sig.qualified_name, ": unnamed receiver with type arguments");
                    return std::nullopt;
                }
                sig.synthetic_prefix = synthetic_receiver_prefix(sig.receiver_type);
                sig.working_name = sig.synthetic_prefix + "_" + sig.name;
            }
        }

        if (decl.type_params) {
            sig.type_params_text = std::string{decl.type_params->span.slice(source)};
            for (const auto& f : decl.type_params->fields) {
                for (const auto& n : f.names) {
                    sig.type_param_names.push_back(n.name);
                }
            }
        }

        for (const auto& f : decl.params.fields) {
            for (const auto& n : f.names) {
                if (n.name == "_") {
                    continue;
                }
                sig.params.push_back(parameter{
                        .name = n.name, .type_text = std::string{f.type.slice(source)}, .variadic = f.variadic});
            }
        }

        sig.result_count = decl.results->slot_count();
        sig.results_text = std::string{decl.results->span.slice(source)};
        sig.insert_offset = decl.body->begin + 1U;
        return sig;
    }

    std::vector<function_signature> extract_signatures(
            const syntax::source_file& file, std::string_view source, const function_filter& filter) {
        std::vector<function_signature> signatures{};
        for (const auto& decl : file.functions) {
            if (auto sig = extract_signature(decl, file.package_name.name, source, filter)) {
                signatures.push_back(std::move(*sig));
            }
        }
        return signatures;
    }

}  // namespace errgotrace
