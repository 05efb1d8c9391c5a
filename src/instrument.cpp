#include "errgotrace/instrument.hpp"

#include "errgotrace/edit.hpp"
#include "errgotrace/format.hpp"
#include "errgotrace/utils.hpp"

#include <algorithm>

using namespace errgotrace::literals;

namespace errgotrace {
    namespace detail {

        static syntax::source_file parse_canonical(std::string_view canonical) {
            try {
                return syntax::parse_source(canonical);
            }
            catch (const parse_error& e) {
                throw source_error{failure_kind::parse, "parse error ({})"_format(e.what())};
            }
        }

    }  // namespace detail

    std::string canonicalize(std::string_view source) {
        try {
            return syntax::format_source(source);
        }
        catch (const parse_error& e) {
            throw source_error{failure_kind::parse, "formatting error ({})"_format(e.what())};
        }
    }

    bool is_processed(const syntax::source_file& file) {
        return std::ranges::any_of(
                file.imports, [](const auto& spec) { return spec.alias && spec.alias->name == import_alias; });
    }

    std::string annotate_source(std::string_view source, const instrument_options& options) {
        auto canonical = canonicalize(source);
        auto file = detail::parse_canonical(canonical);
        if (is_processed(file)) {
            throw source_error{failure_kind::already_processed, "already processed"};
        }

        auto signatures = extract_signatures(file, canonical, options.filter);
        debug_log("package ", file.package_name.name, ": ", signatures.size(), " function(s) to instrument");

        edit_list edits{};
        edits.add(file.package_line_end, render_import_block(options.import_path));
        for (const auto& sig : signatures) {
            edits.add(sig.insert_offset, render_function_block(sig));
        }

        auto merged = edits.apply(canonical);
        merged += render_setup_block();

        try {
            return syntax::format_source(merged);
        }
        catch (const parse_error& e) {
            throw source_error{failure_kind::format, "formatting error in generated code ({})"_format(e.what())};
        }
    }

    std::vector<function_signature> collect_signatures(std::string_view source, const function_filter& filter) {
        auto canonical = canonicalize(source);
        auto file = detail::parse_canonical(canonical);
        if (is_processed(file)) {
            throw source_error{failure_kind::already_processed, "already processed"};
        }
        return extract_signatures(file, canonical, filter);
    }

    std::string reverse_source(std::string_view source) {
        enum class strip_state { normal, in_block, after_block };

        auto state = strip_state::normal;
        size_t block_line = 0U;
        std::vector<std::string> kept{};

        auto lines = utils::split_lines(source);
        for (size_t index = 0U; index < lines.size(); ++index) {
            auto trimmed = utils::trim_ascii(lines[index]);

            if (state == strip_state::in_block) {
                if (trimmed == end_marker) {
                    state = strip_state::after_block;
                }
                continue;
            }
            if (state == strip_state::after_block) {
                state = strip_state::normal;
                if (trimmed.empty()) {
                    continue;
                }
            }
            if (trimmed == begin_marker) {
                state = strip_state::in_block;
                block_line = index + 1U;
                continue;
            }
            kept.emplace_back(lines[index]);
        }

        if (state == strip_state::in_block) {
            throw source_error{failure_kind::marker, "unterminated marker block starting at line {}"_format(block_line)};
        }

        auto out = utils::join_with_separator(kept, "\n"sv);
        while (!out.empty() && out.back() == '\n') {
            out.pop_back();
        }
        if (!out.empty()) {
            out.push_back('\n');
        }
        return out;
    }

}  // namespace errgotrace
