#include "errgotrace/cli.hpp"

#include "errgotrace/format.hpp"
#include "errgotrace/instrument.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace errgotrace::literals;

namespace errgotrace::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr std::string_view version_string{"errgotrace 0.1.0"};

        static constexpr std::string_view usage_footer{
                "examples:\n"
                "  errgotrace main.go                     print instrumented main.go to stdout\n"
                "  errgotrace -w ./pkg/*.go               instrument files in place\n"
                "  errgotrace -w --exported --filter '^store\\.' store/*.go\n"
                "  errgotrace -w --exclude 'Close$' db.go  instrument all but functions ending in Close\n"
                "  errgotrace --list --output json main.go report functions that would be instrumented\n"
                "  errgotrace -w -r ./pkg/*.go            remove instrumentation"};

        static void print_config(const run_config& cfg, std::ostream& os) {
            os << "files=" << cfg.files.size() << '\n';
            os << "write=" << (cfg.write_files ? "true" : "false") << '\n';
            os << "reverse=" << (cfg.reverse ? "true" : "false") << '\n';
            os << "list=" << (cfg.list ? "true" : "false") << '\n';
            os << "filter=" << cfg.filter << '\n';
            os << "exclude=" << (cfg.exclude.empty() ? "<none>" : cfg.exclude) << '\n';
            os << "exported=" << (cfg.exported_only ? "true" : "false") << '\n';
            os << "import_path=" << cfg.import_path << '\n';
            os << "output={}\n"_format(cfg.output);
        }

        static fs::path temporary_sibling(const fs::path& path) {
            auto name = "." + path.filename().string() + ".errgotrace.tmp";
            return path.has_parent_path() ? path.parent_path() / name : fs::path{name};
        }

        static void emit(const fs::path& path, std::string_view text, const run_config& cfg, std::ostream& out) {
            if (cfg.write_files) {
                write_source_file(path, text);
                return;
            }
            out << text;
        }

        static void process_file(
                const fs::path& path,
                const run_config& cfg,
                const instrument_options& options,
                std::vector<listed_file>& listing,
                std::ostream& out,
                std::ostream& err) {
            auto source = read_source_file(path);

            if (cfg.list) {
                listing.push_back(make_listing(path, collect_signatures(source, options.filter)));
                return;
            }
            if (cfg.reverse) {
                if (cfg.verbose) {
                    err << "reversing " << path.string() << '\n';
                }
                emit(path, reverse_source(source), cfg, out);
                return;
            }
            if (cfg.verbose) {
                err << "annotating " << path.string() << '\n';
            }
            emit(path, annotate_source(source, options), cfg, out);
        }

    }  // namespace detail

    std::string read_source_file(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw source_error{failure_kind::io, "failed to open {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw source_error{failure_kind::io, "failed to read {}"_format(path.string())};
        }
        return ss.str();
    }

    void write_source_file(const std::filesystem::path& path, std::string_view text) {
        namespace fs = std::filesystem;

        // A symbolic link is kept and its target rewritten.
        auto target = path;
        if (std::error_code link_ec{}; fs::is_symlink(path, link_ec)) {
            target = fs::canonical(path, link_ec);
            if (link_ec) {
                throw source_error{
                        failure_kind::io, "failed to write {} ({})"_format(path.string(), link_ec.message())};
            }
        }

        auto tmp = detail::temporary_sibling(target);
        {
            std::ofstream out{tmp, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw source_error{failure_kind::io, "failed to write {}"_format(path.string())};
            }
            out << text;
            out.flush();
            if (!out) {
                std::error_code ignored{};
                fs::remove(tmp, ignored);
                throw source_error{failure_kind::io, "failed to write {}"_format(path.string())};
            }
        }

        std::error_code ec{};
        if (auto status = fs::status(target, ec); !ec && fs::exists(status)) {
            fs::permissions(tmp, status.permissions(), fs::perm_options::replace, ec);
        }
        if (!ec) {
            fs::rename(tmp, target, ec);
        }
        if (ec) {
            std::error_code ignored{};
            fs::remove(tmp, ignored);
            throw source_error{failure_kind::io, "failed to write {} ({})"_format(path.string(), ec.message())};
        }
    }

    listed_file make_listing(const std::filesystem::path& path, const std::vector<function_signature>& signatures) {
        listed_file listing{};
        listing.file = path.string();
        for (const auto& sig : signatures) {
            listing.functions.push_back(listed_function{
                    .name = sig.name,
                    .qualified_name = sig.qualified_name,
                    .receiver = sig.receiver_type,
                    .results = sig.result_count});
        }
        return listing;
    }

    void render_listing(const std::vector<listed_file>& listing, output_mode mode, std::ostream& os) {
        if (mode == output_mode::json) {
            std::string json{};
            auto ec = glz::write_json(listing, json);
            if (ec) {
                throw std::runtime_error("failed to serialize function listing");
            }
            os << json << '\n';
            return;
        }

        size_t width = 0U;
        for (const auto& file : listing) {
            for (const auto& fn : file.functions) {
                width = std::max(width, fn.qualified_name.size());
            }
        }
        for (const auto& file : listing) {
            os << file.file << ":\n";
            if (file.functions.empty()) {
                os << "  (no eligible functions)\n";
                continue;
            }
            for (const auto& fn : file.functions) {
                os << "  {:<{}}  {} result{}\n"_format(
                        fn.qualified_name, width, fn.results, fn.results == 1U ? "" : "s");
            }
        }
    }

    int run(const run_config& cfg, std::ostream& out, std::ostream& err) {
        instrument_options options{};
        options.import_path = cfg.import_path;
        try {
            options.filter = function_filter{cfg.filter, cfg.exclude, cfg.exported_only};
        }
        catch (const config_error& e) {
            err << e.what() << '\n';
            return 1;
        }

        std::vector<listed_file> listing{};
        size_t failed = 0U;
        for (const auto& path : cfg.files) {
            try {
                detail::process_file(path, cfg, options, listing, out, err);
            }
            catch (const source_error& e) {
                debug_log("{} failure for {}"_format(e.kind(), path.string()));
                err << path.string() << ": " << e.what() << '\n';
                ++failed;
            }
            catch (const std::exception& e) {
                debug_log("internal failure for ", path.string());
                err << path.string() << ": internal error (" << e.what() << ")\n";
                ++failed;
            }
        }

        if (cfg.list) {
            render_listing(listing, cfg.output, out);
        }
        return failed == 0U ? 0 : 1;
    }

    int run(const run_config& cfg) {
        return run(cfg, std::cout, std::cerr);
    }

    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg) {
        CLI::App app{
                "errgotrace: wraps error-returning Go functions so that every return value passes through an "
                "inspection hook",
                "errgotrace"};
        app.footer(std::string{detail::usage_footer});

        bool show_version = false;
        std::vector<std::string> files_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};

        app.add_option("files", files_arg, "Go source files to process");
        app.add_flag("-w,--write", cfg.write_files, "Write results back to the source files instead of stdout");
        app.add_flag("-r,--reverse", cfg.reverse, "Remove previously injected code");
        app.add_flag("--exported", cfg.exported_only, "Only instrument exported functions");
        app.add_option("--filter", cfg.filter, "Only instrument functions whose qualified name matches this regex")
                ->capture_default_str();
        app.add_option("--exclude", cfg.exclude, "Do not instrument functions whose qualified name matches this regex");
        app.add_option("--import-path", cfg.import_path, "Package providing Setup and InspectReturnValues")
                ->capture_default_str();
        app.add_flag("--list", cfg.list, "List functions that would be instrumented and exit");
        app.add_option("--output", output_arg, "Output mode for --list: table|json");
        app.add_flag("--verbose", cfg.verbose, "Print per-file progress to stderr");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--version", show_version, "Print version and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.reverse && cfg.list) {
            std::cerr << "--reverse and --list are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        cfg.files.assign(files_arg.begin(), files_arg.end());

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.files.empty()) {
            std::cout << app.help();
            return std::optional<int>{1};
        }

        return std::nullopt;
    }

}  // namespace errgotrace::cli
