#include "utils.hpp"

namespace errgotrace::test {
    using namespace std::string_view_literals;

    namespace detail {
        static constexpr std::string_view valid_a{"package a\n\nfunc Open() (int, error) {\n\treturn 0, nil\n}\n"};
        static constexpr std::string_view broken_b{"package b\n\nfunc F( {\n"};
        static constexpr std::string_view valid_c{
                "package c\n\nfunc (s *Store) Close() error {\n\treturn nil\n}\n\nfunc log(msg string) {\n}\n"};
        static constexpr std::string_view one_line_d{"package d; func F() (int, error) { return 0, nil }\n"};
    }  // namespace detail

    TEST_CASE("011: run continues past failing files", "[011][run]") {
        detail::temp_dir temp{"errgotrace_run_continue"};
        auto a = temp.path / "a.go";
        auto b = temp.path / "b.go";
        auto c = temp.path / "c.go";
        detail::write_text_file(a, detail::valid_a);
        detail::write_text_file(b, detail::broken_b);
        detail::write_text_file(c, detail::valid_c);

        run_config cfg{};
        cfg.files = {a, b, c};
        cfg.write_files = true;

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run(cfg, out, err) == 1);
        CHECK(out.str().empty());

        auto diagnostics = err.str();
        CHECK(diagnostics.find(b.string() + ": formatting error (") != std::string::npos);
        CHECK(detail::count_occurrences(diagnostics, "\n"sv) == 1U);

        CHECK(detail::read_text_file(a).find("func __Open() (int, error) {"sv) != std::string::npos);
        CHECK(detail::read_text_file(b) == detail::broken_b);
        CHECK(detail::read_text_file(c).find("func (s *Store) __Close() error {"sv) != std::string::npos);

        std::ostringstream again_out{};
        std::ostringstream again_err{};
        cfg.files = {a};
        auto before = detail::read_text_file(a);
        CHECK(cli::run(cfg, again_out, again_err) == 1);
        CHECK(again_err.str() == a.string() + ": already processed\n");
        CHECK(detail::read_text_file(a) == before);
    }

    TEST_CASE("011: run prints to stdout without -w", "[011][run]") {
        detail::temp_dir temp{"errgotrace_run_stdout"};
        auto a = temp.path / "a.go";
        detail::write_text_file(a, detail::valid_a);

        run_config cfg{};
        cfg.files = {a};

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run(cfg, out, err) == 0);
        CHECK(err.str().empty());
        CHECK(out.str() == annotate_source(detail::valid_a, instrument_options{}));
        CHECK(detail::read_text_file(a) == detail::valid_a);
    }

    TEST_CASE("011: run writes atomically and reverses", "[011][run][reverse]") {
        namespace fs = std::filesystem;

        detail::temp_dir temp{"errgotrace_run_reverse"};
        auto c = temp.path / "c.go";
        detail::write_text_file(c, detail::valid_c);
        fs::permissions(c, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read,
                        fs::perm_options::replace);

        run_config cfg{};
        cfg.files = {c};
        cfg.write_files = true;

        std::ostringstream out{};
        std::ostringstream err{};
        REQUIRE(cli::run(cfg, out, err) == 0);
        CHECK(detail::read_text_file(c) != detail::valid_c);
        CHECK((fs::status(c).permissions() & fs::perms::all) ==
              (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));

        size_t entries = 0U;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator{temp.path}) {
            ++entries;
        }
        CHECK(entries == 1U);

        cfg.reverse = true;
        REQUIRE(cli::run(cfg, out, err) == 0);
        CHECK(detail::read_text_file(c) == detail::valid_c);
        CHECK(err.str().empty());
    }

    TEST_CASE("011: run reports configuration and io errors", "[011][run][errors]") {
        detail::temp_dir temp{"errgotrace_run_errors"};
        auto a = temp.path / "a.go";
        detail::write_text_file(a, detail::valid_a);

        run_config bad_filter{};
        bad_filter.files = {a};
        bad_filter.write_files = true;
        bad_filter.filter = "(";

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run(bad_filter, out, err) == 1);
        CHECK(err.str().starts_with("error in filter regex ("));
        CHECK(detail::read_text_file(a) == detail::valid_a);

        run_config missing{};
        missing.files = {temp.path / "missing.go", a};
        std::ostringstream missing_out{};
        std::ostringstream missing_err{};
        CHECK(cli::run(missing, missing_out, missing_err) == 1);
        CHECK(missing_err.str().find("missing.go: failed to open"sv) != std::string::npos);
        CHECK_FALSE(missing_out.str().empty());
    }

    TEST_CASE("011: run lists eligible functions", "[011][run][list]") {
        detail::temp_dir temp{"errgotrace_run_list"};
        auto a = temp.path / "a.go";
        auto c = temp.path / "c.go";
        detail::write_text_file(a, detail::valid_a);
        detail::write_text_file(c, detail::valid_c);

        run_config cfg{};
        cfg.files = {a, c};
        cfg.list = true;
        cfg.output = output_mode::json;

        std::ostringstream out{};
        std::ostringstream err{};
        REQUIRE(cli::run(cfg, out, err) == 0);

        std::vector<cli::listed_file> listing{};
        auto ec = glz::read_json(listing, out.str());
        REQUIRE(!ec);
        REQUIRE(listing.size() == 2U);
        CHECK(listing[0].file == a.string());
        REQUIRE(listing[0].functions.size() == 1U);
        CHECK(listing[0].functions[0].qualified_name == "a.Open");
        CHECK(listing[0].functions[0].results == 2U);
        REQUIRE(listing[1].functions.size() == 1U);
        CHECK(listing[1].functions[0].name == "Close");
        CHECK(listing[1].functions[0].receiver == "*Store");
        CHECK(detail::read_text_file(a) == detail::valid_a);

        std::ostringstream table{};
        cli::render_listing(listing, output_mode::table, table);
        CHECK(table.str() == a.string() + ":\n  a.Open          2 results\n" + c.string() +
                                     ":\n  c.*Store.Close  1 result\n");
    }

    TEST_CASE("011: run instruments a file with code on the package line", "[011][run]") {
        detail::temp_dir temp{"errgotrace_run_one_line"};
        auto d = temp.path / "d.go";
        auto a = temp.path / "a.go";
        detail::write_text_file(d, detail::one_line_d);
        detail::write_text_file(a, detail::valid_a);

        run_config cfg{};
        cfg.files = {d, a};
        cfg.write_files = true;

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run(cfg, out, err) == 0);
        CHECK(err.str().empty());
        CHECK(detail::read_text_file(d).find("func __F() (int, error) {"sv) != std::string::npos);
        CHECK(detail::read_text_file(a).find("func __Open() (int, error) {"sv) != std::string::npos);

        cfg.reverse = true;
        CHECK(cli::run(cfg, out, err) == 0);
        CHECK(detail::read_text_file(d) == canonicalize(detail::one_line_d));
        CHECK(detail::read_text_file(a) == detail::valid_a);
    }

    TEST_CASE("011: run writes through symbolic links", "[011][run]") {
        namespace fs = std::filesystem;

        detail::temp_dir temp{"errgotrace_run_symlink"};
        auto target = temp.path / "a.go";
        auto link = temp.path / "link.go";
        detail::write_text_file(target, detail::valid_a);
        fs::create_symlink(target.filename(), link);

        run_config cfg{};
        cfg.files = {link};
        cfg.write_files = true;

        std::ostringstream out{};
        std::ostringstream err{};
        REQUIRE(cli::run(cfg, out, err) == 0);
        CHECK(fs::is_symlink(link));
        CHECK(fs::read_symlink(link) == target.filename());
        CHECK(detail::read_text_file(target).find("func __Open() (int, error) {"sv) != std::string::npos);

        size_t entries = 0U;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator{temp.path}) {
            ++entries;
        }
        CHECK(entries == 2U);
    }

    TEST_CASE("011: run refuses to list already processed files", "[011][run][list]") {
        detail::temp_dir temp{"errgotrace_run_list_processed"};
        auto a = temp.path / "a.go";
        auto c = temp.path / "c.go";
        detail::write_text_file(a, annotate_source(detail::valid_a, instrument_options{}));
        detail::write_text_file(c, detail::valid_c);

        run_config cfg{};
        cfg.files = {a, c};
        cfg.list = true;

        std::ostringstream out{};
        std::ostringstream err{};
        CHECK(cli::run(cfg, out, err) == 1);
        CHECK(err.str() == a.string() + ": already processed\n");
        CHECK(out.str() == c.string() + ":\n  c.*Store.Close  1 result\n");
    }
}  // namespace errgotrace::test
