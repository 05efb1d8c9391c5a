#include "utils.hpp"

namespace errgotrace::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output mode parsing", "[001][config]") {
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("table"sv, mode));
        CHECK(mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));
        CHECK(mode == output_mode::table);
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(output_mode::table) == "table"sv);
        CHECK(to_string(output_mode::json) == "json"sv);

        CHECK(to_string(failure_kind::io) == "io"sv);
        CHECK(to_string(failure_kind::parse) == "parse"sv);
        CHECK(to_string(failure_kind::already_processed) == "already_processed"sv);
        CHECK(to_string(failure_kind::format) == "format"sv);
        CHECK(to_string(failure_kind::marker) == "marker"sv);

        CHECK(std::format("{}", failure_kind::marker) == "marker");
        CHECK(std::format("[{:>6}]", output_mode::json) == "[  json]");
    }

    TEST_CASE("001: run config defaults", "[001][config]") {
        run_config cfg{};
        CHECK(cfg.files.empty());
        CHECK_FALSE(cfg.write_files);
        CHECK_FALSE(cfg.reverse);
        CHECK_FALSE(cfg.list);
        CHECK(cfg.filter == ".");
        CHECK(cfg.exclude.empty());
        CHECK_FALSE(cfg.exported_only);
        CHECK(cfg.import_path == "github.com/gellweiler/errgotrace/log");
        CHECK(cfg.output == output_mode::table);
    }

    TEST_CASE("001: error types carry kind and position", "[001][config][errors]") {
        parse_error perr{3U, 14U, "unexpected '}'"};
        CHECK(perr.line() == 3U);
        CHECK(perr.column() == 14U);
        CHECK(std::string_view{perr.what()} == "3:14: unexpected '}'"sv);

        source_error serr{failure_kind::already_processed, "already processed"};
        CHECK(serr.kind() == failure_kind::already_processed);
        CHECK(std::string_view{serr.what()} == "already processed"sv);
    }
}  // namespace errgotrace::test
