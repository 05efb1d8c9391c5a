#include "utils.hpp"

namespace errgotrace::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }

        std::optional<int> parse(std::vector<std::string> args, run_config& cfg) {
            auto argv = to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts run options", "[002][cli]") {
        run_config cfg{};
        auto result = detail::parse(
                {"errgotrace",
                 "-w",
                 "--exported",
                 "--filter",
                 "^store\\.",
                 "--exclude",
                 "Close$",
                 "--import-path",
                 "example.com/trace",
                 "--verbose",
                 "a.go",
                 "pkg/b.go"},
                cfg);

        CHECK(!result);
        CHECK(cfg.write_files);
        CHECK(cfg.exported_only);
        CHECK(cfg.verbose);
        CHECK_FALSE(cfg.reverse);
        CHECK_FALSE(cfg.list);
        CHECK(cfg.filter == "^store\\.");
        CHECK(cfg.exclude == "Close$");
        CHECK(cfg.import_path == "example.com/trace");
        REQUIRE(cfg.files.size() == 2U);
        CHECK(cfg.files[0] == std::filesystem::path{"a.go"});
        CHECK(cfg.files[1] == std::filesystem::path{"pkg/b.go"});
    }

    TEST_CASE("002: parse_cli short flags and list output", "[002][cli]") {
        run_config cfg{};
        CHECK(!detail::parse({"errgotrace", "-r", "-w", "main.go"}, cfg));
        CHECK(cfg.reverse);
        CHECK(cfg.write_files);

        run_config list_cfg{};
        CHECK(!detail::parse({"errgotrace", "--list", "--output", "JSON", "main.go"}, list_cfg));
        CHECK(list_cfg.list);
        CHECK(list_cfg.output == output_mode::json);
    }

    TEST_CASE("002: parse_cli rejects invalid combinations", "[002][cli]") {
        run_config cfg{};
        auto reverse_list = detail::parse({"errgotrace", "--reverse", "--list", "a.go"}, cfg);
        REQUIRE(reverse_list);
        CHECK(*reverse_list == 2);

        run_config bad_output{};
        auto result = detail::parse({"errgotrace", "--output", "yaml", "a.go"}, bad_output);
        REQUIRE(result);
        CHECK(*result == 2);

        run_config unknown{};
        auto unknown_result = detail::parse({"errgotrace", "--bogus", "a.go"}, unknown);
        REQUIRE(unknown_result);
        CHECK(*unknown_result != 0);
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        run_config no_files{};
        auto usage = detail::parse({"errgotrace"}, no_files);
        REQUIRE(usage);
        CHECK(*usage == 1);

        run_config version{};
        auto version_result = detail::parse({"errgotrace", "--version"}, version);
        REQUIRE(version_result);
        CHECK(*version_result == 0);

        run_config print{};
        auto print_result = detail::parse({"errgotrace", "--print-config"}, print);
        REQUIRE(print_result);
        CHECK(*print_result == 0);
        CHECK(print.print_config);
    }
}  // namespace errgotrace::test
