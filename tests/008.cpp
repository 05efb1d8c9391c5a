#include "utils.hpp"

#include <stdexcept>

namespace errgotrace::test {
    using namespace std::string_view_literals;

    TEST_CASE("008: edit_list splices insertions in order", "[008][edit]") {
        edit_list edits{};
        CHECK(edits.empty());

        edits.add(0U, "<");
        edits.add(3U, "|");
        edits.add(3U, "!");
        edits.add(5U, ">");
        CHECK(edits.size() == 4U);
        CHECK(edits.apply("abcde"sv) == "<abc|!de>");
        CHECK(edits.edits()[1].offset == 3U);

        edit_list none{};
        CHECK(none.apply("unchanged"sv) == "unchanged");
    }

    TEST_CASE("008: edit_list rejects misordered and out of range edits", "[008][edit][errors]") {
        edit_list edits{};
        edits.add(4U, "x");
        CHECK_THROWS_AS(edits.add(2U, "y"), std::logic_error);

        edit_list past_end{};
        past_end.add(10U, "x");
        CHECK_THROWS_AS(past_end.apply("abc"sv), std::out_of_range);
    }
}  // namespace errgotrace::test
