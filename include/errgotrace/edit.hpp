#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace errgotrace {

    struct edit {
        size_t offset{};
        std::string text{};
    };

    // Insertions into a buffer, recorded in non-decreasing offset order.
    // Insertions sharing an offset are applied in the order they were added.
    class edit_list {
      public:
        // Throws std::logic_error if `offset` precedes the previous insertion.
        void add(size_t offset, std::string text);

        // Copies `source` once, splicing every insertion at its offset.
        // Throws std::out_of_range if an offset lies past the end of `source`.
        std::string apply(std::string_view source) const;

        size_t size() const noexcept { return edits_.size(); }
        bool empty() const noexcept { return edits_.empty(); }
        const std::vector<edit>& edits() const noexcept { return edits_; }

      private:
        std::vector<edit> edits_{};
    };

}  // namespace errgotrace
