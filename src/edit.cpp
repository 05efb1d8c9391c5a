#include "errgotrace/edit.hpp"

#include "errgotrace/format.hpp"

#include <stdexcept>

using namespace errgotrace::literals;

namespace errgotrace {

    void edit_list::add(size_t offset, std::string text) {
        if (!edits_.empty() && offset < edits_.back().offset) {
            throw std::logic_error{
                    "edit at offset {} precedes previous edit at offset {}"_format(offset, edits_.back().offset)};
        }
        edits_.push_back(edit{.offset = offset, .text = std::move(text)});
    }

    std::string edit_list::apply(std::string_view source) const {
        size_t extra = 0U;
        for (const auto& e : edits_) {
            if (e.offset > source.size()) {
                throw std::out_of_range{"edit offset {} past end of buffer ({})"_format(e.offset, source.size())};
            }
            extra += e.text.size();
        }

        std::string out{};
        out.reserve(source.size() + extra);
        size_t cursor = 0U;
        for (const auto& e : edits_) {
            out.append(source.substr(cursor, e.offset - cursor));
            out.append(e.text);
            cursor = e.offset;
        }
        out.append(source.substr(cursor));
        return out;
    }

}  // namespace errgotrace
