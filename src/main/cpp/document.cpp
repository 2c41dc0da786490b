#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/document.hpp"
#include "slidec/fwd.hpp"

namespace slidec {

#define SLIDEC_NODE_KIND_NAME_CASE(id, type)                                                       \
    case Node_Kind::id: return u8## #id;

std::u8string_view node_kind_name(const Node_Kind kind)
{
    switch (kind) {
    case Node_Kind::section: return u8"section";
        SLIDEC_ELEMENT_KIND_ENUM_DATA(SLIDEC_NODE_KIND_NAME_CASE)
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid node kind.");
}

std::optional<Node_Kind> node_kind_by_name(const std::u8string_view name)
{
    for (std::size_t i = 0; i < node_kind_count; ++i) {
        const auto kind = Node_Kind(i);
        if (node_kind_name(kind) == name) {
            return kind;
        }
    }
    return {};
}

void format_section_number(std::pmr::u8string& out, const std::span<const std::size_t> number)
{
    bool first = true;
    for (const std::size_t n : number) {
        SLIDEC_DEBUG_ASSERT(n != 0);
        if (!first) {
            out.push_back(u8'.');
        }
        append_integer(out, n);
        first = false;
    }
}

} // namespace slidec
