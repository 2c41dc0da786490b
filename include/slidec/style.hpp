#ifndef SLIDEC_STYLE_HPP
#define SLIDEC_STYLE_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "slidec/util/function_ref.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

enum struct Style_Kind : Default_Underlying {
    /// @brief Plain text.
    text,
    /// @brief `*strong*`
    strong,
    /// @brief `_emphasis_`
    emphasis,
    /// @brief `` `code` ``
    code,
    /// @brief `[[url]]` or `[[url][label]]`
    link,
};

[[nodiscard]]
std::u8string_view style_kind_name(Style_Kind kind);

/// @brief A piece of styled text.
struct Style_Fragment {
    Style_Kind kind;
    /// @brief The text to display, with all markup and escapes resolved.
    /// For a link without label, this is the URL.
    std::pmr::u8string text;
    /// @brief For `link`, the target. Otherwise empty.
    std::pmr::u8string url;

    [[nodiscard]]
    friend bool operator==(const Style_Fragment&, const Style_Fragment&)
        = default;
};

/// @brief The result of style processing a raw string.
/// This is deliberately a different type than raw strings,
/// so that text cannot accidentally be processed twice.
using Styled_Text = std::pmr::vector<Style_Fragment>;

/// @brief Receives non-fatal warnings during style processing.
/// `offset` is the position of the offending markup within the raw text, in code units.
using Style_Warning_Consumer
    = Function_Ref<void(std::u8string_view id, std::size_t offset, std::u8string_view message)>;

/// @brief Returns `true` if `c` can be escaped with a backslash in styled text.
[[nodiscard]]
constexpr bool is_style_escapable(char8_t c)
{
    switch (c) {
    case u8'\\':
    case u8'*':
    case u8'_':
    case u8'`':
    case u8'[':
    case u8']': return true;
    default: return false;
    }
}

/// @brief Converts raw text with inline markup into styled fragments,
/// which are appended to `out`.
///
/// Adjacent plain text is merged into a single fragment,
/// so text without any markup results in a single `text` fragment equal to `raw`,
/// and empty text results in no fragments.
///
/// Unmatched markers and unterminated links are reported to `on_warning`,
/// and are kept as literal text.
void apply_style(Styled_Text& out, std::u8string_view raw, Style_Warning_Consumer on_warning);

} // namespace slidec

#endif
