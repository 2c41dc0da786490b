#ifndef SLIDEC_HTML_HPP
#define SLIDEC_HTML_HPP

#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

/// @brief Returns the HTML entity which stands for `c`.
/// Only `&`, `<`, `>`, `'`, and `"` are supported.
[[nodiscard]]
constexpr std::u8string_view html_entity_of(char8_t c)
{
    switch (c) {
    case u8'&': return u8"&amp;";
    case u8'<': return u8"&lt;";
    case u8'>': return u8"&gt;";
    case u8'\'': return u8"&apos;";
    case u8'"': return u8"&quot;";
    default: SLIDEC_ASSERT_UNREACHABLE(u8"No entity for this character.");
    }
}

// https://en.wikipedia.org/wiki/Percent-encoding
inline constexpr auto url_reserved_set = to_charset256(u8"!#$&'()*+,/:;=?@[]");

// A percent sign is assumed to begin an existing percent-encoding.
inline constexpr auto url_unreserved_set = is_ascii_alphanumeric_set | to_charset256(u8"-_~.%");

inline constexpr auto url_always_encoded_set = ~(url_unreserved_set | url_reserved_set);

/// @brief Returns `true` if `c` has to be percent-encoded wherever it appears in a URL,
/// such as whitespace, control characters, or double quotes.
[[nodiscard]]
constexpr bool is_url_always_encoded(char8_t c) noexcept
{
    return url_always_encoded_set.contains(c);
}

/// @brief Writes `text` to `out`,
/// replacing every code unit in `charset` with its entity (see `html_entity_of`).
void write_html_escaped(Text_Sink& out, std::u8string_view text, std::u8string_view charset);

/// @brief Writes `url` to `out`,
/// percent-encoding the ASCII code units for which `is_url_always_encoded` is `true`.
/// If `in_quotes` is `true`, `&` is also encoded,
/// so that the result can be placed inside a quoted attribute value.
/// Non-ASCII code units are written unchanged.
void write_url_encoded(Text_Sink& out, std::u8string_view url, bool in_quotes);

} // namespace slidec

#endif
