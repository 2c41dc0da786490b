#ifndef SLIDEC_CHARS_HPP
#define SLIDEC_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace slidec {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric_set;
using ulight::is_ascii_punctuation_set;
using ulight::is_html_ascii_unquoted_attribute_value_character;
using ulight::is_html_attribute_name_character;
using ulight::is_html_tag_name_character;
using ulight::is_html_whitespace;
using ulight::detail::to_charset256;

/// @brief Returns true if `c` is a space or horizontal tab.
/// These are the only characters which make up the indentation of a line.
[[nodiscard]]
constexpr bool is_indentation(char8_t c)
{
    return c == u8' ' || c == u8'\t';
}

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs,
/// unlike `is_ascii_whitespace`.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

/// @brief Returns true if `c` is ASCII punctuation, like `.`, `,`, or `(`.
[[nodiscard]]
constexpr bool is_ascii_punctuation(char8_t c)
{
    return is_ascii_punctuation_set.contains(c);
}

} // namespace slidec

#endif
