#ifndef SLIDEC_STRINGS_HPP
#define SLIDEC_STRINGS_HPP

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"

namespace slidec {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view str)
{
    return { reinterpret_cast<const char8_t*>(str.data()), str.size() };
}

/// @brief Returns `true` if `str` is empty or consists only of `is_ascii_blank` characters.
[[nodiscard]]
constexpr bool is_ascii_blank(std::u8string_view str)
{
    return std::ranges::all_of(str, [](char8_t c) { return is_ascii_blank(c); });
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    while (!str.empty() && is_ascii_blank(str.front())) {
        str.remove_prefix(1);
    }
    return str;
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_right(std::u8string_view str)
{
    while (!str.empty() && is_ascii_blank(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank(std::u8string_view str)
{
    return trim_ascii_blank_right(trim_ascii_blank_left(str));
}

// https://html.spec.whatwg.org/dev/custom-elements.html#valid-custom-element-name
[[nodiscard]]
constexpr bool is_html_tag_name(std::u8string_view str)
{
    return !str.empty() && is_ascii_alpha(str[0])
        && std::ranges::all_of(str, [](char8_t c) { return is_html_tag_name_character(c); });
}

// https://html.spec.whatwg.org/dev/syntax.html#syntax-attribute-name
[[nodiscard]]
constexpr bool is_html_attribute_name(std::u8string_view str)
{
    return !str.empty()
        && std::ranges::all_of(str, [](char8_t c) { return is_html_attribute_name_character(c); });
}

/// @brief Returns `true` if `str` can be the value of an attribute without surrounding quotes,
/// like `123` in `id=123`.
/// Non-ASCII code units are always permitted.
// https://html.spec.whatwg.org/dev/syntax.html#unquoted
[[nodiscard]]
constexpr bool is_html_unquoted_attribute_value(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t c) {
        return !is_ascii(c) || is_html_ascii_unquoted_attribute_value_character(c);
    };
    return !str.empty() && std::ranges::all_of(str, predicate);
}

/// @brief Parses `str` as a decimal integer.
/// Unlike `std::from_chars`, the whole string has to be consumed,
/// so `"12px"` is not a valid integer.
template <typename T>
[[nodiscard]]
std::optional<T> from_characters(std::u8string_view str)
{
    T result {};
    const std::string_view chars = as_string_view(str);
    const auto [ptr, ec] = std::from_chars(chars.data(), chars.data() + chars.size(), result);
    if (ec != std::errc {} || ptr != chars.data() + chars.size()) {
        return {};
    }
    return result;
}

/// @brief Appends the decimal representation of `x` to `out`.
template <typename String>
void append_integer(String& out, std::size_t x)
{
    char buffer[24];
    const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), x);
    SLIDEC_DEBUG_ASSERT(result.ec == std::errc {});
    for (const char* p = buffer; p != result.ptr; ++p) {
        out.push_back(char8_t(*p));
    }
}

} // namespace slidec

#endif
