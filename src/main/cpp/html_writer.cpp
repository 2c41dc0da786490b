#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"
#include "slidec/util/html.hpp"
#include "slidec/util/html_writer.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/text_sink.hpp"

namespace slidec {

void write_html_escaped(Text_Sink& out, std::u8string_view text, std::u8string_view charset)
{
    while (!text.empty()) {
        const std::size_t pos = text.find_first_of(charset);
        if (pos == std::u8string_view::npos) {
            out.write(text);
            break;
        }
        if (pos != 0) {
            out.write(text.substr(0, pos));
        }
        out.write(html_entity_of(text[pos]));
        text.remove_prefix(pos + 1);
    }
}

void write_url_encoded(Text_Sink& out, std::u8string_view url, bool in_quotes)
{
    constexpr std::u8string_view hex_digits = u8"0123456789ABCDEF";

    for (const char8_t c : url) {
        const bool encode = is_ascii(c) && (is_url_always_encoded(c) || (in_quotes && c == u8'&'));
        if (!encode) {
            out.write(c);
            continue;
        }
        out.write(u8'%');
        out.write(hex_digits[(c >> 4) & 0xf]);
        out.write(hex_digits[c & 0xf]);
    }
}

HTML_Writer& HTML_Writer::write_self_closing_tag(std::u8string_view name)
{
    SLIDEC_ASSERT(!m_in_attributes);
    SLIDEC_ASSERT(is_html_tag_name(name));

    m_out.write(u8'<');
    m_out.write(name);
    m_out.write(u8"/>");
    return *this;
}

HTML_Writer& HTML_Writer::open_tag(std::u8string_view name)
{
    SLIDEC_ASSERT(!m_in_attributes);
    SLIDEC_ASSERT(is_html_tag_name(name));

    m_out.write(u8'<');
    m_out.write(name);
    m_out.write(u8'>');
    ++m_depth;
    return *this;
}

Attribute_Writer HTML_Writer::open_tag_with_attributes(std::u8string_view name)
{
    SLIDEC_ASSERT(!m_in_attributes);
    SLIDEC_ASSERT(is_html_tag_name(name));

    m_out.write(u8'<');
    m_out.write(name);
    return Attribute_Writer { *this };
}

HTML_Writer& HTML_Writer::close_tag(std::u8string_view name)
{
    SLIDEC_ASSERT(!m_in_attributes);
    SLIDEC_ASSERT(is_html_tag_name(name));
    SLIDEC_ASSERT(m_depth != 0);

    --m_depth;
    m_out.write(u8"</");
    m_out.write(name);
    m_out.write(u8'>');
    return *this;
}

HTML_Writer& HTML_Writer::write_inner_text(std::u8string_view text)
{
    SLIDEC_ASSERT(!m_in_attributes);
    write_html_escaped(m_out, text, u8"&<>");
    return *this;
}

HTML_Writer& HTML_Writer::write_inner_html(std::u8string_view html)
{
    SLIDEC_ASSERT(!m_in_attributes);
    m_out.write(html);
    return *this;
}

HTML_Writer& HTML_Writer::write_inner_html(char8_t c)
{
    SLIDEC_ASSERT(!m_in_attributes);
    m_out.write(c);
    return *this;
}

Attribute_Writer::Attribute_Writer(HTML_Writer& writer)
    : m_writer { writer }
{
    m_writer.m_in_attributes = true;
}

Attribute_Writer::~Attribute_Writer() noexcept(false)
{
    // Otherwise, end() or end_empty() was never called.
    SLIDEC_ASSERT(!m_writer.m_in_attributes);
}

void Attribute_Writer::write_value(
    std::u8string_view key,
    std::u8string_view value,
    Attribute_Style style,
    bool is_url
)
{
    SLIDEC_ASSERT(m_writer.m_in_attributes);
    SLIDEC_ASSERT(is_html_attribute_name(key));

    Text_Sink& out = m_writer.m_out;
    out.write(u8' ');
    out.write(key);

    if (value.empty()) {
        if (style == Attribute_Style::always_double) {
            out.write(u8"=\"\"");
        }
        m_unsafe_slash = false;
        return;
    }

    out.write(u8'=');
    if (style == Attribute_Style::double_if_needed && is_html_unquoted_attribute_value(value)) {
        if (is_url) {
            write_url_encoded(out, value, false);
        }
        else {
            out.write(value);
        }
        m_unsafe_slash = true;
        return;
    }

    out.write(u8'"');
    if (is_url) {
        static_assert(is_url_always_encoded(u8'"'));
        write_url_encoded(out, value, true);
    }
    else {
        write_html_escaped(out, value, u8"&\"");
    }
    out.write(u8'"');
    m_unsafe_slash = false;
}

Attribute_Writer& Attribute_Writer::write_attribute(
    std::u8string_view key,
    std::u8string_view value,
    Attribute_Style style
)
{
    write_value(key, value, style, false);
    return *this;
}

Attribute_Writer& Attribute_Writer::write_url_attribute(
    std::u8string_view key,
    std::u8string_view value,
    Attribute_Style style
)
{
    write_value(key, value, style, true);
    return *this;
}

Attribute_Writer& Attribute_Writer::write_integer_attribute(std::u8string_view key, std::size_t value)
{
    char buffer[24];
    const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    SLIDEC_DEBUG_ASSERT(result.ec == std::errc {});
    return write_attribute(key, as_u8string_view(std::string_view { buffer, result.ptr }));
}

Attribute_Writer& Attribute_Writer::write_empty_attribute(std::u8string_view key)
{
    write_value(key, {}, Attribute_Style::double_if_needed, false);
    return *this;
}

Attribute_Writer& Attribute_Writer::end()
{
    SLIDEC_ASSERT(m_writer.m_in_attributes);

    m_writer.m_out.write(u8'>');
    m_writer.m_in_attributes = false;
    ++m_writer.m_depth;
    return *this;
}

Attribute_Writer& Attribute_Writer::end_empty()
{
    SLIDEC_ASSERT(m_writer.m_in_attributes);

    if (m_unsafe_slash) {
        m_writer.m_out.write(u8' ');
    }
    m_writer.m_out.write(u8"/>");
    m_writer.m_in_attributes = false;
    return *this;
}

} // namespace slidec
