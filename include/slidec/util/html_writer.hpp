#ifndef SLIDEC_HTML_WRITER_HPP
#define SLIDEC_HTML_WRITER_HPP

#include <cstddef>
#include <string_view>

#include "slidec/fwd.hpp"

namespace slidec {

enum struct Attribute_Style : Default_Underlying {
    /// @brief Always use double quotes, like `id="name" class="a b" hidden=""`.
    always_double,
    /// @brief Use double quotes when needed, like `id=name class="a b" hidden`.
    double_if_needed,
};

struct Attribute_Writer;

/// @brief Writes well-formed HTML to a `Text_Sink`.
///
/// Tag and attribute names are checked with assertions,
/// and the writer keeps track of how many tags are open,
/// but it does not remember which ones.
/// For every `open_tag(name)` or `open_tag_with_attributes(name)` (other than an empty tag),
/// there must be a matching `close_tag(name)`.
struct HTML_Writer {
private:
    Text_Sink& m_out;
    std::size_t m_depth = 0;
    bool m_in_attributes = false;

    friend Attribute_Writer;

public:
    [[nodiscard]]
    explicit HTML_Writer(Text_Sink& out)
        : m_out { out }
    {
    }

    HTML_Writer(const HTML_Writer&) = delete;
    HTML_Writer& operator=(const HTML_Writer&) = delete;

    /// @brief Returns `true` if every opened tag has been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Writes a tag like `<br/>`.
    HTML_Writer& write_self_closing_tag(std::u8string_view name);

    /// @brief Writes an opening tag like `<ul>`.
    HTML_Writer& open_tag(std::u8string_view name);

    /// @brief Writes an incomplete opening tag like `<img`.
    /// The returned writer is used to append attributes,
    /// and `end()` or `end_empty()` has to be called on it to complete the tag.
    [[nodiscard]]
    Attribute_Writer open_tag_with_attributes(std::u8string_view name);

    /// @brief Writes a closing tag like `</ul>`.
    HTML_Writer& close_tag(std::u8string_view name);

    /// @brief Writes text between tags, with `&`, `<`, and `>` replaced by entities.
    HTML_Writer& write_inner_text(std::u8string_view text);

    /// @brief Writes `html` unchanged.
    HTML_Writer& write_inner_html(std::u8string_view html);
    HTML_Writer& write_inner_html(char8_t c);
};

/// @brief Appends attributes to a tag opened by `HTML_Writer::open_tag_with_attributes`.
struct Attribute_Writer {
private:
    HTML_Writer& m_writer;
    // If the last attribute value was written without quotes,
    // a following `/>` would become part of that value, as in `<img src=a.png/>`.
    bool m_unsafe_slash = false;

public:
    [[nodiscard]]
    explicit Attribute_Writer(HTML_Writer& writer);

    Attribute_Writer(const Attribute_Writer&) = delete;
    Attribute_Writer& operator=(const Attribute_Writer&) = delete;

    /// @brief `end()` or `end_empty()` shall have been called.
    ~Attribute_Writer() noexcept(false);

    /// @brief Writes an attribute like `class=number`.
    /// An empty `value` writes `key` on its own,
    /// and values that cannot appear unquoted in HTML are quoted and escaped.
    Attribute_Writer& write_attribute(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style = Attribute_Style::double_if_needed
    );

    /// @brief Like `write_attribute`, but percent-encodes characters that are never valid in URLs.
    Attribute_Writer& write_url_attribute(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style = Attribute_Style::double_if_needed
    );

    Attribute_Writer& write_integer_attribute(std::u8string_view key, std::size_t value);

    Attribute_Writer& write_empty_attribute(std::u8string_view key);

    Attribute_Writer&
    write_class(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_attribute(u8"class", value, style);
    }

    Attribute_Writer&
    write_id(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_attribute(u8"id", value, style);
    }

    Attribute_Writer&
    write_href(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_url_attribute(u8"href", value, style);
    }

    Attribute_Writer&
    write_src(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_url_attribute(u8"src", value, style);
    }

    /// @brief Writes `>`, completing the opening tag.
    Attribute_Writer& end();

    /// @brief Writes `/>`, completing an empty tag which is not closed later.
    Attribute_Writer& end_empty();

private:
    void write_value(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style,
        bool is_url
    );
};

} // namespace slidec

#endif
