#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/fwd.hpp"
#include "slidec/style.hpp"

namespace slidec {

std::u8string_view style_kind_name(const Style_Kind kind)
{
    using enum Style_Kind;
    switch (kind) {
        SLIDEC_ENUM_STRING_CASE8(text);
        SLIDEC_ENUM_STRING_CASE8(strong);
        SLIDEC_ENUM_STRING_CASE8(emphasis);
        SLIDEC_ENUM_STRING_CASE8(code);
        SLIDEC_ENUM_STRING_CASE8(link);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid style kind.");
}

namespace {

[[nodiscard]]
bool is_boundary(char8_t c)
{
    return is_ascii_blank(c) || is_ascii_punctuation(c);
}

struct [[nodiscard]] Styler {
private:
    Styled_Text& m_out;
    const std::u8string_view m_raw;
    const Style_Warning_Consumer m_on_warning;

    std::size_t m_pos = 0;
    std::pmr::u8string m_text;

public:
    [[nodiscard]]
    Styler(Styled_Text& out, std::u8string_view raw, Style_Warning_Consumer on_warning)
        : m_out { out }
        , m_raw { raw }
        , m_on_warning { on_warning }
        , m_text { out.get_allocator() }
    {
    }

    void operator()()
    {
        while (m_pos < m_raw.size()) {
            const char8_t c = m_raw[m_pos];
            if (c == u8'\\' && m_pos + 1 < m_raw.size() && is_style_escapable(m_raw[m_pos + 1])) {
                m_text += m_raw[m_pos + 1];
                m_pos += 2;
                continue;
            }
            if (c == u8'[' && m_raw.substr(m_pos).starts_with(u8"[[")) {
                if (!try_link()) {
                    m_text += u8"[[";
                    m_pos += 2;
                }
                continue;
            }
            if (c == u8'*' || c == u8'_' || c == u8'`') {
                if (!try_span(c)) {
                    m_text += c;
                    ++m_pos;
                }
                continue;
            }
            m_text += c;
            ++m_pos;
        }
        flush_text();
    }

private:
    void warn(std::u8string_view id, std::size_t offset, std::u8string_view message)
    {
        if (m_on_warning) {
            m_on_warning(id, offset, message);
        }
    }

    void flush_text()
    {
        if (m_text.empty()) {
            return;
        }
        emit(Style_Kind::text, m_text, {});
        m_text.clear();
    }

    void emit(Style_Kind kind, std::u8string_view text, std::u8string_view url)
    {
        m_out.push_back(Style_Fragment {
            .kind = kind,
            .text = std::pmr::u8string { text, m_out.get_allocator() },
            .url = std::pmr::u8string { url, m_out.get_allocator() },
        });
    }

    [[nodiscard]]
    bool can_open(std::size_t index) const
    {
        return (index == 0 || is_boundary(m_raw[index - 1])) && index + 1 < m_raw.size()
            && !is_ascii_blank(m_raw[index + 1]);
    }

    [[nodiscard]]
    bool can_close(std::size_t index) const
    {
        return index != 0 && !is_ascii_blank(m_raw[index - 1])
            && (index + 1 == m_raw.size() || is_boundary(m_raw[index + 1]));
    }

    /// @brief Attempts to match a `*strong*`, `_emphasis_`, or `` `code` `` span
    /// starting at the current position.
    /// @returns `true` if a span was emitted.
    bool try_span(char8_t marker)
    {
        if (!can_open(m_pos)) {
            return false;
        }
        const bool is_code = marker == u8'`';
        std::pmr::u8string content { m_out.get_allocator() };

        for (std::size_t i = m_pos + 1; i < m_raw.size(); ++i) {
            if (!is_code && m_raw[i] == u8'\\' && i + 1 < m_raw.size()
                && is_style_escapable(m_raw[i + 1])) {
                content += m_raw[i + 1];
                ++i;
                continue;
            }
            if (m_raw[i] == marker && i != m_pos + 1 && can_close(i)) {
                flush_text();
                const Style_Kind kind = is_code   ? Style_Kind::code
                    : marker == u8'*' ? Style_Kind::strong
                                      : Style_Kind::emphasis;
                emit(kind, content, {});
                m_pos = i + 1;
                return true;
            }
            content += m_raw[i];
        }

        warn(diagnostic::style_unmatched, m_pos, u8"This style marker is never closed.");
        return false;
    }

    /// @brief Attempts to match `[[url]]` or `[[url][label]]` at the current position.
    /// @returns `true` if a link was emitted.
    bool try_link()
    {
        SLIDEC_ASSERT(m_raw.substr(m_pos).starts_with(u8"[["));

        const std::size_t url_begin = m_pos + 2;
        const std::size_t url_end = m_raw.find(u8']', url_begin);
        if (url_end == std::u8string_view::npos) {
            warn(diagnostic::style_link_unterminated, m_pos, u8"This link is never closed by \"]]\".");
            return false;
        }
        const std::u8string_view url = m_raw.substr(url_begin, url_end - url_begin);
        if (url.empty()) {
            return false;
        }

        const std::u8string_view after_url = m_raw.substr(url_end);
        if (after_url.starts_with(u8"]]")) {
            flush_text();
            emit(Style_Kind::link, url, url);
            m_pos = url_end + 2;
            return true;
        }
        if (after_url.starts_with(u8"][")) {
            std::pmr::u8string label { m_out.get_allocator() };
            for (std::size_t i = url_end + 2; i < m_raw.size(); ++i) {
                if (m_raw[i] == u8'\\' && i + 1 < m_raw.size() && is_style_escapable(m_raw[i + 1])) {
                    label += m_raw[i + 1];
                    ++i;
                    continue;
                }
                if (m_raw.substr(i).starts_with(u8"]]")) {
                    flush_text();
                    emit(Style_Kind::link, label, url);
                    m_pos = i + 2;
                    return true;
                }
                label += m_raw[i];
            }
        }
        warn(diagnostic::style_link_unterminated, m_pos, u8"This link is never closed by \"]]\".");
        return false;
    }
};

} // namespace

void apply_style(
    Styled_Text& out,
    const std::u8string_view raw,
    const Style_Warning_Consumer on_warning
)
{
    Styler { out, raw, on_warning }();
}

} // namespace slidec
