#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/fwd.hpp"
#include "slidec/lex.hpp"
#include "slidec/regexp.hpp"

namespace slidec {

#define SLIDEC_DIRECTIVE_KIND_NAME_CASE(id)                                                        \
    case Directive_Kind::id: return u8## #id;

std::u8string_view directive_kind_name(const Directive_Kind kind)
{
    switch (kind) {
        SLIDEC_DIRECTIVE_KIND_ENUM_DATA(SLIDEC_DIRECTIVE_KIND_NAME_CASE)
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid directive kind.");
}

#define SLIDEC_DIRECTIVE_KIND_NAME_CHECK(id)                                                       \
    if (name == u8## #id) {                                                                        \
        return Directive_Kind::id;                                                                 \
    }

std::optional<Directive_Kind> directive_kind_by_name(const std::u8string_view name)
{
    SLIDEC_DIRECTIVE_KIND_ENUM_DATA(SLIDEC_DIRECTIVE_KIND_NAME_CHECK)
    return {};
}

std::u8string_view line_kind_name(const Line_Kind kind)
{
    using enum Line_Kind;
    switch (kind) {
        SLIDEC_ENUM_STRING_CASE8(blank);
        SLIDEC_ENUM_STRING_CASE8(header);
        SLIDEC_ENUM_STRING_CASE8(bullet);
        SLIDEC_ENUM_STRING_CASE8(fence);
        SLIDEC_ENUM_STRING_CASE8(directive);
        SLIDEC_ENUM_STRING_CASE8(prose);
        SLIDEC_ENUM_STRING_CASE8(verbatim);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid line kind.");
}

std::optional<Source_Line> Line_Reader::peek() const
{
    if (done()) {
        return {};
    }
    const std::u8string_view remainder = m_source.substr(m_pos.begin);
    std::u8string_view text = remainder.substr(0, remainder.find(u8'\n'));
    if (text.ends_with(u8'\r')) {
        text.remove_suffix(1);
    }
    return Source_Line { .text = text, .position = m_pos };
}

Source_Line Line_Reader::next()
{
    SLIDEC_ASSERT(!done());
    const std::u8string_view remainder = m_source.substr(m_pos.begin);
    const std::size_t terminator = remainder.find(u8'\n');

    std::u8string_view text = remainder.substr(0, terminator);
    const Source_Position start = m_pos;
    if (terminator == std::u8string_view::npos) {
        m_pos.begin = m_source.size();
        m_pos.column += text.size();
    }
    else {
        m_pos = { .line = m_pos.line + 1, .column = 0, .begin = m_pos.begin + terminator + 1 };
    }

    if (text.ends_with(u8'\r')) {
        text.remove_suffix(1);
    }
    return Source_Line { .text = text, .position = start };
}

std::size_t measure_indentation(
    const std::u8string_view line,
    std::size_t& out_length,
    const Lex_Options& options
)
{
    SLIDEC_ASSERT(options.tab_width != 0);

    std::size_t columns = 0;
    std::size_t length = 0;
    for (; length < line.size() && is_indentation(line[length]); ++length) {
        if (line[length] == u8'\t') {
            columns = (columns / options.tab_width + 1) * options.tab_width;
        }
        else {
            ++columns;
        }
    }
    out_length = length;
    return columns;
}

namespace {

/// @brief Returns the number of leading `c` in `str`.
[[nodiscard]]
std::size_t count_leading(std::u8string_view str, char8_t c)
{
    std::size_t length = 0;
    while (length < str.size() && str[length] == c) {
        ++length;
    }
    return length;
}

[[nodiscard]]
const Reg_Exp& directive_pattern()
{
    // The keyword must be followed by the end of the line or whitespace,
    // so that `.imagery` is prose, not an `.image` directive.
    static const Reg_Exp pattern
        = *Reg_Exp::make(u8R"(\.(image|video|background|iframe|link|html|caption)(?:[ \t]+(.*))?)");
    return pattern;
}

/// @brief Attempts to classify `rest` (the line after indentation) as a header.
[[nodiscard]]
bool try_header(Classified_Line& out, std::u8string_view rest)
{
    const std::size_t hashes = count_leading(rest, u8'#');
    if (hashes == 0 || hashes >= rest.size() || !is_indentation(rest[hashes])) {
        return false;
    }
    const std::u8string_view title = trim_ascii_blank(rest.substr(hashes));
    if (title.empty()) {
        return false;
    }
    out.kind = Line_Kind::header;
    out.header_depth = hashes + out.indent_level;
    out.content = title;
    return true;
}

[[nodiscard]]
bool try_bullet(Classified_Line& out, std::u8string_view rest)
{
    if (rest.size() < 2 || rest[0] != u8'-' || !is_indentation(rest[1])) {
        return false;
    }
    const std::u8string_view content = trim_ascii_blank(rest.substr(2));
    if (content.empty()) {
        return false;
    }
    out.kind = Line_Kind::bullet;
    out.content = content;
    return true;
}

[[nodiscard]]
bool try_fence(Classified_Line& out, std::u8string_view rest)
{
    if (rest.empty() || (rest[0] != u8'`' && rest[0] != u8'~')) {
        return false;
    }
    const char8_t marker = rest[0];
    const std::size_t length = count_leading(rest, marker);
    if (length < 3) {
        return false;
    }
    const std::u8string_view info = trim_ascii_blank(rest.substr(length));
    if (marker == u8'`' && info.contains(u8'`')) {
        return false;
    }
    out.kind = Line_Kind::fence;
    out.content = info;
    out.fence = Fence_Marker {
        .kind = marker == u8'`' ? Fence_Marker_Kind::backtick : Fence_Marker_Kind::tilde,
        .length = length,
        .indentation = out.indent_columns,
    };
    return true;
}

[[nodiscard]]
bool try_directive(Classified_Line& out, std::u8string_view rest)
{
    if (!rest.starts_with(u8'.')) {
        return false;
    }
    rest = trim_ascii_blank_right(rest);

    std::array<std::u8string_view, 2> groups;
    const Reg_Exp_Status status = directive_pattern().match(rest, groups);
    if (status != Reg_Exp_Status::matched) {
        return false;
    }
    const std::optional<Directive_Kind> kind = directive_kind_by_name(groups[0]);
    SLIDEC_ASSERT(kind);

    out.kind = Line_Kind::directive;
    out.directive = *kind;
    out.content = groups[1];
    return true;
}

} // namespace

Classified_Line classify_line(
    const std::u8string_view line,
    const Source_Position position,
    const Lex_Options& options
)
{
    SLIDEC_ASSERT(options.indent_width != 0);

    Classified_Line result { .kind = Line_Kind::blank, .position = position, .text = line };
    if (is_ascii_blank(line)) {
        return result;
    }

    std::size_t indent_length = 0;
    result.indent_columns = measure_indentation(line, indent_length, options);
    result.indent_level = result.indent_columns / options.indent_width;

    const std::u8string_view rest = line.substr(indent_length);
    if (try_header(result, rest) || try_bullet(result, rest) || try_fence(result, rest)
        || try_directive(result, rest)) {
        return result;
    }

    result.kind = Line_Kind::prose;
    result.content = trim_ascii_blank_right(rest);
    return result;
}

Classified_Line classify_fenced_line(
    const std::u8string_view line,
    const Source_Position position,
    const Fence_Marker& open_marker,
    const Lex_Options& options
)
{
    Classified_Line result { .kind = Line_Kind::verbatim, .position = position, .text = line };

    std::size_t indent_length = 0;
    result.indent_columns = measure_indentation(line, indent_length, options);
    result.indent_level = result.indent_columns / options.indent_width;

    const std::u8string_view rest = line.substr(indent_length);
    const char8_t marker = fence_marker_char(open_marker.kind);
    const std::size_t marker_length = count_leading(rest, marker);

    const bool is_closing = result.indent_columns <= open_marker.indentation + 3
        && marker_length >= open_marker.length && is_ascii_blank(rest.substr(marker_length));
    if (is_closing) {
        result.kind = Line_Kind::fence;
        result.fence = Fence_Marker {
            .kind = open_marker.kind,
            .length = marker_length,
            .indentation = result.indent_columns,
        };
        return result;
    }

    // Remove up to as much indentation as the opening fence had.
    std::size_t columns = 0;
    std::size_t removed = 0;
    for (; removed < line.size() && is_indentation(line[removed]); ++removed) {
        const std::size_t next_columns = line[removed] == u8'\t'
            ? (columns / options.tab_width + 1) * options.tab_width
            : columns + 1;
        if (next_columns > open_marker.indentation) {
            break;
        }
        columns = next_columns;
    }
    result.content = line.substr(removed);
    return result;
}

} // namespace slidec
