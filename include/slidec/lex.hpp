#ifndef SLIDEC_LEX_HPP
#define SLIDEC_LEX_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "slidec/util/source_position.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

#define SLIDEC_DIRECTIVE_KIND_ENUM_DATA(F)                                                         \
    F(image)                                                                                       \
    F(video)                                                                                       \
    F(background)                                                                                  \
    F(iframe)                                                                                      \
    F(link)                                                                                        \
    F(html)                                                                                        \
    F(caption)

#define SLIDEC_DIRECTIVE_KIND_ENUMERATOR(id) id,

/// @brief The keyword of a directive line, like `.image`.
enum struct Directive_Kind : Default_Underlying {
    SLIDEC_DIRECTIVE_KIND_ENUM_DATA(SLIDEC_DIRECTIVE_KIND_ENUMERATOR)
};

/// @brief Returns the keyword of the directive, without the leading `.`.
[[nodiscard]]
std::u8string_view directive_kind_name(Directive_Kind kind);

[[nodiscard]]
std::optional<Directive_Kind> directive_kind_by_name(std::u8string_view name);

enum struct Line_Kind : Default_Underlying {
    /// @brief A line containing only whitespace.
    blank,
    /// @brief A section header, like `## Title`.
    header,
    /// @brief A bullet item, like `- point`.
    bullet,
    /// @brief The opening or closing boundary of a code fence, like `` ```go ``.
    fence,
    /// @brief A directive line, like `.image pic.png 300 400`.
    directive,
    /// @brief Any other line with content.
    prose,
    /// @brief A line within a code fence, taken literally.
    verbatim,
};

[[nodiscard]]
std::u8string_view line_kind_name(Line_Kind kind);

enum struct Fence_Marker_Kind : Default_Underlying {
    /// @brief ```` ``` ````
    backtick,
    /// @brief `~~~`
    tilde,
};

[[nodiscard]]
constexpr char8_t fence_marker_char(Fence_Marker_Kind kind)
{
    return kind == Fence_Marker_Kind::backtick ? u8'`' : u8'~';
}

struct Fence_Marker {
    Fence_Marker_Kind kind;
    /// @brief The number of marker characters, at least three.
    std::size_t length;
    /// @brief The indentation of the fence line, in columns.
    std::size_t indentation;

    [[nodiscard]]
    friend constexpr bool operator==(const Fence_Marker&, const Fence_Marker&)
        = default;
};

struct Lex_Options {
    /// @brief The number of columns which make up one level of indentation.
    std::size_t indent_width = 2;
    /// @brief A tab advances the column to the next multiple of `tab_width`.
    std::size_t tab_width = 4;
};

/// @brief A single line of source text, without its line terminator.
struct Source_Line {
    std::u8string_view text;
    Source_Position position;
};

/// @brief Splits a source text into lines at `\n`.
/// A `\r` immediately preceding the `\n` (or the end of input) is not part of the line.
/// A line terminator at the very end of the source does not begin another line.
struct Line_Reader {
private:
    std::u8string_view m_source;
    Source_Position m_pos {};

public:
    [[nodiscard]]
    explicit Line_Reader(std::u8string_view source)
        : m_source { source }
    {
    }

    [[nodiscard]]
    bool done() const
    {
        return m_pos.begin >= m_source.size();
    }

    /// @brief Returns the line at the current position without consuming it,
    /// or `std::nullopt` if all lines have been read.
    [[nodiscard]]
    std::optional<Source_Line> peek() const;

    /// @brief Consumes and returns the line at the current position.
    /// `done()` shall be `false`.
    Source_Line next();
};

/// @brief The result of classifying one line of source text.
struct Classified_Line {
    Line_Kind kind;
    /// @brief The position of the first character in the line.
    Source_Position position;
    /// @brief The complete line, without its terminator.
    std::u8string_view text;
    /// @brief The width of the leading spaces and tabs, in columns.
    std::size_t indent_columns = 0;
    /// @brief `indent_columns / indent_width`.
    std::size_t indent_level = 0;
    /// @brief For `header`, the number of `#` plus `indent_level`.
    std::size_t header_depth = 0;
    /// @brief The meaningful payload of the line:
    /// - `header`: the title,
    /// - `bullet`: the text following `- `,
    /// - `fence`: the info string,
    /// - `directive`: the argument text following the keyword,
    /// - `prose`: the text with surrounding whitespace removed,
    /// - `verbatim`: the line with the indentation of the opening fence removed,
    /// - `blank`: empty.
    std::u8string_view content;
    /// @brief For `directive`, the keyword.
    Directive_Kind directive {};
    /// @brief For `fence`, the marker.
    Fence_Marker fence {};

    [[nodiscard]]
    Source_Span span() const
    {
        return { position, text.length() };
    }
};

/// @brief Returns the indentation width in columns of `line`,
/// and stores the number of code units that make up the indentation in `out_length`.
[[nodiscard]]
std::size_t measure_indentation(
    std::u8string_view line,
    std::size_t& out_length,
    const Lex_Options& options = {}
);

/// @brief Classifies a line which is outside of any code fence.
[[nodiscard]]
Classified_Line
classify_line(std::u8string_view line, Source_Position position, const Lex_Options& options = {});

/// @brief Classifies a line within a code fence that was opened with `open_marker`.
/// The result is either `fence` for the closing boundary, or `verbatim`.
[[nodiscard]]
Classified_Line classify_fenced_line(
    std::u8string_view line,
    Source_Position position,
    const Fence_Marker& open_marker,
    const Lex_Options& options = {}
);

} // namespace slidec

#endif
