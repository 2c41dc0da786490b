#ifndef SLIDEC_SOURCE_POSITION_HPP
#define SLIDEC_SOURCE_POSITION_HPP

#include <cstddef>

#include "slidec/fwd.hpp"

namespace slidec {

/// @brief A position in a slide source, where lines are separated by `\n`.
struct Source_Position {
    /// Line number, starting at zero.
    std::size_t line;
    /// Column number, starting at zero.
    std::size_t column;
    /// First index in the source file that is part of the syntactical element.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;

    [[nodiscard]]
    constexpr Source_Position to_right(std::size_t offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }

    /// @brief Returns the one-based line number,
    /// which is how lines are cited to humans.
    [[nodiscard]]
    constexpr std::size_t line_number() const
    {
        return line + 1;
    }
};

/// @brief A span of code units within a single line,
/// such as the header of a section or one argument of a directive.
struct Source_Span : Source_Position {
    std::size_t length;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Span, Source_Span)
        = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]]
    constexpr Source_Span with_length(std::size_t l) const
    {
        return { Source_Position { *this }, l }; // NOLINT(cppcoreguidelines-slicing)
    }

    /// @brief Returns a span on the same line and with the same length, shifted to the right
    /// by `offset` characters.
    [[nodiscard]]
    constexpr Source_Span to_right(std::size_t offset) const
    {
        return { { .line = line, .column = column + offset, .begin = begin + offset }, length };
    }

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }
};

} // namespace slidec

#endif
