#ifndef SLIDEC_PRINT_HPP
#define SLIDEC_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

#include "slidec/util/source_position.hpp"

#include "slidec/fwd.hpp"
#include "slidec/services.hpp"

namespace slidec {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`, without its terminator.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints a position within a file, consisting of the file name and line/column,
/// like `talk.slide:3:1`.
/// @param out the string to write to
/// @param file the file name
/// @param pos the position within the file
/// @param colors if `true`, ANSI color sequences are included
void print_file_position(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors = false
);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
void print_affected_line(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors = false
);

/// @brief Prints a diagnostic like `talk.slide:3:1: ERROR: message [id]`,
/// followed by the affected line of `source`.
void print_diagnostic(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    std::u8string_view source,
    const Diagnostic& diagnostic,
    bool colors = false
);

/// @brief Prints a parse error in the same form as `print_diagnostic`, with error severity.
void print_parse_error(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    std::u8string_view source,
    const Parse_Error& error,
    bool colors = false
);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

/// @brief A logger which prints every diagnostic to a stream using `print_diagnostic`.
struct Stream_Logger final : Logger {
private:
    std::ostream& m_out;
    std::u8string_view m_file;
    std::u8string_view m_source;
    bool m_colors;

public:
    [[nodiscard]]
    Stream_Logger(
        std::ostream& out,
        std::u8string_view file,
        std::u8string_view source,
        Severity min_severity = Severity::warning,
        bool colors = false
    )
        : Logger { min_severity }
        , m_out { out }
        , m_file { file }
        , m_source { source }
        , m_colors { colors }
    {
    }

    void operator()(Diagnostic diagnostic) final;
};

} // namespace slidec

#endif
