#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <ostream>
#include <string_view>
#include <vector>

#include "slidec/util/ansi.hpp"
#include "slidec/util/assert.hpp"
#include "slidec/util/severity.hpp"
#include "slidec/util/source_position.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/fwd.hpp"
#include "slidec/parse.hpp"
#include "slidec/print.hpp"

namespace slidec {

namespace {

void append(std::pmr::vector<char8_t>& out, std::u8string_view str)
{
    out.insert(out.end(), str.begin(), str.end());
}

void append(std::pmr::vector<char8_t>& out, std::size_t n, char8_t c)
{
    out.insert(out.end(), n, c);
}

/// @brief Appends `str`, surrounded by `color` and a reset sequence if `colors` is `true`.
void append_colored(
    std::pmr::vector<char8_t>& out,
    std::u8string_view str,
    std::u8string_view color,
    bool colors
)
{
    if (colors) {
        append(out, color);
    }
    append(out, str);
    if (colors) {
        append(out, ansi::reset);
    }
}

[[nodiscard]]
std::u8string_view severity_color(Severity severity)
{
    return severity <= Severity::debug  ? ansi::h_black
        : severity <= Severity::info    ? ansi::h_blue
        : severity <= Severity::warning ? ansi::h_yellow
                                        : ansi::h_red;
}

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    SLIDEC_ASSERT(index <= source.size());

    if (source.empty()) {
        return source;
    }
    if (index == source.size() || source[index] == u8'\n') {
        // Positions at the end of a line or the end of the source belong to the ended line.
        if (index != 0 && source[index - 1] != u8'\n') {
            --index;
        }
        else if (index == source.size()) {
            return {};
        }
    }

    std::size_t begin = index == 0 ? std::u8string_view::npos : source.rfind(u8'\n', index - 1);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find(u8'\n', index), source.size());
    std::u8string_view result = source.substr(begin, end - begin);
    if (result.ends_with(u8'\r')) {
        result.remove_suffix(1);
    }
    return result;
}

void print_file_position(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors
)
{
    std::pmr::vector<char8_t> position { out.get_allocator() };
    append(position, file);
    position.push_back(u8':');
    append_integer(position, pos.line + 1);
    position.push_back(u8':');
    append_integer(position, pos.column + 1);
    append_colored(out, as_u8string_view(position), ansi::h_black, colors);
    out.push_back(u8':');
}

void print_affected_line(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
)
{
    const std::u8string_view cited_code = find_line(source, pos.begin);

    std::pmr::vector<char8_t> line_number { out.get_allocator() };
    append_integer(line_number, pos.line + 1);

    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length
        = pad_max - std::min(line_number.size(), std::size_t { pad_max - 1 });
    append(out, pad_length, u8' ');
    append_colored(out, as_u8string_view(line_number), ansi::h_yellow, colors);
    append(out, u8" | ");
    append(out, cited_code);
    out.push_back(u8'\n');

    const std::size_t align_length = std::max(pad_max, line_number.size() + 1);
    append(out, align_length, u8' ');
    append(out, u8" | ");
    const std::size_t column = std::min(pos.column, cited_code.length());
    append(out, column, u8' ');

    std::pmr::vector<char8_t> indicator { out.get_allocator() };
    indicator.push_back(u8'^');
    const std::size_t indicator_length = std::min(pos.length, cited_code.length() - column);
    if (indicator_length > 1) {
        append(indicator, indicator_length - 1, u8'~');
    }
    append_colored(out, as_u8string_view(indicator), ansi::h_green, colors);
    out.push_back(u8'\n');
}

void print_diagnostic(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    std::u8string_view source,
    const Diagnostic& diagnostic,
    bool colors
)
{
    SLIDEC_ASSERT(severity_is_emittable(diagnostic.severity));

    print_file_position(out, file, diagnostic.location, colors);
    out.push_back(u8' ');
    append_colored(
        out, severity_tag(diagnostic.severity), severity_color(diagnostic.severity), colors
    );
    append(out, u8": ");
    append(out, diagnostic.message);
    append(out, u8" [");
    append(out, diagnostic.id);
    append(out, u8"]\n");
    if (!source.empty()) {
        print_affected_line(out, source, diagnostic.location, colors);
    }
}

void print_parse_error(
    std::pmr::vector<char8_t>& out,
    std::u8string_view file,
    std::u8string_view source,
    const Parse_Error& error,
    bool colors
)
{
    print_diagnostic(
        out, file, source,
        Diagnostic {
            .severity = Severity::error,
            .id = error.id(),
            .location = error.location,
            .message = error.message,
        },
        colors
    );
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void Stream_Logger::operator()(const Diagnostic diagnostic)
{
    std::pmr::vector<char8_t> buffer;
    print_diagnostic(buffer, m_file, m_source, diagnostic, m_colors);
    m_out << as_u8string_view(buffer);
}

} // namespace slidec
