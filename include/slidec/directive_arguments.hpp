#ifndef SLIDEC_DIRECTIVE_ARGUMENTS_HPP
#define SLIDEC_DIRECTIVE_ARGUMENTS_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "slidec/util/result.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

struct Directive_Argument {
    /// @brief The value of the argument, with quotes and escapes resolved.
    std::pmr::u8string value;
    /// @brief The offset of the argument within the argument text, in code units.
    std::size_t offset;
    /// @brief `true` if any part of the argument was enclosed in double quotes.
    bool quoted;

    /// @brief Returns `true` if the argument is the `_` placeholder,
    /// which stands for an absent optional argument.
    /// A quoted `"_"` is not a placeholder.
    [[nodiscard]]
    bool is_placeholder() const
    {
        return !quoted && value == u8"_";
    }
};

enum struct Argument_Error_Kind : Default_Underlying {
    /// @brief A `"` was not closed before the end of the line.
    unterminated_quote,
};

struct Argument_Error {
    Argument_Error_Kind kind;
    /// @brief The offset of the opening quote within the argument text.
    std::size_t offset;
};

/// @brief Splits the argument text of a directive into arguments.
/// Arguments are separated by spaces and tabs.
/// Double quotes enclose text which may contain whitespace,
/// and within them, `\"` and `\\` stand for `"` and `\` respectively.
/// Quoted and unquoted parts which are not separated by whitespace form one argument,
/// so `a"b c"` is the single argument `ab c`.
///
/// On failure, nothing is appended to `out`.
[[nodiscard]]
Result<void, Argument_Error> split_directive_arguments(
    std::pmr::vector<Directive_Argument>& out,
    std::u8string_view text,
    std::pmr::memory_resource* memory
);

} // namespace slidec

#endif
