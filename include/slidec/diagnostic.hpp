#ifndef SLIDEC_DIAGNOSTIC_HPP
#define SLIDEC_DIAGNOSTIC_HPP

#include <string_view>

#include "slidec/util/severity.hpp"
#include "slidec/util/source_position.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The span of source text that is responsible for this diagnostic.
    Source_Span location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// PARSE DIAGNOSTICS ===============================================================================

/// @brief Content (other than blank lines) appeared before the first section header.
inline constexpr std::u8string_view section_missing = u8"parse.section.missing";

/// @brief A header skipped one or more levels of nesting,
/// like `###` directly following `#`.
inline constexpr std::u8string_view heading_skip = u8"parse.heading.skip";

/// @brief The input ended inside a code fence.
inline constexpr std::u8string_view fence_unterminated = u8"parse.fence.unterminated";

/// @brief A directive is missing a required argument, like `.image` without a URL.
inline constexpr std::u8string_view directive_argument_missing
    = u8"parse.directive.missing-argument";

/// @brief A directive argument is malformed,
/// like a non-numeric height or an unterminated quote.
inline constexpr std::u8string_view directive_argument_invalid
    = u8"parse.directive.invalid-argument";

// STYLE DIAGNOSTICS ===============================================================================

/// @brief An inline style marker (`*`, `_`, or a backtick) was never closed.
inline constexpr std::u8string_view style_unmatched = u8"style.unmatched";

/// @brief A `[[` link was never closed with `]]`.
inline constexpr std::u8string_view style_link_unterminated = u8"style.link.unterminated";

// RENDER DIAGNOSTICS ==============================================================================

/// @brief The rule set has no rule for a node kind that occurs in the document.
inline constexpr std::u8string_view render_rule_missing = u8"render.rule.missing";

} // namespace diagnostic

} // namespace slidec

#endif
