#ifndef SLIDEC_DOCUMENT_GENERATION_HPP
#define SLIDEC_DOCUMENT_GENERATION_HPP

#include <memory_resource>
#include <string_view>

#include "slidec/fwd.hpp"
#include "slidec/html_rules.hpp"
#include "slidec/parse.hpp"
#include "slidec/render.hpp"
#include "slidec/services.hpp"

namespace slidec {

enum struct Generation_Status : Default_Underlying {
    /// @brief The document was parsed and rendered.
    ok,
    /// @brief The source could not be parsed.
    /// Nothing was written.
    parse_error,
    /// @brief The rule set has no rule for some node kind in the document.
    /// Nothing was written.
    config_error,
};

[[nodiscard]]
std::u8string_view generation_status_name(Generation_Status status);

struct Generation_Options {
    Parse_Options parse = {};
    const Render_Rule_Set& rules = html_render_rules();
    const Play_Service& play_service = no_support_play_service;
    /// @brief Receives parse errors, configuration errors, and style warnings.
    Logger& logger = ignorant_logger;

    /// @brief A source of memory to be used for the document tree and rendering buffers.
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
};

/// @brief Parses `source`, validates the rule set against the resulting document,
/// and renders the document to `out`.
/// Failures are reported to `options.logger` as errors.
[[nodiscard]]
Generation_Status
generate_document(Text_Sink& out, std::u8string_view source, const Generation_Options& options);

} // namespace slidec

#endif
