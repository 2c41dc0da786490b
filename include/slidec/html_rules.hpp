#ifndef SLIDEC_HTML_RULES_HPP
#define SLIDEC_HTML_RULES_HPP

#include "slidec/util/html_writer.hpp"

#include "slidec/fwd.hpp"
#include "slidec/render.hpp"
#include "slidec/style.hpp"

namespace slidec {

/// @brief Writes styled text as HTML,
/// where strong text becomes `<b>`, emphasized text `<i>`, code `<code>`, and links `<a>`.
void write_styled_html(HTML_Writer& out, const Styled_Text& text);

/// @brief Returns the default rule set, which renders every node kind as HTML.
///
/// Sections of depth 1 become `<article>`, deeper sections `<section>`,
/// each starting with a heading that contains the section number and title.
/// The payload of `.html` directives is written without any escaping.
[[nodiscard]]
const Render_Rule_Set& html_render_rules();

} // namespace slidec

#endif
