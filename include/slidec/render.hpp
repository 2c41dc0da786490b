#ifndef SLIDEC_RENDER_HPP
#define SLIDEC_RENDER_HPP

#include <array>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "slidec/util/result.hpp"

#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/services.hpp"
#include "slidec/style.hpp"
#include "slidec/text_sink.hpp"

namespace slidec {

struct Section_View {
    const Section& section;
    /// @brief The hierarchical number, like `{ 2, 1 }`.
    std::span<const std::size_t> number;
    /// @brief The dot-separated number, like `"2.1"`.
    std::u8string_view formatted_number;
    /// @brief The nesting depth, equal to `number.size()`.
    std::size_t depth;
    const Styled_Text& title;
    /// @brief The already rendered elements and subsections of the section, in document order.
    std::u8string_view body;
};

struct List_View {
    const List& list;
    /// @brief One styled text per bullet.
    std::span<const Styled_Text> bullets;
};

struct Text_View {
    const Text& text;
    /// @brief One styled text per line.
    /// For preformatted text, this is empty, and `text.lines` are to be rendered verbatim.
    std::span<const Styled_Text> lines;
};

struct Code_View {
    const Code& code;
    /// @brief The answer of the `Play_Service` for this code.
    bool playable;
};

struct Image_View {
    const Image& image;
};

struct Video_View {
    const Video& video;
};

struct Background_View {
    const Background& background;
};

struct Iframe_View {
    const Iframe& iframe;
};

struct Link_View {
    const Link& link;
    /// @brief The styled label,
    /// or a single text fragment containing the URL if the link has no label.
    const Styled_Text& label;
    /// @brief `true` if the link has no label, so that the URL is displayed instead.
    bool label_is_url;
};

/// @brief A view of raw HTML.
/// Rules should emit `html.payload` unchanged; it is trusted content.
struct HTML_View {
    const HTML& html;
};

struct Caption_View {
    const Caption& caption;
    const Styled_Text& text;
};

/// @brief The rendering behavior for one kind of node.
/// A rule is invoked exactly once for each node of its kind,
/// and writes the markup for that node to `out`.
template <typename View>
struct Render_Rule {
    virtual void operator()(Text_Sink& out, const View& view) const = 0;
};

/// @brief The set of rules used for rendering, with one rule per node kind.
/// A null rule means that the kind is not supported,
/// which is only an error if the kind occurs in the rendered document.
struct Render_Rule_Set {
    const Render_Rule<Section_View>* section = nullptr;
    const Render_Rule<List_View>* list = nullptr;
    const Render_Rule<Text_View>* text = nullptr;
    const Render_Rule<Code_View>* code = nullptr;
    const Render_Rule<Image_View>* image = nullptr;
    const Render_Rule<Video_View>* video = nullptr;
    const Render_Rule<Background_View>* background = nullptr;
    const Render_Rule<Iframe_View>* iframe = nullptr;
    const Render_Rule<Link_View>* link = nullptr;
    const Render_Rule<HTML_View>* html = nullptr;
    const Render_Rule<Caption_View>* caption = nullptr;

    [[nodiscard]]
    bool has_rule(Node_Kind kind) const;
};

struct Render_Context {
    /// @brief Decides whether code elements are playable.
    const Play_Service& play_service = no_support_play_service;
    /// @brief Receives warnings from style processing.
    Logger& logger = ignorant_logger;
    /// @brief Memory for temporary buffers during rendering.
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
};

/// @brief Error for a rule set which cannot render a document.
struct Render_Config_Error {
    /// @brief Every node kind which occurs in the document but has no rule,
    /// in the order of `Node_Kind`.
    std::pmr::vector<Node_Kind> missing;
    /// @brief A human-readable message enumerating the missing kinds.
    std::pmr::u8string message;
};

/// @brief Indexed by `Node_Kind`, `true` for every kind which occurs in a document.
using Node_Kind_Presence = std::array<bool, node_kind_count>;

/// @brief Returns which node kinds occur in `document`.
[[nodiscard]]
Node_Kind_Presence find_node_kinds(const Document& document);

/// @brief Checks that `rules` has a rule for every node kind that occurs in `document`.
[[nodiscard]]
Result<void, Render_Config_Error> validate_rules(
    const Document& document,
    const Render_Rule_Set& rules,
    std::pmr::memory_resource* memory
);

/// @brief Renders `document` to `out`.
/// The rule set is validated before anything is written,
/// so on failure, nothing is written to `out`.
///
/// Elements are rendered depth-first in document order.
/// Each section is rendered by first rendering its elements and subsections into a buffer,
/// and then invoking the section rule with that buffer as the body.
[[nodiscard]]
Result<void, Render_Config_Error> render(
    Text_Sink& out,
    const Document& document,
    const Render_Rule_Set& rules,
    const Render_Context& context
);

} // namespace slidec

#endif
