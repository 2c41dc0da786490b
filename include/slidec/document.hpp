#ifndef SLIDEC_DOCUMENT_HPP
#define SLIDEC_DOCUMENT_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "slidec/util/assert.hpp"
#include "slidec/util/source_position.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

/// @brief A sequence of bullet items at the same level of indentation.
struct List {
    /// @brief The indentation level shared by all bullets.
    std::size_t level;
    /// @brief The raw text of each bullet, without the leading `- `.
    std::pmr::vector<std::pmr::u8string> bullets;
    /// @brief For each bullet, the span of its text on the line where the bullet begins.
    /// Continuation lines are not part of the span.
    std::pmr::vector<Source_Span> bullet_spans;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const List&, const List&)
        = default;
};

/// @brief A run of consecutive prose lines.
struct Text {
    /// @brief If `true`, the lines are preformatted and rendered byte-for-byte,
    /// including indentation.
    /// Otherwise, each line is style-processed.
    bool pre;
    std::pmr::vector<std::pmr::u8string> lines;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Text&, const Text&)
        = default;
};

/// @brief The contents of a code fence.
struct Code {
    /// @brief The verbatim text between the fences,
    /// where every line (including the last) is terminated by `\n`.
    std::pmr::u8string text;
    /// @brief The language hint from the info string, possibly empty.
    std::pmr::u8string language;
    /// @brief If `true`, the code should be editable by the viewer.
    bool edit;
    /// @brief If `true`, the author requested a playground.
    /// Whether the code is actually playable is decided by a `Play_Service`.
    bool play;
    /// @brief If `true`, the code should be rendered with line numbers.
    bool numbers;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Code&, const Code&)
        = default;
};

/// @brief An image embedded in the slide.
struct Image {
    std::pmr::u8string url;
    std::optional<std::size_t> height;
    std::optional<std::size_t> width;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Image&, const Image&)
        = default;
};

/// @brief An image shown as the background of the slide.
struct Background {
    std::pmr::u8string url;
    std::optional<std::size_t> height;
    std::optional<std::size_t> width;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Background&, const Background&)
        = default;
};

/// @brief A web page embedded in the slide.
struct Iframe {
    std::pmr::u8string url;
    std::optional<std::size_t> height;
    std::optional<std::size_t> width;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Iframe&, const Iframe&)
        = default;
};

struct Video {
    std::pmr::u8string url;
    /// @brief The MIME type of the video, like `video/mp4`.
    std::pmr::u8string source_type;
    std::optional<std::size_t> height;
    std::optional<std::size_t> width;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Video&, const Video&)
        = default;
};

struct Link {
    std::pmr::u8string url;
    /// @brief The raw label.
    /// If empty, the URL is displayed instead.
    std::pmr::u8string label;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Link&, const Link&)
        = default;
};

/// @brief Raw HTML which is emitted as-is.
///
/// WARNING: The payload is neither style-processed nor escaped nor sanitized.
/// Documents containing `.html` directives must be trusted.
struct HTML {
    std::pmr::u8string payload;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const HTML&, const HTML&)
        = default;
};

/// @brief A caption, which by convention describes the preceding media element.
/// The association is only by order; there is no structural link.
struct Caption {
    std::pmr::u8string text;
    Source_Span text_span;
    Source_Position position;

    [[nodiscard]]
    friend bool operator==(const Caption&, const Caption&)
        = default;
};

#define SLIDEC_ELEMENT_KIND_ENUM_DATA(F)                                                           \
    F(list, List)                                                                                  \
    F(text, Text)                                                                                  \
    F(code, Code)                                                                                  \
    F(image, Image)                                                                                \
    F(video, Video)                                                                                \
    F(background, Background)                                                                      \
    F(iframe, Iframe)                                                                              \
    F(link, Link)                                                                                  \
    F(html, HTML)                                                                                  \
    F(caption, Caption)

#define SLIDEC_ELEMENT_KIND_ENUMERATOR(id, type) id,

/// @brief The kind of an `Element`.
/// The enumerators are in the same order as the alternatives of `Element`.
enum struct Element_Kind : Default_Underlying {
    SLIDEC_ELEMENT_KIND_ENUM_DATA(SLIDEC_ELEMENT_KIND_ENUMERATOR)
};

/// @brief One typed unit of content within a section.
using Element = std::variant<List, Text, Code, Image, Video, Background, Iframe, Link, HTML, Caption>;

#define SLIDEC_ELEMENT_KIND_CHECK(id, type)                                                        \
    static_assert(                                                                                 \
        std::is_same_v<std::variant_alternative_t<std::size_t(Element_Kind::id), Element>, type>   \
    );

SLIDEC_ELEMENT_KIND_ENUM_DATA(SLIDEC_ELEMENT_KIND_CHECK)

[[nodiscard]]
inline Element_Kind element_kind(const Element& element)
{
    return Element_Kind(element.index());
}

/// @brief The kind of any node in the document tree,
/// i.e. the kind of any element, or a section.
enum struct Node_Kind : Default_Underlying {
    section,
    SLIDEC_ELEMENT_KIND_ENUM_DATA(SLIDEC_ELEMENT_KIND_ENUMERATOR)
};

/// @brief The number of enumerators in `Node_Kind`.
inline constexpr std::size_t node_kind_count = std::variant_size_v<Element> + 1;

[[nodiscard]]
constexpr Node_Kind to_node_kind(Element_Kind kind)
{
    return Node_Kind(Default_Underlying(kind) + 1);
}

/// @brief Returns the name of the node kind, like `"section"` or `"image"`.
[[nodiscard]]
std::u8string_view node_kind_name(Node_Kind kind);

/// @brief Returns the node kind whose `node_kind_name` is `name`, if any.
[[nodiscard]]
std::optional<Node_Kind> node_kind_by_name(std::u8string_view name);

struct Section {
    /// @brief The hierarchical number of the section, like `{ 2, 1 }`.
    /// Every number is positive.
    std::pmr::vector<std::size_t> number;
    /// @brief The raw title.
    std::pmr::u8string title;
    Source_Span title_span;
    std::pmr::vector<Element> elements;
    /// @brief The nested sections.
    /// All elements precede the first subsection in the source.
    std::pmr::vector<Section> sections;
    Source_Position position;

    /// @brief Returns the nesting depth, which is at least `1`.
    [[nodiscard]]
    std::size_t depth() const
    {
        SLIDEC_DEBUG_ASSERT(!number.empty());
        return number.size();
    }

    [[nodiscard]]
    friend bool operator==(const Section&, const Section&)
        = default;
};

struct Document {
    std::pmr::vector<Section> sections;

    [[nodiscard]]
    friend bool operator==(const Document&, const Document&)
        = default;
};

/// @brief Appends the dot-separated representation of `number` to `out`,
/// like `"2.1"` for `{ 2, 1 }`.
void format_section_number(std::pmr::u8string& out, std::span<const std::size_t> number);

} // namespace slidec

#endif
