#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "slidec/util/assert.hpp"
#include "slidec/util/result.hpp"
#include "slidec/util/severity.hpp"
#include "slidec/util/source_position.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/render.hpp"
#include "slidec/services.hpp"
#include "slidec/settings.hpp"
#include "slidec/style.hpp"
#include "slidec/text_sink.hpp"

namespace slidec {

bool Render_Rule_Set::has_rule(const Node_Kind kind) const
{
    using enum Node_Kind;
    switch (kind) {
    case section: return this->section != nullptr;
    case list: return this->list != nullptr;
    case text: return this->text != nullptr;
    case code: return this->code != nullptr;
    case image: return this->image != nullptr;
    case video: return this->video != nullptr;
    case background: return this->background != nullptr;
    case iframe: return this->iframe != nullptr;
    case link: return this->link != nullptr;
    case html: return this->html != nullptr;
    case caption: return this->caption != nullptr;
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid node kind.");
}

namespace {

void find_node_kinds(Node_Kind_Presence& out, const Section& section)
{
    out[std::size_t(Node_Kind::section)] = true;
    for (const Element& element : section.elements) {
        out[std::size_t(to_node_kind(element_kind(element)))] = true;
    }
    for (const Section& subsection : section.sections) {
        find_node_kinds(out, subsection);
    }
}

} // namespace

Node_Kind_Presence find_node_kinds(const Document& document)
{
    Node_Kind_Presence result {};
    for (const Section& section : document.sections) {
        find_node_kinds(result, section);
    }
    return result;
}

Result<void, Render_Config_Error> validate_rules(
    const Document& document,
    const Render_Rule_Set& rules,
    std::pmr::memory_resource* const memory
)
{
    const Node_Kind_Presence present = find_node_kinds(document);

    Render_Config_Error error { .missing = std::pmr::vector<Node_Kind> { memory },
                                .message = std::pmr::u8string { memory } };
    for (std::size_t i = 0; i < node_kind_count; ++i) {
        const auto kind = Node_Kind(i);
        if (present[i] && !rules.has_rule(kind)) {
            error.missing.push_back(kind);
        }
    }
    if (error.missing.empty()) {
        return {};
    }

    error.message += u8"No render rule for node kind";
    if (error.missing.size() > 1) {
        error.message += u8's';
    }
    error.message += u8": ";
    for (std::size_t i = 0; i < error.missing.size(); ++i) {
        if (i != 0) {
            error.message += u8", ";
        }
        error.message += node_kind_name(error.missing[i]);
    }
    return error;
}

namespace {

struct [[nodiscard]] Renderer {
    const Render_Rule_Set& rules;
    const Render_Context& context;

    void render_section(Text_Sink& out, const Section& section) const
    {
        std::pmr::vector<char8_t> body_data { context.memory };
        body_data.reserve(section_body_buffer_size);
        Capturing_Ref_Text_Sink body { body_data };

        for (const Element& element : section.elements) {
            std::visit([&](const auto& e) { render_element(body, e); }, element);
        }
        for (const Section& subsection : section.sections) {
            render_section(body, subsection);
        }

        std::pmr::u8string formatted_number { context.memory };
        format_section_number(formatted_number, section.number);
        const Styled_Text title = style(section.title, section.title_span);

        SLIDEC_ASSERT(rules.section);
        (*rules.section)(
            out,
            Section_View {
                .section = section,
                .number = section.number,
                .formatted_number = formatted_number,
                .depth = section.depth(),
                .title = title,
                .body = std::u8string_view { body_data.data(), body_data.size() },
            }
        );
    }

private:
    /// @brief Applies inline styles to `raw`.
    /// `source` is the span where `raw` begins in the source.
    /// Warnings at an offset within `source` are reported at that offset,
    /// and all other warnings at the start of `source`.
    [[nodiscard]]
    Styled_Text style(std::u8string_view raw, const Source_Span& source) const
    {
        Styled_Text result { context.memory };
        const auto on_warning
            = [&](std::u8string_view id, std::size_t offset, std::u8string_view message) {
                  if (context.logger.can_log(Severity::warning)) {
                      const Source_Span location = offset < source.length
                          ? source.to_right(offset).with_length(1)
                          : source.with_length(0);
                      context.logger(Diagnostic {
                          .severity = Severity::warning,
                          .id = id,
                          .location = location,
                          .message = message,
                      });
                  }
              };
        apply_style(result, raw, on_warning);
        return result;
    }

    [[nodiscard]]
    Styled_Text style(std::u8string_view raw, const Source_Position& position) const
    {
        return style(raw, Source_Span { position, 0 });
    }

    [[nodiscard]]
    std::pmr::vector<Styled_Text>
    style_all(std::span<const std::pmr::u8string> raw, std::span<const Source_Span> sources) const
    {
        SLIDEC_ASSERT(raw.size() == sources.size());
        std::pmr::vector<Styled_Text> result { context.memory };
        result.reserve(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            result.push_back(style(raw[i], sources[i]));
        }
        return result;
    }

    template <typename View, typename... Args>
    void invoke(const Render_Rule<View>* rule, Text_Sink& out, const Args&... args) const
    {
        SLIDEC_ASSERT(rule);
        (*rule)(out, View { args... });
    }

    void render_element(Text_Sink& out, const List& list) const
    {
        const std::pmr::vector<Styled_Text> bullets = style_all(list.bullets, list.bullet_spans);
        invoke(rules.list, out, list, std::span<const Styled_Text> { bullets });
    }

    void render_element(Text_Sink& out, const Text& text) const
    {
        if (text.pre) {
            invoke(rules.text, out, text, std::span<const Styled_Text> {});
            return;
        }
        std::pmr::vector<Styled_Text> lines { context.memory };
        lines.reserve(text.lines.size());
        for (const std::pmr::u8string& line : text.lines) {
            lines.push_back(style(line, text.position));
        }
        invoke(rules.text, out, text, std::span<const Styled_Text> { lines });
    }

    void render_element(Text_Sink& out, const Code& code) const
    {
        const bool playable = context.play_service.is_playable(code);
        invoke(rules.code, out, code, playable);
    }

    void render_element(Text_Sink& out, const Image& image) const
    {
        invoke(rules.image, out, image);
    }

    void render_element(Text_Sink& out, const Video& video) const
    {
        invoke(rules.video, out, video);
    }

    void render_element(Text_Sink& out, const Background& background) const
    {
        invoke(rules.background, out, background);
    }

    void render_element(Text_Sink& out, const Iframe& iframe) const
    {
        invoke(rules.iframe, out, iframe);
    }

    void render_element(Text_Sink& out, const Link& link) const
    {
        if (link.label.empty()) {
            Styled_Text label { context.memory };
            // The URL is displayed literally, since URLs often contain characters like "_".
            label.push_back(Style_Fragment {
                .kind = Style_Kind::text,
                .text = std::pmr::u8string { link.url, context.memory },
                .url = std::pmr::u8string { context.memory },
            });
            invoke(rules.link, out, link, label, true);
            return;
        }
        const Styled_Text label = style(link.label, link.position);
        invoke(rules.link, out, link, label, false);
    }

    void render_element(Text_Sink& out, const HTML& html) const
    {
        invoke(rules.html, out, html);
    }

    void render_element(Text_Sink& out, const Caption& caption) const
    {
        const Styled_Text text = style(caption.text, caption.text_span);
        invoke(rules.caption, out, caption, text);
    }
};

} // namespace

Result<void, Render_Config_Error> render(
    Text_Sink& out,
    const Document& document,
    const Render_Rule_Set& rules,
    const Render_Context& context
)
{
    SLIDEC_ASSERT(context.memory != nullptr);

    Result<void, Render_Config_Error> valid = validate_rules(document, rules, context.memory);
    if (!valid) {
        return valid;
    }

    const Renderer renderer { .rules = rules, .context = context };
    for (const Section& section : document.sections) {
        renderer.render_section(out, section);
    }
    return {};
}

} // namespace slidec
