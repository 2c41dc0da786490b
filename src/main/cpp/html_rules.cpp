#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/html_writer.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/html_rules.hpp"
#include "slidec/render.hpp"
#include "slidec/settings.hpp"
#include "slidec/style.hpp"
#include "slidec/text_sink.hpp"

namespace slidec {

void write_styled_html(HTML_Writer& out, const Styled_Text& text)
{
    for (const Style_Fragment& fragment : text) {
        switch (fragment.kind) {
        case Style_Kind::text: {
            out.write_inner_text(fragment.text);
            break;
        }
        case Style_Kind::strong: {
            out.open_tag(u8"b");
            out.write_inner_text(fragment.text);
            out.close_tag(u8"b");
            break;
        }
        case Style_Kind::emphasis: {
            out.open_tag(u8"i");
            out.write_inner_text(fragment.text);
            out.close_tag(u8"i");
            break;
        }
        case Style_Kind::code: {
            out.open_tag(u8"code");
            out.write_inner_text(fragment.text);
            out.close_tag(u8"code");
            break;
        }
        case Style_Kind::link: {
            out.open_tag_with_attributes(u8"a")
                .write_href(fragment.url)
                .write_attribute(u8"target", u8"_blank")
                .end();
            out.write_inner_text(fragment.text);
            out.close_tag(u8"a");
            break;
        }
        }
    }
}

namespace {

/// @brief Writes the `height` and `width` attributes, if present.
void write_size_attributes(
    Attribute_Writer& attributes,
    const std::optional<std::size_t>& height,
    const std::optional<std::size_t>& width
)
{
    if (height) {
        attributes.write_integer_attribute(u8"height", *height);
    }
    if (width) {
        attributes.write_integer_attribute(u8"width", *width);
    }
}

struct HTML_Section_Rule final : Render_Rule<Section_View> {
    void operator()(Text_Sink& out, const Section_View& view) const final
    {
        const std::u8string_view tag = view.depth == 1 ? u8"article" : u8"section";
        constexpr std::u8string_view heading_tags[] { u8"h1", u8"h2", u8"h3",
                                                      u8"h4", u8"h5", u8"h6" };
        static_assert(std::size(heading_tags) == max_html_heading_level);
        const std::u8string_view heading
            = heading_tags[std::min(view.depth, max_html_heading_level) - 1];

        std::pmr::u8string id { u8"sec-", view.title.get_allocator() };
        id += view.formatted_number;

        HTML_Writer writer { out };
        writer.open_tag_with_attributes(tag).write_id(id).end();
        writer.write_inner_html(u8'\n');
        writer.open_tag(heading);
        writer.open_tag_with_attributes(u8"span").write_class(u8"number").end();
        writer.write_inner_text(view.formatted_number);
        writer.close_tag(u8"span");
        writer.write_inner_html(u8' ');
        write_styled_html(writer, view.title);
        writer.close_tag(heading);
        writer.write_inner_html(u8'\n');
        writer.write_inner_html(view.body);
        writer.close_tag(tag);
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_List_Rule final : Render_Rule<List_View> {
    void operator()(Text_Sink& out, const List_View& view) const final
    {
        HTML_Writer writer { out };
        writer.open_tag(u8"ul");
        writer.write_inner_html(u8'\n');
        for (const Styled_Text& bullet : view.bullets) {
            writer.open_tag(u8"li");
            write_styled_html(writer, bullet);
            writer.close_tag(u8"li");
            writer.write_inner_html(u8'\n');
        }
        writer.close_tag(u8"ul");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Text_Rule final : Render_Rule<Text_View> {
    void operator()(Text_Sink& out, const Text_View& view) const final
    {
        HTML_Writer writer { out };
        if (view.text.pre) {
            writer.open_tag(u8"pre");
            bool first = true;
            for (const auto& line : view.text.lines) {
                if (!first) {
                    writer.write_inner_html(u8'\n');
                }
                writer.write_inner_text(line);
                first = false;
            }
            writer.close_tag(u8"pre");
            writer.write_inner_html(u8'\n');
            return;
        }

        writer.open_tag(u8"p");
        bool first = true;
        for (const Styled_Text& line : view.lines) {
            if (!first) {
                writer.write_inner_html(u8'\n');
            }
            write_styled_html(writer, line);
            first = false;
        }
        writer.close_tag(u8"p");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Code_Rule final : Render_Rule<Code_View> {
    void operator()(Text_Sink& out, const Code_View& view) const final
    {
        const Code& code = view.code;

        HTML_Writer writer { out };
        Attribute_Writer div = writer.open_tag_with_attributes(u8"div");
        div.write_class(view.playable ? u8"code playground" : u8"code");
        if (code.edit) {
            div.write_attribute(u8"contenteditable", u8"true");
            div.write_attribute(u8"spellcheck", u8"false");
        }
        div.end();

        Attribute_Writer pre = writer.open_tag_with_attributes(u8"pre");
        if (code.numbers) {
            pre.write_class(u8"numbers");
        }
        if (!code.language.empty()) {
            pre.write_attribute(u8"data-lang", code.language);
        }
        pre.end();

        if (!code.numbers) {
            writer.write_inner_text(code.text);
        }
        else {
            std::u8string_view remainder = code.text;
            std::size_t number = 1;
            while (!remainder.empty()) {
                const std::size_t line_end = remainder.find(u8'\n');
                const std::u8string_view line = remainder.substr(0, line_end);
                writer.open_tag_with_attributes(u8"span")
                    .write_integer_attribute(u8"num", number++)
                    .end();
                writer.write_inner_text(line);
                writer.close_tag(u8"span");
                writer.write_inner_html(u8'\n');
                remainder.remove_prefix(
                    line_end == std::u8string_view::npos ? remainder.size() : line_end + 1
                );
            }
        }

        writer.close_tag(u8"pre");
        writer.close_tag(u8"div");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Image_Rule final : Render_Rule<Image_View> {
    void operator()(Text_Sink& out, const Image_View& view) const final
    {
        HTML_Writer writer { out };
        writer.open_tag_with_attributes(u8"div").write_class(u8"image").end();
        Attribute_Writer img = writer.open_tag_with_attributes(u8"img");
        img.write_src(view.image.url);
        write_size_attributes(img, view.image.height, view.image.width);
        img.end_empty();
        writer.close_tag(u8"div");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Video_Rule final : Render_Rule<Video_View> {
    void operator()(Text_Sink& out, const Video_View& view) const final
    {
        HTML_Writer writer { out };
        writer.open_tag_with_attributes(u8"div").write_class(u8"video").end();
        Attribute_Writer video = writer.open_tag_with_attributes(u8"video");
        write_size_attributes(video, view.video.height, view.video.width);
        video.write_empty_attribute(u8"controls");
        video.end();
        writer.open_tag_with_attributes(u8"source")
            .write_src(view.video.url)
            .write_attribute(u8"type", view.video.source_type)
            .end_empty();
        writer.close_tag(u8"video");
        writer.close_tag(u8"div");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Background_Rule final : Render_Rule<Background_View> {
    void operator()(Text_Sink& out, const Background_View& view) const final
    {
        HTML_Writer writer { out };
        Attribute_Writer img = writer.open_tag_with_attributes(u8"img");
        img.write_class(u8"background");
        img.write_src(view.background.url);
        write_size_attributes(img, view.background.height, view.background.width);
        img.end_empty();
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Iframe_Rule final : Render_Rule<Iframe_View> {
    void operator()(Text_Sink& out, const Iframe_View& view) const final
    {
        HTML_Writer writer { out };
        Attribute_Writer iframe = writer.open_tag_with_attributes(u8"iframe");
        iframe.write_src(view.iframe.url);
        write_size_attributes(iframe, view.iframe.height, view.iframe.width);
        iframe.end();
        writer.close_tag(u8"iframe");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_Link_Rule final : Render_Rule<Link_View> {
    void operator()(Text_Sink& out, const Link_View& view) const final
    {
        HTML_Writer writer { out };
        writer.open_tag_with_attributes(u8"p").write_class(u8"link").end();
        writer.open_tag_with_attributes(u8"a")
            .write_href(view.link.url)
            .write_attribute(u8"target", u8"_blank")
            .end();
        write_styled_html(writer, view.label);
        writer.close_tag(u8"a");
        writer.close_tag(u8"p");
        writer.write_inner_html(u8'\n');
    }
};

struct HTML_HTML_Rule final : Render_Rule<HTML_View> {
    void operator()(Text_Sink& out, const HTML_View& view) const final
    {
        // Trusted content; emitted without escaping.
        out.write(view.html.payload);
        out.write(u8'\n');
    }
};

struct HTML_Caption_Rule final : Render_Rule<Caption_View> {
    void operator()(Text_Sink& out, const Caption_View& view) const final
    {
        HTML_Writer writer { out };
        writer.open_tag(u8"figcaption");
        write_styled_html(writer, view.text);
        writer.close_tag(u8"figcaption");
        writer.write_inner_html(u8'\n');
    }
};

constinit const HTML_Section_Rule section_rule {};
constinit const HTML_List_Rule list_rule {};
constinit const HTML_Text_Rule text_rule {};
constinit const HTML_Code_Rule code_rule {};
constinit const HTML_Image_Rule image_rule {};
constinit const HTML_Video_Rule video_rule {};
constinit const HTML_Background_Rule background_rule {};
constinit const HTML_Iframe_Rule iframe_rule {};
constinit const HTML_Link_Rule link_rule {};
constinit const HTML_HTML_Rule html_rule {};
constinit const HTML_Caption_Rule caption_rule {};

constinit const Render_Rule_Set html_rules {
    .section = &section_rule,
    .list = &list_rule,
    .text = &text_rule,
    .code = &code_rule,
    .image = &image_rule,
    .video = &video_rule,
    .background = &background_rule,
    .iframe = &iframe_rule,
    .link = &link_rule,
    .html = &html_rule,
    .caption = &caption_rule,
};

} // namespace

const Render_Rule_Set& html_render_rules()
{
    return html_rules;
}

} // namespace slidec
