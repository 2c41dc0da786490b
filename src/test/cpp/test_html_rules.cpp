#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "slidec/util/html_writer.hpp"
#include "slidec/util/result.hpp"

#include "slidec/document.hpp"
#include "slidec/html_rules.hpp"
#include "slidec/parse.hpp"
#include "slidec/render.hpp"
#include "slidec/services.hpp"
#include "slidec/style.hpp"
#include "slidec/text_sink.hpp"

using namespace std::string_view_literals;

namespace slidec {
namespace {

struct Go_Play_Service final : Play_Service {
    [[nodiscard]]
    bool is_playable(const Code& code) const final
    {
        return code.play && code.language == u8"go";
    }
};

struct HTML_Rules_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Vector_Text_Sink out { &memory };

    [[nodiscard]]
    std::u8string_view
    render_html(std::u8string_view source, const Play_Service& play = no_support_play_service)
    {
        const Result<Document, Parse_Error> document = parse_document(source, {}, &memory);
        EXPECT_TRUE(document);
        if (!document) {
            return {};
        }
        const Render_Context context { .play_service = play, .memory = &memory };
        const Result<void, Render_Config_Error> result
            = render(out, *document, html_render_rules(), context);
        EXPECT_TRUE(result);
        return out.as_string();
    }
};

TEST_F(HTML_Rules_Test, all_kinds_have_rules)
{
    for (std::size_t i = 0; i < node_kind_count; ++i) {
        EXPECT_TRUE(html_render_rules().has_rule(Node_Kind(i)));
    }
}

TEST_F(HTML_Rules_Test, section_and_list)
{
    constexpr std::u8string_view expected = u8"<article id=sec-1>\n"
                                            u8"<h1><span class=number>1</span> Title</h1>\n"
                                            u8"<ul>\n"
                                            u8"<li>one</li>\n"
                                            u8"<li><b>two</b></li>\n"
                                            u8"</ul>\n"
                                            u8"</article>\n";
    EXPECT_EQ(render_html(u8"# Title\n\n- one\n- *two*\n"sv), expected);
}

TEST_F(HTML_Rules_Test, nested_sections)
{
    constexpr std::u8string_view expected = u8"<article id=sec-1>\n"
                                            u8"<h1><span class=number>1</span> A</h1>\n"
                                            u8"<section id=sec-1.1>\n"
                                            u8"<h2><span class=number>1.1</span> <i>B</i></h2>\n"
                                            u8"</section>\n"
                                            u8"</article>\n"
                                            u8"<article id=sec-2>\n"
                                            u8"<h1><span class=number>2</span> C</h1>\n"
                                            u8"</article>\n";
    EXPECT_EQ(render_html(u8"# A\n## _B_\n# C\n"sv), expected);
}

TEST_F(HTML_Rules_Test, deep_heading_is_clamped)
{
    const std::u8string_view html = render_html(u8"# 1\n## 2\n### 3\n#### 4\n##### 5\n###### 6\n####### 7\n"sv);
    EXPECT_TRUE(html.contains(u8"<h6><span class=number>1.1.1.1.1.1</span> 6</h6>"sv));
    EXPECT_TRUE(html.contains(u8"<h6><span class=number>1.1.1.1.1.1.1</span> 7</h6>"sv));
}

TEST_F(HTML_Rules_Test, text)
{
    constexpr std::u8string_view body = u8"<p>Hello &amp; &lt;world&gt;\nsecond <code>line</code></p>\n";
    const std::u8string_view html = render_html(u8"# A\nHello & <world>\nsecond `line`\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, preformatted_text)
{
    constexpr std::u8string_view body = u8"<pre>  x &lt; *y*\n\n    z</pre>\n";
    const std::u8string_view html = render_html(u8"# A\n  x < *y*\n\n    z\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, code)
{
    constexpr std::u8string_view body = u8"<div class=code><pre>a &lt; b\n</pre></div>\n";
    const std::u8string_view html = render_html(u8"# A\n```\na < b\n```\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, code_with_options)
{
    constexpr std::u8string_view body
        = u8"<div class=code contenteditable=true spellcheck=false>"
          u8"<pre class=numbers data-lang=cpp>"
          u8"<span num=1>int a;</span>\n"
          u8"<span num=2>return a&lt;b;</span>\n"
          u8"</pre></div>\n";
    const std::u8string_view html
        = render_html(u8"# A\n```cpp -edit -numbers\nint a;\nreturn a<b;\n```\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, playable_code)
{
    const Go_Play_Service play {};
    const std::u8string_view html
        = render_html(u8"# A\n```go -play\nfunc main() {}\n```\n"sv, play);
    EXPECT_TRUE(html.contains(u8"<div class=\"code playground\"><pre data-lang=go>"sv));
}

TEST_F(HTML_Rules_Test, image)
{
    constexpr std::u8string_view body
        = u8"<div class=image><img src=cat.png height=100 width=200 /></div>\n";
    const std::u8string_view html = render_html(u8"# A\n.image cat.png 100 200\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, image_without_size)
{
    constexpr std::u8string_view body = u8"<div class=image><img src=cat.png /></div>\n";
    const std::u8string_view html = render_html(u8"# A\n.image cat.png\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, video)
{
    const std::u8string_view html = render_html(u8"# A\n.video clip.mp4 video/mp4 _ 640\n"sv);
    EXPECT_TRUE(html.contains(u8"<div class=video><video width=640 controls><source src=clip.mp4 "sv));
    EXPECT_TRUE(html.contains(u8"</video></div>\n"sv));
}

TEST_F(HTML_Rules_Test, background)
{
    constexpr std::u8string_view body = u8"<img class=background src=bg.png />\n";
    const std::u8string_view html = render_html(u8"# A\n.background bg.png\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, iframe)
{
    constexpr std::u8string_view body = u8"<iframe src=page.html width=300></iframe>\n";
    const std::u8string_view html = render_html(u8"# A\n.iframe page.html _ 300\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, link)
{
    constexpr std::u8string_view labeled
        = u8"<p class=link><a href=go.html target=_blank>The <b>Go</b> site</a></p>\n";
    constexpr std::u8string_view unlabeled
        = u8"<p class=link><a href=x_y.html target=_blank>x_y.html</a></p>\n";
    const std::u8string_view html
        = render_html(u8"# A\n.link go.html The *Go* site\n.link x_y.html\n"sv);
    EXPECT_TRUE(html.contains(labeled));
    EXPECT_TRUE(html.contains(unlabeled));
}

TEST_F(HTML_Rules_Test, html_is_not_escaped)
{
    const std::u8string_view html = render_html(u8"# A\n.html <hr class=\"x\"> & *y*\n"sv);
    EXPECT_TRUE(html.contains(u8"\n<hr class=\"x\"> & *y*\n"sv));
}

TEST_F(HTML_Rules_Test, caption)
{
    constexpr std::u8string_view body = u8"<figcaption>A <i>cat</i></figcaption>\n";
    const std::u8string_view html = render_html(u8"# A\n.caption A _cat_\n"sv);
    EXPECT_TRUE(html.contains(body));
}

TEST_F(HTML_Rules_Test, styled_link)
{
    HTML_Writer writer { out };
    Styled_Text text { &memory };
    text.push_back({ .kind = Style_Kind::link,
                     .text = std::pmr::u8string { u8"docs", &memory },
                     .url = std::pmr::u8string { u8"docs.html", &memory } });
    write_styled_html(writer, text);
    EXPECT_EQ(out.as_string(), u8"<a href=docs.html target=_blank>docs</a>"sv);
}

} // namespace
} // namespace slidec
