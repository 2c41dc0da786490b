#include <array>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "slidec/util/result.hpp"
#include "slidec/util/severity.hpp"
#include "slidec/util/source_position.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/collecting_logger.hpp"
#include "slidec/diagnostic.hpp"
#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/parse.hpp"
#include "slidec/render.hpp"
#include "slidec/services.hpp"
#include "slidec/style.hpp"
#include "slidec/text_sink.hpp"

using namespace std::string_view_literals;

namespace slidec {
namespace {

/// @brief Counts its invocations and writes the name of the node kind,
/// or for sections, `[number:title]{body}`.
struct Counting_Rules {
    mutable std::array<std::size_t, node_kind_count> calls {};

    template <typename View>
    struct Rule final : Render_Rule<View> {
        const Counting_Rules& self;
        Node_Kind kind;

        Rule(const Counting_Rules& self, Node_Kind kind)
            : self { self }
            , kind { kind }
        {
        }

        void operator()(Text_Sink& out, const View&) const final
        {
            ++self.calls[std::size_t(kind)];
            out.write(node_kind_name(kind));
            out.write(u8';');
        }
    };

    struct Section_Rule final : Render_Rule<Section_View> {
        const Counting_Rules& self;

        explicit Section_Rule(const Counting_Rules& self)
            : self { self }
        {
        }

        void operator()(Text_Sink& out, const Section_View& view) const final
        {
            ++self.calls[std::size_t(Node_Kind::section)];
            out.write(u8'[');
            out.write(view.formatted_number);
            out.write(u8':');
            for (const Style_Fragment& fragment : view.title) {
                out.write(fragment.text);
            }
            out.write(u8"]{");
            out.write(view.body);
            out.write(u8'}');
        }
    };

    Section_Rule section { *this };
    Rule<List_View> list { *this, Node_Kind::list };
    Rule<Text_View> text { *this, Node_Kind::text };
    Rule<Code_View> code { *this, Node_Kind::code };
    Rule<Image_View> image { *this, Node_Kind::image };
    Rule<Video_View> video { *this, Node_Kind::video };
    Rule<Background_View> background { *this, Node_Kind::background };
    Rule<Iframe_View> iframe { *this, Node_Kind::iframe };
    Rule<Link_View> link { *this, Node_Kind::link };
    Rule<HTML_View> html { *this, Node_Kind::html };
    Rule<Caption_View> caption { *this, Node_Kind::caption };

    [[nodiscard]]
    Render_Rule_Set rule_set() const
    {
        return { .section = &section,
                 .list = &list,
                 .text = &text,
                 .code = &code,
                 .image = &image,
                 .video = &video,
                 .background = &background,
                 .iframe = &iframe,
                 .link = &link,
                 .html = &html,
                 .caption = &caption };
    }

    [[nodiscard]]
    std::size_t element_calls() const
    {
        std::size_t result = 0;
        for (std::size_t i = 1; i < node_kind_count; ++i) {
            result += calls[i];
        }
        return result;
    }
};

/// @brief Records the views it receives.
struct Recording_Link_Rule final : Render_Rule<Link_View> {
    mutable std::vector<std::u8string> labels;
    mutable std::vector<bool> label_is_url;

    void operator()(Text_Sink&, const Link_View& view) const final
    {
        std::u8string label;
        for (const Style_Fragment& fragment : view.label) {
            label += fragment.text;
        }
        labels.push_back(std::move(label));
        label_is_url.push_back(view.label_is_url);
    }
};

struct Always_Play_Service final : Play_Service {
    [[nodiscard]]
    bool is_playable(const Code& code) const final
    {
        return code.language == u8"go";
    }
};

struct Recording_Code_Rule final : Render_Rule<Code_View> {
    mutable std::vector<bool> playable;

    void operator()(Text_Sink&, const Code_View& view) const final
    {
        playable.push_back(view.playable);
    }
};

struct Verbatim_Text_Rule final : Render_Rule<Text_View> {
    void operator()(Text_Sink& out, const Text_View& view) const final
    {
        EXPECT_TRUE(view.text.pre);
        EXPECT_TRUE(view.lines.empty());
        for (const auto& line : view.text.lines) {
            out.write(line);
            out.write(u8'\n');
        }
    }
};

struct Render_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Vector_Text_Sink out { &memory };
    Collecting_Logger logger { &memory };
    Counting_Rules counting;

    [[nodiscard]]
    Document parse(std::u8string_view source)
    {
        Result<Document, Parse_Error> result = parse_document(source, {}, &memory);
        EXPECT_TRUE(result);
        return std::move(*result);
    }

    [[nodiscard]]
    Render_Context context(const Play_Service& play_service = no_support_play_service)
    {
        return { .play_service = play_service, .logger = logger, .memory = &memory };
    }
};

TEST_F(Render_Test, empty_document)
{
    const Document document = parse(u8""sv);
    const Result<void, Render_Config_Error> result
        = render(out, document, counting.rule_set(), context());
    ASSERT_TRUE(result);
    EXPECT_EQ(out.as_string(), u8""sv);
    EXPECT_EQ(counting.element_calls(), 0);
}

TEST_F(Render_Test, one_call_per_node)
{
    const Document document = parse(
        u8"# A\n"
        u8"- x\n"
        u8"- y\n"
        u8"\n"
        u8"text\n"
        u8".image a.png\n"
        u8".caption cap\n"
        u8"## B\n"
        u8"```\n"
        u8"code\n"
        u8"```\n"
        u8".video v.mp4 video/mp4\n"
        u8".background b.png\n"
        u8".iframe i.html\n"
        u8".link l.html\n"
        u8".html <hr>\n"
        u8"# C\n"
    );
    const Result<void, Render_Config_Error> result
        = render(out, document, counting.rule_set(), context());
    ASSERT_TRUE(result);

    EXPECT_EQ(counting.element_calls(), 10);
    EXPECT_EQ(counting.calls[std::size_t(Node_Kind::section)], 3);
    for (std::size_t i = 1; i < node_kind_count; ++i) {
        EXPECT_EQ(counting.calls[i], 1) << as_string_view(node_kind_name(Node_Kind(i)));
    }

    constexpr std::u8string_view expected
        = u8"[1:A]{list;text;image;caption;"
          u8"[1.1:B]{code;video;background;iframe;link;html;}}"
          u8"[2:C]{}";
    EXPECT_EQ(out.as_string(), expected);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Render_Test, section_view)
{
    struct Checking_Section_Rule final : Render_Rule<Section_View> {
        mutable std::size_t calls = 0;

        void operator()(Text_Sink&, const Section_View& view) const final
        {
            ++calls;
            if (view.section.title == u8"Deep") {
                EXPECT_EQ(view.depth, 3);
                EXPECT_EQ(view.formatted_number, u8"2.1.1"sv);
                ASSERT_EQ(view.number.size(), 3);
                EXPECT_EQ(view.number[0], 2);
            }
        }
    };
    const Checking_Section_Rule section_rule {};

    const Document document = parse(u8"# A\n# B\n## C\n### Deep\n"sv);
    const Render_Rule_Set rules { .section = &section_rule };
    const Result<void, Render_Config_Error> result = render(out, document, rules, context());
    ASSERT_TRUE(result);
    EXPECT_EQ(section_rule.calls, 4);
}

TEST_F(Render_Test, missing_rules)
{
    const Document document = parse(u8"# A\n.image a.png\n.video v.mp4 video/mp4\n- x\n"sv);
    Render_Rule_Set rules = counting.rule_set();
    rules.image = nullptr;
    rules.video = nullptr;

    const Result<void, Render_Config_Error> result = render(out, document, rules, context());
    ASSERT_FALSE(result);
    const std::pmr::vector<Node_Kind> expected { { Node_Kind::image, Node_Kind::video }, &memory };
    EXPECT_EQ(result.error().missing, expected);
    EXPECT_EQ(result.error().message, u8"No render rule for node kinds: image, video"sv);

    EXPECT_EQ(out.as_string(), u8""sv);
    EXPECT_EQ(counting.calls[std::size_t(Node_Kind::section)], 0);
    EXPECT_EQ(counting.element_calls(), 0);
}

TEST_F(Render_Test, missing_rule_only_matters_if_kind_occurs)
{
    const Document document = parse(u8"# A\n- x\n"sv);
    Render_Rule_Set rules = counting.rule_set();
    rules.image = nullptr;
    rules.html = nullptr;

    EXPECT_TRUE(validate_rules(document, rules, &memory));
    EXPECT_TRUE(render(out, document, rules, context()));
}

TEST(Node_Kind, names)
{
    for (std::size_t i = 0; i < node_kind_count; ++i) {
        const auto kind = Node_Kind(i);
        const std::u8string_view name = node_kind_name(kind);
        EXPECT_FALSE(name.empty());
        EXPECT_EQ(node_kind_by_name(name), kind) << as_string_view(name);
    }
    EXPECT_EQ(node_kind_name(Node_Kind::section), u8"section"sv);
    EXPECT_EQ(node_kind_name(Node_Kind::iframe), u8"iframe"sv);
    EXPECT_FALSE(node_kind_by_name(u8"slide"sv));
    EXPECT_FALSE(node_kind_by_name(u8""sv));
}

TEST_F(Render_Test, find_node_kinds)
{
    const Document document = parse(u8"# A\n.link x\n## B\n```\n```\n"sv);
    const Node_Kind_Presence present = find_node_kinds(document);
    EXPECT_TRUE(present[std::size_t(Node_Kind::section)]);
    EXPECT_TRUE(present[std::size_t(Node_Kind::link)]);
    EXPECT_TRUE(present[std::size_t(Node_Kind::code)]);
    EXPECT_FALSE(present[std::size_t(Node_Kind::list)]);
    EXPECT_FALSE(present[std::size_t(Node_Kind::text)]);
}

TEST_F(Render_Test, preformatted_text_is_verbatim)
{
    constexpr std::u8string_view lines = u8"  *not*  styled\n\n    [[x]] & <y>\n"sv;
    std::pmr::u8string source { u8"# A\n", &memory };
    source += lines;
    const Document document = parse(source);

    const Verbatim_Text_Rule text_rule {};
    Render_Rule_Set rules = counting.rule_set();
    rules.text = &text_rule;

    const Result<void, Render_Config_Error> result = render(out, document, rules, context());
    ASSERT_TRUE(result);

    std::pmr::u8string expected { u8"[1:A]{", &memory };
    expected += lines;
    expected += u8"}";
    EXPECT_EQ(out.as_string(), expected);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Render_Test, link_labels)
{
    const Document document
        = parse(u8"# A\n.link https://a.b/x_y_z\n.link https://a.b *Bold* label\n"sv);
    const Recording_Link_Rule link_rule {};
    Render_Rule_Set rules = counting.rule_set();
    rules.link = &link_rule;

    ASSERT_TRUE(render(out, document, rules, context()));
    ASSERT_EQ(link_rule.labels.size(), 2);
    EXPECT_EQ(link_rule.labels[0], u8"https://a.b/x_y_z"sv);
    EXPECT_TRUE(link_rule.label_is_url[0]);
    EXPECT_EQ(link_rule.labels[1], u8"Bold label"sv);
    EXPECT_FALSE(link_rule.label_is_url[1]);
}

TEST_F(Render_Test, playable)
{
    const Document document = parse(u8"# A\n```go\n```\n```cpp\n```\n"sv);
    const Recording_Code_Rule code_rule {};
    Render_Rule_Set rules = counting.rule_set();
    rules.code = &code_rule;

    const Always_Play_Service play_service {};
    ASSERT_TRUE(render(out, document, rules, context(play_service)));
    EXPECT_EQ(code_rule.playable, (std::vector<bool> { true, false }));

    code_rule.playable.clear();
    ASSERT_TRUE(render(out, document, rules, context()));
    EXPECT_EQ(code_rule.playable, (std::vector<bool> { false, false }));
}

TEST_F(Render_Test, style_warnings_are_logged)
{
    const Document document = parse(u8"# A *title\n\n- fine\n- [[broken\n"sv);
    ASSERT_TRUE(render(out, document, counting.rule_set(), context()));

    ASSERT_EQ(logger.diagnostics.size(), 2);
    EXPECT_TRUE(logger.was_logged(diagnostic::style_unmatched));
    EXPECT_TRUE(logger.was_logged(diagnostic::style_link_unterminated));
    for (const Collected_Diagnostic& d : logger.diagnostics) {
        EXPECT_EQ(d.severity, Severity::warning);
    }
    // Bullets are rendered before the section title.
    EXPECT_EQ(logger.diagnostics[0].location, (Source_Span { { 3, 2, 21 }, 1 }));
    EXPECT_EQ(logger.diagnostics[1].location, (Source_Span { { 0, 4, 4 }, 1 }));
}

TEST_F(Render_Test, style_warning_locations)
{
    const Document document = parse(u8"# A\n.caption see _this\n- a\n  b *c\n"sv);
    ASSERT_TRUE(render(out, document, counting.rule_set(), context()));

    ASSERT_EQ(logger.diagnostics.size(), 2);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::style_unmatched);
    EXPECT_EQ(logger.diagnostics[0].location, (Source_Span { { 1, 13, 17 }, 1 }));
    // The marker is on a continuation line, so the start of the bullet is reported.
    EXPECT_EQ(logger.diagnostics[1].id, diagnostic::style_unmatched);
    EXPECT_EQ(logger.diagnostics[1].location, (Source_Span { { 2, 2, 25 }, 0 }));
}

TEST_F(Render_Test, render_is_repeatable)
{
    const Document document = parse(u8"# A\ntext\n## B\n- x\n"sv);

    ASSERT_TRUE(render(out, document, counting.rule_set(), context()));
    const std::pmr::u8string first { out.as_string(), &memory };
    (*out).clear();
    ASSERT_TRUE(render(out, document, counting.rule_set(), context()));
    EXPECT_EQ(out.as_string(), first);
}

} // namespace
} // namespace slidec
