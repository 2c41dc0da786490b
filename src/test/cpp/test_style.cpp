#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "slidec/util/function_ref.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/style.hpp"

using namespace std::string_view_literals;

namespace slidec {
namespace {

struct Style_Warning {
    std::u8string id;
    std::size_t offset;

    [[nodiscard]]
    friend bool operator==(const Style_Warning&, const Style_Warning&)
        = default;
};

struct Style_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Styled_Text out { &memory };
    std::vector<Style_Warning> warnings;

    void style(std::u8string_view raw)
    {
        const auto on_warning = [&](std::u8string_view id, std::size_t offset, std::u8string_view) {
            warnings.push_back({ std::u8string { id }, offset });
        };
        apply_style(out, raw, on_warning);
    }

    [[nodiscard]]
    Style_Fragment fragment(Style_Kind kind, std::u8string_view text, std::u8string_view url = {})
    {
        return { .kind = kind,
                 .text = std::pmr::u8string { text, &memory },
                 .url = std::pmr::u8string { url, &memory } };
    }

    [[nodiscard]]
    Style_Fragment plain(std::u8string_view text)
    {
        return fragment(Style_Kind::text, text);
    }
};

TEST_F(Style_Test, empty)
{
    style(u8""sv);
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, identity_without_delimiters)
{
    constexpr std::u8string_view text = u8"Hello, world! (1 + 2) = 3; a.b/c?d#e {x} <tag> & 'q' \"w\""sv;
    style(text);
    const Styled_Text expected { { plain(text) }, &memory };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, spans)
{
    style(u8"a *strong* b _emphasis_ c `code`"sv);
    const Styled_Text expected {
        { plain(u8"a "sv), fragment(Style_Kind::strong, u8"strong"sv), plain(u8" b "sv),
          fragment(Style_Kind::emphasis, u8"emphasis"sv), plain(u8" c "sv),
          fragment(Style_Kind::code, u8"code"sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, span_followed_by_punctuation)
{
    style(u8"(*really*), yes."sv);
    const Styled_Text expected {
        { plain(u8"("sv), fragment(Style_Kind::strong, u8"really"sv), plain(u8"), yes."sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
}

TEST_F(Style_Test, intraword_markers_are_literal)
{
    style(u8"snake_case_name and 2*3*4"sv);
    const Styled_Text expected { { plain(u8"snake_case_name and 2*3*4"sv) }, &memory };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, spaced_markers_are_literal)
{
    style(u8"a * b * c"sv);
    const Styled_Text expected { { plain(u8"a * b * c"sv) }, &memory };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, closing_marker_requires_boundary)
{
    style(u8"*a*b* c"sv);
    const Styled_Text expected {
        { fragment(Style_Kind::strong, u8"a*b"sv), plain(u8" c"sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
}

TEST_F(Style_Test, code_is_literal)
{
    style(u8"`*x* \\_ [[y]]`"sv);
    const Styled_Text expected {
        { fragment(Style_Kind::code, u8"*x* \\_ [[y]]"sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
}

TEST_F(Style_Test, escapes)
{
    style(u8"\\*not strong\\* \\\\ \\[[x]] \\a"sv);
    const Styled_Text expected { { plain(u8"*not strong* \\ [[x]] \\a"sv) }, &memory };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, escape_inside_strong)
{
    style(u8"*a\\*b*"sv);
    const Styled_Text expected { { fragment(Style_Kind::strong, u8"a*b"sv) }, &memory };
    EXPECT_EQ(out, expected);
}

TEST_F(Style_Test, unmatched_marker)
{
    style(u8"an *unclosed marker"sv);
    const Styled_Text expected { { plain(u8"an *unclosed marker"sv) }, &memory };
    EXPECT_EQ(out, expected);

    const std::vector<Style_Warning> expected_warnings {
        { std::u8string { diagnostic::style_unmatched }, 3 },
    };
    EXPECT_EQ(warnings, expected_warnings);
}

TEST_F(Style_Test, links)
{
    style(u8"see [[https://go.dev]] or [[https://example.org][the *example*]]"sv);
    const Styled_Text expected {
        { plain(u8"see "sv), fragment(Style_Kind::link, u8"https://go.dev"sv, u8"https://go.dev"sv),
          plain(u8" or "sv),
          fragment(Style_Kind::link, u8"the *example*"sv, u8"https://example.org"sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, link_label_escapes)
{
    style(u8"[[u][a\\*b]] [[v][x\\]]]"sv);
    const Styled_Text expected {
        { fragment(Style_Kind::link, u8"a*b"sv, u8"u"sv), plain(u8" "sv),
          fragment(Style_Kind::link, u8"x]"sv, u8"v"sv) },
        &memory,
    };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, unterminated_link)
{
    style(u8"x [[https://a.b"sv);
    const Styled_Text expected { { plain(u8"x [[https://a.b"sv) }, &memory };
    EXPECT_EQ(out, expected);

    const std::vector<Style_Warning> expected_warnings {
        { std::u8string { diagnostic::style_link_unterminated }, 2 },
    };
    EXPECT_EQ(warnings, expected_warnings);
}

TEST_F(Style_Test, unterminated_label)
{
    style(u8"[[a][b"sv);
    const Styled_Text expected { { plain(u8"[[a][b"sv) }, &memory };
    EXPECT_EQ(out, expected);
    ASSERT_EQ(warnings.size(), 1);
    EXPECT_EQ(warnings[0].id, diagnostic::style_link_unterminated);
}

TEST_F(Style_Test, empty_link_is_literal)
{
    style(u8"[[]]"sv);
    const Styled_Text expected { { plain(u8"[[]]"sv) }, &memory };
    EXPECT_EQ(out, expected);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(Style_Test, appends)
{
    style(u8"a"sv);
    style(u8"*b*"sv);
    ASSERT_EQ(out.size(), 2);
    EXPECT_EQ(out[1], fragment(Style_Kind::strong, u8"b"sv));
}

TEST(Style_Kind, names)
{
    EXPECT_EQ(style_kind_name(Style_Kind::emphasis), u8"emphasis"sv);
    EXPECT_TRUE(is_style_escapable(u8'`'));
    EXPECT_FALSE(is_style_escapable(u8'a'));
}

} // namespace
} // namespace slidec
