#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "slidec/util/result.hpp"

#include "slidec/directive_arguments.hpp"

using namespace std::string_view_literals;

namespace slidec {
namespace {

struct Directive_Arguments_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Directive_Argument> arguments { &memory };

    [[nodiscard]]
    bool split(std::u8string_view text)
    {
        return bool(split_directive_arguments(arguments, text, &memory));
    }
};

TEST_F(Directive_Arguments_Test, empty)
{
    ASSERT_TRUE(split(u8""sv));
    EXPECT_TRUE(arguments.empty());

    ASSERT_TRUE(split(u8" \t "sv));
    EXPECT_TRUE(arguments.empty());
}

TEST_F(Directive_Arguments_Test, whitespace_separated)
{
    ASSERT_TRUE(split(u8"cat.png  100\t200"sv));
    ASSERT_EQ(arguments.size(), 3);
    EXPECT_EQ(arguments[0].value, u8"cat.png"sv);
    EXPECT_EQ(arguments[0].offset, 0);
    EXPECT_EQ(arguments[1].value, u8"100"sv);
    EXPECT_EQ(arguments[1].offset, 9);
    EXPECT_EQ(arguments[2].value, u8"200"sv);
    EXPECT_EQ(arguments[2].offset, 13);
    EXPECT_FALSE(arguments[0].quoted);
}

TEST_F(Directive_Arguments_Test, quoted)
{
    ASSERT_TRUE(split(u8"\"my file.png\" \"\""sv));
    ASSERT_EQ(arguments.size(), 2);
    EXPECT_EQ(arguments[0].value, u8"my file.png"sv);
    EXPECT_TRUE(arguments[0].quoted);
    EXPECT_EQ(arguments[1].value, u8""sv);
    EXPECT_TRUE(arguments[1].quoted);
}

TEST_F(Directive_Arguments_Test, escapes_in_quotes)
{
    ASSERT_TRUE(split(u8R"("say \"hi\"" "a\\b" "c\d")"sv));
    ASSERT_EQ(arguments.size(), 3);
    EXPECT_EQ(arguments[0].value, u8"say \"hi\""sv);
    EXPECT_EQ(arguments[1].value, u8"a\\b"sv);
    EXPECT_EQ(arguments[2].value, u8"c\\d"sv);
}

TEST_F(Directive_Arguments_Test, backslash_outside_quotes_is_literal)
{
    ASSERT_TRUE(split(u8R"(a\"b")"sv));
    ASSERT_EQ(arguments.size(), 1);
    EXPECT_EQ(arguments[0].value, u8"a\\b"sv);
}

TEST_F(Directive_Arguments_Test, adjacent_quoted_and_unquoted)
{
    ASSERT_TRUE(split(u8"a\"b c\"d e"sv));
    ASSERT_EQ(arguments.size(), 2);
    EXPECT_EQ(arguments[0].value, u8"ab cd"sv);
    EXPECT_EQ(arguments[1].value, u8"e"sv);
}

TEST_F(Directive_Arguments_Test, placeholder)
{
    ASSERT_TRUE(split(u8"_ \"_\" __"sv));
    ASSERT_EQ(arguments.size(), 3);
    EXPECT_TRUE(arguments[0].is_placeholder());
    EXPECT_FALSE(arguments[1].is_placeholder());
    EXPECT_FALSE(arguments[2].is_placeholder());
}

TEST_F(Directive_Arguments_Test, unterminated_quote)
{
    const Result<void, Argument_Error> result
        = split_directive_arguments(arguments, u8"ok \"never closed"sv, &memory);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, Argument_Error_Kind::unterminated_quote);
    EXPECT_EQ(result.error().offset, 3);
    EXPECT_TRUE(arguments.empty());
}

TEST_F(Directive_Arguments_Test, appends)
{
    ASSERT_TRUE(split(u8"a"sv));
    ASSERT_TRUE(split(u8"b"sv));
    ASSERT_EQ(arguments.size(), 2);
    EXPECT_EQ(arguments[1].value, u8"b"sv);
}

} // namespace
} // namespace slidec
