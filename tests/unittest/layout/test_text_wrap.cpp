/**
 * ************************************************************************
 *
 * @file test_text_wrap.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 文本折行估算单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <wire.hpp>

namespace wire::tests
{

using layout::CodePointCount;
using layout::WrapTextToLines;

// 字号 10 时每个字符宽 6，宽度 60 每行容纳 10 个字符
constexpr double FONT_SIZE = 10.0;
constexpr double TEN_CHARS = 60.0;

TEST(TextWrapTest, KeepsShortTextOnOneLine)
{
    const auto lines = WrapTextToLines("hello", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0], "hello");
}

TEST(TextWrapTest, BreaksAtWordBoundaries)
{
    const auto lines = WrapTextToLines("one two three four", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0], "one two");
    EXPECT_EQ(lines[1], "three four");
}

TEST(TextWrapTest, CollapsesRepeatedWhitespace)
{
    const auto lines = WrapTextToLines("  a    b  ", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0], "a b");
}

TEST(TextWrapTest, SlicesOverlongWords)
{
    const auto lines = WrapTextToLines("abcdefghijklmnopqrstuvwxy", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "abcdefghij");
    EXPECT_EQ(lines[1], "klmnopqrst");
    EXPECT_EQ(lines[2], "uvwxy");
}

TEST(TextWrapTest, EmptyTextYieldsOneLine)
{
    const auto lines = WrapTextToLines("", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_TRUE(lines[0].empty());
}

TEST(TextWrapTest, NewlinesStartParagraphs)
{
    const auto lines = WrapTextToLines("first\r\n\nthird", TEN_CHARS, FONT_SIZE);
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "first");
    EXPECT_TRUE(lines[1].empty());
    EXPECT_EQ(lines[2], "third");
}

// 宽度小于单个字符时仍按一个字符一行处理
TEST(TextWrapTest, TinyWidthStillProgresses)
{
    const auto lines = WrapTextToLines("abc", 1.0, FONT_SIZE);
    EXPECT_EQ(lines.size(), 3U);
}

TEST(TextWrapTest, CountsCodePoints)
{
    EXPECT_EQ(CodePointCount(""), 0U);
    EXPECT_EQ(CodePointCount("abc"), 3U);
    EXPECT_EQ(CodePointCount("布局引擎"), 4U);
    EXPECT_EQ(CodePointCount("a\xC3\xA9z"), 3U);
}

// 多字节字符按码点计宽，切分不破坏 UTF-8 序列
TEST(TextWrapTest, SlicesMultiByteWordsOnCodePoints)
{
    const auto lines = WrapTextToLines("布局引擎计算坐标", 3.0 * 6.0, FONT_SIZE);
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "布局引");
    EXPECT_EQ(lines[1], "擎计算");
    EXPECT_EQ(lines[2], "坐标");
}

} // namespace wire::tests
