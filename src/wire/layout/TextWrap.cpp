/**
 * ************************************************************************
 *
 * @file TextWrap.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 文本折行实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "TextWrap.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace wire::layout
{
namespace
{
constexpr double CHAR_WIDTH_FACTOR = 0.6;

bool isContinuationByte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

/**
 * @brief 按码点切分单词，每段最多 maxChars 个码点
 */
void sliceWord(std::string_view word, size_t maxChars, std::vector<std::string>& lines)
{
    size_t start = 0;
    size_t count = 0;
    for (size_t i = 0; i < word.size(); ++i)
    {
        if (isContinuationByte(word[i])) continue;
        if (count == maxChars)
        {
            lines.emplace_back(word.substr(start, i - start));
            start = i;
            count = 0;
        }
        ++count;
    }
    if (start < word.size()) lines.emplace_back(word.substr(start));
}

std::vector<std::string_view> splitWords(std::string_view paragraph)
{
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < paragraph.size())
    {
        while (i < paragraph.size() && isSpace(paragraph[i])) ++i;
        const size_t begin = i;
        while (i < paragraph.size() && !isSpace(paragraph[i])) ++i;
        if (i > begin) words.push_back(paragraph.substr(begin, i - begin));
    }
    return words;
}

void wrapParagraph(std::string_view paragraph, size_t maxChars, std::vector<std::string>& lines)
{
    const auto words = splitWords(paragraph);
    if (words.empty())
    {
        lines.emplace_back();
        return;
    }

    std::string current;
    size_t currentChars = 0;
    for (const auto word : words)
    {
        const size_t wordChars = CodePointCount(word);
        const size_t candidateChars = current.empty() ? wordChars : currentChars + 1 + wordChars;
        if (candidateChars <= maxChars)
        {
            if (!current.empty()) current.push_back(' ');
            current.append(word);
            currentChars = candidateChars;
            continue;
        }

        if (!current.empty())
        {
            lines.push_back(std::move(current));
            current.clear();
            currentChars = 0;
        }

        if (wordChars <= maxChars)
        {
            current.assign(word);
            currentChars = wordChars;
            continue;
        }
        sliceWord(word, maxChars, lines);
    }

    if (!current.empty()) lines.push_back(std::move(current));
}
} // namespace

size_t CodePointCount(std::string_view text)
{
    return static_cast<size_t>(std::ranges::count_if(text, [](char ch) { return !isContinuationByte(ch); }));
}

std::vector<std::string> WrapTextToLines(std::string_view text, double maxWidth, double fontSize)
{
    const double charWidth = fontSize * CHAR_WIDTH_FACTOR;
    const double safeWidth = std::max(maxWidth, charWidth);
    const auto maxChars = std::max<size_t>(1, static_cast<size_t>(std::floor(safeWidth / charWidth)));

    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        auto paragraph = text.substr(start, end - start);
        if (!paragraph.empty() && paragraph.back() == '\r') paragraph.remove_suffix(1);
        wrapParagraph(paragraph, maxChars, lines);

        start = end + 1;
    }

    if (lines.empty()) lines.emplace_back();
    return lines;
}

} // namespace wire::layout
