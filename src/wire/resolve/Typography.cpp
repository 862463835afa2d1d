/**
 * ************************************************************************
 *
 * @file Typography.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 文本度量实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Typography.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace wire::resolve
{
namespace
{
constexpr double HEADING_LINE_HEIGHT = 1.25;
constexpr double MIN_HEADING_FONT_SIZE = 10.0;

double headingBaseFontSize(policies::Density density)
{
    switch (density)
    {
        case policies::Density::COMPACT:
            return 16.0;
        case policies::Density::COMFORTABLE:
            return 24.0;
        case policies::Density::NORMAL:
            break;
    }
    return 20.0;
}

double headingLevelScale(std::string_view level)
{
    std::string normalized;
    for (char ch : level)
    {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0)
        {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }

    if (normalized == "h1") return 1.4;
    if (normalized == "h3") return 0.85;
    if (normalized == "h4") return 0.75;
    if (normalized == "h5") return 0.65;
    if (normalized == "h6") return 0.55;
    return 1.0; // h2
}
} // namespace

TextMetrics TextMetricsFor(policies::Density density)
{
    switch (density)
    {
        case policies::Density::COMPACT:
            return {.fontSize = 12.0, .lineHeight = 1.4};
        case policies::Density::COMFORTABLE:
            return {.fontSize = 16.0, .lineHeight = 1.6};
        case policies::Density::NORMAL:
            break;
    }
    return {.fontSize = 14.0, .lineHeight = 1.5};
}

TextMetrics HeadingMetricsFor(policies::Density density, std::string_view level)
{
    const double fontSize =
        std::max(MIN_HEADING_FONT_SIZE, std::round(headingBaseFontSize(density) * headingLevelScale(level)));
    return {.fontSize = fontSize, .lineHeight = HEADING_LINE_HEIGHT};
}

} // namespace wire::resolve
