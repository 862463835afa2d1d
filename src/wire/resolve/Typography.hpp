/**
 * ************************************************************************
 *
 * @file Typography.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 文本与标题的字号 / 行高度量
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string_view>
#include "../common/Policies.hpp"

namespace wire::resolve
{

struct TextMetrics
{
    double fontSize = 14.0;
    double lineHeight = 1.5; // 行高倍率
};

/**
 * @brief 正文度量 compact 12/1.4, normal 14/1.5, comfortable 16/1.6
 */
TextMetrics TextMetricsFor(policies::Density density);

/**
 * @brief 标题度量：密度基准字号乘以级别系数 (h1..h6)，最小 10px，行高 1.25
 * @param level 级别文本，无法识别时按 h2
 */
TextMetrics HeadingMetricsFor(policies::Density density, std::string_view level);

} // namespace wire::resolve
