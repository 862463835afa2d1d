/**
 * ************************************************************************
 *
 * @file Spacing.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 间距 token 与密度解析实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Spacing.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace wire::resolve
{
namespace
{
constexpr std::array<std::pair<std::string_view, int>, 6> SPACING_VALUES = {{
    {"none", 0},
    {"xs", 4},
    {"sm", 8},
    {"md", 16},
    {"lg", 24},
    {"xl", 32},
}};

constexpr int DEFAULT_SPACING = 16; // md
} // namespace

std::optional<int> SpacingBaseValue(std::string_view token)
{
    for (const auto& [name, value] : SPACING_VALUES)
    {
        if (name == token) return value;
    }
    return std::nullopt;
}

double DensityFactor(policies::Density density)
{
    switch (density)
    {
        case policies::Density::COMPACT:
            return 0.8;
        case policies::Density::COMFORTABLE:
            return 1.25;
        case policies::Density::NORMAL:
            break;
    }
    return 1.0;
}

int ResolveSpacingToken(std::optional<std::string_view> token,
                        std::string_view fallback,
                        policies::Density density,
                        bool densityAware)
{
    std::optional<int> base;
    if (token && !token->empty())
    {
        base = SpacingBaseValue(*token);
    }
    if (!base)
    {
        base = SpacingBaseValue(fallback).value_or(DEFAULT_SPACING);
    }

    if (!densityAware) return *base;
    return static_cast<int>(std::lround(static_cast<double>(*base) * DensityFactor(density)));
}

} // namespace wire::resolve
