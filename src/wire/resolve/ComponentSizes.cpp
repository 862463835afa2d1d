/**
 * ************************************************************************
 *
 * @file ComponentSizes.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 控件尺寸查表实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "ComponentSizes.hpp"

#include <array>

namespace wire::resolve
{
namespace
{
// 行顺序: compact, normal, comfortable
constexpr std::array<std::array<int, 5>, 3> ICON_SIZES = {{
    {10, 12, 16, 20, 28}, // xs sm md lg xl
    {12, 14, 18, 24, 32},
    {14, 16, 20, 28, 36},
}};

constexpr std::array<std::array<int, 3>, 3> ICON_BUTTON_SIZES = {{
    {28, 32, 36}, // sm md lg
    {36, 40, 48},
    {40, 48, 56},
}};

constexpr std::array<int, 3> CONTROL_HEIGHTS = {32, 40, 48};

size_t densityRow(policies::Density density)
{
    return static_cast<size_t>(density);
}

int iconColumn(std::string_view size)
{
    if (size == "xs") return 0;
    if (size == "sm") return 1;
    if (size == "lg") return 3;
    if (size == "xl") return 4;
    return 2;
}

int iconButtonColumn(std::string_view size)
{
    if (size == "sm") return 0;
    if (size == "lg") return 2;
    return 1;
}
} // namespace

int ResolveIconSize(std::string_view size, policies::Density density)
{
    return ICON_SIZES.at(densityRow(density)).at(static_cast<size_t>(iconColumn(size)));
}

int ResolveIconButtonSize(std::string_view size, policies::Density density)
{
    return ICON_BUTTON_SIZES.at(densityRow(density)).at(static_cast<size_t>(iconButtonColumn(size)));
}

int ResolveControlHeight(policies::Density density)
{
    return CONTROL_HEIGHTS.at(densityRow(density));
}

} // namespace wire::resolve
