/**
 * ************************************************************************
 *
 * @file ComponentSizes.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 按密度查表的控件尺寸 (图标 / 图标按钮 / 通用控件行高)
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

/**
 * @brief 图标边长 (xs..xl)，未知尺寸按 md
 */
int ResolveIconSize(std::string_view size, policies::Density density);

/**
 * @brief 图标按钮边长 (sm..lg)，未知尺寸按 md
 */
int ResolveIconButtonSize(std::string_view size, policies::Density density);

/**
 * @brief 通用控件的默认行高 compact 32 / normal 40 / comfortable 48
 */
int ResolveControlHeight(policies::Density density);

} // namespace wire::resolve
