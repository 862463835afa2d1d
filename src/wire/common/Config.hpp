/**
 * ************************************************************************
 *
 * @file Config.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 布局引擎可调参数
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

namespace wire
{

struct LayoutOptions
{
    double fallbackViewportWidth = 1280.0;  // 屏幕未给出视口时使用
    double fallbackViewportHeight = 720.0;
    double defaultSidebarWidth = 260.0;     // split 固定侧栏宽度
};

} // namespace wire
