/**
 * ************************************************************************
 *
 * @file DevicePresets.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 设备视口预设
 *
 * minHeight 只是基线高度，最终渲染高度随内容增长。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string_view>

namespace wire::resolve
{

struct DeviceViewport
{
    double width = 1280.0;
    double minHeight = 720.0;
};

/**
 * @brief 按名称 (不区分大小写) 查找预设，未知名称回退到 desktop
 */
DeviceViewport ResolveDevicePreset(std::string_view device);

/**
 * @brief 名称是否为已知预设
 */
bool IsValidDevice(std::string_view device);

} // namespace wire::resolve
