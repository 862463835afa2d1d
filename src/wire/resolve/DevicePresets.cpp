/**
 * ************************************************************************
 *
 * @file DevicePresets.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 设备视口预设实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "DevicePresets.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace wire::resolve
{
namespace
{
struct DevicePreset
{
    std::string_view key;
    DeviceViewport viewport;
};

constexpr std::array<DevicePreset, 5> DEVICE_PRESETS = {{
    {"mobile", {375.0, 812.0}},   // iPhone SE
    {"tablet", {768.0, 1024.0}},  // 平板竖屏
    {"desktop", {1280.0, 720.0}}, // 桌面 HD
    {"print", {794.0, 1123.0}},   // A4 @96DPI
    {"a4", {794.0, 1123.0}},
}};

std::optional<DeviceViewport> findPreset(std::string_view device)
{
    std::string lowered(device);
    std::ranges::transform(
        lowered, lowered.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    auto it = std::ranges::find(DEVICE_PRESETS, std::string_view{lowered}, &DevicePreset::key);
    if (it == DEVICE_PRESETS.end()) return std::nullopt;
    return it->viewport;
}
} // namespace

DeviceViewport ResolveDevicePreset(std::string_view device)
{
    return findPreset(device).value_or(DeviceViewport{});
}

bool IsValidDevice(std::string_view device)
{
    return findPreset(device).has_value();
}

} // namespace wire::resolve
