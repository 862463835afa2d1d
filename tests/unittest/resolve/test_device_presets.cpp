/**
 * ************************************************************************
 *
 * @file test_device_presets.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 设备视口预设单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <wire.hpp>

using namespace wire::resolve;

TEST(DevicePresetsTest, KnownPresets)
{
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("mobile").width, 375.0);
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("mobile").minHeight, 812.0);
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("tablet").width, 768.0);
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("desktop").minHeight, 720.0);
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("print").minHeight, 1123.0);
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("a4").width, 794.0);
}

// 大小写不敏感
TEST(DevicePresetsTest, CaseInsensitive)
{
    EXPECT_DOUBLE_EQ(ResolveDevicePreset("Mobile").width, 375.0);
    EXPECT_TRUE(IsValidDevice("TABLET"));
}

// 未知设备回退到 desktop
TEST(DevicePresetsTest, UnknownFallsBackToDesktop)
{
    const auto viewport = ResolveDevicePreset("watch");
    EXPECT_DOUBLE_EQ(viewport.width, 1280.0);
    EXPECT_DOUBLE_EQ(viewport.minHeight, 720.0);
    EXPECT_FALSE(IsValidDevice("watch"));
    EXPECT_FALSE(IsValidDevice(""));
}
