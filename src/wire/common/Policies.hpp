/**
 * ************************************************************************
 *
 * @file Policies.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @brief wire 相关的全局枚举定义及其文本形式转换
 *
 * ************************************************************************
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace wire::policies
{

/**
 * @brief 容器类型枚举
 */
enum class ContainerKind : uint8_t
{
    STACK,
    GRID,
    SPLIT,
    PANEL,
    CARD
};

/**
 * @brief 密度等级 (影响间距与控件尺寸)
 */
enum class Density : uint8_t
{
    COMPACT,    // x0.8
    NORMAL,     // x1.0
    COMFORTABLE // x1.25
};

/**
 * @brief 布局方向枚举
 */
enum class LayoutDirection : uint8_t
{
    HORIZONTAL, // 0
    VERTICAL    // 1
};

/**
 * @brief 水平栈主轴对齐 (align 样式的 left/center/right/justify)
 */
enum class Alignment : uint8_t
{
    JUSTIFY, // 等宽铺满 (默认)
    LEFT,
    CENTER,
    RIGHT
};

/**
 * @brief 交叉轴对齐 (align 样式的 start/center/end)
 */
enum class CrossAlignment : uint8_t
{
    START,
    CENTER,
    END
};

/**
 * @brief 主轴分布方式 (justify 参数)
 */
enum class Justify : uint8_t
{
    STRETCH, // 等宽 (默认)
    START,
    CENTER,
    END,
    SPACE_BETWEEN,
    SPACE_AROUND
};

/**
 * @brief 宏定义类型
 */
enum class MacroKind : uint8_t
{
    COMPONENT,
    LAYOUT
};

// ===================== 文本转换 =====================

std::optional<ContainerKind> ParseContainerKind(std::string_view text);
std::string_view ToString(ContainerKind kind);

std::optional<Density> ParseDensity(std::string_view text);
std::string_view ToString(Density density);

std::optional<Alignment> ParseAlignment(std::string_view text);
std::optional<CrossAlignment> ParseCrossAlignment(std::string_view text);
std::optional<Justify> ParseJustify(std::string_view text);

std::string_view ToString(MacroKind kind);

} // namespace wire::policies
