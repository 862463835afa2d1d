/**
 * ************************************************************************
 *
 * @file Types.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief wire 模块核心值类型定义
 *
 * 属性值、绑定参数、布局盒等在语法树、IR 与布局结果之间共享的基础类型。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wire
{

// ===================== 属性值 =====================

/**
 * @brief 标量属性值（字符串或数字）
 */
using Scalar = std::variant<std::string, double>;

/**
 * @brief 宏参数绑定 (源码中以 prop_ 前缀书写)
 */
struct BoundArgument
{
    std::string name;

    bool operator==(const BoundArgument&) const = default;
};

/**
 * @brief 语法树中的属性值：字面量或绑定参数
 */
using AstValue = std::variant<std::string, double, BoundArgument>;

/**
 * @brief 已解析的属性表 (IR 中的 props / params)
 */
using PropertyMap = std::map<std::string, Scalar>;

/**
 * @brief 语法树中的原始属性表
 */
using AstPropertyMap = std::map<std::string, AstValue>;

/**
 * @brief 绑定参数在源码中的前缀标记
 */
inline constexpr std::string_view BINDING_PREFIX = "prop_";

// ===================== 布局结果 =====================

/**
 * @brief 节点的绝对位置与尺寸 (相对所在屏幕原点, 单位 px)
 */
struct LayoutBox
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool operator==(const LayoutBox&) const = default;
};

// ===================== 工具 =====================

/**
 * @brief std::visit 的多 lambda 组合器
 */
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

/**
 * @brief 将标量转换为数字 (字符串按十进制解析)，失败返回 nullopt
 */
std::optional<double> ToNumber(const Scalar& value);

/**
 * @brief 将标量转换为字符串 (整数不带小数部分)
 */
std::string ToString(const Scalar& value);

/**
 * @brief 在属性表中查找键并返回字符串形式
 */
std::optional<std::string> FindString(const PropertyMap& props, const std::string& key);

/**
 * @brief 在属性表中查找键并返回数字；0 和非法值视为缺失
 */
std::optional<double> FindPositiveNumber(const PropertyMap& props, const std::string& key);

} // namespace wire
