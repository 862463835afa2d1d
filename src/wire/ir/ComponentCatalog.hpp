/**
 * ************************************************************************
 *
 * @file ComponentCatalog.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 内置组件 / 布局目录
 *
 * 提供两类查询：
 *  - 组件类型名是否为内置组件 (允许列表)
 *  - 某个组件属性 / 布局参数是否为 "必填且无默认值"，决定缺失绑定是错误还是警告
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <span>
#include <string_view>

namespace wire::ir::catalog
{

/**
 * @brief 内置组件类型名列表
 */
std::span<const std::string_view> BuiltInComponents();

bool IsBuiltInComponent(std::string_view componentType);

/**
 * @brief 组件属性是否必填且无默认值
 */
bool IsRequiredComponentProperty(std::string_view componentType, std::string_view property);

/**
 * @brief 布局参数是否必填且无默认值 (未知布局类型一律非必填)
 */
bool IsRequiredLayoutParameter(std::string_view layoutType, std::string_view parameter);

/**
 * @brief 只属于样式、不进入容器 params 的键
 */
bool IsStyleOnlyKey(std::string_view key);

} // namespace wire::ir::catalog
