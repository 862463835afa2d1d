/**
 * ************************************************************************
 *
 * @file ComponentCatalog.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 内置组件 / 布局目录数据
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "ComponentCatalog.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace wire::ir::catalog
{
namespace
{
constexpr std::array<std::string_view, 31> BUILT_IN_COMPONENTS = {
    "Button",    "Input",       "Heading",  "Text",     "Label",   "Image",   "Card",  "StatCard",
    "Topbar",    "Table",       "Chart",    "ChartPlaceholder", "Textarea", "Select", "Checkbox",
    "Toggle",    "Divider",     "Breadcrumbs", "SidebarMenu", "Radio", "Icon", "IconButton",
    "Alert",     "Badge",       "Modal",    "List",     "Sidebar", "Tabs",    "Code",  "Link",
    "Separate",
};

using Requirement = std::pair<std::string_view, std::string_view>;

// 组件类型 -> 必填且无默认值的属性
constexpr std::array<Requirement, 20> REQUIRED_COMPONENT_PROPERTIES = {{
    {"Heading", "text"},      {"Text", "text"},        {"Label", "text"},    {"Button", "text"},
    {"Link", "text"},         {"Badge", "text"},       {"Checkbox", "label"}, {"Radio", "label"},
    {"Toggle", "label"},      {"Topbar", "title"},     {"Modal", "title"},   {"SidebarMenu", "items"},
    {"Sidebar", "items"},     {"Breadcrumbs", "items"}, {"Tabs", "items"},   {"Table", "columns"},
    {"Chart", "type"},        {"Code", "code"},        {"Icon", "icon"},     {"IconButton", "icon"},
}};

// 布局类型 -> 必填参数
constexpr std::array<Requirement, 2> REQUIRED_LAYOUT_PARAMETERS = {{
    {"stack", "direction"},
    {"grid", "columns"},
}};

constexpr std::array<std::string_view, 4> STYLE_ONLY_KEYS = {"padding", "gap", "align", "justify"};

bool containsRequirement(std::span<const Requirement> table, std::string_view type, std::string_view name)
{
    return std::ranges::any_of(table,
                               [&](const Requirement& entry) { return entry.first == type && entry.second == name; });
}
} // namespace

std::span<const std::string_view> BuiltInComponents()
{
    return BUILT_IN_COMPONENTS;
}

bool IsBuiltInComponent(std::string_view componentType)
{
    return std::ranges::find(BUILT_IN_COMPONENTS, componentType) != BUILT_IN_COMPONENTS.end();
}

bool IsRequiredComponentProperty(std::string_view componentType, std::string_view property)
{
    return containsRequirement(REQUIRED_COMPONENT_PROPERTIES, componentType, property);
}

bool IsRequiredLayoutParameter(std::string_view layoutType, std::string_view parameter)
{
    return containsRequirement(REQUIRED_LAYOUT_PARAMETERS, layoutType, parameter);
}

bool IsStyleOnlyKey(std::string_view key)
{
    return std::ranges::find(STYLE_ONLY_KEYS, key) != STYLE_ONLY_KEYS.end();
}

} // namespace wire::ir::catalog
