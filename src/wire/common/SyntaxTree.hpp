/**
 * ************************************************************************
 *
 * @file SyntaxTree.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 外部解析器产出的语法树结构
 *
 * 只描述 IR 生成器需要的形状：项目 / 宏定义 / 屏幕 / 布局 / 单元格 / 组件。
 * 语法树由解析器一次性生成，本模块只读。
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
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "Types.hpp"

namespace wire::ast
{

struct Node;

/**
 * @brief 组件节点 (叶子)
 */
struct Component
{
    std::string componentType;
    AstPropertyMap props;
    std::optional<std::string> nodeId; // SourceMap 追踪 id
};

/**
 * @brief 布局节点 (stack/grid/... 或自定义布局名)
 */
struct Layout
{
    std::string layoutType;
    AstPropertyMap params;
    std::vector<Node> children;
    std::optional<std::string> nodeId;
};

/**
 * @brief 网格单元格
 */
struct Cell
{
    AstPropertyMap props;
    std::vector<Node> children;
    std::optional<std::string> nodeId;
};

/**
 * @brief 子节点：组件 / 布局 / 单元格 三选一
 */
struct Node
{
    std::variant<Component, Layout, Cell> value;
};

/**
 * @brief define Component "Name" { ... }
 */
struct DefinedComponent
{
    std::string name;
    Node body; // 合法的主体只能是 Layout 或 Component
    std::optional<std::string> nodeId;
};

/**
 * @brief define Layout "Name" { ... }
 */
struct DefinedLayout
{
    std::string name;
    Layout body;
    std::optional<std::string> nodeId;
};

struct Screen
{
    std::string name;
    AstPropertyMap params;
    Layout layout;
    std::optional<std::string> nodeId;
};

/**
 * @brief 语法树根节点
 */
struct Project
{
    std::string name;
    std::map<std::string, std::string> style;
    nlohmann::json mocks = nlohmann::json::object();
    std::map<std::string, std::string> colors;
    std::vector<DefinedComponent> definedComponents;
    std::vector<DefinedLayout> definedLayouts;
    std::vector<Screen> screens;
};

} // namespace wire::ast
