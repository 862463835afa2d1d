/**
 * ************************************************************************
 *
 * @file SyntaxTreeBuilder.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 测试用语法树构造辅助
 *
 * 用简短的工厂函数拼出解析器产出的语法树，避免每个测试手写嵌套结构
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <wire.hpp>

namespace wire::tests
{

inline AstValue Bind(std::string name)
{
    return BoundArgument{std::move(name)};
}

inline ast::Node Comp(std::string type, AstPropertyMap props = {})
{
    return ast::Node{ast::Component{.componentType = std::move(type), .props = std::move(props)}};
}

inline ast::Layout Lay(std::string type, AstPropertyMap params = {}, std::vector<ast::Node> children = {})
{
    return ast::Layout{.layoutType = std::move(type), .params = std::move(params), .children = std::move(children)};
}

inline ast::Node LayNode(std::string type, AstPropertyMap params = {}, std::vector<ast::Node> children = {})
{
    return ast::Node{Lay(std::move(type), std::move(params), std::move(children))};
}

inline ast::Node CellNode(AstPropertyMap props, std::vector<ast::Node> children)
{
    return ast::Node{ast::Cell{.props = std::move(props), .children = std::move(children)}};
}

inline ast::Screen MakeScreen(std::string name, ast::Layout layout, AstPropertyMap params = {})
{
    return ast::Screen{.name = std::move(name), .params = std::move(params), .layout = std::move(layout)};
}

inline ast::Project MakeProject(std::vector<ast::Screen> screens, std::map<std::string, std::string> style = {})
{
    ast::Project project;
    project.name = "Test App";
    project.style = std::move(style);
    project.screens = std::move(screens);
    return project;
}

/**
 * @brief 单屏项目，根布局为 root
 */
inline ast::Project SingleScreen(ast::Layout root, std::map<std::string, std::string> style = {})
{
    std::vector<ast::Screen> screens;
    screens.push_back(MakeScreen("Main", std::move(root)));
    return MakeProject(std::move(screens), std::move(style));
}

/**
 * @brief 按类型收集组件节点 (节点表顺序)
 */
inline std::vector<const ir::ComponentNode*> ComponentsOfType(const ir::IRContract& contract, std::string_view type)
{
    std::vector<const ir::ComponentNode*> result;
    for (const auto& [id, node] : contract.project.nodes)
    {
        if (const auto* component = std::get_if<ir::ComponentNode>(&node); component && component->componentType == type)
        {
            result.push_back(component);
        }
    }
    return result;
}

inline const ir::ContainerNode& RootOf(const ir::IRContract& contract, size_t screen = 0)
{
    return std::get<ir::ContainerNode>(contract.project.nodes.at(contract.project.screens.at(screen).root.ref));
}

inline const ir::Node& ChildOf(const ir::IRContract& contract, const ir::ContainerNode& parent, size_t index)
{
    return contract.project.nodes.at(parent.children.at(index).ref);
}

} // namespace wire::tests
