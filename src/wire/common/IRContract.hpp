/**
 * ************************************************************************
 *
 * @file IRContract.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 中间表示 (IR) 契约定义
 *
 * IR 是一张扁平的节点表，子节点通过 {ref: id} 引用。
 *  - 容器节点与组件节点是互斥的两种变体
 *  - 所有 ref 都指向节点表中已存在的键
 *  - 节点表在生成期间只追加，不修改
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
#include <vector>
#include <nlohmann/json.hpp>
#include "Policies.hpp"
#include "Types.hpp"

namespace wire::ir
{

inline constexpr std::string_view IR_VERSION = "1.0";

/**
 * @brief 项目级样式 (带默认值)
 */
struct IRStyle
{
    std::string density = "normal";
    std::string spacing = "md";
    std::string radius = "md";
    std::string stroke = "normal";
    std::string font = "base";
    std::optional<std::string> background;
    std::optional<std::string> theme;
    std::optional<std::string> device;

    bool operator==(const IRStyle&) const = default;
};

/**
 * @brief 节点级样式
 */
struct NodeStyle
{
    std::optional<std::string> padding;
    std::optional<std::string> gap;
    std::optional<std::string> align;
    std::optional<std::string> justify;
    std::optional<std::string> background;

    bool operator==(const NodeStyle&) const = default;
};

struct NodeMeta
{
    std::optional<std::string> source; // "cell" 表示网格单元格
    std::optional<std::string> nodeId; // SourceMap 追踪 id

    bool operator==(const NodeMeta&) const = default;
};

struct NodeRef
{
    std::string ref;

    bool operator==(const NodeRef&) const = default;
};

struct ContainerNode
{
    std::string id;
    policies::ContainerKind containerType = policies::ContainerKind::STACK;
    PropertyMap params;
    std::vector<NodeRef> children;
    NodeStyle style;
    NodeMeta meta;

    bool operator==(const ContainerNode&) const = default;
};

struct ComponentNode
{
    std::string id;
    std::string componentType;
    PropertyMap props;
    NodeStyle style;
    NodeMeta meta;

    bool operator==(const ComponentNode&) const = default;
};

/**
 * @brief IR 节点 (和类型)
 */
using Node = std::variant<ContainerNode, ComponentNode>;

using NodeMap = std::map<std::string, Node>;

struct Viewport
{
    double width = 0.0;
    double height = 0.0; // 最小高度基线

    bool operator==(const Viewport&) const = default;
};

struct IRScreen
{
    std::string id;
    std::string name;
    Viewport viewport;
    std::optional<std::string> background;
    NodeRef root;

    bool operator==(const IRScreen&) const = default;
};

struct IRProject
{
    std::string id;
    std::string name;
    IRStyle style;
    nlohmann::json mocks = nlohmann::json::object();
    std::map<std::string, std::string> colors;
    std::vector<IRScreen> screens;
    NodeMap nodes;

    bool operator==(const IRProject&) const = default;
};

struct IRContract
{
    std::string irVersion{IR_VERSION};
    IRProject project;

    bool operator==(const IRContract&) const = default;
};

// ===================== 访问辅助 =====================

/**
 * @brief 取节点 id
 */
inline const std::string& IdOf(const Node& node)
{
    return std::visit([](const auto& value) -> const std::string& { return value.id; }, node);
}

/**
 * @brief 节点表中查找节点，不存在返回 nullptr
 */
inline const Node* FindNode(const NodeMap& nodes, const std::string& id)
{
    auto it = nodes.find(id);
    return it != nodes.end() ? &it->second : nullptr;
}

} // namespace wire::ir
