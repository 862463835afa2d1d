/**
 * ************************************************************************
 *
 * @file Json.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief JSON 编解码实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Json.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>

#include "../ir/ContractValidator.hpp"
#include "../singleton/Logger.hpp"

namespace wire::serialization
{
namespace
{
using nlohmann::json;

/**
 * @brief 结构不符合约定 (json 本身合法)
 */
class FormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// ===================== 写出 =====================

json scalarToJson(const Scalar& value)
{
    return std::visit(Overloaded{[](const std::string& text) { return json(text); },
                                 [](double number)
                                 {
                                     if (std::isfinite(number) && std::trunc(number) == number &&
                                         std::abs(number) < 9.0e15)
                                     {
                                         return json(static_cast<int64_t>(number));
                                     }
                                     return json(number);
                                 }},
                      value);
}

json propertiesToJson(const PropertyMap& props)
{
    json result = json::object();
    for (const auto& [key, value] : props)
    {
        result[key] = scalarToJson(value);
    }
    return result;
}

template <typename T>
void putOptional(json& target, const char* key, const std::optional<T>& value)
{
    if (value) target[key] = *value;
}

json styleToJson(const ir::NodeStyle& style)
{
    json result = json::object();
    putOptional(result, "padding", style.padding);
    putOptional(result, "gap", style.gap);
    putOptional(result, "align", style.align);
    putOptional(result, "justify", style.justify);
    putOptional(result, "background", style.background);
    return result;
}

json metaToJson(const ir::NodeMeta& meta)
{
    json result = json::object();
    putOptional(result, "source", meta.source);
    putOptional(result, "nodeId", meta.nodeId);
    return result;
}

json nodeToJson(const ir::Node& node)
{
    return std::visit(Overloaded{[](const ir::ContainerNode& container)
                                 {
                                     json children = json::array();
                                     for (const auto& child : container.children)
                                     {
                                         children.push_back(json{{"ref", child.ref}});
                                     }
                                     return json{{"id", container.id},
                                                 {"kind", "container"},
                                                 {"containerType", std::string(policies::ToString(container.containerType))},
                                                 {"params", propertiesToJson(container.params)},
                                                 {"children", std::move(children)},
                                                 {"style", styleToJson(container.style)},
                                                 {"meta", metaToJson(container.meta)}};
                                 },
                                 [](const ir::ComponentNode& component)
                                 {
                                     return json{{"id", component.id},
                                                 {"kind", "component"},
                                                 {"componentType", component.componentType},
                                                 {"props", propertiesToJson(component.props)},
                                                 {"style", styleToJson(component.style)},
                                                 {"meta", metaToJson(component.meta)}};
                                 }},
                      node);
}

json projectStyleToJson(const ir::IRStyle& style)
{
    json result = {{"density", style.density},
                   {"spacing", style.spacing},
                   {"radius", style.radius},
                   {"stroke", style.stroke},
                   {"font", style.font}};
    putOptional(result, "background", style.background);
    putOptional(result, "theme", style.theme);
    putOptional(result, "device", style.device);
    return result;
}

json screenToJson(const ir::IRScreen& screen)
{
    json result = {{"id", screen.id},
                   {"name", screen.name},
                   {"viewport", {{"width", screen.viewport.width}, {"height", screen.viewport.height}}},
                   {"root", {{"ref", screen.root.ref}}}};
    putOptional(result, "background", screen.background);
    return result;
}

// ===================== 读取 =====================

Scalar scalarFromJson(const json& value)
{
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return std::string(value.get<bool>() ? "true" : "false");
    throw FormatError(std::format("expected a string or number, got {}", value.type_name()));
}

PropertyMap propertiesFromJson(const json& object)
{
    PropertyMap props;
    for (const auto& [key, value] : object.items())
    {
        props.emplace(key, scalarFromJson(value));
    }
    return props;
}

std::optional<std::string> optionalString(const json& object, const char* key)
{
    if (!object.contains(key) || object.at(key).is_null()) return std::nullopt;
    return object.at(key).get<std::string>();
}

ir::NodeStyle nodeStyleFromJson(const json& object)
{
    return ir::NodeStyle{.padding = optionalString(object, "padding"),
                         .gap = optionalString(object, "gap"),
                         .align = optionalString(object, "align"),
                         .justify = optionalString(object, "justify"),
                         .background = optionalString(object, "background")};
}

ir::NodeMeta nodeMetaFromJson(const json& object)
{
    return ir::NodeMeta{.source = optionalString(object, "source"), .nodeId = optionalString(object, "nodeId")};
}

ir::Node nodeFromJson(const json& object)
{
    const auto kind = object.at("kind").get<std::string>();
    const json empty = json::object();

    if (kind == "container")
    {
        const auto typeName = object.at("containerType").get<std::string>();
        const auto containerType = policies::ParseContainerKind(typeName);
        if (!containerType) throw FormatError(std::format("unknown containerType \"{}\"", typeName));

        ir::ContainerNode node;
        node.id = object.at("id").get<std::string>();
        node.containerType = *containerType;
        node.params = propertiesFromJson(object.value("params", empty));
        for (const auto& child : object.at("children"))
        {
            node.children.push_back(ir::NodeRef{child.at("ref").get<std::string>()});
        }
        node.style = nodeStyleFromJson(object.value("style", empty));
        node.meta = nodeMetaFromJson(object.value("meta", empty));
        return node;
    }

    if (kind == "component")
    {
        ir::ComponentNode node;
        node.id = object.at("id").get<std::string>();
        node.componentType = object.at("componentType").get<std::string>();
        node.props = propertiesFromJson(object.value("props", empty));
        node.style = nodeStyleFromJson(object.value("style", empty));
        node.meta = nodeMetaFromJson(object.value("meta", empty));
        return node;
    }

    throw FormatError(std::format("unknown node kind \"{}\"", kind));
}

ir::IRStyle projectStyleFromJson(const json& object)
{
    ir::IRStyle style;
    style.density = object.at("density").get<std::string>();
    style.spacing = object.at("spacing").get<std::string>();
    style.radius = object.at("radius").get<std::string>();
    style.stroke = object.at("stroke").get<std::string>();
    style.font = object.at("font").get<std::string>();
    style.background = optionalString(object, "background");
    style.theme = optionalString(object, "theme");
    style.device = optionalString(object, "device");
    return style;
}

ir::IRScreen screenFromJson(const json& object)
{
    ir::IRScreen screen;
    screen.id = object.at("id").get<std::string>();
    screen.name = object.at("name").get<std::string>();
    screen.viewport.width = object.at("viewport").at("width").get<double>();
    screen.viewport.height = object.at("viewport").at("height").get<double>();
    screen.background = optionalString(object, "background");
    screen.root.ref = object.at("root").at("ref").get<std::string>();
    return screen;
}

// ---------- 语法树 ----------

AstValue astValueFromJson(const json& value)
{
    if (value.is_string())
    {
        auto text = value.get<std::string>();
        if (text.starts_with(BINDING_PREFIX)) return BoundArgument{text.substr(BINDING_PREFIX.size())};
        return text;
    }
    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return std::string(value.get<bool>() ? "true" : "false");
    throw FormatError(std::format("expected a string or number, got {}", value.type_name()));
}

AstPropertyMap astPropertiesFromJson(const json& object, const char* key)
{
    AstPropertyMap props;
    if (!object.contains(key)) return props;
    for (const auto& [name, value] : object.at(key).items())
    {
        props.emplace(name, astValueFromJson(value));
    }
    return props;
}

std::optional<std::string> sourceNodeId(const json& object)
{
    if (!object.contains("_meta")) return std::nullopt;
    return optionalString(object.at("_meta"), "nodeId");
}

ast::Node astNodeFromJson(const json& object);

std::vector<ast::Node> astChildrenFromJson(const json& object)
{
    std::vector<ast::Node> children;
    if (!object.contains("children")) return children;
    for (const auto& child : object.at("children"))
    {
        children.push_back(astNodeFromJson(child));
    }
    return children;
}

ast::Layout astLayoutFromJson(const json& object)
{
    return ast::Layout{.layoutType = object.at("layoutType").get<std::string>(),
                       .params = astPropertiesFromJson(object, "params"),
                       .children = astChildrenFromJson(object),
                       .nodeId = sourceNodeId(object)};
}

ast::Node astNodeFromJson(const json& object)
{
    const auto type = object.at("type").get<std::string>();
    if (type == "layout") return ast::Node{astLayoutFromJson(object)};
    if (type == "component")
    {
        return ast::Node{ast::Component{.componentType = object.at("componentType").get<std::string>(),
                                        .props = astPropertiesFromJson(object, "props"),
                                        .nodeId = sourceNodeId(object)}};
    }
    if (type == "cell")
    {
        return ast::Node{ast::Cell{.props = astPropertiesFromJson(object, "props"),
                                   .children = astChildrenFromJson(object),
                                   .nodeId = sourceNodeId(object)}};
    }
    throw FormatError(std::format("unknown syntax node type \"{}\"", type));
}

std::map<std::string, std::string> stringMapFromJson(const json& object, const char* key)
{
    std::map<std::string, std::string> result;
    if (!object.contains(key)) return result;
    for (const auto& [name, value] : object.at(key).items())
    {
        result.emplace(name, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return result;
}
} // namespace

nlohmann::json ToJson(const ir::IRContract& contract)
{
    const auto& project = contract.project;

    json screens = json::array();
    for (const auto& screen : project.screens)
    {
        screens.push_back(screenToJson(screen));
    }

    json nodes = json::object();
    for (const auto& [id, node] : project.nodes)
    {
        nodes[id] = nodeToJson(node);
    }

    return {{"irVersion", contract.irVersion},
            {"project",
             {{"id", project.id},
              {"name", project.name},
              {"style", projectStyleToJson(project.style)},
              {"mocks", project.mocks},
              {"colors", project.colors},
              {"screens", std::move(screens)},
              {"nodes", std::move(nodes)}}}};
}

nlohmann::json ToJson(const layout::PositionMap& positions)
{
    json result = json::object();
    for (const auto& [id, box] : positions)
    {
        result[id] = {{"x", box.x}, {"y", box.y}, {"width", box.width}, {"height", box.height}};
    }
    return result;
}

std::expected<ir::IRContract, SerializationError> ContractFromJson(const nlohmann::json& json)
{
    ir::IRContract contract;
    try
    {
        contract.irVersion = json.at("irVersion").get<std::string>();

        const auto& project = json.at("project");
        contract.project.id = project.at("id").get<std::string>();
        contract.project.name = project.at("name").get<std::string>();
        contract.project.style = projectStyleFromJson(project.at("style"));
        contract.project.mocks = project.value("mocks", nlohmann::json::object());
        contract.project.colors = stringMapFromJson(project, "colors");
        for (const auto& screen : project.at("screens"))
        {
            contract.project.screens.push_back(screenFromJson(screen));
        }
        for (const auto& [id, node] : project.at("nodes").items())
        {
            contract.project.nodes.emplace(id, nodeFromJson(node));
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        Logger::error("[Json] IR 契约读取失败: {}", e.what());
        return std::unexpected(SerializationError{e.what()});
    }
    catch (const FormatError& e)
    {
        Logger::error("[Json] IR 契约格式错误: {}", e.what());
        return std::unexpected(SerializationError{e.what()});
    }

    if (auto problems = ir::ValidateContract(contract); !problems.empty())
    {
        std::string message = "IR contract validation failed:";
        for (const auto& problem : problems)
        {
            message += "\n- " + problem.message;
        }
        return std::unexpected(SerializationError{std::move(message)});
    }
    return contract;
}

std::expected<ast::Project, SerializationError> SyntaxTreeFromJson(const nlohmann::json& json)
{
    try
    {
        ast::Project project;
        project.name = json.at("name").get<std::string>();
        project.style = stringMapFromJson(json, "style");
        project.mocks = json.value("mocks", nlohmann::json::object());
        project.colors = stringMapFromJson(json, "colors");

        for (const auto& definition : json.value("definedComponents", nlohmann::json::array()))
        {
            project.definedComponents.push_back(ast::DefinedComponent{.name = definition.at("name").get<std::string>(),
                                                                      .body = astNodeFromJson(definition.at("body")),
                                                                      .nodeId = sourceNodeId(definition)});
        }
        for (const auto& definition : json.value("definedLayouts", nlohmann::json::array()))
        {
            project.definedLayouts.push_back(ast::DefinedLayout{.name = definition.at("name").get<std::string>(),
                                                                .body = astLayoutFromJson(definition.at("body")),
                                                                .nodeId = sourceNodeId(definition)});
        }
        for (const auto& screen : json.at("screens"))
        {
            project.screens.push_back(ast::Screen{.name = screen.at("name").get<std::string>(),
                                                  .params = astPropertiesFromJson(screen, "params"),
                                                  .layout = astLayoutFromJson(screen.at("layout")),
                                                  .nodeId = sourceNodeId(screen)});
        }
        return project;
    }
    catch (const nlohmann::json::exception& e)
    {
        Logger::error("[Json] 语法树读取失败: {}", e.what());
        return std::unexpected(SerializationError{e.what()});
    }
    catch (const FormatError& e)
    {
        Logger::error("[Json] 语法树格式错误: {}", e.what());
        return std::unexpected(SerializationError{e.what()});
    }
}

} // namespace wire::serialization
