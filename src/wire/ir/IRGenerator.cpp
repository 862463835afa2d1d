/**
 * ************************************************************************
 *
 * @file IRGenerator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief IR 生成器实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "IRGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

#include "../resolve/DevicePresets.hpp"
#include "../singleton/Logger.hpp"
#include "ComponentCatalog.hpp"
#include "ContractValidator.hpp"

namespace wire::ir
{
namespace
{
constexpr std::string_view CHILDREN_SLOT = "Children";
constexpr std::string_view NODE_PREFIX = "node";
constexpr std::string_view DEFAULT_DEVICE = "desktop";

bool isWarning(DiagnosticCode code)
{
    return code == DiagnosticCode::MissingBoundValue || code == DiagnosticCode::UnusedDefinitionArgument;
}

/**
 * @brief 语法树中字面量值转为字符串 (绑定值保留原始标记)
 */
std::string literalToString(const AstValue& value)
{
    return std::visit(Overloaded{[](const std::string& text) { return text; },
                                 [](double number) { return ToString(Scalar{number}); },
                                 [](const BoundArgument& bound)
                                 { return std::string(BINDING_PREFIX) + bound.name; }},
                      value);
}

PropertyMap stripStyleKeys(const PropertyMap& params)
{
    PropertyMap cleaned;
    for (const auto& [key, value] : params)
    {
        if (!catalog::IsStyleOnlyKey(key)) cleaned.emplace(key, value);
    }
    return cleaned;
}
} // namespace

std::string SanitizeId(std::string_view name)
{
    std::string result;
    result.reserve(name.size());

    bool inWhitespace = false;
    for (char raw : name)
    {
        const auto ch = static_cast<unsigned char>(raw);
        if (std::isspace(ch) != 0)
        {
            // 连续空白折叠为一个下划线
            if (!inWhitespace) result.push_back('_');
            inWhitespace = true;
            continue;
        }
        inWhitespace = false;

        const char lowered = static_cast<char>(std::tolower(ch));
        if ((lowered >= 'a' && lowered <= 'z') || (lowered >= '0' && lowered <= '9') || lowered == '_')
        {
            result.push_back(lowered);
        }
    }
    return result;
}

std::expected<IRContract, CompositionError> GenerateIR(const ast::Project& tree)
{
    IRGenerator generator;
    return generator.generate(tree);
}

// ===================== 主流程 =====================

std::expected<IRContract, CompositionError> IRGenerator::generate(const ast::Project& tree)
{
    reset();
    Logger::debug("[IRGenerator] 开始生成项目 \"{}\" ({} 个屏幕)", tree.name, tree.screens.size());

    // 1. 登记符号表，先于任何屏幕，允许提前使用
    registerDefinitions(tree);

    // 2. 项目样式
    applyStyle(tree.style);

    // 3. 逐屏降级
    std::vector<IRScreen> screens;
    screens.reserve(tree.screens.size());
    for (size_t index = 0; index < tree.screens.size(); ++index)
    {
        screens.push_back(convertScreen(tree.screens[index], index));
    }

    // 4. 未定义组件
    if (!m_undefinedComponents.empty())
    {
        CompositionError error{.failure = CompositionFailure::UndefinedComponentsUsed,
                               .diagnostics = m_errors,
                               .undefinedComponents = {m_undefinedComponents.begin(), m_undefinedComponents.end()}};
        Logger::error("[IRGenerator] {}", error.message());
        return std::unexpected(std::move(error));
    }

    // 5. 语义错误
    if (!m_errors.empty())
    {
        CompositionError error{.failure = CompositionFailure::CompositionFailed, .diagnostics = m_errors};
        Logger::error("[IRGenerator] {}", error.message());
        return std::unexpected(std::move(error));
    }

    IRContract contract;
    contract.project.id = SanitizeId(tree.name);
    contract.project.name = tree.name;
    contract.project.style = m_style;
    contract.project.mocks = tree.mocks.is_null() ? nlohmann::json::object() : tree.mocks;
    contract.project.colors = tree.colors;
    contract.project.screens = std::move(screens);
    contract.project.nodes = std::move(m_nodes);
    m_nodes.clear();

    // 6. 结构校验
    if (auto problems = ValidateContract(contract); !problems.empty())
    {
        CompositionError error{.failure = CompositionFailure::InvalidContract, .diagnostics = std::move(problems)};
        Logger::error("[IRGenerator] {}", error.message());
        return std::unexpected(std::move(error));
    }

    Logger::debug("[IRGenerator] 生成完成: {} 个节点, {} 条警告", contract.project.nodes.size(), m_warnings.size());
    return contract;
}

void IRGenerator::reset()
{
    m_idGen.reset();
    m_nodes.clear();
    m_style = IRStyle{};
    m_definedComponents.clear();
    m_definedLayouts.clear();
    m_undefinedComponents.clear();
    m_errors.clear();
    m_warnings.clear();
}

void IRGenerator::registerDefinitions(const ast::Project& tree)
{
    for (const auto& definition : tree.definedComponents)
    {
        m_definedComponents.insert_or_assign(definition.name, &definition);
    }
    for (const auto& definition : tree.definedLayouts)
    {
        m_definedLayouts.insert_or_assign(definition.name, &definition);
    }
}

void IRGenerator::applyStyle(const std::map<std::string, std::string>& style)
{
    auto assign = [&style](const char* key, std::string& target)
    {
        if (auto it = style.find(key); it != style.end() && !it->second.empty()) target = it->second;
    };
    auto assignOptional = [&style](const char* key, std::optional<std::string>& target)
    {
        if (auto it = style.find(key); it != style.end() && !it->second.empty()) target = it->second;
    };

    assign("density", m_style.density);
    assign("spacing", m_style.spacing);
    assign("radius", m_style.radius);
    assign("stroke", m_style.stroke);
    assign("font", m_style.font);
    assignOptional("background", m_style.background);
    assignOptional("theme", m_style.theme);
    assignOptional("device", m_style.device);
}

IRScreen IRGenerator::convertScreen(const ast::Screen& screen, size_t index)
{
    IRScreen result;
    result.root.ref = lowerLayout(screen.layout, nullptr);
    result.id = SanitizeId(screen.name);
    // 名称全部由非 ASCII 字符或标点组成时按屏幕序号生成 id
    if (result.id.empty()) result.id = std::format("screen_{}", index + 1);
    result.name = screen.name;

    // 视口只取决于设备预设，与内容无关
    const auto viewport = resolve::ResolveDevicePreset(m_style.device.value_or(std::string(DEFAULT_DEVICE)));
    result.viewport = Viewport{.width = viewport.width, .height = viewport.minHeight};

    if (auto it = screen.params.find("background"); it != screen.params.end())
    {
        result.background = literalToString(it->second);
    }
    else if (m_style.background)
    {
        result.background = m_style.background;
    }
    return result;
}

// ===================== 节点降级 =====================

std::optional<std::string> IRGenerator::lowerNode(const ast::Node& node, const ExpansionContext* context)
{
    return std::visit(Overloaded{[&](const ast::Layout& layout) -> std::optional<std::string>
                                 { return lowerLayout(layout, context); },
                                 [&](const ast::Cell& cell) -> std::optional<std::string>
                                 { return lowerCell(cell, context); },
                                 [&](const ast::Component& component) { return lowerComponent(component, context); }},
                      node.value);
}

std::vector<NodeRef> IRGenerator::lowerChildren(const std::vector<ast::Node>& children,
                                                const ExpansionContext* context)
{
    std::vector<NodeRef> refs;
    refs.reserve(children.size());
    for (const auto& child : children)
    {
        if (auto childId = lowerNode(child, context))
        {
            refs.push_back(NodeRef{std::move(*childId)});
        }
    }
    return refs;
}

std::string IRGenerator::lowerLayout(const ast::Layout& layout, const ExpansionContext* context)
{
    auto params = resolveProperties(layout.params, context, BindingTarget::LAYOUT_PARAMETER, layout.layoutType);

    if (auto it = m_definedLayouts.find(layout.layoutType); it != m_definedLayouts.end())
    {
        return expandDefinedLayout(*it->second, params, layout.children, context);
    }

    const auto containerType = policies::ParseContainerKind(layout.layoutType);
    if (!containerType)
    {
        report(DiagnosticCode::UnknownContainerType,
               std::format("Layout \"{}\" is neither a built-in container (stack, grid, split, panel, card) "
                           "nor a defined layout.",
                           layout.layoutType));
    }

    // 先分配自身 id，再处理子节点
    std::string nodeId = m_idGen.generate(NODE_PREFIX);

    ContainerNode node;
    node.id = nodeId;
    node.containerType = containerType.value_or(policies::ContainerKind::STACK);
    node.children = lowerChildren(layout.children, context);

    // 未显式指定 padding 的布局默认无内边距
    node.style.padding = FindString(params, "padding").value_or("none");
    node.style.gap = FindString(params, "gap");
    node.style.align = FindString(params, "align");
    node.style.justify = FindString(params, "justify");
    node.style.background = FindString(params, "background");

    node.params = stripStyleKeys(params);
    node.meta.nodeId = layout.nodeId;

    m_nodes.emplace(nodeId, std::move(node));
    return nodeId;
}

std::string IRGenerator::lowerCell(const ast::Cell& cell, const ExpansionContext* context)
{
    std::string nodeId = m_idGen.generate(NODE_PREFIX);

    ContainerNode node;
    node.id = nodeId;
    node.containerType = policies::ContainerKind::STACK;
    node.children = lowerChildren(cell.children, context);
    // 单元格参数原样保留 (span 等)，间距交给网格 gap
    node.params = resolveProperties(cell.props, context, BindingTarget::LAYOUT_PARAMETER, "cell");
    node.style.padding = "none";
    node.meta.source = "cell";
    node.meta.nodeId = cell.nodeId;

    m_nodes.emplace(nodeId, std::move(node));
    return nodeId;
}

std::optional<std::string> IRGenerator::lowerComponent(const ast::Component& component,
                                                       const ExpansionContext* context)
{
    // 1. Children 插槽占位符
    if (component.componentType == CHILDREN_SLOT)
    {
        if (context == nullptr || !context->allowChildrenSlot)
        {
            report(DiagnosticCode::ChildrenSlotOutsideDefinition,
                   "\"Children\" placeholder can only be used inside a define Layout body.");
            return std::nullopt;
        }
        if (context->childrenSlot == nullptr)
        {
            report(DiagnosticCode::ChildrenSlotMissingChild,
                   std::format("Layout \"{}\" requires exactly one child for \"Children\".", context->definitionName));
            return std::nullopt;
        }
        // 插槽内容在其书写处的上下文中绑定
        return lowerNode(*context->childrenSlot, context->slotScope);
    }

    auto props =
        resolveProperties(component.props, context, BindingTarget::COMPONENT_PROPERTY, component.componentType);

    // 2. 自定义组件 -> 展开
    if (auto it = m_definedComponents.find(component.componentType); it != m_definedComponents.end())
    {
        return expandDefinedComponent(*it->second, props);
    }

    // 3. 内置组件 (未知类型记录下来，全部屏幕处理完再报错)
    if (!catalog::IsBuiltInComponent(component.componentType))
    {
        m_undefinedComponents.insert(component.componentType);
    }

    std::string nodeId = m_idGen.generate(NODE_PREFIX);

    ComponentNode node;
    node.id = nodeId;
    node.componentType = component.componentType;
    node.props = std::move(props);
    node.meta.nodeId = component.nodeId;

    m_nodes.emplace(nodeId, std::move(node));
    return nodeId;
}

// ===================== 宏展开 =====================

std::optional<std::string> IRGenerator::expandDefinedComponent(const ast::DefinedComponent& definition,
                                                               const PropertyMap& invocationArgs)
{
    std::set<std::string> usedArgs;
    const ExpansionContext context{.args = invocationArgs,
                                   .usedArgs = usedArgs,
                                   .definitionName = definition.name,
                                   .kind = policies::MacroKind::COMPONENT};

    std::optional<std::string> result;
    if (const auto* layout = std::get_if<ast::Layout>(&definition.body.value))
    {
        result = lowerLayout(*layout, &context);
    }
    else if (const auto* component = std::get_if<ast::Component>(&definition.body.value))
    {
        result = lowerComponent(*component, &context);
    }
    else
    {
        report(DiagnosticCode::InvalidDefinitionBody,
               std::format("Invalid defined component body type for \"{}\": expected a layout or a component.",
                           definition.name));
        return std::nullopt;
    }

    reportUnusedArguments(context);
    return result;
}

std::string IRGenerator::expandDefinedLayout(const ast::DefinedLayout& definition,
                                             const PropertyMap& invocationParams,
                                             const std::vector<ast::Node>& invocationChildren,
                                             const ExpansionContext* parentContext)
{
    if (invocationChildren.size() != 1)
    {
        // 继续尽力展开，以便暴露更多问题
        report(DiagnosticCode::LayoutChildrenArity,
               std::format("Layout \"{}\" expects exactly one child, received {}.",
                           definition.name,
                           invocationChildren.size()));
    }

    const ExpansionContext* slotScope = parentContext;
    const ast::Node* resolvedSlot = nullptr;
    if (!invocationChildren.empty())
    {
        resolvedSlot = resolveChildrenSlot(invocationChildren.front(), parentContext, slotScope);
    }

    std::set<std::string> usedArgs;
    const ExpansionContext context{.args = invocationParams,
                                   .usedArgs = usedArgs,
                                   .definitionName = definition.name,
                                   .kind = policies::MacroKind::LAYOUT,
                                   .allowChildrenSlot = true,
                                   .childrenSlot = resolvedSlot,
                                   .slotScope = slotScope};

    std::string nodeId = lowerLayout(definition.body, &context);
    reportUnusedArguments(context);
    return nodeId;
}

const ast::Node* IRGenerator::resolveChildrenSlot(const ast::Node& slot,
                                                  const ExpansionContext* parentContext,
                                                  const ExpansionContext*& slotScope)
{
    const auto* component = std::get_if<ast::Component>(&slot.value);
    if (component == nullptr || component->componentType != CHILDREN_SLOT)
    {
        slotScope = parentContext;
        return &slot;
    }

    // 插槽转发：取外层布局自己的插槽内容
    if (parentContext != nullptr && parentContext->allowChildrenSlot)
    {
        slotScope = parentContext->slotScope;
        return parentContext->childrenSlot;
    }

    report(DiagnosticCode::ChildrenSlotOutsideDefinition,
           "\"Children\" placeholder forwarding is only valid inside define Layout bodies.");
    slotScope = nullptr;
    return nullptr;
}

void IRGenerator::reportUnusedArguments(const ExpansionContext& context)
{
    for (const auto& [name, value] : context.args)
    {
        if (!context.usedArgs.contains(name))
        {
            report(DiagnosticCode::UnusedDefinitionArgument,
                   std::format("Argument \"{}\" is not used by {} \"{}\".",
                               name,
                               policies::ToString(context.kind),
                               context.definitionName));
        }
    }
}

// ===================== 参数绑定 =====================

PropertyMap IRGenerator::resolveProperties(const AstPropertyMap& values,
                                           const ExpansionContext* context,
                                           BindingTarget target,
                                           std::string_view targetType)
{
    PropertyMap resolved;
    for (const auto& [key, value] : values)
    {
        // 缺失的可选绑定直接省略该属性
        if (auto scalar = resolveBindingValue(value, context, target, targetType, key))
        {
            resolved.emplace(key, std::move(*scalar));
        }
    }
    return resolved;
}

std::optional<Scalar> IRGenerator::resolveBindingValue(const AstValue& value,
                                                       const ExpansionContext* context,
                                                       BindingTarget target,
                                                       std::string_view targetType,
                                                       std::string_view targetName)
{
    const auto* bound = std::get_if<BoundArgument>(&value);
    if (bound == nullptr)
    {
        if (const auto* text = std::get_if<std::string>(&value)) return Scalar{*text};
        return Scalar{std::get<double>(value)};
    }

    // 宏外部：原样透传给渲染器
    if (context == nullptr)
    {
        return Scalar{std::string(BINDING_PREFIX) + bound->name};
    }

    if (auto it = context->args.find(bound->name); it != context->args.end())
    {
        context->usedArgs.insert(bound->name);
        return it->second;
    }

    const bool isComponent = target == BindingTarget::COMPONENT_PROPERTY;
    const bool required = isComponent ? catalog::IsRequiredComponentProperty(targetType, targetName)
                                      : catalog::IsRequiredLayoutParameter(targetType, targetName);
    const std::string_view descriptor = isComponent ? "property" : "parameter";
    const std::string_view owner = isComponent ? "component" : "layout";

    if (required)
    {
        report(DiagnosticCode::MissingRequiredBoundValue,
               std::format("Missing required bound {} \"{}\" for {} \"{}\" in {} \"{}\" (expected arg \"{}\").",
                           descriptor,
                           targetName,
                           owner,
                           targetType,
                           policies::ToString(context->kind),
                           context->definitionName,
                           bound->name));
    }
    else
    {
        report(DiagnosticCode::MissingBoundValue,
               std::format("Optional {} \"{}\" in {} \"{}\" was omitted because arg \"{}\" was not provided while "
                           "expanding {} \"{}\".",
                           descriptor,
                           targetName,
                           owner,
                           targetType,
                           bound->name,
                           policies::ToString(context->kind),
                           context->definitionName));
    }
    return std::nullopt;
}

void IRGenerator::report(DiagnosticCode code, std::string message)
{
    Diagnostic diagnostic{
        .code = code, .severity = isWarning(code) ? Severity::WARNING : Severity::ERROR, .message = std::move(message)};

    if (diagnostic.severity == Severity::WARNING)
    {
        Logger::warn("[IRGenerator] [{}] {}", ToString(code), diagnostic.message);
        m_warnings.push_back(diagnostic);
    }
    else
    {
        Logger::error("[IRGenerator] [{}] {}", ToString(code), diagnostic.message);
        m_errors.push_back(diagnostic);
    }

    trigger(events::DiagnosticReported{.diagnostic = std::move(diagnostic)});
}

} // namespace wire::ir
