/**
 * ************************************************************************
 *
 * @file IRGenerator.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief IR 生成器 (组合引擎)
 *
 * 将语法树降级为扁平的 IR 节点表：
  - 先登记全部自定义组件 / 布局 (允许先使用后定义)
  - 递归降级布局、单元格、组件，子节点以 {ref} 引用
  - 展开宏调用并绑定参数，每次调用拥有独立的展开上下文
  - 收集全部诊断后一次性失败，警告单独取出
 *
 * 每个实例只服务一次编译的状态；并发编译必须使用各自的实例。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <entt/entt.hpp>

#include "../common/Diagnostics.hpp"
#include "../common/Events.hpp"
#include "../common/IRContract.hpp"
#include "../common/SyntaxTree.hpp"
#include "../traits/EventTraits.hpp"
#include "IdGenerator.hpp"

namespace wire::ir
{

/**
 * @brief 单次宏调用的展开上下文
 *
 * 只由本次调用方的实参构成，嵌套调用各自构造，不向外层查找。
 */
struct ExpansionContext
{
    const PropertyMap& args;          // 调用方传入的实参
    std::set<std::string>& usedArgs;  // 展开过程中实际消费的实参名
    std::string_view definitionName;
    policies::MacroKind kind = policies::MacroKind::COMPONENT;
    bool allowChildrenSlot = false;
    const ast::Node* childrenSlot = nullptr;     // 已解析的插槽内容
    const ExpansionContext* slotScope = nullptr; // 插槽内容书写处的上下文
};

class IRGenerator
{
public:
    IRGenerator() = default;

    IRGenerator(const IRGenerator&) = delete;
    IRGenerator& operator=(const IRGenerator&) = delete;
    IRGenerator(IRGenerator&&) = default;
    IRGenerator& operator=(IRGenerator&&) = default;
    ~IRGenerator() = default;

    /**
     * @brief 生成 IR 契约
     * @return 成功返回契约；失败返回汇总全部问题的 CompositionError，不返回部分结果
     */
    std::expected<IRContract, CompositionError> generate(const ast::Project& tree);

    /**
     * @brief 最近一次 generate 产生的警告
     */
    [[nodiscard]] const std::vector<Diagnostic>& warnings() const { return m_warnings; }

    /**
     * @brief 事件订阅入口 (每个生成器实例独立，不存在全局派发器)
     */
    template <traits::Events Event>
    auto sink()
    {
        return m_dispatcher.sink<Event>();
    }

    auto onDiagnostic() { return sink<events::DiagnosticReported>(); }

private:
    enum class BindingTarget : uint8_t
    {
        COMPONENT_PROPERTY,
        LAYOUT_PARAMETER
    };

    void reset();
    void registerDefinitions(const ast::Project& tree);
    void applyStyle(const std::map<std::string, std::string>& style);
    IRScreen convertScreen(const ast::Screen& screen, size_t index);

    // ===================== 节点降级 =====================

    std::optional<std::string> lowerNode(const ast::Node& node, const ExpansionContext* context);
    std::string lowerLayout(const ast::Layout& layout, const ExpansionContext* context);
    std::string lowerCell(const ast::Cell& cell, const ExpansionContext* context);
    std::optional<std::string> lowerComponent(const ast::Component& component, const ExpansionContext* context);
    std::vector<NodeRef> lowerChildren(const std::vector<ast::Node>& children, const ExpansionContext* context);

    // ===================== 宏展开 =====================

    std::optional<std::string> expandDefinedComponent(const ast::DefinedComponent& definition,
                                                      const PropertyMap& invocationArgs);
    std::string expandDefinedLayout(const ast::DefinedLayout& definition,
                                    const PropertyMap& invocationParams,
                                    const std::vector<ast::Node>& invocationChildren,
                                    const ExpansionContext* parentContext);
    const ast::Node* resolveChildrenSlot(const ast::Node& slot,
                                         const ExpansionContext* parentContext,
                                         const ExpansionContext*& slotScope);
    void reportUnusedArguments(const ExpansionContext& context);

    // ===================== 参数绑定 =====================

    PropertyMap resolveProperties(const AstPropertyMap& values,
                                  const ExpansionContext* context,
                                  BindingTarget target,
                                  std::string_view targetType);
    std::optional<Scalar> resolveBindingValue(const AstValue& value,
                                              const ExpansionContext* context,
                                              BindingTarget target,
                                              std::string_view targetType,
                                              std::string_view targetName);

    void report(DiagnosticCode code, std::string message);

    template <traits::Events Event>
    void trigger(Event&& event)
    {
        m_dispatcher.trigger(std::forward<Event>(event));
    }

    IdGenerator m_idGen;
    NodeMap m_nodes;
    IRStyle m_style;
    std::map<std::string, const ast::DefinedComponent*, std::less<>> m_definedComponents;
    std::map<std::string, const ast::DefinedLayout*, std::less<>> m_definedLayouts;
    std::set<std::string> m_undefinedComponents;
    std::vector<Diagnostic> m_errors;
    std::vector<Diagnostic> m_warnings;
    entt::dispatcher m_dispatcher;
};

/**
 * @brief 便捷入口：使用全新的生成器实例
 */
std::expected<IRContract, CompositionError> GenerateIR(const ast::Project& tree);

/**
 * @brief 将名称规整为 id：小写、空白转下划线、去除 [a-z0-9_] 以外字符
 */
std::string SanitizeId(std::string_view name);

} // namespace wire::ir
