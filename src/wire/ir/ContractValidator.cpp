/**
 * ************************************************************************
 *
 * @file ContractValidator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief IR 契约结构校验实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "ContractValidator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <string_view>

namespace wire::ir
{
namespace
{
constexpr std::array<std::string_view, 5> SPACING_TOKENS = {"xs", "sm", "md", "lg", "xl"};
constexpr std::array<std::string_view, 5> RADIUS_VALUES = {"none", "sm", "md", "lg", "full"};
constexpr std::array<std::string_view, 3> STROKE_VALUES = {"thin", "normal", "thick"};
constexpr std::array<std::string_view, 3> FONT_VALUES = {"sm", "base", "lg"};
constexpr std::array<std::string_view, 6> ALIGN_VALUES = {"left", "center", "right", "justify", "start", "end"};

template <size_t N>
bool oneOf(const std::array<std::string_view, N>& values, std::string_view value)
{
    return std::ranges::find(values, value) != values.end();
}

class ContractChecker
{
public:
    explicit ContractChecker(const IRContract& contract) : m_contract(contract) {}

    std::vector<Diagnostic> run()
    {
        checkVersion();
        checkStyle();
        for (const auto& [key, node] : m_contract.project.nodes)
        {
            checkNode(key, node);
        }
        for (const auto& screen : m_contract.project.screens)
        {
            checkScreen(screen);
        }
        checkTree();
        return std::move(m_problems);
    }

private:
    void fail(std::string message)
    {
        m_problems.push_back(
            Diagnostic{.code = DiagnosticCode::InvalidContract, .severity = Severity::ERROR, .message = std::move(message)});
    }

    void checkVersion()
    {
        if (m_contract.irVersion != IR_VERSION)
        {
            fail(std::format("irVersion must be \"{}\", got \"{}\".", IR_VERSION, m_contract.irVersion));
        }
    }

    void checkStyle()
    {
        const auto& style = m_contract.project.style;
        if (!policies::ParseDensity(style.density))
        {
            fail(std::format("style.density \"{}\" is not one of compact, normal, comfortable.", style.density));
        }
        if (!oneOf(SPACING_TOKENS, style.spacing))
        {
            fail(std::format("style.spacing \"{}\" is not a spacing token.", style.spacing));
        }
        if (!oneOf(RADIUS_VALUES, style.radius))
        {
            fail(std::format("style.radius \"{}\" is not one of none, sm, md, lg, full.", style.radius));
        }
        if (!oneOf(STROKE_VALUES, style.stroke))
        {
            fail(std::format("style.stroke \"{}\" is not one of thin, normal, thick.", style.stroke));
        }
        if (!oneOf(FONT_VALUES, style.font))
        {
            fail(std::format("style.font \"{}\" is not one of sm, base, lg.", style.font));
        }
    }

    void checkRef(const NodeRef& ref, std::string_view owner)
    {
        if (!m_contract.project.nodes.contains(ref.ref))
        {
            fail(std::format("{} references missing node \"{}\".", owner, ref.ref));
        }
    }

    void checkNodeStyle(const std::string& id, const NodeStyle& style)
    {
        if (style.align && !oneOf(ALIGN_VALUES, *style.align))
        {
            fail(std::format("Node \"{}\" has invalid align \"{}\".", id, *style.align));
        }
        if (style.justify && !policies::ParseJustify(*style.justify))
        {
            fail(std::format("Node \"{}\" has invalid justify \"{}\".", id, *style.justify));
        }
    }

    void checkNode(const std::string& key, const Node& node)
    {
        const auto& id = IdOf(node);
        if (id != key)
        {
            fail(std::format("Node map key \"{}\" does not match node id \"{}\".", key, id));
        }

        std::visit(Overloaded{[&](const ContainerNode& container)
                              {
                                  checkNodeStyle(id, container.style);
                                  for (const auto& child : container.children)
                                  {
                                      checkRef(child, std::format("Container \"{}\"", id));
                                  }
                              },
                              [&](const ComponentNode& component)
                              {
                                  checkNodeStyle(id, component.style);
                                  if (component.componentType.empty())
                                  {
                                      fail(std::format("Component \"{}\" has an empty componentType.", id));
                                  }
                              }},
                   node);
    }

    void checkScreen(const IRScreen& screen)
    {
        if (screen.id.empty())
        {
            fail(std::format("Screen \"{}\" has an empty id.", screen.name));
        }
        if (screen.viewport.width <= 0.0 || screen.viewport.height <= 0.0)
        {
            fail(std::format("Screen \"{}\" has a non-positive viewport.", screen.name));
        }
        checkRef(screen.root, std::format("Screen \"{}\" root", screen.name));
    }

    /**
     * @brief 引用图必须是树：无环，且每个节点至多被一个容器引用
     */
    void checkTree()
    {
        std::map<std::string, size_t> parents;
        for (const auto& [key, node] : m_contract.project.nodes)
        {
            if (const auto* container = std::get_if<ContainerNode>(&node))
            {
                for (const auto& child : container->children) ++parents[child.ref];
            }
        }
        for (const auto& [id, count] : parents)
        {
            if (count > 1) fail(std::format("Node \"{}\" is referenced by {} containers.", id, count));
        }

        std::map<std::string, VisitState> states;
        for (const auto& [key, node] : m_contract.project.nodes)
        {
            if (!states.contains(key)) visit(key, states);
        }
    }

    enum class VisitState : uint8_t
    {
        ACTIVE,
        DONE
    };

    void visit(const std::string& id, std::map<std::string, VisitState>& states)
    {
        states[id] = VisitState::ACTIVE;
        const auto* node = FindNode(m_contract.project.nodes, id);
        if (const auto* container = node != nullptr ? std::get_if<ContainerNode>(node) : nullptr)
        {
            for (const auto& child : container->children)
            {
                auto it = states.find(child.ref);
                if (it == states.end())
                {
                    if (m_contract.project.nodes.contains(child.ref)) visit(child.ref, states);
                }
                else if (it->second == VisitState::ACTIVE)
                {
                    fail(std::format("Container \"{}\" forms a reference cycle through \"{}\".", id, child.ref));
                }
            }
        }
        states[id] = VisitState::DONE;
    }

    const IRContract& m_contract;
    std::vector<Diagnostic> m_problems;
};
} // namespace

std::vector<Diagnostic> ValidateContract(const IRContract& contract)
{
    return ContractChecker(contract).run();
}

} // namespace wire::ir
