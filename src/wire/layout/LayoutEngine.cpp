/**
 * ************************************************************************
 *
 * @file LayoutEngine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 布局引擎实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "LayoutEngine.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "../singleton/Logger.hpp"

namespace wire::layout
{
namespace
{
constexpr size_t DEFAULT_GRID_COLUMNS = 12;

using policies::ContainerKind;

size_t wholeCount(std::optional<double> value, size_t fallback)
{
    if (!value) return fallback;
    return std::max<size_t>(1, static_cast<size_t>(std::floor(*value)));
}
} // namespace

LayoutEngine::LayoutEngine(const ir::IRContract& contract, LayoutOptions options)
    : m_contract(contract), m_nodes(contract.project.nodes), m_options(options), m_sizer(contract.project.style)
{
}

PositionMap LayoutEngine::calculate()
{
    m_result.clear();
    m_parentKinds.clear();

    for (const auto& screen : m_contract.project.screens)
    {
        const double width = screen.viewport.width > 0.0 ? screen.viewport.width : m_options.fallbackViewportWidth;
        const double height = screen.viewport.height > 0.0 ? screen.viewport.height : m_options.fallbackViewportHeight;

        Logger::debug("[LayoutEngine] 屏幕 \"{}\" 视口 {}x{}", screen.name, width, height);
        if (screen.root.ref.empty()) continue;
        calculateNode(screen.root.ref, 0.0, 0.0, width, height, std::nullopt);
    }
    return m_result;
}

std::optional<ContainerKind> LayoutEngine::parentKindOf(const std::string& nodeId) const
{
    auto it = m_parentKinds.find(nodeId);
    if (it == m_parentKinds.end()) return std::nullopt;
    return it->second;
}

void LayoutEngine::calculateNode(const std::string& nodeId,
                                 double x,
                                 double y,
                                 double width,
                                 double height,
                                 std::optional<ContainerKind> parentKind)
{
    const auto* node = ir::FindNode(m_nodes, nodeId);
    if (node == nullptr)
    {
        Logger::warn("[LayoutEngine] 跳过悬空引用 \"{}\"", nodeId);
        return;
    }

    if (parentKind) m_parentKinds.insert_or_assign(nodeId, *parentKind);

    std::visit(Overloaded{[&](const ir::ContainerNode& container) { calculateContainer(container, x, y, width, height); },
                          [&](const ir::ComponentNode& component) { calculateComponent(component, x, y, width); }},
               *node);
}

void LayoutEngine::calculateContainer(const ir::ContainerNode& node, double x, double y, double width, double height)
{
    const double padding = m_sizer.resolveSpacing(node.style.padding);
    const double innerX = x + padding;
    const double innerY = y + padding;
    const double innerWidth = width - padding * 2.0;

    // 纵向 stack 不限制高度，由子节点决定
    const bool vertical = isVerticalStack(node);
    const double innerHeight = vertical ? height : height - padding * 2.0;

    m_result.insert_or_assign(node.id, LayoutBox{.x = x, .y = y, .width = width, .height = height});

    switch (node.containerType)
    {
        case ContainerKind::STACK:
            if (vertical)
            {
                calculateVerticalChildren(node, innerX, innerY, innerWidth);
            }
            else
            {
                calculateHorizontalStack(node, innerX, innerY, innerWidth);
            }
            break;
        case ContainerKind::GRID:
            calculateGrid(node, innerX, innerY, innerWidth);
            break;
        case ContainerKind::SPLIT:
            calculateSplit(node, innerX, innerY, innerWidth, innerHeight);
            break;
        case ContainerKind::PANEL:
            calculatePanel(node, innerX, innerY, innerWidth, innerHeight);
            break;
        case ContainerKind::CARD:
            calculateVerticalChildren(node, innerX, innerY, innerWidth);
            break;
    }

    // 纵向 stack 与 card 按内容回写高度
    if (vertical || node.containerType == ContainerKind::CARD)
    {
        double contentBottom = innerY;
        for (const auto& child : node.children)
        {
            if (auto it = m_result.find(child.ref); it != m_result.end())
            {
                contentBottom = std::max(contentBottom, it->second.y + it->second.height);
            }
        }
        m_result[node.id].height = contentBottom - y + padding;
    }
}

void LayoutEngine::calculateComponent(const ir::ComponentNode& node, double x, double y, double width)
{
    const double componentWidth = FindPositiveNumber(node.props, "width").value_or(width);
    const double componentHeight =
        FindPositiveNumber(node.props, "height").value_or(m_sizer.height(node, componentWidth));

    m_result.insert_or_assign(node.id,
                              LayoutBox{.x = x, .y = y, .width = componentWidth, .height = componentHeight});
}

// ===================== 容器算法 =====================

void LayoutEngine::calculateVerticalChildren(const ir::ContainerNode& node, double x, double y, double width)
{
    const double gap = m_sizer.resolveSpacing(node.style.gap);
    double currentY = y;

    for (size_t index = 0; index < node.children.size(); ++index)
    {
        const auto& childId = node.children[index].ref;
        const double childHeight = measure(childId, width);

        calculateNode(childId, x, currentY, width, childHeight, node.containerType);
        currentY += childHeight;
        if (index + 1 < node.children.size()) currentY += gap;
    }

    // 嵌套容器可能在定位后才确定真实高度，按实际高度重新排一遍
    reconcileVertical(node, y, gap);
}

void LayoutEngine::calculateHorizontalStack(const ir::ContainerNode& node, double x, double y, double width)
{
    if (node.children.empty()) return;

    const double gap = m_sizer.resolveSpacing(node.style.gap);
    const auto plan = planRow(node, width, gap);

    std::vector<double> heights;
    heights.reserve(node.children.size());
    double rowHeight = 0.0;
    for (size_t index = 0; index < node.children.size(); ++index)
    {
        heights.push_back(measure(node.children[index].ref, plan.widths[index]));
        rowHeight = std::max(rowHeight, heights.back());
    }

    for (size_t index = 0; index < node.children.size(); ++index)
    {
        double childHeight = rowHeight;
        double offsetY = 0.0;
        if (plan.cross)
        {
            // 交叉轴对齐：较矮的兄弟节点保持自然高度
            childHeight = heights[index];
            if (*plan.cross == policies::CrossAlignment::CENTER) offsetY = (rowHeight - childHeight) / 2.0;
            if (*plan.cross == policies::CrossAlignment::END) offsetY = rowHeight - childHeight;
        }

        calculateNode(node.children[index].ref,
                      x + plan.offsets[index],
                      y + offsetY,
                      plan.widths[index],
                      childHeight,
                      ContainerKind::STACK);
    }
}

void LayoutEngine::calculateGrid(const ir::ContainerNode& node, double x, double y, double width)
{
    const auto plan = planGrid(node, width);

    // 每行的起始 y 为前面各行高度与间距的累加
    std::vector<double> rowY(plan.rowHeights.size(), y);
    for (size_t row = 1; row < plan.rowHeights.size(); ++row)
    {
        rowY[row] = rowY[row - 1] + plan.rowHeights[row - 1] + plan.gap;
    }

    for (size_t index = 0; index < node.children.size(); ++index)
    {
        const auto& cell = plan.cells[index];
        const auto span = static_cast<double>(cell.span);
        const double cellX = x + static_cast<double>(cell.column) * (plan.columnWidth + plan.gap);
        const double cellWidth = span * plan.columnWidth + (span - 1.0) * plan.gap;

        calculateNode(node.children[index].ref,
                      cellX,
                      rowY[cell.row],
                      cellWidth,
                      plan.rowHeights[cell.row],
                      ContainerKind::GRID);
    }
}

void LayoutEngine::calculateSplit(const ir::ContainerNode& node, double x, double y, double width, double height)
{
    const auto plan = planSplit(node, width);
    for (size_t index = 0; index < plan.widths.size(); ++index)
    {
        calculateNode(node.children[index].ref,
                      x + plan.offsets[index],
                      y,
                      plan.widths[index],
                      height,
                      ContainerKind::SPLIT);
    }

    for (size_t index = plan.widths.size(); index < node.children.size(); ++index)
    {
        collapseSubtree(node.children[index].ref, x, y, ContainerKind::SPLIT);
    }
}

void LayoutEngine::calculatePanel(const ir::ContainerNode& node, double x, double y, double width, double height)
{
    if (node.children.empty()) return;

    calculateNode(node.children.front().ref, x, y, width, height, ContainerKind::PANEL);
    for (size_t index = 1; index < node.children.size(); ++index)
    {
        collapseSubtree(node.children[index].ref, x, y, ContainerKind::PANEL);
    }
}

// ===================== 测量 =====================

bool LayoutEngine::isVerticalStack(const ir::ContainerNode& node) const
{
    return node.containerType == ContainerKind::STACK && FindString(node.params, "direction") != "horizontal";
}

double LayoutEngine::measure(const std::string& nodeId, double availableWidth) const
{
    const auto* node = ir::FindNode(m_nodes, nodeId);
    if (node == nullptr) return m_sizer.controlHeight();

    return std::visit(Overloaded{[&](const ir::ContainerNode& container)
                                 { return containerHeight(container, availableWidth); },
                                 [&](const ir::ComponentNode& component)
                                 {
                                     // 显式高度 > 固有高度
                                     return FindPositiveNumber(component.props, "height")
                                         .value_or(m_sizer.height(component, availableWidth));
                                 }},
                      *node);
}

double LayoutEngine::containerHeight(const ir::ContainerNode& node, double availableWidth) const
{
    const double padding = m_sizer.resolveSpacing(node.style.padding);
    const double gap = m_sizer.resolveSpacing(node.style.gap);
    const double innerWidth = availableWidth - padding * 2.0;
    double content = 0.0;

    switch (node.containerType)
    {
        case ContainerKind::GRID:
        {
            const auto plan = planGrid(node, innerWidth);
            for (size_t row = 0; row < plan.rowHeights.size(); ++row)
            {
                content += plan.rowHeights[row];
                if (row + 1 < plan.rowHeights.size()) content += plan.gap;
            }
            break;
        }
        case ContainerKind::SPLIT:
        {
            // 按放置时的面板宽度测量，窄面板内的折行才不会被低估
            const auto plan = planSplit(node, innerWidth);
            for (size_t index = 0; index < plan.widths.size(); ++index)
            {
                content = std::max(content, measure(node.children[index].ref, plan.widths[index]));
            }
            break;
        }
        case ContainerKind::PANEL:
            if (!node.children.empty()) content = measure(node.children.front().ref, innerWidth);
            break;
        case ContainerKind::STACK:
            if (!isVerticalStack(node))
            {
                if (node.children.empty()) break;
                const auto plan = planRow(node, innerWidth, gap);
                for (size_t index = 0; index < node.children.size(); ++index)
                {
                    content = std::max(content, measure(node.children[index].ref, plan.widths[index]));
                }
                break;
            }
            [[fallthrough]];
        case ContainerKind::CARD:
            for (size_t index = 0; index < node.children.size(); ++index)
            {
                content += measure(node.children[index].ref, innerWidth);
                if (index + 1 < node.children.size()) content += gap;
            }
            break;
    }

    return content + padding * 2.0;
}

double LayoutEngine::naturalWidth(const std::string& nodeId) const
{
    const auto* node = ir::FindNode(m_nodes, nodeId);
    if (const auto* component = node != nullptr ? std::get_if<ir::ComponentNode>(node) : nullptr)
    {
        if (auto explicitWidth = FindPositiveNumber(component->props, "width")) return *explicitWidth;
    }
    return m_sizer.width(node);
}

LayoutEngine::RowPlan LayoutEngine::planRow(const ir::ContainerNode& node, double width, double gap) const
{
    RowPlan plan;
    const size_t count = node.children.size();
    if (count == 0) return plan;

    const std::string align = node.style.align.value_or("justify");
    std::optional<policies::Justify> justify;
    if (node.style.justify) justify = policies::ParseJustify(*node.style.justify);

    std::optional<policies::Alignment> mainAlign;
    if (justify && *justify != policies::Justify::STRETCH)
    {
        // 主轴由 justify 决定，align 只作用于交叉轴
        plan.cross = policies::ParseCrossAlignment(align);
    }
    else
    {
        justify.reset();
        mainAlign = policies::ParseAlignment(align);
        if (mainAlign == policies::Alignment::JUSTIFY || !mainAlign)
        {
            mainAlign.reset();
            plan.cross = policies::ParseCrossAlignment(align);
        }
    }

    // 1. 等宽铺满
    if (!justify && !mainAlign)
    {
        const double childWidth = (width - gap * static_cast<double>(count - 1)) / static_cast<double>(count);
        for (size_t index = 0; index < count; ++index)
        {
            plan.widths.push_back(childWidth);
            plan.offsets.push_back(static_cast<double>(index) * (childWidth + gap));
        }
        return plan;
    }

    // 2. 自然宽度
    for (const auto& child : node.children)
    {
        plan.widths.push_back(naturalWidth(child.ref));
    }
    const double sumWidths = std::accumulate(plan.widths.begin(), plan.widths.end(), 0.0);
    const double free = width - (sumWidths + gap * static_cast<double>(count - 1));

    double start = 0.0;
    double spacing = gap;
    double margin = 0.0;

    if (mainAlign)
    {
        if (*mainAlign == policies::Alignment::CENTER) start = free / 2.0;
        if (*mainAlign == policies::Alignment::RIGHT) start = free;
    }
    else
    {
        switch (*justify)
        {
            case policies::Justify::CENTER:
                start = free / 2.0;
                break;
            case policies::Justify::END:
                start = free;
                break;
            case policies::Justify::SPACE_BETWEEN:
                // 单个子节点退化为 start
                if (count > 1) spacing = (width - sumWidths) / static_cast<double>(count - 1);
                break;
            case policies::Justify::SPACE_AROUND:
                margin = (width - sumWidths) / (2.0 * static_cast<double>(count));
                spacing = margin * 2.0;
                start = margin;
                break;
            case policies::Justify::START:
            case policies::Justify::STRETCH:
                break;
        }
    }

    double cursor = start;
    for (const double childWidth : plan.widths)
    {
        plan.offsets.push_back(cursor);
        cursor += childWidth + spacing;
    }
    return plan;
}

LayoutEngine::GridPlan LayoutEngine::planGrid(const ir::ContainerNode& node, double width) const
{
    GridPlan plan;
    const size_t columns = wholeCount(FindPositiveNumber(node.params, "columns"), DEFAULT_GRID_COLUMNS);
    const auto columnCount = static_cast<double>(columns);

    plan.gap = m_sizer.resolveSpacing(node.style.gap);
    plan.columnWidth = (width - plan.gap * (columnCount - 1.0)) / columnCount;
    plan.rowHeights.push_back(0.0);

    size_t row = 0;
    size_t column = 0;
    for (const auto& child : node.children)
    {
        // 跨列数只从单元格读取
        size_t span = 1;
        const auto* childNode = ir::FindNode(m_nodes, child.ref);
        if (const auto* container = childNode != nullptr ? std::get_if<ir::ContainerNode>(childNode) : nullptr;
            container != nullptr && container->meta.source == "cell")
        {
            span = std::min(columns, wholeCount(FindPositiveNumber(container->params, "span"), 1));
        }

        const auto spanCount = static_cast<double>(span);
        const double cellHeight = measure(child.ref, spanCount * plan.columnWidth + (spanCount - 1.0) * plan.gap);

        // 放不下就换行
        if (column + span > columns)
        {
            ++row;
            column = 0;
            plan.rowHeights.push_back(0.0);
        }

        plan.cells.push_back(GridCell{.row = row, .column = column, .span = span});
        plan.rowHeights[row] = std::max(plan.rowHeights[row], cellHeight);
        column += span;
    }
    return plan;
}

LayoutEngine::SplitPlan LayoutEngine::planSplit(const ir::ContainerNode& node, double width) const
{
    SplitPlan plan;
    if (node.children.empty()) return plan;

    if (node.children.size() == 1)
    {
        plan.widths.push_back(width);
        plan.offsets.push_back(0.0);
        return plan;
    }

    const double gap = m_sizer.resolveSpacing(node.style.gap);
    if (auto right = FindPositiveNumber(node.params, "right"))
    {
        // 固定宽度面板在右侧
        const double contentWidth = width - *right - gap;
        plan.widths = {contentWidth, *right};
        plan.offsets = {0.0, contentWidth + gap};
        return plan;
    }

    const double sidebar = FindPositiveNumber(node.params, "left")
                               .or_else([&] { return FindPositiveNumber(node.params, "sidebar"); })
                               .value_or(m_options.defaultSidebarWidth);
    plan.widths = {sidebar, width - sidebar - gap};
    plan.offsets = {0.0, sidebar + gap};
    return plan;
}

// ===================== 校正 =====================

void LayoutEngine::reconcileVertical(const ir::ContainerNode& node, double startY, double gap)
{
    double adjustedY = startY;
    for (size_t index = 0; index < node.children.size(); ++index)
    {
        auto it = m_result.find(node.children[index].ref);
        if (it == m_result.end()) continue;

        auto& box = it->second;
        const double deltaY = adjustedY - box.y;
        box.y = adjustedY;
        if (deltaY != 0.0) shiftDescendants(node.children[index].ref, deltaY);

        adjustedY += box.height;
        if (index + 1 < node.children.size()) adjustedY += gap;
    }
}

void LayoutEngine::shiftDescendants(const std::string& nodeId, double deltaY)
{
    const auto* node = ir::FindNode(m_nodes, nodeId);
    const auto* container = node != nullptr ? std::get_if<ir::ContainerNode>(node) : nullptr;
    if (container == nullptr) return;

    for (const auto& child : container->children)
    {
        if (auto it = m_result.find(child.ref); it != m_result.end())
        {
            it->second.y += deltaY;
        }
        shiftDescendants(child.ref, deltaY);
    }
}

void LayoutEngine::collapseSubtree(const std::string& nodeId, double x, double y, ContainerKind parentKind)
{
    const auto* node = ir::FindNode(m_nodes, nodeId);
    if (node == nullptr) return;

    m_parentKinds.insert_or_assign(nodeId, parentKind);
    m_result.insert_or_assign(nodeId, LayoutBox{.x = x, .y = y, .width = 0.0, .height = 0.0});

    if (const auto* container = std::get_if<ir::ContainerNode>(node))
    {
        for (const auto& child : container->children)
        {
            collapseSubtree(child.ref, x, y, container->containerType);
        }
    }
}

PositionMap CalculateLayout(const ir::IRContract& contract, LayoutOptions options)
{
    LayoutEngine engine(contract, options);
    return engine.calculate();
}

} // namespace wire::layout
