/**
 * ************************************************************************
 *
 * @file LayoutEngine.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 布局引擎
 *
 * 从每个屏幕根节点出发做一次深度优先遍历，为每个 IR 节点计算绝对坐标：
  - stack: 纵向逐个累加 / 横向等宽或自然宽度分布
  - grid: 多遍计算 (先测高，再分行，最后定位)
  - split: 固定宽度侧栏 + 自适应内容区
  - panel: 单子节点直通
  - card: 自带内边距的纵向排列
 * 纵向 stack 与 card 在子节点定位后按内容回写自身高度，并做一次纵向校正
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
#include <vector>
#include "../common/Config.hpp"
#include "../common/IRContract.hpp"
#include "../common/Types.hpp"
#include "IntrinsicSize.hpp"

namespace wire::layout
{

/**
 * @brief 节点 id -> 绝对坐标框
 */
using PositionMap = std::map<std::string, LayoutBox>;

class LayoutEngine
{
public:
    explicit LayoutEngine(const ir::IRContract& contract, LayoutOptions options = {});

    /**
     * @brief 计算全部屏幕的布局；悬空引用按跳过处理，从不失败
     */
    PositionMap calculate();

    /**
     * @brief 节点被哪种容器放置 (屏幕根节点没有父容器)
     */
    [[nodiscard]] std::optional<policies::ContainerKind> parentKindOf(const std::string& nodeId) const;

private:
    struct RowPlan
    {
        std::vector<double> widths;
        std::vector<double> offsets; // 相对行起点的 x 偏移
        std::optional<policies::CrossAlignment> cross;
    };

    // split 实际放置的子节点 (至多两个) 的宽度与相对偏移
    struct SplitPlan
    {
        std::vector<double> widths;
        std::vector<double> offsets;
    };

    struct GridCell
    {
        size_t row = 0;
        size_t column = 0;
        size_t span = 1;
    };

    struct GridPlan
    {
        double columnWidth = 0.0;
        double gap = 0.0;
        std::vector<GridCell> cells;
        std::vector<double> rowHeights;
    };

    void calculateNode(const std::string& nodeId,
                       double x,
                       double y,
                       double width,
                       double height,
                       std::optional<policies::ContainerKind> parentKind);
    void calculateContainer(const ir::ContainerNode& node, double x, double y, double width, double height);
    void calculateComponent(const ir::ComponentNode& node, double x, double y, double width);

    void calculateVerticalChildren(const ir::ContainerNode& node, double x, double y, double width);
    void calculateHorizontalStack(const ir::ContainerNode& node, double x, double y, double width);
    void calculateGrid(const ir::ContainerNode& node, double x, double y, double width);
    void calculateSplit(const ir::ContainerNode& node, double x, double y, double width, double height);
    void calculatePanel(const ir::ContainerNode& node, double x, double y, double width, double height);

    // ===================== 测量 =====================

    [[nodiscard]] double measure(const std::string& nodeId, double availableWidth) const;
    [[nodiscard]] double containerHeight(const ir::ContainerNode& node, double availableWidth) const;
    [[nodiscard]] double naturalWidth(const std::string& nodeId) const;
    [[nodiscard]] RowPlan planRow(const ir::ContainerNode& node, double width, double gap) const;
    [[nodiscard]] GridPlan planGrid(const ir::ContainerNode& node, double width) const;
    [[nodiscard]] SplitPlan planSplit(const ir::ContainerNode& node, double width) const;
    [[nodiscard]] bool isVerticalStack(const ir::ContainerNode& node) const;

    // ===================== 校正 =====================

    void reconcileVertical(const ir::ContainerNode& node, double startY, double gap);
    void shiftDescendants(const std::string& nodeId, double deltaY);
    void collapseSubtree(const std::string& nodeId, double x, double y, policies::ContainerKind parentKind);

    const ir::IRContract& m_contract;
    const ir::NodeMap& m_nodes;
    LayoutOptions m_options;
    IntrinsicSizer m_sizer;
    PositionMap m_result;
    std::map<std::string, policies::ContainerKind> m_parentKinds;
};

/**
 * @brief 便捷入口：一次性计算布局
 */
PositionMap CalculateLayout(const ir::IRContract& contract, LayoutOptions options = {});

} // namespace wire::layout
