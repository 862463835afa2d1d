/**
 * ************************************************************************
 *
 * @file IntrinsicSize.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 组件固有尺寸估算
 *
 * 按组件类型估算自然宽高：
  - 高度: 文本类按折行行数，表格按行数，图片按宽高比，其余查表
  - 宽度: 只在自然宽度的水平排列中使用
 * 所有估算都受项目密度影响
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <optional>
#include <string_view>
#include "../common/IRContract.hpp"
#include "../common/Policies.hpp"

namespace wire::layout
{

class IntrinsicSizer
{
public:
    explicit IntrinsicSizer(const ir::IRStyle& style);

    /**
     * @brief 间距 token 解析 (随密度缩放，缺省回退到项目 spacing)
     */
    [[nodiscard]] double resolveSpacing(const std::optional<std::string>& token) const;

    /**
     * @brief 普通控件行高 (32/40/48)
     */
    [[nodiscard]] double controlHeight() const;

    /**
     * @brief 组件自然高度
     * @param availableWidth 可用宽度；为空或非正时使用各类型的默认折行宽度
     */
    [[nodiscard]] double height(const ir::ComponentNode& node, std::optional<double> availableWidth) const;

    /**
     * @brief 节点自然宽度；容器或空节点为 120
     */
    [[nodiscard]] double width(const ir::Node* node) const;

private:
    [[nodiscard]] double separateSize(const ir::ComponentNode& node) const;
    [[nodiscard]] double wrappedTextHeight(const ir::ComponentNode& node, std::optional<double> availableWidth) const;
    [[nodiscard]] double alertHeight(const ir::ComponentNode& node, std::optional<double> availableWidth) const;
    [[nodiscard]] double componentWidth(const ir::ComponentNode& node) const;

    policies::Density m_density = policies::Density::NORMAL;
    std::string m_spacing;
};

} // namespace wire::layout
