/**
 * ************************************************************************
 *
 * @file IntrinsicSize.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 组件固有尺寸估算实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "IntrinsicSize.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "../resolve/ComponentSizes.hpp"
#include "../resolve/Spacing.hpp"
#include "../resolve/Typography.hpp"
#include "TextWrap.hpp"

namespace wire::layout
{
namespace
{
// 固定高度组件
constexpr double TEXTAREA_HEIGHT = 100.0;
constexpr double MODAL_HEIGHT = 300.0;
constexpr double CARD_HEIGHT = 120.0;
constexpr double CHART_PLACEHOLDER_HEIGHT = 250.0;
constexpr double LIST_HEIGHT = 180.0;
constexpr double TOPBAR_HEIGHT = 56.0;
constexpr double DIVIDER_HEIGHT = 1.0;

// 表格
constexpr double TABLE_TITLE_HEIGHT = 32.0;
constexpr double TABLE_HEADER_HEIGHT = 44.0;
constexpr double TABLE_ROW_HEIGHT = 36.0;
constexpr double TABLE_PAGINATION_HEIGHT = 64.0; // 16 间距 + 32 按钮 + 16 底边
constexpr double TABLE_DEFAULT_ROWS = 5.0;

// 提示框
constexpr double ALERT_FONT_SIZE = 13.0;
constexpr double ALERT_TITLE_LINE_HEIGHT = 1.25;
constexpr double ALERT_TEXT_LINE_HEIGHT = 1.4;
constexpr double ALERT_VERTICAL_PADDING = 12.0;
constexpr double ALERT_TITLE_GAP = 6.0;
constexpr double ALERT_HORIZONTAL_INSET = 24.0;
constexpr double ALERT_DEFAULT_WIDTH = 280.0;
constexpr double ALERT_MIN_WRAP_WIDTH = 40.0;

constexpr double SIDEBAR_MENU_ITEM_HEIGHT = 40.0;
constexpr double SIDEBAR_MENU_DEFAULT_ITEMS = 3.0;

constexpr double DEFAULT_WRAP_WIDTH = 200.0;
constexpr double IMAGE_FALLBACK_HEIGHT = 200.0;
constexpr double DEFAULT_WIDTH = 120.0;

std::string textOr(const PropertyMap& props, const std::string& key, std::string_view fallback)
{
    auto value = FindString(props, key);
    if (!value || value->empty()) return std::string(fallback);
    return *value;
}

double imageAspectRatio(std::string_view placeholder)
{
    if (placeholder == "portrait") return 2.0 / 3.0;
    if (placeholder == "square" || placeholder == "icon" || placeholder == "avatar") return 1.0;
    return 16.0 / 9.0; // landscape
}

double imageWidth(std::string_view placeholder)
{
    if (placeholder == "portrait" || placeholder == "square") return 200.0;
    if (placeholder == "icon" || placeholder == "avatar") return 64.0;
    return 300.0;
}

size_t countMenuItems(const std::string& items)
{
    size_t count = 0;
    size_t start = 0;
    while (start <= items.size())
    {
        size_t end = items.find(',', start);
        if (end == std::string::npos) end = items.size();
        const auto item = std::string_view(items).substr(start, end - start);
        if (item.find_first_not_of(" \t\r\n") != std::string_view::npos) ++count;
        start = end + 1;
    }
    return count;
}

double lineHeightPx(double fontSize, double lineHeight)
{
    return std::ceil(fontSize * lineHeight);
}

double textLengthWidth(const std::string& text, double perChar, double padding, double minimum)
{
    return std::max(minimum, static_cast<double>(CodePointCount(text)) * perChar + padding);
}
} // namespace

IntrinsicSizer::IntrinsicSizer(const ir::IRStyle& style)
    : m_density(policies::ParseDensity(style.density).value_or(policies::Density::NORMAL)),
      m_spacing(style.spacing.empty() ? "md" : style.spacing)
{
}

double IntrinsicSizer::resolveSpacing(const std::optional<std::string>& token) const
{
    std::optional<std::string_view> view;
    if (token) view = *token;
    return static_cast<double>(resolve::ResolveSpacingToken(view, m_spacing, m_density, true));
}

double IntrinsicSizer::controlHeight() const
{
    return static_cast<double>(resolve::ResolveControlHeight(m_density));
}

double IntrinsicSizer::separateSize(const ir::ComponentNode& node) const
{
    auto it = node.props.find("size");
    if (it != node.props.end())
    {
        if (const auto* number = std::get_if<double>(&it->second); number != nullptr && !std::isnan(*number))
        {
            return *number;
        }
    }
    const auto token = FindString(node.props, "size").value_or("md");
    return static_cast<double>(resolve::ResolveSpacingToken(token, "md", m_density, true));
}

double IntrinsicSizer::wrappedTextHeight(const ir::ComponentNode& node, std::optional<double> availableWidth) const
{
    const bool isHeading = node.componentType == "Heading";
    const auto metrics = isHeading
                             ? resolve::HeadingMetricsFor(m_density, FindString(node.props, "level").value_or("h2"))
                             : resolve::TextMetricsFor(m_density);
    const auto text = isHeading ? textOr(node.props, "text", "Heading") : textOr(node.props, "content", "");

    const double maxWidth = availableWidth && *availableWidth > 0.0 ? *availableWidth : DEFAULT_WRAP_WIDTH;
    const auto lines = WrapTextToLines(text, maxWidth, metrics.fontSize);
    const double wrapped =
        static_cast<double>(std::max<size_t>(1, lines.size())) * lineHeightPx(metrics.fontSize, metrics.lineHeight);
    return std::max(controlHeight(), wrapped);
}

double IntrinsicSizer::alertHeight(const ir::ComponentNode& node, std::optional<double> availableWidth) const
{
    const auto title = textOr(node.props, "title", "");
    const auto text = textOr(node.props, "text", "Alert message");

    const double base = availableWidth && *availableWidth > 0.0 ? *availableWidth : ALERT_DEFAULT_WIDTH;
    const double maxWidth = std::max(ALERT_MIN_WRAP_WIDTH, base - ALERT_HORIZONTAL_INSET);

    const bool hasTitle = title.find_first_not_of(" \t\r\n") != std::string::npos;
    const size_t titleLines = hasTitle ? WrapTextToLines(title, maxWidth, ALERT_FONT_SIZE).size() : 0;
    const size_t textLines = std::max<size_t>(1, WrapTextToLines(text, maxWidth, ALERT_FONT_SIZE).size());

    const double wrapped = ALERT_VERTICAL_PADDING +
                           static_cast<double>(titleLines) * lineHeightPx(ALERT_FONT_SIZE, ALERT_TITLE_LINE_HEIGHT) +
                           (hasTitle ? ALERT_TITLE_GAP : 0.0) +
                           static_cast<double>(textLines) * lineHeightPx(ALERT_FONT_SIZE, ALERT_TEXT_LINE_HEIGHT) +
                           ALERT_VERTICAL_PADDING;
    return std::max(controlHeight(), wrapped);
}

double IntrinsicSizer::height(const ir::ComponentNode& node, std::optional<double> availableWidth) const
{
    const auto& type = node.componentType;

    if (type == "Image")
    {
        if (auto explicitHeight = FindPositiveNumber(node.props, "height")) return *explicitHeight;
        if (availableWidth && *availableWidth > 0.0)
        {
            return *availableWidth / imageAspectRatio(textOr(node.props, "placeholder", "landscape"));
        }
        return IMAGE_FALLBACK_HEIGHT;
    }

    if (type == "Table")
    {
        if (auto explicitHeight = FindPositiveNumber(node.props, "height")) return *explicitHeight;
        const double rows = FindPositiveNumber(node.props, "rows").value_or(TABLE_DEFAULT_ROWS);
        const bool hasTitle = !textOr(node.props, "title", "").empty();
        const bool hasPagination = FindString(node.props, "pagination") == "true";
        return (hasTitle ? TABLE_TITLE_HEIGHT : 0.0) + TABLE_HEADER_HEIGHT + rows * TABLE_ROW_HEIGHT +
               (hasPagination ? TABLE_PAGINATION_HEIGHT : 0.0);
    }

    if (type == "Heading" || type == "Text") return wrappedTextHeight(node, availableWidth);
    if (type == "Alert") return alertHeight(node, availableWidth);

    if (type == "SidebarMenu")
    {
        const size_t items = countMenuItems(textOr(node.props, "items", "Item 1,Item 2,Item 3"));
        const double count = items > 0 ? static_cast<double>(items) : SIDEBAR_MENU_DEFAULT_ITEMS;
        return std::max(controlHeight(), count * SIDEBAR_MENU_ITEM_HEIGHT);
    }

    if (type == "Textarea") return TEXTAREA_HEIGHT;
    if (type == "Modal") return MODAL_HEIGHT;
    if (type == "Card" || type == "StatCard") return CARD_HEIGHT;
    if (type == "ChartPlaceholder") return CHART_PLACEHOLDER_HEIGHT;
    if (type == "List") return LIST_HEIGHT;
    if (type == "Topbar") return TOPBAR_HEIGHT;
    if (type == "Divider") return DIVIDER_HEIGHT;
    if (type == "Separate") return separateSize(node);

    return controlHeight();
}

double IntrinsicSizer::componentWidth(const ir::ComponentNode& node) const
{
    const auto& type = node.componentType;

    if (type == "Icon")
    {
        return resolve::ResolveIconSize(textOr(node.props, "size", "md"), m_density);
    }
    if (type == "IconButton")
    {
        return resolve::ResolveIconButtonSize(textOr(node.props, "size", "md"), m_density);
    }
    if (type == "Checkbox" || type == "Radio") return 24.0;
    if (type == "Separate") return separateSize(node);

    if (type == "Button" || type == "Link") return textLengthWidth(textOr(node.props, "text", ""), 8.0, 32.0, 80.0);
    if (type == "Label" || type == "Text")
    {
        const auto content = textOr(node.props, "content", "");
        return textLengthWidth(content.empty() ? textOr(node.props, "text", "") : content, 8.0, 16.0, 60.0);
    }
    if (type == "Heading") return textLengthWidth(textOr(node.props, "text", ""), 12.0, 16.0, 80.0);

    if (type == "Input" || type == "Select" || type == "Textarea") return 200.0;
    if (type == "Image") return imageWidth(textOr(node.props, "placeholder", "landscape"));
    if (type == "Table") return 400.0;
    if (type == "StatCard" || type == "Card") return 280.0;
    if (type == "SidebarMenu") return 260.0;
    if (type == "Badge" || type == "Chip") return textLengthWidth(textOr(node.props, "text", ""), 7.0, 16.0, 50.0);

    return DEFAULT_WIDTH;
}

double IntrinsicSizer::width(const ir::Node* node) const
{
    if (node == nullptr) return DEFAULT_WIDTH;
    if (const auto* component = std::get_if<ir::ComponentNode>(node)) return componentWidth(*component);
    return DEFAULT_WIDTH;
}

} // namespace wire::layout
