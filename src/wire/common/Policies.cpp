/**
 * ************************************************************************
 *
 * @file Policies.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @brief 枚举与 DSL 关键字之间的转换
 *
 * ************************************************************************
 */
#include "Policies.hpp"

namespace wire::policies
{

std::optional<ContainerKind> ParseContainerKind(std::string_view text)
{
    if (text == "stack") return ContainerKind::STACK;
    if (text == "grid") return ContainerKind::GRID;
    if (text == "split") return ContainerKind::SPLIT;
    if (text == "panel") return ContainerKind::PANEL;
    if (text == "card") return ContainerKind::CARD;
    return std::nullopt;
}

std::string_view ToString(ContainerKind kind)
{
    switch (kind)
    {
        case ContainerKind::STACK:
            return "stack";
        case ContainerKind::GRID:
            return "grid";
        case ContainerKind::SPLIT:
            return "split";
        case ContainerKind::PANEL:
            return "panel";
        case ContainerKind::CARD:
            return "card";
    }
    return "stack";
}

std::optional<Density> ParseDensity(std::string_view text)
{
    if (text == "compact") return Density::COMPACT;
    if (text == "normal") return Density::NORMAL;
    if (text == "comfortable") return Density::COMFORTABLE;
    return std::nullopt;
}

std::string_view ToString(Density density)
{
    switch (density)
    {
        case Density::COMPACT:
            return "compact";
        case Density::NORMAL:
            return "normal";
        case Density::COMFORTABLE:
            return "comfortable";
    }
    return "normal";
}

std::optional<Alignment> ParseAlignment(std::string_view text)
{
    if (text == "justify") return Alignment::JUSTIFY;
    if (text == "left") return Alignment::LEFT;
    if (text == "center") return Alignment::CENTER;
    if (text == "right") return Alignment::RIGHT;
    return std::nullopt;
}

std::optional<CrossAlignment> ParseCrossAlignment(std::string_view text)
{
    // 横向 stack 未设置 justify 时 center 归主轴
    if (text == "start") return CrossAlignment::START;
    if (text == "center") return CrossAlignment::CENTER;
    if (text == "end") return CrossAlignment::END;
    return std::nullopt;
}

std::optional<Justify> ParseJustify(std::string_view text)
{
    if (text == "stretch") return Justify::STRETCH;
    if (text == "start") return Justify::START;
    if (text == "center") return Justify::CENTER;
    if (text == "end") return Justify::END;
    if (text == "spaceBetween") return Justify::SPACE_BETWEEN;
    if (text == "spaceAround") return Justify::SPACE_AROUND;
    return std::nullopt;
}

std::string_view ToString(MacroKind kind)
{
    return kind == MacroKind::COMPONENT ? "component" : "layout";
}

} // namespace wire::policies
