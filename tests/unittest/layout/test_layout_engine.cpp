/**
 * ************************************************************************
 *
 * @file test_layout_engine.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 布局引擎单元测试
 *
 * 通过 IR 生成器构造契约再计算布局，验证：
  - 纵向 / 横向间距、内边距、网格分行
  - 卡片自适应高度与纵向校正
  - split / panel / justify / 交叉轴对齐
  - 固有尺寸估算与密度单调性
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <wire.hpp>
#include "common/SyntaxTreeBuilder.h"

namespace wire::tests
{

using ir::ContainerNode;
using policies::ContainerKind;

class LayoutEngineTest : public ::testing::Test
{
protected:
    void SetUp() override { Logger::setLevel(spdlog::level::off); }

    /**
     * @brief 生成 IR 并计算布局，失败时记录测试失败
     */
    bool Run(ast::Layout root, std::map<std::string, std::string> style = {})
    {
        auto contract = ir::GenerateIR(SingleScreen(std::move(root), std::move(style)));
        if (!contract)
        {
            ADD_FAILURE() << contract.error().message();
            return false;
        }
        m_contract = std::move(*contract);
        m_positions = layout::CalculateLayout(m_contract);
        return true;
    }

    const ContainerNode& Root() const { return RootOf(m_contract); }

    const ContainerNode& Container(const ContainerNode& parent, size_t index) const
    {
        return std::get<ContainerNode>(ChildOf(m_contract, parent, index));
    }

    const LayoutBox& Box(const ContainerNode& parent, size_t index) const
    {
        return m_positions.at(parent.children.at(index).ref);
    }

    const LayoutBox& RootBox() const { return m_positions.at(Root().id); }

    ir::IRContract m_contract;
    layout::PositionMap m_positions;
};

// ===================== 间距与内边距 =====================

// 测试 1: 纵向 stack，第二个子节点 y = 第一个 y + 高度 + gap(md=16)
TEST_F(LayoutEngineTest, VerticalSpacingLaw)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"direction", "vertical"}, {"gap", "md"}},
                        {Comp("Button", {{"text", "A"}, {"height", 40.0}}),
                         Comp("Input", {{"height", 50.0}})})));

    const auto& first = Box(Root(), 0);
    const auto& second = Box(Root(), 1);
    EXPECT_DOUBLE_EQ(first.y, 0.0);
    EXPECT_DOUBLE_EQ(first.height, 40.0);
    EXPECT_DOUBLE_EQ(second.y, first.y + 40.0 + 16.0);
    EXPECT_DOUBLE_EQ(second.height, 50.0);

    // 纵向 stack 的高度回写为内容高度
    EXPECT_DOUBLE_EQ(RootBox().height, 40.0 + 16.0 + 50.0);
    EXPECT_DOUBLE_EQ(RootBox().width, 1280.0);
}

// 测试 2: 横向 stack，第二个子节点 x = 第一个 x + 宽度 + gap(lg=24)
TEST_F(LayoutEngineTest, HorizontalSpacingLaw)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"direction", "horizontal"}, {"gap", "lg"}},
                        {Comp("Button", {{"text", "A"}}), Comp("Button", {{"text", "B"}})})));

    const auto& first = Box(Root(), 0);
    const auto& second = Box(Root(), 1);
    EXPECT_DOUBLE_EQ(first.width, (1280.0 - 24.0) / 2.0);
    EXPECT_DOUBLE_EQ(second.x, first.x + first.width + 24.0);
    EXPECT_DOUBLE_EQ(second.y, first.y);
}

// 测试 3: 内边距 xl(32) 使第一个子节点在 x / y 上各偏移 32
TEST_F(LayoutEngineTest, PaddingLaw)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {},
                        {LayNode("stack", {{"padding", "xl"}}, {Comp("Button", {{"text", "Inside"}})})})));

    const auto& inner = Container(Root(), 0);
    const auto& innerBox = Box(Root(), 0);
    const auto& child = Box(inner, 0);
    EXPECT_DOUBLE_EQ(child.x - innerBox.x, 32.0);
    EXPECT_DOUBLE_EQ(child.y - innerBox.y, 32.0);
    EXPECT_DOUBLE_EQ(child.width, innerBox.width - 64.0);
    EXPECT_DOUBLE_EQ(innerBox.height, 32.0 + 40.0 + 32.0);
}

// ===================== 网格 =====================

// 测试 4: 12 列网格，三个 span=4 的单元格同一行、等宽、x 递增
TEST_F(LayoutEngineTest, GridPacksOneRow)
{
    ASSERT_TRUE(Run(Lay("grid",
                        {{"columns", 12.0}, {"gap", "md"}},
                        {CellNode({{"span", 4.0}}, {Comp("StatCard", {{"title", "A"}})}),
                         CellNode({{"span", 4.0}}, {Comp("StatCard", {{"title", "B"}})}),
                         CellNode({{"span", 4.0}}, {Comp("StatCard", {{"title", "C"}})})})));

    const double columnWidth = (1280.0 - 16.0 * 11.0) / 12.0;
    const double cellWidth = 4.0 * columnWidth + 3.0 * 16.0;
    for (size_t index = 0; index < 3; ++index)
    {
        const auto& cell = Box(Root(), index);
        EXPECT_DOUBLE_EQ(cell.y, 0.0);
        EXPECT_DOUBLE_EQ(cell.width, cellWidth);
        EXPECT_DOUBLE_EQ(cell.x, static_cast<double>(index) * 4.0 * (columnWidth + 16.0));
    }
    EXPECT_LT(Box(Root(), 0).x, Box(Root(), 1).x);
    EXPECT_LT(Box(Root(), 1).x, Box(Root(), 2).x);
}

// 测试 5: 三个 span=6 的单元格，第三个换到新行
TEST_F(LayoutEngineTest, GridWrapsRows)
{
    ASSERT_TRUE(Run(Lay("grid",
                        {{"columns", 12.0}, {"gap", "md"}},
                        {CellNode({{"span", 6.0}}, {Comp("Input")}),
                         CellNode({{"span", 6.0}}, {Comp("Textarea")}),
                         CellNode({{"span", 6.0}}, {Comp("Input")})})));

    const auto& first = Box(Root(), 0);
    const auto& second = Box(Root(), 1);
    const auto& third = Box(Root(), 2);
    EXPECT_DOUBLE_EQ(first.y, second.y);
    EXPECT_GT(third.y, first.y);
    EXPECT_DOUBLE_EQ(third.x, first.x);
    // 第一行高度取最高单元格 (Textarea 100)
    EXPECT_DOUBLE_EQ(third.y, 100.0 + 16.0);
}

// 测试 6: span 超过列数时夹紧为整行
TEST_F(LayoutEngineTest, GridClampsOversizedSpan)
{
    ASSERT_TRUE(Run(Lay("grid", {{"columns", 4.0}, {"gap", "none"}}, {CellNode({{"span", 20.0}}, {Comp("Input")})})));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 1280.0);
}

// ===================== 卡片与校正 =====================

// 测试 7: 卡片高度 = 子节点高度 + 间距 + 上下内边距，子节点互不重叠
TEST_F(LayoutEngineTest, CardAutoSizing)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {},
                        {LayNode("card",
                                 {{"padding", "md"}, {"gap", "sm"}},
                                 {Comp("Button", {{"text", "Save"}}), Comp("Input"), Comp("Divider")})})));

    const auto& card = Container(Root(), 0);
    const auto& cardBox = Box(Root(), 0);
    const auto& a = Box(card, 0);
    const auto& b = Box(card, 1);
    const auto& c = Box(card, 2);

    EXPECT_DOUBLE_EQ(a.x, cardBox.x + 16.0);
    EXPECT_DOUBLE_EQ(a.y, cardBox.y + 16.0);
    EXPECT_DOUBLE_EQ(b.y, a.y + a.height + 8.0);
    EXPECT_DOUBLE_EQ(c.y, b.y + b.height + 8.0);
    EXPECT_DOUBLE_EQ(cardBox.height, 40.0 + 8.0 + 40.0 + 8.0 + 1.0 + 2.0 * 16.0);
}

// 测试 8: 实际高度超出预估时，后续兄弟及其后代整体下移
TEST_F(LayoutEngineTest, ReconciliationShiftsFollowingSiblings)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"gap", "md"}},
                        {Comp("Text", {{"content", "alpha beta gamma delta epsilon zeta eta theta"}, {"width", 100.0}}),
                         LayNode("card", {{"padding", "sm"}}, {Comp("Button", {{"text", "Next"}})})})));

    const auto& text = Box(Root(), 0);
    const auto& cardBox = Box(Root(), 1);
    const auto& button = Box(Container(Root(), 1), 0);

    // 宽 100 时每行 11 个字符，共 5 行，行高 21
    EXPECT_DOUBLE_EQ(text.width, 100.0);
    EXPECT_DOUBLE_EQ(text.height, 105.0);
    EXPECT_DOUBLE_EQ(cardBox.y, text.y + text.height + 16.0);
    EXPECT_DOUBLE_EQ(button.y, cardBox.y + 8.0);
    EXPECT_DOUBLE_EQ(RootBox().height, 105.0 + 16.0 + cardBox.height);
}

// ===================== split / panel =====================

// 测试 9: 默认 260 宽侧栏 + 自适应内容区
TEST_F(LayoutEngineTest, SplitDefaultSidebar)
{
    ASSERT_TRUE(Run(Lay("split",
                        {{"gap", "md"}},
                        {Comp("SidebarMenu", {{"items", "Home,Reports"}}),
                         LayNode("stack", {}, {Comp("Heading", {{"text", "Content"}})})})));

    const auto& sidebar = Box(Root(), 0);
    const auto& content = Box(Root(), 1);
    EXPECT_DOUBLE_EQ(sidebar.x, 0.0);
    EXPECT_DOUBLE_EQ(sidebar.width, 260.0);
    EXPECT_DOUBLE_EQ(content.x, 260.0 + 16.0);
    EXPECT_DOUBLE_EQ(content.width, 1280.0 - 260.0 - 16.0);
}

// 测试 10: left / right 指定固定面板宽度
TEST_F(LayoutEngineTest, SplitExplicitPanels)
{
    ASSERT_TRUE(Run(Lay("split", {{"left", 300.0}, {"gap", "none"}}, {Comp("List"), Comp("Table", {{"columns", "a"}})})));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 300.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x, 300.0);

    ASSERT_TRUE(Run(Lay("split", {{"right", 200.0}, {"gap", "md"}}, {Comp("Table", {{"columns", "a"}}), Comp("List")})));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 1280.0 - 200.0 - 16.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x, 1280.0 - 200.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).width, 200.0);
}

// 测试 11: split 只有一个子节点时占满宽度
TEST_F(LayoutEngineTest, SplitSingleChildTakesFullWidth)
{
    ASSERT_TRUE(Run(Lay("split", {}, {Comp("Table", {{"columns", "a"}})})));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 1280.0);
}

// 测试 12: panel 直通第一个子节点，多余子节点折叠为零尺寸
TEST_F(LayoutEngineTest, PanelPassesFirstChild)
{
    ASSERT_TRUE(Run(Lay("panel", {{"padding", "lg"}}, {Comp("Textarea"), Comp("Button", {{"text", "Extra"}})})));

    const auto& first = Box(Root(), 0);
    EXPECT_DOUBLE_EQ(first.x, 24.0);
    EXPECT_DOUBLE_EQ(first.y, 24.0);
    EXPECT_DOUBLE_EQ(first.width, 1280.0 - 48.0);
    EXPECT_DOUBLE_EQ(first.height, 100.0);

    const auto& extra = Box(Root(), 1);
    EXPECT_DOUBLE_EQ(extra.width, 0.0);
    EXPECT_DOUBLE_EQ(extra.height, 0.0);
}

// ===================== 横向对齐 =====================

// 测试 13: align left / center / right 使用自然宽度
TEST_F(LayoutEngineTest, HorizontalAlignNaturalWidths)
{
    auto row = [](const char* align)
    {
        return Lay("stack",
                   {{"direction", "horizontal"}, {"align", align}, {"gap", "md"}},
                   {Comp("Button", {{"text", "OK"}}), Comp("Button", {{"text", "No"}})});
    };

    // Button 自然宽度 max(80, 2*8+32) = 80，总宽 80 + 16 + 80 = 176
    ASSERT_TRUE(Run(row("left")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 0.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 80.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x, 96.0);

    ASSERT_TRUE(Run(row("center")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, (1280.0 - 176.0) / 2.0);

    ASSERT_TRUE(Run(row("right")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 1280.0 - 176.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x + Box(Root(), 1).width, 1280.0);
}

// 测试 14: 显式宽度即使同时给出高度也生效
TEST_F(LayoutEngineTest, ExplicitWidthWithHeight)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"direction", "horizontal"}, {"align", "left"}},
                        {Comp("Button", {{"text", "Wide"}, {"width", 150.0}, {"height", 60.0}})})));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 150.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 0).height, 60.0);
}

// 测试 15: justify 分布
TEST_F(LayoutEngineTest, JustifyDistribution)
{
    auto row = [](const char* justify, size_t count)
    {
        std::vector<ast::Node> children;
        for (size_t index = 0; index < count; ++index)
        {
            children.push_back(Comp("Button", {{"text", "OK"}}));
        }
        return Lay("stack", {{"direction", "horizontal"}, {"justify", justify}, {"gap", "md"}}, std::move(children));
    };

    ASSERT_TRUE(Run(row("spaceBetween", 3)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 0.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x, 80.0 + 520.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 2).x, 1280.0 - 80.0);

    // 单个子节点退化为 start
    ASSERT_TRUE(Run(row("spaceBetween", 1)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 0.0);

    ASSERT_TRUE(Run(row("spaceAround", 2)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 280.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).x, 280.0 + 80.0 + 560.0);

    ASSERT_TRUE(Run(row("end", 2)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, 1280.0 - 176.0);

    ASSERT_TRUE(Run(row("center", 2)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).x, (1280.0 - 176.0) / 2.0);

    // stretch 与默认行为相同：等宽
    ASSERT_TRUE(Run(row("stretch", 2)));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, (1280.0 - 16.0) / 2.0);
}

// 测试 16: 交叉轴对齐，矮的兄弟在行内顶 / 中 / 底对齐
TEST_F(LayoutEngineTest, CrossAxisAlignment)
{
    auto row = [](const char* align)
    {
        return Lay("stack",
                   {{"direction", "horizontal"}, {"justify", "start"}, {"align", align}},
                   {Comp("Button", {{"text", "OK"}}), Comp("Textarea")});
    };

    ASSERT_TRUE(Run(row("start")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).y, 0.0);

    ASSERT_TRUE(Run(row("center")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).y, (100.0 - 40.0) / 2.0);

    ASSERT_TRUE(Run(row("end")));
    EXPECT_DOUBLE_EQ(Box(Root(), 0).y, 100.0 - 40.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).y, 0.0);
}

// ===================== 固有尺寸与密度 =====================

// 测试 17: 各类组件的固有高度
TEST_F(LayoutEngineTest, IntrinsicHeights)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"gap", "none"}},
                        {Comp("Table", {{"columns", "a"}, {"title", "Orders"}, {"rows", 3.0}, {"pagination", "true"}}),
                         Comp("Image", {{"placeholder", "landscape"}}),
                         Comp("SidebarMenu", {{"items", "A, B, C, D"}}),
                         Comp("Divider"),
                         Comp("Separate", {{"size", "lg"}}),
                         Comp("Separate", {{"size", 10.0}}),
                         Comp("Topbar", {{"title", "App"}}),
                         Comp("Alert", {{"text", "Saved"}})})));

    EXPECT_DOUBLE_EQ(Box(Root(), 0).height, 32.0 + 44.0 + 3.0 * 36.0 + 64.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).height, 1280.0 * 9.0 / 16.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 2).height, 4.0 * 40.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 3).height, 1.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 4).height, 24.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 5).height, 10.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 6).height, 56.0);
    // 12 + ceil(13*1.4) + 12 = 43
    EXPECT_DOUBLE_EQ(Box(Root(), 7).height, 43.0);
}

// 测试 18: 长标题按宽度折行
TEST_F(LayoutEngineTest, HeadingWrapsAtAvailableWidth)
{
    ASSERT_TRUE(Run(Lay("stack",
                        {{"direction", "horizontal"}, {"gap", "none"}},
                        {Comp("Heading", {{"text", "Quarterly revenue overview for all regions"}}),
                         Comp("Heading", {{"text", "Short"}}),
                         Comp("Heading", {{"text", "Short"}}),
                         Comp("Heading", {{"text", "Short"}})})));

    // 每列 320 宽，字宽 12，一行 26 个字符，两行，行高 ceil(20*1.25)=25
    EXPECT_DOUBLE_EQ(Box(Root(), 0).height, 50.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 1).height, 40.0);
}

// 测试 19: 紧凑密度下的控件尺寸严格小于宽松密度
TEST_F(LayoutEngineTest, DensityMonotonicity)
{
    auto tree = []
    {
        return Lay("stack",
                   {{"direction", "horizontal"}, {"align", "left"}, {"gap", "md"}},
                   {Comp("Button", {{"text", "Go"}}), Comp("Icon", {{"icon", "star"}}), Comp("Input")});
    };

    ASSERT_TRUE(Run(tree(), {{"density", "compact"}}));
    const auto compactButton = Box(Root(), 0);
    const auto compactIcon = Box(Root(), 1);
    const auto compactGap = Box(Root(), 1).x - (Box(Root(), 0).x + Box(Root(), 0).width);

    ASSERT_TRUE(Run(tree(), {{"density", "comfortable"}}));
    const auto comfortableButton = Box(Root(), 0);
    const auto comfortableIcon = Box(Root(), 1);
    const auto comfortableGap = Box(Root(), 1).x - (Box(Root(), 0).x + Box(Root(), 0).width);

    EXPECT_LT(compactButton.height, comfortableButton.height);
    EXPECT_LT(compactIcon.width, comfortableIcon.width);
    EXPECT_LT(compactGap, comfortableGap);
}

// ===================== 遍历 =====================

// 测试 20: 设备预设决定根宽度
TEST_F(LayoutEngineTest, UsesScreenViewport)
{
    ASSERT_TRUE(Run(Lay("stack", {}, {Comp("Button", {{"text", "A"}})}), {{"device", "mobile"}}));
    EXPECT_DOUBLE_EQ(RootBox().width, 375.0);
    EXPECT_DOUBLE_EQ(Box(Root(), 0).width, 375.0);
}

// 测试 21: 每个节点都有坐标，并记录放置它的容器类型
TEST_F(LayoutEngineTest, EveryNodePositionedWithParentKind)
{
    auto contract = ir::GenerateIR(SingleScreen(Lay(
        "split",
        {},
        {Comp("SidebarMenu", {{"items", "A,B"}}),
         LayNode("stack",
                 {},
                 {LayNode("grid",
                          {{"columns", 2.0}},
                          {CellNode({}, {Comp("StatCard", {{"title", "A"}})}), CellNode({}, {Comp("Chart", {{"type", "bar"}})})}),
                  LayNode("card", {}, {Comp("Text", {{"content", "Body"}})})})})));
    ASSERT_TRUE(contract.has_value());

    layout::LayoutEngine engine(*contract);
    const auto positions = engine.calculate();
    EXPECT_EQ(positions.size(), contract->project.nodes.size());

    const auto& root = RootOf(*contract);
    EXPECT_FALSE(engine.parentKindOf(root.id).has_value());
    EXPECT_EQ(engine.parentKindOf(root.children[0].ref), ContainerKind::SPLIT);

    const auto& stack = std::get<ContainerNode>(ChildOf(*contract, root, 1));
    const auto& grid = std::get<ContainerNode>(ChildOf(*contract, stack, 0));
    EXPECT_EQ(engine.parentKindOf(grid.id), ContainerKind::STACK);
    EXPECT_EQ(engine.parentKindOf(grid.children[0].ref), ContainerKind::GRID);

    const auto& card = std::get<ContainerNode>(ChildOf(*contract, stack, 1));
    EXPECT_EQ(engine.parentKindOf(card.children[0].ref), ContainerKind::CARD);
}

// 测试 22: 悬空引用被跳过而不是崩溃
TEST_F(LayoutEngineTest, SkipsDanglingReferences)
{
    ir::IRContract contract;
    ContainerNode root;
    root.id = "node_1";
    root.children = {{"node_404"}};
    contract.project.nodes.emplace(root.id, root);
    contract.project.screens.push_back(ir::IRScreen{.id = "main", .name = "Main", .root = {"node_1"}});

    const auto positions = layout::CalculateLayout(contract, LayoutOptions{.fallbackViewportWidth = 800.0});
    ASSERT_EQ(positions.size(), 1U);
    EXPECT_DOUBLE_EQ(positions.at("node_1").width, 800.0);
    EXPECT_FALSE(positions.contains("node_404"));
}

// ===================== split 测量 =====================

// 测试 23: split 按面板实际宽度测高，窄面板中的折行文本不与后续兄弟重叠
TEST_F(LayoutEngineTest, SplitMeasuresPanelsAtPlacedWidth)
{
    std::string content;
    for (int word = 0; word < 40; ++word)
    {
        if (!content.empty()) content += ' ';
        content += "alpha";
    }

    auto page = [&content](AstPropertyMap splitParams)
    {
        return Lay("stack",
                   {{"gap", "md"}},
                   {LayNode("split",
                            std::move(splitParams),
                            {LayNode("stack", {}, {Comp("Text", {{"content", content}})}), Comp("Input")}),
                    Comp("Button", {{"text", "Next"}})});
    };

    // 默认 260 宽侧栏：每行 30 个字符 (5 个单词)，共 8 行，行高 21
    ASSERT_TRUE(Run(page({})));
    {
        const auto& split = Container(Root(), 0);
        const auto& splitBox = Box(Root(), 0);
        const auto& text = Box(Container(split, 0), 0);
        const auto& button = Box(Root(), 1);

        EXPECT_DOUBLE_EQ(text.width, 260.0);
        EXPECT_DOUBLE_EQ(text.height, 8.0 * 21.0);
        EXPECT_DOUBLE_EQ(splitBox.height, text.height);
        EXPECT_DOUBLE_EQ(button.y, splitBox.y + splitBox.height + 16.0);
        EXPECT_GE(button.y, text.y + text.height + 16.0);
    }

    // 右侧固定面板：左侧内容区宽 1280 - 300 - 16
    ASSERT_TRUE(Run(page({{"right", 300.0}})));
    {
        const auto& split = Container(Root(), 0);
        const auto& text = Box(Container(split, 0), 0);
        const auto& button = Box(Root(), 1);

        EXPECT_DOUBLE_EQ(text.width, 1280.0 - 300.0 - 16.0);
        EXPECT_GE(button.y, text.y + text.height + 16.0);
    }
}

} // namespace wire::tests
