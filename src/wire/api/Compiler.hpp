/**
 * ************************************************************************
 *
 * @file Compiler.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 编译入口：语法树 -> IR 契约 -> 坐标表
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <expected>
#include <vector>
#include "../common/Config.hpp"
#include "../common/Diagnostics.hpp"
#include "../common/IRContract.hpp"
#include "../common/SyntaxTree.hpp"
#include "../layout/LayoutEngine.hpp"

namespace wire
{

struct CompileResult
{
    ir::IRContract contract;
    layout::PositionMap positions;
    std::vector<Diagnostic> warnings;
};

class Compiler
{
public:
    explicit Compiler(LayoutOptions options = {}) : m_options(options) {}

    /**
     * @brief 一次完整编译；每次调用使用全新的生成器与布局引擎
     * @return 失败时不返回任何部分结果
     */
    [[nodiscard]] std::expected<CompileResult, CompositionError> compile(const ast::Project& tree) const;

private:
    LayoutOptions m_options;
};

} // namespace wire
