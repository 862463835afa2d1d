/**
 * ************************************************************************
 *
 * @file Compiler.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 编译入口实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Compiler.hpp"

#include "../ir/IRGenerator.hpp"
#include "../singleton/Logger.hpp"

namespace wire
{

std::expected<CompileResult, CompositionError> Compiler::compile(const ast::Project& tree) const
{
    ir::IRGenerator generator;
    auto contract = generator.generate(tree);
    if (!contract)
    {
        return std::unexpected(std::move(contract.error()));
    }

    CompileResult result;
    result.warnings = generator.warnings();
    result.positions = layout::LayoutEngine(*contract, m_options).calculate();
    result.contract = std::move(*contract);

    Logger::info("[Compiler] \"{}\" 编译完成: {} 个屏幕, {} 个节点, {} 条警告",
                 tree.name,
                 result.contract.project.screens.size(),
                 result.contract.project.nodes.size(),
                 result.warnings.size());
    return result;
}

} // namespace wire
