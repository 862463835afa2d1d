/**
 * ************************************************************************
 *
 * @file IdGenerator.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 节点 id 生成器实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "IdGenerator.hpp"

#include <format>

namespace wire::ir
{

std::string IdGenerator::generate(std::string_view prefix)
{
    auto& counter = m_counters[std::string(prefix)];
    ++counter;
    return std::format("{}_{}", prefix, counter);
}

} // namespace wire::ir
