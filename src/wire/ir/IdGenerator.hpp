/**
 * ************************************************************************
 *
 * @file IdGenerator.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 按前缀递增的节点 id 生成器
 *
 * 每次编译前必须 reset()，保证同一输入得到相同 id 序列。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wire::ir
{

class IdGenerator
{
public:
    /**
     * @brief 生成 "{prefix}_{n}"，n 从 1 开始按前缀独立计数
     */
    std::string generate(std::string_view prefix);

    /**
     * @brief 清空所有计数器
     */
    void reset() { m_counters.clear(); }

private:
    std::unordered_map<std::string, uint64_t> m_counters;
};

} // namespace wire::ir
