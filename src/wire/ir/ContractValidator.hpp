/**
 * ************************************************************************
 *
 * @file ContractValidator.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief IR 契约结构校验
 *
 * 构建完成后的纯函数检查：
  - 版本号、项目样式枚举合法
  - 节点表键与节点 id 一致
  - 屏幕根引用与子节点引用全部可解析
  - align / justify 取值在范围内
  - 引用图为树 (无环、无共享子节点)
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <vector>
#include "../common/Diagnostics.hpp"
#include "../common/IRContract.hpp"

namespace wire::ir
{

/**
 * @brief 校验契约，返回全部问题 (空表示合法)，诊断码均为 InvalidContract
 */
[[nodiscard]] std::vector<Diagnostic> ValidateContract(const IRContract& contract);

} // namespace wire::ir
