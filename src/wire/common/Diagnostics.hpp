/**
 * ************************************************************************
 *
 * @file Diagnostics.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 编译诊断与组合错误定义
 *
 * 错误全部收集后一次性报告，警告单独取出且不阻断编译。
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
#include <vector>

namespace wire
{

enum class DiagnosticCode : uint8_t
{
    UndefinedComponentsUsed,       // 未定义的组件类型
    MissingRequiredBoundValue,     // 缺少必填绑定参数
    LayoutChildrenArity,           // 自定义布局子节点数量不为 1
    ChildrenSlotOutsideDefinition, // Children 用在布局定义之外
    ChildrenSlotMissingChild,      // 布局定义内的 Children 没有可用内容
    InvalidDefinitionBody,         // 自定义组件主体既不是布局也不是组件
    UnknownContainerType,          // 布局类型既不是内置容器也不是自定义布局
    InvalidContract,               // IR 结构校验失败
    MissingBoundValue,             // [警告] 可选绑定参数缺失
    UnusedDefinitionArgument       // [警告] 传入参数未被使用
};

enum class Severity : uint8_t
{
    ERROR,
    WARNING
};

struct Diagnostic
{
    DiagnosticCode code;
    Severity severity = Severity::ERROR;
    std::string message;

    bool operator==(const Diagnostic&) const = default;
};

/**
 * @brief 诊断码的 kebab-case 文本 (用于汇总消息)
 */
std::string_view ToString(DiagnosticCode code);

/**
 * @brief 组合失败的类别
 */
enum class CompositionFailure : uint8_t
{
    UndefinedComponentsUsed,
    CompositionFailed,
    InvalidContract
};

/**
 * @brief IR 生成失败时返回的聚合错误
 */
struct CompositionError
{
    CompositionFailure failure = CompositionFailure::CompositionFailed;
    std::vector<Diagnostic> diagnostics;          // 全部致命诊断
    std::vector<std::string> undefinedComponents; // 已排序去重

    /**
     * @brief 生成面向用户的汇总消息
     */
    [[nodiscard]] std::string message() const;
};

} // namespace wire
