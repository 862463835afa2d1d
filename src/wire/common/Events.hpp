/**
 * ************************************************************************
 *
 * @file Events.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief wire 编译事件定义
 *
 * 事件通过生成器实例自有的 entt::dispatcher 以 trigger 方式立即分发，
 * 不存在全局分发器。
 *
 * ************************************************************************
 */

#pragma once
#include "Diagnostics.hpp"

namespace wire::events
{

/**
 * @brief 记录到一条诊断 (错误或警告) 时触发
 * [IMMEDIATE] 使用 trigger
 */
struct DiagnosticReported
{
    using is_event_tag = void;
    Diagnostic diagnostic;
};

} // namespace wire::events
