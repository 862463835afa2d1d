/**
 * ************************************************************************
 *
 * @file Spacing.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 间距 token 与密度解析
 *
 * none=0 xs=4 sm=8 md=16 lg=24 xl=32，
 * 密度系数 compact 0.8 / normal 1.0 / comfortable 1.25 (仅 densityAware 时生效)。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <optional>
#include <string_view>
#include "../common/Policies.hpp"

namespace wire::resolve
{

/**
 * @brief token 对应的基础像素值，未知 token 返回 nullopt
 */
std::optional<int> SpacingBaseValue(std::string_view token);

/**
 * @brief 密度缩放系数
 */
double DensityFactor(policies::Density density);

/**
 * @brief 解析间距 token
 * @param token 可选 token，缺失或未知时使用 fallback
 * @param fallback 备用 token (自身未知时按 md)
 * @param density 密度等级
 * @param densityAware 是否按密度缩放 (四舍五入)
 * @return 像素值
 */
int ResolveSpacingToken(std::optional<std::string_view> token,
                        std::string_view fallback = "md",
                        policies::Density density = policies::Density::NORMAL,
                        bool densityAware = false);

} // namespace wire::resolve
