/**
 * ************************************************************************
 *
 * @file Json.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief IR 契约 / 坐标表 / 语法树的 JSON 编解码
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <expected>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/IRContract.hpp"
#include "../common/SyntaxTree.hpp"
#include "../layout/LayoutEngine.hpp"

namespace wire::serialization
{

struct SerializationError
{
    std::string message;
};

/**
 * @brief IR 契约 -> JSON，节点以 "kind" 区分容器与组件，整数值写为 JSON 整数
 */
[[nodiscard]] nlohmann::json ToJson(const ir::IRContract& contract);

/**
 * @brief 坐标表 -> { id: {x, y, width, height} }
 */
[[nodiscard]] nlohmann::json ToJson(const layout::PositionMap& positions);

/**
 * @brief 读取已持久化的 IR 契约，读取后做结构校验
 */
std::expected<ir::IRContract, SerializationError> ContractFromJson(const nlohmann::json& json);

/**
 * @brief 读取外部解析器产出的语法树
 * @note 以 "prop_" 开头的字符串值视为绑定参数
 */
std::expected<ast::Project, SerializationError> SyntaxTreeFromJson(const nlohmann::json& json);

} // namespace wire::serialization
