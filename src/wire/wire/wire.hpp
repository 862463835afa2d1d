/**
 * ************************************************************************
 *
 * @file wire.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 汇总所有 wirekit 模块头文件
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

// NOLINTBEGIN(unused-included)
#include "../common/Config.hpp"
#include "../common/Diagnostics.hpp"
#include "../common/Events.hpp"
#include "../common/IRContract.hpp"
#include "../common/Policies.hpp"
#include "../common/SyntaxTree.hpp"
#include "../common/Types.hpp"
#include "../singleton/Logger.hpp"

#include "../resolve/ComponentSizes.hpp"
#include "../resolve/DevicePresets.hpp"
#include "../resolve/Spacing.hpp"
#include "../resolve/Typography.hpp"

#include "../ir/ComponentCatalog.hpp"
#include "../ir/ContractValidator.hpp"
#include "../ir/IdGenerator.hpp"
#include "../ir/IRGenerator.hpp"

#include "../layout/IntrinsicSize.hpp"
#include "../layout/LayoutEngine.hpp"
#include "../layout/TextWrap.hpp"

#include "../serialization/Json.hpp"

#include "../api/Compiler.hpp"
// NOLINTEND(unused-included)
