/**
 * ************************************************************************
 *
 * @file TextWrap.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 等宽估算的文本折行
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wire::layout
{

/**
 * @brief 每个字符按 0.6 * fontSize 估算宽度，按单词折行，超长单词强制截断
 * @note 长度以 UTF-8 码点计；空段落保留一个空行；结果至少包含一行
 */
std::vector<std::string> WrapTextToLines(std::string_view text, double maxWidth, double fontSize);

/**
 * @brief UTF-8 码点数
 */
size_t CodePointCount(std::string_view text);

} // namespace wire::layout
