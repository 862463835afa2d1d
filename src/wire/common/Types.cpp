/**
 * ************************************************************************
 *
 * @file Types.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 核心值类型工具函数实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Types.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>

namespace wire
{

std::optional<double> ToNumber(const Scalar& value)
{
    return std::visit(Overloaded{[](double number) -> std::optional<double>
                                 {
                                     if (std::isnan(number)) return std::nullopt;
                                     return number;
                                 },
                                 [](const std::string& text) -> std::optional<double>
                                 {
                                     // 去除首尾空白
                                     const auto first = text.find_first_not_of(" \t\r\n");
                                     if (first == std::string::npos) return std::nullopt;
                                     const auto last = text.find_last_not_of(" \t\r\n");

                                     const char* begin = text.data() + first;
                                     const char* end = text.data() + last + 1;
                                     if (*begin == '+') ++begin;

                                     double result = 0.0;
                                     auto [ptr, ec] = std::from_chars(begin, end, result);
                                     if (ec != std::errc{} || ptr != end) return std::nullopt;
                                     return result;
                                 }},
                      value);
}

std::string ToString(const Scalar& value)
{
    return std::visit(Overloaded{[](const std::string& text) { return text; },
                                 [](double number)
                                 {
                                     if (std::isfinite(number) && std::trunc(number) == number &&
                                         std::abs(number) < 9.0e15)
                                     {
                                         return std::format("{}", static_cast<int64_t>(number));
                                     }
                                     return std::format("{}", number);
                                 }},
                      value);
}

std::optional<std::string> FindString(const PropertyMap& props, const std::string& key)
{
    auto it = props.find(key);
    if (it == props.end()) return std::nullopt;
    return ToString(it->second);
}

std::optional<double> FindPositiveNumber(const PropertyMap& props, const std::string& key)
{
    auto it = props.find(key);
    if (it == props.end()) return std::nullopt;

    auto number = ToNumber(it->second);
    if (!number || *number <= 0.0) return std::nullopt;
    return number;
}

} // namespace wire
