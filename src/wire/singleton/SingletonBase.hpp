/**
 * ************************************************************************
 *
 * @file SingletonBase.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.2
 * @brief 单例基类模板
 *
 * 仅用于进程级的无状态设施 (日志)。编译状态一律放在实例中。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <utility>

namespace wire
{

template <typename Derived>
class SingletonBase
{
public:
    template <typename... Args>
    static Derived& getInstance(Args&&... args)
    {
        // 静态局部变量，C++11 起保证线程安全地只初始化一次
        static Derived instance(std::forward<Args>(args)...);
        return instance;
    }

    SingletonBase(const SingletonBase&) = delete;
    SingletonBase& operator=(const SingletonBase&) = delete;
    SingletonBase(SingletonBase&&) = delete;
    SingletonBase& operator=(SingletonBase&&) = delete;

protected:
    SingletonBase() = default;
    virtual ~SingletonBase() = default;
};

} // namespace wire
