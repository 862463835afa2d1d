/**
 * ************************************************************************
 *
 * @file Logger.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.2
 * @brief wire 模块日志系统封装
  - 基于 spdlog 实现的日志系统封装
  - 控制台 + 轮转文件双输出
  - 支持源码位置记录，便于定位诊断来源
  - 线程安全的一次性初始化
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <concepts>
#include <memory>
#include <source_location>
#include <vector>
#include "SingletonBase.hpp"

namespace wire
{
/**
 * @brief 辅助结构体：用于在调用点自动捕获位置和格式化字符串
 */
struct LogLocation
{
    spdlog::string_view_t fmt;
    std::source_location loc;

    template <typename T>
        requires std::convertible_to<T, spdlog::string_view_t>
    constexpr LogLocation(const T& s, std::source_location l = std::source_location::current()) : fmt(s), loc(l)
    {
    }
};

class Logger : public SingletonBase<Logger>
{
    static constexpr size_t MAX_LOG_FILE_SIZE = 1024 * 1024 * 5; // 5MB
    static constexpr size_t MAX_LOG_FILE_COUNT = 1;

    friend class SingletonBase<Logger>;

public:
    template <typename... Args>
    static void warn(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::warn, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::info, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::err, msg, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogLocation msg, Args&&... args)
    {
        getInstance().log_impl(spdlog::level::debug, msg, std::forward<Args>(args)...);
    }

    /**
     * @brief 调整输出级别 (例如测试中压低为 warn)
     */
    static void setLevel(spdlog::level::level_enum level) { getInstance().m_logger->set_level(level); }

private:
    Logger()
    {
        // 1. 控制台 sink
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%l] %n: %v%$");

        // 2. 轮转文件 sink
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/wirekit.log", MAX_LOG_FILE_SIZE, MAX_LOG_FILE_COUNT);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%# %!] %v");

        std::vector<spdlog::sink_ptr> sinks{consoleSink, fileSink};
        m_logger = std::make_shared<spdlog::logger>("wirekit", sinks.begin(), sinks.end());

        m_logger->set_level(spdlog::level::info);
        m_logger->flush_on(spdlog::level::warn);
    }

    template <typename... Args>
    void log_impl(spdlog::level::level_enum lvl, const LogLocation& msg, Args&&... args)
    {
        m_logger->log(
            spdlog::source_loc{msg.loc.file_name(), static_cast<int>(msg.loc.line()), msg.loc.function_name()},
            lvl,
            fmt::runtime(msg.fmt),
            std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace wire
