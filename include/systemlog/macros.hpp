/**
 * @file macros.hpp
 * @brief Logging macros for systemlog
 * @brief systemlog 日志宏定义
 *
 * Each macro forwards to the matching method of SystemLogger::Main().
 * Define SYSTEMLOG_DISABLE_<LEVEL> before including to compile it out.
 *
 * 每个宏转发到 SystemLogger::Main() 的对应方法。
 * 在包含之前定义 SYSTEMLOG_DISABLE_<LEVEL> 可在编译期移除。
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include "systemlog/logger.hpp"

#ifndef SYSTEMLOG_DISABLE_DEBUG
#define SYSTEMLOG_DEBUG(...) ::systemlog::SystemLogger::Main().LogDebug(__VA_ARGS__)
#else
#define SYSTEMLOG_DEBUG(...) ((void)0)
#endif

#ifndef SYSTEMLOG_DISABLE_INFO
#define SYSTEMLOG_INFO(...) ::systemlog::SystemLogger::Main().LogInfo(__VA_ARGS__)
#else
#define SYSTEMLOG_INFO(...) ((void)0)
#endif

#ifndef SYSTEMLOG_DISABLE_WARNING
#define SYSTEMLOG_WARNING(...) ::systemlog::SystemLogger::Main().LogWarning(__VA_ARGS__)
#else
#define SYSTEMLOG_WARNING(...) ((void)0)
#endif

#ifndef SYSTEMLOG_DISABLE_ERROR
#define SYSTEMLOG_ERROR(...) ::systemlog::SystemLogger::Main().LogError(__VA_ARGS__)
#else
#define SYSTEMLOG_ERROR(...) ((void)0)
#endif

#ifndef SYSTEMLOG_DISABLE_CRITICAL
#define SYSTEMLOG_CRITICAL(...) ::systemlog::SystemLogger::Main().LogCritical(__VA_ARGS__)
#else
#define SYSTEMLOG_CRITICAL(...) ((void)0)
#endif

#ifndef SYSTEMLOG_DISABLE_PRIVATE
#define SYSTEMLOG_PRIVATE(...) ::systemlog::SystemLogger::Main().LogPrivate(__VA_ARGS__)
#else
#define SYSTEMLOG_PRIVATE(...) ((void)0)
#endif
