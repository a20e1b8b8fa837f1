/**
 * @file systemlog.hpp
 * @brief Main header file for systemlog - system logging facade
 * @brief systemlog 主头文件 - 系统日志门面
 *
 * Include this file to use all systemlog features.
 * 包含此文件以使用所有 systemlog 功能。
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * #include <systemlog/systemlog.hpp>
 *
 * int main() {
 *     systemlog::SystemLogger::Main().LogInfo("started");
 *     systemlog::SystemLogger db("com.example.app", "Database");
 *     db.LogWarning("slow query: {} ms", 250);
 *     return 0;
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

// Core types / 核心类型
#include "systemlog/common.hpp"
#include "systemlog/log_record.hpp"

// Sinks / 输出目标
#include "systemlog/sink.hpp"
#include "systemlog/syslog_sink.hpp"

// Configuration / 配置
#include "systemlog/application_id.hpp"
#include "systemlog/logger_config.hpp"

// Logger / 日志器
#include "systemlog/logger.hpp"
#include "systemlog/macros.hpp"
