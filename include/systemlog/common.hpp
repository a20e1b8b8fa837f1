/**
 * @file common.hpp
 * @brief Common definitions for systemlog (Level, Privacy, Backend)
 * @brief systemlog 通用定义（日志级别、隐私标记、后端类型）
 *
 * This file contains fundamental types and constants used throughout the library:
 * - Level: Log severity levels (Debug, Info, Default, Warn, Error, Critical)
 * - Privacy: Whether a payload is rendered in clear or redacted
 * - Backend: Which platform sink a logger writes to
 *
 * 此文件包含整个库使用的基本类型和常量：
 * - Level：日志严重级别（Debug、Info、Default、Warn、Error、Critical）
 * - Privacy：消息内容是明文显示还是脱敏显示
 * - Backend：日志器写入的平台 Sink 类型
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#ifndef SYSTEMLOG_COMMON_HPP
#define SYSTEMLOG_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace systemlog {

// ==============================================================================
// Constants / 常量
// ==============================================================================

/// Category used when none (or an empty one) is given / 未指定类别时使用的默认类别
inline constexpr std::string_view kDefaultCategory = "default";

/// Subsystem used when the application identifier cannot be resolved
/// 无法解析应用标识时使用的子系统名
inline constexpr std::string_view kFallbackSubsystem = "com.systemlogger.default";

/// Text shown in place of a private payload / 私有消息的占位文本
inline constexpr std::string_view kRedactedPlaceholder = "<private>";

// ==============================================================================
// Log Level / 日志级别
// ==============================================================================

/**
 * @brief Log level enumeration
 * @brief 日志级别枚举
 *
 * Levels are ordered by severity from lowest (Debug) to highest (Critical).
 * Default sits between Info and Warn and is the level of privacy-tagged
 * messages, matching the "default" level of unified system logs.
 *
 * 日志级别按严重程度从低（Debug）到高（Critical）排序。
 * Default 位于 Info 和 Warn 之间，用于隐私消息，对应系统统一日志的 "default" 级别。
 */
enum class Level : uint8_t {
    Debug = 0,     ///< Debug information (development use) / 调试信息（开发使用）
    Info = 1,      ///< General information (normal operation) / 一般信息（正常运行）
    Default = 2,   ///< Default level, notice-equivalent / 默认级别（相当于 notice）
    Warn = 3,      ///< Warning messages (potential issues) / 警告信息（潜在问题）
    Error = 4,     ///< Error messages (recoverable errors) / 错误信息（可恢复错误）
    Critical = 5   ///< Faults (severe failures) / 故障（严重错误）
};

constexpr size_t kLevelCount = 6;  ///< Number of log levels / 日志级别数量

/**
 * @brief Level name display style
 * @brief 日志级别名称显示样式
 */
enum class LevelNameStyle : uint8_t {
    Full,    ///< Full name: "debug", "info", "default", "warning", "error", "fault"
    Short4,  ///< 4-char name: "DBUG", "INFO", "DFLT", "WARN", "ERRO", "CRIT"
    Short1   ///< 1-char name: "D", "I", "N", "W", "E", "C"
};

/**
 * @brief Convert log level to string representation
 * @brief 将日志级别转换为字符串表示
 */
constexpr std::string_view LevelToString(Level level,
                                          LevelNameStyle style = LevelNameStyle::Short4) noexcept {
    constexpr std::string_view kFullNames[] = {"debug", "info",  "default",
                                                "warning", "error", "fault"};
    constexpr std::string_view kShort4Names[] = {"DBUG", "INFO", "DFLT",
                                                  "WARN", "ERRO", "CRIT"};
    constexpr std::string_view kShort1Names[] = {"D", "I", "N", "W", "E", "C"};

    const auto idx = static_cast<size_t>(level);
    if (idx >= kLevelCount) {
        return "UNKN";
    }

    switch (style) {
        case LevelNameStyle::Full:
            return kFullNames[idx];
        case LevelNameStyle::Short4:
            return kShort4Names[idx];
        case LevelNameStyle::Short1:
            return kShort1Names[idx];
        default:
            return kShort4Names[idx];
    }
}

/**
 * @brief Convert string to log level
 * @brief 将字符串转换为日志级别
 *
 * Unknown names map to Level::Default.
 * 未知名称映射为 Level::Default。
 */
constexpr Level StringToLevel(std::string_view name) noexcept {
    if (name == "debug" || name == "DEBUG" || name == "DBUG" || name == "D") {
        return Level::Debug;
    }
    if (name == "info" || name == "INFO" || name == "I") {
        return Level::Info;
    }
    if (name == "warn" || name == "WARN" || name == "warning" || name == "WARNING" || name == "W") {
        return Level::Warn;
    }
    if (name == "error" || name == "ERROR" || name == "ERRO" || name == "E") {
        return Level::Error;
    }
    if (name == "critical" || name == "CRITICAL" || name == "CRIT" || name == "fault" ||
        name == "FAULT" || name == "C") {
        return Level::Critical;
    }
    return Level::Default;
}

// ==============================================================================
// Privacy / 隐私标记
// ==============================================================================

/**
 * @brief Privacy of a message payload
 * @brief 消息内容的隐私属性
 *
 * Private payloads are hidden by viewers unless explicitly revealed.
 * 私有内容默认由查看器隐藏，除非显式开启显示。
 */
enum class Privacy : uint8_t {
    Public = 0,   ///< Rendered in clear / 明文显示
    Private = 1   ///< Redacted by default / 默认脱敏
};

// ==============================================================================
// Backend / 后端类型
// ==============================================================================

/**
 * @brief Sink backend selection
 * @brief Sink 后端选择
 */
enum class Backend : uint8_t {
    Syslog = 0,   ///< Platform system log (syslog(3)) / 平台系统日志
    Console = 1,  ///< Standard output/error / 标准输出/错误
    Null = 2      ///< Discard everything / 丢弃所有日志
};

/**
 * @brief Convert backend to string representation
 * @brief 将后端类型转换为字符串表示
 */
constexpr std::string_view BackendToString(Backend backend) noexcept {
    switch (backend) {
        case Backend::Syslog:
            return "syslog";
        case Backend::Console:
            return "console";
        case Backend::Null:
            return "null";
        default:
            return "unknown";
    }
}

/**
 * @brief Convert string to backend
 * @brief 将字符串转换为后端类型
 */
constexpr Backend StringToBackend(std::string_view name) noexcept {
    if (name == "console" || name == "Console" || name == "CONSOLE" || name == "stderr") {
        return Backend::Console;
    }
    if (name == "null" || name == "Null" || name == "NULL" || name == "none") {
        return Backend::Null;
    }
    return Backend::Syslog;
}

}  // namespace systemlog

#endif  // SYSTEMLOG_COMMON_HPP
