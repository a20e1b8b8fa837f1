/**
 * @file logger.hpp
 * @brief SystemLogger facade for systemlog
 * @brief systemlog 系统日志门面
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "systemlog/common.hpp"
#include "systemlog/log_record.hpp"
#include "systemlog/logger_config.hpp"
#include "systemlog/sink.hpp"

namespace systemlog {

// ==============================================================================
// SystemLogger Class / SystemLogger 类
// ==============================================================================

/**
 * @brief Leveled, privacy-aware, categorized logging facade
 * @brief 分级、支持隐私标记、按类别划分的日志门面
 *
 * A SystemLogger is an immutable value: a (subsystem, category) pair plus the
 * sink it forwards to. Copies share the sink. Every logging method is noexcept
 * and safe to call concurrently from any number of threads.
 *
 * SystemLogger 是不可变值：(子系统, 类别) 对以及其转发的 Sink。副本共享同一 Sink。
 * 所有日志方法均为 noexcept，可被任意数量的线程并发调用。
 *
 * The six logging methods are the only severity/privacy combinations offered:
 * 仅提供以下六种级别/隐私组合：
 * - LogDebug / LogInfo / LogWarning / LogError / LogCritical: public payload
 * - LogPrivate: default level, payload redacted by viewers
 *
 * @code
 * systemlog::SystemLogger net("com.example.app", "Networking");
 * net.LogInfo("request started");
 * net.LogError("request failed after {} ms", elapsed);
 * net.LogPrivate("token: " + token);
 * @endcode
 */
class SystemLogger {
public:
    /**
     * @brief Construct with the host application identifier and "default" category
     * @brief 使用宿主应用标识和 "default" 类别构造
     */
    SystemLogger();

    /**
     * @brief Construct a logger
     * @brief 构造日志器
     *
     * @param subsystem Owning subsystem, empty to resolve from the host / 所属子系统，为空时从宿主解析
     * @param category  Category, empty means "default" / 类别，为空时使用 "default"
     * @param sink      Target sink, null for DefaultSink() / 目标 Sink，为空时使用 DefaultSink()
     */
    explicit SystemLogger(std::string subsystem,
                          std::string category = std::string(kDefaultCategory),
                          std::shared_ptr<Sink> sink = nullptr);

    /**
     * @brief Construct from a configuration
     * @brief 根据配置构造
     */
    explicit SystemLogger(const LoggerConfig& config);

    /**
     * @brief Shared process-wide instance
     * @brief 进程级共享实例
     *
     * Built on first access with the default subsystem, category and sink.
     * 首次访问时以默认子系统、类别和 Sink 构建。
     */
    static const SystemLogger& Main();

    const std::string& Subsystem() const noexcept { return m_subsystem; }
    const std::string& Category() const noexcept { return m_category; }
    const std::shared_ptr<Sink>& GetSink() const noexcept { return m_sink; }

    // =========================================================================
    // Logging Methods / 日志记录方法
    // =========================================================================

    void LogInfo(std::string_view message) const noexcept {
        Emit(Level::Info, Privacy::Public, message);
    }

    void LogDebug(std::string_view message) const noexcept {
        Emit(Level::Debug, Privacy::Public, message);
    }

    void LogWarning(std::string_view message) const noexcept {
        Emit(Level::Warn, Privacy::Public, message);
    }

    void LogError(std::string_view message) const noexcept {
        Emit(Level::Error, Privacy::Public, message);
    }

    /**
     * @brief Log a fault
     * @brief 记录故障
     */
    void LogCritical(std::string_view message) const noexcept {
        Emit(Level::Critical, Privacy::Public, message);
    }

    /**
     * @brief Log a message whose payload is redacted by default
     * @brief 记录默认脱敏显示的消息
     */
    void LogPrivate(std::string_view message) const noexcept {
        Emit(Level::Default, Privacy::Private, message);
    }

    // =========================================================================
    // Formatted Logging Methods / 格式化日志方法
    // =========================================================================
    //
    // Only chosen when at least one argument follows the format string, so a
    // plain message is never parsed for replacement fields. Under C++17 the
    // format string is checked at run time unless the caller wraps it in
    // FMT_STRING; a failing format emits the raw format string instead.
    // 仅当格式字符串后至少有一个参数时才会选中，普通消息不会被解析替换字段。

    template <typename Arg, typename... Args>
    void LogInfo(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Info, Privacy::Public, static_cast<fmt::string_view>(format), fmt::make_format_args(arg, args...));
    }

    template <typename Arg, typename... Args>
    void LogDebug(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Debug, Privacy::Public, static_cast<fmt::string_view>(format), fmt::make_format_args(arg, args...));
    }

    template <typename Arg, typename... Args>
    void LogWarning(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Warn, Privacy::Public, static_cast<fmt::string_view>(format), fmt::make_format_args(arg, args...));
    }

    template <typename Arg, typename... Args>
    void LogError(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Error, Privacy::Public, static_cast<fmt::string_view>(format), fmt::make_format_args(arg, args...));
    }

    template <typename Arg, typename... Args>
    void LogCritical(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Critical, Privacy::Public, static_cast<fmt::string_view>(format),
                      fmt::make_format_args(arg, args...));
    }

    template <typename Arg, typename... Args>
    void LogPrivate(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) const noexcept {
        EmitFormatted(Level::Default, Privacy::Private, static_cast<fmt::string_view>(format),
                      fmt::make_format_args(arg, args...));
    }

private:
    void Emit(Level level, Privacy privacy, std::string_view message) const noexcept;

    // Falls back to the raw format string if formatting fails
    void EmitFormatted(Level level, Privacy privacy, fmt::string_view format,
                       fmt::format_args args) const noexcept;

    std::string m_subsystem;
    std::string m_category;
    std::shared_ptr<Sink> m_sink;
};

}  // namespace systemlog
