/**
 * @file sink.hpp
 * @brief Log output sinks for systemlog
 * @brief systemlog 日志输出目标
 *
 * This file contains the sink capability and the portable sinks:
 * - Sink: Base class for all sinks
 * - ConsoleSink: Console output sink
 * - NullSink: Discarding sink
 *
 * The platform system log sink lives in syslog_sink.hpp.
 * 平台系统日志 Sink 位于 syslog_sink.hpp。
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "systemlog/common.hpp"
#include "systemlog/log_record.hpp"

namespace systemlog {

// ==============================================================================
// Record Rendering / 记录渲染
// ==============================================================================

/**
 * @brief Append the one-line text form of a record to a buffer
 * @brief 将记录的单行文本形式追加到缓冲区
 *
 * Layout: "<LEVEL> [subsystem:category] message". Private payloads are
 * replaced by kRedactedPlaceholder unless revealPrivate is set.
 *
 * 格式："<LEVEL> [subsystem:category] message"。除非设置 revealPrivate，
 * 私有内容将被替换为 kRedactedPlaceholder。
 */
void FormatRecordTo(fmt::memory_buffer& buffer, const LogRecord& record, bool revealPrivate);

/**
 * @brief Render a record to a string
 * @brief 将记录渲染为字符串
 */
std::string FormatRecord(const LogRecord& record, bool revealPrivate = false);

// ==============================================================================
// Sink Base Class / Sink 基类
// ==============================================================================

/**
 * @brief Base class for log output sinks
 * @brief 日志输出目标基类
 *
 * A sink receives every record a logger emits. Write must never throw: a sink
 * absorbs its own failures and reports them through HasError/GetLastError.
 * Implementations must be safe to call from several threads at once.
 *
 * Sink 接收日志器发出的每条记录。Write 不允许抛出异常：Sink 自行吸收失败，
 * 并通过 HasError/GetLastError 报告。实现必须支持多线程并发调用。
 */
class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Write a single log record
     * @brief 写入单条日志记录
     */
    virtual void Write(const LogRecord& record) noexcept = 0;

    /**
     * @brief Flush any buffered output
     * @brief 刷新所有缓冲的输出
     */
    virtual void Flush() noexcept {}

    /**
     * @brief Check if an error has occurred
     * @brief 检查是否发生错误
     */
    bool HasError() const noexcept {
        return m_hasError.load(std::memory_order_acquire);
    }

    /**
     * @brief Get the last error message
     * @brief 获取最后的错误消息
     */
    std::string GetLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

protected:
    void RecordError(std::string_view what) noexcept;

private:
    std::atomic<bool> m_hasError{false};
    std::string m_lastError;
    mutable std::mutex m_errorMutex;
};

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

/**
 * @brief Console output sink
 * @brief 控制台输出 Sink
 */
class ConsoleSink : public Sink {
public:
    enum class Stream { StdOut, StdErr };

    explicit ConsoleSink(Stream stream = Stream::StdErr, bool revealPrivate = false)
        : m_stream(stream), m_revealPrivate(revealPrivate) {}

    void Write(const LogRecord& record) noexcept override;
    void Flush() noexcept override;

    void SetColorEnabled(bool enable) { m_colorEnabled.store(enable, std::memory_order_relaxed); }
    bool IsColorEnabled() const { return m_colorEnabled.load(std::memory_order_relaxed); }
    bool RevealsPrivate() const { return m_revealPrivate; }
    Stream GetStream() const { return m_stream; }

    static const char* GetLevelColor(Level level) {
        switch (level) {
            case Level::Debug:    return "\033[36m";
            case Level::Info:     return "\033[32m";
            case Level::Default:  return "\033[37m";
            case Level::Warn:     return "\033[33m";
            case Level::Error:    return "\033[31m";
            case Level::Critical: return "\033[35m";
            default:              return "\033[0m";
        }
    }

    static const char* GetResetColor() { return "\033[0m"; }

private:
    std::FILE* Output() const { return (m_stream == Stream::StdOut) ? stdout : stderr; }

    const Stream m_stream;
    const bool m_revealPrivate;
    std::atomic<bool> m_colorEnabled{true};
    std::mutex m_mutex;
};

// ==============================================================================
// NullSink / 空输出
// ==============================================================================

/**
 * @brief Sink that discards every record
 * @brief 丢弃所有记录的 Sink
 */
class NullSink : public Sink {
public:
    void Write(const LogRecord&) noexcept override {}
};

}  // namespace systemlog
