/**
 * @file sink.cpp
 * @brief Portable sinks and record rendering
 * @brief 可移植 Sink 与记录渲染实现
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include "systemlog/sink.hpp"

#include <exception>
#include <iterator>
#include <new>

namespace systemlog {

// ==============================================================================
// Record Rendering / 记录渲染
// ==============================================================================

void FormatRecordTo(fmt::memory_buffer& buffer, const LogRecord& record, bool revealPrivate) {
    fmt::format_to(std::back_inserter(buffer), "{} [{}:{}] {}",
                   LevelToString(record.level, LevelNameStyle::Short4),
                   record.subsystem, record.category,
                   record.VisibleMessage(revealPrivate));
}

std::string FormatRecord(const LogRecord& record, bool revealPrivate) {
    fmt::memory_buffer buffer;
    FormatRecordTo(buffer, record, revealPrivate);
    return fmt::to_string(buffer);
}

// ==============================================================================
// Sink / Sink 基类
// ==============================================================================

void Sink::RecordError(std::string_view what) noexcept {
    m_hasError.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(m_errorMutex);
    try {
        m_lastError.assign(what.data(), what.size());
    } catch (const std::bad_alloc&) {
        // Keep the previous message; the flag is already set
        // 保留之前的消息，错误标志已设置
    }
}

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

void ConsoleSink::Write(const LogRecord& record) noexcept {
    try {
        fmt::memory_buffer buffer;
        const bool color = IsColorEnabled();
        if (color) {
            buffer.append(std::string_view(GetLevelColor(record.level)));
        }
        FormatRecordTo(buffer, record, m_revealPrivate);
        if (color) {
            buffer.append(std::string_view(GetResetColor()));
        }
        buffer.push_back('\n');

        std::lock_guard<std::mutex> lock(m_mutex);
        std::FILE* out = Output();
        if (std::fwrite(buffer.data(), 1, buffer.size(), out) != buffer.size()) {
            RecordError("Console write failed");
        }
    } catch (const std::exception& e) {
        RecordError(e.what());
    }
}

void ConsoleSink::Flush() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::fflush(Output()) != 0) {
        RecordError("Console flush failed");
    }
}

}  // namespace systemlog
