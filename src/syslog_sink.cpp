/**
 * @file syslog_sink.cpp
 * @brief System logger sink implementation
 * @brief 系统日志 Sink 实现
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include "systemlog/syslog_sink.hpp"

#include <exception>
#include <iterator>

namespace systemlog {

void FormatSyslogLineTo(fmt::memory_buffer& buffer, const LogRecord& record, bool revealPrivate) {
    fmt::format_to(std::back_inserter(buffer), "[{}:{}] ", record.subsystem, record.category);
    // syslog(3) takes a C string, so NUL bytes are written as the escape "\0"
    for (const char c : record.VisibleMessage(revealPrivate)) {
        if (c == '\0') {
            buffer.push_back('\\');
            buffer.push_back('0');
        } else {
            buffer.push_back(c);
        }
    }
}

std::string FormatSyslogLine(const LogRecord& record, bool revealPrivate) {
    fmt::memory_buffer buffer;
    FormatSyslogLineTo(buffer, record, revealPrivate);
    return fmt::to_string(buffer);
}

void SyslogSink::Write(const LogRecord& record) noexcept {
    try {
        fmt::memory_buffer buffer;
        FormatSyslogLineTo(buffer, record, m_revealPrivate);
        ::syslog(m_facility | LevelToSyslogPriority(record.level), "%.*s",
                 static_cast<int>(buffer.size()), buffer.data());
    } catch (const std::exception& e) {
        RecordError(e.what());
    }
}

}  // namespace systemlog
