/**
 * @file syslog_sink.hpp
 * @brief Platform system log sink (syslog(3))
 * @brief 平台系统日志 Sink（syslog(3)）
 *
 * Records are forwarded to the system logger as "[subsystem:category] message"
 * with the priority matching the record level. The identity and options of the
 * connection are left to the process (openlog is never called here), so the
 * system logger tags entries with the program name as usual.
 *
 * 记录以 "[subsystem:category] message" 的形式转发到系统日志，优先级与记录级别对应。
 * 连接的标识和选项由进程自行决定（此处不调用 openlog），系统日志照常以程序名标记条目。
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <syslog.h>

#include <string>

#include <fmt/format.h>

#include "systemlog/sink.hpp"

namespace systemlog {

/**
 * @brief Map a level to a syslog priority
 * @brief 将日志级别映射为 syslog 优先级
 */
constexpr int LevelToSyslogPriority(Level level) noexcept {
    switch (level) {
        case Level::Debug:    return LOG_DEBUG;
        case Level::Info:     return LOG_INFO;
        case Level::Default:  return LOG_NOTICE;
        case Level::Warn:     return LOG_WARNING;
        case Level::Error:    return LOG_ERR;
        case Level::Critical: return LOG_CRIT;
        default:              return LOG_NOTICE;
    }
}

/**
 * @brief Render the text handed to syslog(3): "[subsystem:category] message"
 * @brief 生成交给 syslog(3) 的文本："[subsystem:category] message"
 *
 * Embedded NUL bytes in the message are escaped as "\0" so the whole
 * message reaches the system logger.
 * 消息中的 NUL 字节转义为 "\0"，以保证完整消息到达系统日志。
 */
void FormatSyslogLineTo(fmt::memory_buffer& buffer, const LogRecord& record, bool revealPrivate);

std::string FormatSyslogLine(const LogRecord& record, bool revealPrivate);

/**
 * @brief Sink writing to the system logger
 * @brief 写入系统日志的 Sink
 *
 * syslog(3) is thread-safe, so Write takes no lock. Private payloads are sent
 * as kRedactedPlaceholder unless revealPrivate is set.
 *
 * syslog(3) 是线程安全的，因此 Write 不加锁。除非设置 revealPrivate，
 * 私有内容以 kRedactedPlaceholder 发送。
 */
class SyslogSink : public Sink {
public:
    explicit SyslogSink(int facility = LOG_USER, bool revealPrivate = false)
        : m_facility(facility), m_revealPrivate(revealPrivate) {}

    void Write(const LogRecord& record) noexcept override;

    int GetFacility() const { return m_facility; }
    bool RevealsPrivate() const { return m_revealPrivate; }

private:
    const int m_facility;
    const bool m_revealPrivate;
};

}  // namespace systemlog
