/**
 * @file log_record.hpp
 * @brief Log record handed to sinks
 * @brief 传递给 Sink 的日志记录
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <string_view>

#include "systemlog/common.hpp"

namespace systemlog {

/**
 * @brief One emitted log entry
 * @brief 一条日志记录
 *
 * All string members are views into storage owned by the caller and are only
 * valid for the duration of Sink::Write. Sinks that keep a record must copy it.
 *
 * 所有字符串成员都是调用方存储的视图，仅在 Sink::Write 期间有效。
 * 需要保存记录的 Sink 必须自行复制。
 */
struct LogRecord {
    std::string_view subsystem;         ///< Owning subsystem / 所属子系统
    std::string_view category;          ///< Category within the subsystem / 子系统内的类别
    Level level{Level::Default};        ///< Severity / 严重级别
    Privacy privacy{Privacy::Public};   ///< Payload privacy / 内容隐私属性
    std::string_view message;           ///< Payload / 消息内容

    constexpr bool IsRedacted() const noexcept {
        return privacy == Privacy::Private;
    }

    /**
     * @brief Payload as a viewer without private access sees it
     * @brief 无隐私权限的查看者看到的消息内容
     */
    constexpr std::string_view VisibleMessage(bool revealPrivate) const noexcept {
        return (IsRedacted() && !revealPrivate) ? kRedactedPlaceholder : message;
    }
};

}  // namespace systemlog
