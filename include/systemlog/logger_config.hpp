/**
 * @file logger_config.hpp
 * @brief Runtime logger configuration and sink factory
 * @brief 运行时日志器配置与 Sink 工厂
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <memory>
#include <string>

#include "systemlog/common.hpp"
#include "systemlog/sink.hpp"
#include "systemlog/syslog_sink.hpp"

namespace systemlog {

// ==============================================================================
// Logger Configuration / Logger 配置
// ==============================================================================

/**
 * @brief Logger configuration structure
 * @brief Logger 配置结构
 */
struct LoggerConfig {
    std::string subsystem;                            ///< Empty: resolve from host / 为空时从宿主解析
    std::string category{kDefaultCategory};           ///< Category / 类别
    Backend backend{Backend::Syslog};                 ///< Sink backend / Sink 后端
    bool revealPrivate{false};                        ///< Render private payloads in clear / 明文显示私有内容
    int syslogFacility{LOG_USER};                     ///< Syslog facility / syslog 设施
    ConsoleSink::Stream consoleStream{ConsoleSink::Stream::StdErr};  ///< Console stream / 控制台流
    bool colorEnabled{true};                          ///< Console colours / 控制台颜色
};

/**
 * @brief Build the sink described by a configuration
 * @brief 根据配置创建 Sink
 */
std::shared_ptr<Sink> MakeSink(const LoggerConfig& config);

/**
 * @brief Process-wide default platform sink
 * @brief 进程级默认平台 Sink
 *
 * Created on first use and shared by every logger built without an explicit sink.
 * 首次使用时创建，由所有未显式指定 Sink 的日志器共享。
 */
const std::shared_ptr<Sink>& DefaultSink();

}  // namespace systemlog
