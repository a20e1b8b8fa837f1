/**
 * @file logger_config.cpp
 * @brief Sink factory implementation
 * @brief Sink 工厂实现
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include "systemlog/logger_config.hpp"

namespace systemlog {

std::shared_ptr<Sink> MakeSink(const LoggerConfig& config) {
    switch (config.backend) {
        case Backend::Console: {
            auto sink = std::make_shared<ConsoleSink>(config.consoleStream, config.revealPrivate);
            sink->SetColorEnabled(config.colorEnabled);
            return sink;
        }
        case Backend::Null:
            return std::make_shared<NullSink>();
        case Backend::Syslog:
        default:
            return std::make_shared<SyslogSink>(config.syslogFacility, config.revealPrivate);
    }
}

const std::shared_ptr<Sink>& DefaultSink() {
    // Leaked on purpose: Main() outlives static destruction and holds this sink
    static const std::shared_ptr<Sink>* const sink =
        new std::shared_ptr<Sink>(std::make_shared<SyslogSink>());
    return *sink;
}

}  // namespace systemlog
