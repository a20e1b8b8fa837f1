/**
 * @file logger.cpp
 * @brief SystemLogger implementation
 * @brief SystemLogger 实现
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include "systemlog/logger.hpp"

#include <exception>
#include <utility>

#include "systemlog/application_id.hpp"

namespace systemlog {

SystemLogger::SystemLogger()
    : SystemLogger(std::string(), std::string(kDefaultCategory), nullptr) {}

SystemLogger::SystemLogger(std::string subsystem, std::string category,
                           std::shared_ptr<Sink> sink)
    : m_subsystem(std::move(subsystem))
    , m_category(std::move(category))
    , m_sink(std::move(sink)) {
    if (m_subsystem.empty()) {
        m_subsystem = GetApplicationIdentifier();
    }
    if (m_category.empty()) {
        m_category = std::string(kDefaultCategory);
    }
    if (!m_sink) {
        m_sink = DefaultSink();
    }
}

SystemLogger::SystemLogger(const LoggerConfig& config)
    : SystemLogger(config.subsystem, config.category, MakeSink(config)) {}

const SystemLogger& SystemLogger::Main() {
    // Never destroyed, so logging from static destructors and atexit handlers stays valid
    static const SystemLogger* const instance = new SystemLogger();
    return *instance;
}

void SystemLogger::Emit(Level level, Privacy privacy, std::string_view message) const noexcept {
    LogRecord record;
    record.subsystem = m_subsystem;
    record.category = m_category;
    record.level = level;
    record.privacy = privacy;
    record.message = message;
    m_sink->Write(record);
}

void SystemLogger::EmitFormatted(Level level, Privacy privacy, fmt::string_view format,
                                 fmt::format_args args) const noexcept {
    std::string text;
    try {
        text = fmt::vformat(format, args);
    } catch (const std::exception&) {
        Emit(level, privacy, std::string_view(format.data(), format.size()));
        return;
    }
    Emit(level, privacy, text);
}

}  // namespace systemlog
