/**
 * @file basic_usage.cpp
 * @brief Basic systemlog usage
 * @brief systemlog 基本用法示例
 *
 * Usage: basic_usage [syslog|console|null]
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include <string>
#include <thread>
#include <vector>

#include <systemlog/systemlog.hpp>

int main(int argc, char* argv[]) {
    systemlog::SetApplicationIdentifier("com.example.basic_usage");

    // Shared instance / 共享实例
    SYSTEMLOG_INFO("application started");
    SYSTEMLOG_DEBUG("argc = {}", argc);

    // Explicit subsystem and category / 显式子系统和类别
    systemlog::LoggerConfig config;
    config.category = "Networking";
    config.backend = (argc > 1) ? systemlog::StringToBackend(argv[1]) : systemlog::Backend::Console;
    const systemlog::SystemLogger net(config);

    net.LogInfo("request started");
    net.LogWarning("slow response: {} ms", 850);
    net.LogError("request failed");
    net.LogPrivate("user email: {}", "user@example.com");

    // Loggers are passed explicitly to the code that needs them
    // 日志器显式传递给需要它的代码
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([net, i] { net.LogDebug("worker {} done", i); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    net.LogCritical("shutting down after fault injection");
    net.GetSink()->Flush();
    return 0;
}
