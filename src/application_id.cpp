/**
 * @file application_id.cpp
 * @brief Host application identifier resolution
 * @brief 宿主应用标识解析实现
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include "systemlog/application_id.hpp"

#include <mutex>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace systemlog {

namespace detail {

namespace {

struct ApplicationIdState {
    std::mutex mutex;
    std::string installed;
    std::string resolved;
    bool frozen = false;
};

ApplicationIdState& GetApplicationIdState() {
    static ApplicationIdState* const state = new ApplicationIdState();
    return *state;
}

std::string BaseName(const std::string& path) {
    const auto pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

}  // namespace

std::string ResolvePlatformIdentifier() {
#ifdef _WIN32
    char path[MAX_PATH] = {};
    const DWORD len = ::GetModuleFileNameA(nullptr, path, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    std::string name = BaseName(std::string(path, len));
    const auto dot = name.rfind(".exe");
    if (dot != std::string::npos && dot + 4 == name.size()) {
        name.erase(dot);
    }
    return name;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    const char* name = ::getprogname();
    return name ? std::string(name) : std::string();
#else
    char path[PATH_MAX];
    const ssize_t len = ::readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len <= 0) {
        return {};
    }
    std::string name = BaseName(std::string(path, static_cast<size_t>(len)));
    // The kernel appends this marker when the binary was replaced on disk
    constexpr std::string_view kDeleted = " (deleted)";
    if (name.size() > kDeleted.size() &&
        name.compare(name.size() - kDeleted.size(), kDeleted.size(), kDeleted) == 0) {
        name.erase(name.size() - kDeleted.size());
    }
    return name;
#endif
}

std::string ChooseApplicationIdentifier(std::string_view installed, std::string_view platform) {
    if (!installed.empty()) {
        return std::string(installed);
    }
    if (!platform.empty()) {
        return std::string(platform);
    }
    return std::string(kFallbackSubsystem);
}

}  // namespace detail

bool SetApplicationIdentifier(std::string identifier) {
    auto& state = detail::GetApplicationIdState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.frozen) {
        return false;
    }
    state.installed = std::move(identifier);
    return true;
}

const std::string& GetApplicationIdentifier() {
    auto& state = detail::GetApplicationIdState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.frozen) {
        const std::string platform =
            state.installed.empty() ? detail::ResolvePlatformIdentifier() : std::string();
        state.resolved = detail::ChooseApplicationIdentifier(state.installed, platform);
        state.frozen = true;
    }
    return state.resolved;
}

}  // namespace systemlog
