/**
 * @file application_id.hpp
 * @brief Host application identifier resolution for systemlog
 * @brief systemlog 的宿主应用标识解析
 *
 * Design principles / 设计原则：
 * - The application identifier belongs to the process, NOT to a logger
 * - 应用标识属于进程，而不是某个日志器
 * - It is resolved once, on first use, and never changes afterwards
 * - 首次使用时解析一次，之后不再改变
 *
 * Resolution order / 解析顺序：
 * 1. Identifier installed with SetApplicationIdentifier() before first use
 *    首次使用前通过 SetApplicationIdentifier() 设置的标识
 * 2. Platform identifier (executable name) / 平台标识（可执行文件名）
 * 3. kFallbackSubsystem / 默认常量
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#pragma once

#include <string>
#include <string_view>

#include "systemlog/common.hpp"

namespace systemlog {

/**
 * @brief Install the application identifier (call once at startup)
 * @brief 设置应用标识（启动时调用一次）
 *
 * @return false if the identifier was already resolved; nothing changes then
 * @return 如果标识已被解析则返回 false，此时不做任何修改
 */
bool SetApplicationIdentifier(std::string identifier);

/**
 * @brief Get the resolved application identifier
 * @brief 获取已解析的应用标识
 *
 * Never empty. The returned reference stays valid for the process lifetime.
 * 永不为空。返回的引用在进程生命周期内有效。
 */
const std::string& GetApplicationIdentifier();

namespace detail {

/**
 * @brief Query the platform for the executable name
 * @brief 向平台查询可执行文件名
 *
 * Returns an empty string when the platform offers nothing.
 * 平台无法提供时返回空字符串。
 */
std::string ResolvePlatformIdentifier();

/**
 * @brief Pick the identifier: installed, else platform, else kFallbackSubsystem
 * @brief 选择标识：优先已设置的标识，其次平台标识，最后使用 kFallbackSubsystem
 */
std::string ChooseApplicationIdentifier(std::string_view installed, std::string_view platform);

}  // namespace detail

}  // namespace systemlog
