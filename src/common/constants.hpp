#pragma once

#include <chrono>
#include <string>

namespace whiz::constants {

//-----------------------------------------------------------------------------
// 单实例锁 (Instance Lock)
//-----------------------------------------------------------------------------

/// @brief 默认应用名称，用于派生锁文件、共享内存段与信号量名称
const std::string kDefaultAppName = "whiz";

/// @brief 窗口激活时匹配的默认窗口标题
const std::string kDefaultWindowTitle = "Whiz";

/// @brief 锁文件名后缀: <app>_app.lock
const std::string kLockFileSuffix = "_app.lock";

/// @brief 共享内存段名称后缀: <app>_single_instance
const std::string kSegmentSuffix = "_single_instance";

/// @brief 信号量名称后缀: <app>_single_instance_sem
const std::string kSemaphoreSuffix = "_single_instance_sem";

/// @brief 锁记录过期时间 (5分钟)
constexpr auto kDefaultStaleTimeout = std::chrono::minutes(5);

/// @brief 窗口激活外部调用的超时时间
constexpr auto kDefaultActivationTimeout = std::chrono::seconds(5);

/// @brief 跨进程信号量的最长等待时间
constexpr auto kDefaultSemaphoreTimeout = std::chrono::seconds(5);

//-----------------------------------------------------------------------------
// 资源清理 (Cleanup)
//-----------------------------------------------------------------------------

/// @brief 整个清理流程的全局超时
constexpr auto kDefaultGlobalCleanupTimeout = std::chrono::seconds(60);

/// @brief 单个清理任务的默认超时
constexpr auto kDefaultTaskTimeout = std::chrono::seconds(10);

/// @brief 清理结果校验的超时 (比任务超时更短)
constexpr auto kDefaultVerifyTimeout = std::chrono::seconds(5);

/// @brief 单实例锁清理任务的超时
constexpr auto kLockCleanupTimeout = std::chrono::seconds(5);

/// @brief 单实例锁清理任务的名称
const std::string kLockCleanupTaskName = "single_instance_lock_cleanup";

}  // namespace whiz::constants
