#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "lifecycle/cleanup_orchestrator.hpp"
#include "lifecycle/exit_hooks.hpp"
#include "lifecycle/instance_lock.hpp"

namespace whiz::lifecycle {

/**
 * @class LifecycleContext
 * @brief 进程级上下文：持有单实例锁、清理编排器和退出钩子
 *
 * 在 main 中构造一次并传递给需要的调用点。shutdown() 只执行一次：
 * 运行全部清理任务，若锁仍被持有则释放，然后以 JSON 记录清理报告。
 * 析构时如果尚未关闭会自动关闭。
 */
class LifecycleContext {
 public:
  LifecycleContext(InstanceLockOptions lock_options,
                   CleanupOptions cleanup_options,
                   std::unique_ptr<WindowActivator> activator = nullptr);

  /**
   * @brief 按 ConfigManager 中的配置构造
   */
  static auto fromConfig(const common::ConfigManager& config)
      -> std::unique_ptr<LifecycleContext>;

  ~LifecycleContext();

  LifecycleContext(const LifecycleContext&) = delete;
  auto operator=(const LifecycleContext&) -> LifecycleContext& = delete;

  auto instanceLock() -> InstanceLock& { return *lock_; }
  auto cleanup() -> CleanupOrchestrator& { return *orchestrator_; }
  auto exitHooks() -> ExitHooks& { return *hooks_; }

  /**
   * @brief 将单实例锁的释放注册为 SYSTEM_RESOURCES 阶段的非关键任务
   */
  void registerInstanceLockCleanup();

  void installExitHooks();

  /**
   * @return 本次调用实际执行了关闭流程时返回 true
   */
  auto shutdown() -> bool;

  [[nodiscard]] auto isShutDown() const -> bool { return shut_down_; }

  /**
   * @brief 锁状态与清理结果的诊断报告
   */
  [[nodiscard]] auto report() const -> nlohmann::json;

 private:
  void runShutdown();

  std::unique_ptr<InstanceLock> lock_;
  std::unique_ptr<CleanupOrchestrator> orchestrator_;
  std::unique_ptr<ExitHooks> hooks_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace whiz::lifecycle
