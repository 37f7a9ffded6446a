#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/config_manager.hpp"
#include "common/constants.hpp"

namespace whiz::lifecycle {

/**
 * @brief 清理阶段，按声明顺序执行
 */
enum class CleanupPhase : std::uint8_t {
  UI_WIDGETS = 1,
  AUDIO_RESOURCES,
  HOTKEY_RESOURCES,
  MODEL_RESOURCES,
  FILE_RESOURCES,
  NETWORK_RESOURCES,
  SYSTEM_RESOURCES,
  FINAL_CLEANUP
};

constexpr std::array<CleanupPhase, 8> kAllCleanupPhases = {
    CleanupPhase::UI_WIDGETS,        CleanupPhase::AUDIO_RESOURCES,
    CleanupPhase::HOTKEY_RESOURCES,  CleanupPhase::MODEL_RESOURCES,
    CleanupPhase::FILE_RESOURCES,    CleanupPhase::NETWORK_RESOURCES,
    CleanupPhase::SYSTEM_RESOURCES,  CleanupPhase::FINAL_CLEANUP};

enum class CleanupStatus : std::uint8_t {
  PENDING,
  IN_PROGRESS,
  COMPLETED,
  FAILED,
  TIMEOUT,
  SKIPPED
};

auto to_string(CleanupPhase phase) -> std::string;
auto to_string(CleanupStatus status) -> std::string;

struct CleanupTask {
  std::string name;
  CleanupPhase phase{CleanupPhase::FINAL_CLEANUP};
  std::function<bool()> action;
  std::function<bool()> verify;  // 可选
  std::chrono::milliseconds timeout{constants::kDefaultTaskTimeout};
  bool critical{true};
  std::function<void()> rollback;  // 可选，失败或超时后执行一次
  std::vector<std::string> dependencies;
};

struct CleanupResult {
  std::string task_name;
  CleanupStatus status{CleanupStatus::PENDING};
  std::chrono::milliseconds duration{0};
  std::optional<std::string> error;
  bool verification_passed{true};
};

using CleanupResults = std::map<std::string, CleanupResult>;

struct CleanupSummary {
  std::size_t total{0};
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t timed_out{0};
  std::size_t skipped{0};
  std::size_t pending{0};
  double success_rate{0.0};  // 完成比例，0 到 1
  double total_duration_seconds{0.0};
  bool started{false};
  bool complete{false};
};

void to_json(nlohmann::json& j, const CleanupResult& result);
void to_json(nlohmann::json& j, const CleanupSummary& summary);

struct CleanupOptions {
  std::chrono::milliseconds global_timeout{
      constants::kDefaultGlobalCleanupTimeout};
  std::chrono::milliseconds verify_timeout{constants::kDefaultVerifyTimeout};

  static auto fromConfig(const common::ConfigManager& config)
      -> CleanupOptions;
};

/**
 * @class CleanupOrchestrator
 * @brief 按阶段、依赖和超时执行进程退出前的资源清理
 *
 * 任务在 cleanupAll() 之前注册；同一阶段内按注册顺序串行执行。
 * 每个动作在工作线程上运行，等待时间取任务超时与全局剩余预算的较小值，
 * 超时的工作线程被放弃而不是被杀死，因此任务动作必须可以安全地被放弃。
 *
 * 关键任务失败或超时后不再进入后续阶段，未执行的任务保持 PENDING；
 * 全局预算耗尽时剩余的 PENDING 任务被标记为 TIMEOUT。
 */
class CleanupOrchestrator {
 public:
  explicit CleanupOrchestrator(CleanupOptions options = {});

  CleanupOrchestrator(const CleanupOrchestrator&) = delete;
  auto operator=(const CleanupOrchestrator&) -> CleanupOrchestrator& = delete;

  /**
   * @throws std::logic_error 清理已经开始
   * @throws std::invalid_argument 名称重复、为空或动作为空
   */
  void registerTask(CleanupTask task);

  void registerTask(
      const std::string& name, CleanupPhase phase,
      std::function<bool()> action, std::function<bool()> verify = {},
      std::chrono::milliseconds timeout = constants::kDefaultTaskTimeout,
      bool critical = true, std::function<void()> rollback = {},
      std::vector<std::string> dependencies = {});

  /**
   * @brief 执行全部清理。重复调用返回已有结果的快照。
   */
  auto cleanupAll() -> CleanupResults;

  [[nodiscard]] auto results() const -> CleanupResults;
  [[nodiscard]] auto summary() const -> CleanupSummary;
  [[nodiscard]] auto isStarted() const -> bool;
  [[nodiscard]] auto isComplete() const -> bool;

 private:
  void executeTask(const CleanupTask& task);
  void runRollback(const CleanupTask& task);
  void markPendingAsTimeout();
  void setStatus(const std::string& name, CleanupStatus status);
  [[nodiscard]] auto statusOf(const std::string& name) const
      -> std::optional<CleanupStatus>;
  [[nodiscard]] auto remainingBudget() const -> std::chrono::milliseconds;

  CleanupOptions options_;
  std::vector<CleanupTask> tasks_;  // 注册顺序
  CleanupResults results_;
  bool started_{false};
  bool complete_{false};
  std::chrono::steady_clock::time_point start_time_;
  std::chrono::milliseconds total_duration_{0};

  mutable std::mutex mutex_;
};

}  // namespace whiz::lifecycle
