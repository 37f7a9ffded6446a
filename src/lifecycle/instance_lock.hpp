#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "common/config_manager.hpp"
#include "common/constants.hpp"
#include "common/process_utils.hpp"
#include "lifecycle/atomic_segment.hpp"
#include "lifecycle/lock_record.hpp"
#include "lifecycle/window_activator.hpp"

namespace whiz::lifecycle {

struct InstanceLockOptions {
  std::string app_name = constants::kDefaultAppName;
  std::string window_title = constants::kDefaultWindowTitle;
  std::chrono::seconds stale_timeout = constants::kDefaultStaleTimeout;
  std::chrono::milliseconds activation_timeout =
      constants::kDefaultActivationTimeout;
  std::chrono::milliseconds semaphore_timeout =
      constants::kDefaultSemaphoreTimeout;
  bool use_atomic_backend = true;
  std::optional<std::filesystem::path> lock_directory;  // 默认为系统临时目录

  /**
   * @brief 从 ConfigManager 的 instance_lock.* 键读取选项
   */
  static auto fromConfig(const common::ConfigManager& config)
      -> InstanceLockOptions;
};

/**
 * @brief 获取结果
 *
 * acquired 为 true 且 note 非空表示已激活现有实例，调用者应退出。
 */
struct AcquireResult {
  bool acquired{false};
  std::optional<std::string> note;
};

struct InstanceLockStatus {
  bool held{false};
  common::ProcessId pid{0};
  std::string lock_file_path;
  bool lock_file_exists{false};
  double timeout_seconds{0.0};
  bool atomic_backend_available{false};
};

void to_json(nlohmann::json& j, const InstanceLockStatus& status);

/**
 * @class InstanceLock
 * @brief 跨进程的单实例锁
 *
 * 首选原子后端：在命名信号量保护下排他创建命名段并写入锁记录。
 * 后端不可用时退化为仅使用锁记录文件（存在检查与写入之间的竞争窗口）。
 * 发现存活的实例时尝试激活其窗口。
 *
 * 析构时如果仍持有锁会自动释放。
 */
class InstanceLock {
 public:
  static constexpr const char* kActivatedNote = "Existing instance activated";
  static constexpr const char* kNotActivatedNote =
      "Existing instance found but could not be activated";

  explicit InstanceLock(InstanceLockOptions options = {},
                        std::unique_ptr<WindowActivator> activator = nullptr);
  ~InstanceLock();

  InstanceLock(const InstanceLock&) = delete;
  auto operator=(const InstanceLock&) -> InstanceLock& = delete;

  auto tryAcquire() -> AcquireResult;
  auto release() -> bool;

  /**
   * @brief 不做 PID 检查地删除段、信号量和锁记录，用于崩溃后的人工恢复
   */
  auto forceRelease() -> bool;

  [[nodiscard]] auto status() const -> InstanceLockStatus;
  [[nodiscard]] auto isHeld() const -> bool;

  [[nodiscard]] auto lockFilePath() const -> const std::filesystem::path& {
    return store_.path();
  }

 private:
  auto acquireAtomic() -> AcquireResult;
  auto acquireWithRecordOnly() -> AcquireResult;
  auto stampRecord() -> LockRecordResult<void>;
  auto recordIsLive() const -> bool;
  auto activateExisting() -> AcquireResult;
  auto isOwnRecord(const LockRecord& record) const -> bool;
  auto releaseRecord(const std::optional<LockRecord>& record) -> bool;
  void openBackend();

  InstanceLockOptions options_;
  LockRecordStore store_;
  SegmentNames names_;
  std::unique_ptr<WindowActivator> activator_;
  std::unique_ptr<AtomicSegment> segment_;

  // 本实例获取锁时写入的记录，用于释放时判断锁是否已被接管
  std::optional<LockRecord> stamped_;
  bool held_{false};
  mutable std::mutex mutex_;
};

}  // namespace whiz::lifecycle
