#include "lifecycle/instance_lock.hpp"

#include <cmath>
#include <exception>

#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace {

constexpr const char* kModule = "instance_lock";

// 记录时间戳以微秒精度写入文件
constexpr double kTimestampTolerance = 1e-5;

auto failure(const std::string& message) -> AcquireResult {
  LOG_MODULE(kModule, ERROR) << "Failed to acquire lock: " << message;
  return AcquireResult{false, "Failed to acquire lock: " + message};
}

template <typename Duration>
auto from_seconds(double seconds) -> Duration {
  return std::chrono::duration_cast<Duration>(
      std::chrono::duration<double>(seconds));
}

}  // namespace

auto InstanceLockOptions::fromConfig(const common::ConfigManager& config)
    -> InstanceLockOptions {
  InstanceLockOptions options;
  options.app_name = config.getWithDefault<std::string>(
      "instance_lock.app_name", options.app_name);
  options.window_title = config.getWithDefault<std::string>(
      "instance_lock.window_title", options.window_title);
  options.stale_timeout = from_seconds<std::chrono::seconds>(
      60.0 * config.getWithDefault<double>(
                 "instance_lock.stale_timeout_minutes",
                 std::chrono::duration<double, std::ratio<60>>(
                     constants::kDefaultStaleTimeout)
                     .count()));
  options.activation_timeout = from_seconds<std::chrono::milliseconds>(
      config.getWithDefault<double>(
          "instance_lock.activation_timeout_seconds",
          std::chrono::duration<double>(constants::kDefaultActivationTimeout)
              .count()));
  options.semaphore_timeout = from_seconds<std::chrono::milliseconds>(
      config.getWithDefault<double>(
          "instance_lock.semaphore_timeout_seconds",
          std::chrono::duration<double>(constants::kDefaultSemaphoreTimeout)
              .count()));
  options.use_atomic_backend =
      config.getWithDefault<bool>("instance_lock.use_atomic_backend", true);
  return options;
}

void to_json(nlohmann::json& j, const InstanceLockStatus& status) {
  j = nlohmann::json{{"held", status.held},
                     {"pid", status.pid},
                     {"lock_file_path", status.lock_file_path},
                     {"lock_file_exists", status.lock_file_exists},
                     {"timeout_seconds", status.timeout_seconds},
                     {"atomic_backend_available",
                      status.atomic_backend_available}};
}

InstanceLock::InstanceLock(InstanceLockOptions options,
                           std::unique_ptr<WindowActivator> activator)
    : options_(std::move(options)),
      store_(LockRecordStore::defaultPathFor(options_.app_name,
                                             options_.lock_directory)),
      names_(SegmentNames::forApp(options_.app_name)),
      activator_(std::move(activator)) {
  if (!activator_) {
    activator_ = make_window_activator(options_.window_title,
                                       options_.activation_timeout);
  }
  openBackend();
}

InstanceLock::~InstanceLock() {
  if (isHeld()) {
    (void)release();
  }
}

void InstanceLock::openBackend() {
  if (!options_.use_atomic_backend) {
    LOG_MODULE(kModule, INFO)
        << "Atomic backend disabled, using lock file only";
    return;
  }
  auto opened = AtomicSegment::open(names_);
  if (!opened) {
    LOG_MODULE(kModule, WARNING)
        << "Atomic backend unavailable (" << opened.error().message
        << "), falling back to lock file";
    return;
  }
  segment_ = std::move(*opened);
}

auto InstanceLock::tryAcquire() -> AcquireResult {
  std::lock_guard<std::mutex> lock(mutex_);
  if (held_) {
    return AcquireResult{true, std::nullopt};
  }

  try {
    return segment_ ? acquireAtomic() : acquireWithRecordOnly();
  } catch (const std::exception& e) {
    return failure(e.what());
  }
}

auto InstanceLock::acquireAtomic() -> AcquireResult {
  {
    auto section = segment_->enter(options_.semaphore_timeout);
    if (!section) {
      return failure(section.error().message);
    }

    auto created = segment_->create();
    if (!created) {
      return failure(created.error().message);
    }

    if (*created == CreateOutcome::AlreadyExists && !recordIsLive()) {
      LOG_MODULE(kModule, INFO)
          << "Found stale instance lock, reclaiming " << names_.segment;
      segment_->removeOrphan();
      created = segment_->create();
      if (!created) {
        return failure(created.error().message);
      }
      if (*created == CreateOutcome::AlreadyExists) {
        return failure("segment " + names_.segment +
                       " still exists after removing it");
      }
    }

    if (*created == CreateOutcome::Created) {
      auto stamped = stampRecord();
      if (!stamped) {
        auto detached = segment_->detach();
        if (!detached) {
          LOG_MODULE(kModule, WARNING) << detached.error().message;
        }
        return failure(stamped.error().message);
      }
      held_ = true;
      LOG_MODULE(kModule, INFO)
          << "Single instance lock acquired (PID "
          << common::current_process_id() << ")";
      return AcquireResult{true, std::nullopt};
    }
  }

  // 临界区外进行窗口激活，避免长时间占用信号量
  return activateExisting();
}

auto InstanceLock::acquireWithRecordOnly() -> AcquireResult {
  // 检查与写入之间没有原子性保证
  if (recordIsLive()) {
    return activateExisting();
  }

  auto stamped = stampRecord();
  if (!stamped) {
    return failure(stamped.error().message);
  }
  held_ = true;
  LOG_MODULE(kModule, INFO) << "Single instance lock acquired via lock file (PID "
                            << common::current_process_id() << ")";
  return AcquireResult{true, std::nullopt};
}

auto InstanceLock::stampRecord() -> LockRecordResult<void> {
  const auto record = LockRecordStore::makeCurrent();
  auto written = store_.write(record);
  if (written) {
    stamped_ = record;
  }
  return written;
}

auto InstanceLock::isOwnRecord(const LockRecord& record) const -> bool {
  return stamped_ && record.owner_pid == stamped_->owner_pid &&
         std::fabs(record.acquired_at - stamped_->acquired_at) <
             kTimestampTolerance;
}

auto InstanceLock::recordIsLive() const -> bool {
  const auto record = store_.read();
  if (!record) {
    LOG_MODULE(kModule, DEBUG) << "No valid lock record at " << store_.path();
    return false;
  }
  if (LockRecordStore::isStale(*record, options_.stale_timeout)) {
    LOG_MODULE(kModule, INFO)
        << "Lock record of PID " << record->owner_pid << " is stale";
    return false;
  }
  return true;
}

auto InstanceLock::activateExisting() -> AcquireResult {
  LOG_MODULE(kModule, INFO) << "Another instance is running, activating it";
  if (activator_->activate()) {
    LOG_MODULE(kModule, INFO) << kActivatedNote;
    return AcquireResult{true, std::string(kActivatedNote)};
  }
  LOG_MODULE(kModule, WARNING) << kNotActivatedNote;
  return AcquireResult{false, std::string(kNotActivatedNote)};
}

auto InstanceLock::releaseRecord(const std::optional<LockRecord>& record)
    -> bool {
  if (!record) {
    return true;
  }
  if (!isOwnRecord(*record)) {
    LOG_MODULE(kModule, WARNING)
        << "Lock record belongs to PID " << record->owner_pid
        << ", leaving it in place";
    return true;
  }
  auto removed = store_.remove();
  if (!removed) {
    LOG_MODULE(kModule, ERROR) << removed.error().message;
    return false;
  }
  return true;
}

auto InstanceLock::release() -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!held_) {
    return true;
  }

  bool ok = true;
  if (segment_) {
    auto section = segment_->enter(options_.semaphore_timeout);
    if (!section) {
      // 仍然释放自己的资源，但报告失败
      LOG_MODULE(kModule, ERROR) << section.error().message;
      ok = false;
    }
    const auto record = store_.read();
    if (record && !isOwnRecord(*record)) {
      // 锁已被其他实例接管，段现在属于新的持有者
      LOG_MODULE(kModule, WARNING)
          << "Instance lock was taken over by PID " << record->owner_pid
          << ", leaving segment " << names_.segment << " in place";
      segment_->abandon();
    } else {
      auto detached = segment_->detach();
      if (!detached) {
        LOG_MODULE(kModule, ERROR) << detached.error().message;
        ok = false;
      }
    }
    ok = releaseRecord(record) && ok;
  } else {
    ok = releaseRecord(store_.read());
  }

  held_ = false;
  stamped_.reset();
  if (ok) {
    LOG_MODULE(kModule, INFO) << "Single instance lock released";
  } else {
    LOG_MODULE(kModule, WARNING) << "Single instance lock released with errors";
  }
  return ok;
}

auto InstanceLock::forceRelease() -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  LOG_MODULE(kModule, WARNING) << "Force releasing instance lock resources";

  segment_.reset();
  AtomicSegment::forceRemove(names_);
  auto removed = store_.remove();
  held_ = false;
  stamped_.reset();

  openBackend();
  if (!removed) {
    LOG_MODULE(kModule, ERROR) << removed.error().message;
    return false;
  }
  return true;
}

auto InstanceLock::status() const -> InstanceLockStatus {
  std::lock_guard<std::mutex> lock(mutex_);
  InstanceLockStatus status;
  status.held = held_;
  status.pid = common::current_process_id();
  status.lock_file_path = store_.path().string();
  status.lock_file_exists = store_.exists();
  status.timeout_seconds =
      std::chrono::duration<double>(options_.stale_timeout).count();
  status.atomic_backend_available = segment_ != nullptr;
  return status;
}

auto InstanceLock::isHeld() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_;
}

}  // namespace whiz::lifecycle
