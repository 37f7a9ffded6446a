#include "lifecycle/cleanup_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace {

constexpr const char* kModule = "cleanup";

enum class Outcome { Returned, Threw, TimedOut };

struct TimedOutcome {
  Outcome kind{Outcome::TimedOut};
  bool value{false};
  std::string error;
};

// 在分离的工作线程上运行 fn，最多等待 timeout。超时后线程被放弃。
auto run_with_timeout(std::function<bool()> fn,
                      std::chrono::milliseconds timeout) -> TimedOutcome {
  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();

  try {
    std::thread([promise, fn = std::move(fn)]() {
      try {
        promise->set_value(fn());
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    }).detach();
  } catch (const std::system_error& e) {
    return TimedOutcome{Outcome::Threw, false,
                        std::string("cannot start worker: ") + e.what()};
  }

  if (future.wait_for(std::max(timeout, std::chrono::milliseconds(0))) !=
      std::future_status::ready) {
    return TimedOutcome{Outcome::TimedOut, false, {}};
  }

  try {
    return TimedOutcome{Outcome::Returned, future.get(), {}};
  } catch (const std::exception& e) {
    return TimedOutcome{Outcome::Threw, false, e.what()};
  } catch (...) {
    return TimedOutcome{Outcome::Threw, false, "unknown exception"};
  }
}

auto elapsed_since(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

auto is_failure(CleanupStatus status) -> bool {
  return status == CleanupStatus::FAILED || status == CleanupStatus::TIMEOUT;
}

}  // namespace

auto to_string(CleanupPhase phase) -> std::string {
  switch (phase) {
    case CleanupPhase::UI_WIDGETS:
      return "UI_WIDGETS";
    case CleanupPhase::AUDIO_RESOURCES:
      return "AUDIO_RESOURCES";
    case CleanupPhase::HOTKEY_RESOURCES:
      return "HOTKEY_RESOURCES";
    case CleanupPhase::MODEL_RESOURCES:
      return "MODEL_RESOURCES";
    case CleanupPhase::FILE_RESOURCES:
      return "FILE_RESOURCES";
    case CleanupPhase::NETWORK_RESOURCES:
      return "NETWORK_RESOURCES";
    case CleanupPhase::SYSTEM_RESOURCES:
      return "SYSTEM_RESOURCES";
    case CleanupPhase::FINAL_CLEANUP:
      return "FINAL_CLEANUP";
  }
  return "UNKNOWN";
}

auto to_string(CleanupStatus status) -> std::string {
  switch (status) {
    case CleanupStatus::PENDING:
      return "pending";
    case CleanupStatus::IN_PROGRESS:
      return "in_progress";
    case CleanupStatus::COMPLETED:
      return "completed";
    case CleanupStatus::FAILED:
      return "failed";
    case CleanupStatus::TIMEOUT:
      return "timeout";
    case CleanupStatus::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

void to_json(nlohmann::json& j, const CleanupResult& result) {
  j = nlohmann::json{{"task_name", result.task_name},
                     {"status", to_string(result.status)},
                     {"duration_ms", result.duration.count()},
                     {"verification_passed", result.verification_passed}};
  if (result.error) {
    j["error"] = *result.error;
  } else {
    j["error"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const CleanupSummary& summary) {
  j = nlohmann::json{{"total_tasks", summary.total},
                     {"completed_tasks", summary.completed},
                     {"failed_tasks", summary.failed},
                     {"timeout_tasks", summary.timed_out},
                     {"skipped_tasks", summary.skipped},
                     {"pending_tasks", summary.pending},
                     {"success_rate", summary.success_rate},
                     {"total_duration", summary.total_duration_seconds},
                     {"cleanup_started", summary.started},
                     {"cleanup_completed", summary.complete}};
}

auto CleanupOptions::fromConfig(const common::ConfigManager& config)
    -> CleanupOptions {
  CleanupOptions options;
  const double global_seconds = config.getWithDefault<double>(
      "cleanup.global_timeout_seconds",
      std::chrono::duration<double>(options.global_timeout).count());
  const double verify_seconds = config.getWithDefault<double>(
      "cleanup.verify_timeout_seconds",
      std::chrono::duration<double>(options.verify_timeout).count());
  options.global_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double>(global_seconds));
  options.verify_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double>(verify_seconds));
  return options;
}

CleanupOrchestrator::CleanupOrchestrator(CleanupOptions options)
    : options_(options) {
  LOG_MODULE(kModule, INFO) << "Cleanup orchestrator initialized with "
                            << options_.global_timeout.count()
                            << "ms global timeout";
}

void CleanupOrchestrator::registerTask(CleanupTask task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    throw std::logic_error("Cannot register cleanup task '" + task.name +
                           "' after cleanup has started");
  }
  if (task.name.empty()) {
    throw std::invalid_argument("Cleanup task name must not be empty");
  }
  if (!task.action) {
    throw std::invalid_argument("Cleanup task '" + task.name +
                                "' has no action");
  }
  if (results_.count(task.name) != 0) {
    throw std::invalid_argument("Cleanup task '" + task.name +
                                "' is already registered");
  }

  LOG_MODULE(kModule, DEBUG) << "Registered cleanup task: " << task.name
                             << " (phase: " << to_string(task.phase) << ")";
  CleanupResult result;
  result.task_name = task.name;
  results_.emplace(task.name, std::move(result));
  tasks_.push_back(std::move(task));
}

void CleanupOrchestrator::registerTask(
    const std::string& name, CleanupPhase phase, std::function<bool()> action,
    std::function<bool()> verify, std::chrono::milliseconds timeout,
    bool critical, std::function<void()> rollback,
    std::vector<std::string> dependencies) {
  CleanupTask task;
  task.name = name;
  task.phase = phase;
  task.action = std::move(action);
  task.verify = std::move(verify);
  task.timeout = timeout;
  task.critical = critical;
  task.rollback = std::move(rollback);
  task.dependencies = std::move(dependencies);
  registerTask(std::move(task));
}

auto CleanupOrchestrator::cleanupAll() -> CleanupResults {
  std::vector<CleanupTask> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
      LOG_MODULE(kModule, WARNING) << "Cleanup already started";
      return results_;
    }
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
    tasks = tasks_;
  }

  LOG_MODULE(kModule, INFO) << "Starting cleanup of " << tasks.size()
                            << " tasks";

  for (const auto phase : kAllCleanupPhases) {
    std::vector<const CleanupTask*> phase_tasks;
    for (const auto& task : tasks) {
      if (task.phase == phase) {
        phase_tasks.push_back(&task);
      }
    }
    if (phase_tasks.empty()) {
      continue;
    }

    LOG_MODULE(kModule, INFO) << "Cleanup phase " << to_string(phase) << " ("
                              << phase_tasks.size() << " tasks)";

    bool budget_exhausted = false;
    bool critical_failed = false;
    for (const auto* task : phase_tasks) {
      if (remainingBudget().count() <= 0) {
        budget_exhausted = true;
        break;
      }
      executeTask(*task);
      if (task->critical && is_failure(statusOf(task->name).value_or(
                                CleanupStatus::PENDING))) {
        critical_failed = true;
      }
    }

    if (budget_exhausted || remainingBudget().count() <= 0) {
      LOG_MODULE(kModule, ERROR)
          << "Global cleanup timeout exceeded after "
          << elapsed_since(start_time_).count() << "ms";
      markPendingAsTimeout();
      break;
    }
    if (critical_failed) {
      LOG_MODULE(kModule, ERROR)
          << "Critical task failed in phase " << to_string(phase)
          << ", stopping cleanup";
      break;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  complete_ = true;
  total_duration_ = elapsed_since(start_time_);
  LOG_MODULE(kModule, INFO) << "Cleanup finished in " << total_duration_.count()
                            << "ms";
  return results_;
}

void CleanupOrchestrator::executeTask(const CleanupTask& task) {
  for (const auto& dependency : task.dependencies) {
    if (statusOf(dependency) != CleanupStatus::COMPLETED) {
      LOG_MODULE(kModule, WARNING) << "Skipping task " << task.name
                                   << ": dependency " << dependency
                                   << " not completed";
      setStatus(task.name, CleanupStatus::SKIPPED);
      return;
    }
  }

  setStatus(task.name, CleanupStatus::IN_PROGRESS);
  const auto task_start = std::chrono::steady_clock::now();
  LOG_MODULE(kModule, DEBUG) << "Executing cleanup task: " << task.name;

  const auto outcome = run_with_timeout(
      task.action, std::min(task.timeout, remainingBudget()));

  CleanupStatus status = CleanupStatus::COMPLETED;
  std::optional<std::string> error;
  bool verification_passed = true;

  switch (outcome.kind) {
    case Outcome::TimedOut:
      status = CleanupStatus::TIMEOUT;
      LOG_MODULE(kModule, ERROR) << "Task " << task.name << " timed out";
      break;
    case Outcome::Threw:
      status = CleanupStatus::FAILED;
      error = outcome.error;
      LOG_MODULE(kModule, ERROR)
          << "Task " << task.name << " raised: " << outcome.error;
      break;
    case Outcome::Returned:
      status = outcome.value ? CleanupStatus::COMPLETED : CleanupStatus::FAILED;
      if (!outcome.value) {
        LOG_MODULE(kModule, ERROR) << "Task " << task.name << " failed";
      }
      break;
  }

  if (status == CleanupStatus::COMPLETED && task.verify) {
    const auto verified = run_with_timeout(
        task.verify, std::min(options_.verify_timeout, remainingBudget()));
    verification_passed =
        verified.kind == Outcome::Returned && verified.value;
    if (!verification_passed) {
      LOG_MODULE(kModule, WARNING)
          << "Verification failed for task " << task.name;
    }
  }

  if (status != CleanupStatus::COMPLETED) {
    runRollback(task);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& result = results_.at(task.name);
  result.status = status;
  result.error = std::move(error);
  result.verification_passed = verification_passed;
  result.duration = elapsed_since(task_start);
  LOG_MODULE(kModule, INFO) << "Task " << task.name << " "
                            << to_string(status) << " in "
                            << result.duration.count() << "ms";
}

void CleanupOrchestrator::runRollback(const CleanupTask& task) {
  if (!task.rollback) {
    return;
  }
  LOG_MODULE(kModule, INFO) << "Rolling back task " << task.name;
  auto rollback = task.rollback;
  const auto outcome = run_with_timeout(
      [rollback]() {
        rollback();
        return true;
      },
      std::min(task.timeout, remainingBudget()));
  if (outcome.kind == Outcome::TimedOut) {
    LOG_MODULE(kModule, ERROR) << "Rollback of " << task.name << " timed out";
  } else if (outcome.kind == Outcome::Threw) {
    LOG_MODULE(kModule, ERROR)
        << "Rollback of " << task.name << " failed: " << outcome.error;
  }
}

void CleanupOrchestrator::markPendingAsTimeout() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [name, result] : results_) {
    if (result.status == CleanupStatus::PENDING) {
      result.status = CleanupStatus::TIMEOUT;
      LOG_MODULE(kModule, WARNING) << "Task " << name << " marked as timeout";
    }
  }
}

void CleanupOrchestrator::setStatus(const std::string& name,
                                    CleanupStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  results_.at(name).status = status;
}

auto CleanupOrchestrator::statusOf(const std::string& name) const
    -> std::optional<CleanupStatus> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = results_.find(name);
  if (it == results_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

auto CleanupOrchestrator::remainingBudget() const -> std::chrono::milliseconds {
  return options_.global_timeout - elapsed_since(start_time_);
}

auto CleanupOrchestrator::results() const -> CleanupResults {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_;
}

auto CleanupOrchestrator::summary() const -> CleanupSummary {
  std::lock_guard<std::mutex> lock(mutex_);
  CleanupSummary summary;
  summary.total = results_.size();
  for (const auto& [name, result] : results_) {
    switch (result.status) {
      case CleanupStatus::COMPLETED:
        ++summary.completed;
        break;
      case CleanupStatus::FAILED:
        ++summary.failed;
        break;
      case CleanupStatus::TIMEOUT:
        ++summary.timed_out;
        break;
      case CleanupStatus::SKIPPED:
        ++summary.skipped;
        break;
      case CleanupStatus::PENDING:
      case CleanupStatus::IN_PROGRESS:
        ++summary.pending;
        break;
    }
  }
  summary.success_rate =
      summary.total == 0
          ? 0.0
          : static_cast<double>(summary.completed) /
                static_cast<double>(summary.total);
  summary.started = started_;
  summary.complete = complete_;
  if (complete_) {
    summary.total_duration_seconds =
        std::chrono::duration<double>(total_duration_).count();
  } else if (started_) {
    summary.total_duration_seconds =
        std::chrono::duration<double>(elapsed_since(start_time_)).count();
  }
  return summary;
}

auto CleanupOrchestrator::isStarted() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

auto CleanupOrchestrator::isComplete() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return complete_;
}

}  // namespace whiz::lifecycle
