#include "lifecycle/lifecycle_context.hpp"

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace {
constexpr const char* kModule = "lifecycle";
}

LifecycleContext::LifecycleContext(InstanceLockOptions lock_options,
                                   CleanupOptions cleanup_options,
                                   std::unique_ptr<WindowActivator> activator)
    : lock_(std::make_unique<InstanceLock>(std::move(lock_options),
                                           std::move(activator))),
      orchestrator_(std::make_unique<CleanupOrchestrator>(cleanup_options)),
      hooks_(std::make_unique<ExitHooks>([this]() { runShutdown(); })) {}

auto LifecycleContext::fromConfig(const common::ConfigManager& config)
    -> std::unique_ptr<LifecycleContext> {
  return std::make_unique<LifecycleContext>(
      InstanceLockOptions::fromConfig(config),
      CleanupOptions::fromConfig(config));
}

LifecycleContext::~LifecycleContext() { shutdown(); }

void LifecycleContext::registerInstanceLockCleanup() {
  InstanceLock* lock = lock_.get();
  orchestrator_->registerTask(
      constants::kLockCleanupTaskName, CleanupPhase::SYSTEM_RESOURCES,
      [lock]() { return lock->release(); },
      [lock]() { return !lock->isHeld(); }, constants::kLockCleanupTimeout,
      false);
}

void LifecycleContext::installExitHooks() { hooks_->install(); }

auto LifecycleContext::shutdown() -> bool { return hooks_->runOnce(); }

void LifecycleContext::runShutdown() {
  LOG_MODULE(kModule, INFO) << "Shutting down";
  orchestrator_->cleanupAll();

  if (lock_->isHeld()) {
    LOG_MODULE(kModule, INFO) << "Instance lock still held, releasing";
    if (!lock_->release()) {
      LOG_MODULE(kModule, WARNING) << "Instance lock release reported errors";
    }
  }

  shut_down_ = true;
  LOG_MODULE(kModule, INFO) << "Cleanup report: " << report().dump();
  logger::Logger::flush();
}

auto LifecycleContext::report() const -> nlohmann::json {
  nlohmann::json tasks = nlohmann::json::object();
  for (const auto& [name, result] : orchestrator_->results()) {
    tasks[name] = result;
  }
  return nlohmann::json{{"instance_lock", lock_->status()},
                        {"summary", orchestrator_->summary()},
                        {"tasks", tasks}};
}

}  // namespace whiz::lifecycle
