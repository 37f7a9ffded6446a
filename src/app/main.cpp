#include <iostream>
#include <memory>
#include <string>

#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include "lifecycle/lifecycle_context.hpp"

namespace {

void print_usage(const char* program) {
  std::cout << "Usage: " << program
            << " [--config=<file>] [--force-release] [--status]\n"
            << "  --config=<file>   load configuration from a JSON file\n"
            << "  --force-release   remove leftover lock resources before "
               "starting\n"
            << "  --status          print the instance lock status as JSON "
               "and exit\n";
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  std::string config_file;
  bool force_release = false;
  bool status_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      config_file = arg.substr(std::string("--config=").size());
    } else if (arg == "--force-release") {
      force_release = true;
    } else if (arg == "--status") {
      status_only = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  auto& config = whiz::common::ConfigManager::getInstance();
  if (!config_file.empty()) {
    if (auto loaded = config.loadFromFile(config_file); !loaded) {
      std::cerr << loaded.error().message << "\n";
      return 2;
    }
  } else {
    config.loadFromEnvironment();
  }
  if (!config.validateConfig()) {
    std::cerr << "Invalid configuration"
              << (config_file.empty() ? std::string(" from environment")
                                      : " in " + config_file)
              << "\n";
    return 2;
  }
  whiz::logger::Logger::InitFromConfigManager(argv[0]);

  auto context = whiz::lifecycle::LifecycleContext::fromConfig(config);
  auto& lock = context->instanceLock();

  if (status_only) {
    const nlohmann::json status = lock.status();
    std::cout << status.dump(2) << std::endl;
    return 0;
  }

  if (force_release) {
    LOG_WARNING << "Force release requested";
    if (!lock.forceRelease()) {
      LOG_ERROR << "Force release did not complete cleanly";
    }
  }

  const auto result = lock.tryAcquire();
  if (!result.acquired) {
    std::cerr << result.note.value_or("Failed to acquire lock") << std::endl;
    return 1;
  }
  if (result.note) {
    // 已激活正在运行的实例
    std::cout << *result.note << std::endl;
    return 0;
  }

  context->registerInstanceLockCleanup();
  context->installExitHooks();

  LOG_INFO << "Whiz lifecycle host running (PID "
           << whiz::common::current_process_id() << "), press Ctrl+C to exit";
  context->exitHooks().waitForShutdown();
  return 0;
}
