// 跨进程测试使用的辅助程序：以子进程身份获取/持有单实例锁
//
// 退出码: 0 获取成功, 1 未获取, 2 已激活现有实例, 3 参数错误

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "common/logging.hpp"
#include "lifecycle/lifecycle_context.hpp"

using namespace whiz::lifecycle;

namespace {

class FixedWindowActivator : public WindowActivator {
 public:
  explicit FixedWindowActivator(bool result) : result_(result) {}
  auto activate() -> bool override { return result_; }
  [[nodiscard]] auto name() const -> std::string override { return "fixed"; }

 private:
  bool result_;
};

struct HelperArgs {
  std::string mode;
  std::string app_name;
  std::filesystem::path lock_dir;
  std::filesystem::path ready_file;
  int hold_ms{0};
  bool activation_succeeds{false};
};

void touch(const std::filesystem::path& path) {
  if (!path.empty()) {
    std::ofstream(path) << "ready";
  }
}

auto exit_code_for(const AcquireResult& result) -> int {
  if (!result.acquired) {
    return 1;
  }
  return result.note ? 2 : 0;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  HelperArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value_of = [&arg](const std::string& prefix) {
      return arg.substr(prefix.size());
    };
    if (arg.rfind("--mode=", 0) == 0) {
      args.mode = value_of("--mode=");
    } else if (arg.rfind("--app=", 0) == 0) {
      args.app_name = value_of("--app=");
    } else if (arg.rfind("--dir=", 0) == 0) {
      args.lock_dir = value_of("--dir=");
    } else if (arg.rfind("--ready=", 0) == 0) {
      args.ready_file = value_of("--ready=");
    } else if (arg.rfind("--hold-ms=", 0) == 0) {
      args.hold_ms = std::stoi(value_of("--hold-ms="));
    } else if (arg == "--activation-succeeds") {
      args.activation_succeeds = true;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      return 3;
    }
  }
  if (args.mode.empty() || args.app_name.empty()) {
    return 3;
  }

  whiz::logger::LogConfig log_config;
  log_config.file_enabled = false;
  log_config.console_enabled = false;
  whiz::logger::Logger::Init(argv[0], log_config);

  InstanceLockOptions options;
  options.app_name = args.app_name;
  options.lock_directory = args.lock_dir;

  if (args.mode == "try" || args.mode == "crash") {
    InstanceLock lock(options, std::make_unique<FixedWindowActivator>(
                                   args.activation_succeeds));
    const auto result = lock.tryAcquire();
    const int code = exit_code_for(result);
    if (code == 0) {
      touch(args.ready_file);
      std::this_thread::sleep_for(std::chrono::milliseconds(args.hold_ms));
      if (args.mode == "crash") {
        // 不释放任何资源直接退出，模拟崩溃
        std::_Exit(0);
      }
      if (!lock.release()) {
        return 4;
      }
    }
    return code;
  }

  if (args.mode == "hooks" || args.mode == "atexit") {
    LifecycleContext context(options, CleanupOptions{},
                             std::make_unique<FixedWindowActivator>(false));
    const int code = exit_code_for(context.instanceLock().tryAcquire());
    if (code != 0) {
      return code;
    }
    context.registerInstanceLockCleanup();
    context.installExitHooks();
    touch(args.ready_file);

    if (args.mode == "atexit") {
      // std::exit 不展开栈，清理只能由 atexit 钩子完成
      std::exit(0);
    }
    context.exitHooks().waitForShutdown();
    return 0;
  }

  return 3;
}
