#include "lifecycle/window_activator.hpp"

#include <stdexcept>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace whiz::lifecycle {

CommandWindowActivator::CommandWindowActivator(
    std::string name, std::vector<ActivationCommand> commands,
    std::chrono::milliseconds timeout)
    : name_(std::move(name)), commands_(std::move(commands)), timeout_(timeout) {}

auto CommandWindowActivator::activate() -> bool {
  // 所有候选命令共用同一个截止时间
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  for (const auto& command : commands_) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
      LOG_MODULE("instance_lock", WARNING)
          << "Window activation timed out after " << timeout_.count() << "ms";
      return false;
    }
    try {
      common::Process process(command.executable, command.args, true);
      const auto exit_code = process.waitForExit(remaining);
      if (!exit_code.has_value()) {
        LOG_MODULE("instance_lock", WARNING)
            << command.executable << " did not finish within "
            << remaining.count() << "ms";
        (void)process.terminate();
        continue;
      }
      if (*exit_code == 0) {
        LOG_MODULE("instance_lock", INFO)
            << "Activated existing window via " << command.executable;
        return true;
      }
      LOG_MODULE("instance_lock", DEBUG)
          << command.executable << " exited with code " << *exit_code;
    } catch (const std::runtime_error& e) {
      LOG_MODULE("instance_lock", DEBUG)
          << "Activation command unavailable: " << e.what();
    }
  }
  return false;
}

auto UnsupportedWindowActivator::activate() -> bool {
  LOG_MODULE("instance_lock", WARNING)
      << "Window activation is not supported on this platform";
  return false;
}

auto make_linux_activator(const std::string& window_title,
                          std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator> {
  std::vector<ActivationCommand> commands = {
      {"wmctrl", {"-a", window_title}},
      {"xdotool", {"search", "--name", window_title, "windowactivate"}}};
  return std::make_unique<CommandWindowActivator>("linux", std::move(commands),
                                                  timeout);
}

auto make_macos_activator(const std::string& window_title,
                          std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator> {
  // 找不到进程时脚本抛错，osascript 以非零码退出
  const std::string script =
      "tell application \"System Events\"\n"
      "  set matches to (every process whose name contains \"" +
      window_title +
      "\")\n"
      "  if (count of matches) is 0 then error \"not running\"\n"
      "  set frontmost of item 1 of matches to true\n"
      "end tell";
  std::vector<ActivationCommand> commands = {{"osascript", {"-e", script}}};
  return std::make_unique<CommandWindowActivator>("macos", std::move(commands),
                                                  timeout);
}

#ifdef _WIN32
namespace {

struct EnumState {
  const std::string* title;
  HWND found;
};

BOOL CALLBACK find_window_proc(HWND hwnd, LPARAM lparam) {
  auto* state = reinterpret_cast<EnumState*>(lparam);
  if (!IsWindowVisible(hwnd)) {
    return TRUE;
  }
  char buffer[512];
  const int length = GetWindowTextA(hwnd, buffer, sizeof(buffer));
  if (length > 0 &&
      std::string(buffer, length).find(*state->title) != std::string::npos) {
    state->found = hwnd;
    return FALSE;
  }
  return TRUE;
}

}  // namespace

Win32WindowActivator::Win32WindowActivator(std::string window_title)
    : window_title_(std::move(window_title)) {}

auto Win32WindowActivator::activate() -> bool {
  EnumState state{&window_title_, nullptr};
  EnumWindows(find_window_proc, reinterpret_cast<LPARAM>(&state));
  if (state.found == nullptr) {
    LOG_MODULE("instance_lock", WARNING)
        << "No window titled '" << window_title_ << "' found";
    return false;
  }
  if (IsIconic(state.found)) {
    ShowWindow(state.found, SW_RESTORE);
  }
  if (!SetForegroundWindow(state.found)) {
    LOG_MODULE("instance_lock", WARNING)
        << "SetForegroundWindow failed (" << GetLastError() << ")";
    return false;
  }
  LOG_MODULE("instance_lock", INFO) << "Activated existing window";
  return true;
}
#endif

auto make_window_activator(const std::string& window_title,
                           std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator> {
#if defined(_WIN32)
  (void)timeout;
  return std::make_unique<Win32WindowActivator>(window_title);
#elif defined(__APPLE__)
  return make_macos_activator(window_title, timeout);
#elif defined(__linux__)
  return make_linux_activator(window_title, timeout);
#else
  (void)window_title;
  (void)timeout;
  return std::make_unique<UnsupportedWindowActivator>();
#endif
}

}  // namespace whiz::lifecycle
