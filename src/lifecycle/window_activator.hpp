#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace whiz::lifecycle {

/**
 * @brief 将已运行实例的窗口带到前台
 *
 * 激活是尽力而为的：失败只返回 false，不抛出异常。
 */
class WindowActivator {
 public:
  virtual ~WindowActivator() = default;

  virtual auto activate() -> bool = 0;
  [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/**
 * @brief 一条外部命令：可执行文件加参数
 */
struct ActivationCommand {
  std::string executable;
  std::vector<std::string> args;
};

/**
 * @class CommandWindowActivator
 * @brief 依次运行候选外部命令，任一命令以 0 退出即视为激活成功
 *
 * 所有命令共用同一个超时，超时的子进程会被终止。
 */
class CommandWindowActivator : public WindowActivator {
 public:
  CommandWindowActivator(std::string name,
                         std::vector<ActivationCommand> commands,
                         std::chrono::milliseconds timeout);

  auto activate() -> bool override;
  [[nodiscard]] auto name() const -> std::string override { return name_; }

 private:
  std::string name_;
  std::vector<ActivationCommand> commands_;
  std::chrono::milliseconds timeout_;
};

/**
 * @brief 无法识别的平台：总是返回 false
 */
class UnsupportedWindowActivator : public WindowActivator {
 public:
  auto activate() -> bool override;
  [[nodiscard]] auto name() const -> std::string override {
    return "unsupported";
  }
};

// Linux: wmctrl，失败后回退到 xdotool
auto make_linux_activator(const std::string& window_title,
                          std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator>;

// macOS: osascript 通过 System Events 激活进程
auto make_macos_activator(const std::string& window_title,
                          std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator>;

#ifdef _WIN32
/**
 * @brief Windows: 枚举可见顶层窗口，找到标题包含关键字的窗口并置前
 */
class Win32WindowActivator : public WindowActivator {
 public:
  explicit Win32WindowActivator(std::string window_title);

  auto activate() -> bool override;
  [[nodiscard]] auto name() const -> std::string override { return "win32"; }

 private:
  std::string window_title_;
};
#endif

/**
 * @brief 按当前平台创建激活器
 */
auto make_window_activator(const std::string& window_title,
                           std::chrono::milliseconds timeout)
    -> std::unique_ptr<WindowActivator>;

}  // namespace whiz::lifecycle
