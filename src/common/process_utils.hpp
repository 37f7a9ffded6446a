#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "platform_fixes.hpp"
#else
#include <sys/types.h>
#endif

namespace whiz::common {

#ifdef _WIN32
using ProcessId = DWORD;
#else
using ProcessId = pid_t;
#endif

/**
 * @brief 获取当前进程的ID。
 */
auto current_process_id() -> ProcessId;

/**
 * @brief 检查具有给定ID的进程当前是否正在运行。
 * @param pid 要检查的进程ID。
 * @return 如果进程正在运行，则为true；否则为false。PID 0 总是返回false。
 */
auto is_process_running(ProcessId pid) -> bool;

/**
 * @class Process
 * @brief 以跨平台的方式管理子进程的生命周期。
 *
 * 创建Process对象时启动指定的程序（按 PATH 查找可执行文件），
 * 对象销毁时如果子进程仍在运行则将其终止，避免产生孤儿进程。
 * 启动失败时构造函数抛出 std::runtime_error。
 */
class Process {
 public:
  /**
   * @param executable 可执行文件路径或名称。
   * @param args 传递给可执行文件的参数。
   * @param discard_output 为true时子进程的stdout/stderr重定向到空设备。
   */
  Process(const std::string& executable, const std::vector<std::string>& args,
          bool discard_output = false);

  ~Process();

  Process(const Process&) = delete;
  Process(Process&&) = delete;
  auto operator=(const Process&) -> Process& = delete;
  auto operator=(Process&&) -> Process& = delete;

  [[nodiscard]] auto isRunning() const -> bool;

  [[nodiscard]] auto pid() const -> std::optional<ProcessId> { return pid_; }

  /**
   * @brief 强制终止被管理的进程并回收。
   * @return 进程已不在运行时返回true。
   */
  [[nodiscard]] auto terminate() -> bool;

  /**
   * @brief 等待进程退出并获取退出码。
   * @return 进程正常退出时返回退出码；被信号终止或无法获取时返回std::nullopt。
   */
  auto waitForExit() -> std::optional<int>;

  /**
   * @brief 在限定时间内等待进程退出。
   * @return 超时或异常终止时返回std::nullopt，此时进程可能仍在运行。
   */
  auto waitForExit(std::chrono::milliseconds timeout) -> std::optional<int>;

#ifndef _WIN32
  /**
   * @brief 子进程被信号终止并已回收时返回该信号。
   */
  [[nodiscard]] auto terminationSignal() const -> std::optional<int> {
    return term_signal_;
  }
#endif

 private:
  std::optional<ProcessId> pid_;
#ifdef _WIN32
  HANDLE process_handle_{nullptr};
#else
  std::optional<int> term_signal_;
#endif
};

}  // namespace whiz::common
